// modules/handlers/handler_registry.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
#define BLOCKFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H

#include "modules/handlers/block_handler.h"
#include "modules/path/path_resolver.h"
#include "core/types/config.h"
#include <memory>
#include <vector>

namespace blockflow {

// Fixed priority list: starter, function, router, condition, loop, generic tool.
// The first handler whose can_handle() accepts the block wins.
class HandlerRegistry {
public:
    HandlerRegistry(ToolInvoker& tools, const PathResolver& path, const ExecutorConfig& config);

    // Throws HandlerNotFoundError
    BlockHandler& find(const Block& block) const;

    const std::vector<std::unique_ptr<BlockHandler>>& handlers() const { return handlers_; }

private:
    std::vector<std::unique_ptr<BlockHandler>> handlers_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
