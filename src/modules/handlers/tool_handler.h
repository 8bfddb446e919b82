// modules/handlers/tool_handler.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_TOOL_HANDLER_H
#define BLOCKFLOW_MODULES_HANDLERS_TOOL_HANDLER_H

#include "modules/handlers/block_handler.h"
#include "core/types/config.h"

namespace blockflow {

// Fallback for any block whose kind (or config.tool) names a registered tool.
// Params are config.params overlaid with the resolved inputs, plus _context.
class GenericToolHandler : public ToolBackedHandler {
public:
    GenericToolHandler(ToolInvoker& tools, const ExecutorConfig& config);

    const char* name() const override { return "tool"; }
    bool can_handle(const Block& block) const override;
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;

private:
    const ExecutorConfig& config_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_TOOL_HANDLER_H
