// modules/handlers/handler_registry.cpp
#include "modules/handlers/handler_registry.h"
#include "modules/handlers/decision_handlers.h"
#include "modules/handlers/flow_handlers.h"
#include "modules/handlers/function_handler.h"
#include "modules/handlers/tool_handler.h"
#include "core/types/errors.h"

namespace blockflow {

HandlerRegistry::HandlerRegistry(ToolInvoker& tools, const PathResolver& path, const ExecutorConfig& config) {
    handlers_.push_back(std::make_unique<StarterHandler>());
    handlers_.push_back(std::make_unique<FunctionHandler>(tools, config));
    handlers_.push_back(std::make_unique<RouterHandler>(path));
    handlers_.push_back(std::make_unique<ConditionHandler>(path));
    handlers_.push_back(std::make_unique<LoopHandler>());
    handlers_.push_back(std::make_unique<GenericToolHandler>(tools, config));
}

BlockHandler& HandlerRegistry::find(const Block& block) const {
    for (const auto& handler : handlers_) {
        if (handler->can_handle(block)) {
            return *handler;
        }
    }
    throw HandlerNotFoundError(block.id, block.kind_name);
}

} // namespace blockflow
