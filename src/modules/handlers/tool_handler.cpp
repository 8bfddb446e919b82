// modules/handlers/tool_handler.cpp
#include "modules/handlers/tool_handler.h"

namespace blockflow {

GenericToolHandler::GenericToolHandler(ToolInvoker& tools, const ExecutorConfig& config)
    : ToolBackedHandler(tools), config_(config) {}

bool GenericToolHandler::can_handle(const Block& block) const {
    return block.kind == BlockKind::TOOL && tools_.has_tool(block.tool_name());
}

Value GenericToolHandler::execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) {
    const std::string tool = block.tool_name();

    Value params = Value::object();
    if (block.config.contains("params") && block.config["params"].is_object()) {
        params = block.config["params"];
    }
    if (inputs.is_object()) {
        for (auto it = inputs.begin(); it != inputs.end(); ++it) {
            params[it.key()] = it.value();
        }
    }
    params["_context"] = {{"workflowId", ctx.workflow_id()}};

    long long timeout_ms = config_.default_tool_timeout_ms;
    if (block.config.contains("timeout")) {
        timeout_ms = timeout_ms_from(block.config["timeout"], timeout_ms);
    }

    Value output = call_tool(tool, params, timeout_ms, cancel, tool + " execution failed");
    return Value{{"response", output}};
}

} // namespace blockflow
