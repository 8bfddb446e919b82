// modules/handlers/function_handler.cpp
#include "modules/handlers/function_handler.h"

namespace blockflow {

FunctionHandler::FunctionHandler(ToolInvoker& tools, const ExecutorConfig& config)
    : ToolBackedHandler(tools), config_(config) {}

bool FunctionHandler::can_handle(const Block& block) const {
    return block.kind == BlockKind::FUNCTION;
}

Value FunctionHandler::execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) {
    // fragment lists were joined by the resolver
    Value code = inputs.is_object() && inputs.contains("code") ? inputs["code"] : Value("");

    Value timeout = config_.default_function_timeout_ms;
    if (inputs.is_object() && inputs.contains("timeout") && !inputs["timeout"].is_null()) {
        timeout = inputs["timeout"];
    }
    long long wait_ms = timeout_ms_from(timeout, config_.default_function_timeout_ms);

    Value params = {
        {"code", code},
        {"timeout", timeout},
        {"_context", {{"workflowId", ctx.workflow_id()}}}
    };

    Value output = call_tool(kFunctionExecuteTool, params, wait_ms, cancel, "Function execution failed");
    return Value{{"response", output}};
}

} // namespace blockflow
