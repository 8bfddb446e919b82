// modules/handlers/function_handler.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_FUNCTION_HANDLER_H
#define BLOCKFLOW_MODULES_HANDLERS_FUNCTION_HANDLER_H

#include "modules/handlers/block_handler.h"
#include "core/types/config.h"

namespace blockflow {

inline constexpr const char* kFunctionExecuteTool = "function_execute";

// Runs user code through the "function_execute" tool.
// Params: {code, timeout, _context: {workflowId}}; output: {response: <tool output>}.
class FunctionHandler : public ToolBackedHandler {
public:
    FunctionHandler(ToolInvoker& tools, const ExecutorConfig& config);

    const char* name() const override { return "function"; }
    bool can_handle(const Block& block) const override;
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;

private:
    const ExecutorConfig& config_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_FUNCTION_HANDLER_H
