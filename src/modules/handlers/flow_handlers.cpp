// modules/handlers/flow_handlers.cpp
#include "modules/handlers/flow_handlers.h"
#include "modules/loop/loop_controller.h"

namespace blockflow {

Value StarterHandler::execute(const Block&, const Value&, ExecutionContext& ctx, const CancellationToken&) {
    return Value{{"input", ctx.workflow_input()}};
}

Value LoopHandler::execute(const Block& block, const Value&, ExecutionContext& ctx, const CancellationToken&) {
    return LoopController::aggregate(block.id, ctx);
}

} // namespace blockflow
