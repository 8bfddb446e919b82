// modules/handlers/flow_handlers.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_FLOW_HANDLERS_H
#define BLOCKFLOW_MODULES_HANDLERS_FLOW_HANDLERS_H

#include "modules/handlers/block_handler.h"

namespace blockflow {

// Output: {input: workflowInput}
class StarterHandler : public BlockHandler {
public:
    const char* name() const override { return "starter"; }
    bool can_handle(const Block& block) const override { return block.kind == BlockKind::STARTER; }
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;
};

// Runs once the loop is Completed; returns {results: [...], iterations: N}
class LoopHandler : public BlockHandler {
public:
    const char* name() const override { return "loop"; }
    bool can_handle(const Block& block) const override { return block.kind == BlockKind::LOOP; }
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_FLOW_HANDLERS_H
