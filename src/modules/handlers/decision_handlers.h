// modules/handlers/decision_handlers.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_DECISION_HANDLERS_H
#define BLOCKFLOW_MODULES_HANDLERS_DECISION_HANDLERS_H

#include "modules/handlers/block_handler.h"
#include "modules/path/path_resolver.h"

namespace blockflow {

// Template data for router/condition expressions: the resolved inputs at the
// top level plus "blocks" with every recorded block state.
Value expression_data(const Value& inputs, const ExecutionContext& ctx);

// config.expression renders to a route label matching one outgoing edge
// (by label or target id). Output: {selectedRoute, selectedPath: {blockId}}
class RouterHandler : public BlockHandler {
public:
    explicit RouterHandler(const PathResolver& path) : path_(path) {}

    const char* name() const override { return "router"; }
    bool can_handle(const Block& block) const override { return block.kind == BlockKind::ROUTER; }
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;

private:
    const PathResolver& path_;
};

// config.conditions: [{label, expression?}], first truthy wins, no expression means else.
// Output: {result, selectedConditionId, selectedPath: {blockId}}
class ConditionHandler : public BlockHandler {
public:
    explicit ConditionHandler(const PathResolver& path) : path_(path) {}

    const char* name() const override { return "condition"; }
    bool can_handle(const Block& block) const override { return block.kind == BlockKind::CONDITION; }
    Value execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) override;

private:
    const PathResolver& path_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_DECISION_HANDLERS_H
