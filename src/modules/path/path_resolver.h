// modules/path/path_resolver.h
#ifndef BLOCKFLOW_MODULES_PATH_PATH_RESOLVER_H
#define BLOCKFLOW_MODULES_PATH_PATH_RESOLVER_H

#include "core/types/block.h"
#include "modules/context/execution_context.h"
#include "modules/scheduler/graph_index.h"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace blockflow {

// Maintains activeExecutionPath. An edge is live when its source is active and
// enabled, its target is enabled, and a decided source chose the edge's label.
// A block is active when it is an enabled root or has a live incoming edge.
class PathResolver {
public:
    explicit PathResolver(const GraphIndex& graph);

    // Rejects decision blocks with two outgoing edges sharing a label
    void validate() const;

    std::unordered_set<BlockId> initial_active_set(const ExecutionContext::State& state) const;

    bool is_edge_live(const Edge& edge, const ExecutionContext::State& state) const;

    // Outgoing edge of `decider` whose label (or target id) is `route`
    const Edge* find_branch(const BlockId& decider, const std::string& route) const;
    std::vector<std::string> branch_labels(const BlockId& decider) const;

    // Stores the decision and output, marks the block executed and prunes, all under one lock
    void record_decision(ExecutionContext& ctx, const Block& decider, const std::string& label, const Value& output) const;

    // Recomputes the descendants of `decider`; blocks may only leave the active set.
    // Caller holds the context lock (ExecutionContext::transact).
    void prune_after_decision(const BlockId& decider, ExecutionContext::State& state) const;

    // Recomputes the descendants of `loop_id` from scratch so that blocks pruned by a
    // previous iteration's decisions can come back. Body decisions must be cleared first.
    void reactivate_body(const BlockId& loop_id, ExecutionContext::State& state) const;

private:
    const GraphIndex& graph_;
    std::unordered_set<BlockId> roots_;

    bool has_live_incoming(const BlockId& id, const ExecutionContext::State& state) const;
    void recompute(const std::unordered_set<BlockId>& region,
                   ExecutionContext::State& state,
                   bool allow_growth) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_PATH_PATH_RESOLVER_H
