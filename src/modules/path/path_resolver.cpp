// modules/path/path_resolver.cpp
#include "modules/path/path_resolver.h"
#include "core/types/errors.h"
#include <unordered_map>

namespace blockflow {

namespace {
std::optional<std::string> decision_of(const BlockId& id, const ExecutionContext::State& state) {
    auto r = state.decisions.router.find(id);
    if (r != state.decisions.router.end()) return r->second;
    auto c = state.decisions.condition.find(id);
    if (c != state.decisions.condition.end()) return c->second;
    return std::nullopt;
}
} // namespace

PathResolver::PathResolver(const GraphIndex& graph)
    : graph_(graph), roots_(graph.roots().begin(), graph.roots().end()) {}

void PathResolver::validate() const {
    for (const auto& block : graph_.graph().blocks) {
        if (!block.is_decision()) continue;
        std::unordered_map<std::string, BlockId> seen;
        for (std::size_t ei : graph_.outgoing(block.id)) {
            const Edge& e = graph_.edge(ei);
            auto [it, inserted] = seen.emplace(e.branch_label(), e.target);
            if (!inserted) {
                throw GraphValidationError("Decision block '" + block.id + "' has several edges labelled '" +
                                           e.branch_label() + "' (" + it->second + ", " + e.target + ")");
            }
        }
    }
}

std::unordered_set<BlockId> PathResolver::initial_active_set(const ExecutionContext::State& state) const {
    ExecutionContext::State scratch;
    scratch.decisions = state.decisions;
    for (const auto& id : graph_.topological_order()) {
        const Block& b = graph_.block(id);
        if (!b.enabled) continue;
        if (roots_.count(id) > 0 || has_live_incoming(id, scratch)) {
            scratch.active_execution_path.insert(id);
        }
    }
    return scratch.active_execution_path;
}

bool PathResolver::is_edge_live(const Edge& edge, const ExecutionContext::State& state) const {
    if (state.active_execution_path.count(edge.source) == 0) return false;
    const Block& source = graph_.block(edge.source);
    if (!source.enabled || !graph_.block(edge.target).enabled) return false;
    if (source.is_decision()) {
        if (auto chosen = decision_of(edge.source, state)) {
            return *chosen == edge.branch_label();
        }
    }
    return true;
}

const Edge* PathResolver::find_branch(const BlockId& decider, const std::string& route) const {
    for (std::size_t ei : graph_.outgoing(decider)) {
        const Edge& e = graph_.edge(ei);
        if (e.branch_label() == route) return &e;
    }
    // labelled edges may also be addressed by target id
    for (std::size_t ei : graph_.outgoing(decider)) {
        const Edge& e = graph_.edge(ei);
        if (e.target == route) return &e;
    }
    return nullptr;
}

std::vector<std::string> PathResolver::branch_labels(const BlockId& decider) const {
    std::vector<std::string> labels;
    for (std::size_t ei : graph_.outgoing(decider)) {
        labels.push_back(graph_.edge(ei).branch_label());
    }
    return labels;
}

void PathResolver::record_decision(ExecutionContext& ctx, const Block& decider,
                                   const std::string& label, const Value& output) const {
    ctx.transact([&](ExecutionContext::State& state) {
        if (decider.kind == BlockKind::ROUTER) {
            state.decisions.router[decider.id] = label;
        } else {
            state.decisions.condition[decider.id] = label;
        }
        state.block_states[decider.id] = output;
        state.executed_blocks.insert(decider.id);
        prune_after_decision(decider.id, state);
    });
}

void PathResolver::prune_after_decision(const BlockId& decider, ExecutionContext::State& state) const {
    recompute(graph_.descendants(decider), state, false);
}

void PathResolver::reactivate_body(const BlockId& loop_id, ExecutionContext::State& state) const {
    recompute(graph_.descendants(loop_id), state, true);
}

bool PathResolver::has_live_incoming(const BlockId& id, const ExecutionContext::State& state) const {
    for (std::size_t ei : graph_.incoming(id)) {
        if (is_edge_live(graph_.edge(ei), state)) return true;
    }
    return false;
}

void PathResolver::recompute(const std::unordered_set<BlockId>& region,
                             ExecutionContext::State& state,
                             bool allow_growth) const {
    for (const auto& id : graph_.topological_order()) {
        if (region.count(id) == 0) continue;
        bool was_active = state.active_execution_path.count(id) > 0;
        if (!was_active && !allow_growth) continue;
        bool active = graph_.block(id).enabled && (roots_.count(id) > 0 || has_live_incoming(id, state));
        if (active) {
            state.active_execution_path.insert(id);
        } else {
            state.active_execution_path.erase(id);
        }
    }
}

} // namespace blockflow
