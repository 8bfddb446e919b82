// modules/scheduler/graph_index.cpp
#include "modules/scheduler/graph_index.h"
#include "core/types/errors.h"
#include <algorithm>
#include <queue>
#include <set>

namespace blockflow {

GraphIndex::GraphIndex(WorkflowGraph graph) : graph_(std::move(graph)) {
    for (std::size_t i = 0; i < graph_.blocks.size(); ++i) {
        const BlockId& id = graph_.blocks[i].id;
        if (!position_.emplace(id, i).second) {
            throw GraphValidationError("Duplicate block id: " + id);
        }
        incoming_[id];
        outgoing_[id];
    }

    for (std::size_t i = 0; i < graph_.edges.size(); ++i) {
        const Edge& e = graph_.edges[i];
        if (!contains(e.source)) {
            throw GraphValidationError("Edge source not found: " + e.source);
        }
        if (!contains(e.target)) {
            throw GraphValidationError("Edge target not found: " + e.target);
        }
        if (e.source == e.target) {
            throw GraphValidationError("Self edge on block: " + e.source);
        }
        outgoing_[e.source].push_back(i);
        incoming_[e.target].push_back(i);
    }

    build_topological_order();
    select_roots();
}

const Block& GraphIndex::block(const BlockId& id) const {
    auto it = position_.find(id);
    if (it == position_.end()) {
        throw GraphValidationError("Block not found: " + id);
    }
    return graph_.blocks[it->second];
}

const std::vector<std::size_t>& GraphIndex::incoming(const BlockId& id) const {
    return incoming_.at(id);
}

const std::vector<std::size_t>& GraphIndex::outgoing(const BlockId& id) const {
    return outgoing_.at(id);
}

void GraphIndex::build_topological_order() {
    // Kahn's algorithm; ties broken by declaration order so the order is stable
    std::unordered_map<BlockId, int> in_degree;
    for (const auto& b : graph_.blocks) {
        in_degree[b.id] = static_cast<int>(incoming_[b.id].size());
    }

    auto by_declaration = [this](const BlockId& a, const BlockId& b) {
        return position_.at(a) > position_.at(b);
    };
    std::priority_queue<BlockId, std::vector<BlockId>, decltype(by_declaration)> ready(by_declaration);
    for (const auto& b : graph_.blocks) {
        if (in_degree[b.id] == 0) ready.push(b.id);
    }

    while (!ready.empty()) {
        BlockId id = ready.top();
        ready.pop();
        topo_order_.push_back(id);
        for (std::size_t ei : outgoing_[id]) {
            const BlockId& next = graph_.edges[ei].target;
            if (--in_degree[next] == 0) ready.push(next);
        }
    }

    if (topo_order_.size() != graph_.blocks.size()) {
        std::set<BlockId> cyclic;
        for (const auto& [id, deg] : in_degree) {
            if (deg > 0) cyclic.insert(id);
        }
        std::string names;
        for (const auto& id : cyclic) {
            names += (names.empty() ? "" : ", ") + id;
        }
        throw GraphValidationError("Workflow graph contains a cycle through: " + names);
    }
}

void GraphIndex::select_roots() {
    if (!graph_.start_blocks.empty()) {
        for (const auto& id : graph_.start_blocks) {
            if (!contains(id)) {
                throw GraphValidationError("Start block not found: " + id);
            }
        }
        roots_ = graph_.start_blocks;
        return;
    }
    for (const auto& b : graph_.blocks) {
        if (b.enabled && b.kind == BlockKind::STARTER) roots_.push_back(b.id);
    }
    if (!roots_.empty()) return;
    for (const auto& b : graph_.blocks) {
        if (b.enabled && incoming_[b.id].empty()) roots_.push_back(b.id);
    }
}

std::unordered_set<BlockId> GraphIndex::descendants(const BlockId& id) const {
    std::unordered_set<BlockId> seen;
    std::vector<BlockId> stack{id};
    while (!stack.empty()) {
        BlockId current = stack.back();
        stack.pop_back();
        for (std::size_t ei : outgoing_.at(current)) {
            const BlockId& next = graph_.edges[ei].target;
            if (seen.insert(next).second) stack.push_back(next);
        }
    }
    return seen;
}

} // namespace blockflow
