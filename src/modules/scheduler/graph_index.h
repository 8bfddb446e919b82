// modules/scheduler/graph_index.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_GRAPH_INDEX_H
#define BLOCKFLOW_MODULES_SCHEDULER_GRAPH_INDEX_H

#include "core/types/block.h"
#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockflow {

// Adjacency and topological order of a workflow graph. Owns its copy of the graph.
// Throws GraphValidationError on dangling edges, duplicate ids or cycles.
class GraphIndex {
public:
    explicit GraphIndex(WorkflowGraph graph);

    const WorkflowGraph& graph() const { return graph_; }
    const std::string& workflow_id() const { return graph_.workflow_id; }

    bool contains(const BlockId& id) const { return position_.count(id) > 0; }
    const Block& block(const BlockId& id) const;
    const Edge& edge(std::size_t index) const { return graph_.edges[index]; }

    // Edge indices
    const std::vector<std::size_t>& incoming(const BlockId& id) const;
    const std::vector<std::size_t>& outgoing(const BlockId& id) const;

    const std::vector<BlockId>& topological_order() const { return topo_order_; }

    // Every block reachable from `id` by edges, excluding `id` itself
    std::unordered_set<BlockId> descendants(const BlockId& id) const;

    // Explicit start list, else starter blocks, else enabled blocks without incoming edges
    const std::vector<BlockId>& roots() const { return roots_; }

private:
    WorkflowGraph graph_;
    std::unordered_map<BlockId, std::size_t> position_; // index into graph_.blocks
    std::unordered_map<BlockId, std::vector<std::size_t>> incoming_;
    std::unordered_map<BlockId, std::vector<std::size_t>> outgoing_;
    std::vector<BlockId> topo_order_;
    std::vector<BlockId> roots_;

    void build_topological_order();
    void select_roots();
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_GRAPH_INDEX_H
