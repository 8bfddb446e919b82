// modules/loop/loop_controller.h
#ifndef BLOCKFLOW_MODULES_LOOP_LOOP_CONTROLLER_H
#define BLOCKFLOW_MODULES_LOOP_LOOP_CONTROLLER_H

#include "core/types/block.h"
#include "core/types/config.h"
#include "modules/context/execution_context.h"
#include "modules/path/path_resolver.h"
#include "modules/scheduler/graph_index.h"
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace blockflow {

enum class LoopState {
    PENDING,
    ITERATING,
    COMPLETED
};

enum class LoopMode {
    FOR_EACH, // over a collection
    FOR       // fixed count
};

// Static description of one loop block, validated against the graph
struct LoopPlan {
    BlockId id;
    LoopMode mode = LoopMode::FOR;
    int iterations = 5;                // count bound, already clamped
    std::unordered_set<BlockId> body;
    std::vector<BlockId> body_order;   // topological
    std::optional<Value> static_collection;
};

using LoopPlans = std::unordered_map<BlockId, LoopPlan>;

// Drives Pending -> Iterating -> Completed for every loop of one run.
// Per-iteration outputs live in the context (loop_results); completion of body
// blocks is tracked here under (blockId, iteration) keys.
class LoopController {
public:
    // Throws GraphValidationError for bodies outside the loop's subgraph and nested loops
    static LoopPlans plan(const GraphIndex& graph, const ExecutorConfig& config);

    LoopController(const GraphIndex& graph, const LoopPlans& plans, const ExecutorConfig& config);

    bool is_loop(const BlockId& id) const { return plans_.count(id) > 0; }
    std::optional<BlockId> owning_loop(const BlockId& id) const;

    LoopState state(const BlockId& loop_id) const;
    int current_iteration(const BlockId& loop_id) const; // 0-based, -1 before the first pass
    bool body_completed(const BlockId& block_id, int iteration) const;

    // Pending -> Iterating (or straight to Completed for an empty collection / zero count)
    void begin(const BlockId& loop_id, const Value& inputs, ExecutionContext& ctx, const PathResolver& path);

    // Called by the worker that finished a body block
    void record_body_output(const BlockId& block_id, int iteration, const Value& output, ExecutionContext& ctx);

    // Closes finished passes: next iteration or Completed. Returns true if any loop moved.
    bool advance(ExecutionContext& ctx, const PathResolver& path);

    // {results: [...], iterations: N}
    static Value aggregate(const BlockId& loop_id, const ExecutionContext& ctx);

    // Array as is, object as [key, value] pairs, string as JSON text of either
    static Value parse_collection(const Value& raw);

private:
    struct Runtime {
        LoopState state = LoopState::PENDING;
        int iteration = -1;
        std::vector<Value> items;
    };

    const GraphIndex& graph_;
    const LoopPlans& plans_;
    const ExecutorConfig& config_;
    std::unordered_map<BlockId, BlockId> owner_; // body block -> loop

    mutable std::mutex mutex_;
    std::unordered_map<BlockId, Runtime> runtime_;
    std::set<std::pair<BlockId, int>> completed_;

    void start_iteration(const LoopPlan& plan, Runtime& rt, int index, ExecutionContext& ctx, const PathResolver& path);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_LOOP_LOOP_CONTROLLER_H
