// modules/scheduler/executor.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_EXECUTOR_H
#define BLOCKFLOW_MODULES_SCHEDULER_EXECUTOR_H

#include "core/types/block.h"
#include "core/types/config.h"
#include "common/tools/cancellation.h"
#include "common/tools/registry.h"
#include "modules/budget/budget_controller.h"
#include "modules/context/execution_context.h"
#include "modules/handlers/handler_registry.h"
#include "modules/loop/loop_controller.h"
#include "modules/path/path_resolver.h"
#include "modules/resolver/input_resolver.h"
#include "modules/scheduler/graph_index.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockflow {

struct ExecutionResult {
    bool success = false;
    bool cancelled = false;
    std::string message;
    std::vector<BlockLog> block_logs;
    std::unordered_map<BlockId, Value> block_states;
    Decisions decisions;
    std::unordered_map<BlockId, int> loop_iterations;
    Value budget = Value::object(); // usage at the end of the run
};

// Runs a workflow graph tick by tick. Blocks that are ready in the same tick
// run concurrently; their dependents become ready in a later tick.
//
// Construction validates the graph (cycles, dangling edges, decision labels,
// loop bodies) and looks up a handler for every enabled block, so
// configuration errors throw here rather than during a run.
class Executor {
public:
    Executor(WorkflowGraph graph, ToolInvoker& tools, ExecutorConfig config = {});

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Each call starts from a fresh ExecutionContext
    ExecutionResult execute(const Value& workflow_input = Value::object(),
                            std::unordered_map<std::string, std::string> environment_variables = {},
                            CancellationToken cancel = CancellationToken());

    const GraphIndex& graph() const { return index_; }
    const ExecutorConfig& config() const { return config_; }

private:
    struct WorkItem {
        BlockId id;
        std::optional<BlockId> loop; // set for loop body blocks
        int iteration = -1;
    };

    struct Outcome {
        enum class Kind { COMPLETED, RECOVERED, FAILED, CANCELLED, BUDGET };
        Kind kind = Kind::COMPLETED;
        std::string message;
    };

    // Per-run collaborators
    struct Run {
        ExecutionContext& ctx;
        LoopController& loops;
        BudgetController& budget;
        const CancellationToken& cancel;
    };

    ExecutorConfig config_;
    GraphIndex index_;
    PathResolver path_;
    LoopPlans loop_plans_;
    HandlerRegistry handlers_;
    InputResolver resolver_;

    std::vector<WorkItem> collect_ready(const Run& run, std::vector<BlockId>& loop_starts) const;
    bool dependencies_satisfied(const BlockId& id, const ExecutionContext::State& state, const LoopController& loops) const;
    std::vector<BlockId> unfinished_blocks(const Run& run) const;

    Outcome run_block(const WorkItem& item, Run& run);
    std::optional<std::string> start_loop(const BlockId& loop_id, Run& run);

    ExecutionResult finish(const Run& run, bool success, bool cancelled, std::string message) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_EXECUTOR_H
