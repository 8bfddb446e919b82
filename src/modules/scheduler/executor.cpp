// modules/scheduler/executor.cpp
#include "modules/scheduler/executor.h"
#include "modules/trace/log_exporter.h"
#include "core/types/errors.h"
#include <algorithm>
#include <future>
#include <iostream>

namespace blockflow {

namespace {

std::string join_ids(const std::vector<BlockId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        out += (out.empty() ? "" : ", ") + id;
    }
    return out;
}

} // namespace

Executor::Executor(WorkflowGraph graph, ToolInvoker& tools, ExecutorConfig config)
    : config_(std::move(config)),
      index_(std::move(graph)),
      path_(index_),
      loop_plans_(LoopController::plan(index_, config_)),
      handlers_(tools, path_, config_),
      resolver_(index_) {
    if (config_.max_parallel_blocks == 0) {
        config_.max_parallel_blocks = 1;
    }
    path_.validate();
    for (const auto& block : index_.graph().blocks) {
        if (!block.enabled) continue; // disabled blocks are treated as removed
        handlers_.find(block);
    }
}

ExecutionResult Executor::execute(const Value& workflow_input,
                                  std::unordered_map<std::string, std::string> environment_variables,
                                  CancellationToken cancel) {
    ExecutionContext ctx(index_.workflow_id(), std::move(environment_variables), workflow_input);
    LoopController loops(index_, loop_plans_, config_);

    std::optional<ExecutionBudget> limits;
    if (config_.max_block_executions >= 0 || config_.max_duration_ms >= 0) {
        ExecutionBudget b;
        b.max_block_executions = config_.max_block_executions;
        b.max_duration_ms = config_.max_duration_ms;
        limits = std::move(b);
    }
    BudgetController budget(std::move(limits));

    Run run{ctx, loops, budget, cancel};

    ctx.transact([&](ExecutionContext::State& s) {
        s.active_execution_path = path_.initial_active_set(s);
    });

    if (config_.verbose) {
        std::cerr << "[DEBUG] Starting workflow '" << index_.workflow_id() << "' with "
                  << index_.graph().blocks.size() << " blocks" << std::endl;
    }

    while (true) {
        if (cancel.is_cancelled()) {
            return finish(run, false, true, "Execution cancelled");
        }
        if (budget.exceeded()) {
            return finish(run, false, false, budget.describe_exhaustion());
        }

        std::vector<BlockId> loop_starts;
        std::vector<WorkItem> ready = collect_ready(run, loop_starts);

        if (ready.empty() && loop_starts.empty()) {
            if (loops.advance(ctx, path_)) {
                continue;
            }
            auto pending = unfinished_blocks(run);
            if (pending.empty()) {
                return finish(run, true, false, "Workflow completed successfully");
            }
            return finish(run, false, false, "Workflow stalled; blocks can never become ready: " + join_ids(pending));
        }

        for (const auto& loop_id : loop_starts) {
            if (auto error = start_loop(loop_id, run)) {
                return finish(run, false, false, *error);
            }
        }

        for (std::size_t begin = 0; begin < ready.size(); begin += config_.max_parallel_blocks) {
            if (cancel.is_cancelled()) {
                return finish(run, false, true, "Execution cancelled");
            }
            std::size_t end = std::min(ready.size(), begin + config_.max_parallel_blocks);

            std::vector<std::future<Outcome>> workers;
            workers.reserve(end - begin);
            for (std::size_t i = begin; i < end; ++i) {
                workers.push_back(std::async(std::launch::async, [this, &run, item = ready[i]]() {
                    return run_block(item, run);
                }));
            }

            // Join every worker before acting on a failure
            std::vector<Outcome> outcomes;
            outcomes.reserve(workers.size());
            for (auto& w : workers) {
                outcomes.push_back(w.get());
            }

            for (const auto& outcome : outcomes) {
                if (outcome.kind == Outcome::Kind::FAILED) {
                    return finish(run, false, false, outcome.message);
                }
            }
            for (const auto& outcome : outcomes) {
                if (outcome.kind == Outcome::Kind::CANCELLED) {
                    return finish(run, false, true, "Execution cancelled");
                }
                if (outcome.kind == Outcome::Kind::BUDGET) {
                    return finish(run, false, false, outcome.message);
                }
            }
        }

        loops.advance(ctx, path_);
    }
}

std::vector<Executor::WorkItem> Executor::collect_ready(const Run& run, std::vector<BlockId>& loop_starts) const {
    const auto state = run.ctx.snapshot();
    std::vector<WorkItem> ready;

    for (const auto& id : index_.topological_order()) {
        const Block& block = index_.block(id);
        if (!block.enabled || state.active_execution_path.count(id) == 0) continue;

        if (run.loops.is_loop(id)) {
            LoopState ls = run.loops.state(id);
            if (ls == LoopState::PENDING && dependencies_satisfied(id, state, run.loops)) {
                loop_starts.push_back(id);
            } else if (ls == LoopState::COMPLETED && state.executed_blocks.count(id) == 0) {
                ready.push_back(WorkItem{id, std::nullopt, -1});
            }
            continue;
        }

        if (auto owner = run.loops.owning_loop(id)) {
            if (run.loops.state(*owner) != LoopState::ITERATING) continue;
            int iteration = run.loops.current_iteration(*owner);
            if (run.loops.body_completed(id, iteration)) continue;
            if (dependencies_satisfied(id, state, run.loops)) {
                ready.push_back(WorkItem{id, owner, iteration});
            }
            continue;
        }

        if (state.executed_blocks.count(id) > 0) continue;
        if (dependencies_satisfied(id, state, run.loops)) {
            ready.push_back(WorkItem{id, std::nullopt, -1});
        }
    }
    return ready;
}

bool Executor::dependencies_satisfied(const BlockId& id,
                                      const ExecutionContext::State& state,
                                      const LoopController& loops) const {
    const std::optional<BlockId> own_loop = loops.owning_loop(id);

    for (std::size_t ei : index_.incoming(id)) {
        const Edge& e = index_.edge(ei);
        const BlockId& src = e.source;
        const bool live = path_.is_edge_live(e, state);

        std::optional<BlockId> src_loop = loops.is_loop(src) ? std::optional<BlockId>(src) : loops.owning_loop(src);
        if (src_loop && src_loop != own_loop) {
            // Outside the loop: wait for the loop block itself to finish
            if (state.active_execution_path.count(*src_loop) > 0 && state.executed_blocks.count(*src_loop) == 0) {
                return false;
            }
            continue;
        }

        if (!live) continue; // dead edges are not dependencies

        if (loops.is_loop(src)) {
            // body entry edge
            if (loops.state(src) != LoopState::ITERATING) return false;
            continue;
        }
        if (src_loop) {
            if (!loops.body_completed(src, loops.current_iteration(*src_loop))) return false;
            continue;
        }
        if (state.executed_blocks.count(src) == 0) return false;
    }
    return true;
}

std::vector<BlockId> Executor::unfinished_blocks(const Run& run) const {
    const auto state = run.ctx.snapshot();
    std::vector<BlockId> pending;
    for (const auto& id : index_.topological_order()) {
        if (state.active_execution_path.count(id) == 0) continue;
        if (run.loops.owning_loop(id)) continue; // covered by the loop block
        if (state.executed_blocks.count(id) == 0) pending.push_back(id);
    }
    return pending;
}

Executor::Outcome Executor::run_block(const WorkItem& item, Run& run) {
    const Block& block = index_.block(item.id);

    if (!run.budget.try_consume_block()) {
        return Outcome{Outcome::Kind::BUDGET, run.budget.describe_exhaustion()};
    }

    BlockLog log;
    log.block_id = block.id;
    log.block_kind = block.kind_name;
    if (item.loop) log.iteration = item.iteration;
    log.input = block.inputs;
    log.start_time = std::chrono::system_clock::now();

    if (config_.verbose) {
        std::cerr << "[DEBUG] Executing block '" << block.id << "' (" << block.kind_name << ")";
        if (item.loop) std::cerr << " iteration " << item.iteration;
        std::cerr << std::endl;
    }

    try {
        Value inputs = resolver_.resolve(block, run.ctx, item.loop);
        log.input = inputs;

        BlockHandler& handler = handlers_.find(block);
        Value output = handler.execute(block, inputs, run.ctx, run.cancel);

        log.end_time = std::chrono::system_clock::now();
        log.output = output;
        log.success = true;
        if (item.loop) {
            run.loops.record_body_output(block.id, item.iteration, output, run.ctx);
        }
        run.ctx.record_completion(block.id, std::move(output), std::move(log));
        return Outcome{Outcome::Kind::COMPLETED, {}};
    } catch (const CancelledError&) {
        // interrupted blocks are neither recorded nor logged
        return Outcome{Outcome::Kind::CANCELLED, {}};
    } catch (const std::exception& e) {
        log.end_time = std::chrono::system_clock::now();
        log.error = e.what();
        log.success = false;

        if (block.best_effort) {
            std::cerr << "[WARNING] Best-effort block '" << block.id << "' failed: " << e.what() << std::endl;
            Value state = {{"error", e.what()}};
            if (item.loop) {
                run.loops.record_body_output(block.id, item.iteration, state, run.ctx);
            }
            run.ctx.record_completion(block.id, std::move(state), std::move(log));
            return Outcome{Outcome::Kind::RECOVERED, e.what()};
        }

        if (config_.verbose) {
            std::cerr << "[DEBUG] Block '" << block.id << "' failed: " << e.what() << std::endl;
        }
        run.ctx.append_log(std::move(log));
        return Outcome{Outcome::Kind::FAILED, e.what()};
    }
}

std::optional<std::string> Executor::start_loop(const BlockId& loop_id, Run& run) {
    const Block& block = index_.block(loop_id);
    try {
        Value inputs = resolver_.resolve(block, run.ctx);
        run.loops.begin(loop_id, inputs, run.ctx, path_);
        return std::nullopt;
    } catch (const std::exception& e) {
        BlockLog log;
        log.block_id = block.id;
        log.block_kind = block.kind_name;
        log.input = block.inputs;
        log.start_time = log.end_time = std::chrono::system_clock::now();
        log.error = e.what();
        run.ctx.append_log(std::move(log));
        return std::string(e.what());
    }
}

ExecutionResult Executor::finish(const Run& run, bool success, bool cancelled, std::string message) const {
    auto state = run.ctx.snapshot();

    ExecutionResult result;
    result.success = success;
    result.cancelled = cancelled;
    result.message = std::move(message);
    result.block_logs = std::move(state.block_logs);
    result.block_states = std::move(state.block_states);
    result.decisions = std::move(state.decisions);
    result.loop_iterations = std::move(state.loop_iterations);
    result.budget = LogExporter::serialize_budget_state(run.budget.get_budget());

    if (config_.verbose || !success) {
        std::cerr << (success ? "[DEBUG] " : "[WARNING] ") << "Workflow '" << index_.workflow_id()
                  << "' finished: " << result.message << std::endl;
    }
    return result;
}

} // namespace blockflow
