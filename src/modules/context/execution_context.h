// modules/context/execution_context.h
#ifndef BLOCKFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H
#define BLOCKFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H

#include "core/types/context.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockflow {

// One execution record. Appended in completion order.
struct BlockLog {
    std::uint64_t sequence = 0; // assigned on append
    BlockId block_id;
    std::string block_kind;
    std::optional<int> iteration; // loop body pass, 0-based
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    Value input = Value::object();
    std::optional<Value> output;
    std::optional<std::string> error;
    bool success = false;

    long long duration_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    }
};

struct Decisions {
    std::unordered_map<BlockId, std::string> router;
    std::unordered_map<BlockId, std::string> condition;
};

// Run-scoped state shared by every block execution. All access goes through
// one mutex; multi-field updates use transact().
class ExecutionContext {
public:
    struct State {
        std::unordered_map<BlockId, Value> block_states;
        std::vector<BlockLog> block_logs;
        Decisions decisions;
        std::unordered_map<BlockId, int> loop_iterations;
        std::unordered_map<BlockId, Value> loop_items;
        std::unordered_map<BlockId, Value> loop_results; // loop id -> [{bodyBlockId: output}, ...]
        std::unordered_set<BlockId> executed_blocks;
        std::unordered_set<BlockId> active_execution_path;
        std::uint64_t next_sequence = 0;

        void append_log(BlockLog log);
    };

    ExecutionContext(std::string workflow_id,
                     std::unordered_map<std::string, std::string> environment_variables = {},
                     Value workflow_input = Value::object());

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const std::string& workflow_id() const { return workflow_id_; }
    const Value& workflow_input() const { return workflow_input_; }

    // Read-only for the whole run
    const std::unordered_map<std::string, std::string>& environment_variables() const { return environment_variables_; }
    std::optional<std::string> environment_variable(const std::string& name) const;

    bool has_block_state(const BlockId& id) const;
    std::optional<Value> block_state(const BlockId& id) const;
    void set_block_state(const BlockId& id, Value output);
    std::unordered_map<BlockId, Value> block_states() const;

    void append_log(BlockLog log);
    std::vector<BlockLog> block_logs() const;

    std::optional<std::string> router_decision(const BlockId& id) const;
    std::optional<std::string> condition_decision(const BlockId& id) const;
    std::optional<std::string> decision(const BlockId& id) const; // either map
    Decisions decisions() const;

    int loop_iteration(const BlockId& loop_id) const;
    void set_loop_iteration(const BlockId& loop_id, int iteration);
    std::optional<Value> loop_item(const BlockId& loop_id) const;
    void set_loop_item(const BlockId& loop_id, Value item);
    Value loop_results(const BlockId& loop_id) const; // empty array when none

    bool is_executed(const BlockId& id) const;
    void mark_executed(const BlockId& id);
    std::unordered_set<BlockId> executed_blocks() const;

    bool is_active(const BlockId& id) const;
    std::unordered_set<BlockId> active_execution_path() const;
    void set_active_execution_path(std::unordered_set<BlockId> active);

    // Successful completion: state, executed mark and log under one lock
    void record_completion(const BlockId& id, Value output, BlockLog log);

    // Runs `fn` with the lock held
    void transact(const std::function<void(State&)>& fn);

    State snapshot() const;

private:
    const std::string workflow_id_;
    const std::unordered_map<std::string, std::string> environment_variables_;
    const Value workflow_input_;

    mutable std::mutex mutex_;
    State state_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_CONTEXT_EXECUTION_CONTEXT_H
