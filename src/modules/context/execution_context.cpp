// modules/context/execution_context.cpp
#include "modules/context/execution_context.h"

namespace blockflow {

void ExecutionContext::State::append_log(BlockLog log) {
    log.sequence = next_sequence++;
    block_logs.push_back(std::move(log));
}

ExecutionContext::ExecutionContext(std::string workflow_id,
                                   std::unordered_map<std::string, std::string> environment_variables,
                                   Value workflow_input)
    : workflow_id_(std::move(workflow_id)),
      environment_variables_(std::move(environment_variables)),
      workflow_input_(std::move(workflow_input)) {}

std::optional<std::string> ExecutionContext::environment_variable(const std::string& name) const {
    auto it = environment_variables_.find(name);
    if (it == environment_variables_.end()) return std::nullopt;
    return it->second;
}

bool ExecutionContext::has_block_state(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.block_states.count(id) > 0;
}

std::optional<Value> ExecutionContext::block_state(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.block_states.find(id);
    if (it == state_.block_states.end()) return std::nullopt;
    return it->second;
}

void ExecutionContext::set_block_state(const BlockId& id, Value output) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.block_states[id] = std::move(output);
}

std::unordered_map<BlockId, Value> ExecutionContext::block_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.block_states;
}

void ExecutionContext::append_log(BlockLog log) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.append_log(std::move(log));
}

std::vector<BlockLog> ExecutionContext::block_logs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.block_logs;
}

std::optional<std::string> ExecutionContext::router_decision(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.decisions.router.find(id);
    if (it == state_.decisions.router.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ExecutionContext::condition_decision(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.decisions.condition.find(id);
    if (it == state_.decisions.condition.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ExecutionContext::decision(const BlockId& id) const {
    if (auto r = router_decision(id)) return r;
    return condition_decision(id);
}

Decisions ExecutionContext::decisions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.decisions;
}

int ExecutionContext::loop_iteration(const BlockId& loop_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.loop_iterations.find(loop_id);
    return it == state_.loop_iterations.end() ? 0 : it->second;
}

void ExecutionContext::set_loop_iteration(const BlockId& loop_id, int iteration) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.loop_iterations[loop_id] = iteration;
}

std::optional<Value> ExecutionContext::loop_item(const BlockId& loop_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.loop_items.find(loop_id);
    if (it == state_.loop_items.end()) return std::nullopt;
    return it->second;
}

void ExecutionContext::set_loop_item(const BlockId& loop_id, Value item) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.loop_items[loop_id] = std::move(item);
}

Value ExecutionContext::loop_results(const BlockId& loop_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.loop_results.find(loop_id);
    if (it == state_.loop_results.end()) return Value::array();
    return it->second;
}

bool ExecutionContext::is_executed(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.executed_blocks.count(id) > 0;
}

void ExecutionContext::mark_executed(const BlockId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.executed_blocks.insert(id);
}

std::unordered_set<BlockId> ExecutionContext::executed_blocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.executed_blocks;
}

bool ExecutionContext::is_active(const BlockId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active_execution_path.count(id) > 0;
}

std::unordered_set<BlockId> ExecutionContext::active_execution_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active_execution_path;
}

void ExecutionContext::set_active_execution_path(std::unordered_set<BlockId> active) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.active_execution_path = std::move(active);
}

void ExecutionContext::record_completion(const BlockId& id, Value output, BlockLog log) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.block_states[id] = std::move(output);
    state_.executed_blocks.insert(id);
    state_.append_log(std::move(log));
}

void ExecutionContext::transact(const std::function<void(State&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(state_);
}

ExecutionContext::State ExecutionContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace blockflow
