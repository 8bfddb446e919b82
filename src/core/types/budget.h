#ifndef BLOCKFLOW_CORE_TYPES_BUDGET_H
#define BLOCKFLOW_CORE_TYPES_BUDGET_H

#include <atomic>
#include <chrono>

namespace blockflow {

// Run-level execution budget
struct ExecutionBudget {
    int max_block_executions = -1; // -1 means unlimited
    long long max_duration_ms = -1;

    // Handlers of one tick consume concurrently
    mutable std::atomic<int> block_executions_used{0};
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}

    // Moving resets the counters: a budget always starts fresh
    ExecutionBudget(ExecutionBudget&& other) noexcept
        : max_block_executions(other.max_block_executions),
          max_duration_ms(other.max_duration_ms),
          block_executions_used(0),
          start_time(std::chrono::steady_clock::now()) {}

    ExecutionBudget& operator=(ExecutionBudget&& other) noexcept {
        if (this != &other) {
            max_block_executions = other.max_block_executions;
            max_duration_ms = other.max_duration_ms;
            block_executions_used = 0;
            start_time = std::chrono::steady_clock::now();
        }
        return *this;
    }

    ExecutionBudget(const ExecutionBudget&) = delete;
    ExecutionBudget& operator=(const ExecutionBudget&) = delete;

    long long elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    }

    bool duration_exceeded() const {
        return max_duration_ms >= 0 && elapsed_ms() > max_duration_ms;
    }

    bool exceeded() const {
        if (max_block_executions >= 0 && block_executions_used.load() > max_block_executions) return true;
        return duration_exceeded();
    }

    bool try_consume_block() {
        int expected = block_executions_used.load();
        do {
            if (max_block_executions >= 0 && expected >= max_block_executions) return false;
        } while (!block_executions_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }
};

} // namespace blockflow

#endif // BLOCKFLOW_CORE_TYPES_BUDGET_H
