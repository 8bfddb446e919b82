// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"
#include <chrono>

namespace blockflow {

BudgetController::BudgetController(std::optional<ExecutionBudget> initial_budget)
    : budget_opt_(std::move(initial_budget)) {
    if (budget_opt_.has_value()) {
        budget_opt_->start_time = std::chrono::steady_clock::now();
    }
}

bool BudgetController::try_consume_block() {
    if (!budget_opt_.has_value()) {
        return true;
    }
    return budget_opt_->try_consume_block();
}

bool BudgetController::exceeded() const {
    if (!budget_opt_.has_value()) {
        return false;
    }
    return budget_opt_->exceeded();
}

std::string BudgetController::describe_exhaustion() const {
    if (!budget_opt_.has_value()) {
        return "Budget exceeded";
    }
    const auto& b = *budget_opt_;
    if (b.duration_exceeded()) {
        return "Budget exceeded: run took longer than " + std::to_string(b.max_duration_ms) + "ms";
    }
    return "Budget exceeded: more than " + std::to_string(b.max_block_executions) + " block executions";
}

const std::optional<ExecutionBudget>& BudgetController::get_budget() const {
    return budget_opt_;
}

} // namespace blockflow
