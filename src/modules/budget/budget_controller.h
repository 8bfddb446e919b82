// modules/budget/budget_controller.h
#ifndef BLOCKFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define BLOCKFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h"
#include <optional>
#include <string>

namespace blockflow {

// Wraps the run's ExecutionBudget. No budget means unlimited.
class BudgetController {
public:
    explicit BudgetController(std::optional<ExecutionBudget> initial_budget = std::nullopt);

    // Counts one block execution; false once max_block_executions is reached
    bool try_consume_block();

    bool exceeded() const;

    // Why the budget is exhausted, for the run's failure message
    std::string describe_exhaustion() const;

    const std::optional<ExecutionBudget>& get_budget() const;

private:
    std::optional<ExecutionBudget> budget_opt_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
