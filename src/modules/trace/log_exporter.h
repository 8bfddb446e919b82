// modules/trace/log_exporter.h
#ifndef BLOCKFLOW_MODULES_TRACE_LOG_EXPORTER_H
#define BLOCKFLOW_MODULES_TRACE_LOG_EXPORTER_H

#include "core/types/budget.h"
#include "core/types/context.h"
#include "modules/context/execution_context.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

struct ExecutionResult;

// Serializes run results for callers and the CLI
class LogExporter {
public:
    static Value block_log_to_json(const BlockLog& log);
    static Value block_logs_to_json(const std::vector<BlockLog>& logs);
    static Value decisions_to_json(const Decisions& decisions);
    static Value result_to_json(const ExecutionResult& result);

    static Value serialize_budget_state(const std::optional<ExecutionBudget>& budget);

    // ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_TRACE_LOG_EXPORTER_H
