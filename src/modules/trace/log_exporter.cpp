// modules/trace/log_exporter.cpp
#include "modules/trace/log_exporter.h"
#include "modules/scheduler/executor.h"
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace blockflow {

Value LogExporter::block_log_to_json(const BlockLog& log) {
    Value j;
    j["sequence"] = log.sequence;
    j["blockId"] = log.block_id;
    j["blockType"] = log.block_kind;
    if (log.iteration) j["iteration"] = *log.iteration;
    j["startedAt"] = format_timestamp(log.start_time);
    j["endedAt"] = format_timestamp(log.end_time);
    j["durationMs"] = log.duration_ms();
    j["success"] = log.success;
    j["input"] = log.input;
    if (log.output) j["output"] = *log.output;
    if (log.error) j["error"] = *log.error;
    return j;
}

Value LogExporter::block_logs_to_json(const std::vector<BlockLog>& logs) {
    Value arr = Value::array();
    for (const auto& log : logs) {
        arr.push_back(block_log_to_json(log));
    }
    return arr;
}

Value LogExporter::decisions_to_json(const Decisions& decisions) {
    // std::map for a stable key order in the output
    std::map<std::string, std::string> router(decisions.router.begin(), decisions.router.end());
    std::map<std::string, std::string> condition(decisions.condition.begin(), decisions.condition.end());
    return Value{{"router", router}, {"condition", condition}};
}

Value LogExporter::result_to_json(const ExecutionResult& result) {
    Value j;
    j["success"] = result.success;
    j["cancelled"] = result.cancelled;
    j["message"] = result.message;

    Value states = Value::object();
    for (const auto& [id, state] : result.block_states) {
        states[id] = state;
    }
    j["blockStates"] = std::move(states);
    j["blockLogs"] = block_logs_to_json(result.block_logs);
    j["decisions"] = decisions_to_json(result.decisions);

    Value loops = Value::object();
    for (const auto& [id, n] : result.loop_iterations) {
        loops[id] = n;
    }
    j["loopIterations"] = std::move(loops);
    j["budget"] = result.budget;
    return j;
}

Value LogExporter::serialize_budget_state(const std::optional<ExecutionBudget>& budget) {
    if (!budget.has_value()) {
        return Value::object();
    }
    const auto& b = budget.value();
    Value obj;
    obj["max_block_executions"] = b.max_block_executions;
    obj["max_duration_ms"] = b.max_duration_ms;
    obj["block_executions_used"] = b.block_executions_used.load();
    obj["elapsed_ms"] = b.elapsed_ms();
    return obj;
}

std::string LogExporter::format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // namespace blockflow
