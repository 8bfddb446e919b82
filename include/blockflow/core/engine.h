// blockflow/core/engine.h
#ifndef BLOCKFLOW_CORE_ENGINE_H
#define BLOCKFLOW_CORE_ENGINE_H

#include "core/types/block.h"
#include "core/types/config.h"
#include "common/tools/cancellation.h"
#include "common/tools/registry.h"
#include "modules/scheduler/executor.h"
#include "modules/trace/log_exporter.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace blockflow {

struct RunOptions {
    std::unordered_map<std::string, std::string> environment_variables;
    Value input = Value::object();
    std::optional<CancellationToken> cancel;
};

class WorkflowEngine {
public:
    static std::unique_ptr<WorkflowEngine> from_yaml(const std::string& content, ExecutorConfig config = {});
    static std::unique_ptr<WorkflowEngine> from_file(const std::string& file_path, ExecutorConfig config = {});

    explicit WorkflowEngine(WorkflowGraph graph, ExecutorConfig config = {});

    // fn(const Value& params, const CancellationToken& cancel) -> ToolEnvelope
    template<typename Func>
    void register_tool(std::string_view name, Func&& func) {
        tool_registry_.register_tool(std::string(name), std::forward<Func>(func));
    }

    // Handler lookup happens here, so every tool a block names must be registered first.
    // Throws HandlerNotFoundError; run failures are reported in the result.
    ExecutionResult run(const RunOptions& options = RunOptions{});

    const WorkflowGraph& graph() const { return graph_; }
    const ExecutorConfig& config() const { return config_; }
    ToolRegistry& tools() { return tool_registry_; }

private:
    WorkflowGraph graph_;
    ExecutorConfig config_;
    ToolRegistry tool_registry_;
};

// Reads an ExecutorConfig from a JSON file. A missing file or an ill-typed
// field keeps the default value.
ExecutorConfig load_executor_config(const std::string& config_path = "blockflow_config.json");

} // namespace blockflow

#endif // BLOCKFLOW_CORE_ENGINE_H
