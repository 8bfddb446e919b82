// src/core/engine.cpp
#include "blockflow/core/engine.h"
#include "modules/loop/loop_controller.h"
#include "modules/parser/graph_parser.h"
#include "modules/path/path_resolver.h"
#include "modules/scheduler/graph_index.h"
#include <fstream>
#include <iostream>

namespace blockflow {

ExecutorConfig load_executor_config(const std::string& config_path) {
    ExecutorConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[WARNING] Ignoring malformed config file: " << config_path << std::endl;
        return config;
    }

    if (j.contains("default_function_timeout_ms") && j["default_function_timeout_ms"].is_number_integer()) {
        config.default_function_timeout_ms = j["default_function_timeout_ms"].get<long long>();
    }
    if (j.contains("default_tool_timeout_ms") && j["default_tool_timeout_ms"].is_number_integer()) {
        config.default_tool_timeout_ms = j["default_tool_timeout_ms"].get<long long>();
    }
    if (j.contains("max_parallel_blocks") && j["max_parallel_blocks"].is_number_unsigned()) {
        auto n = j["max_parallel_blocks"].get<std::size_t>();
        config.max_parallel_blocks = (n > 0) ? n : 1;
    }
    if (j.contains("max_loop_iterations") && j["max_loop_iterations"].is_number_integer()) {
        config.max_loop_iterations = j["max_loop_iterations"].get<int>();
    }
    if (j.contains("default_loop_iterations") && j["default_loop_iterations"].is_number_integer()) {
        config.default_loop_iterations = j["default_loop_iterations"].get<int>();
    }
    if (j.contains("verbose") && j["verbose"].is_boolean()) {
        config.verbose = j["verbose"].get<bool>();
    }
    if (j.contains("budget") && j["budget"].is_object()) {
        const auto& b = j["budget"];
        if (b.contains("max_block_executions") && b["max_block_executions"].is_number_integer()) {
            config.max_block_executions = b["max_block_executions"].get<int>();
        }
        if (b.contains("max_duration_ms") && b["max_duration_ms"].is_number_integer()) {
            config.max_duration_ms = b["max_duration_ms"].get<long long>();
        }
    }

    return config;
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_yaml(const std::string& content, ExecutorConfig config) {
    GraphParser parser;
    return std::make_unique<WorkflowEngine>(parser.parse_from_string(content), std::move(config));
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_file(const std::string& file_path, ExecutorConfig config) {
    GraphParser parser;
    return std::make_unique<WorkflowEngine>(parser.parse_from_file(file_path), std::move(config));
}

WorkflowEngine::WorkflowEngine(WorkflowGraph graph, ExecutorConfig config)
    : graph_(std::move(graph)), config_(std::move(config)) {
    // Structural checks up front; handler lookup waits for the tools
    GraphIndex index(graph_);
    PathResolver(index).validate();
    LoopController::plan(index, config_);
}

ExecutionResult WorkflowEngine::run(const RunOptions& options) {
    Executor executor(graph_, tool_registry_, config_);
    return executor.execute(options.input,
                            options.environment_variables,
                            options.cancel.value_or(CancellationToken()));
}

} // namespace blockflow
