// main.cpp
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>
#include "blockflow/core/engine.h"

using blockflow::CancellationToken;
using blockflow::ToolEnvelope;
using blockflow::Value;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <workflow.yaml> [config.json] [input.json]\n";
        return 1;
    }

    try {
        // 1. Config and workflow
        auto config = blockflow::load_executor_config(argc >= 3 ? argv[2] : "blockflow_config.json");
        auto engine = blockflow::WorkflowEngine::from_file(argv[1], config);

        // 2. Demo tools
        engine->register_tool("function_execute", [](const Value& params, const CancellationToken&) {
            // Stand-in for a sandboxed interpreter: echoes the code it was given
            std::string code = params.value("code", std::string{});
            return ToolEnvelope::ok(Value{{"result", code}, {"lines", std::count(code.begin(), code.end(), '\n') + 1}});
        });
        engine->register_tool("uppercase", [](const Value& params, const CancellationToken&) {
            if (!params.contains("text") || !params["text"].is_string()) {
                return ToolEnvelope::failure("uppercase: 'text' must be a string");
            }
            std::string text = params["text"].get<std::string>();
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
            return ToolEnvelope::ok(Value{{"text", text}});
        });
        engine->register_tool("sleep", [](const Value& params, const CancellationToken& cancel) {
            auto ms = params.value("ms", 100);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
            while (std::chrono::steady_clock::now() < deadline) {
                if (cancel.is_cancelled()) return ToolEnvelope::failure("sleep cancelled");
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return ToolEnvelope::ok(Value{{"slept_ms", ms}});
        });

        // 3. Run
        blockflow::RunOptions options;
        if (argc == 4) {
            std::ifstream input_file(argv[3]);
            if (!input_file.is_open()) {
                std::cerr << "[ERROR] Cannot open input file: " << argv[3] << "\n";
                return 1;
            }
            options.input = nlohmann::json::parse(input_file);
        }
        options.environment_variables["GREETING"] = "hello";

        auto result = engine->run(options);

        // 4. Report
        std::cout << blockflow::LogExporter::result_to_json(result).dump(2) << std::endl;
        if (!result.success) {
            std::cerr << "[ERROR] " << result.message << "\n";
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
