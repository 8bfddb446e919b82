// tests/test_loop.cpp
#include <catch2/catch_test_macros.hpp>
#include "blockflow/core/engine.h"
#include "modules/loop/loop_controller.h"
#include "core/types/errors.h"
#include "mock_tools.h"
#include <string>

using blockflow::Value;

namespace {

std::unique_ptr<blockflow::WorkflowEngine> make_engine(const std::string& yaml, blockflow::ExecutorConfig config = {}) {
    auto engine = blockflow::WorkflowEngine::from_yaml(yaml, config);
    engine->register_tool("function_execute", blockflow::testing::echo_code);
    return engine;
}

std::vector<blockflow::BlockLog> logs_of(const blockflow::ExecutionResult& result, const std::string& id) {
    std::vector<blockflow::BlockLog> out;
    for (const auto& log : result.block_logs) {
        if (log.block_id == id) out.push_back(log);
    }
    return out;
}

const char* kForEach = R"(
workflow_id: wf-loop
blocks:
  - { id: start, kind: starter }
  - id: each
    kind: loop
    config: { mode: forEach, body: [work] }
    inputs: { collection: "<start.input.items>" }
  - id: work
    kind: function
    inputs: { code: "item=<loop.currentItem> idx=<loop.index>" }
  - id: after
    kind: function
    inputs: { code: "total=<each.iterations>" }
edges:
  - { source: start, target: each }
  - { source: each, target: work }
  - { source: work, target: after }
)";

} // namespace

// Test 1: forEach over an array
TEST_CASE("forEach loop runs once per item", "[loop]") {
    auto engine = make_engine(kForEach);
    blockflow::RunOptions options;
    options.input = Value{{"items", {1, 2, 3}}};

    auto result = engine->run(options);
    REQUIRE(result.success);
    REQUIRE(result.loop_iterations.at("each") == 3);

    const Value& aggregate = result.block_states.at("each");
    REQUIRE(aggregate["iterations"] == 3);
    REQUIRE(aggregate["results"].size() == 3);
    REQUIRE(aggregate["results"][0]["work"]["response"]["result"] == "item=1 idx=0");
    REQUIRE(aggregate["results"][1]["work"]["response"]["result"] == "item=2 idx=1");
    REQUIRE(aggregate["results"][2]["work"]["response"]["result"] == "item=3 idx=2");

    // latest iteration only
    REQUIRE(result.block_states.at("work")["response"]["result"] == "item=3 idx=2");

    auto work_logs = logs_of(result, "work");
    REQUIRE(work_logs.size() == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(work_logs[i].iteration == i);
    }

    // downstream waits for the loop
    REQUIRE(result.block_states.at("after")["response"]["result"] == "total=3");
    REQUIRE(logs_of(result, "each").size() == 1);
    REQUIRE(logs_of(result, "after").front().sequence > work_logs.back().sequence);
}

TEST_CASE("Empty collection completes immediately", "[loop]") {
    auto engine = make_engine(kForEach);
    blockflow::RunOptions options;
    options.input = Value{{"items", Value::array()}};

    auto result = engine->run(options);
    REQUIRE(result.success);
    REQUIRE(result.block_states.at("each") == Value{{"results", Value::array()}, {"iterations", 0}});
    REQUIRE(logs_of(result, "work").empty());
    REQUIRE(result.block_states.at("after")["response"]["result"] == "total=0");
}

// Test 2: count mode
TEST_CASE("for loop runs the configured count", "[loop]") {
    const char* yaml = R"(
blocks:
  - { id: start, kind: starter }
  - id: repeat
    kind: loop
    config: { mode: for, iterations: 4, body: [tick] }
  - id: tick
    kind: function
    inputs: { code: "n=<loop.iteration>" }
edges:
  - { source: start, target: repeat }
  - { source: repeat, target: tick }
)";

    SECTION("bound as written") {
        auto result = make_engine(yaml)->run();
        REQUIRE(result.success);
        REQUIRE(result.loop_iterations.at("repeat") == 4);
        REQUIRE(logs_of(result, "tick").size() == 4);
        REQUIRE(result.block_states.at("tick")["response"]["result"] == "n=4");
    }

    SECTION("clamped by max_loop_iterations") {
        blockflow::ExecutorConfig config;
        config.max_loop_iterations = 2;
        auto result = make_engine(yaml, config)->run();
        REQUIRE(result.success);
        REQUIRE(result.loop_iterations.at("repeat") == 2);
    }
}

TEST_CASE("Default iteration count is five", "[loop]") {
    auto result = make_engine(R"(
blocks:
  - { id: repeat, kind: loop, config: { body: [tick] } }
  - { id: tick, kind: function, inputs: { code: "x" } }
edges:
  - { source: repeat, target: tick }
)")->run();
    REQUIRE(result.success);
    REQUIRE(result.loop_iterations.at("repeat") == 5);
}

// Test 3: branches inside the body are re-evaluated every iteration
TEST_CASE("Decisions inside a loop body reset per iteration", "[loop][pruning]") {
    auto engine = make_engine(R"(
blocks:
  - { id: start, kind: starter }
  - id: each
    kind: loop
    config: { mode: forEach, collection: [1, 5, 2], body: [check, big, small] }
  - id: check
    kind: condition
    config:
      conditions:
        - { label: big, expression: "value > 1" }
        - { label: small }
    inputs: { value: "<loop.currentItem>" }
  - { id: big, kind: function, inputs: { code: "big <loop.currentItem>" } }
  - { id: small, kind: function, inputs: { code: "small <loop.currentItem>" } }
  - { id: done, kind: function, inputs: { code: "done" } }
edges:
  - { source: start, target: each }
  - { source: each, target: check }
  - { source: check, target: big, label: big }
  - { source: check, target: small, label: small }
  - { source: big, target: done }
  - { source: small, target: done }
)");

    auto result = engine->run();
    REQUIRE(result.success);

    const Value& results = result.block_states.at("each")["results"];
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].contains("small"));
    REQUIRE_FALSE(results[0].contains("big"));
    REQUIRE(results[1]["big"]["response"]["result"] == "big 5");
    REQUIRE_FALSE(results[1].contains("small"));
    REQUIRE(results[2]["big"]["response"]["result"] == "big 2");

    REQUIRE(logs_of(result, "check").size() == 3);
    REQUIRE(logs_of(result, "big").size() == 2);
    REQUIRE(logs_of(result, "small").size() == 1);
    REQUIRE(logs_of(result, "done").size() == 1);
    REQUIRE(result.decisions.condition.at("check") == "big");
}

// Test 4: collections
TEST_CASE("Loop collections", "[loop][collection]") {
    using blockflow::LoopController;

    REQUIRE(LoopController::parse_collection(Value({"x", "y"})) == Value({"x", "y"}));
    REQUIRE(LoopController::parse_collection(Value{{"a", 1}, {"b", 2}}) ==
            Value::array({Value::array({"a", 1}), Value::array({"b", 2})}));
    REQUIRE(LoopController::parse_collection(Value("[\"x\",\"y\"]")) == Value({"x", "y"}));
    REQUIRE(LoopController::parse_collection(Value()).empty());
    REQUIRE_THROWS_AS(LoopController::parse_collection(Value(42)), blockflow::ExecutionError);
    REQUIRE_THROWS_AS(LoopController::parse_collection(Value("not json")), blockflow::ExecutionError);
}

TEST_CASE("Object collection iterates key/value pairs", "[loop][collection]") {
    auto engine = make_engine(R"(
blocks:
  - id: each
    kind: loop
    config: { mode: forEach, body: [work] }
    inputs: { collection: "<start.input.scores>" }
  - { id: work, kind: function, inputs: { code: "<loop.currentItem.0>=<loop.currentItem.1>" } }
edges:
  - { source: each, target: work }
)");
    blockflow::RunOptions options;
    options.input = Value{{"scores", {{"ann", 3}, {"bob", 7}}}};

    auto result = engine->run(options);
    REQUIRE(result.success);
    const Value& results = result.block_states.at("each")["results"];
    REQUIRE(results.size() == 2);
    REQUIRE(results[0]["work"]["response"]["result"] == "ann=3");
    REQUIRE(results[1]["work"]["response"]["result"] == "bob=7");
}

TEST_CASE("Invalid collection fails the run", "[loop][errors]") {
    auto engine = make_engine(kForEach);
    blockflow::RunOptions options;
    options.input = Value{{"items", 42}};

    auto result = engine->run(options);
    REQUIRE_FALSE(result.success);
    REQUIRE(logs_of(result, "each").size() == 1);
    REQUIRE_FALSE(logs_of(result, "each").front().success);
    REQUIRE(logs_of(result, "work").empty());
}

// Test 5: validation
TEST_CASE("Loop validation", "[loop][validation]") {
    SECTION("nested loops") {
        REQUIRE_THROWS_AS(blockflow::WorkflowEngine::from_yaml(R"(
blocks:
  - { id: outer, kind: loop, config: { body: [inner, work] } }
  - { id: inner, kind: loop, config: { body: [work] } }
  - { id: work, kind: function }
edges:
  - { source: outer, target: inner }
  - { source: inner, target: work }
)"), blockflow::GraphValidationError);
    }

    SECTION("body outside the loop subgraph") {
        REQUIRE_THROWS_AS(blockflow::WorkflowEngine::from_yaml(R"(
blocks:
  - { id: each, kind: loop, config: { body: [elsewhere] } }
  - { id: elsewhere, kind: function }
)"), blockflow::GraphValidationError);
    }

    SECTION("unknown mode") {
        REQUIRE_THROWS_AS(blockflow::WorkflowEngine::from_yaml(R"(
blocks:
  - { id: each, kind: loop, config: { mode: while, body: [work] } }
  - { id: work, kind: function }
edges:
  - { source: each, target: work }
)"), blockflow::GraphValidationError);
    }
}
