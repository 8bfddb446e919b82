// tests/test_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "blockflow/core/engine.h"
#include "modules/parser/graph_parser.h"
#include "modules/scheduler/graph_index.h"
#include "common/utils/parser_utils.h"
#include "core/types/errors.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace blockflow;

// Test 1: basic document
TEST_CASE("Parse workflow graph", "[parser]") {
    GraphParser parser;
    auto graph = parser.parse_from_string(R"(
workflow_id: wf-parse
blocks:
  - id: start
    kind: starter
  - id: pick
    type: condition
    config:
      conditions:
        - { label: big, expression: "{{ x > 1 }}" }
        - { label: small }
  - id: notify
    kind: slack_message
    enabled: false
    best_effort: true
    config: { tool: slack, params: { channel: ops } }
    inputs: { text: "<start.input.text>" }
edges:
  - { source: start, target: pick }
  - { source: pick, target: notify, label: true }
)");

    REQUIRE(graph.workflow_id == "wf-parse");
    REQUIRE(graph.blocks.size() == 3);
    REQUIRE(graph.blocks[0].kind == BlockKind::STARTER);
    REQUIRE(graph.blocks[1].kind == BlockKind::CONDITION);
    REQUIRE(graph.blocks[1].kind_name == "condition");

    const Block* notify = graph.find_block("notify");
    REQUIRE(notify != nullptr);
    REQUIRE(notify->kind == BlockKind::TOOL);
    REQUIRE(notify->kind_name == "slack_message");
    REQUIRE(notify->tool_name() == "slack");
    REQUIRE_FALSE(notify->enabled);
    REQUIRE(notify->best_effort);
    REQUIRE(notify->inputs["text"] == "<start.input.text>");

    REQUIRE(graph.edges.size() == 2);
    REQUIRE_FALSE(graph.edges[0].label.has_value());
    REQUIRE(graph.edges[0].branch_label() == "pick");
    REQUIRE(graph.edges[1].label == std::string("true"));
}

TEST_CASE("Parse graph from JSON", "[parser]") {
    GraphParser parser;
    auto graph = parser.parse_from_string(R"({
        "blocks": [
            {"id": "a", "kind": "function", "inputs": {"code": "1"}},
            {"id": "b", "kind": "http_request"}
        ],
        "edges": [{"source": "a", "target": "b"}],
        "start": "a"
    })");
    REQUIRE(graph.workflow_id == "workflow");
    REQUIRE(graph.blocks.size() == 2);
    REQUIRE(graph.blocks[1].tool_name() == "http_request");
    REQUIRE(graph.start_blocks == std::vector<BlockId>{"a"});
}

// Test 2: malformed documents
TEST_CASE("Reject malformed graphs", "[parser][errors]") {
    GraphParser parser;

    SECTION("duplicate ids") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"(
blocks:
  - { id: a, kind: function }
  - { id: a, kind: function }
)"), GraphValidationError);
    }
    SECTION("dangling edge") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"(
blocks:
  - { id: a, kind: function }
edges:
  - { source: a, target: ghost }
)"), GraphValidationError);
    }
    SECTION("missing kind") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"(
blocks:
  - { id: a }
)"), GraphValidationError);
    }
    SECTION("invalid id") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"(
blocks:
  - { id: "a.b", kind: function }
)"), GraphValidationError);
    }
    SECTION("unknown start block") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"(
start: [nope]
blocks:
  - { id: a, kind: function }
)"), GraphValidationError);
    }
    SECTION("broken yaml") {
        REQUIRE_THROWS_AS(parser.parse_from_string("blocks: [ { id: a"), GraphValidationError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(parser.parse_from_file("/nonexistent/workflow.yaml"), GraphValidationError);
    }
}

// Test 3: graph index
TEST_CASE("Graph index orders and roots", "[parser][index]") {
    GraphParser parser;
    GraphIndex index(parser.parse_from_string(R"(
blocks:
  - { id: c, kind: function }
  - { id: b, kind: function }
  - { id: a, kind: function }
edges:
  - { source: a, target: b }
  - { source: b, target: c }
)"));

    REQUIRE(index.topological_order() == std::vector<BlockId>{"a", "b", "c"});
    REQUIRE(index.roots() == std::vector<BlockId>{"a"});
    REQUIRE(index.descendants("a").size() == 2);
    REQUIRE(index.incoming("c").size() == 1);

    auto cyclic = parser.parse_from_string(R"(
blocks:
  - { id: a, kind: function }
  - { id: b, kind: function }
edges:
  - { source: a, target: b }
  - { source: b, target: a }
)");
    REQUIRE_THROWS_AS(GraphIndex(cyclic), GraphValidationError);
}

TEST_CASE("Starter blocks are the default roots", "[parser][index]") {
    GraphParser parser;
    GraphIndex index(parser.parse_from_string(R"(
blocks:
  - { id: orphan, kind: function }
  - { id: entry, kind: starter }
)"));
    REQUIRE(index.roots() == std::vector<BlockId>{"entry"});
}

// Test 4: reference scanning
TEST_CASE("Scan input tokens", "[parser][utils]") {
    auto tokens = scan_input_tokens("Hi <user.profile.name>, key={{API_KEY|none}}");
    REQUIRE(tokens.size() == 2);

    REQUIRE(tokens[0].type == InputToken::Type::BLOCK_REFERENCE);
    REQUIRE(tokens[0].name == "user");
    REQUIRE(tokens[0].path == std::vector<std::string>{"profile", "name"});
    REQUIRE(tokens[0].raw == "<user.profile.name>");

    REQUIRE(tokens[1].type == InputToken::Type::ENV_VARIABLE);
    REQUIRE(tokens[1].name == "API_KEY");
    REQUIRE(tokens[1].fallback == std::string("none"));

    Value doc = Value::parse(R"({"items": [{"v": 1}, {"v": 2}]})");
    REQUIRE(lookup_path(doc, {"items", "1", "v"}) == 2);
    REQUIRE(lookup_path(doc, {"items", "7"}).is_null());
}

// Test 5: executor configuration file
TEST_CASE("Load executor config", "[config]") {
    SECTION("missing file keeps defaults") {
        auto config = load_executor_config("/nonexistent/blockflow_config.json");
        REQUIRE(config.default_function_timeout_ms == 5000);
        REQUIRE(config.max_parallel_blocks == 8);
        REQUIRE(config.max_block_executions == -1);
    }

    SECTION("values from file") {
        const std::string path = "test_blockflow_config.json";
        {
            std::ofstream out(path);
            out << R"({
                "default_function_timeout_ms": 1500,
                "max_parallel_blocks": 2,
                "max_loop_iterations": "lots",
                "verbose": true,
                "budget": {"max_block_executions": 40, "max_duration_ms": 60000}
            })";
        }
        auto config = load_executor_config(path);
        std::remove(path.c_str());

        REQUIRE(config.default_function_timeout_ms == 1500);
        REQUIRE(config.max_parallel_blocks == 2);
        REQUIRE(config.max_loop_iterations == 1000); // ill-typed, default kept
        REQUIRE(config.verbose);
        REQUIRE(config.max_block_executions == 40);
        REQUIRE(config.max_duration_ms == 60000);
    }
}
