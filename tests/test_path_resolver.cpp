// tests/test_path_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/path/path_resolver.h"
#include "modules/parser/graph_parser.h"
#include "core/types/errors.h"
#include <string>
#include <unordered_set>

using blockflow::Value;

namespace {

blockflow::WorkflowGraph parse(const std::string& yaml) {
    blockflow::GraphParser parser;
    return parser.parse_from_string(yaml);
}

// start -> r ; r -(x)-> a ; r -(y)-> b ; a,b -> join -> end ; b -> only_b ; start -> side
const char* kDiamond = R"(
workflow_id: diamond
blocks:
  - { id: start, kind: starter }
  - { id: r, kind: router }
  - { id: a, kind: function }
  - { id: b, kind: function }
  - { id: join, kind: function }
  - { id: end, kind: function }
  - { id: only_b, kind: function }
  - { id: side, kind: function }
edges:
  - { source: start, target: r }
  - { source: r, target: a, label: x }
  - { source: r, target: b, label: y }
  - { source: a, target: join }
  - { source: b, target: join }
  - { source: join, target: end }
  - { source: b, target: only_b }
  - { source: start, target: side }
)";

std::unordered_set<blockflow::BlockId> init_active(const blockflow::PathResolver& path, blockflow::ExecutionContext& ctx) {
    ctx.transact([&](blockflow::ExecutionContext::State& s) {
        s.active_execution_path = path.initial_active_set(s);
    });
    return ctx.active_execution_path();
}

} // namespace

// Test 1: initial reachability
TEST_CASE("Initial active set covers every reachable block", "[path]") {
    blockflow::GraphIndex index(parse(kDiamond));
    blockflow::PathResolver path(index);
    blockflow::ExecutionContext ctx("diamond");

    auto active = init_active(path, ctx);
    REQUIRE(active.size() == 8);
}

TEST_CASE("Disabled blocks are treated as removed", "[path]") {
    blockflow::GraphIndex index(parse(R"(
blocks:
  - { id: start, kind: starter }
  - { id: off, kind: function, enabled: false }
  - { id: behind, kind: function }
  - { id: both, kind: function }
edges:
  - { source: start, target: off }
  - { source: off, target: behind }
  - { source: start, target: both }
  - { source: off, target: both }
)"));
    blockflow::PathResolver path(index);
    blockflow::ExecutionContext ctx("wf");

    auto active = init_active(path, ctx);
    REQUIRE(active.count("start") == 1);
    REQUIRE(active.count("off") == 0);
    REQUIRE(active.count("behind") == 0);
    REQUIRE(active.count("both") == 1);
}

TEST_CASE("Roots without starter blocks", "[path]") {
    SECTION("blocks without incoming edges") {
        blockflow::GraphIndex index(parse(R"(
blocks:
  - { id: a, kind: function }
  - { id: b, kind: function }
  - { id: c, kind: function }
edges:
  - { source: a, target: c }
)"));
        REQUIRE(index.roots() == std::vector<blockflow::BlockId>{"a", "b"});
    }

    SECTION("explicit start list") {
        blockflow::GraphIndex index(parse(R"(
start: [b]
blocks:
  - { id: a, kind: starter }
  - { id: b, kind: function }
  - { id: c, kind: function }
edges:
  - { source: a, target: c }
  - { source: b, target: c }
)"));
        blockflow::PathResolver path(index);
        blockflow::ExecutionContext ctx("wf");
        auto active = init_active(path, ctx);
        REQUIRE(active.count("a") == 0);
        REQUIRE(active.count("b") == 1);
        REQUIRE(active.count("c") == 1);
    }
}

// Test 2: pruning after a decision
TEST_CASE("Decision prunes unselected branches and keeps reconvergence", "[path][pruning]") {
    blockflow::GraphIndex index(parse(kDiamond));
    blockflow::PathResolver path(index);
    blockflow::ExecutionContext ctx("diamond");
    auto before = init_active(path, ctx);

    path.record_decision(ctx, index.block("r"), "x", Value{{"selectedRoute", "x"}});
    auto after = ctx.active_execution_path();

    REQUIRE(after.count("a") == 1);
    REQUIRE(after.count("join") == 1);
    REQUIRE(after.count("end") == 1);
    REQUIRE(after.count("b") == 0);
    REQUIRE(after.count("only_b") == 0);
    REQUIRE(after.count("side") == 1);

    // never grows
    for (const auto& id : after) {
        REQUIRE(before.count(id) == 1);
    }

    auto state = ctx.snapshot();
    REQUIRE(state.decisions.router.at("r") == "x");
    REQUIRE(state.executed_blocks.count("r") == 1);
}

TEST_CASE("Edge liveness follows the decision", "[path][pruning]") {
    blockflow::GraphIndex index(parse(kDiamond));
    blockflow::PathResolver path(index);
    blockflow::ExecutionContext ctx("diamond");
    init_active(path, ctx);

    const blockflow::Edge* to_a = path.find_branch("r", "x");
    const blockflow::Edge* to_b = path.find_branch("r", "y");
    REQUIRE(to_a != nullptr);
    REQUIRE(to_b != nullptr);
    REQUIRE(to_a->target == "a");
    REQUIRE(path.find_branch("r", "b") == to_b); // by target id
    REQUIRE(path.find_branch("r", "nope") == nullptr);

    auto undecided = ctx.snapshot();
    REQUIRE(path.is_edge_live(*to_a, undecided));
    REQUIRE(path.is_edge_live(*to_b, undecided));

    path.record_decision(ctx, index.block("r"), "y", Value::object());
    auto decided = ctx.snapshot();
    REQUIRE_FALSE(path.is_edge_live(*to_a, decided));
    REQUIRE(path.is_edge_live(*to_b, decided));
}

TEST_CASE("Pruning only touches descendants of the decider", "[path][pruning]") {
    blockflow::GraphIndex index(parse(kDiamond));
    blockflow::PathResolver path(index);
    blockflow::ExecutionContext ctx("diamond");
    init_active(path, ctx);

    // a block outside r's subgraph that was already removed stays removed
    ctx.transact([](blockflow::ExecutionContext::State& s) { s.active_execution_path.erase("side"); });
    path.record_decision(ctx, index.block("r"), "x", Value::object());
    REQUIRE_FALSE(ctx.is_active("side"));
}

// Test 3: validation
TEST_CASE("Decision blocks may not repeat a label", "[path][validation]") {
    blockflow::GraphIndex index(parse(R"(
blocks:
  - { id: r, kind: router }
  - { id: a, kind: function }
  - { id: b, kind: function }
edges:
  - { source: r, target: a, label: same }
  - { source: r, target: b, label: same }
)"));
    blockflow::PathResolver path(index);
    REQUIRE_THROWS_AS(path.validate(), blockflow::GraphValidationError);
}

TEST_CASE("Branch labels default to target ids", "[path]") {
    blockflow::GraphIndex index(parse(kDiamond));
    blockflow::PathResolver path(index);
    REQUIRE(path.branch_labels("r") == std::vector<std::string>{"x", "y"});
    REQUIRE(path.branch_labels("start") == std::vector<std::string>{"r", "side"});
}
