// tests/test_input_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/resolver/input_resolver.h"
#include "modules/parser/graph_parser.h"
#include "core/types/errors.h"
#include <string>

using blockflow::Value;

namespace {

blockflow::WorkflowGraph resolver_graph() {
    blockflow::GraphParser parser;
    return parser.parse_from_string(R"(
workflow_id: wf-resolve
blocks:
  - id: fetch
    kind: http_request
  - id: user
    kind: http_request
  - id: target
    kind: http_request
  - id: legacy
    kind: http_request
    enabled: false
edges:
  - { source: fetch, target: target }
  - { source: user, target: target }
)");
}

struct ResolverFixture {
    blockflow::GraphIndex index{resolver_graph()};
    blockflow::ExecutionContext ctx{"wf-resolve", {{"API_KEY", "secret"}}, Value{{"q", "hi"}}};
    blockflow::InputResolver resolver{index};

    ResolverFixture() {
        ctx.set_active_execution_path({"fetch", "user", "target"});
        ctx.set_block_state("fetch", Value{
            {"count", 3},
            {"data", {{"items", {1, 2, 3}}, {"name", "x"}}}
        });
    }
};

} // namespace

// Test 1: a string holding only a reference keeps the JSON type
TEST_CASE("Whole-string references keep their type", "[resolver]") {
    ResolverFixture f;
    REQUIRE(f.resolver.resolve_value("<fetch.count>", f.ctx) == 3);
    REQUIRE(f.resolver.resolve_value("<fetch.data.items>", f.ctx) == Value({1, 2, 3}));
    REQUIRE(f.resolver.resolve_value("<fetch.data.items.1>", f.ctx) == 2);
    REQUIRE(f.resolver.resolve_value("<fetch>", f.ctx)["data"]["name"] == "x");
}

// Test 2: embedded references are interpolated
TEST_CASE("Embedded references are interpolated as text", "[resolver]") {
    ResolverFixture f;
    REQUIRE(f.resolver.resolve_value("count=<fetch.count> name=<fetch.data.name>", f.ctx) == "count=3 name=x");
    REQUIRE(f.resolver.resolve_value("items=<fetch.data.items>", f.ctx) == "items=[1,2,3]");
}

TEST_CASE("Missing field resolves to null", "[resolver]") {
    ResolverFixture f;
    REQUIRE(f.resolver.resolve_value("<fetch.missing>", f.ctx).is_null());
    REQUIRE(f.resolver.resolve_value("<fetch.data.items.9>", f.ctx).is_null());
}

TEST_CASE("Unknown block names are left as text", "[resolver]") {
    ResolverFixture f;
    REQUIRE(f.resolver.resolve_value("std::vector<int> v;", f.ctx) == "std::vector<int> v;");
    REQUIRE(f.resolver.resolve_value("<nope.x>", f.ctx) == "<nope.x>");
}

TEST_CASE("Reference to a block without output throws", "[resolver][errors]") {
    ResolverFixture f;
    REQUIRE_THROWS_AS(f.resolver.resolve_value("<user.name>", f.ctx), blockflow::UnresolvedReferenceError);
    REQUIRE_THROWS_AS(f.resolver.resolve_value("hello <user.name>", f.ctx), blockflow::UnresolvedReferenceError);
}

TEST_CASE("References to pruned or disabled blocks are empty", "[resolver][pruning]") {
    ResolverFixture f;
    f.ctx.set_active_execution_path({"fetch", "target"}); // "user" pruned by a decision

    REQUIRE(f.resolver.resolve_value("<user.name>", f.ctx).is_null());
    REQUIRE(f.resolver.resolve_value("hello <user.name>!", f.ctx) == "hello !");
    REQUIRE(f.resolver.resolve_value("<legacy.response>", f.ctx).is_null());
    REQUIRE(f.resolver.resolve_value("[<legacy.response>|<fetch.count>]", f.ctx) == "[|3]");

    // a pruned block that did produce output still resolves
    f.ctx.set_block_state("user", Value{{"name", "Ada"}});
    REQUIRE(f.resolver.resolve_value("<user.name>", f.ctx) == "Ada");
}

// Test 3: environment variables
TEST_CASE("Environment variables and fallbacks", "[resolver][env]") {
    ResolverFixture f;
    REQUIRE(f.resolver.resolve_value("{{API_KEY}}", f.ctx) == "secret");
    REQUIRE(f.resolver.resolve_value("Bearer {{ API_KEY }}", f.ctx) == "Bearer secret");
    REQUIRE(f.resolver.resolve_value("{{REGION|eu-west-1}}", f.ctx) == "eu-west-1");
    REQUIRE(f.resolver.resolve_value("{{API_KEY|unused}}", f.ctx) == "secret");
    REQUIRE_THROWS_AS(f.resolver.resolve_value("{{MISSING}}", f.ctx), blockflow::MissingEnvironmentVariableError);
}

// Test 4: objects and arrays are resolved element-wise
TEST_CASE("Nested inputs are resolved recursively", "[resolver]") {
    ResolverFixture f;
    blockflow::Block block;
    block.id = "target";
    block.kind_name = "http_request";
    block.inputs = Value{
        {"count", "<fetch.count>"},
        {"list", {"<fetch.data.name>", 5}},
        {"headers", {{"Authorization", "Bearer {{API_KEY}}"}}},
        {"flag", true},
        {"nothing", nullptr}
    };

    Value resolved = f.resolver.resolve(block, f.ctx);
    REQUIRE(resolved["count"] == 3);
    REQUIRE(resolved["list"] == Value({"x", 5}));
    REQUIRE(resolved["headers"]["Authorization"] == "Bearer secret");
    REQUIRE(resolved["flag"] == true);
    REQUIRE(resolved["nothing"].is_null());

    // deterministic
    REQUIRE(f.resolver.resolve(block, f.ctx) == resolved);
}

// Test 5: multi-part code
TEST_CASE("Code fragments are joined with newlines", "[resolver][code]") {
    ResolverFixture f;
    blockflow::Block block;
    block.id = "target";
    block.inputs = Value{{"code", {{{"content", "a"}}, {{"content", "b"}}}}};
    REQUIRE(f.resolver.resolve(block, f.ctx)["code"] == "a\nb");

    REQUIRE(blockflow::InputResolver::join_code_fragments(Value({"x", {{"content", "y"}}})) == std::string("x\ny"));
    REQUIRE_FALSE(blockflow::InputResolver::join_code_fragments(Value({1, 2})).has_value());
    REQUIRE_FALSE(blockflow::InputResolver::join_code_fragments(Value("plain")).has_value());
}

// Test 6: pseudo-blocks
TEST_CASE("Loop and start pseudo-blocks", "[resolver][loop]") {
    ResolverFixture f;
    f.ctx.set_loop_iteration("each", 2);
    f.ctx.set_loop_item("each", "b");

    std::optional<blockflow::BlockId> scope = "each";
    REQUIRE(f.resolver.resolve_value("<loop.currentItem>", f.ctx, scope) == "b");
    REQUIRE(f.resolver.resolve_value("<loop.index>", f.ctx, scope) == 1);
    REQUIRE(f.resolver.resolve_value("<loop.iteration>", f.ctx, scope) == 2);
    REQUIRE(f.resolver.resolve_value("item <loop.index>: <loop.currentItem>", f.ctx, scope) == "item 1: b");

    // outside a loop body "loop" is just text
    REQUIRE(f.resolver.resolve_value("<loop.index>", f.ctx) == "<loop.index>");

    REQUIRE(f.resolver.resolve_value("<start.input.q>", f.ctx) == "hi");
}
