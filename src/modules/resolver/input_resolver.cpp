// modules/resolver/input_resolver.cpp
#include "modules/resolver/input_resolver.h"
#include "core/types/errors.h"

namespace blockflow {

namespace {
const char* const kLoopPseudoBlock = "loop";
const char* const kStartPseudoBlock = "start";
const char* const kCodeInput = "code";

std::string stringify(const Value& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}
} // namespace

InputResolver::InputResolver(const GraphIndex& graph) : graph_(graph) {}

Value InputResolver::resolve(const Block& block,
                             const ExecutionContext& ctx,
                             const std::optional<BlockId>& loop_scope) const {
    Value resolved = Value::object();
    if (!block.inputs.is_object()) {
        return resolved;
    }
    for (auto it = block.inputs.begin(); it != block.inputs.end(); ++it) {
        Value value = resolve_value(it.value(), ctx, loop_scope);
        if (it.key() == kCodeInput) {
            if (auto joined = join_code_fragments(value)) {
                value = *joined;
            }
        }
        resolved[it.key()] = std::move(value);
    }
    return resolved;
}

Value InputResolver::resolve_value(const Value& expr,
                                   const ExecutionContext& ctx,
                                   const std::optional<BlockId>& loop_scope) const {
    if (expr.is_string()) {
        return resolve_string(expr.get<std::string>(), ctx, loop_scope);
    }
    if (expr.is_array()) {
        Value out = Value::array();
        for (const auto& item : expr) {
            out.push_back(resolve_value(item, ctx, loop_scope));
        }
        return out;
    }
    if (expr.is_object()) {
        Value out = Value::object();
        for (auto it = expr.begin(); it != expr.end(); ++it) {
            out[it.key()] = resolve_value(it.value(), ctx, loop_scope);
        }
        return out;
    }
    return expr;
}

std::optional<std::string> InputResolver::join_code_fragments(const Value& code) {
    if (!code.is_array()) {
        return std::nullopt;
    }
    std::string joined;
    bool first = true;
    for (const auto& fragment : code) {
        std::string text;
        if (fragment.is_string()) {
            text = fragment.get<std::string>();
        } else if (fragment.is_object() && fragment.contains("content") && fragment["content"].is_string()) {
            text = fragment["content"].get<std::string>();
        } else {
            return std::nullopt;
        }
        if (!first) joined += '\n';
        joined += text;
        first = false;
    }
    return joined;
}

Value InputResolver::resolve_string(const std::string& text,
                                    const ExecutionContext& ctx,
                                    const std::optional<BlockId>& loop_scope) const {
    auto tokens = scan_input_tokens(text);
    if (tokens.empty()) {
        return text;
    }

    // Whole string is a single reference: keep the JSON type
    if (tokens.size() == 1 && tokens[0].offset == 0 && tokens[0].length == text.size()) {
        const auto& token = tokens[0];
        if (token.type == InputToken::Type::ENV_VARIABLE) {
            return resolve_environment(token, ctx);
        }
        if (never_runs(token, ctx, loop_scope)) {
            return Value();
        }
        if (auto value = resolve_reference(token, ctx, loop_scope)) {
            return *value;
        }
        return text;
    }

    std::string out;
    std::size_t cursor = 0;
    for (const auto& token : tokens) {
        out.append(text, cursor, token.offset - cursor);
        if (token.type == InputToken::Type::ENV_VARIABLE) {
            out += resolve_environment(token, ctx);
        } else if (never_runs(token, ctx, loop_scope)) {
            // pruned or disabled source contributes nothing
        } else if (auto value = resolve_reference(token, ctx, loop_scope)) {
            out += stringify(*value);
        } else {
            out += token.raw;
        }
        cursor = token.offset + token.length;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

std::optional<Value> InputResolver::resolve_reference(const InputToken& token,
                                                      const ExecutionContext& ctx,
                                                      const std::optional<BlockId>& loop_scope) const {
    if (token.name == kLoopPseudoBlock && loop_scope.has_value()) {
        return lookup_path(loop_view(*loop_scope, ctx), token.path);
    }
    if (!graph_.contains(token.name)) {
        if (token.name == kStartPseudoBlock) {
            return lookup_path(Value{{"input", ctx.workflow_input()}}, token.path);
        }
        return std::nullopt; // not a reference, e.g. "vector<int>"
    }

    auto state = ctx.block_state(token.name);
    if (!state.has_value()) {
        throw UnresolvedReferenceError(token.name, token.raw);
    }
    return lookup_path(*state, token.path);
}

bool InputResolver::never_runs(const InputToken& token,
                               const ExecutionContext& ctx,
                               const std::optional<BlockId>& loop_scope) const {
    if (token.name == kLoopPseudoBlock && loop_scope.has_value()) return false;
    if (!graph_.contains(token.name)) return false;
    if (ctx.block_state(token.name).has_value()) return false;
    return !graph_.block(token.name).enabled || !ctx.is_active(token.name);
}

std::string InputResolver::resolve_environment(const InputToken& token, const ExecutionContext& ctx) const {
    if (auto value = ctx.environment_variable(token.name)) {
        return *value;
    }
    if (token.fallback.has_value()) {
        return *token.fallback;
    }
    throw MissingEnvironmentVariableError(token.name);
}

Value InputResolver::loop_view(const BlockId& loop_id, const ExecutionContext& ctx) const {
    int iteration = ctx.loop_iteration(loop_id);
    Value view = {
        {"id", loop_id},
        {"iteration", iteration},
        {"index", iteration > 0 ? iteration - 1 : 0},
        {"currentItem", ctx.loop_item(loop_id).value_or(Value())}
    };
    return view;
}

} // namespace blockflow
