// modules/handlers/decision_handlers.cpp
#include "modules/handlers/decision_handlers.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"

namespace blockflow {

namespace {

std::string join_labels(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& l : labels) {
        out += (out.empty() ? "" : ", ") + l;
    }
    return out;
}

} // namespace

Value expression_data(const Value& inputs, const ExecutionContext& ctx) {
    Value data = inputs.is_object() ? inputs : Value::object();
    Value blocks = Value::object();
    for (auto& [id, state] : ctx.block_states()) {
        blocks[id] = std::move(state);
    }
    data["blocks"] = std::move(blocks);
    data["workflow_input"] = ctx.workflow_input();
    return data;
}

Value RouterHandler::execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        throw CancelledError();
    }
    if (!block.config.contains("expression") || !block.config["expression"].is_string()) {
        throw ExpressionError("Router '" + block.id + "' has no expression");
    }

    std::string route = InjaTemplateRenderer::render_expression(
        block.config["expression"].get<std::string>(), expression_data(inputs, ctx));

    const Edge* branch = path_.find_branch(block.id, route);
    if (branch == nullptr) {
        throw ExpressionError("Router '" + block.id + "' selected unknown route '" + route +
                              "' (available: " + join_labels(path_.branch_labels(block.id)) + ")");
    }

    Value output = {
        {"selectedRoute", branch->branch_label()},
        {"selectedPath", {{"blockId", branch->target}}}
    };
    path_.record_decision(ctx, block, branch->branch_label(), output);
    return output;
}

Value ConditionHandler::execute(const Block& block, const Value& inputs, ExecutionContext& ctx, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        throw CancelledError();
    }
    const Value& conditions = block.config.contains("conditions") ? block.config["conditions"] : Value();
    if (!conditions.is_array() || conditions.empty()) {
        throw ExpressionError("Condition block '" + block.id + "' has no conditions");
    }

    Value data = expression_data(inputs, ctx);
    for (const auto& entry : conditions) {
        if (!entry.is_object() || !entry.contains("label") || !entry["label"].is_string()) {
            throw ExpressionError("Condition block '" + block.id + "': every condition needs a label");
        }
        std::string label = entry["label"].get<std::string>();

        bool matched = true; // else branch
        if (entry.contains("expression") && !entry["expression"].is_null()) {
            matched = InjaTemplateRenderer::evaluate_condition(entry["expression"].get<std::string>(), data);
        }
        if (!matched) continue;

        const Edge* branch = path_.find_branch(block.id, label);
        if (branch == nullptr) {
            throw ExpressionError("Condition '" + label + "' of block '" + block.id + "' has no outgoing edge");
        }
        Value output = {
            {"result", true},
            {"selectedConditionId", branch->branch_label()},
            {"selectedPath", {{"blockId", branch->target}}}
        };
        path_.record_decision(ctx, block, branch->branch_label(), output);
        return output;
    }
    throw ExpressionError("Condition block '" + block.id + "' matched no condition");
}

} // namespace blockflow
