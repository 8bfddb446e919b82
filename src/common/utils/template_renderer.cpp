// common/utils/template_renderer.cpp
#include "template_renderer.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace blockflow {

namespace {

std::string trim(std::string_view s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (first < last) ? std::string(first, last) : std::string();
}

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw ExpressionError("Template render error: " + std::string(e.message));
    }
}

std::string InjaTemplateRenderer::render_expression(std::string_view expression, const Value& data) {
    std::string expr = trim(expression);
    if (expr.find("{{") == std::string::npos && expr.find("{%") == std::string::npos) {
        expr = "{{ " + expr + " }}";
    }
    return trim(render(expr, data));
}

bool InjaTemplateRenderer::evaluate_condition(std::string_view expression, const Value& data) {
    std::string rendered = render_expression(expression, data);
    if (rendered == "true") return true;
    if (rendered == "false") return false;
    try {
        std::size_t consumed = 0;
        double num_val = std::stod(rendered, &consumed);
        if (consumed == rendered.size()) {
            return num_val != 0.0;
        }
    } catch (const std::logic_error&) {
        // not a number, reported below
    }
    throw ExpressionError("Condition did not evaluate to a boolean value ('true'/'false' or number): '" + rendered + "'");
}

} // namespace blockflow
