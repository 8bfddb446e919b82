#ifndef BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <filesystem> // set_include_callback signature
#include <string>
#include <string_view>

namespace blockflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders with the shared default environment. Throws ExpressionError.
    static std::string render(std::string_view template_str, const Value& data);

    // Renders a router/condition expression. A bare expression ("a.b > 1")
    // is wrapped as "{{ a.b > 1 }}" first.
    static std::string render_expression(std::string_view expression, const Value& data);

    // true/false, or a number (non-zero is true). Anything else throws ExpressionError.
    static bool evaluate_condition(std::string_view expression, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    void configure_security(); // no includes from templates
};

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
