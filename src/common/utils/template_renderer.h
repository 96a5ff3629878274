// common/utils/template_renderer.h
#ifndef AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h" // 引入 Context (nlohmann::json)
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentflow {

// Renders decision conditions. Conditions are inja expressions, e.g. "n1.count > 3".
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Context& context);

    // Wraps a bare expression as "{{ expr }}" and returns the trimmed rendered text
    static std::string evaluate_expression(std::string_view expression, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

private:
    inja::Environment env_;
    void configure_security(); // 禁用 include
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
