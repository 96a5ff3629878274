// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace agentflow {

namespace {

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_throw_at_missing_includes(true);
    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    // inja::Environment 渲染不是线程安全的; layer 内任务并发执行
    static InjaTemplateRenderer renderer;
    static std::mutex render_mutex;
    std::lock_guard<std::mutex> lock(render_mutex);
    return renderer.render_with_env(template_str, context);
}

std::string InjaTemplateRenderer::evaluate_expression(std::string_view expression, const Context& context) {
    std::string tmpl = "{{ " + std::string(expression) + " }}";
    return trim(render(tmpl, context));
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& context) {
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentflow
