// modules/executor/decision_evaluator.cpp
#include "modules/executor/decision_evaluator.h"
#include "common/utils/template_renderer.h"
#include <chrono>

namespace agentflow {

bool is_decision_task(const Task& task) {
    const auto* tool = task.as_tool();
    return tool && tool->tool == kDecisionToolId;
}

std::string DecisionEvaluator::normalize_outcome(const std::string& rendered) {
    if (rendered == "True" || rendered == "TRUE" || rendered == "1") return "true";
    if (rendered == "False" || rendered == "FALSE" || rendered == "0" || rendered.empty()) return "false";
    return rendered;
}

ExecutorResult DecisionEvaluator::evaluate(const Task& task, const Value& arguments,
                                           const std::map<TaskId, TaskResult>& deps,
                                           const Context& workflow_context) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    if (!arguments.contains("condition") || !arguments["condition"].is_string()) {
        return ExecutorResult::fail("Decision task " + task.id + " has no condition");
    }
    const std::string condition = arguments["condition"].get<std::string>();
    const std::string decision_node_id = arguments.value("decisionNodeId", task.id);

    // 渲染上下文: 工作流 context + 依赖输出 (原始节点 id 与 task id 均可引用)
    Context ctx = workflow_context.is_object() ? workflow_context : Context::object();
    Value dep_outputs = Value::object();
    for (const auto& [id, result] : deps) {
        Value output = result.output.value_or(Value());
        dep_outputs[id] = output;
        ctx[id] = output;
        const auto& prefix = config_.task_id_prefix;
        if (!prefix.empty() && id.rfind(prefix, 0) == 0) {
            ctx[id.substr(prefix.size())] = output;
        }
    }
    ctx["deps"] = std::move(dep_outputs);

    std::string rendered;
    try {
        rendered = InjaTemplateRenderer::evaluate_expression(condition, ctx);
    } catch (const std::runtime_error& e) {
        return ExecutorResult::fail("Decision " + decision_node_id + " failed: " + e.what(), elapsed_ms());
    }

    Value output = {
        {"outcome", normalize_outcome(rendered)},
        {"decisionNodeId", decision_node_id},
        {"condition", condition},
    };
    return ExecutorResult::ok(std::move(output), elapsed_ms());
}

} // namespace agentflow
