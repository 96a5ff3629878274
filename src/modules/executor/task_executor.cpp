// modules/executor/task_executor.cpp
#include "modules/executor/task_executor.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <chrono>
#include <thread>

namespace agentflow {

TaskExecutor::TaskExecutor(ExecutorCollaborators collaborators, std::shared_ptr<const EngineConfig> config)
    : collaborators_(collaborators),
      config_(config ? std::move(config) : std::make_shared<const EngineConfig>()),
      code_executor_(collaborators.sandbox, config_->sandbox),
      capability_executor_(collaborators.sandbox, collaborators.capabilities, config_->sandbox) {}

void TaskExecutor::set_config(std::shared_ptr<const EngineConfig> config) {
    if (!config) return;
    config_ = std::move(config);
    code_executor_.set_defaults(config_->sandbox);
    capability_executor_.set_defaults(config_->sandbox);
}

TaskResult TaskExecutor::execute(const Task& task, const ResultMap& prior_results, const Context& workflow_context) {
    TaskResult result;
    result.task_id = task.id;
    const bool safe = is_safe_to_fail(task);

    auto resolution = DependencyResolver::resolve(task.depends_on, prior_results);
    ExecutorResult outcome = resolution.success
        ? dispatch(task, resolution.results, prior_results, workflow_context)
        : ExecutorResult::fail(resolution.error);

    result.elapsed_ms = outcome.elapsed_ms;
    if (outcome.success) {
        result.status = TaskStatus::SUCCESS;
        result.output = std::move(outcome.output);
    } else {
        result.status = safe ? TaskStatus::FAILED_SAFE : TaskStatus::ERROR;
        result.error = std::move(outcome.error);
        if (safe) {
            Logger::warning("task_executor", "Safe-to-fail task " + task.id + " failed: " + *result.error);
        } else {
            Logger::error("task_executor", "Task " + task.id + " failed: " + *result.error);
        }
    }
    return result;
}

ExecutorResult TaskExecutor::dispatch(const Task& task, const std::map<TaskId, TaskResult>& deps,
                                      const ResultMap& prior_results, const Context& workflow_context) {
    switch (classify(task)) {
        case TaskKind::CODE_EXECUTION:
            if (is_safe_to_fail(task)) return run_code_with_retry(task, deps);
            return code_executor_.execute(task, deps);
        case TaskKind::CAPABILITY:
            return capability_executor_.execute(task, deps);
        case TaskKind::MCP_TOOL:
            return run_tool(task, deps, prior_results, workflow_context);
    }
    throw ConfigurationError("Unroutable task kind for " + task.id);
}

ExecutorResult TaskExecutor::run_tool(const Task& task, const std::map<TaskId, TaskResult>& deps,
                                      const ResultMap& prior_results, const Context& workflow_context) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    // static 参数先解析, 显式参数覆盖
    Value resolved = argument_resolver_.resolve_arguments(task.static_arguments, workflow_context, prior_results);
    Value merged = ArgumentResolver::merge_arguments(resolved, task.arguments);
    auto refs = ArgumentResolver::resolve_output_references(merged, prior_results);
    if (!refs.success) {
        return ExecutorResult::fail(refs.error, elapsed_ms());
    }

    if (is_decision_task(task)) {
        return decision_evaluator_.evaluate(task, refs.arguments, deps, workflow_context);
    }

    if (!collaborators_.tools) {
        throw ConfigurationError("Tool task " + task.id + " requires a ToolInvoker");
    }
    const std::string tool_id = task.tool_label();
    try {
        Value output = collaborators_.tools->invoke(tool_id, refs.arguments);
        return ExecutorResult::ok(std::move(output), elapsed_ms());
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        return ExecutorResult::fail(e.what(), elapsed_ms());
    }
}

ExecutorResult TaskExecutor::run_code_with_retry(const Task& task, const std::map<TaskId, TaskResult>& deps) {
    const int max_attempts = config_->scheduler.safe_task_max_retries;
    int64_t backoff_ms = config_->scheduler.retry_backoff_ms;
    ExecutorResult last;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        last = code_executor_.execute(task, deps);
        if (last.success) return last;
        if (attempt < max_attempts) {
            Logger::warning("task_executor", "Retry " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                                                 " for task " + task.id + " in " + std::to_string(backoff_ms) + "ms: " +
                                                 last.error);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
        }
    }
    return last;
}

} // namespace agentflow
