// modules/executor/code_executor.cpp
#include "modules/executor/code_executor.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <chrono>

namespace agentflow {

SandboxOptions make_sandbox_options(const SandboxDefaults& defaults, const std::optional<SandboxConfig>& task_config) {
    SandboxOptions options;
    options.timeout_ms = defaults.timeout_ms;
    options.memory_limit_mb = defaults.memory_limit_mb;
    options.allowed_read_paths = defaults.allowed_read_paths;
    if (task_config) {
        if (task_config->timeout_ms) options.timeout_ms = *task_config->timeout_ms;
        if (task_config->memory_limit_mb) options.memory_limit_mb = *task_config->memory_limit_mb;
        if (!task_config->allowed_read_paths.empty()) options.allowed_read_paths = task_config->allowed_read_paths;
        if (task_config->permission_set) options.permission_set = *task_config->permission_set;
    }
    return options;
}

CodeExecutor::CodeExecutor(SandboxExecutor* sandbox, SandboxDefaults defaults)
    : sandbox_(sandbox), defaults_(std::move(defaults)) {}

ExecutorResult CodeExecutor::execute(const Task& task, const std::map<TaskId, TaskResult>& deps) {
    const auto* spec = task.as_code();
    if (!spec) {
        throw ConfigurationError("CodeExecutor received non-code task " + task.id);
    }
    if (!sandbox_) {
        throw ConfigurationError("CodeExecutor requires a SandboxExecutor");
    }

    auto start = std::chrono::steady_clock::now();
    Context ctx = build_execution_context(task.arguments, deps, task.intent);
    SandboxOptions options = make_sandbox_options(defaults_, task.sandbox_config);

    SandboxResult result;
    try {
        result = sandbox_->execute(spec->code, ctx, options);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        return ExecutorResult::fail(e.what(), elapsed);
    }

    double elapsed = result.elapsed_ms > 0.0
        ? result.elapsed_ms
        : std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (!result.success) {
        std::string message = result.error
            ? result.error->type + ": " + result.error->message
            : std::string("SandboxError: code execution failed");
        Logger::debug("code_executor", "Task " + task.id + " failed: " + message);
        return ExecutorResult::fail(std::move(message), elapsed);
    }
    return ExecutorResult::ok(std::move(result.result), elapsed);
}

} // namespace agentflow
