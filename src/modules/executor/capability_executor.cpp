// modules/executor/capability_executor.cpp
#include "modules/executor/capability_executor.h"
#include "modules/executor/code_executor.h" // 引入 make_sandbox_options
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <chrono>

namespace agentflow {

CapabilityExecutor::CapabilityExecutor(SandboxExecutor* sandbox, CapabilityStore* store, SandboxDefaults defaults)
    : sandbox_(sandbox), store_(store), defaults_(std::move(defaults)) {}

ExecutorResult CapabilityExecutor::execute(const Task& task, const std::map<TaskId, TaskResult>& deps) {
    const auto* spec = task.as_capability();
    if (!spec) {
        throw ConfigurationError("CapabilityExecutor received non-capability task " + task.id);
    }
    if (!sandbox_) {
        throw ConfigurationError("CapabilityExecutor requires a SandboxExecutor");
    }

    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    SandboxOptions options = make_sandbox_options(defaults_, task.sandbox_config);
    std::string code;
    if (spec->code && !spec->code->empty()) {
        code = *spec->code;
    } else {
        if (!store_) {
            throw ConfigurationError("Capability task " + task.id +
                                     " has no code and no CapabilityStore is configured");
        }
        std::optional<CapabilityRecord> record;
        try {
            record = store_->find_by_id(spec->capability_id);
        } catch (const std::exception& e) {
            return ExecutorResult::fail(e.what(), elapsed_ms());
        }
        if (!record) {
            return ExecutorResult::fail("Capability " + spec->capability_id +
                                        " not found in CapabilityStore for task " + task.id, elapsed_ms());
        }
        code = record->code_snippet;
        if (!task.sandbox_config || !task.sandbox_config->permission_set) {
            options.permission_set = record->permission_set;
        }
        Logger::debug("capability_executor", "Fetched capability code from store: " + spec->capability_id);
    }

    Context ctx = build_execution_context(task.arguments, deps, task.intent);
    ctx["capabilityId"] = spec->capability_id;

    SandboxResult result;
    try {
        result = sandbox_->execute(code, ctx, options);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        return ExecutorResult::fail(e.what(), elapsed_ms());
    }

    if (!result.success) {
        std::string message = result.error
            ? result.error->type + ": " + result.error->message
            : std::string("SandboxError: capability execution failed");
        return ExecutorResult::fail(std::move(message), elapsed_ms());
    }

    Value output = {
        {"result", result.result},
        {"capabilityId", spec->capability_id},
        {"executionTimeMs", result.elapsed_ms},
    };
    Logger::info("capability_executor", "Capability task " + task.id + " succeeded (" + spec->capability_id + ")");
    return ExecutorResult::ok(std::move(output), elapsed_ms());
}

std::string CapabilityExecutor::get_permission_set(const std::string& capability_id) {
    if (!store_) return "minimal";
    auto record = store_->find_by_id(capability_id);
    if (!record || record->permission_set.empty()) return "minimal";
    return record->permission_set;
}

} // namespace agentflow
