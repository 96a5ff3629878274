// modules/executor/code_executor.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_CODE_EXECUTOR_H
#define AGENTFLOW_MODULES_EXECUTOR_CODE_EXECUTOR_H

#include "common/config/engine_config.h" // 引入 SandboxDefaults
#include "modules/executor/executor_result.h"
#include "modules/executor/sandbox.h"
#include <map>

namespace agentflow {

SandboxOptions make_sandbox_options(const SandboxDefaults& defaults, const std::optional<SandboxConfig>& task_config);

class CodeExecutor {
public:
    CodeExecutor(SandboxExecutor* sandbox, SandboxDefaults defaults = {});

    // Throws ConfigurationError when no sandbox is wired
    ExecutorResult execute(const Task& task, const std::map<TaskId, TaskResult>& deps);

    void set_defaults(SandboxDefaults defaults) { defaults_ = std::move(defaults); }

private:
    SandboxExecutor* sandbox_; // 非拥有
    SandboxDefaults defaults_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_CODE_EXECUTOR_H
