// modules/executor/capability_executor.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_CAPABILITY_EXECUTOR_H
#define AGENTFLOW_MODULES_EXECUTOR_CAPABILITY_EXECUTOR_H

#include "common/config/engine_config.h"
#include "modules/executor/executor_result.h"
#include "modules/executor/sandbox.h"
#include <map>
#include <string>

namespace agentflow {

class CapabilityExecutor {
public:
    CapabilityExecutor(SandboxExecutor* sandbox, CapabilityStore* store, SandboxDefaults defaults = {});

    // Output: {result, capabilityId, executionTimeMs}.
    // ConfigurationError when the code must come from the store and none is wired.
    ExecutorResult execute(const Task& task, const std::map<TaskId, TaskResult>& deps);

    // 默认最严格 "minimal"
    std::string get_permission_set(const std::string& capability_id);

    void set_store(CapabilityStore* store) { store_ = store; }
    void set_defaults(SandboxDefaults defaults) { defaults_ = std::move(defaults); }

private:
    SandboxExecutor* sandbox_;
    CapabilityStore* store_;
    SandboxDefaults defaults_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_CAPABILITY_EXECUTOR_H
