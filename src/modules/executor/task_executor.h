// modules/executor/task_executor.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_TASK_EXECUTOR_H
#define AGENTFLOW_MODULES_EXECUTOR_TASK_EXECUTOR_H

#include "common/config/engine_config.h"
#include "common/tools/tool_invoker.h"
#include "modules/executor/capability_executor.h"
#include "modules/executor/code_executor.h"
#include "modules/executor/decision_evaluator.h"
#include "modules/resolver/argument_resolver.h"
#include "modules/resolver/dependency_resolver.h"
#include "modules/router/task_router.h"
#include <memory>

namespace agentflow {

// 外部协作者 (非拥有指针, 可为空)
struct ExecutorCollaborators {
    ToolInvoker* tools = nullptr;
    SandboxExecutor* sandbox = nullptr;
    CapabilityStore* capabilities = nullptr;
};

// Runs one task end to end: dependency resolution, routing by kind, failure classification.
class TaskExecutor {
public:
    TaskExecutor(ExecutorCollaborators collaborators, std::shared_ptr<const EngineConfig> config);

    // Task failures come back as TaskResult (error / failed_safe).
    // Only ConfigurationError escapes.
    TaskResult execute(const Task& task, const ResultMap& prior_results, const Context& workflow_context);

    void set_config(std::shared_ptr<const EngineConfig> config);

private:
    ExecutorResult dispatch(const Task& task, const std::map<TaskId, TaskResult>& deps,
                            const ResultMap& prior_results, const Context& workflow_context);
    ExecutorResult run_tool(const Task& task, const std::map<TaskId, TaskResult>& deps,
                            const ResultMap& prior_results, const Context& workflow_context);
    ExecutorResult run_code_with_retry(const Task& task, const std::map<TaskId, TaskResult>& deps);

    ExecutorCollaborators collaborators_;
    std::shared_ptr<const EngineConfig> config_;
    CodeExecutor code_executor_;
    CapabilityExecutor capability_executor_;
    ArgumentResolver argument_resolver_;
    DecisionEvaluator decision_evaluator_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_TASK_EXECUTOR_H
