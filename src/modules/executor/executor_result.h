// modules/executor/executor_result.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_EXECUTOR_RESULT_H
#define AGENTFLOW_MODULES_EXECUTOR_EXECUTOR_RESULT_H

#include "core/types/context.h"
#include "core/types/task.h"
#include <map>
#include <optional>
#include <string>

namespace agentflow {

// Shared return contract of the code / capability / tool executors
struct ExecutorResult {
    bool success = false;
    Value output;
    std::string error; // 原样写入 TaskResult.error
    double elapsed_ms = 0.0;

    static ExecutorResult ok(Value output, double elapsed_ms) {
        return ExecutorResult{true, std::move(output), {}, elapsed_ms};
    }
    static ExecutorResult fail(std::string error, double elapsed_ms = 0.0) {
        return ExecutorResult{false, Value(), std::move(error), elapsed_ms};
    }
};

// {...arguments, deps: {id: TaskResult}, intent?}
Context build_execution_context(const Value& arguments, const std::map<TaskId, TaskResult>& deps,
                                const std::optional<std::string>& intent);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_EXECUTOR_RESULT_H
