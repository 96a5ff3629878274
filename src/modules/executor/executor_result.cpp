// modules/executor/executor_result.cpp
#include "modules/executor/executor_result.h"

namespace agentflow {

Context build_execution_context(const Value& arguments, const std::map<TaskId, TaskResult>& deps,
                                const std::optional<std::string>& intent) {
    Context ctx = arguments.is_object() ? arguments : Context::object();
    Value dep_json = Value::object();
    for (const auto& [id, result] : deps) {
        dep_json[id] = task_result_to_json(result);
    }
    ctx["deps"] = std::move(dep_json);
    if (intent) ctx["intent"] = *intent;
    return ctx;
}

} // namespace agentflow
