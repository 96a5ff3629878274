// core/types/task.cpp
#include "core/types/task.h"
#include "core/types/errors.h"
#include <unordered_set>

namespace agentflow {

std::string to_string(TaskKind kind) {
    switch (kind) {
        case TaskKind::CODE_EXECUTION: return "code_execution";
        case TaskKind::CAPABILITY: return "capability";
        case TaskKind::MCP_TOOL: return "mcp_tool";
    }
    return "mcp_tool";
}

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::SUCCESS: return "success";
        case TaskStatus::ERROR: return "error";
        case TaskStatus::FAILED_SAFE: return "failed_safe";
    }
    return "error";
}

TaskKind task_kind_from_string(std::string_view name) {
    if (name == "code_execution") return TaskKind::CODE_EXECUTION;
    if (name == "capability") return TaskKind::CAPABILITY;
    return TaskKind::MCP_TOOL;
}

TaskStatus task_status_from_string(std::string_view name) {
    if (name == "success") return TaskStatus::SUCCESS;
    if (name == "failed_safe") return TaskStatus::FAILED_SAFE;
    if (name == "error") return TaskStatus::ERROR;
    throw std::runtime_error("Unknown task status: " + std::string(name));
}

Task Task::make_tool(TaskId id, std::string tool, std::vector<TaskId> depends_on, Value arguments) {
    Task task;
    task.id = std::move(id);
    task.payload = ToolTaskSpec{std::move(tool)};
    task.depends_on = std::move(depends_on);
    task.arguments = std::move(arguments);
    task.validate();
    return task;
}

Task Task::make_code(TaskId id, std::string code, std::vector<TaskId> depends_on, bool side_effects) {
    Task task;
    task.id = std::move(id);
    task.payload = CodeTaskSpec{std::move(code)};
    task.depends_on = std::move(depends_on);
    task.side_effects = side_effects;
    task.validate();
    return task;
}

Task Task::make_capability(TaskId id, std::string capability_id, std::vector<TaskId> depends_on,
                           std::optional<std::string> code) {
    Task task;
    task.id = std::move(id);
    task.payload = CapabilityTaskSpec{std::move(capability_id), std::move(code)};
    task.depends_on = std::move(depends_on);
    task.validate();
    return task;
}

TaskKind Task::kind() const {
    if (std::holds_alternative<CodeTaskSpec>(payload)) return TaskKind::CODE_EXECUTION;
    if (std::holds_alternative<CapabilityTaskSpec>(payload)) return TaskKind::CAPABILITY;
    return TaskKind::MCP_TOOL;
}

std::string Task::tool_label() const {
    if (const auto* tool = as_tool()) return tool->tool;
    if (const auto* cap = as_capability()) return "capability:" + cap->capability_id;
    return "code:exec";
}

void Task::validate() const {
    if (id.empty()) {
        throw DagValidationError("Task id must be non-empty");
    }
    if (const auto* tool = as_tool()) {
        if (tool->tool.empty()) {
            throw DagValidationError("Task " + id + " (mcp_tool) requires a tool");
        }
    } else if (const auto* code = as_code()) {
        if (code->code.empty()) {
            throw DagValidationError("Task " + id + " (code_execution) requires code");
        }
    } else if (const auto* cap = as_capability()) {
        if (cap->capability_id.empty()) {
            throw DagValidationError("Task " + id + " (capability) requires a capabilityId");
        }
    }
    if (!arguments.is_object()) {
        throw DagValidationError("Task " + id + " arguments must be an object");
    }
}

bool DAGStructure::contains(const TaskId& id) const {
    return find(id) != nullptr;
}

const Task* DAGStructure::find(const TaskId& id) const {
    for (const auto& task : tasks_) {
        if (task.id == id) return &task;
    }
    return nullptr;
}

Task* DAGStructure::find(const TaskId& id) {
    for (auto& task : tasks_) {
        if (task.id == id) return &task;
    }
    return nullptr;
}

void DAGStructure::add_tasks(const std::vector<Task>& tasks) {
    std::vector<Task> merged = tasks_;
    for (const auto& task : tasks) {
        if (contains(task.id)) {
            throw DagValidationError("Task " + task.id + " already exists in DAG");
        }
        merged.push_back(task);
    }
    DAGStructure candidate(std::move(merged));
    candidate.validate();
    tasks_ = std::move(candidate.tasks_);
}

void DAGStructure::validate() const {
    std::unordered_set<TaskId> ids;
    for (const auto& task : tasks_) {
        task.validate();
        if (!ids.insert(task.id).second) {
            throw DagValidationError("Duplicate task id: " + task.id);
        }
    }
    for (const auto& task : tasks_) {
        for (const auto& dep : task.depends_on) {
            if (ids.count(dep) == 0) {
                throw DagValidationError("Task " + task.id + " depends on unknown task " + dep);
            }
        }
    }
}

// --- JSON ---

Value argument_value_to_json(const ArgumentValue& arg) {
    switch (arg.type) {
        case ArgumentValue::Type::LITERAL:
            return Value{{"type", "literal"}, {"value", arg.value}};
        case ArgumentValue::Type::REFERENCE:
            return Value{{"type", "reference"}, {"expression", arg.expression}};
        case ArgumentValue::Type::PARAMETER:
            return Value{{"type", "parameter"}, {"parameterName", arg.parameter_name}};
    }
    return Value::object();
}

ArgumentValue argument_value_from_json(const Value& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        throw DagValidationError("Argument value requires a string 'type': " + json.dump());
    }
    ArgumentValue arg;
    const std::string type = json["type"].get<std::string>();
    if (type == "literal") {
        arg.type = ArgumentValue::Type::LITERAL;
        arg.value = json.value("value", Value());
    } else if (type == "reference") {
        arg.type = ArgumentValue::Type::REFERENCE;
        arg.expression = json.value("expression", "");
    } else if (type == "parameter") {
        arg.type = ArgumentValue::Type::PARAMETER;
        arg.parameter_name = json.value("parameterName", "");
    } else {
        throw DagValidationError("Unknown argument type: " + type);
    }
    return arg;
}

namespace {

Value sandbox_config_to_json(const SandboxConfig& cfg) {
    Value j = Value::object();
    if (cfg.timeout_ms) j["timeout"] = *cfg.timeout_ms;
    if (cfg.memory_limit_mb) j["memoryLimit"] = *cfg.memory_limit_mb;
    if (!cfg.allowed_read_paths.empty()) j["allowedReadPaths"] = cfg.allowed_read_paths;
    if (cfg.permission_set) j["permissionSet"] = *cfg.permission_set;
    return j;
}

SandboxConfig sandbox_config_from_json(const Value& j) {
    SandboxConfig cfg;
    if (j.contains("timeout") && j["timeout"].is_number()) cfg.timeout_ms = j["timeout"].get<int64_t>();
    if (j.contains("memoryLimit") && j["memoryLimit"].is_number()) cfg.memory_limit_mb = j["memoryLimit"].get<int64_t>();
    if (j.contains("allowedReadPaths") && j["allowedReadPaths"].is_array()) {
        cfg.allowed_read_paths = j["allowedReadPaths"].get<std::vector<std::string>>();
    }
    if (j.contains("permissionSet") && j["permissionSet"].is_string()) {
        cfg.permission_set = j["permissionSet"].get<std::string>();
    }
    return cfg;
}

std::string optional_string(const Value& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

} // namespace

Value task_to_json(const Task& task) {
    Value j;
    j["id"] = task.id;
    j["kind"] = to_string(task.kind());
    if (const auto* tool = task.as_tool()) {
        j["tool"] = tool->tool;
    } else if (const auto* code = task.as_code()) {
        j["code"] = code->code;
    } else if (const auto* cap = task.as_capability()) {
        j["capabilityId"] = cap->capability_id;
        j["tool"] = task.tool_label();
        if (cap->code) j["code"] = *cap->code;
    }
    j["arguments"] = task.arguments;
    j["dependsOn"] = task.depends_on;
    j["sideEffects"] = task.side_effects;
    if (task.condition) {
        j["condition"] = {{"decisionNodeId", task.condition->decision_node_id},
                          {"requiredOutcome", task.condition->required_outcome}};
    }
    if (!task.static_arguments.empty()) {
        Value args = Value::object();
        for (const auto& [name, arg] : task.static_arguments) {
            args[name] = argument_value_to_json(arg);
        }
        j["staticArguments"] = std::move(args);
    }
    if (task.intent) j["intent"] = *task.intent;
    if (task.sandbox_config) j["sandboxConfig"] = sandbox_config_to_json(*task.sandbox_config);
    return j;
}

Task task_from_json(const Value& j) {
    if (!j.is_object()) {
        throw DagValidationError("Task must be an object: " + j.dump());
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        throw DagValidationError("Task requires a string 'id': " + j.dump());
    }
    Task task;
    task.id = j["id"].get<std::string>();

    std::string kind_name = optional_string(j, "kind");
    if (kind_name.empty()) kind_name = optional_string(j, "type");
    const TaskKind kind = task_kind_from_string(kind_name);
    switch (kind) {
        case TaskKind::CODE_EXECUTION:
            task.payload = CodeTaskSpec{optional_string(j, "code")};
            break;
        case TaskKind::CAPABILITY: {
            CapabilityTaskSpec spec;
            spec.capability_id = optional_string(j, "capabilityId");
            const std::string tool = optional_string(j, "tool");
            if (spec.capability_id.empty() && tool.rfind("capability:", 0) == 0) {
                spec.capability_id = tool.substr(std::string("capability:").size());
            }
            if (j.contains("code") && j["code"].is_string()) spec.code = j["code"].get<std::string>();
            task.payload = std::move(spec);
            break;
        }
        case TaskKind::MCP_TOOL:
            task.payload = ToolTaskSpec{optional_string(j, "tool")};
            break;
    }

    if (j.contains("arguments") && !j["arguments"].is_null()) task.arguments = j["arguments"];
    if (j.contains("dependsOn") && !j["dependsOn"].is_null()) {
        if (!j["dependsOn"].is_array()) {
            throw DagValidationError("Task " + task.id + " dependsOn must be an array");
        }
        for (const auto& dep : j["dependsOn"]) {
            if (!dep.is_string()) {
                throw DagValidationError("Task " + task.id + " dependsOn entries must be strings: " + dep.dump());
            }
            task.depends_on.push_back(dep.get<TaskId>());
        }
    }
    if (j.contains("sideEffects")) {
        if (!j["sideEffects"].is_boolean()) {
            throw DagValidationError("Task " + task.id + " sideEffects must be a boolean");
        }
        task.side_effects = j["sideEffects"].get<bool>();
    }
    if (j.contains("condition") && j["condition"].is_object()) {
        const auto& c = j["condition"];
        task.condition = TaskCondition{optional_string(c, "decisionNodeId"), optional_string(c, "requiredOutcome")};
    }
    if (j.contains("staticArguments") && j["staticArguments"].is_object()) {
        for (auto it = j["staticArguments"].begin(); it != j["staticArguments"].end(); ++it) {
            task.static_arguments[it.key()] = argument_value_from_json(it.value());
        }
    }
    if (j.contains("intent") && j["intent"].is_string()) task.intent = j["intent"].get<std::string>();
    if (j.contains("sandboxConfig") && j["sandboxConfig"].is_object()) {
        task.sandbox_config = sandbox_config_from_json(j["sandboxConfig"]);
    }
    task.validate();
    return task;
}

std::vector<Task> tasks_from_json(const Value& json_array) {
    if (!json_array.is_array()) {
        throw DagValidationError("Expected an array of tasks");
    }
    std::vector<Task> tasks;
    tasks.reserve(json_array.size());
    for (const auto& item : json_array) {
        tasks.push_back(task_from_json(item));
    }
    return tasks;
}

Value task_result_to_json(const TaskResult& result) {
    Value j;
    j["taskId"] = result.task_id;
    j["status"] = to_string(result.status);
    if (result.output) j["output"] = *result.output;
    if (result.error) j["error"] = *result.error;
    if (result.elapsed_ms) j["executionTimeMs"] = *result.elapsed_ms;
    return j;
}

TaskResult task_result_from_json(const Value& j) {
    TaskResult result;
    result.task_id = j.at("taskId").get<std::string>();
    result.status = task_status_from_string(j.at("status").get<std::string>());
    if (j.contains("output")) result.output = j["output"];
    if (j.contains("error") && j["error"].is_string()) result.error = j["error"].get<std::string>();
    if (j.contains("executionTimeMs") && j["executionTimeMs"].is_number()) {
        result.elapsed_ms = j["executionTimeMs"].get<double>();
    }
    return result;
}

Value dag_to_json(const DAGStructure& dag) {
    Value tasks = Value::array();
    for (const auto& task : dag.tasks()) {
        tasks.push_back(task_to_json(task));
    }
    return Value{{"tasks", std::move(tasks)}};
}

DAGStructure dag_from_json(const Value& j) {
    if (!j.is_object() || !j.contains("tasks")) {
        throw DagValidationError("DAG requires a 'tasks' array");
    }
    DAGStructure dag(tasks_from_json(j["tasks"]));
    dag.validate();
    return dag;
}

} // namespace agentflow
