// core/types/task.h
#ifndef AGENTFLOW_CORE_TYPES_TASK_H
#define AGENTFLOW_CORE_TYPES_TASK_H

#include "core/types/context.h" // 引入 Value, TaskId
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentflow {

// 任务执行类型
enum class TaskKind : uint8_t {
    CODE_EXECUTION,
    CAPABILITY,
    MCP_TOOL
};

enum class TaskStatus : uint8_t {
    SUCCESS,
    ERROR,
    FAILED_SAFE
};

std::string to_string(TaskKind kind);
std::string to_string(TaskStatus status);
// Unknown or empty names map to MCP_TOOL
TaskKind task_kind_from_string(std::string_view name);
TaskStatus task_status_from_string(std::string_view name);

// Gates a task on an upstream decision's observed outcome
struct TaskCondition {
    std::string decision_node_id;
    std::string required_outcome;

    bool operator==(const TaskCondition&) const = default;
};

// Argument resolution strategy preserved from static analysis
struct ArgumentValue {
    enum class Type : uint8_t { LITERAL, REFERENCE, PARAMETER };

    Type type = Type::LITERAL;
    Value value;                  // LITERAL
    std::string expression;       // REFERENCE, e.g. "n1.content.items[0]"
    std::string parameter_name;   // PARAMETER

    bool operator==(const ArgumentValue&) const = default;
};

using ArgumentsStructure = std::map<std::string, ArgumentValue>;

struct SandboxConfig {
    std::optional<int64_t> timeout_ms;
    std::optional<int64_t> memory_limit_mb;
    std::vector<std::string> allowed_read_paths;
    std::optional<std::string> permission_set;

    bool operator==(const SandboxConfig&) const = default;
};

struct CodeTaskSpec {
    std::string code;
    bool operator==(const CodeTaskSpec&) const = default;
};

struct CapabilityTaskSpec {
    std::string capability_id;
    std::optional<std::string> code; // 可内联代码, 否则从 CapabilityStore 查找
    bool operator==(const CapabilityTaskSpec&) const = default;
};

struct ToolTaskSpec {
    std::string tool; // "server:action"
    bool operator==(const ToolTaskSpec&) const = default;
};

using TaskPayload = std::variant<CodeTaskSpec, CapabilityTaskSpec, ToolTaskSpec>;

struct Task {
    TaskId id;
    TaskPayload payload = ToolTaskSpec{};
    std::vector<TaskId> depends_on;
    bool side_effects = false;
    std::optional<TaskCondition> condition;
    Value arguments = Value::object();
    ArgumentsStructure static_arguments;
    std::optional<std::string> intent;
    std::optional<SandboxConfig> sandbox_config;

    static Task make_tool(TaskId id, std::string tool, std::vector<TaskId> depends_on = {},
                          Value arguments = Value::object());
    static Task make_code(TaskId id, std::string code, std::vector<TaskId> depends_on = {},
                          bool side_effects = false);
    static Task make_capability(TaskId id, std::string capability_id, std::vector<TaskId> depends_on = {},
                                std::optional<std::string> code = std::nullopt);

    TaskKind kind() const;
    // Tool id for MCP_TOOL, "capability:<id>" for CAPABILITY, "code:exec" for code tasks
    std::string tool_label() const;
    const ToolTaskSpec* as_tool() const { return std::get_if<ToolTaskSpec>(&payload); }
    const CodeTaskSpec* as_code() const { return std::get_if<CodeTaskSpec>(&payload); }
    const CapabilityTaskSpec* as_capability() const { return std::get_if<CapabilityTaskSpec>(&payload); }

    // Throws DagValidationError on an incomplete payload
    void validate() const;

    bool operator==(const Task&) const = default;
};

struct TaskResult {
    TaskId task_id;
    TaskStatus status = TaskStatus::SUCCESS;
    std::optional<Value> output;
    std::optional<std::string> error;
    std::optional<double> elapsed_ms;

    bool succeeded() const { return status == TaskStatus::SUCCESS; }
    // success or failed_safe: dependents may proceed
    bool settled_ok() const { return status != TaskStatus::ERROR; }
};

class DAGStructure {
public:
    DAGStructure() = default;
    explicit DAGStructure(std::vector<Task> tasks) : tasks_(std::move(tasks)) {}

    const std::vector<Task>& tasks() const { return tasks_; }
    std::vector<Task>& mutable_tasks() { return tasks_; }
    size_t size() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }

    bool contains(const TaskId& id) const;
    const Task* find(const TaskId& id) const;
    Task* find(const TaskId& id);

    // 追加任务 (replan / inject), 拒绝重复 id, 追加后整体校验
    void add_tasks(const std::vector<Task>& tasks);

    // unique ids + every depends_on present; throws DagValidationError
    void validate() const;

private:
    std::vector<Task> tasks_;
};

// --- JSON 编解码 (wire format) ---
Value argument_value_to_json(const ArgumentValue& arg);
ArgumentValue argument_value_from_json(const Value& json);

Value task_to_json(const Task& task);
Task task_from_json(const Value& json);
std::vector<Task> tasks_from_json(const Value& json_array);

Value task_result_to_json(const TaskResult& result);
TaskResult task_result_from_json(const Value& json);

Value dag_to_json(const DAGStructure& dag);
// Parses and validates {tasks: [...]}
DAGStructure dag_from_json(const Value& json);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_TASK_H
