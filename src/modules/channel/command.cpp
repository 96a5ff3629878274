// modules/channel/command.cpp
#include "modules/channel/command.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentflow {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool has_string(const Value& j, const char* key) {
    return j.contains(key) && j[key].is_string();
}

bool has_number(const Value& j, const char* key) {
    return j.contains(key) && j[key].is_number();
}

std::string decision_to_string(CheckpointDecision decision) {
    switch (decision) {
        case CheckpointDecision::CONTINUE: return "continue";
        case CheckpointDecision::ROLLBACK: return "rollback";
        case CheckpointDecision::MODIFY: return "modify";
    }
    return "continue";
}

std::optional<CheckpointDecision> decision_from_string(const std::string& name) {
    if (name == "continue") return CheckpointDecision::CONTINUE;
    if (name == "rollback") return CheckpointDecision::ROLLBACK;
    if (name == "modify") return CheckpointDecision::MODIFY;
    return std::nullopt;
}

Value tasks_to_json(const std::vector<Task>& tasks) {
    Value arr = Value::array();
    for (const auto& task : tasks) {
        arr.push_back(task_to_json(task));
    }
    return arr;
}

} // namespace

std::string to_string(CommandType type) {
    switch (type) {
        case CommandType::CONTINUE: return "continue";
        case CommandType::ABORT: return "abort";
        case CommandType::INJECT_TASKS: return "inject_tasks";
        case CommandType::REPLAN_DAG: return "replan_dag";
        case CommandType::SKIP_LAYER: return "skip_layer";
        case CommandType::MODIFY_ARGS: return "modify_args";
        case CommandType::CHECKPOINT_RESPONSE: return "checkpoint_response";
        case CommandType::APPROVAL_RESPONSE: return "approval_response";
    }
    return "unknown";
}

std::optional<CommandType> command_type_from_string(std::string_view name) {
    if (name == "continue") return CommandType::CONTINUE;
    if (name == "abort") return CommandType::ABORT;
    if (name == "inject_tasks") return CommandType::INJECT_TASKS;
    if (name == "replan_dag") return CommandType::REPLAN_DAG;
    if (name == "skip_layer") return CommandType::SKIP_LAYER;
    if (name == "modify_args") return CommandType::MODIFY_ARGS;
    if (name == "checkpoint_response") return CommandType::CHECKPOINT_RESPONSE;
    if (name == "approval_response") return CommandType::APPROVAL_RESPONSE;
    return std::nullopt;
}

CommandType command_type(const Command& command) {
    return std::visit(Overloaded{
        [](const ContinueCommand&) { return CommandType::CONTINUE; },
        [](const AbortCommand&) { return CommandType::ABORT; },
        [](const InjectTasksCommand&) { return CommandType::INJECT_TASKS; },
        [](const ReplanDagCommand&) { return CommandType::REPLAN_DAG; },
        [](const SkipLayerCommand&) { return CommandType::SKIP_LAYER; },
        [](const ModifyArgsCommand&) { return CommandType::MODIFY_ARGS; },
        [](const CheckpointResponseCommand&) { return CommandType::CHECKPOINT_RESPONSE; },
        [](const ApprovalResponseCommand&) { return CommandType::APPROVAL_RESPONSE; },
    }, command);
}

bool is_valid_command(const Value& j) {
    if (!j.is_object() || !has_string(j, "type")) return false;
    auto type = command_type_from_string(j["type"].get<std::string>());
    if (!type) return false;

    switch (*type) {
        case CommandType::CONTINUE:
            return !j.contains("reason") || j["reason"].is_string();
        case CommandType::ABORT:
            return has_string(j, "reason");
        case CommandType::INJECT_TASKS:
            return j.contains("tasks") && j["tasks"].is_array() && has_number(j, "targetLayer");
        case CommandType::REPLAN_DAG:
            return has_string(j, "newRequirement") &&
                   j.contains("availableContext") && j["availableContext"].is_object() &&
                   (!j.contains("tasks") || j["tasks"].is_array());
        case CommandType::SKIP_LAYER:
            return has_number(j, "layerIndex") && has_string(j, "reason");
        case CommandType::MODIFY_ARGS:
            return has_string(j, "taskId") && j.contains("updates") && j["updates"].is_object();
        case CommandType::CHECKPOINT_RESPONSE:
            return has_string(j, "checkpointId") && has_string(j, "decision") &&
                   decision_from_string(j["decision"].get<std::string>()).has_value();
        case CommandType::APPROVAL_RESPONSE:
            return has_string(j, "checkpointId") &&
                   j.contains("approved") && j["approved"].is_boolean() &&
                   (!j.contains("feedback") || j["feedback"].is_string());
    }
    return false;
}

Command command_from_json(const Value& j) {
    if (!is_valid_command(j)) {
        throw InvalidCommandError("Invalid command: " + j.dump());
    }
    const CommandType type = *command_type_from_string(j["type"].get<std::string>());
    try {
        switch (type) {
            case CommandType::CONTINUE: {
                ContinueCommand cmd;
                if (j.contains("reason")) cmd.reason = j["reason"].get<std::string>();
                return cmd;
            }
            case CommandType::ABORT:
                return AbortCommand{j["reason"].get<std::string>()};
            case CommandType::INJECT_TASKS:
                return InjectTasksCommand{tasks_from_json(j["tasks"]), j["targetLayer"].get<int>()};
            case CommandType::REPLAN_DAG: {
                ReplanDagCommand cmd;
                cmd.new_requirement = j["newRequirement"].get<std::string>();
                cmd.available_context = j["availableContext"];
                if (j.contains("tasks")) cmd.tasks = tasks_from_json(j["tasks"]);
                return cmd;
            }
            case CommandType::SKIP_LAYER:
                return SkipLayerCommand{j["layerIndex"].get<int>(), j["reason"].get<std::string>()};
            case CommandType::MODIFY_ARGS:
                return ModifyArgsCommand{j["taskId"].get<std::string>(), j["updates"]};
            case CommandType::CHECKPOINT_RESPONSE: {
                CheckpointResponseCommand cmd;
                cmd.checkpoint_id = j["checkpointId"].get<std::string>();
                cmd.decision = *decision_from_string(j["decision"].get<std::string>());
                if (j.contains("modifications") && j["modifications"].is_object()) {
                    cmd.modifications = j["modifications"];
                }
                return cmd;
            }
            case CommandType::APPROVAL_RESPONSE: {
                ApprovalResponseCommand cmd;
                cmd.checkpoint_id = j["checkpointId"].get<std::string>();
                cmd.approved = j["approved"].get<bool>();
                if (j.contains("feedback")) cmd.feedback = j["feedback"].get<std::string>();
                return cmd;
            }
        }
    } catch (const DagValidationError& e) {
        // 嵌套的 tasks 结构不合法
        throw InvalidCommandError("Invalid command: " + std::string(e.what()));
    } catch (const nlohmann::json::exception& e) {
        // 字段类型错误, 例如 dependsOn 中出现数字
        throw InvalidCommandError("Invalid command: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw InvalidCommandError("Invalid command: " + std::string(e.what()));
    } catch (const std::out_of_range& e) {
        throw InvalidCommandError("Invalid command: " + std::string(e.what()));
    }
    throw InvalidCommandError("Invalid command: " + j.dump());
}

Value command_to_json(const Command& command) {
    Value j = std::visit(Overloaded{
        [](const ContinueCommand& c) {
            Value v = Value::object();
            if (c.reason) v["reason"] = *c.reason;
            return v;
        },
        [](const AbortCommand& c) { return Value{{"reason", c.reason}}; },
        [](const InjectTasksCommand& c) {
            return Value{{"tasks", tasks_to_json(c.tasks)}, {"targetLayer", c.target_layer}};
        },
        [](const ReplanDagCommand& c) {
            Value v{{"newRequirement", c.new_requirement}, {"availableContext", c.available_context}};
            if (!c.tasks.empty()) v["tasks"] = tasks_to_json(c.tasks);
            return v;
        },
        [](const SkipLayerCommand& c) { return Value{{"layerIndex", c.layer_index}, {"reason", c.reason}}; },
        [](const ModifyArgsCommand& c) { return Value{{"taskId", c.task_id}, {"updates", c.updates}}; },
        [](const CheckpointResponseCommand& c) {
            Value v{{"checkpointId", c.checkpoint_id}, {"decision", decision_to_string(c.decision)}};
            if (!c.modifications.empty()) v["modifications"] = c.modifications;
            return v;
        },
        [](const ApprovalResponseCommand& c) {
            Value v{{"checkpointId", c.checkpoint_id}, {"approved", c.approved}};
            if (c.feedback) v["feedback"] = *c.feedback;
            return v;
        },
    }, command);
    j["type"] = to_string(command_type(command));
    return j;
}

std::optional<std::string> validate_command(const Command& command) {
    return std::visit(Overloaded{
        [](const ContinueCommand&) -> std::optional<std::string> { return std::nullopt; },
        [](const AbortCommand&) -> std::optional<std::string> { return std::nullopt; },
        [](const InjectTasksCommand& c) -> std::optional<std::string> {
            for (const auto& task : c.tasks) {
                try {
                    task.validate();
                } catch (const DagValidationError& e) {
                    return std::string(e.what());
                }
            }
            return std::nullopt;
        },
        [](const ReplanDagCommand& c) -> std::optional<std::string> {
            if (!c.available_context.is_object()) return std::string("availableContext must be an object");
            return std::nullopt;
        },
        [](const SkipLayerCommand& c) -> std::optional<std::string> {
            if (c.layer_index < 0) return std::string("layerIndex must be >= 0");
            return std::nullopt;
        },
        [](const ModifyArgsCommand& c) -> std::optional<std::string> {
            if (c.task_id.empty()) return std::string("taskId must be non-empty");
            if (!c.updates.is_object()) return std::string("updates must be an object");
            return std::nullopt;
        },
        [](const CheckpointResponseCommand& c) -> std::optional<std::string> {
            if (c.checkpoint_id.empty()) return std::string("checkpointId must be non-empty");
            return std::nullopt;
        },
        [](const ApprovalResponseCommand& c) -> std::optional<std::string> {
            if (c.checkpoint_id.empty()) return std::string("checkpointId must be non-empty");
            return std::nullopt;
        },
    }, command);
}

} // namespace agentflow
