// modules/channel/command.h
#ifndef AGENTFLOW_MODULES_CHANNEL_COMMAND_H
#define AGENTFLOW_MODULES_CHANNEL_COMMAND_H

#include "core/types/context.h"
#include "core/types/task.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentflow {

enum class CommandType : uint8_t {
    CONTINUE,
    ABORT,
    INJECT_TASKS,
    REPLAN_DAG,
    SKIP_LAYER,
    MODIFY_ARGS,
    CHECKPOINT_RESPONSE,
    APPROVAL_RESPONSE
};

std::string to_string(CommandType type);
std::optional<CommandType> command_type_from_string(std::string_view name);

struct ContinueCommand {
    std::optional<std::string> reason;
};

struct AbortCommand {
    std::string reason;
};

struct InjectTasksCommand {
    std::vector<Task> tasks;
    int target_layer = 0;
};

struct ReplanDagCommand {
    std::string new_requirement;
    Value available_context = Value::object();
    std::vector<Task> tasks; // 为空时交给 DagReplanner
};

struct SkipLayerCommand {
    int layer_index = 0;
    std::string reason;
};

struct ModifyArgsCommand {
    TaskId task_id;
    Value updates = Value::object();
};

enum class CheckpointDecision : uint8_t { CONTINUE, ROLLBACK, MODIFY };

struct CheckpointResponseCommand {
    std::string checkpoint_id;
    CheckpointDecision decision = CheckpointDecision::CONTINUE;
    Value modifications = Value::object();
};

struct ApprovalResponseCommand {
    std::string checkpoint_id;
    bool approved = false;
    std::optional<std::string> feedback;
};

using Command = std::variant<
    ContinueCommand,
    AbortCommand,
    InjectTasksCommand,
    ReplanDagCommand,
    SkipLayerCommand,
    ModifyArgsCommand,
    CheckpointResponseCommand,
    ApprovalResponseCommand>;

CommandType command_type(const Command& command);

// Structural check of the JSON wire form (discriminator "type")
bool is_valid_command(const Value& json);

// Throws InvalidCommandError when the shape does not match its variant
Command command_from_json(const Value& json);
Value command_to_json(const Command& command);

// Typed commands can still carry empty ids / non-object updates; returns an error text or nullopt
std::optional<std::string> validate_command(const Command& command);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CHANNEL_COMMAND_H
