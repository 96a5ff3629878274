// modules/state/workflow_state.h
#ifndef AGENTFLOW_MODULES_STATE_WORKFLOW_STATE_H
#define AGENTFLOW_MODULES_STATE_WORKFLOW_STATE_H

#include "core/types/context.h"
#include "core/types/task.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct Message {
    std::string role; // "system" | "user" | "assistant"
    std::string content;
    TimePoint timestamp{};
    Value metadata = Value::object();
};

enum class DecisionType : uint8_t { AIL, HIL };

struct Decision {
    DecisionType type = DecisionType::HIL;
    TimePoint timestamp{};
    std::string description;
    std::string outcome;
    Value metadata = Value::object();
};

struct WorkflowState {
    WorkflowId workflow_id;
    int current_layer = 0;
    std::vector<Message> messages;
    std::vector<TaskResult> tasks;
    std::vector<Decision> decisions;
    Context context = Context::object();
};

// Partial update; absent fields are left untouched
struct StateUpdate {
    std::optional<int> current_layer;
    std::vector<Message> messages;     // append
    std::vector<TaskResult> tasks;     // append
    std::vector<Decision> decisions;   // append
    std::optional<Context> context;    // shallow merge, update wins
};

// --- reducers ---
std::vector<Message> messages_reducer(const std::vector<Message>& existing, const std::vector<Message>& update);
std::vector<TaskResult> tasks_reducer(const std::vector<TaskResult>& existing, const std::vector<TaskResult>& update);
std::vector<Decision> decisions_reducer(const std::vector<Decision>& existing, const std::vector<Decision>& update);
Context context_reducer(const Context& existing, const Context& update);

// Throws StateInvariantError
void validate_state_invariants(const WorkflowState& state);

// Pure: returns the new state or throws StateInvariantError without touching `state`
WorkflowState update_state(const WorkflowState& state, const StateUpdate& update);

WorkflowState create_initial_state(const WorkflowId& workflow_id, Context initial_context = Context::object());

struct StateSummary {
    size_t succeeded = 0;
    size_t failed = 0;
    size_t failed_safe = 0;
    size_t decisions = 0;
    size_t messages = 0;
};

StateSummary summarize_state(const WorkflowState& state);

std::string to_string(DecisionType type);

Value workflow_state_to_json(const WorkflowState& state);
WorkflowState workflow_state_from_json(const Value& json);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_STATE_WORKFLOW_STATE_H
