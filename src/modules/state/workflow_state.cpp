// modules/state/workflow_state.cpp
#include "modules/state/workflow_state.h"
#include "core/types/errors.h"

namespace agentflow {

namespace {

template <typename T>
std::vector<T> append(const std::vector<T>& existing, const std::vector<T>& update) {
    std::vector<T> merged;
    merged.reserve(existing.size() + update.size());
    merged.insert(merged.end(), existing.begin(), existing.end());
    merged.insert(merged.end(), update.begin(), update.end());
    return merged;
}

} // namespace

std::vector<Message> messages_reducer(const std::vector<Message>& existing, const std::vector<Message>& update) {
    return append(existing, update);
}

std::vector<TaskResult> tasks_reducer(const std::vector<TaskResult>& existing, const std::vector<TaskResult>& update) {
    return append(existing, update);
}

std::vector<Decision> decisions_reducer(const std::vector<Decision>& existing, const std::vector<Decision>& update) {
    return append(existing, update);
}

Context context_reducer(const Context& existing, const Context& update) {
    Context merged = existing.is_object() ? existing : Context::object();
    if (update.is_object()) {
        for (auto it = update.begin(); it != update.end(); ++it) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

void validate_state_invariants(const WorkflowState& state) {
    if (state.workflow_id.empty()) {
        throw StateInvariantError("State invariant violated: workflow_id must be non-empty");
    }
    if (state.current_layer < 0) {
        throw StateInvariantError("State invariant violated: current_layer must be >= 0 (got " +
                                  std::to_string(state.current_layer) + ")");
    }
    if (state.tasks.size() < state.decisions.size()) {
        throw StateInvariantError("State invariant violated: tasks.length (" + std::to_string(state.tasks.size()) +
                                  ") must be >= decisions.length (" + std::to_string(state.decisions.size()) + ")");
    }
}

WorkflowState update_state(const WorkflowState& state, const StateUpdate& update) {
    WorkflowState next = state;
    if (update.current_layer) next.current_layer = *update.current_layer;
    if (!update.messages.empty()) next.messages = messages_reducer(state.messages, update.messages);
    if (!update.tasks.empty()) next.tasks = tasks_reducer(state.tasks, update.tasks);
    if (!update.decisions.empty()) next.decisions = decisions_reducer(state.decisions, update.decisions);
    if (update.context) next.context = context_reducer(state.context, *update.context);
    validate_state_invariants(next);
    return next;
}

WorkflowState create_initial_state(const WorkflowId& workflow_id, Context initial_context) {
    WorkflowState state;
    state.workflow_id = workflow_id;
    state.context = initial_context.is_object() ? std::move(initial_context) : Context::object();
    validate_state_invariants(state);
    return state;
}

StateSummary summarize_state(const WorkflowState& state) {
    StateSummary summary;
    for (const auto& result : state.tasks) {
        switch (result.status) {
            case TaskStatus::SUCCESS: summary.succeeded++; break;
            case TaskStatus::ERROR: summary.failed++; break;
            case TaskStatus::FAILED_SAFE: summary.failed_safe++; break;
        }
    }
    summary.decisions = state.decisions.size();
    summary.messages = state.messages.size();
    return summary;
}

std::string to_string(DecisionType type) {
    return type == DecisionType::AIL ? "AIL" : "HIL";
}

Value workflow_state_to_json(const WorkflowState& state) {
    Value messages = Value::array();
    for (const auto& m : state.messages) {
        messages.push_back({{"role", m.role}, {"content", m.content},
                            {"timestamp", format_timestamp(m.timestamp)}, {"metadata", m.metadata}});
    }
    Value tasks = Value::array();
    for (const auto& t : state.tasks) {
        tasks.push_back(task_result_to_json(t));
    }
    Value decisions = Value::array();
    for (const auto& d : state.decisions) {
        decisions.push_back({{"type", to_string(d.type)}, {"timestamp", format_timestamp(d.timestamp)},
                             {"description", d.description}, {"outcome", d.outcome}, {"metadata", d.metadata}});
    }
    return Value{
        {"workflowId", state.workflow_id},
        {"currentLayer", state.current_layer},
        {"messages", std::move(messages)},
        {"tasks", std::move(tasks)},
        {"decisions", std::move(decisions)},
        {"context", state.context},
    };
}

WorkflowState workflow_state_from_json(const Value& j) {
    WorkflowState state;
    state.workflow_id = j.at("workflowId").get<std::string>();
    state.current_layer = j.value("currentLayer", 0);
    for (const auto& m : j.value("messages", Value::array())) {
        Message msg;
        msg.role = m.value("role", "system");
        msg.content = m.value("content", "");
        if (m.contains("timestamp")) msg.timestamp = parse_timestamp(m["timestamp"].get<std::string>());
        msg.metadata = m.value("metadata", Value::object());
        state.messages.push_back(std::move(msg));
    }
    for (const auto& t : j.value("tasks", Value::array())) {
        state.tasks.push_back(task_result_from_json(t));
    }
    for (const auto& d : j.value("decisions", Value::array())) {
        Decision decision;
        decision.type = d.value("type", "HIL") == "AIL" ? DecisionType::AIL : DecisionType::HIL;
        if (d.contains("timestamp")) decision.timestamp = parse_timestamp(d["timestamp"].get<std::string>());
        decision.description = d.value("description", "");
        decision.outcome = d.value("outcome", "");
        decision.metadata = d.value("metadata", Value::object());
        state.decisions.push_back(std::move(decision));
    }
    state.context = j.value("context", Context::object());
    validate_state_invariants(state);
    return state;
}

} // namespace agentflow
