// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"

namespace agentflow {

std::string to_string(TraceEventType type) {
    switch (type) {
        case TraceEventType::WORKFLOW_START: return "workflow_start";
        case TraceEventType::LAYER_START: return "layer_start";
        case TraceEventType::TASK_START: return "task_start";
        case TraceEventType::TASK_COMPLETE: return "task_complete";
        case TraceEventType::TASK_WARNING: return "task_warning";
        case TraceEventType::TASK_ERROR: return "task_error";
        case TraceEventType::TASK_SKIPPED: return "task_skipped";
        case TraceEventType::CHECKPOINT: return "checkpoint";
        case TraceEventType::DECISION_REQUIRED: return "decision_required";
        case TraceEventType::COMMAND: return "command";
        case TraceEventType::WORKFLOW_COMPLETE: return "workflow_complete";
        case TraceEventType::WORKFLOW_ABORT: return "workflow_abort";
    }
    return "unknown";
}

Value trace_record_to_json(const TraceRecord& record) {
    Value j{
        {"type", to_string(record.type)},
        {"timestamp", format_timestamp(record.timestamp)},
        {"workflowId", record.workflow_id},
        {"payload", record.payload},
    };
    if (record.layer) j["layer"] = *record.layer;
    if (record.task_id) j["taskId"] = *record.task_id;
    return j;
}

void TraceExporter::emit(TraceEventType type, const WorkflowId& workflow_id, std::optional<int> layer,
                         std::optional<TaskId> task_id, Value payload) {
    TraceRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.workflow_id = workflow_id;
    record.layer = layer;
    record.task_id = std::move(task_id);
    record.payload = std::move(payload);

    TraceListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        traces_.push_back(record);
        listener = listener_;
    }
    if (listener) {
        listener(record);
    }
}

void TraceExporter::on_task_start(const WorkflowId& workflow_id, int layer, const TaskId& task_id,
                                  const std::string& tool) {
    emit(TraceEventType::TASK_START, workflow_id, layer, task_id, Value{{"tool", tool}});
}

void TraceExporter::on_task_end(const WorkflowId& workflow_id, int layer, const TaskId& task_id,
                                const std::string& status, const std::optional<std::string>& error,
                                std::optional<double> elapsed_ms) {
    Value payload{{"status", status}};
    if (error) payload["error"] = *error;
    if (elapsed_ms) payload["executionTimeMs"] = *elapsed_ms;

    TraceEventType type = TraceEventType::TASK_COMPLETE;
    if (status == "error") type = TraceEventType::TASK_ERROR;
    else if (status == "failed_safe") type = TraceEventType::TASK_WARNING;
    emit(type, workflow_id, layer, task_id, std::move(payload));
}

void TraceExporter::set_listener(TraceListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<TraceRecord> TraceExporter::get_traces(TraceEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceRecord> filtered;
    for (const auto& record : traces_) {
        if (record.type == type) filtered.push_back(record);
    }
    return filtered;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

} // namespace agentflow
