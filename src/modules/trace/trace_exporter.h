// modules/trace/trace_exporter.h
#ifndef AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

enum class TraceEventType : uint8_t {
    WORKFLOW_START,
    LAYER_START,
    TASK_START,
    TASK_COMPLETE,
    TASK_WARNING,   // failed_safe
    TASK_ERROR,
    TASK_SKIPPED,
    CHECKPOINT,
    DECISION_REQUIRED,
    COMMAND,
    WORKFLOW_COMPLETE,
    WORKFLOW_ABORT
};

std::string to_string(TraceEventType type);

struct TraceRecord {
    TraceEventType type = TraceEventType::WORKFLOW_START;
    TimePoint timestamp{};
    WorkflowId workflow_id;
    std::optional<int> layer;
    std::optional<TaskId> task_id;
    Value payload = Value::object();
};

Value trace_record_to_json(const TraceRecord& record);

using TraceListener = std::function<void(const TraceRecord&)>;

// Collects workflow execution events; thread-safe (tasks of a layer report concurrently)
class TraceExporter {
public:
    void emit(TraceEventType type, const WorkflowId& workflow_id, std::optional<int> layer = std::nullopt,
              std::optional<TaskId> task_id = std::nullopt, Value payload = Value::object());

    void on_task_start(const WorkflowId& workflow_id, int layer, const TaskId& task_id, const std::string& tool);
    // status: "success" | "error" | "failed_safe"
    void on_task_end(const WorkflowId& workflow_id, int layer, const TaskId& task_id, const std::string& status,
                     const std::optional<std::string>& error, std::optional<double> elapsed_ms);

    void set_listener(TraceListener listener);

    std::vector<TraceRecord> get_traces() const;
    std::vector<TraceRecord> get_traces(TraceEventType type) const;
    void clear_traces();

private:
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
    TraceListener listener_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
