// modules/scheduler/workflow_scheduler.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_WORKFLOW_SCHEDULER_H
#define AGENTFLOW_MODULES_SCHEDULER_WORKFLOW_SCHEDULER_H

#include "common/config/engine_config.h"
#include "modules/channel/command_queue.h"
#include "modules/executor/task_executor.h"
#include "modules/scheduler/layer_planner.h"
#include "modules/state/workflow_state.h"
#include "modules/store/checkpoint_store.h"
#include "modules/store/workflow_record_store.h"
#include "modules/trace/trace_exporter.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace agentflow {

enum class WorkflowStatus : uint8_t { CREATED, RUNNING, PAUSED_FOR_APPROVAL, COMPLETE, ABORTED };
enum class StepKind : uint8_t { PAUSED, AWAITING_APPROVAL, COMPLETED, ABORTED };

std::string to_string(WorkflowStatus status);
std::string to_string(StepKind kind);

struct StepOutcome {
    StepKind kind = StepKind::PAUSED;
    int layer = -1;                       // 本步执行的层; -1 = 未执行
    std::vector<TaskId> task_ids;
    std::vector<TaskResult> layer_results;
    std::optional<std::string> checkpoint_id;
    std::string reason;
    std::string summary;                  // HIL 审批摘要
    bool decision_required = false;       // AIL 决策点
};

struct WorkflowSummary {
    int layers_executed = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t failed_safe = 0;
    size_t skipped = 0;
    size_t pending = 0;
    int replans = 0;
};

Value workflow_summary_to_json(const WorkflowSummary& summary);

// Produces replacement/additional tasks for a replan_dag command that carries none
class DagReplanner {
public:
    virtual ~DagReplanner() = default;
    virtual std::vector<Task> replan(const DAGStructure& current, const WorkflowState& state,
                                     const std::string& new_requirement, const Value& available_context) = 0;
};

// 非拥有指针, 均可为空
struct SchedulerCollaborators {
    ExecutorCollaborators executors;
    CheckpointStore* checkpoints = nullptr;
    WorkflowRecordStore* records = nullptr;
    DagReplanner* replanner = nullptr;
    TraceExporter* trace = nullptr;
    const TaskRouter* router = nullptr;
};

struct StartOptions {
    std::optional<std::string> intent;
    bool per_layer_validation = false;
    Context context = Context::object();
};

// Layer-by-layer state machine for one workflow.
// A driver calls step() repeatedly; each call applies pending commands, then runs at most one layer.
class WorkflowScheduler {
public:
    WorkflowScheduler(WorkflowId workflow_id, std::shared_ptr<const EngineConfig> config,
                      SchedulerCollaborators collaborators);

    // Validates the DAG (DagValidationError / CycleDetectedError) and moves to RUNNING
    void start(DAGStructure dag, StartOptions options = {});

    StepOutcome step();

    // Throws CheckpointNotFoundError
    void resume_from_checkpoint(DAGStructure dag, const std::string& checkpoint_id);
    void resume_from_checkpoint(const Checkpoint& checkpoint);
    // Re-enters the approval pause taken at `checkpoint_id` (after a restore)
    void mark_awaiting_approval(const std::string& checkpoint_id);

    // Moves straight to ABORTED with `reason`
    void abort(const std::string& reason);

    // Blocks up to `timeout` for a command; it is applied at the next step(). Returns false on timeout.
    bool wait_for_command(std::chrono::milliseconds timeout);

    std::shared_ptr<CommandQueue> command_queue() const { return commands_; }
    void enqueue_command(Command command) { commands_->enqueue(std::move(command)); }

    const WorkflowId& workflow_id() const { return workflow_id_; }
    WorkflowStatus status() const { return status_; }
    const WorkflowState& state() const { return state_; }
    const DAGStructure& dag() const { return dag_; }
    const std::optional<std::string>& intent() const { return options_.intent; }
    const std::optional<std::string>& pending_checkpoint_id() const { return pending_checkpoint_id_; }
    const std::string& abort_reason() const { return abort_reason_; }
    const std::vector<TaskId>& skipped_tasks() const { return skipped_order_; }
    int next_layer() const { return next_layer_; }
    // True when the last step() threw because a command was rejected; the workflow itself is intact
    bool command_rejected() const { return command_rejected_; }

    WorkflowSummary summary() const;
    // Latest result per task id, in execution order
    std::vector<TaskResult> latest_results() const;

    void set_config(std::shared_ptr<const EngineConfig> config);

private:
    // --- 命令处理 ---
    void apply_commands();
    void apply(const Command& command);
    void handle_inject(const InjectTasksCommand& command);
    void handle_replan(const ReplanDagCommand& command);
    void handle_modify_args(const TaskId& task_id, const Value& updates);
    void handle_checkpoint_response(const CheckpointResponseCommand& command);
    void handle_approval(const ApprovalResponseCommand& command);
    void resume_running(const std::string& source);

    // --- 层执行 ---
    std::vector<TaskResult> execute_layer(int layer, const std::vector<TaskId>& task_ids);
    void mark_skipped(const TaskId& task_id, const std::string& reason, int layer);
    std::optional<std::string> recorded_outcome(const std::string& decision_node_id) const;
    LayerPlan plan() const;

    std::optional<Checkpoint> save_checkpoint(int layer);
    bool approval_required(const std::vector<TaskId>& task_ids) const;
    bool decision_point(const std::vector<TaskResult>& layer_results) const;
    std::string build_approval_summary(int layer, const std::vector<TaskResult>& layer_results) const;

    void restore(const Checkpoint& checkpoint, DAGStructure dag);
    void sync_record();
    Value scheduler_metadata() const;
    void trace(TraceEventType type, std::optional<int> layer = std::nullopt,
               std::optional<TaskId> task_id = std::nullopt, Value payload = Value::object());

    WorkflowId workflow_id_;
    std::shared_ptr<const EngineConfig> config_;
    SchedulerCollaborators collaborators_;
    TaskExecutor executor_;
    std::shared_ptr<CommandQueue> commands_;
    std::vector<Command> deferred_; // wait_for_command 取出, 下一步应用
    bool command_rejected_ = false;

    WorkflowStatus status_ = WorkflowStatus::CREATED;
    StartOptions options_;
    DAGStructure dag_;
    WorkflowState state_;
    ResultMap results_;
    std::unordered_set<TaskId> skipped_;
    std::vector<TaskId> skipped_order_;
    std::map<int, std::string> skip_layers_; // layer index -> reason
    int next_layer_ = 0;
    int layers_executed_ = 0;
    int replans_ = 0;
    std::optional<std::string> pending_checkpoint_id_;
    std::string abort_reason_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_WORKFLOW_SCHEDULER_H
