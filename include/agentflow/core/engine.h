#ifndef AGENTFLOW_CORE_ENGINE_H
#define AGENTFLOW_CORE_ENGINE_H

#include "common/config/engine_config.h"
#include "common/tools/tool_invoker.h"
#include "modules/channel/command.h"
#include "modules/executor/sandbox.h"
#include "modules/router/task_router.h"
#include "modules/scheduler/workflow_scheduler.h"
#include "modules/store/checkpoint_store.h"
#include "modules/store/workflow_record_store.h"
#include "modules/trace/trace_exporter.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct ExecuteOptions {
    std::optional<WorkflowId> workflow_id; // 未指定时生成 "wf-<hex>"
    std::optional<std::string> intent;
    bool per_layer_validation = false;
    Context context = Context::object();
};

struct WorkflowRun {
    WorkflowId workflow_id;
    WorkflowStatus status = WorkflowStatus::CREATED;
    std::optional<std::string> checkpoint_id;
    std::string summary;              // 审批摘要 (paused_for_approval)
    std::string reason;               // 中止原因
    std::vector<TaskResult> results;
    WorkflowSummary stats;
};

Value workflow_run_to_json(const WorkflowRun& run);

std::string generate_workflow_id();

class WorkflowEngine {
public:
    explicit WorkflowEngine(EngineConfig config = {});

    // Remembers `path` for reload_config_file()
    static std::unique_ptr<WorkflowEngine> from_config_file(const std::string& path);

    // Runs layers until completion, abort or an approval pause
    WorkflowRun execute(DAGStructure dag, ExecuteOptions options = {});

    WorkflowRun continue_workflow(const WorkflowId& workflow_id, std::optional<std::string> reason = std::nullopt);
    WorkflowRun approve(const WorkflowId& workflow_id, const std::string& checkpoint_id, bool approved,
                        std::optional<std::string> feedback = std::nullopt);
    WorkflowRun abort(const WorkflowId& workflow_id, const std::string& reason);
    WorkflowRun replan(const WorkflowId& workflow_id, const std::string& new_requirement,
                       std::vector<Task> tasks = {}, Value available_context = Value::object());
    // Blocks up to timeouts.hil_ms for an approval command, then aborts the workflow
    WorkflowRun await_approval(const WorkflowId& workflow_id);

    // Queued only; applied at the next layer boundary
    void send_command(const WorkflowId& workflow_id, Command command);

    std::optional<WorkflowStatus> status(const WorkflowId& workflow_id) const;
    size_t cleanup_expired();
    void reload_config(EngineConfig config);
    void reload_config_file();
    std::shared_ptr<const EngineConfig> config() const { return config_.current(); }

    template <typename Func>
    void register_tool_client(std::string server, Func&& func) {
        tools_.register_client(std::move(server), std::forward<Func>(func));
    }

    // 新工作流生效; 已运行的保留原协作者
    void set_sandbox(std::shared_ptr<SandboxExecutor> sandbox);
    void set_capability_store(std::shared_ptr<CapabilityStore> store);
    void set_record_store(std::shared_ptr<WorkflowRecordStore> store);
    void set_checkpoint_store(std::shared_ptr<CheckpointStore> store);
    void set_replanner(std::shared_ptr<DagReplanner> replanner);

    TraceExporter& trace() { return trace_; }
    const TaskRouter& router() const { return router_; }
    ToolInvoker& tools() { return tools_; }

private:
    struct ActiveWorkflow {
        std::unique_ptr<WorkflowScheduler> scheduler;
        std::mutex run_mutex;
        // 协作者在工作流生命周期内保持存活
        std::shared_ptr<SandboxExecutor> sandbox;
        std::shared_ptr<CapabilityStore> capabilities;
        std::shared_ptr<WorkflowRecordStore> records;
        std::shared_ptr<CheckpointStore> checkpoints;
        std::shared_ptr<DagReplanner> replanner;
    };

    std::shared_ptr<ActiveWorkflow> make_workflow(const WorkflowId& workflow_id);
    // Active workflow, or one rehydrated from the record store plus its latest checkpoint
    std::shared_ptr<ActiveWorkflow> acquire(const WorkflowId& workflow_id,
                                            const std::optional<std::string>& approval_checkpoint = std::nullopt);
    WorkflowRun submit(const WorkflowId& workflow_id, Command command,
                       const std::optional<std::string>& approval_checkpoint = std::nullopt);
    WorkflowRun drive(const std::shared_ptr<ActiveWorkflow>& workflow);
    WorkflowRun snapshot(const WorkflowScheduler& scheduler) const;
    void finish(const WorkflowId& workflow_id, ActiveWorkflow& workflow);

    ConfigHolder config_;
    std::optional<std::string> config_source_;
    ToolInvoker tools_;
    TaskRouter router_;
    TraceExporter trace_;

    mutable std::mutex mutex_;
    std::shared_ptr<SandboxExecutor> sandbox_;
    std::shared_ptr<CapabilityStore> capabilities_;
    std::shared_ptr<WorkflowRecordStore> records_;
    std::shared_ptr<CheckpointStore> checkpoints_;
    std::shared_ptr<DagReplanner> replanner_;
    std::map<WorkflowId, std::shared_ptr<ActiveWorkflow>> active_;
    std::map<WorkflowId, WorkflowStatus> finished_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ENGINE_H
