// src/core/engine.cpp
#include "agentflow/core/engine.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentflow {

namespace {

constexpr const char* kComponent = "engine";

} // namespace

std::string generate_workflow_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "wf-" << std::hex << std::setfill('0') << std::setw(16) << rng();
    return oss.str();
}

Value workflow_run_to_json(const WorkflowRun& run) {
    Value results = Value::array();
    for (const auto& result : run.results) {
        results.push_back(task_result_to_json(result));
    }
    Value json{
        {"workflowId", run.workflow_id},
        {"status", to_string(run.status)},
        {"results", results},
        {"stats", workflow_summary_to_json(run.stats)},
    };
    if (run.checkpoint_id) json["checkpointId"] = *run.checkpoint_id;
    if (!run.summary.empty()) json["summary"] = run.summary;
    if (!run.reason.empty()) json["reason"] = run.reason;
    return json;
}

WorkflowEngine::WorkflowEngine(EngineConfig config)
    : config_(std::move(config)),
      router_(std::make_shared<const RoutingConfig>(config_.current()->routing)) {
    auto current = config_.current();
    Logger::set_level(log_level_from_string(current->log_level));

    auto ttl = std::chrono::seconds(current->store.record_ttl_seconds);
    if (current->store.directory) {
        std::filesystem::path root(*current->store.directory);
        records_ = std::make_shared<FileWorkflowRecordStore>(root / "records", ttl);
        checkpoints_ = std::make_shared<FileCheckpointStore>(root / "checkpoints");
        Logger::info(kComponent, "Using file stores under " + root.string());
    } else {
        records_ = std::make_shared<InMemoryWorkflowRecordStore>(ttl);
        checkpoints_ = std::make_shared<InMemoryCheckpointStore>();
    }
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config_file(const std::string& path) {
    auto engine = std::make_unique<WorkflowEngine>(load_engine_config(path));
    engine->config_source_ = path;
    return engine;
}

// --- 协作者 ---

void WorkflowEngine::set_sandbox(std::shared_ptr<SandboxExecutor> sandbox) {
    std::lock_guard<std::mutex> lock(mutex_);
    sandbox_ = std::move(sandbox);
}

void WorkflowEngine::set_capability_store(std::shared_ptr<CapabilityStore> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_ = std::move(store);
}

void WorkflowEngine::set_record_store(std::shared_ptr<WorkflowRecordStore> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(store);
}

void WorkflowEngine::set_checkpoint_store(std::shared_ptr<CheckpointStore> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_ = std::move(store);
}

void WorkflowEngine::set_replanner(std::shared_ptr<DagReplanner> replanner) {
    std::lock_guard<std::mutex> lock(mutex_);
    replanner_ = std::move(replanner);
}

std::shared_ptr<WorkflowEngine::ActiveWorkflow> WorkflowEngine::make_workflow(const WorkflowId& workflow_id) {
    auto workflow = std::make_shared<ActiveWorkflow>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workflow->sandbox = sandbox_;
        workflow->capabilities = capabilities_;
        workflow->records = records_;
        workflow->checkpoints = checkpoints_;
        workflow->replanner = replanner_;
    }

    SchedulerCollaborators collaborators;
    collaborators.executors.tools = &tools_;
    collaborators.executors.sandbox = workflow->sandbox.get();
    collaborators.executors.capabilities = workflow->capabilities.get();
    collaborators.checkpoints = workflow->checkpoints.get();
    collaborators.records = workflow->records.get();
    collaborators.replanner = workflow->replanner.get();
    collaborators.trace = &trace_;
    collaborators.router = &router_;

    workflow->scheduler = std::make_unique<WorkflowScheduler>(workflow_id, config_.current(), collaborators);
    return workflow;
}

// --- 执行 ---

WorkflowRun WorkflowEngine::execute(DAGStructure dag, ExecuteOptions options) {
    WorkflowId workflow_id = options.workflow_id.value_or(generate_workflow_id());
    auto workflow = make_workflow(workflow_id);

    // 启动完成前持有 run_mutex, 同 id 的并发调用只能看到已启动的工作流
    std::unique_lock<std::mutex> run_lock(workflow->run_mutex);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.try_emplace(workflow_id, workflow).second) {
            throw StateInvariantError("Workflow " + workflow_id + " is already running");
        }
        finished_.erase(workflow_id);
    }

    try {
        StartOptions start;
        start.intent = options.intent;
        start.per_layer_validation = options.per_layer_validation;
        start.context = std::move(options.context);
        workflow->scheduler->start(dag, std::move(start));

        if (workflow->records) {
            workflow->records->save(workflow_id, dag, options.intent);
        }
    } catch (const std::exception& e) {
        Logger::error(kComponent, "Workflow " + workflow_id + " failed to start: " + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(workflow_id);
        throw;
    }
    run_lock.unlock();
    return drive(workflow);
}

WorkflowRun WorkflowEngine::continue_workflow(const WorkflowId& workflow_id, std::optional<std::string> reason) {
    return submit(workflow_id, ContinueCommand{std::move(reason)});
}

WorkflowRun WorkflowEngine::approve(const WorkflowId& workflow_id, const std::string& checkpoint_id, bool approved,
                                    std::optional<std::string> feedback) {
    return submit(workflow_id, ApprovalResponseCommand{checkpoint_id, approved, std::move(feedback)}, checkpoint_id);
}

WorkflowRun WorkflowEngine::abort(const WorkflowId& workflow_id, const std::string& reason) {
    return submit(workflow_id, AbortCommand{reason});
}

WorkflowRun WorkflowEngine::replan(const WorkflowId& workflow_id, const std::string& new_requirement,
                                   std::vector<Task> tasks, Value available_context) {
    return submit(workflow_id, ReplanDagCommand{new_requirement, std::move(available_context), std::move(tasks)});
}

WorkflowRun WorkflowEngine::await_approval(const WorkflowId& workflow_id) {
    auto workflow = acquire(workflow_id);
    {
        std::lock_guard<std::mutex> run_lock(workflow->run_mutex);
        auto& scheduler = *workflow->scheduler;
        if (scheduler.status() != WorkflowStatus::PAUSED_FOR_APPROVAL) {
            return snapshot(scheduler);
        }
        auto timeout = std::chrono::milliseconds(config_.current()->timeouts.hil_ms);
        if (!scheduler.wait_for_command(timeout)) {
            scheduler.abort("Workflow aborted: HIL approval timeout");
        }
    }
    return drive(workflow);
}

void WorkflowEngine::send_command(const WorkflowId& workflow_id, Command command) {
    auto workflow = acquire(workflow_id);
    workflow->scheduler->enqueue_command(std::move(command));
}

WorkflowRun WorkflowEngine::submit(const WorkflowId& workflow_id, Command command,
                                   const std::optional<std::string>& approval_checkpoint) {
    auto workflow = acquire(workflow_id, approval_checkpoint);
    workflow->scheduler->enqueue_command(std::move(command));
    return drive(workflow);
}

std::shared_ptr<WorkflowEngine::ActiveWorkflow> WorkflowEngine::acquire(
    const WorkflowId& workflow_id, const std::optional<std::string>& approval_checkpoint) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(workflow_id);
        if (it != active_.end()) return it->second;
    }

    // 无状态恢复: 记录 + 最新检查点
    auto workflow = make_workflow(workflow_id);
    auto record = workflow->records ? workflow->records->get_record(workflow_id) : std::nullopt;
    if (!record) {
        throw RecordNotFoundError("Workflow " + workflow_id + " not found");
    }
    auto checkpoint = workflow->checkpoints ? workflow->checkpoints->latest(workflow_id) : std::nullopt;
    if (!checkpoint) {
        throw CheckpointNotFoundError("No checkpoint found for workflow " + workflow_id);
    }
    workflow->scheduler->resume_from_checkpoint(record->dag, checkpoint->id);
    if (approval_checkpoint && *approval_checkpoint == checkpoint->id) {
        workflow->scheduler->mark_awaiting_approval(checkpoint->id);
    }
    workflow->records->extend_expiration(workflow_id);
    Logger::info(kComponent, "Workflow " + workflow_id + " rehydrated from checkpoint " + checkpoint->id);

    std::lock_guard<std::mutex> lock(mutex_);
    return active_.emplace(workflow_id, workflow).first->second; // 并发恢复时以先到者为准
}

WorkflowRun WorkflowEngine::drive(const std::shared_ptr<ActiveWorkflow>& workflow) {
    std::lock_guard<std::mutex> run_lock(workflow->run_mutex);
    auto& scheduler = *workflow->scheduler;
    const WorkflowId workflow_id = scheduler.workflow_id();

    try {
        while (true) {
            auto config = config_.current();
            scheduler.set_config(config);

            StepOutcome outcome = scheduler.step();
            switch (outcome.kind) {
            case StepKind::COMPLETED:
            case StepKind::ABORTED: {
                WorkflowRun run = snapshot(scheduler);
                finish(workflow_id, *workflow);
                return run;
            }
            case StepKind::AWAITING_APPROVAL: {
                if (workflow->records) workflow->records->extend_expiration(workflow_id);
                WorkflowRun run = snapshot(scheduler);
                run.checkpoint_id = outcome.checkpoint_id;
                run.summary = outcome.summary;
                return run;
            }
            case StepKind::PAUSED:
                if (outcome.decision_required) {
                    auto timeout = std::chrono::milliseconds(config->timeouts.ail_ms);
                    if (!scheduler.wait_for_command(timeout)) {
                        Logger::info(kComponent, "No agent decision for workflow " + workflow_id + " within " +
                                                     std::to_string(config->timeouts.ail_ms) + "ms; continuing");
                    }
                }
                break;
            }
        }
    } catch (const std::exception& e) {
        if (scheduler.command_rejected()) {
            // 被拒绝的命令不影响工作流本身; 同批命令可能已将其终止
            if (scheduler.status() == WorkflowStatus::ABORTED || scheduler.status() == WorkflowStatus::COMPLETE) {
                finish(workflow_id, *workflow);
            }
            throw;
        }
        Logger::error(kComponent, "Workflow " + workflow_id + " failed: " + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(workflow_id);
        throw;
    }
}

WorkflowRun WorkflowEngine::snapshot(const WorkflowScheduler& scheduler) const {
    WorkflowRun run;
    run.workflow_id = scheduler.workflow_id();
    run.status = scheduler.status();
    run.checkpoint_id = scheduler.pending_checkpoint_id();
    run.reason = scheduler.abort_reason();
    run.results = scheduler.latest_results();
    run.stats = scheduler.summary();
    return run;
}

void WorkflowEngine::finish(const WorkflowId& workflow_id, ActiveWorkflow& workflow) {
    if (workflow.records) workflow.records->remove(workflow_id);
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(workflow_id);
    finished_[workflow_id] = workflow.scheduler->status();
}

// --- 查询 / 维护 ---

std::optional<WorkflowStatus> WorkflowEngine::status(const WorkflowId& workflow_id) const {
    std::shared_ptr<ActiveWorkflow> workflow;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(workflow_id);
        if (it != active_.end()) {
            workflow = it->second;
        } else {
            auto done = finished_.find(workflow_id);
            if (done != finished_.end()) return done->second;
        }
    }
    if (workflow) {
        std::lock_guard<std::mutex> run_lock(workflow->run_mutex);
        return workflow->scheduler->status();
    }
    // 记录仍在: 可恢复
    std::shared_ptr<WorkflowRecordStore> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records = records_;
    }
    if (records && records->get_record(workflow_id)) return WorkflowStatus::RUNNING;
    return std::nullopt;
}

size_t WorkflowEngine::cleanup_expired() {
    std::shared_ptr<WorkflowRecordStore> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records = records_;
    }
    if (!records) return 0;
    size_t removed = records->cleanup_expired();

    // 记录过期的暂停工作流一并释放
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = active_.begin(); it != active_.end();) {
        auto& workflow = *it->second;
        std::unique_lock<std::mutex> run_lock(workflow.run_mutex, std::try_to_lock);
        if (run_lock.owns_lock() && workflow.scheduler->status() == WorkflowStatus::PAUSED_FOR_APPROVAL &&
            workflow.records && !workflow.records->get_record(it->first)) {
            workflow.scheduler->abort("Workflow expired while awaiting approval");
            finished_[it->first] = WorkflowStatus::ABORTED;
            run_lock.unlock();
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        Logger::info(kComponent, "Removed " + std::to_string(removed) + " expired workflow records");
    }
    return removed;
}

void WorkflowEngine::reload_config(EngineConfig config) {
    auto current = config_.replace(std::move(config));
    Logger::set_level(log_level_from_string(current->log_level));
    router_.reload(std::make_shared<const RoutingConfig>(current->routing));
    // 运行中的调度器在下一步边界取新配置
}

void WorkflowEngine::reload_config_file() {
    if (!config_source_) {
        throw ConfigurationError("Engine was not created from a config file");
    }
    reload_config(load_engine_config(*config_source_));
}

} // namespace agentflow
