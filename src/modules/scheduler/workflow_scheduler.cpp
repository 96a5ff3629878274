// modules/scheduler/workflow_scheduler.cpp
#include "modules/scheduler/workflow_scheduler.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <algorithm>
#include <exception>
#include <future>
#include <sstream>
#include <type_traits>
#include <variant>

namespace agentflow {

namespace {

constexpr const char* kComponent = "scheduler";
constexpr size_t kPreviewLimit = 5;
constexpr size_t kOutputPreviewChars = 200;

std::string join_ids(const std::vector<TaskId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    return out;
}

std::string preview(const Value& value) {
    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    if (text.size() > kOutputPreviewChars) {
        text = text.substr(0, kOutputPreviewChars) + "...";
    }
    return text;
}

} // namespace

std::string to_string(WorkflowStatus status) {
    switch (status) {
    case WorkflowStatus::CREATED: return "created";
    case WorkflowStatus::RUNNING: return "running";
    case WorkflowStatus::PAUSED_FOR_APPROVAL: return "paused_for_approval";
    case WorkflowStatus::COMPLETE: return "complete";
    case WorkflowStatus::ABORTED: return "aborted";
    }
    return "unknown";
}

std::string to_string(StepKind kind) {
    switch (kind) {
    case StepKind::PAUSED: return "paused";
    case StepKind::AWAITING_APPROVAL: return "awaiting_approval";
    case StepKind::COMPLETED: return "completed";
    case StepKind::ABORTED: return "aborted";
    }
    return "unknown";
}

Value workflow_summary_to_json(const WorkflowSummary& summary) {
    return Value{
        {"layersExecuted", summary.layers_executed},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"failedSafe", summary.failed_safe},
        {"skipped", summary.skipped},
        {"pending", summary.pending},
        {"replans", summary.replans},
    };
}

WorkflowScheduler::WorkflowScheduler(WorkflowId workflow_id, std::shared_ptr<const EngineConfig> config,
                                     SchedulerCollaborators collaborators)
    : workflow_id_(std::move(workflow_id)),
      config_(config ? std::move(config) : std::make_shared<const EngineConfig>()),
      collaborators_(collaborators),
      executor_(collaborators.executors, config_),
      commands_(std::make_shared<CommandQueue>()),
      state_(create_initial_state(workflow_id_)) {}

void WorkflowScheduler::set_config(std::shared_ptr<const EngineConfig> config) {
    if (!config) return;
    config_ = std::move(config);
    executor_.set_config(config_);
}

// --- 生命周期 ---

void WorkflowScheduler::start(DAGStructure dag, StartOptions options) {
    if (status_ != WorkflowStatus::CREATED) {
        throw StateInvariantError("Workflow " + workflow_id_ + " has already been started");
    }
    dag.validate();
    auto layers = compute_topological_layers(dag); // 环检测

    dag_ = std::move(dag);
    options_ = std::move(options);
    state_ = create_initial_state(workflow_id_, options_.context);
    if (options_.intent) {
        StateUpdate update;
        update.messages.push_back(Message{"user", *options_.intent, now(), Value::object()});
        state_ = update_state(state_, update);
    }
    status_ = WorkflowStatus::RUNNING;

    Logger::info(kComponent, "Workflow " + workflow_id_ + " started: " + std::to_string(dag_.size()) +
                                 " tasks in " + std::to_string(layers.size()) + " static layers");
    trace(TraceEventType::WORKFLOW_START, std::nullopt, std::nullopt,
          Value{{"taskCount", dag_.size()}, {"staticLayers", layers.size()},
                {"perLayerValidation", options_.per_layer_validation}});
}

void WorkflowScheduler::resume_from_checkpoint(DAGStructure dag, const std::string& checkpoint_id) {
    if (!collaborators_.checkpoints) {
        throw ConfigurationError("Resuming from a checkpoint requires a checkpoint store");
    }
    auto checkpoint = collaborators_.checkpoints->load(checkpoint_id);
    if (!checkpoint) {
        throw CheckpointNotFoundError("Checkpoint " + checkpoint_id + " not found");
    }
    if (checkpoint->workflow_id != workflow_id_) {
        throw CheckpointNotFoundError("Checkpoint " + checkpoint_id + " not found for workflow " + workflow_id_);
    }
    dag.validate();
    compute_topological_layers(dag);
    restore(*checkpoint, std::move(dag));
}

void WorkflowScheduler::resume_from_checkpoint(const Checkpoint& checkpoint) {
    if (checkpoint.workflow_id != workflow_id_) {
        throw CheckpointNotFoundError("Checkpoint " + checkpoint.id + " not found for workflow " + workflow_id_);
    }
    restore(checkpoint, checkpoint.dag);
}

void WorkflowScheduler::restore(const Checkpoint& checkpoint, DAGStructure dag) {
    dag_ = std::move(dag);
    state_ = checkpoint.state;
    results_.clear();
    for (const auto& result : state_.tasks) {
        results_[result.task_id] = result; // 后写覆盖 (重试 / 重放)
    }
    skipped_.clear();
    skipped_order_.clear();
    for (const auto& id : checkpoint.skipped) {
        if (skipped_.insert(id).second) skipped_order_.push_back(id);
    }
    next_layer_ = checkpoint.layer + 1;
    layers_executed_ = checkpoint.layer + 1;
    skip_layers_.clear();

    const auto& meta = checkpoint.metadata;
    if (meta.is_object()) {
        if (meta.contains("intent") && meta["intent"].is_string()) {
            options_.intent = meta["intent"].get<std::string>();
        }
        options_.per_layer_validation = meta.value("perLayerValidation", options_.per_layer_validation);
        replans_ = meta.value("replans", replans_);
    }
    options_.context = state_.context;

    status_ = WorkflowStatus::RUNNING;
    pending_checkpoint_id_.reset();
    abort_reason_.clear();
    Logger::info(kComponent, "Workflow " + workflow_id_ + " restored from checkpoint " + checkpoint.id +
                                 " (layer " + std::to_string(checkpoint.layer) + ")");
}

void WorkflowScheduler::mark_awaiting_approval(const std::string& checkpoint_id) {
    if (status_ != WorkflowStatus::RUNNING) {
        throw StateInvariantError("Workflow " + workflow_id_ + " cannot await approval while " + to_string(status_));
    }
    status_ = WorkflowStatus::PAUSED_FOR_APPROVAL;
    pending_checkpoint_id_ = checkpoint_id;
}

bool WorkflowScheduler::wait_for_command(std::chrono::milliseconds timeout) {
    auto command = commands_->wait_for_command(timeout);
    if (!command) return false;
    deferred_.push_back(std::move(*command));
    return true;
}

// --- 单步 ---

StepOutcome WorkflowScheduler::step() {
    StepOutcome outcome;
    if (status_ == WorkflowStatus::CREATED) {
        throw StateInvariantError("Workflow " + workflow_id_ + " has not been started");
    }
    if (status_ == WorkflowStatus::COMPLETE) {
        outcome.kind = StepKind::COMPLETED;
        return outcome;
    }
    if (status_ == WorkflowStatus::ABORTED) {
        outcome.kind = StepKind::ABORTED;
        outcome.reason = abort_reason_;
        return outcome;
    }

    command_rejected_ = false;
    apply_commands();

    if (status_ == WorkflowStatus::ABORTED) {
        outcome.kind = StepKind::ABORTED;
        outcome.reason = abort_reason_;
        return outcome;
    }
    if (status_ == WorkflowStatus::PAUSED_FOR_APPROVAL) {
        outcome.kind = StepKind::AWAITING_APPROVAL;
        outcome.checkpoint_id = pending_checkpoint_id_;
        outcome.reason = "Waiting for approval";
        return outcome;
    }

    const int layer = next_layer_;
    LayerPlan next = plan();
    for (const auto& [id, reason] : next.newly_skipped) {
        mark_skipped(id, reason, layer);
    }

    if (next.complete) {
        status_ = WorkflowStatus::COMPLETE;
        auto stats = summary();
        Logger::info(kComponent, "Workflow " + workflow_id_ + " complete after " +
                                     std::to_string(stats.layers_executed) + " layers");
        trace(TraceEventType::WORKFLOW_COMPLETE, std::nullopt, std::nullopt, workflow_summary_to_json(stats));
        outcome.kind = StepKind::COMPLETED;
        return outcome;
    }

    if (next.eligible.empty()) {
        if (next.waiting.empty()) {
            abort("Workflow halted: tasks blocked by failed dependencies: [" + join_ids(next.blocked) + "]");
            outcome.kind = StepKind::ABORTED;
            outcome.reason = abort_reason_;
            return outcome;
        }
        std::vector<TaskId> remaining = next.waiting;
        remaining.insert(remaining.end(), next.blocked.begin(), next.blocked.end());
        throw CycleDetectedError("Circular dependency detected in DAG. Remaining tasks: " + join_ids(remaining));
    }

    // skip_layer: 该层的可执行任务整体跳过
    auto skip = skip_layers_.find(layer);
    if (skip != skip_layers_.end()) {
        std::string reason = "Layer " + std::to_string(layer) + " skipped: " + skip->second;
        for (const auto& id : next.eligible) {
            mark_skipped(id, reason, layer);
        }
        skip_layers_.erase(skip);
        next_layer_ = layer + 1;

        StateUpdate update;
        update.current_layer = layer;
        update.messages.push_back(Message{"system", reason, now(), Value{{"layer", layer}}});
        state_ = update_state(state_, update);

        auto checkpoint = save_checkpoint(layer);
        outcome.kind = StepKind::PAUSED;
        outcome.layer = layer;
        outcome.reason = reason;
        if (checkpoint) outcome.checkpoint_id = checkpoint->id;
        return outcome;
    }

    Value layer_payload{{"tasks", next.eligible}};
    if (collaborators_.router) {
        Value routing = Value::object();
        for (const auto& id : next.eligible) {
            routing[id] = to_string(collaborators_.router->resolve_routing(*dag_.find(id)));
        }
        layer_payload["routing"] = routing;
    }
    trace(TraceEventType::LAYER_START, layer, std::nullopt, layer_payload);
    Logger::debug(kComponent, "Layer " + std::to_string(layer) + ": " + join_ids(next.eligible));

    auto layer_results = execute_layer(layer, next.eligible);

    StateUpdate update;
    update.current_layer = layer;
    update.tasks = layer_results;
    state_ = update_state(state_, update);
    for (const auto& result : layer_results) {
        results_[result.task_id] = result;
    }
    next_layer_ = layer + 1;
    layers_executed_++;

    auto checkpoint = save_checkpoint(layer);

    outcome.kind = StepKind::PAUSED;
    outcome.layer = layer;
    outcome.task_ids = next.eligible;
    outcome.layer_results = layer_results;
    if (checkpoint) outcome.checkpoint_id = checkpoint->id;

    if (approval_required(next.eligible)) {
        status_ = WorkflowStatus::PAUSED_FOR_APPROVAL;
        pending_checkpoint_id_ = checkpoint ? checkpoint->id : "layer-" + std::to_string(layer);
        outcome.kind = StepKind::AWAITING_APPROVAL;
        outcome.checkpoint_id = pending_checkpoint_id_;
        outcome.summary = build_approval_summary(layer, layer_results);
        trace(TraceEventType::DECISION_REQUIRED, layer, std::nullopt,
              Value{{"type", "hil"}, {"checkpointId", *pending_checkpoint_id_}});
        sync_record();
        Logger::info(kComponent, "Workflow " + workflow_id_ + " paused for approval after layer " +
                                     std::to_string(layer));
        return outcome;
    }

    if (decision_point(layer_results)) {
        outcome.decision_required = true;
        StateUpdate note;
        note.messages.push_back(Message{"system", "Decision point after layer " + std::to_string(layer), now(),
                                        Value{{"layer", layer}, {"type", "ail"}}});
        state_ = update_state(state_, note);
        trace(TraceEventType::DECISION_REQUIRED, layer, std::nullopt,
              Value{{"type", "ail"}, {"checkpointId", outcome.checkpoint_id ? Value(*outcome.checkpoint_id) : Value()}});
    }
    return outcome;
}

LayerPlan WorkflowScheduler::plan() const {
    return plan_next_layer(dag_, results_, skipped_,
                           [this](const std::string& node_id) { return recorded_outcome(node_id); });
}

std::optional<std::string> WorkflowScheduler::recorded_outcome(const std::string& decision_node_id) const {
    for (auto it = state_.decisions.rbegin(); it != state_.decisions.rend(); ++it) {
        if (it->metadata.is_object() && it->metadata.value("decision_node_id", "") == decision_node_id) {
            return it->outcome;
        }
    }
    const auto& context = state_.context;
    if (context.is_object() && context.contains("decisions") && context["decisions"].is_object()) {
        const auto& decisions = context["decisions"];
        auto found = decisions.find(decision_node_id);
        if (found != decisions.end()) {
            if (found->is_string()) return found->get<std::string>();
            if (found->is_boolean()) return found->get<bool>() ? "true" : "false";
            return found->dump();
        }
    }
    return std::nullopt;
}

void WorkflowScheduler::mark_skipped(const TaskId& task_id, const std::string& reason, int layer) {
    if (!skipped_.insert(task_id).second) return;
    skipped_order_.push_back(task_id);
    Logger::debug(kComponent, "Task " + task_id + " skipped: " + reason);
    trace(TraceEventType::TASK_SKIPPED, layer, task_id, Value{{"reason", reason}});
}

std::vector<TaskResult> WorkflowScheduler::execute_layer(int layer, const std::vector<TaskId>& task_ids) {
    // 层内任务只读共享快照
    const ResultMap snapshot = results_;
    const Context context = state_.context;
    TraceExporter* tracer = collaborators_.trace;
    const WorkflowId workflow_id = workflow_id_;

    size_t batch_size = config_->scheduler.max_concurrency;
    if (batch_size == 0) batch_size = task_ids.size();

    std::vector<TaskResult> layer_results;
    layer_results.reserve(task_ids.size());
    std::exception_ptr configuration_failure;

    for (size_t begin = 0; begin < task_ids.size(); begin += batch_size) {
        size_t end = std::min(task_ids.size(), begin + batch_size);
        std::vector<std::future<TaskResult>> futures;
        futures.reserve(end - begin);

        for (size_t i = begin; i < end; ++i) {
            const Task* found = dag_.find(task_ids[i]);
            if (!found) {
                throw StateInvariantError("Task " + task_ids[i] + " disappeared from the DAG");
            }
            Task task = *found;
            futures.push_back(std::async(std::launch::async, [this, task, layer, &snapshot, &context, tracer,
                                                              workflow_id]() {
                if (tracer) tracer->on_task_start(workflow_id, layer, task.id, task.tool_label());
                TaskResult result;
                try {
                    result = executor_.execute(task, snapshot, context);
                } catch (const ConfigurationError&) {
                    throw;
                } catch (const std::exception& e) {
                    result.task_id = task.id;
                    result.status = is_safe_to_fail(task) ? TaskStatus::FAILED_SAFE : TaskStatus::ERROR;
                    result.error = e.what();
                }
                if (tracer) {
                    tracer->on_task_end(workflow_id, layer, task.id, to_string(result.status), result.error,
                                        result.elapsed_ms);
                }
                return result;
            }));
        }

        // 等待整批结束后再抛出配置错误
        for (auto& future : futures) {
            try {
                layer_results.push_back(future.get());
            } catch (const ConfigurationError&) {
                if (!configuration_failure) configuration_failure = std::current_exception();
            }
        }
        if (configuration_failure) std::rethrow_exception(configuration_failure);
    }

    for (const auto& result : layer_results) {
        if (result.status == TaskStatus::ERROR) {
            Logger::error(kComponent, "Task " + result.task_id + " failed: " + result.error.value_or("unknown error"));
        } else if (result.status == TaskStatus::FAILED_SAFE) {
            Logger::warning(kComponent, "Task " + result.task_id + " failed safely: " +
                                            result.error.value_or("unknown error"));
        }
    }
    return layer_results;
}

std::optional<Checkpoint> WorkflowScheduler::save_checkpoint(int layer) {
    if (!collaborators_.checkpoints) {
        Logger::debug(kComponent, "No checkpoint store configured; layer " + std::to_string(layer) + " not persisted");
        return std::nullopt;
    }
    auto checkpoint = collaborators_.checkpoints->save(workflow_id_, layer, state_, dag_, skipped_order_,
                                                       scheduler_metadata());
    size_t retention = config_->scheduler.checkpoint_retention;
    if (retention > 0) {
        collaborators_.checkpoints->prune(workflow_id_, retention);
    }
    trace(TraceEventType::CHECKPOINT, layer, std::nullopt, Value{{"checkpointId", checkpoint.id}});
    return checkpoint;
}

bool WorkflowScheduler::approval_required(const std::vector<TaskId>& task_ids) const {
    ApprovalMode mode = ApprovalMode::NEVER;
    if (options_.per_layer_validation) {
        mode = ApprovalMode::ALWAYS;
    } else if (config_->hil.enabled) {
        mode = config_->hil.approval_required;
    }

    switch (mode) {
    case ApprovalMode::ALWAYS:
        return true;
    case ApprovalMode::NEVER:
        return false;
    case ApprovalMode::CRITICAL_ONLY:
        return std::any_of(task_ids.begin(), task_ids.end(), [this](const TaskId& id) {
            const Task* task = dag_.find(id);
            return task && task->side_effects;
        });
    }
    return false;
}

bool WorkflowScheduler::decision_point(const std::vector<TaskResult>& layer_results) const {
    if (!config_->ail.enabled) return false;
    switch (config_->ail.decision_points) {
    case DecisionPointMode::PER_LAYER:
        return true;
    case DecisionPointMode::ON_ERROR:
        return std::any_of(layer_results.begin(), layer_results.end(),
                           [](const TaskResult& r) { return r.status != TaskStatus::SUCCESS; });
    case DecisionPointMode::MANUAL:
        return false;
    }
    return false;
}

std::string WorkflowScheduler::build_approval_summary(int layer, const std::vector<TaskResult>& layer_results) const {
    auto counts = summarize_state(state_);
    std::ostringstream oss;
    oss << "## Workflow " << workflow_id_ << ": layer " << layer << " completed\n";
    oss << "Completed: " << counts.succeeded << ", failed: " << counts.failed
        << ", failed_safe: " << counts.failed_safe << ", skipped: " << skipped_.size() << "\n";

    oss << "\n## Layer " << layer << " Results\n";
    for (const auto& result : layer_results) {
        const Task* task = dag_.find(result.task_id);
        oss << "  - " << result.task_id << " (" << (task ? task->tool_label() : "?") << "): "
            << to_string(result.status);
        if (result.error) {
            oss << " - " << *result.error;
        } else if (result.output) {
            oss << " - " << preview(*result.output);
        }
        oss << "\n";
    }

    LayerPlan upcoming = plan();
    if (!upcoming.eligible.empty()) {
        oss << "\n## Next Layer Preview\n";
        oss << "The next layer contains " << upcoming.eligible.size() << " task(s):\n";
        for (size_t i = 0; i < upcoming.eligible.size() && i < kPreviewLimit; ++i) {
            const Task* task = dag_.find(upcoming.eligible[i]);
            oss << "  - " << upcoming.eligible[i] << " (" << (task ? task->tool_label() : "?") << ")";
            if (task && !task->depends_on.empty()) oss << " after " << join_ids(task->depends_on);
            oss << "\n";
        }
        if (upcoming.eligible.size() > kPreviewLimit) {
            oss << "  ... and " << (upcoming.eligible.size() - kPreviewLimit) << " more tasks\n";
        }
        oss << "\nApprove to continue execution?";
    } else {
        oss << "\n## Final Layer Reached\n";
        oss << "\nApprove to complete the workflow?";
    }
    return oss.str();
}

// --- 命令 ---

void WorkflowScheduler::apply_commands() {
    std::vector<Command> commands = std::move(deferred_);
    deferred_.clear();
    auto drained = commands_->process_commands();
    commands.insert(commands.end(), std::make_move_iterator(drained.begin()), std::make_move_iterator(drained.end()));

    // 单个命令失败不影响同批后续命令; 整批应用完后再抛出第一个错误
    std::exception_ptr first_failure;
    for (const auto& command : commands) {
        try {
            apply(command);
        } catch (const std::exception& e) {
            const std::string type = to_string(command_type(command));
            Logger::error(kComponent, "Rejected " + type + " command for workflow " + workflow_id_ + ": " + e.what());
            trace(TraceEventType::COMMAND, std::nullopt, std::nullopt,
                  Value{{"type", type}, {"rejected", true}, {"error", e.what()}});
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) {
        command_rejected_ = true;
        std::rethrow_exception(first_failure);
    }
}

void WorkflowScheduler::apply(const Command& command) {
    trace(TraceEventType::COMMAND, std::nullopt, std::nullopt, command_to_json(command));
    if (status_ == WorkflowStatus::ABORTED) {
        Logger::warning(kComponent, "Ignoring " + to_string(command_type(command)) + " command: workflow " +
                                        workflow_id_ + " already aborted");
        return;
    }

    std::visit([this](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, ContinueCommand>) {
            resume_running("continue" + (cmd.reason ? ": " + *cmd.reason : std::string{}));
        } else if constexpr (std::is_same_v<T, AbortCommand>) {
            abort("Workflow aborted by agent: " + cmd.reason);
        } else if constexpr (std::is_same_v<T, InjectTasksCommand>) {
            handle_inject(cmd);
        } else if constexpr (std::is_same_v<T, ReplanDagCommand>) {
            handle_replan(cmd);
        } else if constexpr (std::is_same_v<T, SkipLayerCommand>) {
            if (cmd.layer_index < next_layer_) {
                Logger::warning(kComponent, "skip_layer " + std::to_string(cmd.layer_index) +
                                                " ignored: layer already executed");
            } else {
                skip_layers_[cmd.layer_index] = cmd.reason;
            }
        } else if constexpr (std::is_same_v<T, ModifyArgsCommand>) {
            handle_modify_args(cmd.task_id, cmd.updates);
        } else if constexpr (std::is_same_v<T, CheckpointResponseCommand>) {
            handle_checkpoint_response(cmd);
        } else if constexpr (std::is_same_v<T, ApprovalResponseCommand>) {
            handle_approval(cmd);
        }
    }, command);
}

void WorkflowScheduler::resume_running(const std::string& source) {
    if (status_ != WorkflowStatus::PAUSED_FOR_APPROVAL) {
        Logger::debug(kComponent, "Workflow " + workflow_id_ + " already running (" + source + ")");
        return;
    }
    status_ = WorkflowStatus::RUNNING;
    pending_checkpoint_id_.reset();
    Logger::info(kComponent, "Workflow " + workflow_id_ + " resumed: " + source);
}

void WorkflowScheduler::handle_inject(const InjectTasksCommand& command) {
    if (command.tasks.empty()) return;
    DAGStructure augmented = dag_;
    augmented.add_tasks(command.tasks);
    compute_topological_layers(augmented);
    dag_ = std::move(augmented);

    StateUpdate update;
    update.messages.push_back(Message{"system", "Injected " + std::to_string(command.tasks.size()) + " tasks",
                                      now(), Value{{"targetLayer", command.target_layer}}});
    state_ = update_state(state_, update);
    sync_record();
}

void WorkflowScheduler::handle_replan(const ReplanDagCommand& command) {
    if (replans_ >= config_->scheduler.max_replans) {
        Logger::warning(kComponent, "Replan limit reached (" + std::to_string(config_->scheduler.max_replans) +
                                        "); ignoring replan_dag for workflow " + workflow_id_);
        return;
    }

    std::vector<Task> tasks = command.tasks;
    if (tasks.empty()) {
        if (collaborators_.replanner) {
            tasks = collaborators_.replanner->replan(dag_, state_, command.new_requirement, command.available_context);
        } else {
            Logger::warning(kComponent, "replan_dag carries no tasks and no replanner is configured");
        }
    }

    StateUpdate update;
    if (command.available_context.is_object() && !command.available_context.empty()) {
        update.context = command.available_context;
    }
    update.messages.push_back(Message{"user", "Replan: " + command.new_requirement, now(),
                                      Value{{"addedTasks", tasks.size()}}});

    if (!tasks.empty()) {
        DAGStructure augmented = dag_;
        augmented.add_tasks(tasks);
        compute_topological_layers(augmented);
        dag_ = std::move(augmented);
    }
    state_ = update_state(state_, update);
    replans_++;
    Logger::info(kComponent, "Workflow " + workflow_id_ + " replanned (+" + std::to_string(tasks.size()) + " tasks)");
    sync_record();
}

void WorkflowScheduler::handle_modify_args(const TaskId& task_id, const Value& updates) {
    Task* task = dag_.find(task_id);
    if (!task) {
        Logger::warning(kComponent, "modify_args: unknown task " + task_id);
        return;
    }
    if (results_.count(task_id) > 0 || skipped_.count(task_id) > 0) {
        Logger::warning(kComponent, "modify_args: task " + task_id + " already settled");
        return;
    }
    if (!updates.is_object()) return;
    if (!task->arguments.is_object()) task->arguments = Value::object();
    for (auto it = updates.begin(); it != updates.end(); ++it) {
        task->arguments[it.key()] = it.value();
    }
}

void WorkflowScheduler::handle_checkpoint_response(const CheckpointResponseCommand& command) {
    switch (command.decision) {
    case CheckpointDecision::CONTINUE:
        resume_running("checkpoint " + command.checkpoint_id);
        break;
    case CheckpointDecision::MODIFY:
        if (command.modifications.is_object()) {
            for (auto it = command.modifications.begin(); it != command.modifications.end(); ++it) {
                handle_modify_args(it.key(), it.value());
            }
        }
        resume_running("checkpoint " + command.checkpoint_id + " (modified)");
        break;
    case CheckpointDecision::ROLLBACK: {
        if (!collaborators_.checkpoints) {
            throw ConfigurationError("Rollback requires a checkpoint store");
        }
        auto checkpoint = collaborators_.checkpoints->load(command.checkpoint_id);
        if (!checkpoint || checkpoint->workflow_id != workflow_id_) {
            throw CheckpointNotFoundError("Checkpoint " + command.checkpoint_id + " not found");
        }
        restore(*checkpoint, checkpoint->dag);
        break;
    }
    }
}

void WorkflowScheduler::handle_approval(const ApprovalResponseCommand& command) {
    if (status_ != WorkflowStatus::PAUSED_FOR_APPROVAL) {
        Logger::warning(kComponent, "approval_response ignored: workflow " + workflow_id_ + " is not awaiting approval");
        return;
    }
    if (pending_checkpoint_id_ && command.checkpoint_id != *pending_checkpoint_id_) {
        Logger::warning(kComponent, "approval_response for " + command.checkpoint_id + " while waiting on " +
                                        *pending_checkpoint_id_);
    }

    Decision decision;
    decision.type = DecisionType::HIL;
    decision.timestamp = now();
    decision.description = "Approval after layer " + std::to_string(next_layer_ - 1);
    decision.outcome = command.approved ? "approved" : "rejected";
    decision.metadata = Value{{"checkpointId", command.checkpoint_id}};
    if (command.feedback) decision.metadata["feedback"] = *command.feedback;

    StateUpdate update;
    update.decisions.push_back(decision);
    state_ = update_state(state_, update);

    if (command.approved) {
        resume_running("approved");
    } else {
        abort("Workflow aborted by human: " + command.feedback.value_or("no reason provided"));
    }
}

void WorkflowScheduler::abort(const std::string& reason) {
    status_ = WorkflowStatus::ABORTED;
    abort_reason_ = reason;
    pending_checkpoint_id_.reset();
    Logger::warning(kComponent, "Workflow " + workflow_id_ + ": " + reason);
    trace(TraceEventType::WORKFLOW_ABORT, std::nullopt, std::nullopt, Value{{"reason", reason}});
}

// --- 辅助 ---

void WorkflowScheduler::sync_record() {
    auto* records = collaborators_.records;
    if (!records || !records->get_record(workflow_id_)) return;
    records->update(workflow_id_, dag_);
}

Value WorkflowScheduler::scheduler_metadata() const {
    Value meta = Value{{"perLayerValidation", options_.per_layer_validation}, {"replans", replans_}};
    if (options_.intent) meta["intent"] = *options_.intent;
    return meta;
}

void WorkflowScheduler::trace(TraceEventType type, std::optional<int> layer, std::optional<TaskId> task_id,
                              Value payload) {
    if (!collaborators_.trace) return;
    collaborators_.trace->emit(type, workflow_id_, layer, std::move(task_id), std::move(payload));
}

WorkflowSummary WorkflowScheduler::summary() const {
    WorkflowSummary stats;
    stats.layers_executed = layers_executed_;
    stats.replans = replans_;
    stats.skipped = skipped_.size();
    for (const auto& [id, result] : results_) {
        switch (result.status) {
        case TaskStatus::SUCCESS: stats.succeeded++; break;
        case TaskStatus::ERROR: stats.failed++; break;
        case TaskStatus::FAILED_SAFE: stats.failed_safe++; break;
        }
    }
    for (const auto& task : dag_.tasks()) {
        if (results_.count(task.id) == 0 && skipped_.count(task.id) == 0) stats.pending++;
    }
    return stats;
}

std::vector<TaskResult> WorkflowScheduler::latest_results() const {
    std::vector<TaskResult> out;
    std::unordered_set<TaskId> seen;
    for (auto it = state_.tasks.rbegin(); it != state_.tasks.rend(); ++it) {
        if (seen.insert(it->task_id).second) out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace agentflow
