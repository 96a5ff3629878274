// modules/store/checkpoint_store.h
#ifndef AGENTFLOW_MODULES_STORE_CHECKPOINT_STORE_H
#define AGENTFLOW_MODULES_STORE_CHECKPOINT_STORE_H

#include "modules/state/workflow_state.h"
#include "modules/store/workflow_record_store.h" // 引入 Clock, JSON 文件工具
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// Snapshot taken after a layer completes
struct Checkpoint {
    std::string id;
    WorkflowId workflow_id;
    int layer = 0;
    WorkflowState state;
    DAGStructure dag;
    std::vector<TaskId> skipped; // 条件不满足 / skip_layer 跳过的任务
    TimePoint created_at{};
    uint64_t sequence = 0;       // 同一毫秒内的先后
    Value metadata = Value::object(); // 调度选项 (intent, per-layer validation, replans)
};

Value checkpoint_to_json(const Checkpoint& checkpoint);
Checkpoint checkpoint_from_json(const Value& json);

std::string generate_checkpoint_id();

class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    virtual Checkpoint save(const WorkflowId& workflow_id, int layer, const WorkflowState& state,
                            const DAGStructure& dag, const std::vector<TaskId>& skipped,
                            const Value& metadata) = 0;
    virtual std::optional<Checkpoint> load(const std::string& checkpoint_id) = 0;
    // Most recently saved checkpoint of a workflow
    virtual std::optional<Checkpoint> latest(const WorkflowId& workflow_id) = 0;
    // Keeps the newest `keep`; returns how many were deleted
    virtual size_t prune(const WorkflowId& workflow_id, size_t keep) = 0;
    virtual size_t remove_workflow(const WorkflowId& workflow_id) = 0;
};

class InMemoryCheckpointStore : public CheckpointStore {
public:
    explicit InMemoryCheckpointStore(Clock clock = system_clock()) : clock_(std::move(clock)) {}

    Checkpoint save(const WorkflowId& workflow_id, int layer, const WorkflowState& state,
                    const DAGStructure& dag, const std::vector<TaskId>& skipped,
                    const Value& metadata) override;
    std::optional<Checkpoint> load(const std::string& checkpoint_id) override;
    std::optional<Checkpoint> latest(const WorkflowId& workflow_id) override;
    size_t prune(const WorkflowId& workflow_id, size_t keep) override;
    size_t remove_workflow(const WorkflowId& workflow_id) override;

    size_t size() const;

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<Checkpoint> checkpoints_; // 按保存顺序
    uint64_t next_sequence_ = 1;
};

// <directory>/<checkpoint_id>.json
class FileCheckpointStore : public CheckpointStore {
public:
    explicit FileCheckpointStore(std::filesystem::path directory, Clock clock = system_clock());

    Checkpoint save(const WorkflowId& workflow_id, int layer, const WorkflowState& state,
                    const DAGStructure& dag, const std::vector<TaskId>& skipped,
                    const Value& metadata) override;
    std::optional<Checkpoint> load(const std::string& checkpoint_id) override;
    std::optional<Checkpoint> latest(const WorkflowId& workflow_id) override;
    size_t prune(const WorkflowId& workflow_id, size_t keep) override;
    size_t remove_workflow(const WorkflowId& workflow_id) override;

private:
    std::vector<Checkpoint> list_locked(const WorkflowId& workflow_id) const;
    std::filesystem::path path_for(const std::string& checkpoint_id) const;

    std::filesystem::path directory_;
    Clock clock_;
    mutable std::mutex mutex_;
    uint64_t next_sequence_ = 1;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_STORE_CHECKPOINT_STORE_H
