// modules/store/workflow_record_store.h
#ifndef AGENTFLOW_MODULES_STORE_WORKFLOW_RECORD_STORE_H
#define AGENTFLOW_MODULES_STORE_WORKFLOW_RECORD_STORE_H

#include "core/types/context.h"
#include "core/types/task.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentflow {

using Clock = std::function<TimePoint()>;
Clock system_clock();

struct WorkflowRecord {
    WorkflowId workflow_id;
    DAGStructure dag;
    std::optional<std::string> intent;
    TimePoint created_at{};
    TimePoint expires_at{};
};

Value workflow_record_to_json(const WorkflowRecord& record);
WorkflowRecord workflow_record_from_json(const Value& json);

// Durable owner of a workflow's DAG across process restarts. Rolling TTL.
class WorkflowRecordStore {
public:
    virtual ~WorkflowRecordStore() = default;

    // Upsert; (re)starts the TTL
    virtual void save(const WorkflowId& id, const DAGStructure& dag, const std::optional<std::string>& intent = std::nullopt) = 0;
    // Expired records are invisible
    virtual std::optional<DAGStructure> get(const WorkflowId& id) = 0;
    virtual std::optional<WorkflowRecord> get_record(const WorkflowId& id) = 0;
    // Throws RecordNotFoundError; never creates
    virtual void update(const WorkflowId& id, const DAGStructure& dag) = 0;
    // Returns false when the record is absent or expired
    virtual bool extend_expiration(const WorkflowId& id) = 0;
    virtual bool remove(const WorkflowId& id) = 0;
    // Physically deletes expired records, returns how many
    virtual size_t cleanup_expired() = 0;
};

class InMemoryWorkflowRecordStore : public WorkflowRecordStore {
public:
    explicit InMemoryWorkflowRecordStore(std::chrono::seconds ttl = std::chrono::hours(1), Clock clock = system_clock());

    void save(const WorkflowId& id, const DAGStructure& dag, const std::optional<std::string>& intent = std::nullopt) override;
    std::optional<DAGStructure> get(const WorkflowId& id) override;
    std::optional<WorkflowRecord> get_record(const WorkflowId& id) override;
    void update(const WorkflowId& id, const DAGStructure& dag) override;
    bool extend_expiration(const WorkflowId& id) override;
    bool remove(const WorkflowId& id) override;
    size_t cleanup_expired() override;

    // Rows including expired ones not yet cleaned up
    size_t physical_size() const;

private:
    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<WorkflowId, WorkflowRecord> records_;
};

// 每个 workflow 一个 JSON 文件: <directory>/<workflow_id>.json
class FileWorkflowRecordStore : public WorkflowRecordStore {
public:
    explicit FileWorkflowRecordStore(std::filesystem::path directory,
                                     std::chrono::seconds ttl = std::chrono::hours(1),
                                     Clock clock = system_clock());

    void save(const WorkflowId& id, const DAGStructure& dag, const std::optional<std::string>& intent = std::nullopt) override;
    std::optional<DAGStructure> get(const WorkflowId& id) override;
    std::optional<WorkflowRecord> get_record(const WorkflowId& id) override;
    void update(const WorkflowId& id, const DAGStructure& dag) override;
    bool extend_expiration(const WorkflowId& id) override;
    bool remove(const WorkflowId& id) override;
    size_t cleanup_expired() override;

    size_t physical_size() const;

private:
    std::filesystem::path path_for(const WorkflowId& id) const;
    std::optional<WorkflowRecord> read_locked(const WorkflowId& id) const;
    void write_locked(const WorkflowRecord& record) const;

    std::filesystem::path directory_;
    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
};

// 文件名安全且可逆的 id 编码: "team/a" -> "team%2Fa"
std::string encode_file_stem(const std::string& id);
Value read_json_file(const std::filesystem::path& path);
// write to <path>.tmp then rename
void write_json_file(const std::filesystem::path& path, const Value& json);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_STORE_WORKFLOW_RECORD_STORE_H
