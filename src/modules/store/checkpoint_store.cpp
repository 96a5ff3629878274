// modules/store/checkpoint_store.cpp
#include "modules/store/checkpoint_store.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentflow {

namespace {

bool newer(const Checkpoint& a, const Checkpoint& b) {
    return a.sequence > b.sequence;
}

} // namespace

std::string generate_checkpoint_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "ckpt-" << std::hex << std::setfill('0') << std::setw(16) << rng();
    return oss.str();
}

Value checkpoint_to_json(const Checkpoint& checkpoint) {
    return Value{
        {"id", checkpoint.id},
        {"workflowId", checkpoint.workflow_id},
        {"layer", checkpoint.layer},
        {"state", workflow_state_to_json(checkpoint.state)},
        {"dag", dag_to_json(checkpoint.dag)},
        {"skipped", checkpoint.skipped},
        {"createdAt", to_epoch_ms(checkpoint.created_at)},
        {"sequence", checkpoint.sequence},
        {"metadata", checkpoint.metadata},
    };
}

Checkpoint checkpoint_from_json(const Value& j) {
    Checkpoint checkpoint;
    checkpoint.id = j.at("id").get<std::string>();
    checkpoint.workflow_id = j.at("workflowId").get<std::string>();
    checkpoint.layer = j.at("layer").get<int>();
    checkpoint.state = workflow_state_from_json(j.at("state"));
    checkpoint.dag = dag_from_json(j.at("dag"));
    checkpoint.skipped = j.value("skipped", std::vector<TaskId>{});
    checkpoint.created_at = from_epoch_ms(j.at("createdAt").get<int64_t>());
    checkpoint.sequence = j.value("sequence", uint64_t{0});
    checkpoint.metadata = j.value("metadata", Value::object());
    return checkpoint;
}

// --- InMemoryCheckpointStore ---

Checkpoint InMemoryCheckpointStore::save(const WorkflowId& workflow_id, int layer, const WorkflowState& state,
                                         const DAGStructure& dag, const std::vector<TaskId>& skipped,
                                         const Value& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    Checkpoint checkpoint{generate_checkpoint_id(), workflow_id, layer, state, dag, skipped, clock_(), next_sequence_++, metadata};
    checkpoints_.push_back(checkpoint);
    return checkpoint;
}

std::optional<Checkpoint> InMemoryCheckpointStore::load(const std::string& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& checkpoint : checkpoints_) {
        if (checkpoint.id == checkpoint_id) return checkpoint;
    }
    return std::nullopt;
}

std::optional<Checkpoint> InMemoryCheckpointStore::latest(const WorkflowId& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = checkpoints_.rbegin(); it != checkpoints_.rend(); ++it) {
        if (it->workflow_id == workflow_id) return *it;
    }
    return std::nullopt;
}

size_t InMemoryCheckpointStore::prune(const WorkflowId& workflow_id, size_t keep) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t seen = 0;
    size_t removed = 0;
    // 从新到旧计数, 超出 keep 的删除
    for (auto it = checkpoints_.end(); it != checkpoints_.begin();) {
        --it;
        if (it->workflow_id != workflow_id) continue;
        if (++seen > keep) {
            it = checkpoints_.erase(it);
            removed++;
        }
    }
    return removed;
}

size_t InMemoryCheckpointStore::remove_workflow(const WorkflowId& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = checkpoints_.size();
    checkpoints_.erase(std::remove_if(checkpoints_.begin(), checkpoints_.end(),
                                      [&](const Checkpoint& c) { return c.workflow_id == workflow_id; }),
                       checkpoints_.end());
    return before - checkpoints_.size();
}

size_t InMemoryCheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.size();
}

// --- FileCheckpointStore ---

FileCheckpointStore::FileCheckpointStore(std::filesystem::path directory, Clock clock)
    : directory_(std::move(directory)), clock_(std::move(clock)) {
    std::filesystem::create_directories(directory_);
    // 继续已有文件的序号
    for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            auto json = read_json_file(entry.path());
            next_sequence_ = std::max(next_sequence_, json.value("sequence", uint64_t{0}) + 1);
        } catch (const std::exception& e) {
            Logger::warning("checkpoint_store", "Skipping unreadable checkpoint " + entry.path().string() + ": " + e.what());
        }
    }
}

std::filesystem::path FileCheckpointStore::path_for(const std::string& checkpoint_id) const {
    return directory_ / (encode_file_stem(checkpoint_id) + ".json");
}

Checkpoint FileCheckpointStore::save(const WorkflowId& workflow_id, int layer, const WorkflowState& state,
                                     const DAGStructure& dag, const std::vector<TaskId>& skipped,
                                         const Value& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    Checkpoint checkpoint{generate_checkpoint_id(), workflow_id, layer, state, dag, skipped, clock_(), next_sequence_++, metadata};
    write_json_file(path_for(checkpoint.id), checkpoint_to_json(checkpoint));
    return checkpoint;
}

std::optional<Checkpoint> FileCheckpointStore::load(const std::string& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = path_for(checkpoint_id);
    if (!std::filesystem::exists(path)) return std::nullopt;
    auto checkpoint = checkpoint_from_json(read_json_file(path));
    if (checkpoint.id != checkpoint_id) {
        throw StateInvariantError("Checkpoint file " + path.string() + " holds " + checkpoint.id +
                                  ", expected " + checkpoint_id);
    }
    return checkpoint;
}

std::vector<Checkpoint> FileCheckpointStore::list_locked(const WorkflowId& workflow_id) const {
    std::vector<Checkpoint> result;
    for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        auto json = read_json_file(entry.path());
        if (json.value("workflowId", "") != workflow_id) continue;
        result.push_back(checkpoint_from_json(json));
    }
    std::sort(result.begin(), result.end(), newer);
    return result;
}

std::optional<Checkpoint> FileCheckpointStore::latest(const WorkflowId& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto all = list_locked(workflow_id);
    if (all.empty()) return std::nullopt;
    return all.front();
}

size_t FileCheckpointStore::prune(const WorkflowId& workflow_id, size_t keep) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto all = list_locked(workflow_id);
    size_t removed = 0;
    for (size_t i = keep; i < all.size(); ++i) {
        if (std::filesystem::remove(path_for(all[i].id))) removed++;
    }
    return removed;
}

size_t FileCheckpointStore::remove_workflow(const WorkflowId& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (const auto& checkpoint : list_locked(workflow_id)) {
        if (std::filesystem::remove(path_for(checkpoint.id))) removed++;
    }
    return removed;
}

} // namespace agentflow
