// modules/store/workflow_record_store.cpp
#include "modules/store/workflow_record_store.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace agentflow {

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

Value workflow_record_to_json(const WorkflowRecord& record) {
    Value j;
    j["workflow_id"] = record.workflow_id;
    j["dag"] = dag_to_json(record.dag);
    j["intent"] = record.intent ? Value(*record.intent) : Value();
    j["created_at"] = to_epoch_ms(record.created_at);
    j["expires_at"] = to_epoch_ms(record.expires_at);
    return j;
}

WorkflowRecord workflow_record_from_json(const Value& j) {
    WorkflowRecord record;
    record.workflow_id = j.at("workflow_id").get<std::string>();
    record.dag = dag_from_json(j.at("dag"));
    if (j.contains("intent") && j["intent"].is_string()) record.intent = j["intent"].get<std::string>();
    record.created_at = from_epoch_ms(j.at("created_at").get<int64_t>());
    record.expires_at = from_epoch_ms(j.at("expires_at").get<int64_t>());
    return record;
}

std::string encode_file_stem(const std::string& id) {
    // [A-Za-z0-9-] 原样保留, 其余字节 (含 '%') 编码为 %XX, 不同 id 不会映射到同一文件
    static constexpr char kHex[] = "0123456789ABCDEF";
    if (id.empty()) return "%";
    std::string stem;
    stem.reserve(id.size());
    for (char c : id) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-') {
            stem += c;
        } else {
            stem += '%';
            stem += kHex[byte >> 4];
            stem += kHex[byte & 0x0F];
        }
    }
    return stem;
}

Value read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return Value::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Corrupt JSON in " + path.string() + ": " + e.what());
    }
}

void write_json_file(const std::filesystem::path& path, const Value& json) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write " + tmp.string());
        }
        file << json.dump(2);
        if (!file) {
            throw std::runtime_error("Failed writing " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

// --- InMemoryWorkflowRecordStore ---

InMemoryWorkflowRecordStore::InMemoryWorkflowRecordStore(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

void InMemoryWorkflowRecordStore::save(const WorkflowId& id, const DAGStructure& dag,
                                       const std::optional<std::string>& intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    auto it = records_.find(id);
    WorkflowRecord record;
    record.workflow_id = id;
    record.dag = dag;
    record.intent = intent;
    record.created_at = (it != records_.end()) ? it->second.created_at : now;
    record.expires_at = now + ttl_;
    records_[id] = std::move(record);
    Logger::debug("record_store", "Saved workflow " + id);
}

std::optional<DAGStructure> InMemoryWorkflowRecordStore::get(const WorkflowId& id) {
    auto record = get_record(id);
    if (!record) return std::nullopt;
    return std::move(record->dag);
}

std::optional<WorkflowRecord> InMemoryWorkflowRecordStore::get_record(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.expires_at <= clock_()) return std::nullopt;
    return it->second;
}

void InMemoryWorkflowRecordStore::update(const WorkflowId& id, const DAGStructure& dag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.expires_at <= clock_()) {
        throw RecordNotFoundError("Workflow " + id + " not found");
    }
    it->second.dag = dag;
}

bool InMemoryWorkflowRecordStore::extend_expiration(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    auto it = records_.find(id);
    if (it == records_.end() || it->second.expires_at <= now) return false;
    it->second.expires_at = now + ttl_;
    return true;
}

bool InMemoryWorkflowRecordStore::remove(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) > 0;
}

size_t InMemoryWorkflowRecordStore::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.expires_at <= now) {
            it = records_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) Logger::info("record_store", "Cleaned up " + std::to_string(removed) + " expired workflows");
    return removed;
}

size_t InMemoryWorkflowRecordStore::physical_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// --- FileWorkflowRecordStore ---

FileWorkflowRecordStore::FileWorkflowRecordStore(std::filesystem::path directory, std::chrono::seconds ttl, Clock clock)
    : directory_(std::move(directory)), ttl_(ttl), clock_(std::move(clock)) {
    std::filesystem::create_directories(directory_);
}

std::filesystem::path FileWorkflowRecordStore::path_for(const WorkflowId& id) const {
    return directory_ / (encode_file_stem(id) + ".json");
}

std::optional<WorkflowRecord> FileWorkflowRecordStore::read_locked(const WorkflowId& id) const {
    auto path = path_for(id);
    if (!std::filesystem::exists(path)) return std::nullopt;
    auto record = workflow_record_from_json(read_json_file(path));
    if (record.workflow_id != id) {
        throw StateInvariantError("Record file " + path.string() + " holds workflow " + record.workflow_id +
                                  ", expected " + id);
    }
    return record;
}

void FileWorkflowRecordStore::write_locked(const WorkflowRecord& record) const {
    write_json_file(path_for(record.workflow_id), workflow_record_to_json(record));
}

void FileWorkflowRecordStore::save(const WorkflowId& id, const DAGStructure& dag,
                                   const std::optional<std::string>& intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    auto existing = read_locked(id);
    WorkflowRecord record;
    record.workflow_id = id;
    record.dag = dag;
    record.intent = intent;
    record.created_at = existing ? existing->created_at : now;
    record.expires_at = now + ttl_;
    write_locked(record);
    Logger::debug("record_store", "Saved workflow " + id + " to " + path_for(id).string());
}

std::optional<DAGStructure> FileWorkflowRecordStore::get(const WorkflowId& id) {
    auto record = get_record(id);
    if (!record) return std::nullopt;
    return std::move(record->dag);
}

std::optional<WorkflowRecord> FileWorkflowRecordStore::get_record(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = read_locked(id);
    if (!record || record->expires_at <= clock_()) return std::nullopt;
    return record;
}

void FileWorkflowRecordStore::update(const WorkflowId& id, const DAGStructure& dag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = read_locked(id);
    if (!record || record->expires_at <= clock_()) {
        throw RecordNotFoundError("Workflow " + id + " not found");
    }
    record->dag = dag;
    write_locked(*record);
}

bool FileWorkflowRecordStore::extend_expiration(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    auto record = read_locked(id);
    if (!record || record->expires_at <= now) return false;
    record->expires_at = now + ttl_;
    write_locked(*record);
    return true;
}

bool FileWorkflowRecordStore::remove(const WorkflowId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!read_locked(id)) return false; // 校验文件中的 workflow_id
    return std::filesystem::remove(path_for(id));
}

size_t FileWorkflowRecordStore::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    std::vector<std::filesystem::path> expired;
    for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            auto record = workflow_record_from_json(read_json_file(entry.path()));
            if (record.expires_at <= now) expired.push_back(entry.path());
        } catch (const std::exception& e) {
            Logger::warning("record_store", "Skipping unreadable record " + entry.path().string() + ": " + e.what());
        }
    }
    size_t removed = 0;
    for (const auto& path : expired) {
        if (std::filesystem::remove(path)) removed++;
    }
    if (removed > 0) Logger::info("record_store", "Cleaned up " + std::to_string(removed) + " expired workflows");
    return removed;
}

size_t FileWorkflowRecordStore::physical_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") count++;
    }
    return count;
}

} // namespace agentflow
