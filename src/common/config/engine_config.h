// common/config/engine_config.h
#ifndef AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
#define AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H

#include "core/types/context.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

enum class ApprovalMode : uint8_t { ALWAYS, CRITICAL_ONLY, NEVER };
enum class DecisionPointMode : uint8_t { PER_LAYER, ON_ERROR, MANUAL };

std::string to_string(ApprovalMode mode);
std::string to_string(DecisionPointMode mode);

struct SchedulerSettings {
    size_t max_concurrency = 0;        // 0 = 整层并发
    int max_replans = 3;
    size_t checkpoint_retention = 5;
    int safe_task_max_retries = 3;
    int64_t retry_backoff_ms = 100;    // 每次重试翻倍
};

struct HilSettings {
    bool enabled = false;
    ApprovalMode approval_required = ApprovalMode::NEVER;
};

struct AilSettings {
    bool enabled = false;
    DecisionPointMode decision_points = DecisionPointMode::PER_LAYER;
};

struct TimeoutSettings {
    int64_t hil_ms = 300000;
    int64_t ail_ms = 60000;
};

struct SandboxDefaults {
    int64_t timeout_ms = 30000;
    int64_t memory_limit_mb = 512;
    std::vector<std::string> allowed_read_paths;
};

struct RoutingConfig {
    uint64_t version = 1;
    std::vector<std::string> cloud_servers;
};

struct StoreSettings {
    int64_t record_ttl_seconds = 3600;
    std::optional<std::string> directory; // 未设置 = 内存存储
};

// Versioned snapshot; components hold shared_ptr<const EngineConfig>
struct EngineConfig {
    uint64_t version = 1;
    SchedulerSettings scheduler;
    HilSettings hil;
    AilSettings ail;
    TimeoutSettings timeouts;
    SandboxDefaults sandbox;
    RoutingConfig routing;
    StoreSettings store;
    std::string log_level = "info";

    // Throws ConfigurationError on out-of-range values
    void validate() const;
};

EngineConfig engine_config_from_json(const Value& json);
Value engine_config_to_json(const EngineConfig& config);
// .yaml / .yml / .json
EngineConfig load_engine_config(const std::string& path);

// Holds the current snapshot; replace() bumps the version
class ConfigHolder {
public:
    explicit ConfigHolder(EngineConfig config = {});

    std::shared_ptr<const EngineConfig> current() const;
    std::shared_ptr<const EngineConfig> replace(EngineConfig config);
    // Re-reads the file the holder was last loaded from
    std::shared_ptr<const EngineConfig> reload();
    std::shared_ptr<const EngineConfig> load_from_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const EngineConfig> current_;
    std::optional<std::string> source_path_;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
