// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include "common/utils/logger.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace agentflow {

std::string to_string(ApprovalMode mode) {
    switch (mode) {
        case ApprovalMode::ALWAYS: return "always";
        case ApprovalMode::CRITICAL_ONLY: return "critical_only";
        case ApprovalMode::NEVER: return "never";
    }
    return "never";
}

std::string to_string(DecisionPointMode mode) {
    switch (mode) {
        case DecisionPointMode::PER_LAYER: return "per_layer";
        case DecisionPointMode::ON_ERROR: return "on_error";
        case DecisionPointMode::MANUAL: return "manual";
    }
    return "manual";
}

namespace {

ApprovalMode approval_mode_from_string(const std::string& name) {
    if (name == "always") return ApprovalMode::ALWAYS;
    if (name == "critical_only") return ApprovalMode::CRITICAL_ONLY;
    if (name == "never") return ApprovalMode::NEVER;
    throw ConfigurationError("hil.approval_required must be always|critical_only|never, got: " + name);
}

DecisionPointMode decision_points_from_string(const std::string& name) {
    if (name == "per_layer") return DecisionPointMode::PER_LAYER;
    if (name == "on_error") return DecisionPointMode::ON_ERROR;
    if (name == "manual") return DecisionPointMode::MANUAL;
    throw ConfigurationError("ail.decision_points must be per_layer|on_error|manual, got: " + name);
}

const Value& section(const Value& root, const char* name) {
    static const Value empty = Value::object();
    if (root.contains(name)) {
        if (!root[name].is_object()) {
            throw ConfigurationError(std::string("Config section '") + name + "' must be a mapping");
        }
        return root[name];
    }
    return empty;
}

template <typename T>
T read(const Value& obj, const char* key, T fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    try {
        return obj[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigurationError(std::string("Config key '") + key + "' has the wrong type: " + obj[key].dump());
    }
}

} // namespace

void EngineConfig::validate() const {
    if (scheduler.max_replans < 0) throw ConfigurationError("scheduler.max_replans must be >= 0");
    if (scheduler.safe_task_max_retries < 1) throw ConfigurationError("scheduler.safe_task_max_retries must be >= 1");
    if (scheduler.retry_backoff_ms < 0) throw ConfigurationError("scheduler.retry_backoff_ms must be >= 0");
    if (scheduler.checkpoint_retention < 1) throw ConfigurationError("scheduler.checkpoint_retention must be >= 1");
    if (timeouts.hil_ms <= 0 || timeouts.ail_ms <= 0) throw ConfigurationError("timeouts must be positive");
    if (sandbox.timeout_ms <= 0) throw ConfigurationError("sandbox.timeout_ms must be positive");
    if (sandbox.memory_limit_mb <= 0) throw ConfigurationError("sandbox.memory_limit_mb must be positive");
    if (store.record_ttl_seconds <= 0) throw ConfigurationError("store.record_ttl_seconds must be positive");
    try {
        log_level_from_string(log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
}

EngineConfig engine_config_from_json(const Value& json) {
    if (!json.is_object()) {
        throw ConfigurationError("Engine config must be a mapping");
    }
    EngineConfig cfg;
    cfg.version = read<uint64_t>(json, "version", cfg.version);
    cfg.log_level = read<std::string>(json, "log_level", cfg.log_level);

    const auto& sched = section(json, "scheduler");
    cfg.scheduler.max_concurrency = read<size_t>(sched, "max_concurrency", cfg.scheduler.max_concurrency);
    cfg.scheduler.max_replans = read<int>(sched, "max_replans", cfg.scheduler.max_replans);
    cfg.scheduler.checkpoint_retention = read<size_t>(sched, "checkpoint_retention", cfg.scheduler.checkpoint_retention);
    cfg.scheduler.safe_task_max_retries = read<int>(sched, "safe_task_max_retries", cfg.scheduler.safe_task_max_retries);
    cfg.scheduler.retry_backoff_ms = read<int64_t>(sched, "retry_backoff_ms", cfg.scheduler.retry_backoff_ms);

    const auto& hil = section(json, "hil");
    cfg.hil.enabled = read<bool>(hil, "enabled", cfg.hil.enabled);
    cfg.hil.approval_required = approval_mode_from_string(
        read<std::string>(hil, "approval_required", to_string(cfg.hil.approval_required)));

    const auto& ail = section(json, "ail");
    cfg.ail.enabled = read<bool>(ail, "enabled", cfg.ail.enabled);
    cfg.ail.decision_points = decision_points_from_string(
        read<std::string>(ail, "decision_points", to_string(cfg.ail.decision_points)));

    const auto& timeouts = section(json, "timeouts");
    cfg.timeouts.hil_ms = read<int64_t>(timeouts, "hil_ms", cfg.timeouts.hil_ms);
    cfg.timeouts.ail_ms = read<int64_t>(timeouts, "ail_ms", cfg.timeouts.ail_ms);

    const auto& sandbox = section(json, "sandbox");
    cfg.sandbox.timeout_ms = read<int64_t>(sandbox, "timeout_ms", cfg.sandbox.timeout_ms);
    cfg.sandbox.memory_limit_mb = read<int64_t>(sandbox, "memory_limit_mb", cfg.sandbox.memory_limit_mb);
    cfg.sandbox.allowed_read_paths = read<std::vector<std::string>>(sandbox, "allowed_read_paths", {});

    const auto& routing = section(json, "routing");
    cfg.routing.version = cfg.version;
    cfg.routing.cloud_servers = read<std::vector<std::string>>(routing, "cloud_servers", {});

    const auto& store = section(json, "store");
    cfg.store.record_ttl_seconds = read<int64_t>(store, "record_ttl_seconds", cfg.store.record_ttl_seconds);
    if (store.contains("directory") && store["directory"].is_string()) {
        cfg.store.directory = store["directory"].get<std::string>();
    }

    cfg.validate();
    return cfg;
}

Value engine_config_to_json(const EngineConfig& cfg) {
    Value j;
    j["version"] = cfg.version;
    j["log_level"] = cfg.log_level;
    j["scheduler"] = {
        {"max_concurrency", cfg.scheduler.max_concurrency},
        {"max_replans", cfg.scheduler.max_replans},
        {"checkpoint_retention", cfg.scheduler.checkpoint_retention},
        {"safe_task_max_retries", cfg.scheduler.safe_task_max_retries},
        {"retry_backoff_ms", cfg.scheduler.retry_backoff_ms},
    };
    j["hil"] = {{"enabled", cfg.hil.enabled}, {"approval_required", to_string(cfg.hil.approval_required)}};
    j["ail"] = {{"enabled", cfg.ail.enabled}, {"decision_points", to_string(cfg.ail.decision_points)}};
    j["timeouts"] = {{"hil_ms", cfg.timeouts.hil_ms}, {"ail_ms", cfg.timeouts.ail_ms}};
    j["sandbox"] = {
        {"timeout_ms", cfg.sandbox.timeout_ms},
        {"memory_limit_mb", cfg.sandbox.memory_limit_mb},
        {"allowed_read_paths", cfg.sandbox.allowed_read_paths},
    };
    j["routing"] = {{"cloud_servers", cfg.routing.cloud_servers}};
    j["store"] = {{"record_ttl_seconds", cfg.store.record_ttl_seconds}};
    if (cfg.store.directory) j["store"]["directory"] = *cfg.store.directory;
    return j;
}

EngineConfig load_engine_config(const std::string& path) {
    namespace fs = std::filesystem;
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path);
    }
    const std::string ext = fs::path(path).extension().string();
    Value json;
    try {
        if (ext == ".json") {
            std::ifstream file(path);
            std::stringstream buffer;
            buffer << file.rdbuf();
            json = Value::parse(buffer.str());
        } else {
            json = load_yaml_file(path);
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Failed to parse config " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigurationError("Failed to parse config " + path + ": " + e.what());
    }
    Logger::info("config", "Loaded engine config from " + path);
    return engine_config_from_json(json);
}

ConfigHolder::ConfigHolder(EngineConfig config) {
    config.validate();
    current_ = std::make_shared<const EngineConfig>(std::move(config));
}

std::shared_ptr<const EngineConfig> ConfigHolder::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const EngineConfig> ConfigHolder::replace(EngineConfig config) {
    config.validate();
    std::lock_guard<std::mutex> lock(mutex_);
    config.version = current_->version + 1;
    config.routing.version = config.version;
    current_ = std::make_shared<const EngineConfig>(std::move(config));
    Logger::info("config", "Engine config replaced, version " + std::to_string(current_->version));
    return current_;
}

std::shared_ptr<const EngineConfig> ConfigHolder::reload() {
    std::optional<std::string> path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = source_path_;
    }
    if (!path) {
        throw ConfigurationError("Config holder has no source file to reload");
    }
    return replace(load_engine_config(*path));
}

std::shared_ptr<const EngineConfig> ConfigHolder::load_from_file(const std::string& path) {
    auto loaded = load_engine_config(path);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source_path_ = path;
    }
    return replace(std::move(loaded));
}

} // namespace agentflow
