// modules/router/task_router.cpp
#include "modules/router/task_router.h"
#include "common/utils/logger.h"
#include <algorithm>

namespace agentflow {

TaskKind classify(const Task& task) {
    return task.kind();
}

bool requires_sandbox(TaskKind kind) {
    return kind == TaskKind::CODE_EXECUTION || kind == TaskKind::CAPABILITY;
}

bool is_safe_to_fail(const Task& task) {
    return classify(task) == TaskKind::CODE_EXECUTION && !task.side_effects;
}

std::string to_string(RoutingTarget target) {
    return target == RoutingTarget::CLOUD ? "cloud" : "local";
}

std::string extract_server_name(const std::string& tool_id) {
    auto pos = tool_id.find(':');
    return pos == std::string::npos ? tool_id : tool_id.substr(0, pos);
}

TaskRouter::TaskRouter(std::shared_ptr<const RoutingConfig> config) : config_(std::move(config)) {
    if (!config_) config_ = std::make_shared<const RoutingConfig>();
}

RoutingTarget TaskRouter::resolve_routing(const Task& task) const {
    // code / capability 始终在本地沙箱执行
    if (requires_sandbox(classify(task))) return RoutingTarget::LOCAL;
    return resolve_routing(task.tool_label());
}

RoutingTarget TaskRouter::resolve_routing(const std::string& tool_id) const {
    std::shared_ptr<const RoutingConfig> config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }
    const std::string server = extract_server_name(tool_id);
    const auto& cloud = config->cloud_servers;
    return std::find(cloud.begin(), cloud.end(), server) != cloud.end() ? RoutingTarget::CLOUD : RoutingTarget::LOCAL;
}

void TaskRouter::reload(std::shared_ptr<const RoutingConfig> config) {
    if (!config) return;
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
    Logger::debug("router", "Routing config reloaded, version " + std::to_string(config_->version));
}

uint64_t TaskRouter::config_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_->version;
}

} // namespace agentflow
