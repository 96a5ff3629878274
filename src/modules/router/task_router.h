// modules/router/task_router.h
#ifndef AGENTFLOW_MODULES_ROUTER_TASK_ROUTER_H
#define AGENTFLOW_MODULES_ROUTER_TASK_ROUTER_H

#include "common/config/engine_config.h" // 引入 RoutingConfig
#include "core/types/task.h"
#include <memory>
#include <mutex>
#include <string>

namespace agentflow {

// 纯函数: 任务分类
TaskKind classify(const Task& task);
bool requires_sandbox(TaskKind kind);
// The only rule for tolerating a failure: side-effect-free code tasks
bool is_safe_to_fail(const Task& task);

enum class RoutingTarget : uint8_t { LOCAL, CLOUD };
std::string to_string(RoutingTarget target);

// "server:action" -> "server"; whole id when there is no ':'
std::string extract_server_name(const std::string& tool_id);

class TaskRouter {
public:
    explicit TaskRouter(std::shared_ptr<const RoutingConfig> config = std::make_shared<const RoutingConfig>());

    RoutingTarget resolve_routing(const Task& task) const;
    RoutingTarget resolve_routing(const std::string& tool_id) const;

    void reload(std::shared_ptr<const RoutingConfig> config);
    uint64_t config_version() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RoutingConfig> config_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_ROUTER_TASK_ROUTER_H
