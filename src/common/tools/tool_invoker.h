// common/tools/tool_invoker.h
#ifndef AGENTFLOW_COMMON_TOOLS_TOOL_INVOKER_H
#define AGENTFLOW_COMMON_TOOLS_TOOL_INVOKER_H

#include "core/types/context.h"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentflow {

// (action, args) -> raw result. Throwing signals a tool failure.
using ToolClient = std::function<Value(const std::string& action, const Value& args)>;

// 按 server 注册客户端; tool id 形如 "server:action"
class ToolInvoker {
public:
    ToolInvoker() = default;

    template <typename Func>
    void register_client(std::string server, Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_[std::move(server)] = ToolClient(std::forward<Func>(func));
    }

    bool has_client(const std::string& server) const;
    std::vector<std::string> list_servers() const;

    // Throws ToolRoutingError on a malformed id or unknown server; client exceptions propagate
    Value invoke(const std::string& tool_id, const Value& args) const;

    // "server:action" -> {server, action}; throws ToolRoutingError without ':'
    static std::pair<std::string, std::string> split_tool_id(const std::string& tool_id);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolClient> clients_;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_TOOLS_TOOL_INVOKER_H
