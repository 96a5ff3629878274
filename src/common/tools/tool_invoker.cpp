// common/tools/tool_invoker.cpp
#include "common/tools/tool_invoker.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentflow {

bool ToolInvoker::has_client(const std::string& server) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(server) > 0;
}

std::vector<std::string> ToolInvoker::list_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, _] : clients_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::pair<std::string, std::string> ToolInvoker::split_tool_id(const std::string& tool_id) {
    auto pos = tool_id.find(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == tool_id.size()) {
        throw ToolRoutingError("Invalid tool id (expected server:action): " + tool_id);
    }
    return {tool_id.substr(0, pos), tool_id.substr(pos + 1)};
}

Value ToolInvoker::invoke(const std::string& tool_id, const Value& args) const {
    auto [server, action] = split_tool_id(tool_id);
    ToolClient client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(server);
        if (it == clients_.end()) {
            throw ToolRoutingError("No client registered for server: " + server);
        }
        client = it->second; // 拷贝后解锁, 客户端调用可能很慢
    }
    return client(action, args);
}

} // namespace agentflow
