// modules/resolver/dependency_resolver.h
#ifndef AGENTFLOW_MODULES_RESOLVER_DEPENDENCY_RESOLVER_H
#define AGENTFLOW_MODULES_RESOLVER_DEPENDENCY_RESOLVER_H

#include "core/types/task.h"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

using ResultMap = std::unordered_map<TaskId, TaskResult>;

struct DependencyResolution {
    bool success = false;
    std::string error;
    std::map<TaskId, TaskResult> results; // 完整 TaskResult, 下游可按 status 分支
};

class DependencyResolver {
public:
    // Fails on a missing dependency or one whose status is error. failed_safe results pass through.
    static DependencyResolution resolve(const std::vector<TaskId>& depends_on, const ResultMap& prior_results);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_RESOLVER_DEPENDENCY_RESOLVER_H
