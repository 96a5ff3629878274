// modules/resolver/dependency_resolver.cpp
#include "modules/resolver/dependency_resolver.h"

namespace agentflow {

DependencyResolution DependencyResolver::resolve(const std::vector<TaskId>& depends_on, const ResultMap& prior_results) {
    DependencyResolution resolution;
    for (const auto& dep : depends_on) {
        auto it = prior_results.find(dep);
        if (it == prior_results.end()) {
            resolution.error = "Dependency task " + dep + " not found in results";
            return resolution;
        }
        if (it->second.status == TaskStatus::ERROR) {
            resolution.error = "Dependency task " + dep + " failed: " + it->second.error.value_or("unknown error");
            return resolution;
        }
        resolution.results.emplace(dep, it->second);
    }
    resolution.success = true;
    return resolution;
}

} // namespace agentflow
