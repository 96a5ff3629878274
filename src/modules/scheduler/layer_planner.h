// modules/scheduler/layer_planner.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_LAYER_PLANNER_H
#define AGENTFLOW_MODULES_SCHEDULER_LAYER_PLANNER_H

#include "core/types/task.h"
#include "modules/resolver/dependency_resolver.h" // 引入 ResultMap
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace agentflow {

// Static Kahn layering of the whole DAG. Throws CycleDetectedError.
std::vector<std::vector<TaskId>> compute_topological_layers(const DAGStructure& dag);

// Outcome recorded outside the DAG (decisions, context) for a decision node
using OutcomeLookup = std::function<std::optional<std::string>(const std::string& decision_node_id)>;

struct LayerPlan {
    std::vector<TaskId> eligible;                                // DAG 顺序
    std::vector<std::pair<TaskId, std::string>> newly_skipped;   // id, reason
    std::vector<TaskId> blocked;                                 // 上游 error, 永不可执行
    std::vector<TaskId> waiting;                                 // 既不可执行也未被阻塞
    bool complete = false;                                       // 没有待执行任务
};

// Dynamic layering against the results observed so far:
//  - eligible: every dependency settled ok (success / failed_safe) and condition satisfied
//  - skipped: condition decided otherwise (or undecidable), or a dependency was skipped
//  - blocked: a dependency (transitively) ended in error
LayerPlan plan_next_layer(const DAGStructure& dag, const ResultMap& results,
                          const std::unordered_set<TaskId>& skipped, const OutcomeLookup& lookup);

// Finds the materialized decision task for a decision node, if any
const Task* find_decision_task(const DAGStructure& dag, const std::string& decision_node_id);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_LAYER_PLANNER_H
