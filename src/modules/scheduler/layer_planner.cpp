// modules/scheduler/layer_planner.cpp
#include "modules/scheduler/layer_planner.h"
#include "core/types/errors.h"
#include "modules/executor/decision_evaluator.h"
#include <unordered_map>

namespace agentflow {

namespace {

std::string join_ids(const std::vector<TaskId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    return out;
}

enum class ConditionState : uint8_t { SATISFIED, PENDING, UNMET };

} // namespace

std::vector<std::vector<TaskId>> compute_topological_layers(const DAGStructure& dag) {
    std::unordered_map<TaskId, int> in_degree;
    std::unordered_map<TaskId, std::vector<TaskId>> dependents;
    for (const auto& task : dag.tasks()) {
        in_degree[task.id] += 0;
        for (const auto& dep : task.depends_on) {
            in_degree[task.id]++;
            dependents[dep].push_back(task.id);
        }
    }

    std::vector<std::vector<TaskId>> layers;
    std::unordered_set<TaskId> placed;
    std::vector<TaskId> current;
    for (const auto& task : dag.tasks()) {
        if (in_degree[task.id] == 0) current.push_back(task.id);
    }
    // 逐层剥离入度为 0 的节点
    while (!current.empty()) {
        std::vector<TaskId> next;
        for (const auto& id : current) {
            placed.insert(id);
            for (const auto& dependent : dependents[id]) {
                if (--in_degree[dependent] == 0) next.push_back(dependent);
            }
        }
        layers.push_back(std::move(current));
        current = std::move(next);
    }

    if (placed.size() != dag.size()) {
        std::vector<TaskId> remaining;
        for (const auto& task : dag.tasks()) {
            if (placed.count(task.id) == 0) remaining.push_back(task.id);
        }
        throw CycleDetectedError("Circular dependency detected in DAG. Remaining tasks: " + join_ids(remaining));
    }
    return layers;
}

const Task* find_decision_task(const DAGStructure& dag, const std::string& decision_node_id) {
    for (const auto& task : dag.tasks()) {
        if (is_decision_task(task) && task.arguments.is_object() &&
            task.arguments.value("decisionNodeId", "") == decision_node_id) {
            return &task;
        }
    }
    return nullptr;
}

LayerPlan plan_next_layer(const DAGStructure& dag, const ResultMap& results,
                          const std::unordered_set<TaskId>& skipped, const OutcomeLookup& lookup) {
    LayerPlan plan;
    std::unordered_set<TaskId> skip_set = skipped;
    std::unordered_set<TaskId> blocked;

    auto is_pending = [&](const TaskId& id) {
        return results.count(id) == 0 && skip_set.count(id) == 0;
    };

    auto condition_state = [&](const TaskCondition& condition, std::string& observed) {
        std::optional<std::string> outcome;
        if (const Task* decision = find_decision_task(dag, condition.decision_node_id)) {
            auto it = results.find(decision->id);
            if (it == results.end()) {
                if (skip_set.count(decision->id) == 0) return ConditionState::PENDING;
            } else if (it->second.succeeded() && it->second.output && it->second.output->contains("outcome")) {
                const auto& value = (*it->second.output)["outcome"];
                outcome = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        if (!outcome && lookup) outcome = lookup(condition.decision_node_id);
        observed = outcome.value_or("<none>");
        return (outcome && *outcome == condition.required_outcome) ? ConditionState::SATISFIED : ConditionState::UNMET;
    };

    // 跳过 / 阻塞 传播到不动点
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& task : dag.tasks()) {
            if (!is_pending(task.id) || blocked.count(task.id) > 0) continue;

            std::optional<std::string> skip_reason;
            bool is_blocked = false;
            bool all_settled = true;
            for (const auto& dep : task.depends_on) {
                if (skip_set.count(dep) > 0) {
                    skip_reason = "dependency " + dep + " was skipped";
                    break;
                }
                auto it = results.find(dep);
                if (blocked.count(dep) > 0 || (it != results.end() && it->second.status == TaskStatus::ERROR)) {
                    is_blocked = true;
                } else if (it == results.end()) {
                    all_settled = false;
                }
            }

            // 条件所引用的 decision 任务也是一条依赖边, 不一定出现在 depends_on 中
            if (!skip_reason && !is_blocked && task.condition) {
                if (const Task* decision = find_decision_task(dag, task.condition->decision_node_id)) {
                    auto it = results.find(decision->id);
                    if (blocked.count(decision->id) > 0 ||
                        (it != results.end() && it->second.status == TaskStatus::ERROR)) {
                        is_blocked = true;
                    }
                }
            }

            if (!skip_reason && !is_blocked && all_settled && task.condition) {
                std::string observed;
                if (condition_state(*task.condition, observed) == ConditionState::UNMET) {
                    skip_reason = "condition " + task.condition->decision_node_id + " == " +
                                  task.condition->required_outcome + " not met (outcome: " + observed + ")";
                }
            }

            if (skip_reason) {
                skip_set.insert(task.id);
                plan.newly_skipped.emplace_back(task.id, *skip_reason);
                changed = true;
            } else if (is_blocked) {
                blocked.insert(task.id);
                changed = true;
            }
        }
    }

    bool any_pending = false;
    for (const auto& task : dag.tasks()) {
        if (!is_pending(task.id)) continue;
        any_pending = true;
        if (blocked.count(task.id) > 0) {
            plan.blocked.push_back(task.id);
            continue;
        }
        bool ready = true;
        for (const auto& dep : task.depends_on) {
            auto it = results.find(dep);
            if (it == results.end() || !it->second.settled_ok()) {
                ready = false;
                break;
            }
        }
        if (ready && task.condition) {
            std::string observed;
            ready = condition_state(*task.condition, observed) == ConditionState::SATISFIED;
        }
        if (ready) {
            plan.eligible.push_back(task.id);
        } else {
            plan.waiting.push_back(task.id);
        }
    }
    plan.complete = !any_pending;
    return plan;
}

} // namespace agentflow
