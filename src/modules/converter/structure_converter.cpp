// modules/converter/structure_converter.cpp
#include "modules/converter/structure_converter.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace agentflow {

namespace {

StructureNodeType node_type_from_string(const std::string& name) {
    if (name == "task") return StructureNodeType::TASK;
    if (name == "capability") return StructureNodeType::CAPABILITY;
    if (name == "decision") return StructureNodeType::DECISION;
    if (name == "fork") return StructureNodeType::FORK;
    if (name == "join") return StructureNodeType::JOIN;
    throw ConversionError("Unknown node type: " + name);
}

std::string to_string(StructureNodeType type) {
    switch (type) {
        case StructureNodeType::TASK: return "task";
        case StructureNodeType::CAPABILITY: return "capability";
        case StructureNodeType::DECISION: return "decision";
        case StructureNodeType::FORK: return "fork";
        case StructureNodeType::JOIN: return "join";
    }
    return "task";
}

StructureEdgeType edge_type_from_string(const std::string& name) {
    if (name == "sequence") return StructureEdgeType::SEQUENCE;
    if (name == "provides") return StructureEdgeType::PROVIDES;
    if (name == "conditional") return StructureEdgeType::CONDITIONAL;
    if (name == "contains") return StructureEdgeType::CONTAINS;
    throw ConversionError("Unknown edge type: " + name);
}

std::string to_string(StructureEdgeType type) {
    switch (type) {
        case StructureEdgeType::SEQUENCE: return "sequence";
        case StructureEdgeType::PROVIDES: return "provides";
        case StructureEdgeType::CONDITIONAL: return "conditional";
        case StructureEdgeType::CONTAINS: return "contains";
    }
    return "sequence";
}

void add_dependency(std::unordered_map<TaskId, std::vector<TaskId>>& deps, const TaskId& task, const TaskId& dep) {
    auto& list = deps[task];
    // 去重, 保持首次出现顺序
    if (dep != task && std::find(list.begin(), list.end(), dep) == list.end()) {
        list.push_back(dep);
    }
}

} // namespace

StaticStructure static_structure_from_json(const Value& json) {
    if (!json.is_object() || !json.contains("nodes") || !json["nodes"].is_array()) {
        throw ConversionError("Static structure requires a 'nodes' array");
    }
    StaticStructure structure;
    for (const auto& n : json["nodes"]) {
        StructureNode node;
        node.id = n.at("id").get<std::string>();
        node.type = node_type_from_string(n.at("type").get<std::string>());
        node.tool = n.value("tool", "");
        node.capability_id = n.value("capabilityId", "");
        node.condition = n.value("condition", "");
        if (n.contains("arguments") && n["arguments"].is_object()) {
            for (auto it = n["arguments"].begin(); it != n["arguments"].end(); ++it) {
                node.arguments[it.key()] = argument_value_from_json(it.value());
            }
        }
        structure.nodes.push_back(std::move(node));
    }
    if (json.contains("edges") && json["edges"].is_array()) {
        for (const auto& e : json["edges"]) {
            StructureEdge edge;
            edge.from = e.at("from").get<std::string>();
            edge.to = e.at("to").get<std::string>();
            edge.type = edge_type_from_string(e.value("type", "sequence"));
            if (e.contains("outcome") && e["outcome"].is_string()) edge.outcome = e["outcome"].get<std::string>();
            structure.edges.push_back(std::move(edge));
        }
    }
    return structure;
}

Value static_structure_to_json(const StaticStructure& structure) {
    Value nodes = Value::array();
    for (const auto& node : structure.nodes) {
        Value n{{"id", node.id}, {"type", to_string(node.type)}};
        if (!node.tool.empty()) n["tool"] = node.tool;
        if (!node.capability_id.empty()) n["capabilityId"] = node.capability_id;
        if (!node.condition.empty()) n["condition"] = node.condition;
        if (!node.arguments.empty()) {
            Value args = Value::object();
            for (const auto& [name, arg] : node.arguments) args[name] = argument_value_to_json(arg);
            n["arguments"] = std::move(args);
        }
        nodes.push_back(std::move(n));
    }
    Value edges = Value::array();
    for (const auto& edge : structure.edges) {
        Value e{{"from", edge.from}, {"to", edge.to}, {"type", to_string(edge.type)}};
        if (edge.outcome) e["outcome"] = *edge.outcome;
        edges.push_back(std::move(e));
    }
    return Value{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

bool is_valid_for_conversion(const StaticStructure& structure) {
    return std::any_of(structure.nodes.begin(), structure.nodes.end(), [](const StructureNode& n) {
        return n.type == StructureNodeType::TASK || n.type == StructureNodeType::CAPABILITY;
    });
}

std::vector<std::string> get_tools(const StaticStructure& structure) {
    std::vector<std::string> tools;
    for (const auto& node : structure.nodes) {
        if (node.type == StructureNodeType::TASK) tools.push_back(node.tool);
    }
    return tools;
}

size_t estimate_parallel_layers(const StaticStructure& structure) {
    size_t forks = 0;
    size_t executable = 0;
    for (const auto& node : structure.nodes) {
        if (node.type == StructureNodeType::FORK) forks++;
        if (node.type == StructureNodeType::TASK || node.type == StructureNodeType::CAPABILITY) executable++;
    }
    if (forks == 0) return executable;
    return std::max<size_t>(1, forks + 1);
}

DAGStructure StructureConverter::convert(const StaticStructure& structure) const {
    if (!is_valid_for_conversion(structure)) {
        throw ConversionError("Cannot convert static structure: no executable nodes");
    }
    Logger::debug("converter", "Converting static structure: " + std::to_string(structure.nodes.size()) +
                                   " nodes, " + std::to_string(structure.edges.size()) + " edges");

    // Phase 1: 节点 -> 任务
    std::vector<Task> tasks;
    std::unordered_map<std::string, TaskId> node_to_task;
    std::unordered_set<std::string> structural; // fork / join / 未物化的 decision
    std::unordered_map<std::string, std::vector<TaskId>> fork_children;

    for (const auto& node : structure.nodes) {
        const TaskId task_id = options_.task_id_prefix + node.id;
        switch (node.type) {
            case StructureNodeType::TASK: {
                if (node.tool.empty()) throw ConversionError("Task node " + node.id + " has no tool");
                Task task = Task::make_tool(task_id, node.tool);
                task.static_arguments = node.arguments;
                tasks.push_back(std::move(task));
                break;
            }
            case StructureNodeType::CAPABILITY:
                if (node.capability_id.empty()) {
                    throw ConversionError("Capability node " + node.id + " has no capabilityId");
                }
                tasks.push_back(Task::make_capability(task_id, node.capability_id));
                break;
            case StructureNodeType::DECISION:
                if (!options_.include_decision_tasks) {
                    structural.insert(node.id);
                    continue;
                }
                tasks.push_back(Task::make_tool(task_id, "internal:decision", {},
                                                Value{{"condition", node.condition}, {"decisionNodeId", node.id}}));
                break;
            case StructureNodeType::FORK:
                fork_children[node.id] = {};
                structural.insert(node.id);
                continue;
            case StructureNodeType::JOIN:
                structural.insert(node.id);
                continue;
        }
        node_to_task[node.id] = task_id;
    }

    // 结构节点的任务前驱 (穿透 fork / join / decision)
    std::unordered_map<std::string, std::vector<TaskId>> predecessor_cache;
    std::unordered_set<std::string> visiting;
    std::function<const std::vector<TaskId>&(const std::string&)> task_predecessors =
        [&](const std::string& node_id) -> const std::vector<TaskId>& {
        auto cached = predecessor_cache.find(node_id);
        if (cached != predecessor_cache.end()) return cached->second;
        if (!visiting.insert(node_id).second) {
            throw ConversionError("Cycle among structural nodes at " + node_id);
        }
        std::vector<TaskId> preds;
        for (const auto& edge : structure.edges) {
            if (edge.to != node_id || edge.type == StructureEdgeType::CONTAINS) continue;
            auto from_task = node_to_task.find(edge.from);
            if (from_task != node_to_task.end()) {
                if (std::find(preds.begin(), preds.end(), from_task->second) == preds.end()) {
                    preds.push_back(from_task->second);
                }
            } else if (structural.count(edge.from) > 0) {
                for (const auto& p : task_predecessors(edge.from)) {
                    if (std::find(preds.begin(), preds.end(), p) == preds.end()) preds.push_back(p);
                }
            }
        }
        visiting.erase(node_id);
        return predecessor_cache[node_id] = std::move(preds);
    };

    // Phase 2: 边 -> 依赖 / 条件
    std::unordered_map<TaskId, std::vector<TaskId>> dependencies;
    std::unordered_map<TaskId, TaskCondition> conditions;

    for (const auto& edge : structure.edges) {
        auto to_it = node_to_task.find(edge.to);
        if (to_it == node_to_task.end()) continue; // 目标不是任务
        const TaskId& to_task = to_it->second;
        auto from_it = node_to_task.find(edge.from);

        switch (edge.type) {
            case StructureEdgeType::SEQUENCE:
            case StructureEdgeType::PROVIDES:
                if (from_it != node_to_task.end()) {
                    add_dependency(dependencies, to_task, from_it->second);
                } else if (structural.count(edge.from) > 0) {
                    for (const auto& pred : task_predecessors(edge.from)) add_dependency(dependencies, to_task, pred);
                }
                if (fork_children.count(edge.from) > 0) {
                    fork_children[edge.from].push_back(to_task);
                }
                break;
            case StructureEdgeType::CONDITIONAL:
                if (!edge.outcome) break;
                conditions[to_task] = TaskCondition{edge.from, *edge.outcome};
                if (from_it != node_to_task.end()) {
                    add_dependency(dependencies, to_task, from_it->second);
                } else if (structural.count(edge.from) > 0) {
                    for (const auto& pred : task_predecessors(edge.from)) add_dependency(dependencies, to_task, pred);
                }
                break;
            case StructureEdgeType::CONTAINS:
                break;
        }
    }

    // Phase 3: 应用
    size_t conditional_count = 0;
    for (auto& task : tasks) {
        auto deps = dependencies.find(task.id);
        if (deps != dependencies.end()) task.depends_on = deps->second;
        auto cond = conditions.find(task.id);
        if (cond != conditions.end()) {
            task.condition = cond->second;
            conditional_count++;
        }
    }
    for (const auto& [fork, children] : fork_children) {
        Logger::debug("converter", "Fork " + fork + " has " + std::to_string(children.size()) + " parallel branches");
    }

    DAGStructure dag(std::move(tasks));
    dag.validate();
    Logger::debug("converter", "Converted to " + std::to_string(dag.size()) + " tasks (" +
                                   std::to_string(conditional_count) + " conditional)");
    return dag;
}

} // namespace agentflow
