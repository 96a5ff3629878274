// modules/converter/structure_converter.h
#ifndef AGENTFLOW_MODULES_CONVERTER_STRUCTURE_CONVERTER_H
#define AGENTFLOW_MODULES_CONVERTER_STRUCTURE_CONVERTER_H

#include "core/types/context.h"
#include "core/types/task.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// 静态分析图
enum class StructureNodeType : uint8_t { TASK, CAPABILITY, DECISION, FORK, JOIN };
enum class StructureEdgeType : uint8_t { SEQUENCE, PROVIDES, CONDITIONAL, CONTAINS };

struct StructureNode {
    std::string id;
    StructureNodeType type = StructureNodeType::TASK;
    std::string tool;                       // TASK
    std::string capability_id;              // CAPABILITY
    std::string condition;                  // DECISION (inja expression)
    ArgumentsStructure arguments;           // TASK
};

struct StructureEdge {
    std::string from;
    std::string to;
    StructureEdgeType type = StructureEdgeType::SEQUENCE;
    std::optional<std::string> outcome;     // CONDITIONAL
};

struct StaticStructure {
    std::vector<StructureNode> nodes;
    std::vector<StructureEdge> edges;
};

StaticStructure static_structure_from_json(const Value& json);
Value static_structure_to_json(const StaticStructure& structure);

struct ConverterOptions {
    bool include_decision_tasks = false;
    std::string task_id_prefix = "task_";
};

class StructureConverter {
public:
    StructureConverter() = default;
    explicit StructureConverter(ConverterOptions options) : options_(std::move(options)) {}

    // Throws ConversionError ("no executable nodes", incomplete nodes, cycles among fork/join/decision nodes)
    // or DagValidationError
    DAGStructure convert(const StaticStructure& structure) const;

    const ConverterOptions& options() const { return options_; }

private:
    ConverterOptions options_;
};

// At least one task or capability node
bool is_valid_for_conversion(const StaticStructure& structure);
std::vector<std::string> get_tools(const StaticStructure& structure);
// Heuristic: task count without forks, fork count + 1 otherwise
size_t estimate_parallel_layers(const StaticStructure& structure);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONVERTER_STRUCTURE_CONVERTER_H
