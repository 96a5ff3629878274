// tests/test_converter.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/converter/structure_converter.h"
#include <algorithm>

using namespace agentflow;

namespace {

StaticStructure parse(const char* json) {
    return static_structure_from_json(Value::parse(json));
}

const Task& task_of(const DAGStructure& dag, const TaskId& id) {
    const Task* task = dag.find(id);
    REQUIRE(task != nullptr);
    return *task;
}

bool depends(const Task& task, const TaskId& dep) {
    return std::find(task.depends_on.begin(), task.depends_on.end(), dep) != task.depends_on.end();
}

} // namespace

TEST_CASE("Sequence edges become dependencies with prefixed ids", "[converter]") {
    auto structure = parse(R"({
      "nodes": [
        {"id": "n1", "type": "task", "tool": "fs:read_file",
         "arguments": {"path": {"type": "literal", "value": "/tmp/a"}}},
        {"id": "n2", "type": "task", "tool": "text:summarize"}
      ],
      "edges": [{"from": "n1", "to": "n2", "type": "sequence"}]
    })");

    auto dag = StructureConverter().convert(structure);
    REQUIRE(dag.size() == 2);
    const auto& n1 = task_of(dag, "task_n1");
    REQUIRE(n1.tool_label() == "fs:read_file");
    REQUIRE(n1.static_arguments.at("path").value == "/tmp/a");
    REQUIRE(depends(task_of(dag, "task_n2"), "task_n1"));
}

TEST_CASE("Fork and join nodes pass dependencies through", "[converter]") {
    auto structure = parse(R"({
      "nodes": [
        {"id": "start", "type": "task", "tool": "a:start"},
        {"id": "f", "type": "fork"},
        {"id": "left", "type": "task", "tool": "a:left"},
        {"id": "right", "type": "task", "tool": "a:right"},
        {"id": "j", "type": "join"},
        {"id": "end", "type": "task", "tool": "a:end"}
      ],
      "edges": [
        {"from": "start", "to": "f"},
        {"from": "f", "to": "left"},
        {"from": "f", "to": "right"},
        {"from": "left", "to": "j"},
        {"from": "right", "to": "j"},
        {"from": "j", "to": "end"}
      ]
    })");

    auto dag = StructureConverter().convert(structure);
    REQUIRE(dag.size() == 4);
    REQUIRE(task_of(dag, "task_left").depends_on == std::vector<TaskId>{"task_start"});
    REQUIRE(task_of(dag, "task_right").depends_on == std::vector<TaskId>{"task_start"});
    const auto& end = task_of(dag, "task_end");
    REQUIRE(end.depends_on.size() == 2);
    REQUIRE(depends(end, "task_left"));
    REQUIRE(depends(end, "task_right"));

    REQUIRE(estimate_parallel_layers(structure) == 2);
}

TEST_CASE("Conditional edges attach task conditions", "[converter]") {
    const char* json = R"({
      "nodes": [
        {"id": "check", "type": "task", "tool": "fs:exists"},
        {"id": "d", "type": "decision", "condition": "check.exists"},
        {"id": "yes", "type": "task", "tool": "fs:read"},
        {"id": "no", "type": "task", "tool": "fs:create"}
      ],
      "edges": [
        {"from": "check", "to": "d"},
        {"from": "d", "to": "yes", "type": "conditional", "outcome": "true"},
        {"from": "d", "to": "no", "type": "conditional", "outcome": "false"}
      ]
    })";

    SECTION("decision stays structural by default") {
        auto dag = StructureConverter().convert(parse(json));
        REQUIRE(dag.size() == 3);
        const auto& yes = task_of(dag, "task_yes");
        REQUIRE(yes.condition.has_value());
        REQUIRE(yes.condition->decision_node_id == "d");
        REQUIRE(yes.condition->required_outcome == "true");
        REQUIRE(yes.depends_on == std::vector<TaskId>{"task_check"});
        REQUIRE(task_of(dag, "task_no").condition->required_outcome == "false");
    }

    SECTION("decision tasks can be materialized") {
        StructureConverter converter(ConverterOptions{true, "task_"});
        auto dag = converter.convert(parse(json));
        REQUIRE(dag.size() == 4);
        const auto& decision = task_of(dag, "task_d");
        REQUIRE(decision.tool_label() == "internal:decision");
        REQUIRE(decision.arguments["condition"] == "check.exists");
        REQUIRE(decision.arguments["decisionNodeId"] == "d");
        REQUIRE(task_of(dag, "task_yes").depends_on == std::vector<TaskId>{"task_d"});
    }
}

TEST_CASE("Cycles among fork and join nodes are reported", "[converter]") {
    auto structure = parse(R"({
      "nodes": [
        {"id": "a", "type": "task", "tool": "x:a"},
        {"id": "f", "type": "fork"},
        {"id": "j", "type": "join"},
        {"id": "b", "type": "task", "tool": "x:b"}
      ],
      "edges": [
        {"from": "a", "to": "f"},
        {"from": "f", "to": "j"},
        {"from": "j", "to": "f"},
        {"from": "j", "to": "b"}
      ]
    })");
    REQUIRE_THROWS_AS(StructureConverter().convert(structure), ConversionError);
}

TEST_CASE("Capability nodes convert to capability tasks", "[converter]") {
    auto structure = parse(R"({
      "nodes": [{"id": "c", "type": "capability", "capabilityId": "cap-42"}],
      "edges": []
    })");
    auto dag = StructureConverter(ConverterOptions{false, "s_"}).convert(structure);
    const auto& task = task_of(dag, "s_c");
    REQUIRE(task.kind() == TaskKind::CAPABILITY);
    REQUIRE(task.as_capability()->capability_id == "cap-42");
    REQUIRE(task.tool_label() == "capability:cap-42");
}

TEST_CASE("Structures without executable nodes are rejected", "[converter]") {
    auto structure = parse(R"({
      "nodes": [{"id": "f", "type": "fork"}, {"id": "d", "type": "decision", "condition": "x"}],
      "edges": []
    })");
    REQUIRE_FALSE(is_valid_for_conversion(structure));
    REQUIRE_THROWS_AS(StructureConverter().convert(structure), ConversionError);
    REQUIRE_THROWS_AS(static_structure_from_json(Value{{"edges", Value::array()}}), ConversionError);
}

TEST_CASE("Tool listing and layer estimate", "[converter]") {
    auto structure = parse(R"({
      "nodes": [
        {"id": "a", "type": "task", "tool": "x:one"},
        {"id": "b", "type": "task", "tool": "y:two"},
        {"id": "c", "type": "capability", "capabilityId": "cap"}
      ],
      "edges": []
    })");
    REQUIRE(get_tools(structure) == std::vector<std::string>{"x:one", "y:two"});
    REQUIRE(estimate_parallel_layers(structure) == 3);

    auto round_trip = static_structure_from_json(static_structure_to_json(structure));
    REQUIRE(round_trip.nodes.size() == 3);
    REQUIRE(round_trip.nodes[2].capability_id == "cap");
}
