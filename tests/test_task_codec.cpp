// tests/test_task_codec.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "core/types/task.h"

using namespace agentflow;

namespace {

DAGStructure mixed_dag() {
    Task read = Task::make_tool("read", "fs:read_file", {}, Value{{"path", "/tmp/in.txt"}});
    read.static_arguments["path"] = ArgumentValue{ArgumentValue::Type::LITERAL, "/tmp/in.txt", "", ""};
    read.intent = "load the input";

    Task parse = Task::make_code("parse", "return input.split()", {"read"});
    parse.sandbox_config = SandboxConfig{5000, 128, {"/tmp"}, std::string("read-only")};
    parse.static_arguments["input"] = ArgumentValue{ArgumentValue::Type::REFERENCE, Value(), "read.content", ""};

    Task enrich = Task::make_capability("enrich", "cap-7", {"parse"}, std::string("return 1"));
    enrich.static_arguments["lang"] = ArgumentValue{ArgumentValue::Type::PARAMETER, Value(), "", "language"};

    Task publish = Task::make_tool("publish", "slack:post", {"enrich"});
    publish.side_effects = true;
    publish.condition = TaskCondition{"gate", "approved"};

    return DAGStructure({read, parse, enrich, publish});
}

} // namespace

TEST_CASE("DAG wire format keeps every task field", "[types][codec]") {
    auto dag = mixed_dag();
    auto json = dag_to_json(dag);

    REQUIRE(json["tasks"].size() == 4);
    REQUIRE(json["tasks"][1]["kind"] == "code_execution");
    REQUIRE(json["tasks"][2]["tool"] == "capability:cap-7");
    REQUIRE(json["tasks"][3]["condition"]["decisionNodeId"] == "gate");

    // 经过字符串序列化后再解析
    auto parsed = dag_from_json(Value::parse(json.dump()));
    REQUIRE(parsed.size() == dag.size());
    for (size_t i = 0; i < dag.size(); ++i) {
        REQUIRE(parsed.tasks()[i] == dag.tasks()[i]);
    }
}

TEST_CASE("Task parsing accepts the legacy type field and capability tool ids", "[types][codec]") {
    auto code = task_from_json(Value{{"id", "c"}, {"type", "code_execution"}, {"code", "x = 1"}});
    REQUIRE(code.kind() == TaskKind::CODE_EXECUTION);
    REQUIRE(code.as_code()->code == "x = 1");

    auto cap = task_from_json(Value{{"id", "k"}, {"kind", "capability"}, {"tool", "capability:cap-9"}});
    REQUIRE(cap.as_capability()->capability_id == "cap-9");
    REQUIRE_FALSE(cap.side_effects);
    REQUIRE(cap.depends_on.empty());
}

TEST_CASE("Malformed task JSON raises DagValidationError", "[types][codec]") {
    REQUIRE_THROWS_AS(task_from_json(Value::array()), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", 3}, {"tool", "a:b"}}), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"}}), DagValidationError); // 缺少 tool
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"}, {"kind", "code_execution"}}), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"}, {"tool", "a:b"}, {"dependsOn", Value::array({1})}}), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"}, {"tool", "a:b"}, {"dependsOn", "x"}}), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"}, {"tool", "a:b"}, {"sideEffects", "no"}}), DagValidationError);
    REQUIRE_THROWS_AS(task_from_json(Value{{"id", "t"},
                                           {"tool", "a:b"},
                                           {"staticArguments", {{"p", {{"type", "magic"}}}}}}),
                      DagValidationError);
}

TEST_CASE("Malformed DAG JSON raises DagValidationError", "[types][codec]") {
    REQUIRE_THROWS_AS(dag_from_json(Value::object()), DagValidationError);
    REQUIRE_THROWS_AS(dag_from_json(Value{{"tasks", "none"}}), DagValidationError);

    Value unknown_dep{{"tasks", Value::array({Value{{"id", "a"}, {"tool", "x:y"}, {"dependsOn", Value::array({"ghost"})}}})}};
    REQUIRE_THROWS_AS(dag_from_json(unknown_dep), DagValidationError);

    Value duplicate{{"tasks", Value::array({Value{{"id", "a"}, {"tool", "x:y"}}, Value{{"id", "a"}, {"tool", "x:z"}}})}};
    REQUIRE_THROWS_AS(dag_from_json(duplicate), DagValidationError);
}

TEST_CASE("Task results survive the wire format", "[types][codec]") {
    TaskResult result{"parse", TaskStatus::FAILED_SAFE, std::nullopt, std::string("timeout"), 12.5};
    auto back = task_result_from_json(task_result_to_json(result));
    REQUIRE(back.task_id == "parse");
    REQUIRE(back.status == TaskStatus::FAILED_SAFE);
    REQUIRE(back.error == std::optional<std::string>("timeout"));
    REQUIRE(back.elapsed_ms == std::optional<double>(12.5));
    REQUIRE_FALSE(back.output.has_value());
}
