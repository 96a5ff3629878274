// tests/test_resolvers.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/resolver/argument_resolver.h"
#include "modules/resolver/dependency_resolver.h"

using namespace agentflow;

namespace {

TaskResult make_result(const TaskId& id, TaskStatus status, Value output = Value(), std::string error = "") {
    TaskResult r;
    r.task_id = id;
    r.status = status;
    if (!output.is_null()) r.output = std::move(output);
    if (!error.empty()) r.error = std::move(error);
    return r;
}

} // namespace

TEST_CASE("Dependency resolution collects full results", "[resolver][dependency]") {
    ResultMap prior;
    prior["a"] = make_result("a", TaskStatus::SUCCESS, Value{{"n", 1}});
    prior["b"] = make_result("b", TaskStatus::FAILED_SAFE, Value(), "flaky");

    auto resolution = DependencyResolver::resolve({"a", "b"}, prior);
    REQUIRE(resolution.success);
    REQUIRE(resolution.results.size() == 2);
    REQUIRE(resolution.results.at("b").status == TaskStatus::FAILED_SAFE);

    auto empty = DependencyResolver::resolve({}, prior);
    REQUIRE(empty.success);
    REQUIRE(empty.results.empty());
}

TEST_CASE("Dependency resolution fails on missing or errored dependencies", "[resolver][dependency]") {
    ResultMap prior;
    prior["a"] = make_result("a", TaskStatus::ERROR, Value(), "boom");

    auto missing = DependencyResolver::resolve({"zzz"}, prior);
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error == "Dependency task zzz not found in results");

    auto failed = DependencyResolver::resolve({"a"}, prior);
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.error == "Dependency task a failed: boom");
}

TEST_CASE("Expressions split into path segments", "[resolver][argument]") {
    REQUIRE(ArgumentResolver::parse_expression("n1.items[0]['name']") ==
            std::vector<std::string>{"n1", "items", "0", "name"});
    REQUIRE(ArgumentResolver::parse_expression("`ctx.user`") == std::vector<std::string>{"ctx", "user"});

    Value root{{"items", Value::array({Value{{"name", "first"}}})}};
    auto name = ArgumentResolver::navigate_path(root, {"items", "0", "name"});
    REQUIRE(name.has_value());
    REQUIRE(*name == "first");
    REQUIRE_FALSE(ArgumentResolver::navigate_path(root, {"items", "3"}).has_value());
}

TEST_CASE("Arguments resolve from literals, parameters and references", "[resolver][argument]") {
    ArgumentsStructure args;
    args["limit"] = ArgumentValue{ArgumentValue::Type::LITERAL, 10, "", ""};
    args["user"] = ArgumentValue{ArgumentValue::Type::PARAMETER, Value(), "", "user"};
    args["path"] = ArgumentValue{ArgumentValue::Type::REFERENCE, Value(), "n1.files[1]", ""};
    args["lost"] = ArgumentValue{ArgumentValue::Type::REFERENCE, Value(), "nowhere.value", ""};

    Context context{{"parameters", {{"user", "ada"}}}};
    ResultMap results;
    results["task_n1"] = make_result("task_n1", TaskStatus::SUCCESS, Value{{"files", {"a.txt", "b.txt"}}});

    ArgumentResolver resolver;
    auto resolved = resolver.resolve_arguments(args, context, results);
    REQUIRE(resolved["limit"] == 10);
    REQUIRE(resolved["user"] == "ada");
    REQUIRE(resolved["path"] == "b.txt");
    REQUIRE_FALSE(resolved.contains("lost"));
}

TEST_CASE("$OUTPUT references are substituted recursively", "[resolver][argument]") {
    ResultMap results;
    results["fetch"] = make_result("fetch", TaskStatus::SUCCESS, Value{{"data", {{"count", 3}}}});

    Value args{{"count", "$OUTPUT[fetch].data.count"},
               {"nested", {{"all", "$OUTPUT[fetch]"}}},
               {"plain", "text"}};
    auto resolution = ArgumentResolver::resolve_output_references(args, results);
    REQUIRE(resolution.success);
    REQUIRE(resolution.arguments["count"] == 3);
    REQUIRE(resolution.arguments["nested"]["all"]["data"]["count"] == 3);
    REQUIRE(resolution.arguments["plain"] == "text");

    auto missing = ArgumentResolver::resolve_output_references(Value{{"x", "$OUTPUT[ghost]"}}, results);
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error == "Referenced task ghost has no output");
}

TEST_CASE("Explicit arguments override resolved ones", "[resolver][argument]") {
    auto merged = ArgumentResolver::merge_arguments(Value{{"a", 1}, {"b", 2}}, Value{{"b", 3}});
    REQUIRE(merged == Value{{"a", 1}, {"b", 3}});
}
