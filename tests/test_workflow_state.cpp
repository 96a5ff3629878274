// tests/test_workflow_state.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/state/workflow_state.h"

using namespace agentflow;

namespace {

TaskResult result(const TaskId& id, TaskStatus status) {
    TaskResult r;
    r.task_id = id;
    r.status = status;
    if (status == TaskStatus::SUCCESS) r.output = Value{{"id", id}};
    else r.error = "failed " + id;
    return r;
}

Decision approval(const std::string& outcome) {
    Decision d;
    d.type = DecisionType::HIL;
    d.timestamp = now();
    d.description = "approve layer";
    d.outcome = outcome;
    return d;
}

} // namespace

TEST_CASE("Initial state is empty and valid", "[state]") {
    auto state = create_initial_state("wf-1", Context{{"user", "ada"}});
    REQUIRE(state.workflow_id == "wf-1");
    REQUIRE(state.current_layer == 0);
    REQUIRE(state.tasks.empty());
    REQUIRE(state.context["user"] == "ada");

    REQUIRE_THROWS_AS(create_initial_state(""), StateInvariantError);
}

TEST_CASE("Reducers append and merge", "[state][reducer]") {
    auto merged = context_reducer(Context{{"a", 1}, {"b", 1}}, Context{{"b", 2}, {"c", 3}});
    REQUIRE(merged == Context{{"a", 1}, {"b", 2}, {"c", 3}});

    auto tasks = tasks_reducer({result("a", TaskStatus::SUCCESS)}, {result("b", TaskStatus::ERROR)});
    REQUIRE(tasks.size() == 2);
    REQUIRE(tasks[1].task_id == "b");

    auto messages = messages_reducer({}, {Message{"user", "hi", now(), Value::object()}});
    REQUIRE(messages.size() == 1);
}

TEST_CASE("update_state is pure and folds every field", "[state]") {
    auto initial = create_initial_state("wf-1");

    StateUpdate update;
    update.current_layer = 1;
    update.tasks = {result("a", TaskStatus::SUCCESS), result("b", TaskStatus::FAILED_SAFE)};
    update.decisions = {approval("approved")};
    update.messages = {Message{"system", "layer 1 done", now(), Value::object()}};
    update.context = Context{{"k", "v"}};

    auto next = update_state(initial, update);
    REQUIRE(initial.tasks.empty());
    REQUIRE(initial.current_layer == 0);

    REQUIRE(next.current_layer == 1);
    REQUIRE(next.tasks.size() == 2);
    REQUIRE(next.decisions.size() == 1);
    REQUIRE(next.messages.size() == 1);
    REQUIRE(next.context["k"] == "v");

    auto summary = summarize_state(next);
    REQUIRE(summary.succeeded == 1);
    REQUIRE(summary.failed_safe == 1);
    REQUIRE(summary.failed == 0);
    REQUIRE(summary.decisions == 1);
}

TEST_CASE("Invariant violations leave the input untouched", "[state][invariant]") {
    auto state = create_initial_state("wf-1");

    StateUpdate bad_layer;
    bad_layer.current_layer = -1;
    REQUIRE_THROWS_AS(update_state(state, bad_layer), StateInvariantError);

    StateUpdate too_many_decisions;
    too_many_decisions.decisions = {approval("approved")};
    try {
        update_state(state, too_many_decisions);
        FAIL("expected StateInvariantError");
    } catch (const StateInvariantError& e) {
        REQUIRE(std::string(e.what()) ==
                "State invariant violated: tasks.length (0) must be >= decisions.length (1)");
    }
    REQUIRE(state.decisions.empty());

    WorkflowState negative = state;
    negative.current_layer = -3;
    try {
        validate_state_invariants(negative);
        FAIL("expected StateInvariantError");
    } catch (const StateInvariantError& e) {
        REQUIRE(std::string(e.what()) == "State invariant violated: current_layer must be >= 0 (got -3)");
    }
}

TEST_CASE("State survives a JSON round trip", "[state][json]") {
    StateUpdate update;
    update.current_layer = 2;
    update.tasks = {result("a", TaskStatus::SUCCESS), result("b", TaskStatus::ERROR)};
    update.decisions = {approval("rejected")};
    auto state = update_state(create_initial_state("wf-9", Context{{"x", 1}}), update);

    auto json = workflow_state_to_json(state);
    REQUIRE(json["decisions"][0]["type"] == "HIL");

    auto restored = workflow_state_from_json(json);
    REQUIRE(restored.workflow_id == "wf-9");
    REQUIRE(restored.current_layer == 2);
    REQUIRE(restored.tasks.size() == 2);
    REQUIRE(restored.tasks[1].status == TaskStatus::ERROR);
    REQUIRE(restored.decisions[0].outcome == "rejected");
    REQUIRE(restored.context["x"] == 1);
}
