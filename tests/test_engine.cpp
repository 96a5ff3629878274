// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentflow/core/engine.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include "test_support.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

using namespace agentflow;
using agentflow::testing::FakeSandbox;
using agentflow::testing::ManualClock;
using agentflow::testing::fast_config;

namespace {

DAGStructure three_layers() {
    return DAGStructure({Task::make_code("a", "a"), Task::make_code("b", "b", {"a"}), Task::make_code("c", "c", {"b"})});
}

ExecuteOptions with_id(const WorkflowId& id, bool per_layer_validation = false) {
    ExecuteOptions options;
    options.workflow_id = id;
    options.per_layer_validation = per_layer_validation;
    return options;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& content) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() / ("agentflow-config-" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

const TaskResult* result_of(const WorkflowRun& run, const TaskId& id) {
    for (const auto& result : run.results) {
        if (result.task_id == id) return &result;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Engine runs a workflow to completion", "[engine]") {
    WorkflowEngine engine(fast_config());
    auto sandbox = std::make_shared<FakeSandbox>();
    engine.set_sandbox(sandbox);

    auto run = engine.execute(three_layers(), with_id("wf-done"));
    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE(run.results.size() == 3);
    REQUIRE(run.stats.layers_executed == 3);
    REQUIRE(engine.status("wf-done") == std::optional<WorkflowStatus>(WorkflowStatus::COMPLETE));

    auto json = workflow_run_to_json(run);
    REQUIRE(json["status"] == "complete");
    REQUIRE(json["stats"]["succeeded"] == 3);
    REQUIRE_FALSE(json.contains("reason"));
}

TEST_CASE("Generated workflow ids are unique", "[engine]") {
    auto first = generate_workflow_id();
    REQUIRE(first.rfind("wf-", 0) == 0);
    REQUIRE(first != generate_workflow_id());

    WorkflowEngine engine(fast_config());
    engine.set_sandbox(std::make_shared<FakeSandbox>());
    auto run = engine.execute(three_layers());
    REQUIRE(run.workflow_id.rfind("wf-", 0) == 0);
}

TEST_CASE("Tool tasks go through registered clients", "[engine][tools]") {
    EngineConfig config = fast_config();
    config.routing.cloud_servers = {"inventory"};
    WorkflowEngine engine(config);
    engine.register_tool_client("inventory", [](const std::string& action, const Value& args) {
        return Value{{"action", action}, {"args", args}};
    });

    DAGStructure dag({
        Task::make_tool("lookup", "inventory:lookup", {}, Value{{"sku", "A1"}}),
        Task::make_tool("reserve", "inventory:reserve", {"lookup"}, Value{{"item", "$OUTPUT[lookup].args.sku"}}),
        Task::make_tool("notify", "pager:send"),
    });
    auto run = engine.execute(dag, with_id("wf-tools"));

    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE(result_of(run, "reserve")->output->at("args")["item"] == "A1");
    // 未注册的 server: 任务失败, 工作流不中断
    REQUIRE(result_of(run, "notify")->status == TaskStatus::ERROR);
    REQUIRE(run.stats.failed == 1);

    auto layers = engine.trace().get_traces(TraceEventType::LAYER_START);
    REQUIRE(layers[0].payload["routing"]["lookup"] == to_string(RoutingTarget::CLOUD));
    REQUIRE(layers[0].payload["routing"]["notify"] == to_string(RoutingTarget::LOCAL));
}

TEST_CASE("Engine pauses for approval and resumes on approve", "[engine][hil]") {
    WorkflowEngine engine(fast_config());
    auto sandbox = std::make_shared<FakeSandbox>();
    engine.set_sandbox(sandbox);

    auto run = engine.execute(three_layers(), with_id("wf-hil", true));
    int approvals = 0;
    while (run.status == WorkflowStatus::PAUSED_FOR_APPROVAL) {
        REQUIRE(run.checkpoint_id.has_value());
        REQUIRE_FALSE(run.summary.empty());
        REQUIRE(engine.status("wf-hil") == std::optional<WorkflowStatus>(WorkflowStatus::PAUSED_FOR_APPROVAL));
        run = engine.approve("wf-hil", *run.checkpoint_id, true);
        approvals++;
    }
    REQUIRE(approvals == 3);
    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE(sandbox->calls("c") == 1);
}

TEST_CASE("Engine aborts on rejection or explicit abort", "[engine][hil]") {
    WorkflowEngine engine(fast_config());
    engine.set_sandbox(std::make_shared<FakeSandbox>());

    SECTION("rejection") {
        auto paused = engine.execute(three_layers(), with_id("wf-reject", true));
        auto run = engine.approve("wf-reject", *paused.checkpoint_id, false, std::string("wrong target"));
        REQUIRE(run.status == WorkflowStatus::ABORTED);
        REQUIRE(run.reason == "Workflow aborted by human: wrong target");
        REQUIRE(engine.status("wf-reject") == std::optional<WorkflowStatus>(WorkflowStatus::ABORTED));
    }

    SECTION("abort") {
        engine.execute(three_layers(), with_id("wf-abort", true));
        auto run = engine.abort("wf-abort", "operator request");
        REQUIRE(run.status == WorkflowStatus::ABORTED);
        REQUIRE(run.reason == "Workflow aborted by agent: operator request");
        REQUIRE(run.results.size() == 1);
    }
}

TEST_CASE("Replan while paused extends the running workflow", "[engine][command]") {
    WorkflowEngine engine(fast_config());
    auto sandbox = std::make_shared<FakeSandbox>();
    engine.set_sandbox(sandbox);

    auto paused = engine.execute(three_layers(), with_id("wf-replan", true));
    auto still_paused = engine.replan("wf-replan", "add a summary", {Task::make_code("summary", "summary", {"c"})});
    REQUIRE(still_paused.status == WorkflowStatus::PAUSED_FOR_APPROVAL);
    REQUIRE(still_paused.stats.replans == 1);
    REQUIRE(still_paused.stats.pending == 3);

    auto run = engine.approve("wf-replan", *paused.checkpoint_id, true);
    while (run.status == WorkflowStatus::PAUSED_FOR_APPROVAL) {
        run = engine.approve("wf-replan", *run.checkpoint_id, true);
    }
    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE(sandbox->calls("summary") == 1);
}

TEST_CASE("A rejected command keeps the workflow and its queued commands", "[engine][command]") {
    WorkflowEngine engine(fast_config());
    auto sandbox = std::make_shared<FakeSandbox>();
    engine.set_sandbox(sandbox);
    auto paused = engine.execute(three_layers(), with_id("wf-bad-cmd", true));
    REQUIRE(paused.status == WorkflowStatus::PAUSED_FOR_APPROVAL);

    engine.send_command("wf-bad-cmd", InjectTasksCommand{{Task::make_code("a", "again")}, 1});

    SECTION("abort queued behind it still ends the workflow") {
        REQUIRE_THROWS_AS(engine.abort("wf-bad-cmd", "stop now"), DagValidationError);
        REQUIRE(engine.status("wf-bad-cmd") == std::optional<WorkflowStatus>(WorkflowStatus::ABORTED));
        REQUIRE(sandbox->calls("b") == 0);
    }

    SECTION("the workflow stays active and can be approved") {
        REQUIRE_THROWS_AS(engine.continue_workflow("wf-bad-cmd"), DagValidationError);
        REQUIRE(engine.status("wf-bad-cmd") == std::optional<WorkflowStatus>(WorkflowStatus::RUNNING));

        auto run = engine.continue_workflow("wf-bad-cmd");
        while (run.status == WorkflowStatus::PAUSED_FOR_APPROVAL) {
            run = engine.approve("wf-bad-cmd", *run.checkpoint_id, true);
        }
        REQUIRE(run.status == WorkflowStatus::COMPLETE);
        REQUIRE(sandbox->calls("again") == 0);
        REQUIRE(sandbox->calls("c") == 1);
    }
}

TEST_CASE("Concurrent executes with the same id start one workflow", "[engine][concurrency]") {
    WorkflowEngine engine(fast_config());
    engine.set_sandbox(std::make_shared<FakeSandbox>());

    std::atomic<bool> go{false};
    std::atomic<int> started{0};
    std::atomic<int> refused{0};
    auto attempt = [&] {
        while (!go.load()) std::this_thread::yield();
        try {
            engine.execute(three_layers(), with_id("wf-race", true));
            started++;
        } catch (const StateInvariantError&) {
            refused++;
        }
    };
    std::thread first(attempt);
    std::thread second(attempt);
    go = true;
    first.join();
    second.join();

    REQUIRE(started.load() == 1);
    REQUIRE(refused.load() == 1);
    REQUIRE(engine.status("wf-race") == std::optional<WorkflowStatus>(WorkflowStatus::PAUSED_FOR_APPROVAL));
}

TEST_CASE("A second engine rehydrates a paused workflow from shared stores", "[engine][stateless]") {
    auto records = std::make_shared<InMemoryWorkflowRecordStore>();
    auto checkpoints = std::make_shared<InMemoryCheckpointStore>();
    auto sandbox = std::make_shared<FakeSandbox>();

    std::string checkpoint_id;
    {
        WorkflowEngine first(fast_config());
        first.set_sandbox(sandbox);
        first.set_record_store(records);
        first.set_checkpoint_store(checkpoints);
        auto paused = first.execute(three_layers(), with_id("wf-shared", true));
        checkpoint_id = *paused.checkpoint_id;
    }

    WorkflowEngine second(fast_config());
    second.set_sandbox(sandbox);
    second.set_record_store(records);
    second.set_checkpoint_store(checkpoints);
    REQUIRE(second.status("wf-shared") == std::optional<WorkflowStatus>(WorkflowStatus::RUNNING));

    auto run = second.approve("wf-shared", checkpoint_id, true);
    // 每层审批的设置随检查点恢复
    REQUIRE(run.status == WorkflowStatus::PAUSED_FOR_APPROVAL);
    REQUIRE(sandbox->calls("a") == 1);
    REQUIRE(sandbox->calls("b") == 1);

    while (run.status == WorkflowStatus::PAUSED_FOR_APPROVAL) {
        run = second.approve("wf-shared", *run.checkpoint_id, true);
    }
    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE_FALSE(records->get("wf-shared").has_value());
}

TEST_CASE("Unknown workflows are reported", "[engine][stateless]") {
    WorkflowEngine engine(fast_config());
    REQUIRE_THROWS_AS(engine.continue_workflow("wf-ghost"), RecordNotFoundError);
    REQUIRE_FALSE(engine.status("wf-ghost").has_value());

    auto records = std::make_shared<InMemoryWorkflowRecordStore>();
    records->save("wf-orphan", three_layers());
    engine.set_record_store(records);
    REQUIRE_THROWS_AS(engine.continue_workflow("wf-orphan"), CheckpointNotFoundError);
}

TEST_CASE("Expired records release paused workflows", "[engine][ttl]") {
    ManualClock clock;
    auto records = std::make_shared<InMemoryWorkflowRecordStore>(std::chrono::seconds(10), clock.clock());
    WorkflowEngine engine(fast_config());
    engine.set_sandbox(std::make_shared<FakeSandbox>());
    engine.set_record_store(records);

    engine.execute(three_layers(), with_id("wf-stale", true));
    REQUIRE(engine.cleanup_expired() == 0);

    clock.advance(std::chrono::seconds(11));
    REQUIRE(engine.cleanup_expired() == 1);
    REQUIRE(engine.status("wf-stale") == std::optional<WorkflowStatus>(WorkflowStatus::ABORTED));
}

TEST_CASE("await_approval applies a queued response or times out", "[engine][hil]") {
    EngineConfig config = fast_config();
    config.timeouts.hil_ms = 20;
    WorkflowEngine engine(config);
    engine.set_sandbox(std::make_shared<FakeSandbox>());

    SECTION("queued approval") {
        auto paused = engine.execute(three_layers(), with_id("wf-wait", true));
        engine.send_command("wf-wait", ApprovalResponseCommand{*paused.checkpoint_id, true, std::nullopt});
        auto run = engine.await_approval("wf-wait");
        REQUIRE(run.status == WorkflowStatus::PAUSED_FOR_APPROVAL);
        REQUIRE(run.stats.layers_executed == 2);
    }

    SECTION("timeout") {
        engine.execute(three_layers(), with_id("wf-timeout", true));
        auto run = engine.await_approval("wf-timeout");
        REQUIRE(run.status == WorkflowStatus::ABORTED);
        REQUIRE(run.reason == "Workflow aborted: HIL approval timeout");
    }

    SECTION("approval from another thread") {
        auto paused = engine.execute(three_layers(), with_id("wf-async", true));
        EngineConfig patient = config;
        patient.timeouts.hil_ms = 5000;
        engine.reload_config(patient);
        std::thread approver([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            engine.send_command("wf-async", ApprovalResponseCommand{*paused.checkpoint_id, true, std::nullopt});
        });
        auto run = engine.await_approval("wf-async");
        approver.join();
        REQUIRE(run.status == WorkflowStatus::PAUSED_FOR_APPROVAL);
    }
}

TEST_CASE("Agent decision points wait briefly and continue", "[engine][ail]") {
    EngineConfig config = fast_config();
    config.ail.enabled = true;
    config.ail.decision_points = DecisionPointMode::PER_LAYER;
    config.timeouts.ail_ms = 5;
    WorkflowEngine engine(config);
    engine.set_sandbox(std::make_shared<FakeSandbox>());

    auto run = engine.execute(three_layers(), with_id("wf-ail"));
    REQUIRE(run.status == WorkflowStatus::COMPLETE);
    REQUIRE(engine.trace().get_traces(TraceEventType::DECISION_REQUIRED).size() == 3);
}

TEST_CASE("Engine config loads from YAML", "[engine][config]") {
    auto path = write_temp_file("engine.yaml", R"(
version: 4
log_level: warning
scheduler:
  max_concurrency: 2
  max_replans: 1
hil:
  enabled: true
  approval_required: always
ail:
  decision_points: on_error
timeouts:
  hil_ms: 1000
routing:
  cloud_servers: [github, slack]
store:
  record_ttl_seconds: 60
)");

    auto config = load_engine_config(path.string());
    REQUIRE(config.version == 4);
    REQUIRE(config.scheduler.max_concurrency == 2);
    REQUIRE(config.scheduler.max_replans == 1);
    REQUIRE(config.hil.approval_required == ApprovalMode::ALWAYS);
    REQUIRE(config.ail.decision_points == DecisionPointMode::ON_ERROR);
    REQUIRE(config.timeouts.hil_ms == 1000);
    REQUIRE(config.timeouts.ail_ms == 60000);
    REQUIRE(config.routing.cloud_servers == std::vector<std::string>{"github", "slack"});
    REQUIRE(config.routing.version == 4);
    REQUIRE_FALSE(config.store.directory.has_value());

    auto engine = WorkflowEngine::from_config_file(path.string());
    REQUIRE(engine->config()->scheduler.max_concurrency == 2);
    engine->reload_config_file();
    REQUIRE(engine->config()->version == 5);
    REQUIRE(engine->router().config_version() == 5);

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Invalid engine config is rejected", "[engine][config]") {
    REQUIRE_THROWS_AS(load_engine_config("/nonexistent/agentflow.yaml"), ConfigurationError);
    REQUIRE_THROWS_AS(engine_config_from_json(Value{{"hil", {{"approval_required", "sometimes"}}}}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(engine_config_from_json(Value{{"scheduler", {{"max_replans", "many"}}}}), ConfigurationError);
    REQUIRE_THROWS_AS(engine_config_from_json(Value{{"timeouts", {{"hil_ms", 0}}}}), ConfigurationError);
    REQUIRE_THROWS_AS(engine_config_from_json(Value{{"log_level", "chatty"}}), ConfigurationError);

    WorkflowEngine engine(fast_config());
    REQUIRE_THROWS_AS(engine.reload_config_file(), ConfigurationError);
}

TEST_CASE("ConfigHolder versions every replacement", "[engine][config]") {
    ConfigHolder holder(fast_config());
    auto first = holder.current();
    EngineConfig next = fast_config();
    next.scheduler.max_replans = 7;
    auto second = holder.replace(next);

    REQUIRE(second->version == first->version + 1);
    REQUIRE(second->scheduler.max_replans == 7);
    // 旧快照不受影响
    REQUIRE(first->scheduler.max_replans == 3);
    REQUIRE_THROWS_AS(holder.reload(), ConfigurationError);
}

TEST_CASE("YAML scalars keep quoted strings as strings", "[engine][config]") {
    auto json = parse_yaml_document("quoted: \"123\"\nplain: 123\nflag: true\nratio: 0.5\nnothing: ~\n");
    REQUIRE(json["quoted"] == "123");
    REQUIRE(json["plain"] == 123);
    REQUIRE(json["flag"] == true);
    REQUIRE(json["ratio"] == 0.5);
    REQUIRE(json["nothing"].is_null());
    REQUIRE_THROWS_AS(parse_yaml_document("key: [unclosed"), std::runtime_error);
}
