// tests/test_stores.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/store/checkpoint_store.h"
#include "modules/store/workflow_record_store.h"
#include "test_support.h"
#include <filesystem>
#include <random>

using namespace agentflow;
using namespace std::chrono_literals;
using agentflow::testing::ManualClock;

namespace {

DAGStructure small_dag() {
    return DAGStructure({Task::make_tool("a", "fs:read"), Task::make_tool("b", "fs:write", {"a"})});
}

// 每个测试独立的临时目录, 析构时删除
struct TempDir {
    std::filesystem::path path;
    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() / ("agentflow-test-" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("In-memory records expire after their TTL", "[store][record]") {
    ManualClock clock;
    InMemoryWorkflowRecordStore store(10s, clock.clock());
    store.save("wf-1", small_dag(), std::string("ship it"));

    auto record = store.get_record("wf-1");
    REQUIRE(record.has_value());
    REQUIRE(record->intent == std::optional<std::string>("ship it"));
    REQUIRE(record->expires_at == clock.current + 10s);
    REQUIRE(store.get("wf-1")->size() == 2);

    clock.advance(5s);
    REQUIRE(store.extend_expiration("wf-1"));
    clock.advance(9s);
    REQUIRE(store.get("wf-1").has_value());

    clock.advance(1s);
    REQUIRE_FALSE(store.get("wf-1").has_value());
    REQUIRE_FALSE(store.extend_expiration("wf-1"));
    REQUIRE(store.physical_size() == 1);
    REQUIRE(store.cleanup_expired() == 1);
    REQUIRE(store.physical_size() == 0);
}

TEST_CASE("Record update requires a live record", "[store][record]") {
    ManualClock clock;
    InMemoryWorkflowRecordStore store(60s, clock.clock());
    REQUIRE_THROWS_AS(store.update("missing", small_dag()), RecordNotFoundError);

    store.save("wf-1", small_dag());
    DAGStructure bigger = small_dag();
    bigger.add_tasks({Task::make_tool("c", "fs:list", {"b"})});
    store.update("wf-1", bigger);
    REQUIRE(store.get("wf-1")->size() == 3);

    REQUIRE(store.remove("wf-1"));
    REQUIRE_FALSE(store.remove("wf-1"));
}

TEST_CASE("File records persist across store instances", "[store][record][file]") {
    TempDir dir;
    ManualClock clock;
    {
        FileWorkflowRecordStore store(dir.path, 30s, clock.clock());
        store.save("wf/odd id", small_dag(), std::string("intent"));
        store.save("wf-2", small_dag());
    }

    FileWorkflowRecordStore reopened(dir.path, 30s, clock.clock());
    auto record = reopened.get_record("wf/odd id");
    REQUIRE(record.has_value());
    REQUIRE(record->workflow_id == "wf/odd id");
    REQUIRE(record->dag.size() == 2);

    clock.advance(31s);
    REQUIRE(reopened.cleanup_expired() == 2);
    REQUIRE(reopened.physical_size() == 0);
}

TEST_CASE("File stems encode ids without collisions", "[store][file]") {
    REQUIRE(encode_file_stem("wf-1") == "wf-1");
    REQUIRE(encode_file_stem("team/a") == "team%2Fa");
    REQUIRE(encode_file_stem("team_a") == "team%5Fa");
    REQUIRE(encode_file_stem("100%") == "100%25");
    REQUIRE(encode_file_stem("..") == "%2E%2E");
    REQUIRE(encode_file_stem("") == "%");
}

TEST_CASE("File records with similar ids stay separate", "[store][record][file]") {
    TempDir dir;
    ManualClock clock;
    FileWorkflowRecordStore store(dir.path, 30s, clock.clock());

    store.save("team/a", small_dag(), std::string("slash"));
    store.save("team_a", DAGStructure({Task::make_tool("only", "fs:read")}), std::string("underscore"));
    store.save("team.a", small_dag());
    REQUIRE(store.physical_size() == 3);

    auto slash = store.get_record("team/a");
    REQUIRE(slash.has_value());
    REQUIRE(slash->intent == std::optional<std::string>("slash"));
    REQUIRE(slash->dag.size() == 2);
    REQUIRE(store.get("team_a")->size() == 1);

    REQUIRE(store.remove("team/a"));
    REQUIRE_FALSE(store.get("team/a").has_value());
    REQUIRE(store.get_record("team_a")->intent == std::optional<std::string>("underscore"));
    REQUIRE(store.get("team.a").has_value());
    REQUIRE_FALSE(store.remove("team/a"));
}

TEST_CASE("File stores refuse documents stored under another id", "[store][file]") {
    TempDir dir;
    ManualClock clock;

    SECTION("records") {
        FileWorkflowRecordStore store(dir.path, 30s, clock.clock());
        store.save("owner", small_dag());
        std::filesystem::copy_file(dir.path / "owner.json", dir.path / "intruder.json");

        REQUIRE_THROWS_AS(store.get("intruder"), StateInvariantError);
        REQUIRE_THROWS_AS(store.remove("intruder"), StateInvariantError);
        REQUIRE(std::filesystem::exists(dir.path / "intruder.json"));
        REQUIRE(store.get("owner").has_value());
    }

    SECTION("checkpoints") {
        FileCheckpointStore store(dir.path);
        auto saved = store.save("wf-1", 0, create_initial_state("wf-1"), small_dag(), {}, Value::object());
        std::filesystem::copy_file(dir.path / (encode_file_stem(saved.id) + ".json"),
                                   dir.path / (encode_file_stem("ckpt-copy") + ".json"));

        REQUIRE_THROWS_AS(store.load("ckpt-copy"), StateInvariantError);
        REQUIRE(store.load(saved.id).has_value());
    }
}

TEST_CASE("Checkpoints are saved, loaded and pruned newest first", "[store][checkpoint]") {
    InMemoryCheckpointStore store;
    auto state = create_initial_state("wf-1");

    auto first = store.save("wf-1", 0, state, small_dag(), {}, Value{{"replans", 0}});
    auto second = store.save("wf-1", 1, state, small_dag(), {"b"}, Value::object());
    store.save("wf-2", 0, create_initial_state("wf-2"), small_dag(), {}, Value::object());

    REQUIRE(first.id.rfind("ckpt-", 0) == 0);
    REQUIRE(first.id != second.id);

    auto loaded = store.load(first.id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->layer == 0);
    REQUIRE(loaded->metadata["replans"] == 0);
    REQUIRE(store.latest("wf-1")->id == second.id);
    REQUIRE(store.latest("wf-1")->skipped == std::vector<TaskId>{"b"});
    REQUIRE_FALSE(store.load("ckpt-missing").has_value());

    REQUIRE(store.prune("wf-1", 1) == 1);
    REQUIRE_FALSE(store.load(first.id).has_value());
    REQUIRE(store.size() == 2);

    REQUIRE(store.remove_workflow("wf-2") == 1);
    REQUIRE_FALSE(store.latest("wf-2").has_value());
}

TEST_CASE("File checkpoints keep ordering after reopening", "[store][checkpoint][file]") {
    TempDir dir;
    std::string first_id;
    std::string second_id;
    {
        FileCheckpointStore store(dir.path);
        first_id = store.save("wf-1", 0, create_initial_state("wf-1"), small_dag(), {}, Value::object()).id;
        second_id = store.save("wf-1", 1, create_initial_state("wf-1"), small_dag(), {}, Value::object()).id;
    }

    FileCheckpointStore reopened(dir.path);
    auto third = reopened.save("wf-1", 2, create_initial_state("wf-1"), small_dag(), {}, Value::object());
    REQUIRE(reopened.latest("wf-1")->id == third.id);
    REQUIRE(third.sequence > reopened.load(second_id)->sequence);

    REQUIRE(reopened.prune("wf-1", 2) == 1);
    REQUIRE_FALSE(reopened.load(first_id).has_value());
    REQUIRE(reopened.remove_workflow("wf-1") == 2);
}
