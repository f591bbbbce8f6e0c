#include <catch2/catch_test_macros.hpp>

#include "random_source.hpp"
#include "seed_data.hpp"
#include "thread_store.hpp"

#include <set>
#include <string>

namespace {

NewThread new_thread(int64_t now = 100) {
    return NewThread{
        .name = std::nullopt,
        .cwd = "/work",
        .model_provider = "openai",
        .now = now,
        .cli_version = "0.1.0",
        .source = ThreadSource::AppServer,
    };
}

bool contains(const std::vector<Thread>& threads, const std::string& id) {
    for (auto& t : threads) {
        if (t.id == id) return true;
    }
    return false;
}

} // namespace

TEST_CASE("ThreadStore", "[threads]") {
    RandomSource random(42);
    ThreadStore store(random);

    SECTION("EmptyStore") {
        REQUIRE(store.list(true).empty());
        REQUIRE(store.find("anything") == nullptr);
        REQUIRE(store.turns("anything").empty());
        REQUIRE(store.loaded().empty());
    }

    SECTION("CreateInsertsAtFront") {
        auto first = store.create(new_thread()).id;
        auto second = store.create(new_thread()).id;

        auto threads = store.list(false);
        REQUIRE(threads.size() == 2);
        REQUIRE(threads[0].id == second);
        REQUIRE(threads[1].id == first);
        REQUIRE(threads[0].source == ThreadSource::AppServer);
        REQUIRE_FALSE(threads[0].name.has_value());
        REQUIRE(threads[0].created_at == 100);
        REQUIRE(store.turns(first).empty());
    }

    SECTION("CreatedIdsAreDistinct") {
        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i) {
            auto& t = store.create(new_thread());
            REQUIRE(t.id.starts_with("thread-"));
            ids.insert(t.id);
        }
        REQUIRE(ids.size() == 200);
    }

    SECTION("InsertRejectsDuplicateId") {
        seed_demo_data(store, 1000);
        Thread dup{.id = "thread-001-abc"};
        REQUIRE_FALSE(store.insert(dup));
        REQUIRE(store.active_count() == 3);
    }

    SECTION("ArchiveMovesBetweenCollections") {
        seed_demo_data(store, 1000);

        REQUIRE(store.archive("thread-002-def"));
        REQUIRE_FALSE(contains(store.list(false), "thread-002-def"));

        auto all = store.list(true);
        REQUIRE(contains(all, "thread-002-def"));
        REQUIRE(store.find("thread-002-def")->archived);
        REQUIRE(store.active_count() == 2);
        REQUIRE(store.archived_count() == 2);
    }

    SECTION("ArchiveUnknownIsNoOp") {
        seed_demo_data(store, 1000);
        REQUIRE_FALSE(store.archive("nonexistent"));
        // Already archived threads are not in the active collection
        REQUIRE_FALSE(store.archive("thread-004-old"));
        REQUIRE(store.active_count() == 3);
        REQUIRE(store.archived_count() == 1);
    }

    SECTION("UnarchiveIsInverseOfArchive") {
        seed_demo_data(store, 1000);

        REQUIRE(store.archive("thread-001-abc"));
        REQUIRE(store.unarchive("thread-001-abc"));

        REQUIRE(contains(store.list(false), "thread-001-abc"));
        REQUIRE_FALSE(store.find("thread-001-abc")->archived);
        REQUIRE(store.active_count() == 3);
        REQUIRE(store.archived_count() == 1);
    }

    SECTION("UnarchiveAppendsToActive") {
        seed_demo_data(store, 1000);
        REQUIRE(store.unarchive("thread-004-old"));
        auto active = store.list(false);
        REQUIRE(active.back().id == "thread-004-old");
        REQUIRE_FALSE(store.unarchive("thread-004-old"));
    }

    SECTION("RenameInPlace") {
        seed_demo_data(store, 1000);
        REQUIRE(store.rename("thread-003-ghi", "New name"));
        REQUIRE(store.find("thread-003-ghi")->name == "New name");
        REQUIRE(store.rename("thread-004-old", "Archived rename"));
        REQUIRE_FALSE(store.rename("nonexistent", "x"));
    }

    SECTION("SetStatusTouchesUpdatedAt") {
        seed_demo_data(store, 1000);
        REQUIRE(store.set_status("thread-001-abc", {ThreadStatusType::Active, {}}, 2000));
        auto* t = store.find("thread-001-abc");
        REQUIRE(t->status.type == ThreadStatusType::Active);
        REQUIRE(t->updated_at == 2000);
        REQUIRE_FALSE(store.set_status("nonexistent", {}, 2000));
    }

    SECTION("SeedData") {
        seed_demo_data(store, 1000);
        REQUIRE(store.active_count() == 3);
        REQUIRE(store.archived_count() == 1);
        REQUIRE(store.find("thread-004-old")->status.type == ThreadStatusType::NotLoaded);
        REQUIRE(store.turns("thread-001-abc").size() == 1);
        REQUIRE(store.turns("thread-001-abc")[0].items.size() == 5);
        REQUIRE(store.turns("thread-003-ghi").empty());
        REQUIRE(store.loaded() == std::vector<std::string>{"thread-001-abc", "thread-002-def"});
    }

    SECTION("LoadedSetHasNoDuplicates") {
        REQUIRE(store.mark_loaded("a"));
        REQUIRE_FALSE(store.mark_loaded("a"));
        REQUIRE(store.mark_loaded("b"));
        REQUIRE(store.is_loaded("a"));
        REQUIRE_FALSE(store.is_loaded("c"));
        REQUIRE(store.loaded().size() == 2);
    }

    SECTION("TurnHistoryAccumulates") {
        auto id = store.create(new_thread()).id;
        store.append_turn(id, Turn{.id = "turn-a", .items = {}});
        store.append_turn(id, Turn{.id = "turn-b", .items = {AgentMessageItem{"item-1", "hi"}}});

        REQUIRE(store.turns(id).size() == 2);
        auto* turn = store.find_turn(id, "turn-b");
        REQUIRE(turn != nullptr);
        REQUIRE(item_id(turn->items[0]) == "item-1");
        REQUIRE(store.find_turn(id, "turn-c") == nullptr);
    }
}
