#include <catch2/catch_test_macros.hpp>
#include "stores/memory_store.hpp"
#include <thread>
#include <vector>

using namespace chatmux;

static TurnRecord record(const std::string& user, const std::string& assistant,
                         uint64_t at = 1000) {
    TurnRecord r;
    r.user.content = user;
    r.user.created_at = at;
    r.assistant.role = Role::Assistant;
    r.assistant.content = assistant;
    r.assistant.created_at = at;
    return r;
}

TEST_CASE("MemoryThreadStore: append and history", "[memory_store]") {
    MemoryThreadStore store;
    REQUIRE(store.append("t", "u1", record("q", "a")).status == AppendStatus::Success);
    auto h = store.get_history("t");
    REQUIRE(h.size() == 2);
    REQUIRE(h[0].content == "q");
    REQUIRE(h[1].role == Role::Assistant);
    REQUIRE(store.has_thread("t"));
}

TEST_CASE("MemoryThreadStore: duplicate turn id is deduplicated", "[memory_store]") {
    MemoryThreadStore store;
    store.append("t", "u1", record("q", "a"));
    REQUIRE(store.append("t", "u1", record("q", "a")).status == AppendStatus::AlreadyExists);
    REQUIRE(store.get_history("t").size() == 2);
}

TEST_CASE("MemoryThreadStore: list ordered by updated_at", "[memory_store]") {
    MemoryThreadStore store;
    store.append("a", "u", record("first", "x", 10));
    store.append("b", "u", record("second", "x", 20));
    store.append("a", "u2", record("again", "x", 30));
    auto list = store.list_threads();
    REQUIRE(list.size() == 2);
    REQUIRE(list[0].thread_id == "a");
    REQUIRE(list[0].title == "first");
    REQUIRE(list[0].message_count == 4);
    REQUIRE(list[1].thread_id == "b");
}

TEST_CASE("MemoryThreadStore: remove tombstones the id", "[memory_store]") {
    MemoryThreadStore store;
    store.append("t", "u1", record("q", "a"));
    REQUIRE(store.remove("t").status == RemoveStatus::Success);
    REQUIRE(store.remove("t").status == RemoveStatus::NotFound);
    REQUIRE(store.append("t", "u2", record("q", "a")).status == AppendStatus::ThreadDeleted);
    REQUIRE(store.list_threads().empty());
}

TEST_CASE("MemoryThreadStore: concurrent appends to distinct threads", "[memory_store]") {
    MemoryThreadStore store;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, i] {
            for (int k = 0; k < 25; ++k) {
                store.append("t" + std::to_string(i), "u" + std::to_string(k), record("q", "a"));
            }
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(store.list_threads().size() == 8);
    REQUIRE(store.get_history("t3").size() == 50);
}
