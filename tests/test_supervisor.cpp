#include <catch2/catch_test_macros.hpp>
#include "fake_connection.hpp"
#include "recording_store.hpp"
#include "scripted_stream_client.hpp"
#include "supervisor.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using namespace chatmux;
using namespace std::chrono_literals;
using json = nlohmann::json;

static TurnOptions supervisor_options() {
    TurnOptions o;
    o.persist_backoff_ms = 1;
    return o;
}

static std::vector<json> parsed(const std::vector<std::string>& written) {
    std::vector<json> out;
    for (const auto& w : written) out.push_back(json::parse(w));
    return out;
}

static bool has_kind(const std::vector<std::string>& written, const std::string& kind) {
    for (const auto& w : written) {
        if (json::parse(w)["kind"] == kind) return true;
    }
    return false;
}

TEST_CASE("ConnectionSupervisor: streams a turn to the connection", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    client.default_script.fragments = {"Hi", " there", "!"};
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 16);
    FakeConnection conn;
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound(R"({"text":"hello"})");
    REQUIRE(conn.wait_for_written([](const std::vector<std::string>& w) {
        return has_kind(w, "completed");
    }));
    conn.hang_up();
    server.join();

    auto frames = parsed(conn.written());
    REQUIRE(frames.size() == 5);
    REQUIRE(frames[0]["kind"] == "started");
    REQUIRE(frames[1]["seq"] == 0);
    REQUIRE(frames[3]["seq"] == 2);
    REQUIRE(frames[4]["payload"] == "Hi there!");
    REQUIRE(sup.frames_written() == 5);
    REQUIRE_FALSE(sup.live());
}

TEST_CASE("ConnectionSupervisor: malformed frame keeps the connection open", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    client.default_script.fragments = {"ok"};
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 16);
    FakeConnection conn;
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound("not json at all");
    conn.push_inbound(R"({"thread_id":"T1"})");
    conn.push_inbound(R"({"thread_id":"T1","text":"hi"})");
    REQUIRE(conn.wait_for_written([](const std::vector<std::string>& w) {
        return has_kind(w, "completed");
    }));
    conn.hang_up();
    server.join();

    auto frames = parsed(conn.written());
    REQUIRE(frames[0]["kind"] == "protocol_error");
    REQUIRE(frames[0]["code"] == "bad_frame");
    REQUIRE(frames[1]["kind"] == "protocol_error");
    REQUIRE(frames.back()["thread_id"] == "T1");
    REQUIRE(store.get_history("T1").size() == 2);
}

TEST_CASE("ConnectionSupervisor: slow client loses no fragments", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    for (int i = 0; i < 30; ++i) client.default_script.fragments.push_back("w" + std::to_string(i));
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 2);
    FakeConnection conn;
    conn.set_write_blocked(true);
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound(R"({"thread_id":"T1","text":"count"})");
    std::this_thread::sleep_for(30ms);
    REQUIRE(sup.frames_written() == 0);
    REQUIRE(mux.has_active_turn("T1"));

    conn.set_write_blocked(false);
    REQUIRE(conn.wait_for_written([](const std::vector<std::string>& w) {
        return has_kind(w, "completed");
    }));
    conn.hang_up();
    server.join();

    uint64_t expected = 0;
    for (const auto& f : parsed(conn.written())) {
        if (f["kind"] != "fragment") continue;
        REQUIRE(f["seq"] == expected);
        ++expected;
    }
    REQUIRE(expected == 30);
}

TEST_CASE("ConnectionSupervisor: hang-up cancels active turns", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    client.default_script.fragments = {"partial"};
    client.default_script.hang = true;
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 16);
    FakeConnection conn;
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound(R"({"thread_id":"A","text":"one"})");
    conn.push_inbound(R"({"thread_id":"B","text":"two"})");
    REQUIRE(conn.wait_for_written([](const std::vector<std::string>& w) {
        int fragments = 0;
        for (const auto& s : w) {
            if (json::parse(s)["kind"] == "fragment") ++fragments;
        }
        return fragments == 2;
    }));

    conn.hang_up();
    server.join();

    REQUIRE(mux.active_turn_count() == 0);
    REQUIRE(client.counters->abandons.load() == 2);
    REQUIRE(client.counters->live.load() == 0);
    REQUIRE(store.append_calls.load() == 0);
}

TEST_CASE("ConnectionSupervisor: write failure tears the session down", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    client.default_script.hang = true;
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 16);
    FakeConnection conn;
    conn.set_fail_writes(true);
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound(R"({"thread_id":"T1","text":"hi"})");
    server.join();

    REQUIRE(conn.closed());
    REQUIRE_FALSE(sup.live());
    REQUIRE(conn.written().empty());
    REQUIRE(mux.active_turn_count() == 0);
    REQUIRE(client.counters->live.load() == 0);
}

TEST_CASE("ConnectionSupervisor: teardown races a blocked write", "[supervisor]") {
    RecordingStore store;
    ScriptedStreamClient client;
    client.default_script.fragments = {"a", "b", "c"};
    client.default_script.hang = true;
    SessionMultiplexer mux("s1", store, client, nullptr, supervisor_options(), 1);
    FakeConnection conn;
    conn.set_write_blocked(true);
    ConnectionSupervisor sup(conn, mux);

    std::thread server([&] { sup.serve(); });
    conn.push_inbound(R"({"thread_id":"T1","text":"hi"})");
    std::this_thread::sleep_for(20ms);

    sup.teardown();
    server.join();
    sup.teardown();

    REQUIRE(conn.closed());
    REQUIRE(mux.active_turn_count() == 0);
    REQUIRE(client.counters->live.load() == 0);
    REQUIRE(store.append_calls.load() == 0);
}
