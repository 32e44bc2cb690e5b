#include <catch2/catch_test_macros.hpp>
#include "streams/sse.hpp"
#include <vector>

using namespace chatmux;

static std::vector<SSEEvent> feed_all(SSEParser& parser, const std::vector<std::string>& chunks) {
    std::vector<SSEEvent> events;
    for (const auto& c : chunks) {
        parser.feed(c, [&](const SSEEvent& e) {
            events.push_back(e);
            return true;
        });
    }
    return events;
}

TEST_CASE("SSEParser: single data event", "[sse]") {
    SSEParser parser;
    auto events = feed_all(parser, {"data: {\"a\":1}\n\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "{\"a\":1}");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: event split across chunks at any byte", "[sse]") {
    SSEParser parser;
    auto events = feed_all(parser, {"da", "ta: hel", "lo\r", "\n", "\r\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

TEST_CASE("SSEParser: named event and multi-line data", "[sse]") {
    SSEParser parser;
    auto events = feed_all(parser, {"event: update\ndata: one\ndata:two\n\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "update");
    REQUIRE(events[0].data == "one\ntwo");
}

TEST_CASE("SSEParser: comments and unknown fields ignored", "[sse]") {
    SSEParser parser;
    auto events = feed_all(parser, {": keep-alive\nid: 7\nretry: 100\ndata: x\n\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
}

TEST_CASE("SSEParser: blank lines without data dispatch nothing", "[sse]") {
    SSEParser parser;
    auto events = feed_all(parser, {"\n\n\nevent: ping\n\n"});
    REQUIRE(events.empty());
}

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    int seen = 0;
    bool more = parser.feed("data: 1\n\ndata: 2\n\n", [&](const SSEEvent&) {
        ++seen;
        return false;
    });
    REQUIRE_FALSE(more);
    REQUIRE(seen == 1);
}

TEST_CASE("SSEParser: finish flushes an unterminated event", "[sse]") {
    SSEParser parser;
    std::vector<std::string> data;
    auto cb = [&](const SSEEvent& e) {
        data.push_back(e.data);
        return true;
    };
    parser.feed("data: tail", cb);
    REQUIRE(data.empty());
    parser.finish(cb);
    REQUIRE(data.size() == 1);
    REQUIRE(data[0] == "tail");
}

TEST_CASE("SSEParser: reset discards partial input", "[sse]") {
    SSEParser parser;
    parser.feed("data: partial", [](const SSEEvent&) { return true; });
    parser.reset();
    auto events = feed_all(parser, {"data: fresh\n\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
}
