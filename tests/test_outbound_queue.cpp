#include <catch2/catch_test_macros.hpp>
#include "outbound_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace chatmux;
using namespace std::chrono_literals;

static OutboundFrame frame_with(uint64_t seq) {
    OutboundFrame f;
    f.thread_id = "t";
    f.kind = FrameKind::Fragment;
    f.seq = seq;
    return f;
}

TEST_CASE("OutboundQueue: FIFO order", "[outbound_queue]") {
    OutboundQueue q(4);
    REQUIRE(q.push(frame_with(0)));
    REQUIRE(q.push(frame_with(1)));
    REQUIRE(q.size() == 2);
    REQUIRE(q.pop()->seq == 0);
    REQUIRE(q.pop()->seq == 1);
}

TEST_CASE("OutboundQueue: push blocks while full until a pop", "[outbound_queue]") {
    OutboundQueue q(1);
    REQUIRE(q.push(frame_with(0)));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(frame_with(1));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(pushed.load());
    REQUIRE(q.pop()->seq == 0);
    producer.join();
    REQUIRE(pushed.load());
    REQUIRE(q.pop()->seq == 1);
}

TEST_CASE("OutboundQueue: close wakes blocked producer and refuses pushes", "[outbound_queue]") {
    OutboundQueue q(1);
    REQUIRE(q.push(frame_with(0)));

    std::atomic<int> result{-1};
    std::thread producer([&] { result = q.push(frame_with(1)) ? 1 : 0; });
    std::this_thread::sleep_for(20ms);
    q.close();
    producer.join();

    REQUIRE(result.load() == 0);
    REQUIRE_FALSE(q.push(frame_with(2)));
    // already-queued frames are still drained, then nullopt
    REQUIRE(q.pop()->seq == 0);
    REQUIRE_FALSE(q.pop().has_value());
}

TEST_CASE("OutboundQueue: abort flag plus interrupt releases a producer", "[outbound_queue]") {
    OutboundQueue q(1);
    REQUIRE(q.push(frame_with(0)));

    std::atomic<bool> abort{false};
    std::atomic<int> result{-1};
    std::thread producer([&] { result = q.push(frame_with(1), &abort) ? 1 : 0; });
    std::this_thread::sleep_for(20ms);
    abort = true;
    q.interrupt();
    producer.join();

    REQUIRE(result.load() == 0);
    REQUIRE(q.size() == 1);
    REQUIRE_FALSE(q.closed());
}

TEST_CASE("OutboundQueue: pop blocks until a frame arrives", "[outbound_queue]") {
    OutboundQueue q(2);
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        q.push(frame_with(7));
    });
    auto f = q.pop();
    producer.join();
    REQUIRE(f.has_value());
    REQUIRE(f->seq == 7);
}

TEST_CASE("OutboundQueue: zero capacity is treated as one", "[outbound_queue]") {
    OutboundQueue q(0);
    REQUIRE(q.capacity() == 1);
    REQUIRE(q.push(frame_with(0)));
}
