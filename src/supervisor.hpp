#pragma once
#include "connection.hpp"
#include "session_mux.hpp"
#include <atomic>
#include <mutex>
#include <thread>

namespace chatmux {

// Runs one connection: the calling thread reads and routes inbound frames, a
// writer thread drains the session's outbound queue onto the connection.
class ConnectionSupervisor {
public:
    ConnectionSupervisor(Connection& conn, SessionMultiplexer& mux);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Blocks until the connection ends and teardown has finished.
    void serve();

    // Flip liveness off, close the queue and the connection, cancel and join
    // every turn, join the writer. Idempotent; callable from any thread
    // except the writer.
    void teardown();

    bool live() const { return live_.load(); }
    uint64_t frames_written() const { return frames_written_.load(); }

private:
    void write_loop();

    Connection& conn_;
    SessionMultiplexer& mux_;
    std::atomic<bool> live_{false};
    std::atomic<uint64_t> frames_written_{0};
    std::mutex teardown_mutex_;
    bool torn_down_ = false;
    std::thread writer_;
};

} // namespace chatmux
