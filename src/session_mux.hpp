#pragma once
#include "frame.hpp"
#include "outbound_queue.hpp"
#include "turn.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chatmux {

class ThreadStore;
class StreamClient;
class UploadStore;

// Per-connection routing of inbound frames to turns (at most one active turn
// per thread) and fan-in of every turn's events onto one bounded queue.
class SessionMultiplexer {
public:
    SessionMultiplexer(std::string session_id, ThreadStore& store, StreamClient& client,
                       const UploadStore* uploads, TurnOptions turn_options,
                       size_t queue_capacity);
    ~SessionMultiplexer();

    SessionMultiplexer(const SessionMultiplexer&) = delete;
    SessionMultiplexer& operator=(const SessionMultiplexer&) = delete;

    // Start a turn, reject a conflicting one, or delete a thread. Called from
    // the connection's reader thread only.
    void route(const InboundFrame& frame);

    void report_protocol_error(const std::string& message,
                               const std::string& code = "bad_frame",
                               const std::string& thread_id = "");

    // Blocks for the next frame to write; nullopt once the queue is closed
    // and drained.
    std::optional<OutboundFrame> next_outbound();

    // Refuse further output and wake blocked producers and the writer.
    void close_outbound();

    // Cancel and join every turn, then close the queue. Idempotent.
    void shutdown();

    // Join workers of turns that already reached a terminal state.
    void reap_finished();

    // Wait until no turn is active and every terminal event has been queued.
    // Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    bool has_active_turn(const std::string& thread_id) const;
    size_t active_turn_count() const;
    std::vector<std::string> touched_threads() const;
    bool is_tombstoned(const std::string& thread_id) const;

    const std::string& session_id() const { return session_id_; }
    OutboundQueue& queue() { return queue_; }

private:
    struct ActiveTurn {
        std::shared_ptr<Turn> turn;
        std::thread worker;
    };

    void start_turn(const std::string& thread_id, const InboundFrame& frame);
    void delete_thread(const std::string& thread_id);
    void release_slot(const std::string& thread_id, const std::string& turn_id);
    void on_turn_finished(const std::shared_ptr<Turn>& turn);
    TurnSink make_sink();

    std::string session_id_;
    ThreadStore& store_;
    StreamClient& client_;
    const UploadStore* uploads_;
    TurnOptions turn_options_;
    OutboundQueue queue_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, ActiveTurn> active_;
    std::vector<std::thread> finished_;
    std::set<const Turn*> draining_;  // released, terminal event not yet queued
    std::set<std::string> touched_;
    std::set<std::string> tombstones_;
    bool shutting_down_ = false;
};

} // namespace chatmux
