#pragma once
#include "frame.hpp"
#include "stream_client.hpp"
#include "thread_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chatmux {

class UploadStore;

enum class TurnState {
    Composing,
    Dispatched,
    Streaming,
    Finalizing,
    Completed,
    Failed,
    Cancelled,
};

const char* turn_state_name(TurnState state);

// Where a turn delivers its events. emit() blocks while the channel is full
// and returns false when the frame was not delivered (channel closed, or
// abort set). interrupt() wakes an emit() blocked on a full channel.
struct TurnSink {
    std::function<bool(OutboundFrame frame, const std::atomic<bool>* abort)> emit;
    std::function<void()> interrupt;
};

struct TurnOptions {
    uint32_t deadline_ms = 0;       // 0 = none
    uint32_t persist_attempts = 3;
    uint32_t persist_backoff_ms = 100;
    std::string default_language = "English";
};

// One user message and the assistant reply it produces:
// Composing → Dispatched → Streaming → Finalizing → Completed | Failed | Cancelled.
// run() drives the whole sequence on the calling thread; cancel() may be
// called from any thread at any time.
class Turn {
public:
    Turn(std::string thread_id, std::string turn_id, InboundFrame input,
         ThreadStore& store, StreamClient& client, const UploadStore* uploads,
         TurnSink sink, TurnOptions options = {});
    ~Turn();

    Turn(const Turn&) = delete;
    Turn& operator=(const Turn&) = delete;

    // Emits started, fragments seq 0..n, then exactly one of completed,
    // failed or cancelled.
    void run();

    // Abandons the AI stream (once), skips persistence. Idempotent.
    void cancel();

    // Append the turn record. Safe to call repeatedly: a record that already
    // exists counts as persisted. Retries store errors with the same turn id,
    // except on a deleted thread.
    bool finalize();

    TurnState state() const { return state_.load(); }
    bool is_terminal() const;
    bool cancelled() const { return cancelled_.load(); }

    const std::string& thread_id() const { return thread_id_; }
    const std::string& turn_id() const { return turn_id_; }

    std::string full_text() const;
    std::string failure_reason() const;

private:
    StreamRequest compose();
    void abandon_stream();
    void start_watchdog();
    void stop_watchdog();

    OutboundFrame make_frame(FrameKind kind, std::string payload = {}) const;
    void finish_completed();
    void finish_failed(const std::string& reason);
    void finish_cancelled();

    std::string thread_id_;
    std::string turn_id_;
    InboundFrame input_;
    ThreadStore& store_;
    StreamClient& client_;
    const UploadStore* uploads_;
    TurnSink sink_;
    TurnOptions options_;

    std::atomic<TurnState> state_{TurnState::Composing};
    std::atomic<bool> stop_{false};        // cancel or deadline; aborts emits
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> deadline_hit_{false};
    std::atomic<bool> stream_abandoned_{false};

    mutable std::mutex mutex_;  // guards stream_, text_, failure_, persist_error_
    std::unique_ptr<FragmentStream> stream_;
    std::string text_;
    std::string failure_;
    std::string persist_error_;
    uint64_t created_at_ = 0;

    std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    bool watch_done_ = false;
    std::thread watchdog_;
};

} // namespace chatmux
