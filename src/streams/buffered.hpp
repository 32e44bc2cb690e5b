#pragma once
#include "../stream_client.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace chatmux {

// Bridges a push-style producer (an HTTP transfer delivering chunks through a
// callback) to the pull-style FragmentStream. The producer runs on its own
// thread and blocks in push() while the buffer is full, so a slow consumer
// stalls the transfer rather than growing memory.
class BufferedFragmentStream : public FragmentStream {
public:
    using Producer = std::function<void(BufferedFragmentStream& out)>;

    explicit BufferedFragmentStream(size_t capacity = 64);
    ~BufferedFragmentStream() override;

    BufferedFragmentStream(const BufferedFragmentStream&) = delete;
    BufferedFragmentStream& operator=(const BufferedFragmentStream&) = delete;

    // Launch the producer thread. A producer that returns without calling
    // finish() or fail() finishes the stream; an exception fails it.
    void start(Producer producer);

    StreamItem next() override;
    void abandon() override;

    // ── Producer side ──
    // Blocks while full. Returns false once the consumer abandoned.
    bool push(std::string fragment);
    void finish();
    void fail(const std::string& reason);

    // Set when abandon() was called; handed to the HTTP transfer.
    const std::atomic<bool>* abandon_flag() const { return &abandoned_; }
    bool abandoned() const { return abandoned_.load(); }

private:
    const size_t capacity_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> buffer_;
    bool finished_ = false;
    std::optional<std::string> error_;
    std::atomic<bool> abandoned_{false};
    std::thread producer_;
};

} // namespace chatmux
