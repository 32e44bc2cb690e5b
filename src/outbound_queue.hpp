#pragma once
#include "frame.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace chatmux {

// Bounded FIFO between a connection's turns (producers) and its writer
// (consumer). Never drops: push() blocks while full.
class OutboundQueue {
public:
    explicit OutboundQueue(size_t capacity);

    // Blocks while full. Returns false without enqueuing when the queue is
    // closed or abort is set. Set abort, then call interrupt() to wake.
    bool push(OutboundFrame frame, const std::atomic<bool>* abort = nullptr);

    // Blocks while empty. Returns nullopt once closed and drained.
    std::optional<OutboundFrame> pop();

    // Wake blocked producers so they re-check their abort flags.
    void interrupt();

    // Refuse further pushes and wake everyone. Frames already queued are
    // still handed out by pop().
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<OutboundFrame> frames_;
    bool closed_ = false;
};

} // namespace chatmux
