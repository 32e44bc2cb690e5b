#include "outbound_queue.hpp"

namespace chatmux {

OutboundQueue::OutboundQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool OutboundQueue::push(OutboundFrame frame, const std::atomic<bool>* abort) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&] {
        return closed_ || frames_.size() < capacity_ || (abort && abort->load());
    });
    if (closed_ || (abort && abort->load())) return false;
    frames_.push_back(std::move(frame));
    not_empty_.notify_one();
    return true;
}

std::optional<OutboundFrame> OutboundQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) return std::nullopt;
    OutboundFrame frame = std::move(frames_.front());
    frames_.pop_front();
    not_full_.notify_one();
    return frame;
}

void OutboundQueue::interrupt() {
    // Taking the lock orders the caller's flag store before the waiters' check.
    { std::lock_guard<std::mutex> lock(mutex_); }
    not_full_.notify_all();
}

void OutboundQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

} // namespace chatmux
