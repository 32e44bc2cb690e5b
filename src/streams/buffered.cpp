#include "buffered.hpp"
#include <exception>

namespace chatmux {

BufferedFragmentStream::BufferedFragmentStream(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

BufferedFragmentStream::~BufferedFragmentStream() {
    abandon();
    if (producer_.joinable()) producer_.join();
}

void BufferedFragmentStream::start(Producer producer) {
    producer_ = std::thread([this, producer = std::move(producer)]() {
        try {
            producer(*this);
            finish();
        } catch (const std::exception& e) {
            fail(e.what());
        }
    });
}

StreamItem BufferedFragmentStream::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] {
        return !buffer_.empty() || finished_ || error_ || abandoned_.load();
    });
    if (abandoned_.load()) return StreamItem::abandoned();
    if (!buffer_.empty()) {
        std::string text = std::move(buffer_.front());
        buffer_.pop_front();
        not_full_.notify_one();
        return StreamItem::fragment(std::move(text));
    }
    if (error_) return StreamItem::error(*error_);
    return StreamItem::done();
}

void BufferedFragmentStream::abandon() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned_.store(true);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool BufferedFragmentStream::push(std::string fragment) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
        return buffer_.size() < capacity_ || abandoned_.load();
    });
    if (abandoned_.load()) return false;
    buffer_.push_back(std::move(fragment));
    not_empty_.notify_one();
    return true;
}

void BufferedFragmentStream::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) return;
        finished_ = true;
    }
    not_empty_.notify_all();
}

void BufferedFragmentStream::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_ || error_) return;
        error_ = reason;
    }
    not_empty_.notify_all();
}

} // namespace chatmux
