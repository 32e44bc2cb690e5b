#pragma once
#include "connection.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace chatmux {

// In-memory Connection. The test feeds inbound messages and inspects what the
// server wrote.
class FakeConnection : public Connection {
public:
    void push_inbound(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(text);
        }
        cv_.notify_all();
    }

    // The client hangs up: read_message returns Closed once inbound is drained.
    void hang_up() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    // While set, write_message blocks (slow client).
    void set_write_blocked(bool blocked) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            write_blocked_ = blocked;
        }
        cv_.notify_all();
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    ReadStatus read_message(std::string& out) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !inbound_.empty() || eof_ || closed_; });
        if (closed_) return ReadStatus::Closed;
        if (!inbound_.empty()) {
            out = inbound_.front();
            inbound_.pop_front();
            return ReadStatus::Message;
        }
        return ReadStatus::Closed;
    }

    bool write_message(const std::string& text) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !write_blocked_ || closed_; });
        if (closed_ || fail_writes_) return false;
        written_.push_back(text);
        cv_.notify_all();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::string peer() const override { return "fake"; }

    std::vector<std::string> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Wait until pred(written) holds. Returns false on timeout.
    bool wait_for_written(const std::function<bool(const std::vector<std::string>&)>& pred,
                          std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return pred(written_); });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> written_;
    bool eof_ = false;
    bool closed_ = false;
    bool write_blocked_ = false;
    bool fail_writes_ = false;
};

} // namespace chatmux
