#include "turn.hpp"
#include "errors.hpp"
#include "uploads.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace chatmux {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Composing:  return "composing";
        case TurnState::Dispatched: return "dispatched";
        case TurnState::Streaming:  return "streaming";
        case TurnState::Finalizing: return "finalizing";
        case TurnState::Completed:  return "completed";
        case TurnState::Failed:     return "failed";
        case TurnState::Cancelled:  return "cancelled";
    }
    return "composing";
}

Turn::Turn(std::string thread_id, std::string turn_id, InboundFrame input,
           ThreadStore& store, StreamClient& client, const UploadStore* uploads,
           TurnSink sink, TurnOptions options)
    : thread_id_(std::move(thread_id)), turn_id_(std::move(turn_id)),
      input_(std::move(input)), store_(store), client_(client), uploads_(uploads),
      sink_(std::move(sink)), options_(std::move(options)) {
    if (options_.persist_attempts == 0) options_.persist_attempts = 1;
}

Turn::~Turn() {
    cancel();
    stop_watchdog();
}

bool Turn::is_terminal() const {
    auto s = state_.load();
    return s == TurnState::Completed || s == TurnState::Failed || s == TurnState::Cancelled;
}

std::string Turn::full_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

std::string Turn::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

OutboundFrame Turn::make_frame(FrameKind kind, std::string payload) const {
    OutboundFrame frame;
    frame.thread_id = thread_id_;
    frame.turn_id = turn_id_;
    frame.kind = kind;
    frame.payload = std::move(payload);
    return frame;
}

// ── Cancellation ────────────────────────────────────────────────

void Turn::abandon_stream() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_ && !stream_abandoned_.exchange(true)) {
        stream_->abandon();
    }
}

void Turn::cancel() {
    if (is_terminal()) return;
    cancelled_.store(true);
    stop_.store(true);
    abandon_stream();
    if (sink_.interrupt) sink_.interrupt();
}

void Turn::start_watchdog() {
    if (options_.deadline_ms == 0) return;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.deadline_ms);
    watchdog_ = std::thread([this, deadline]() {
        std::unique_lock<std::mutex> lock(watch_mutex_);
        if (watch_cv_.wait_until(lock, deadline, [this] { return watch_done_; })) return;
        lock.unlock();
        if (stop_.load()) return;
        std::cerr << "[turn] " << thread_id_ << "/" << turn_id_
                  << " deadline of " << options_.deadline_ms << "ms exceeded\n";
        deadline_hit_.store(true);
        stop_.store(true);
        abandon_stream();
        if (sink_.interrupt) sink_.interrupt();
    });
}

void Turn::stop_watchdog() {
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watch_done_ = true;
    }
    watch_cv_.notify_all();
    if (watchdog_.joinable() && watchdog_.get_id() != std::this_thread::get_id()) {
        watchdog_.join();
    }
}

// ── Terminal transitions ────────────────────────────────────────

void Turn::finish_completed() {
    state_.store(TurnState::Completed);
    sink_.emit(make_frame(FrameKind::Completed, full_text()), nullptr);
}

void Turn::finish_failed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = reason;
    }
    std::cerr << "[turn] " << thread_id_ << "/" << turn_id_ << " failed: " << reason << "\n";
    state_.store(TurnState::Failed);
    auto frame = make_frame(FrameKind::Failed, reason);
    auto colon = reason.find(':');
    frame.code = colon == std::string::npos ? reason : reason.substr(0, colon);
    sink_.emit(std::move(frame), nullptr);
}

void Turn::finish_cancelled() {
    state_.store(TurnState::Cancelled);
    sink_.emit(make_frame(FrameKind::Cancelled), nullptr);
}

// ── Run ─────────────────────────────────────────────────────────

StreamRequest Turn::compose() {
    StreamRequest request;
    request.prompt = input_.text;
    request.language = input_.language.empty() ? options_.default_language : input_.language;
    request.history = store_.get_history(thread_id_);

    if (input_.image_ref) {
        std::optional<std::string> path;
        if (uploads_) path = uploads_->resolve(*input_.image_ref);
        if (path) {
            request.image_path = *path;
        } else {
            std::cerr << "[turn] " << thread_id_ << "/" << turn_id_
                      << " image not found, sending text only: " << *input_.image_ref << "\n";
        }
    }
    return request;
}

void Turn::run() {
    created_at_ = epoch_seconds();
    start_watchdog();

    auto finish = [this](auto&& transition) {
        stop_watchdog();
        transition();
    };

    state_.store(TurnState::Composing);
    if (!sink_.emit(make_frame(FrameKind::Started, input_.text), &stop_) && !stop_.load()) {
        cancelled_.store(true);
        stop_.store(true);
    }

    StreamRequest request;
    if (!stop_.load()) {
        try {
            request = compose();
        } catch (const std::exception& e) {
            finish([&] { finish_failed(std::string("persistence_error: ") + e.what()); });
            return;
        }
    }

    std::unique_ptr<FragmentStream> stream;
    if (!stop_.load()) {
        state_.store(TurnState::Dispatched);
        try {
            stream = client_.start_stream(request);
        } catch (const std::exception& e) {
            finish([&] { finish_failed(std::string("upstream_error: ") + e.what()); });
            return;
        }
    }

    FragmentStream* active = nullptr;
    if (stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = std::move(stream);
        active = stream_.get();
    }
    // cancel() may have run before the stream was installed
    if (stop_.load()) abandon_stream();

    std::string upstream_error;
    bool upstream_failed = false;
    if (active && !stop_.load()) {
        state_.store(TurnState::Streaming);
        uint64_t seq = 0;
        for (;;) {
            StreamItem item = active->next();
            if (stop_.load() || item.status == StreamStatus::Abandoned) break;
            if (item.status == StreamStatus::Done) break;
            if (item.status == StreamStatus::Error) {
                upstream_failed = true;
                upstream_error = item.text;
                break;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                text_ += item.text;
            }
            auto frame = make_frame(FrameKind::Fragment, std::move(item.text));
            frame.seq = seq++;
            if (!sink_.emit(std::move(frame), &stop_)) {
                if (!stop_.load()) {
                    // channel closed under us: nobody is listening any more
                    cancelled_.store(true);
                    stop_.store(true);
                }
                break;
            }
        }
    }

    // Release the upstream call before finalizing.
    std::unique_ptr<FragmentStream> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_ && !stream_abandoned_.exchange(true)) stream_->abandon();
        released = std::move(stream_);
    }
    released.reset();

    if (cancelled_.load()) {
        finish([&] { finish_cancelled(); });
        return;
    }
    if (deadline_hit_.load()) {
        finish([&] { finish_failed("deadline_exceeded"); });
        return;
    }
    if (upstream_failed) {
        finish([&] { finish_failed("upstream_error: " + upstream_error); });
        return;
    }

    stop_watchdog();
    state_.store(TurnState::Finalizing);
    if (!finalize()) {
        if (cancelled_.load()) {
            finish_cancelled();
            return;
        }
        std::string detail;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            detail = persist_error_;
        }
        finish_failed("persistence_error: " + detail);
        return;
    }
    finish_completed();
}

bool Turn::finalize() {
    TurnRecord record;
    record.user.role = Role::User;
    record.user.content = input_.text;
    record.user.image_ref = input_.image_ref;
    record.user.created_at = created_at_ ? created_at_ : epoch_seconds();
    record.assistant.role = Role::Assistant;
    record.assistant.content = full_text();
    record.assistant.created_at = epoch_seconds();

    uint32_t backoff = options_.persist_backoff_ms;
    for (uint32_t attempt = 1; attempt <= options_.persist_attempts; ++attempt) {
        if (cancelled_.load()) return false;

        AppendResult result;
        try {
            result = store_.append(thread_id_, turn_id_, record);
        } catch (const std::exception& e) {
            result.status = AppendStatus::Error;
            result.error = e.what();
        }
        if (result.status == AppendStatus::Success ||
            result.status == AppendStatus::AlreadyExists) {
            return true;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            persist_error_ = result.error;
        }
        std::cerr << "[turn] " << thread_id_ << "/" << turn_id_ << " persist attempt "
                  << attempt << "/" << options_.persist_attempts << " failed: "
                  << result.error << "\n";
        if (result.status == AppendStatus::ThreadDeleted) break;
        if (attempt < options_.persist_attempts && backoff > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
            backoff = std::min<uint32_t>(backoff * 2, 2000);
        }
    }
    return false;
}

} // namespace chatmux
