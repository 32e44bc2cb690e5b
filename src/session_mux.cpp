#include "session_mux.hpp"
#include "errors.hpp"
#include "stream_client.hpp"
#include "thread_store.hpp"
#include "util.hpp"
#include <iostream>

namespace chatmux {

SessionMultiplexer::SessionMultiplexer(std::string session_id, ThreadStore& store,
                                       StreamClient& client, const UploadStore* uploads,
                                       TurnOptions turn_options, size_t queue_capacity)
    : session_id_(std::move(session_id)), store_(store), client_(client),
      uploads_(uploads), turn_options_(std::move(turn_options)),
      queue_(queue_capacity) {}

SessionMultiplexer::~SessionMultiplexer() {
    shutdown();
}

TurnSink SessionMultiplexer::make_sink() {
    TurnSink sink;
    sink.emit = [this](OutboundFrame frame, const std::atomic<bool>* abort) {
        // The thread must accept a new turn by the time the client sees the
        // terminal event.
        if (frame.is_terminal()) release_slot(frame.thread_id, frame.turn_id);
        return queue_.push(std::move(frame), abort);
    };
    sink.interrupt = [this]() { queue_.interrupt(); };
    return sink;
}

void SessionMultiplexer::route(const InboundFrame& frame) {
    reap_finished();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return;
    }

    if (frame.del) {
        if (!frame.thread_id) {
            report_protocol_error("delete requires a thread_id");
            return;
        }
        delete_thread(*frame.thread_id);
        return;
    }

    std::string thread_id = frame.thread_id ? *frame.thread_id : generate_id();
    if (is_tombstoned(thread_id)) {
        report_protocol_error("thread was deleted", "thread_deleted", thread_id);
        return;
    }
    start_turn(thread_id, frame);
}

void SessionMultiplexer::start_turn(const std::string& thread_id, const InboundFrame& frame) {
    std::string turn_id = generate_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.count(thread_id)) {
            touched_.insert(thread_id);
            auto turn = std::make_shared<Turn>(thread_id, turn_id, frame, store_, client_,
                                               uploads_, make_sink(), turn_options_);
            auto& slot = active_[thread_id];
            slot.turn = turn;
            // The worker's epilogue takes mutex_, so it cannot run before the
            // handle is stored.
            slot.worker = std::thread([this, turn]() {
                turn->run();
                on_turn_finished(turn);
            });
            std::cerr << "[session] " << session_id_ << " turn " << turn_id
                      << " started on thread " << thread_id << "\n";
            return;
        }
    }
    report_protocol_error("a turn is already in progress for this thread",
                          error_kind_name(ErrorKind::Conflict), thread_id);
}

void SessionMultiplexer::release_slot(const std::string& thread_id, const std::string& turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(thread_id);
    if (it == active_.end() || it->second.turn->turn_id() != turn_id) return;
    draining_.insert(it->second.turn.get());
    finished_.push_back(std::move(it->second.worker));
    active_.erase(it);
}

void SessionMultiplexer::on_turn_finished(const std::shared_ptr<Turn>& turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    draining_.erase(turn.get());
    auto it = active_.find(turn->thread_id());
    if (it != active_.end() && it->second.turn == turn) {
        finished_.push_back(std::move(it->second.worker));
        active_.erase(it);
    }
    idle_cv_.notify_all();
}

void SessionMultiplexer::delete_thread(const std::string& thread_id) {
    ActiveTurn victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tombstones_.insert(thread_id);
        touched_.insert(thread_id);
        auto it = active_.find(thread_id);
        if (it != active_.end()) {
            victim = std::move(it->second);
            active_.erase(it);
        }
    }

    if (victim.turn) {
        victim.turn->cancel();
        if (victim.worker.joinable()) victim.worker.join();
        idle_cv_.notify_all();
    }

    RemoveResult result;
    try {
        result = store_.remove(thread_id);
    } catch (const std::exception& e) {
        result.status = RemoveStatus::Error;
        result.error = e.what();
    }

    if (result.status == RemoveStatus::Error) {
        std::cerr << "[session] " << session_id_ << " delete of " << thread_id
                  << " failed: " << result.error << "\n";
        report_protocol_error(result.error, error_kind_name(ErrorKind::Persistence), thread_id);
        return;
    }

    std::cerr << "[session] " << session_id_ << " deleted thread " << thread_id << "\n";
    OutboundFrame frame;
    frame.thread_id = thread_id;
    frame.kind = FrameKind::Deleted;
    frame.payload = result.status == RemoveStatus::Success ? "deleted" : "not_found";
    queue_.push(std::move(frame));
}

void SessionMultiplexer::report_protocol_error(const std::string& message,
                                               const std::string& code,
                                               const std::string& thread_id) {
    OutboundFrame frame;
    frame.thread_id = thread_id;
    frame.kind = FrameKind::ProtocolError;
    frame.payload = message;
    frame.code = code;
    queue_.push(std::move(frame));
}

std::optional<OutboundFrame> SessionMultiplexer::next_outbound() {
    return queue_.pop();
}

void SessionMultiplexer::close_outbound() {
    queue_.close();
}

void SessionMultiplexer::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done.swap(finished_);
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void SessionMultiplexer::shutdown() {
    std::vector<ActiveTurn> running;
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto& [_, slot] : active_) running.push_back(std::move(slot));
        active_.clear();
        done.swap(finished_);
    }

    // Nobody drains the queue after shutdown; closing it keeps terminal
    // emits of cancelled turns from blocking on a full queue.
    for (auto& slot : running) slot.turn->cancel();
    queue_.close();
    for (auto& slot : running) {
        if (slot.worker.joinable()) slot.worker.join();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
    if (!running.empty()) {
        std::cerr << "[session] " << session_id_ << " cancelled " << running.size()
                  << " active turn(s)\n";
    }
    idle_cv_.notify_all();
}

bool SessionMultiplexer::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return active_.empty() && draining_.empty(); });
}

bool SessionMultiplexer::has_active_turn(const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(thread_id) > 0;
}

size_t SessionMultiplexer::active_turn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::vector<std::string> SessionMultiplexer::touched_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {touched_.begin(), touched_.end()};
}

bool SessionMultiplexer::is_tombstoned(const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tombstones_.count(thread_id) > 0;
}

} // namespace chatmux
