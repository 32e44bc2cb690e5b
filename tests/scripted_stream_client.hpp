#pragma once
#include "errors.hpp"
#include "stream_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatmux {

// What a scripted stream produces for one prompt.
struct StreamScript {
    std::vector<std::string> fragments;
    std::optional<std::string> error;  // emitted after the fragments
    bool hang = false;                 // after the fragments, wait for abandon
    int fragment_delay_ms = 0;
};

struct ScriptCounters {
    std::atomic<int> starts{0};
    std::atomic<int> abandons{0};  // abandon() calls on any stream
    std::atomic<int> live{0};      // streams not yet destroyed
};

class ScriptedFragmentStream : public FragmentStream {
public:
    ScriptedFragmentStream(StreamScript script, std::shared_ptr<ScriptCounters> counters)
        : script_(std::move(script)), counters_(std::move(counters)) {
        counters_->live++;
    }
    ~ScriptedFragmentStream() override { counters_->live--; }

    StreamItem next() override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (abandoned_) return StreamItem::abandoned();
        if (index_ < script_.fragments.size()) {
            if (script_.fragment_delay_ms > 0) {
                cv_.wait_for(lock, std::chrono::milliseconds(script_.fragment_delay_ms),
                             [this] { return abandoned_; });
                if (abandoned_) return StreamItem::abandoned();
            }
            return StreamItem::fragment(script_.fragments[index_++]);
        }
        if (script_.error) return StreamItem::error(*script_.error);
        if (script_.hang) {
            cv_.wait(lock, [this] { return abandoned_; });
            return StreamItem::abandoned();
        }
        return StreamItem::done();
    }

    void abandon() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned_ = true;
        }
        counters_->abandons++;
        cv_.notify_all();
    }

private:
    StreamScript script_;
    std::shared_ptr<ScriptCounters> counters_;
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t index_ = 0;
    bool abandoned_ = false;
};

// Stream client answering from per-prompt scripts (default_script otherwise).
class ScriptedStreamClient : public StreamClient {
public:
    StreamScript default_script;
    std::map<std::string, StreamScript> scripts;
    std::optional<std::string> start_error;  // start_stream throws Upstream
    std::shared_ptr<ScriptCounters> counters = std::make_shared<ScriptCounters>();

    std::unique_ptr<FragmentStream> start_stream(const StreamRequest& request) override {
        counters->starts++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        if (start_error) throw ChatError(ErrorKind::Upstream, *start_error);
        auto it = scripts.find(request.prompt);
        StreamScript script = it != scripts.end() ? it->second : default_script;
        return std::make_unique<ScriptedFragmentStream>(std::move(script), counters);
    }

    std::string client_name() const override { return "scripted"; }

    std::vector<StreamRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<StreamRequest> requests_;
};

} // namespace chatmux
