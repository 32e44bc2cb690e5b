#pragma once
#include "stores/memory_store.hpp"
#include <atomic>
#include <string>

namespace chatmux {

// MemoryThreadStore that counts appends and can fail the first N of them.
class RecordingStore : public ThreadStore {
public:
    std::atomic<int> fail_appends{0};   // -1 = fail forever
    std::atomic<int> append_calls{0};
    std::string failure = "disk full";

    std::string backend_name() const override { return "recording"; }
    std::vector<ThreadSummary> list_threads() override { return inner_.list_threads(); }
    std::vector<Message> get_history(const std::string& id) override {
        return inner_.get_history(id);
    }
    bool has_thread(const std::string& id) override { return inner_.has_thread(id); }

    AppendResult append(const std::string& thread_id, const std::string& turn_id,
                        const TurnRecord& turn) override {
        append_calls++;
        int remaining = fail_appends.load();
        if (remaining != 0) {
            if (remaining > 0) fail_appends--;
            AppendResult r;
            r.status = AppendStatus::Error;
            r.error = failure;
            return r;
        }
        return inner_.append(thread_id, turn_id, turn);
    }

    RemoveResult remove(const std::string& id) override { return inner_.remove(id); }

private:
    MemoryThreadStore inner_;
};

} // namespace chatmux
