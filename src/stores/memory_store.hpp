#pragma once
#include "../thread_store.hpp"
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace chatmux {

// Process-local store. Nothing survives a restart.
class MemoryThreadStore : public ThreadStore {
public:
    std::string backend_name() const override { return "memory"; }

    std::vector<ThreadSummary> list_threads() override;
    std::vector<Message> get_history(const std::string& thread_id) override;
    bool has_thread(const std::string& thread_id) override;
    AppendResult append(const std::string& thread_id,
                        const std::string& turn_id,
                        const TurnRecord& turn) override;
    RemoveResult remove(const std::string& thread_id) override;

private:
    struct ThreadData {
        ThreadSummary summary;
        std::vector<Message> messages;
        uint64_t sequence = 0;  // tie-break for equal updated_at
    };

    std::mutex mutex_;
    std::unordered_map<std::string, ThreadData> threads_;
    std::set<std::pair<std::string, std::string>> turns_;
    std::set<std::string> tombstones_;
    uint64_t sequence_ = 0;
};

} // namespace chatmux
