#include "memory_store.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <algorithm>

static chatmux::StoreRegistrar reg_memory("memory",
    [](const chatmux::Config&) {
        return std::make_unique<chatmux::MemoryThreadStore>();
    });

namespace chatmux {

std::vector<ThreadSummary> MemoryThreadStore::list_threads() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const ThreadData*> sorted;
    sorted.reserve(threads_.size());
    for (const auto& [_, data] : threads_) sorted.push_back(&data);
    std::sort(sorted.begin(), sorted.end(), [](const ThreadData* a, const ThreadData* b) {
        if (a->summary.updated_at != b->summary.updated_at)
            return a->summary.updated_at > b->summary.updated_at;
        return a->sequence > b->sequence;
    });

    std::vector<ThreadSummary> out;
    out.reserve(sorted.size());
    for (const auto* data : sorted) out.push_back(data->summary);
    return out;
}

std::vector<Message> MemoryThreadStore::get_history(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) return {};
    return it->second.messages;
}

bool MemoryThreadStore::has_thread(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.count(thread_id) > 0;
}

AppendResult MemoryThreadStore::append(const std::string& thread_id,
                                       const std::string& turn_id,
                                       const TurnRecord& turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    AppendResult result;
    if (tombstones_.count(thread_id)) {
        result.status = AppendStatus::ThreadDeleted;
        result.error = "thread deleted: " + thread_id;
        return result;
    }
    if (!turns_.insert({thread_id, turn_id}).second) {
        result.status = AppendStatus::AlreadyExists;
        return result;
    }

    uint64_t now = turn.assistant.created_at ? turn.assistant.created_at : epoch_seconds();
    auto& data = threads_[thread_id];
    if (data.messages.empty()) {
        data.summary.thread_id = thread_id;
        data.summary.title = thread_title_for(turn.user);
        data.summary.created_at = now;
    }
    data.messages.push_back(turn.user);
    data.messages.push_back(turn.assistant);
    data.summary.updated_at = now;
    data.summary.message_count = static_cast<uint32_t>(data.messages.size());
    data.sequence = ++sequence_;

    result.status = AppendStatus::Success;
    return result;
}

RemoveResult MemoryThreadStore::remove(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tombstones_.insert(thread_id);
    RemoveResult result;
    result.status = threads_.erase(thread_id) > 0 ? RemoveStatus::Success
                                                   : RemoveStatus::NotFound;
    for (auto it = turns_.begin(); it != turns_.end();) {
        if (it->first == thread_id) it = turns_.erase(it);
        else ++it;
    }
    return result;
}

} // namespace chatmux
