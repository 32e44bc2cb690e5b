#pragma once
#include "../thread_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace chatmux {

class SqliteThreadStore : public ThreadStore {
public:
    explicit SqliteThreadStore(const std::string& path);
    ~SqliteThreadStore() override;

    // Non-copyable
    SqliteThreadStore(const SqliteThreadStore&) = delete;
    SqliteThreadStore& operator=(const SqliteThreadStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::vector<ThreadSummary> list_threads() override;
    std::vector<Message> get_history(const std::string& thread_id) override;
    bool has_thread(const std::string& thread_id) override;
    AppendResult append(const std::string& thread_id,
                        const std::string& turn_id,
                        const TurnRecord& turn) override;
    RemoveResult remove(const std::string& thread_id) override;

private:
    void init_schema();
    bool exec(const char* sql, std::string* error = nullptr);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace chatmux
