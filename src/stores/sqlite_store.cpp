#include "sqlite_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static chatmux::StoreRegistrar reg_sqlite("sqlite",
    [](const chatmux::Config& config) {
        return std::make_unique<chatmux::SqliteThreadStore>(config.resolved_store_path());
    });

namespace chatmux {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Rolls back an open transaction unless commit() succeeded.
class TxnGuard {
public:
    explicit TxnGuard(sqlite3* db) : db_(db) {}
    ~TxnGuard() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    bool commit() {
        done_ = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK;
        return done_;
    }
    void release() { done_ = true; }

private:
    sqlite3* db_;
    bool done_ = false;
};

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : std::string();
}

SqliteThreadStore::SqliteThreadStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteThreadStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");

    init_schema();
}

SqliteThreadStore::~SqliteThreadStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteThreadStore::exec(const char* sql, std::string* error) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (error) *error = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteThreadStore::init_schema() {
    const char* schema =
        "CREATE TABLE IF NOT EXISTS threads ("
        "  thread_id  TEXT PRIMARY KEY,"
        "  title      TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");"
        // One row per persisted turn; the primary key is the dedupe key.
        "CREATE TABLE IF NOT EXISTS turns ("
        "  thread_id  TEXT NOT NULL REFERENCES threads(thread_id) ON DELETE CASCADE,"
        "  turn_id    TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  PRIMARY KEY (thread_id, turn_id)"
        ");"
        "CREATE TABLE IF NOT EXISTS messages ("
        "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  thread_id  TEXT NOT NULL REFERENCES threads(thread_id) ON DELETE CASCADE,"
        "  turn_id    TEXT NOT NULL,"
        "  role       TEXT NOT NULL,"
        "  content    TEXT NOT NULL,"
        "  image_ref  TEXT,"
        "  created_at INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS messages_thread ON messages(thread_id, id);"
        "CREATE TABLE IF NOT EXISTS tombstones ("
        "  thread_id  TEXT PRIMARY KEY,"
        "  deleted_at INTEGER NOT NULL"
        ");";
    std::string error;
    if (!exec(schema, &error)) {
        throw std::runtime_error("SqliteThreadStore: schema init failed: " + error);
    }
}

std::vector<ThreadSummary> SqliteThreadStore::list_threads() {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "SELECT t.thread_id, t.title, t.created_at, t.updated_at,"
        "       (SELECT COUNT(*) FROM messages m WHERE m.thread_id = t.thread_id)"
        "  FROM threads t ORDER BY t.updated_at DESC, t.rowid DESC;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw ChatError(ErrorKind::Persistence,
                        std::string("list_threads: ") + sqlite3_errmsg(db_));
    }

    std::vector<ThreadSummary> out;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        ThreadSummary s;
        s.thread_id = column_text(g.stmt, 0);
        s.title = column_text(g.stmt, 1);
        s.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
        s.updated_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        s.message_count = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 4));
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<Message> SqliteThreadStore::get_history(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "SELECT role, content, image_ref, created_at FROM messages"
        " WHERE thread_id = ? ORDER BY id ASC;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw ChatError(ErrorKind::Persistence,
                        std::string("get_history: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Message> out;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        Message m;
        m.role = role_from_string(column_text(g.stmt, 0));
        m.content = column_text(g.stmt, 1);
        if (sqlite3_column_type(g.stmt, 2) != SQLITE_NULL)
            m.image_ref = column_text(g.stmt, 2);
        m.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        out.push_back(std::move(m));
    }
    if (rc != SQLITE_DONE) {
        throw ChatError(ErrorKind::Persistence,
                        std::string("get_history: ") + sqlite3_errmsg(db_));
    }
    return out;
}

bool SqliteThreadStore::has_thread(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM threads WHERE thread_id = ?;",
                           -1, &g.stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

static bool insert_message(sqlite3* db, const std::string& thread_id,
                           const std::string& turn_id, const Message& m) {
    StmtGuard g;
    const char* sql =
        "INSERT INTO messages (thread_id, turn_id, role, content, image_ref, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, turn_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, role_to_string(m.role), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, m.content.c_str(), -1, SQLITE_TRANSIENT);
    if (m.image_ref) {
        sqlite3_bind_text(g.stmt, 5, m.image_ref->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(g.stmt, 5);
    }
    sqlite3_bind_int64(g.stmt, 6, static_cast<sqlite3_int64>(m.created_at));
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

AppendResult SqliteThreadStore::append(const std::string& thread_id,
                                       const std::string& turn_id,
                                       const TurnRecord& turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    AppendResult result;

    if (!exec("BEGIN IMMEDIATE;", &result.error)) {
        return result;
    }
    TxnGuard txn(db_);
    auto fail = [&](const char* what) {
        result.status = AppendStatus::Error;
        result.error = std::string(what) + ": " + sqlite3_errmsg(db_);
        return result;
    };

    {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, "SELECT 1 FROM tombstones WHERE thread_id = ?;",
                               -1, &g.stmt, nullptr) != SQLITE_OK)
            return fail("tombstone check");
        sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) == SQLITE_ROW) {
            result.status = AppendStatus::ThreadDeleted;
            result.error = "thread deleted: " + thread_id;
            return result;
        }
    }

    uint64_t now = turn.assistant.created_at ? turn.assistant.created_at : epoch_seconds();

    {
        StmtGuard g;
        const char* sql =
            "INSERT INTO threads (thread_id, title, created_at, updated_at)"
            " VALUES (?, ?, ?, ?)"
            " ON CONFLICT(thread_id) DO UPDATE SET updated_at = excluded.updated_at;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
            return fail("upsert thread");
        std::string title = thread_title_for(turn.user);
        sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, title.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(now));
        sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(now));
        if (sqlite3_step(g.stmt) != SQLITE_DONE) return fail("upsert thread");
    }

    {
        StmtGuard g;
        const char* sql =
            "INSERT OR IGNORE INTO turns (thread_id, turn_id, created_at) VALUES (?, ?, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
            return fail("insert turn");
        sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, turn_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(now));
        if (sqlite3_step(g.stmt) != SQLITE_DONE) return fail("insert turn");
        if (sqlite3_changes(db_) == 0) {
            // Duplicate finalize: roll back the updated_at bump too.
            result.status = AppendStatus::AlreadyExists;
            return result;
        }
    }

    if (!insert_message(db_, thread_id, turn_id, turn.user) ||
        !insert_message(db_, thread_id, turn_id, turn.assistant)) {
        return fail("insert message");
    }

    if (!txn.commit()) return fail("commit");
    result.status = AppendStatus::Success;
    return result;
}

RemoveResult SqliteThreadStore::remove(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    RemoveResult result;

    if (!exec("BEGIN IMMEDIATE;", &result.error)) {
        return result;
    }
    TxnGuard txn(db_);

    int deleted = 0;
    {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, "DELETE FROM threads WHERE thread_id = ?;",
                               -1, &g.stmt, nullptr) != SQLITE_OK) {
            result.error = std::string("delete thread: ") + sqlite3_errmsg(db_);
            return result;
        }
        sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            result.error = std::string("delete thread: ") + sqlite3_errmsg(db_);
            return result;
        }
        deleted = sqlite3_changes(db_);
    }

    {
        StmtGuard g;
        const char* sql =
            "INSERT OR REPLACE INTO tombstones (thread_id, deleted_at) VALUES (?, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            result.error = std::string("tombstone: ") + sqlite3_errmsg(db_);
            return result;
        }
        sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(epoch_seconds()));
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            result.error = std::string("tombstone: ") + sqlite3_errmsg(db_);
            return result;
        }
    }

    if (!txn.commit()) {
        result.error = std::string("commit: ") + sqlite3_errmsg(db_);
        return result;
    }
    result.status = deleted > 0 ? RemoveStatus::Success : RemoveStatus::NotFound;
    if (deleted > 0) {
        std::cerr << "[sqlite] Deleted thread " << thread_id << "\n";
    }
    return result;
}

} // namespace chatmux
