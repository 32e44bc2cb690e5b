#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace chatmux {

struct Config;

enum class Role { User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

inline Role role_from_string(const std::string& s) {
    return s == "assistant" ? Role::Assistant : Role::User;
}

struct Message {
    Role role = Role::User;
    std::string content;
    std::optional<std::string> image_ref;
    uint64_t created_at = 0;  // epoch seconds
};

// The persisted unit of a completed turn: the user input and the assistant
// reply it produced, written together.
struct TurnRecord {
    Message user;
    Message assistant;
};

struct ThreadSummary {
    std::string thread_id;
    std::string title;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    uint32_t message_count = 0;
};

// ThreadDeleted: the id is tombstoned; retrying cannot succeed.
enum class AppendStatus { Success, AlreadyExists, ThreadDeleted, Error };

struct AppendResult {
    AppendStatus status = AppendStatus::Error;
    std::string error;
};

enum class RemoveStatus { Success, NotFound, Error };

struct RemoveResult {
    RemoveStatus status = RemoveStatus::Error;
    std::string error;
};

// Title shown in thread listings: first 30 characters of the first user
// message, or "Image message" for an image-only message.
std::string thread_title_for(const Message& first_user_message);

// Durable thread-id → ordered message history. Implementations are shared
// across connections and must be thread-safe; each call is atomic on its own.
class ThreadStore {
public:
    virtual ~ThreadStore() = default;

    virtual std::string backend_name() const = 0;

    // All threads, most recently updated first.
    virtual std::vector<ThreadSummary> list_threads() = 0;

    // Messages of a thread in insertion order (empty for unknown threads).
    // Throws ChatError(Persistence) when the backend cannot be read.
    virtual std::vector<Message> get_history(const std::string& thread_id) = 0;

    virtual bool has_thread(const std::string& thread_id) = 0;

    // Append a completed turn, keyed by (thread_id, turn_id). A repeated key
    // returns AlreadyExists and leaves the history untouched. Appending to a
    // deleted thread returns ThreadDeleted.
    virtual AppendResult append(const std::string& thread_id,
                                const std::string& turn_id,
                                const TurnRecord& turn) = 0;

    // Delete a thread and tombstone its id.
    virtual RemoveResult remove(const std::string& thread_id) = 0;
};

// Create the backend named by config.store.backend via the plugin registry.
std::unique_ptr<ThreadStore> create_thread_store(const Config& config);

} // namespace chatmux
