#pragma once
#include <string>

namespace chatmux {

enum class ReadStatus { Message, Closed, Error };

// A message-oriented duplex channel to one client. read_message() is called
// from one thread and write_message() from another; close() may be called
// from any thread, including while the other two are blocked.
class Connection {
public:
    virtual ~Connection() = default;

    virtual ReadStatus read_message(std::string& out) = 0;

    // Returns false when the message could not be written; the connection
    // is unusable afterwards.
    virtual bool write_message(const std::string& text) = 0;

    // Unblocks pending reads and writes. Idempotent.
    virtual void close() = 0;

    virtual std::string peer() const = 0;
};

} // namespace chatmux
