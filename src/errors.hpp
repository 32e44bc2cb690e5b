#pragma once
#include <stdexcept>
#include <string>

namespace chatmux {

enum class ErrorKind { Protocol, Conflict, Upstream, Persistence, Connection };

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Protocol:    return "protocol_error";
        case ErrorKind::Conflict:    return "turn_in_progress";
        case ErrorKind::Upstream:    return "upstream_error";
        case ErrorKind::Persistence: return "persistence_error";
        case ErrorKind::Connection:  return "connection_error";
    }
    return "protocol_error";
}

// Error raised at parse and collaborator boundaries. Turn-local failures are
// reported to the client; only Connection escalates to teardown.
class ChatError : public std::runtime_error {
public:
    ChatError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace chatmux
