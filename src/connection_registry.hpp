#pragma once
#include "connection.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chatmux {

// Process-wide set of live connections. Entries are added when a connection
// is upgraded and removed on teardown; close_all() is used at shutdown.
class ConnectionRegistry {
public:
    void add(const std::string& session_id, Connection* conn);
    void remove(const std::string& session_id);
    size_t size() const;

    // Close every registered connection. Their supervisors then tear down
    // and remove themselves.
    void close_all();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Connection*> connections_;
};

} // namespace chatmux
