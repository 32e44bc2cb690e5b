#include "connection_registry.hpp"

namespace chatmux {

void ConnectionRegistry::add(const std::string& session_id, Connection* conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[session_id] = conn;
}

void ConnectionRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(session_id);
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::close_all() {
    // close() only shuts the socket down; it never blocks, so holding the
    // lock keeps the pointers valid against a concurrent remove().
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, conn] : connections_) conn->close();
}

} // namespace chatmux
