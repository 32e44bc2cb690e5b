#pragma once
#include "config.hpp"
#include "connection_registry.hpp"
#include "http_api.hpp"
#include "turn.hpp"
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chatmux {

class ThreadStore;
class StreamClient;
class UploadStore;

// TCP front end: HTTP requests go to HttpApi, a GET on the WebSocket path is
// upgraded and handed to a ConnectionSupervisor. One thread per connection.
class ChatServer {
public:
    ChatServer(const Config& config, ThreadStore& store, StreamClient& client,
               UploadStore& uploads);
    ~ChatServer();

    // Bind and start the accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, close every live connection and join all threads.
    void stop();

    // Bound port (useful when listening on port 0).
    uint16_t port() const { return port_; }

    size_t connection_count() const { return registry_.size(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int fd, const std::string& peer);
    void serve_websocket(int fd, const std::string& peer, const ApiRequest& request,
                         std::string leftover);
    void reap_workers(bool all);

    std::string listen_addr_;
    std::string ws_path_;
    uint32_t max_body_;
    uint32_t max_frame_;
    size_t queue_capacity_;
    TurnOptions turn_options_;

    ThreadStore& store_;
    StreamClient& client_;
    UploadStore& uploads_;
    HttpApi api_;
    ConnectionRegistry registry_;

    int server_fd_ = -1;
    int shutdown_pipe_[2] = {-1, -1};
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range (0 is allowed: any free port).
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace chatmux
