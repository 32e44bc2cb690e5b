#include "server.hpp"
#include "session_mux.hpp"
#include "supervisor.hpp"
#include "util.hpp"
#include "websocket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatmux {

// ── Address parsing ───────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string digits = addr.substr(pos + 1);
        int p = std::stoi(digits, &used);
        if (used != digits.size() || p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── HTTP helpers ──────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 426: return "Upgrade Required";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

static bool send_raw(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static void send_http_response(int fd, const ApiResponse& resp) {
    std::string out = "HTTP/1.1 " + std::to_string(resp.status) + " " +
                      reason_phrase(resp.status) + "\r\n";
    if (!resp.content_type.empty()) out += "Content-Type: " + resp.content_type + "\r\n";
    for (const auto& [name, value] : resp.headers) out += name + ": " + value + "\r\n";
    out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
           "Connection: close\r\n\r\n";
    out += resp.body;
    send_raw(fd, out);
}

static ApiResponse plain_response(int status, const std::string& body) {
    ApiResponse resp;
    resp.status = status;
    resp.content_type = "text/plain";
    resp.body = body;
    resp.headers.emplace_back("Access-Control-Allow-Origin", "*");
    return resp;
}

// ── ChatServer ────────────────────────────────────────────────

ChatServer::ChatServer(const Config& config, ThreadStore& store, StreamClient& client,
                       UploadStore& uploads)
    : listen_addr_(config.server.listen)
    , ws_path_(config.server.ws_path)
    , max_body_(config.server.max_body)
    , max_frame_(config.server.max_frame)
    , queue_capacity_(config.session.queue_capacity)
    , store_(store)
    , client_(client)
    , uploads_(uploads)
    , api_(store, uploads)
{
    turn_options_.deadline_ms = config.session.turn_deadline_ms;
    turn_options_.persist_attempts = config.session.persist_attempts;
    turn_options_.default_language = config.session.default_language;
}

ChatServer::~ChatServer() {
    stop();
}

bool ChatServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }
    if (::listen(server_fd_, 64) != 0) {
        return fail("listen failed");
    }

    socklen_t len = sizeof(sa);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&sa), &len) == 0) {
        port_ = ntohs(sa.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    std::cerr << "[server] Listening on " << host << ":" << port_
              << " (websocket " << ws_path_ << ")\n";
    return true;
}

void ChatServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] shutdown pipe write failed\n";
    }
    if (thread_.joinable()) thread_.join();

    registry_.close_all();
    reap_workers(true);

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
    std::cerr << "[server] Stopped\n";
}

void ChatServer::reap_workers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void ChatServer::accept_loop() {
    while (running_.load()) {
        reap_workers(false);

        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        char addr[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, addr, sizeof(addr));
        std::string peer_name = std::string(addr) + ":" + std::to_string(ntohs(peer.sin_port));

        struct timeval tv{10, 0};  // 10s recv timeout until upgraded
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        auto done = worker.done;
        worker.thread = std::thread([this, cfd, peer_name, done]() {
            try {
                handle_connection(cfd, peer_name);
            } catch (const std::exception& e) {
                std::cerr << "[server] " << peer_name << " connection aborted: "
                          << e.what() << "\n";
            }
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(std::move(worker));
    }
}

void ChatServer::handle_connection(int fd, const std::string& peer) {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) { ::close(fd); return; }
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_http_response(fd, plain_response(400, "Headers too large"));
            ::close(fd);
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    ApiRequest req;
    auto rl_end = headers_raw.find("\r\n");
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_http_response(fd, plain_response(400, "Malformed request line"));
            ::close(fd);
            return;
        }
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    size_t pos = rl_end == std::string::npos ? headers_raw.size() : rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    if (req.path == ws_path_) {
        serve_websocket(fd, peer, req, std::move(leftover));  // takes ownership of fd
        return;
    }

    if (!req.header("transfer-encoding").empty()) {
        send_http_response(fd, plain_response(400, "Chunked request bodies are not supported"));
        ::close(fd);
        return;
    }

    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        try {
            content_len = std::stoul(cl);
        } catch (const std::exception&) {
            send_http_response(fd, plain_response(400, "Invalid Content-Length"));
            ::close(fd);
            return;
        }
    }
    if (content_len > max_body_) {
        send_http_response(fd, plain_response(413, "Payload too large"));
        ::close(fd);
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) break;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() < content_len) {
        send_http_response(fd, plain_response(400, "Truncated body"));
        ::close(fd);
        return;
    }
    req.body.resize(content_len);

    ApiResponse resp = api_.handle(req);
    std::cerr << "[server] " << peer << " " << req.method << " " << req.path
              << " -> " << resp.status << "\n";
    send_http_response(fd, resp);
    ::close(fd);
}

void ChatServer::serve_websocket(int fd, const std::string& peer, const ApiRequest& request,
                                 std::string leftover) {
    std::string key = request.header("sec-websocket-key");
    if (request.method != "GET" ||
        to_lower(request.header("upgrade")).find("websocket") == std::string::npos ||
        key.empty()) {
        send_http_response(fd, plain_response(426, "Expected a WebSocket upgrade"));
        ::close(fd);
        return;
    }
    if (request.header("sec-websocket-version") != "13") {
        auto resp = plain_response(426, "Unsupported WebSocket version");
        resp.headers.emplace_back("Sec-WebSocket-Version", "13");
        send_http_response(fd, resp);
        ::close(fd);
        return;
    }

    std::string handshake =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + websocket_accept_key(key) + "\r\n\r\n";
    if (!send_raw(fd, handshake)) {
        ::close(fd);
        return;
    }

    // Upgraded connections are long-lived; drop the handshake timeout.
    struct timeval tv{0, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string session_id = generate_id();
    WebSocketConnection conn(fd, max_frame_, std::move(leftover), peer);

    struct Registration {
        ConnectionRegistry& registry;
        std::string id;
        ~Registration() { registry.remove(id); }
    };
    registry_.add(session_id, &conn);
    Registration registration{registry_, session_id};
    if (!running_.load()) conn.close();  // raced with stop()

    SessionMultiplexer mux(session_id, store_, client_, &uploads_, turn_options_,
                           queue_capacity_);
    ConnectionSupervisor supervisor(conn, mux);
    supervisor.serve();
}

} // namespace chatmux
