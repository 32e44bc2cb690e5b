// Outbound HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Used by the Gemini stream client; body I/O runs in 1-second slices so both
// the process-wide and the per-request abort flags are honoured promptly.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <stdexcept>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatmux {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http_socket: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── RAII socket (TCP + optional TLS) ───────────────────────────

class ClientSocket {
public:
    explicit ClientSocket(const std::atomic<bool>* abort_flag) : abort_flag_(abort_flag) {}
    ~ClientSocket() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    ClientSocket(const ClientSocket&)            = delete;
    ClientSocket& operator=(const ClientSocket&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd_, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd_ + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd_, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd_); fd_ = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_) return false;
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx_);
            SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

            ssl_ = SSL_new(ctx_);
            if (!ssl_) return false;
            SSL_set_fd(ssl_, fd_);
            SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

            if (SSL_connect(ssl_) != 1) return false;
        }

        set_socket_timeout(1);
        return true;
    }

    bool aborted() const {
        if (g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed))
            return true;
        return abort_flag_ && abort_flag_->load(std::memory_order_relaxed);
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or abort.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (aborted()) return -1;

            ssize_t n;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                return -1;
            }
            n = ::recv(fd_, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    const std::atomic<bool>* abort_flag_;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static bool read_line(ClientSocket& sock, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = sock.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
static long parse_response_headers(ClientSocket& sock, std::string& leftover,
                                    bool& is_chunked, size_t& content_length) {
    is_chunked     = false;
    content_length = 0;

    std::string status_line;
    if (!read_line(sock, leftover, status_line) || status_line.empty()) return 0;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return 0;
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 599) return 0;

    while (true) {
        std::string line;
        if (!read_line(sock, leftover, line)) return 0;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            content_length = std::strtoul(value.c_str(), nullptr, 10);
    }
    return status;
}

// Read exactly n bytes through sink, consuming leftover first.
static bool read_exactly(ClientSocket& sock, std::string& leftover, size_t n,
                          const RawChunkCallback& sink, bool& stopped) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            if (!sink(leftover.data(), take)) { stopped = true; return false; }
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = sock.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        if (!sink(buf, static_cast<size_t>(got))) { stopped = true; return false; }
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Deliver the body to sink; dechunks if needed. Returns false on I/O error.
static bool stream_body(ClientSocket& sock, std::string& leftover,
                        bool is_chunked, size_t content_length,
                        const RawChunkCallback& sink) {
    bool stopped = false;
    if (is_chunked) {
        RawChunkCallback discard = [](const char*, size_t) { return true; };
        for (;;) {
            std::string size_line;
            if (!read_line(sock, leftover, size_line)) return false;
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(sock, leftover, chunk_size, sink, stopped))
                return stopped;
            if (!read_exactly(sock, leftover, 2, discard, stopped)) // trailing \r\n
                return false;
        }
    }
    if (content_length > 0) {
        return read_exactly(sock, leftover, content_length, sink, stopped) || stopped;
    }
    // Read to connection close.
    if (!leftover.empty()) {
        if (!sink(leftover.data(), leftover.size())) return true;
        leftover.clear();
    }
    char buf[4096];
    for (;;) {
        ssize_t n = sock.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        if (!sink(buf, static_cast<size_t>(n))) return true;
    }
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const RawChunkCallback* success_sink,
                                const std::atomic<bool>* abort_flag,
                                long timeout_secs) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::runtime_error&) {
        return {};
    }

    ClientSocket sock(abort_flag);
    if (!sock.connect(url, timeout_secs)) return {};

    std::string request = build_request("POST", url, body, headers);
    if (!sock.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    bool   is_chunked     = false;
    size_t content_length = 0;
    long status = parse_response_headers(sock, leftover, is_chunked, content_length);
    if (status == 0) return {};

    HttpResponse resp;
    resp.status_code = status;
    RawChunkCallback collect = [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    };
    bool streaming = success_sink && status >= 200 && status < 300;
    bool ok = stream_body(sock, leftover, is_chunked, content_length,
                          streaming ? *success_sink : collect);
    if (!ok) resp.status_code = 0; // truncated body or abort
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::stream_post_raw(const std::string& url,
                                                const std::string& body,
                                                const std::vector<Header>& headers,
                                                RawChunkCallback callback,
                                                const std::atomic<bool>* abort_flag,
                                                long timeout_seconds) {
    return do_request(url, body, headers, &callback, abort_flag, timeout_seconds);
}

} // namespace chatmux
