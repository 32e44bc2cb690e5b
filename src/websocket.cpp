#include "websocket.hpp"
#include "util.hpp"

#include <openssl/sha.h>

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatmux {

static const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string websocket_accept_key(const std::string& client_key) {
    std::string input = trim(client_key) + WS_GUID;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return base64_encode(std::string(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            bool fin, const uint8_t* mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame += static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    size_t len = payload.size();
    if (len < 126) {
        frame += static_cast<char>(mask_bit | len);
    } else if (len <= 0xFFFF) {
        frame += static_cast<char>(mask_bit | 126);
        frame += static_cast<char>((len >> 8) & 0xFF);
        frame += static_cast<char>(len & 0xFF);
    } else {
        frame += static_cast<char>(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame += static_cast<char>((static_cast<uint64_t>(len) >> shift) & 0xFF);
        }
    }

    if (mask) {
        frame.append(reinterpret_cast<const char*>(mask), 4);
        for (size_t i = 0; i < len; ++i) {
            frame += static_cast<char>(payload[i] ^ static_cast<char>(mask[i % 4]));
        }
    } else {
        frame += payload;
    }
    return frame;
}

// ── WebSocketConnection ─────────────────────────────────────────

WebSocketConnection::WebSocketConnection(int fd, size_t max_message, std::string leftover,
                                         std::string peer)
    : fd_(fd), max_message_(max_message), leftover_(std::move(leftover)),
      peer_(std::move(peer)) {}

WebSocketConnection::~WebSocketConnection() {
    close();
    if (fd_ >= 0) ::close(fd_);
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketConnection::read_exact(char* dst, size_t n) {
    size_t got = 0;
    while (got < n && leftover_pos_ < leftover_.size()) {
        dst[got++] = leftover_[leftover_pos_++];
    }
    if (leftover_pos_ >= leftover_.size() && !leftover_.empty()) {
        leftover_.clear();
        leftover_pos_ = 0;
    }
    while (got < n) {
        ssize_t r = ::recv(fd_, dst + got, n - got, 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        got += static_cast<size_t>(r);
    }
    return true;
}

bool WebSocketConnection::write_frame(WsOpcode opcode, const std::string& payload) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load() || close_sent_) return false;
    return send_all(fd_, encode_ws_frame(opcode, payload));
}

void WebSocketConnection::send_close(uint16_t code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (close_sent_) return;
    close_sent_ = true;
    std::string payload;
    payload += static_cast<char>((code >> 8) & 0xFF);
    payload += static_cast<char>(code & 0xFF);
    payload += reason.substr(0, 123);
    send_all(fd_, encode_ws_frame(WsOpcode::Close, payload));
}

bool WebSocketConnection::write_message(const std::string& text) {
    return write_frame(WsOpcode::Text, text);
}

void WebSocketConnection::close() {
    if (closed_.exchange(true)) return;
    // A writer may be blocked in send() holding the lock; never wait for it.
    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (lock.owns_lock() && !close_sent_) {
        close_sent_ = true;
        std::string payload;
        payload += static_cast<char>((WS_CLOSE_NORMAL >> 8) & 0xFF);
        payload += static_cast<char>(WS_CLOSE_NORMAL & 0xFF);
        std::string frame = encode_ws_frame(WsOpcode::Close, payload);
        ::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    }
    ::shutdown(fd_, SHUT_RDWR);
}

ReadStatus WebSocketConnection::read_message(std::string& out) {
    std::string message;
    bool in_message = false;

    for (;;) {
        unsigned char hdr[2];
        if (!read_exact(reinterpret_cast<char*>(hdr), 2)) return ReadStatus::Closed;

        bool fin = (hdr[0] & 0x80) != 0;
        uint8_t opcode = hdr[0] & 0x0F;
        bool masked = (hdr[1] & 0x80) != 0;
        uint64_t len = hdr[1] & 0x7F;

        if ((hdr[0] & 0x70) != 0 || !masked) {
            send_close(WS_CLOSE_PROTOCOL, "protocol error");
            return ReadStatus::Error;
        }

        if (len == 126) {
            unsigned char ext[2];
            if (!read_exact(reinterpret_cast<char*>(ext), 2)) return ReadStatus::Closed;
            len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
        } else if (len == 127) {
            unsigned char ext[8];
            if (!read_exact(reinterpret_cast<char*>(ext), 8)) return ReadStatus::Closed;
            if (ext[0] & 0x80) {
                send_close(WS_CLOSE_PROTOCOL, "bad payload length");
                return ReadStatus::Error;
            }
            len = 0;
            for (unsigned char b : ext) len = (len << 8) | b;
        }

        bool control = (opcode & 0x08) != 0;
        if (control && (!fin || len > 125)) {
            send_close(WS_CLOSE_PROTOCOL, "bad control frame");
            return ReadStatus::Error;
        }
        // message.size() never exceeds max_message_, so the subtraction cannot wrap
        if (!control && len > max_message_ - message.size()) {
            send_close(WS_CLOSE_TOO_BIG, "message too big");
            return ReadStatus::Error;
        }

        unsigned char mask[4];
        if (!read_exact(reinterpret_cast<char*>(mask), 4)) return ReadStatus::Closed;
        std::string payload(static_cast<size_t>(len), '\0');
        if (len > 0 && !read_exact(&payload[0], payload.size())) return ReadStatus::Closed;
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(payload[i] ^ static_cast<char>(mask[i % 4]));
        }

        switch (static_cast<WsOpcode>(opcode)) {
            case WsOpcode::Close:
                send_close(WS_CLOSE_NORMAL);
                return ReadStatus::Closed;
            case WsOpcode::Ping:
                write_frame(WsOpcode::Pong, payload);
                continue;
            case WsOpcode::Pong:
                continue;
            case WsOpcode::Text:
                if (in_message) {
                    send_close(WS_CLOSE_PROTOCOL, "expected continuation");
                    return ReadStatus::Error;
                }
                if (fin) {
                    out = std::move(payload);
                    return ReadStatus::Message;
                }
                message = std::move(payload);
                in_message = true;
                continue;
            case WsOpcode::Continuation:
                if (!in_message) {
                    send_close(WS_CLOSE_PROTOCOL, "unexpected continuation");
                    return ReadStatus::Error;
                }
                message += payload;
                if (fin) {
                    out = std::move(message);
                    return ReadStatus::Message;
                }
                continue;
            case WsOpcode::Binary:
                send_close(WS_CLOSE_UNSUPPORTED, "text frames only");
                return ReadStatus::Error;
        }
        send_close(WS_CLOSE_PROTOCOL, "unknown opcode");
        return ReadStatus::Error;
    }
}

} // namespace chatmux
