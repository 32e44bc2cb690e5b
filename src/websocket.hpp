#pragma once
#include "connection.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace chatmux {

// RFC 6455 opcodes
enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

// Close status codes sent by the server
constexpr uint16_t WS_CLOSE_NORMAL = 1000;
constexpr uint16_t WS_CLOSE_PROTOCOL = 1002;
constexpr uint16_t WS_CLOSE_UNSUPPORTED = 1003;
constexpr uint16_t WS_CLOSE_TOO_BIG = 1009;

// Sec-WebSocket-Accept value for a client's Sec-WebSocket-Key.
std::string websocket_accept_key(const std::string& client_key);

// Encode one frame. mask is a 4-byte key for client-to-server frames, or
// nullptr for unmasked server frames.
std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            bool fin = true, const uint8_t* mask = nullptr);

// Server side of an upgraded WebSocket over a connected socket. Owns fd.
class WebSocketConnection : public Connection {
public:
    // leftover: bytes already read past the end of the handshake request.
    WebSocketConnection(int fd, size_t max_message, std::string leftover,
                        std::string peer = "");
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    // Reassembles fragmented text messages and answers pings. Returns Closed
    // after a close handshake or EOF, Error on protocol violations (the peer
    // is sent a close frame with the matching status first).
    ReadStatus read_message(std::string& out) override;

    bool write_message(const std::string& text) override;

    void close() override;

    std::string peer() const override { return peer_; }

private:
    bool read_exact(char* dst, size_t n);
    bool write_frame(WsOpcode opcode, const std::string& payload);
    void send_close(uint16_t code, const std::string& reason = "");

    int fd_;
    size_t max_message_;
    std::string leftover_;
    size_t leftover_pos_ = 0;
    std::string peer_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
    bool close_sent_ = false;  // guarded by write_mutex_
};

} // namespace chatmux
