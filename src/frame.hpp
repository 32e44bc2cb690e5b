#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace chatmux {

// Client → server message on the realtime channel.
struct InboundFrame {
    std::optional<std::string> thread_id;
    std::string text;
    std::optional<std::string> image_ref;
    bool del = false;
    std::string language;  // empty = session default
};

enum class FrameKind {
    Started,
    Fragment,
    Completed,
    Failed,
    Cancelled,
    Deleted,
    ProtocolError,
};

const char* frame_kind_name(FrameKind kind);

// Server → client message.
struct OutboundFrame {
    std::string thread_id;
    std::string turn_id;  // empty for frames not tied to a turn
    FrameKind kind = FrameKind::ProtocolError;
    uint64_t seq = 0;     // meaningful for Fragment only
    std::string payload;
    std::string code;     // empty = omitted

    bool is_terminal() const {
        return kind == FrameKind::Completed || kind == FrameKind::Failed ||
               kind == FrameKind::Cancelled;
    }
};

// Decode one text message. Throws ChatError(Protocol) on malformed JSON,
// wrong field types, or a non-delete frame with neither text nor image.
InboundFrame parse_inbound(const std::string& text);

std::string encode_outbound(const OutboundFrame& frame);

} // namespace chatmux
