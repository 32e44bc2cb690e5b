#include "frame.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatmux {

const char* frame_kind_name(FrameKind kind) {
    switch (kind) {
        case FrameKind::Started:       return "started";
        case FrameKind::Fragment:      return "fragment";
        case FrameKind::Completed:     return "completed";
        case FrameKind::Failed:        return "failed";
        case FrameKind::Cancelled:     return "cancelled";
        case FrameKind::Deleted:       return "deleted";
        case FrameKind::ProtocolError: return "protocol_error";
    }
    return "protocol_error";
}

// First present key of names, which must be a string or null.
static std::optional<std::string> string_field(const json& j,
                                               std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = j.find(name);
        if (it == j.end() || it->is_null()) continue;
        if (!it->is_string()) {
            throw ChatError(ErrorKind::Protocol,
                            std::string("field '") + name + "' must be a string");
        }
        return it->get<std::string>();
    }
    return std::nullopt;
}

InboundFrame parse_inbound(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error&) {
        throw ChatError(ErrorKind::Protocol, "frame is not valid JSON");
    }
    if (!j.is_object()) {
        throw ChatError(ErrorKind::Protocol, "frame must be a JSON object");
    }

    InboundFrame frame;
    auto thread_id = string_field(j, {"thread_id", "threadId"});
    if (thread_id && !thread_id->empty()) frame.thread_id = std::move(thread_id);
    frame.text = string_field(j, {"text", "content"}).value_or("");
    auto image = string_field(j, {"image_ref", "image"});
    if (image && !image->empty()) frame.image_ref = std::move(image);
    frame.language = string_field(j, {"language"}).value_or("");

    auto del = j.find("delete");
    if (del != j.end() && !del->is_null()) {
        if (!del->is_boolean()) {
            throw ChatError(ErrorKind::Protocol, "field 'delete' must be a boolean");
        }
        frame.del = del->get<bool>();
    }

    if (frame.del) {
        if (!frame.thread_id) {
            throw ChatError(ErrorKind::Protocol, "delete requires a thread_id");
        }
    } else if (frame.text.empty() && !frame.image_ref) {
        throw ChatError(ErrorKind::Protocol, "frame needs text or an image_ref");
    }
    return frame;
}

std::string encode_outbound(const OutboundFrame& frame) {
    json j;
    j["thread_id"] = frame.thread_id;
    if (!frame.turn_id.empty()) j["turn_id"] = frame.turn_id;
    j["kind"] = frame_kind_name(frame.kind);
    if (frame.kind == FrameKind::Fragment) j["seq"] = frame.seq;
    j["payload"] = frame.payload;
    if (!frame.code.empty()) j["code"] = frame.code;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace chatmux
