#pragma once
#include <string>
#include <functional>

namespace chatmux {

struct SSEEvent {
    std::string event;  // "event:" field, empty for the default "message" type
    std::string data;   // joined "data:" lines
};

// Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental text/event-stream parser. Chunks may split lines and events
// at any byte; partial input is carried over to the next feed().
class SSEParser {
public:
    // Returns false if the callback asked to stop.
    bool feed(const char* data, size_t len, const SSECallback& callback);
    bool feed(const std::string& chunk, const SSECallback& callback) {
        return feed(chunk.data(), chunk.size(), callback);
    }

    // Dispatch an event left pending when the stream ends without a
    // trailing blank line.
    bool finish(const SSECallback& callback);

    void reset();

private:
    bool dispatch(const SSECallback& callback);

    std::string line_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

} // namespace chatmux
