#include "sse.hpp"

namespace chatmux {

// Extracts the value of a "field: value" or "field:value" line.
static bool field_value(const std::string& line, const char* field, size_t flen,
                        std::string& value) {
    if (line.compare(0, flen, field) != 0 || line.size() < flen + 1 || line[flen] != ':')
        return false;
    size_t start = flen + 1;
    if (start < line.size() && line[start] == ' ') ++start;
    value = line.substr(start);
    return true;
}

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (has_data_) {
        SSEEvent event{event_, data_};
        keep_going = callback(event);
    }
    event_.clear();
    data_.clear();
    has_data_ = false;
    return keep_going;
}

bool SSEParser::feed(const char* data, size_t len, const SSECallback& callback) {
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];
        if (c != '\n') {
            line_ += c;
            continue;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();

        std::string line;
        line.swap(line_);
        if (line.empty()) {
            if (!dispatch(callback)) return false;
            continue;
        }
        if (line[0] == ':') continue;  // comment / keep-alive

        std::string value;
        if (field_value(line, "data", 4, value)) {
            if (has_data_) data_ += '\n';
            data_ += value;
            has_data_ = true;
        } else if (field_value(line, "event", 5, value)) {
            event_ = value;
        }
        // id:, retry: and unknown fields are ignored
    }
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    if (!line_.empty()) {
        // Treat an unterminated last line as complete.
        std::string tail = "\n";
        if (!feed(tail, callback)) return false;
    }
    return dispatch(callback);
}

void SSEParser::reset() {
    line_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace chatmux
