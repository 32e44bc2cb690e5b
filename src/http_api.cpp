#include "http_api.hpp"
#include "errors.hpp"
#include "thread_store.hpp"
#include "uploads.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace chatmux {

// ── URL helpers ───────────────────────────────────────────────

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

std::string ApiRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

// ── Multipart ─────────────────────────────────────────────────

// Value of a `key=value` / `key="value"` parameter in a header value.
static std::string header_param(const std::string& value, const std::string& key) {
    for (const auto& raw : split(value, ';')) {
        std::string part = trim(raw);
        auto eq = part.find('=');
        if (eq == std::string::npos) continue;
        if (to_lower(trim(part.substr(0, eq))) != key) continue;
        std::string v = trim(part.substr(eq + 1));
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
            v = v.substr(1, v.size() - 2);
        }
        return v;
    }
    return "";
}

std::optional<MultipartFile> parse_multipart(const std::string& content_type,
                                             const std::string& body) {
    std::string boundary = header_param(content_type, "boundary");
    if (boundary.empty()) return std::nullopt;
    std::string delim = "--" + boundary;

    std::optional<MultipartFile> first;
    size_t pos = body.find(delim);
    while (pos != std::string::npos) {
        pos += delim.size();
        if (body.compare(pos, 2, "--") == 0) break;  // closing delimiter
        if (body.compare(pos, 2, "\r\n") != 0) return std::nullopt;
        pos += 2;

        size_t hdr_end = body.find("\r\n\r\n", pos);
        if (hdr_end == std::string::npos) return std::nullopt;
        size_t next = body.find("\r\n" + delim, hdr_end + 4);
        if (next == std::string::npos) return std::nullopt;

        MultipartFile part;
        for (const auto& line : split(body.substr(pos, hdr_end - pos), '\n')) {
            std::string l = trim(line);
            auto colon = l.find(':');
            if (colon == std::string::npos) continue;
            std::string name = to_lower(trim(l.substr(0, colon)));
            std::string value = trim(l.substr(colon + 1));
            if (name == "content-disposition") {
                part.field_name = header_param(value, "name");
                part.filename = header_param(value, "filename");
            } else if (name == "content-type") {
                part.content_type = value;
            }
        }
        part.data = body.substr(hdr_end + 4, next - (hdr_end + 4));

        if (!part.filename.empty()) return part;
        if (!first) first = std::move(part);
        pos = next + 2;
        pos = body.find(delim, pos);
    }
    return first;
}

// ── Routes ────────────────────────────────────────────────────

static ApiResponse json_response(int status, const json& body) {
    ApiResponse resp;
    resp.status = status;
    resp.body = body.dump();
    return resp;
}

static ApiResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

HttpApi::HttpApi(ThreadStore& store, UploadStore& uploads)
    : store_(store), uploads_(uploads) {}

ApiResponse HttpApi::handle(const ApiRequest& request) {
    ApiResponse resp;
    if (request.method == "OPTIONS") {
        resp.status = 204;
        resp.content_type.clear();
    } else {
        const std::string thread_prefix = "/api/thread/";
        const std::string upload_prefix = "/uploads/";
        const std::string& path = request.path;

        try {
            if (path == "/api/thread" || path == "/api/thread/") {
                resp = request.method == "GET" ? list_threads()
                                               : error_response(405, "method not allowed");
            } else if (path.compare(0, thread_prefix.size(), thread_prefix) == 0) {
                std::string id = url_decode(path.substr(thread_prefix.size()));
                if (request.method == "GET") resp = get_thread(id);
                else if (request.method == "DELETE") resp = delete_thread(id);
                else resp = error_response(405, "method not allowed");
            } else if (path == "/api/upload") {
                resp = request.method == "POST" ? upload(request)
                                                : error_response(405, "method not allowed");
            } else if (path.compare(0, upload_prefix.size(), upload_prefix) == 0) {
                resp = request.method == "GET"
                    ? serve_upload(url_decode(path.substr(upload_prefix.size())))
                    : error_response(405, "method not allowed");
            } else {
                resp = error_response(404, "not found");
            }
        } catch (const ChatError& e) {
            std::cerr << "[api] " << request.method << " " << path << ": " << e.what() << "\n";
            resp = error_response(500, e.what());
        }
    }

    resp.headers.emplace_back("Access-Control-Allow-Origin", "*");
    resp.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    resp.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type");
    return resp;
}

ApiResponse HttpApi::list_threads() {
    json arr = json::array();
    for (const auto& t : store_.list_threads()) {
        arr.push_back({
            {"thread_id", t.thread_id},
            {"title", t.title},
            {"created_at", t.created_at},
            {"updated_at", t.updated_at},
            {"message_count", t.message_count}
        });
    }
    return json_response(200, arr);
}

ApiResponse HttpApi::get_thread(const std::string& thread_id) {
    if (thread_id.empty() || !store_.has_thread(thread_id)) {
        return error_response(404, "thread not found");
    }
    json arr = json::array();
    for (const auto& m : store_.get_history(thread_id)) {
        json entry = {
            {"role", role_to_string(m.role)},
            {"content", m.content},
            {"created_at", m.created_at}
        };
        if (m.image_ref) entry["image_ref"] = *m.image_ref;
        arr.push_back(std::move(entry));
    }
    return json_response(200, arr);
}

ApiResponse HttpApi::delete_thread(const std::string& thread_id) {
    if (thread_id.empty()) return error_response(404, "thread not found");
    RemoveResult result = store_.remove(thread_id);
    switch (result.status) {
        case RemoveStatus::Success:
            return json_response(200, {{"success", true}, {"thread_id", thread_id}});
        case RemoveStatus::NotFound:
            return json_response(404, {{"success", false}, {"thread_id", thread_id}});
        case RemoveStatus::Error:
            break;
    }
    return error_response(500, result.error);
}

ApiResponse HttpApi::upload(const ApiRequest& request) {
    std::string content_type = request.header("content-type");
    std::string data;
    std::string mime;

    if (to_lower(content_type).rfind("multipart/form-data", 0) == 0) {
        auto part = parse_multipart(content_type, request.body);
        if (!part) return error_response(400, "malformed multipart body");
        mime = part->content_type;
        data = std::move(part->data);
    } else {
        mime = content_type;
        data = request.body;
    }

    auto ext = UploadStore::extension_for(mime);
    if (!ext) return error_response(400, "unsupported image type: " + mime);
    if (data.empty()) return error_response(400, "empty upload");

    std::string name;
    try {
        name = uploads_.save(data, *ext);
    } catch (const std::runtime_error& e) {
        std::cerr << "[api] upload failed: " << e.what() << "\n";
        return error_response(500, "could not store upload");
    }
    std::cerr << "[api] stored upload " << name << " (" << data.size() << " bytes)\n";
    return json_response(200, {
        {"url", UploadStore::url_for(name)},
        {"path", uploads_.dir() + "/" + name}
    });
}

ApiResponse HttpApi::serve_upload(const std::string& name) {
    auto path = uploads_.resolve(name);
    if (!path) return error_response(404, "not found");

    std::ifstream file(*path, std::ios::binary);
    if (!file) return error_response(404, "not found");
    std::ostringstream ss;
    ss << file.rdbuf();

    ApiResponse resp;
    resp.content_type = UploadStore::mime_type_for(*path);
    resp.body = ss.str();
    return resp;
}

} // namespace chatmux
