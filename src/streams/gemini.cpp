#include "gemini.hpp"
#include "buffered.hpp"
#include "sse.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

static chatmux::StreamClientRegistrar reg_gemini("gemini",
    [](const chatmux::Config& config, chatmux::HttpClient& http) {
        return std::make_unique<chatmux::GeminiStreamClient>(
            config.api_key_for("gemini"), http, config.base_url_for("gemini"),
            config.model, config.temperature);
    });

using json = nlohmann::json;

namespace chatmux {

GeminiStreamClient::GeminiStreamClient(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url,
                                       const std::string& model, double temperature)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://generativelanguage.googleapis.com/v1beta"
                                 : base_url),
      model_(model), temperature_(temperature) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string GeminiStreamClient::stream_url() const {
    return base_url_ + "/models/" + model_ + ":streamGenerateContent?alt=sse";
}

std::string GeminiStreamClient::mime_type_for(const std::string& path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? "" : to_lower(path.substr(dot + 1));
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    return "image/jpeg";
}

static std::string read_image(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ChatError(ErrorKind::Upstream, "cannot read image: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

json GeminiStreamClient::build_request(const StreamRequest& request) const {
    json contents = json::array();
    for (const auto& msg : request.history) {
        if (msg.content.empty()) continue;
        contents.push_back({
            {"role", msg.role == Role::Assistant ? "model" : "user"},
            {"parts", json::array({{{"text", msg.content}}})}
        });
    }

    json parts = json::array();
    if (request.image_path.empty()) {
        parts.push_back({{"text", "Respond in " + request.language +
                                  ". User query: " + request.prompt}});
    } else {
        std::string text = request.prompt.empty() ? "Describe this image in detail."
                                                  : request.prompt;
        parts.push_back({{"text", "Respond in " + request.language + ". " + text}});
        parts.push_back({{"inline_data", {
            {"mime_type", mime_type_for(request.image_path)},
            {"data", base64_encode(read_image(request.image_path))}
        }}});
    }
    contents.push_back({{"role", "user"}, {"parts", parts}});

    json body;
    body["contents"] = contents;
    body["generationConfig"] = {{"temperature", temperature_}};
    return body;
}

// Message of a Gemini error document, or the raw body.
static std::string error_detail(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_array() && !j.empty()) j = j[0];
        if (j.contains("error") && j["error"].is_object()) {
            return j["error"].value("message", body);
        }
    } catch (const json::exception&) {
        // not JSON
    }
    return body;
}

std::unique_ptr<FragmentStream> GeminiStreamClient::start_stream(const StreamRequest& request) {
    if (api_key_.empty()) {
        throw ChatError(ErrorKind::Upstream, "no API key configured for gemini");
    }

    std::string body = build_request(request).dump();
    std::vector<Header> headers = {
        {"content-type", "application/json"},
        {"x-goog-api-key", api_key_}
    };

    auto stream = std::make_unique<BufferedFragmentStream>();
    HttpClient* http = &http_;
    std::string url = stream_url();

    stream->start([http, url, body, headers](BufferedFragmentStream& out) {
        SSEParser parser;
        std::string stream_error;

        auto on_event = [&](const SSEEvent& sse) -> bool {
            if (sse.data.empty()) return true;
            json payload;
            try {
                payload = json::parse(sse.data);
            } catch (const json::exception&) {
                stream_error = "malformed stream data";
                return false;
            }

            if (payload.contains("error")) {
                stream_error = error_detail(sse.data);
                return false;
            }
            if (payload.contains("promptFeedback") &&
                payload["promptFeedback"].contains("blockReason")) {
                stream_error = "prompt blocked: " +
                    payload["promptFeedback"]["blockReason"].get<std::string>();
                return false;
            }
            if (!payload.contains("candidates") || payload["candidates"].empty()) {
                return true;
            }
            const auto& candidate = payload["candidates"][0];
            if (!candidate.contains("content") ||
                !candidate["content"].contains("parts")) {
                return true;
            }
            for (const auto& part : candidate["content"]["parts"]) {
                std::string text = part.value("text", "");
                if (text.empty()) continue;
                if (!out.push(std::move(text))) return false;
            }
            return true;
        };

        auto response = http->stream_post_raw(
            url, body, headers,
            [&](const char* data, size_t len) -> bool {
                return parser.feed(data, len, on_event);
            },
            out.abandon_flag());

        if (out.abandoned()) return;
        if (stream_error.empty() && response.status_code == 200) {
            parser.finish(on_event);
        }

        if (!stream_error.empty()) {
            out.fail(stream_error);
        } else if (response.status_code == 0) {
            out.fail("connection failed");
        } else if (response.status_code < 200 || response.status_code >= 300) {
            std::cerr << "[gemini] HTTP " << response.status_code << "\n";
            out.fail("HTTP " + std::to_string(response.status_code) + ": " +
                     error_detail(response.body));
        } else {
            out.finish();
        }
    });

    return stream;
}

} // namespace chatmux
