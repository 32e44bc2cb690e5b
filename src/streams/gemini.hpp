#pragma once
#include "../stream_client.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace chatmux {

// Google Gemini streamGenerateContent over server-sent events.
class GeminiStreamClient : public StreamClient {
public:
    GeminiStreamClient(const std::string& api_key, HttpClient& http,
                       const std::string& base_url, const std::string& model,
                       double temperature);

    std::unique_ptr<FragmentStream> start_stream(const StreamRequest& request) override;

    std::string client_name() const override { return "gemini"; }

    // Exposed for tests.
    nlohmann::json build_request(const StreamRequest& request) const;
    std::string stream_url() const;

    // MIME type from the file extension (image/jpeg when unknown).
    static std::string mime_type_for(const std::string& path);

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    double temperature_;
};

} // namespace chatmux
