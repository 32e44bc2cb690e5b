#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatmux {

class ThreadStore;
class UploadStore;

// A parsed inbound HTTP request.
struct ApiRequest {
    std::string method;
    std::string path;  // without query string
    std::map<std::string, std::string> query_params;  // URL-decoded
    std::map<std::string, std::string> headers;       // names lowercased
    std::string body;

    // Header value, or "" if absent. name must be lowercase.
    std::string header(const std::string& name) const;
};

struct ApiResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;  // extra headers
};

// One file part of a multipart/form-data body.
struct MultipartFile {
    std::string field_name;
    std::string filename;
    std::string content_type;
    std::string data;
};

// First part carrying a filename (or, failing that, the first part) of a
// multipart body. nullopt when the body or boundary is malformed.
std::optional<MultipartFile> parse_multipart(const std::string& content_type,
                                             const std::string& body);

// REST routes for thread listing, history, deletion, and image uploads.
class HttpApi {
public:
    HttpApi(ThreadStore& store, UploadStore& uploads);

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse list_threads();
    ApiResponse get_thread(const std::string& thread_id);
    ApiResponse delete_thread(const std::string& thread_id);
    ApiResponse upload(const ApiRequest& request);
    ApiResponse serve_upload(const std::string& name);

    ThreadStore& store_;
    UploadStore& uploads_;
};

std::string url_decode(const std::string& s);
std::map<std::string, std::string> parse_query_string(const std::string& qs);

} // namespace chatmux
