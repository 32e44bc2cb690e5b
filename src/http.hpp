#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace chatmux {

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = transport failure (connect, TLS, I/O)
    std::string body;
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Streaming POST client (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Streams the response body to callback. The returned body is empty for
    // 2xx responses; for other statuses it holds the (small) error body.
    // abort_flag, when set, cancels this transfer only.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         const std::atomic<bool>* abort_flag = nullptr,
                                         long timeout_seconds = 300) = 0;
};

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const std::atomic<bool>* abort_flag = nullptr,
                                 long timeout_seconds = 300) override;
};

} // namespace chatmux
