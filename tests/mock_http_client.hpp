#pragma once
#include "http.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace chatmux {

class MockHttpClient : public HttpClient {
public:
    // stream_post_raw delivers these chunks, then returns stream_status with
    // stream_error_body (non-2xx) as the body.
    std::vector<std::string> stream_chunks;
    long stream_status = 200;
    std::string stream_error_body;
    // After the chunks, block until the abort flag is set (status 0).
    bool hang_after_chunks = false;

    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    std::atomic<int> call_count{0};
    std::atomic<bool> saw_abort{false};

    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const std::atomic<bool>* abort_flag,
                                 long /*timeout_seconds*/) override {
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;

        HttpResponse resp;
        if (stream_status < 200 || stream_status >= 300) {
            resp.status_code = stream_status;
            resp.body = stream_error_body;
            return resp;
        }
        for (const auto& chunk : stream_chunks) {
            if (abort_flag && abort_flag->load()) {
                saw_abort = true;
                return resp;  // status 0: aborted
            }
            if (!callback(chunk.data(), chunk.size())) {
                resp.status_code = stream_status;
                return resp;
            }
        }
        if (hang_after_chunks) {
            while (!(abort_flag && abort_flag->load())) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            saw_abort = true;
            return resp;
        }
        resp.status_code = stream_status;
        return resp;
    }
};

} // namespace chatmux
