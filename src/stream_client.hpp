#pragma once
#include "thread_store.hpp"
#include <string>
#include <vector>
#include <memory>

namespace chatmux {

class HttpClient;
struct Config;

struct StreamRequest {
    std::string prompt;            // the new user message
    std::vector<Message> history;  // prior messages of the thread
    std::string language = "English";
    std::string image_path;        // local file, empty when text-only
};

enum class StreamStatus { Fragment, Done, Error, Abandoned };

struct StreamItem {
    StreamStatus status = StreamStatus::Done;
    std::string text;  // fragment text, or the error reason

    static StreamItem fragment(std::string t) { return {StreamStatus::Fragment, std::move(t)}; }
    static StreamItem done() { return {StreamStatus::Done, {}}; }
    static StreamItem error(std::string reason) { return {StreamStatus::Error, std::move(reason)}; }
    static StreamItem abandoned() { return {StreamStatus::Abandoned, {}}; }
};

// Lazy, finite, non-restartable sequence of text fragments. The consumer
// pulls with next(); once a terminal item (Done/Error/Abandoned) has been
// returned, every later call returns a terminal item again.
class FragmentStream {
public:
    virtual ~FragmentStream() = default;

    // Blocks until the next fragment or terminal marker is available.
    virtual StreamItem next() = 0;

    // Stop producing and release the upstream call. Safe to call from any
    // thread; a next() blocked in another thread returns Abandoned.
    virtual void abandon() = 0;
};

// Streaming text-generation capability. Shared across connections; each
// start_stream call is independent.
class StreamClient {
public:
    virtual ~StreamClient() = default;

    // Throws ChatError(Upstream) when the stream cannot be started at all.
    virtual std::unique_ptr<FragmentStream> start_stream(const StreamRequest& request) = 0;

    virtual std::string client_name() const = 0;
};

// Create the client named by config.provider via the plugin registry and,
// when config.canned_path is set, wrap it with canned-response lookup.
std::unique_ptr<StreamClient> create_stream_client(const Config& config, HttpClient& http);

} // namespace chatmux
