#pragma once
#include "../stream_client.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatmux {

// Reads a JSON object of phrase → reply. Keys are normalized (trimmed,
// lowercased). Throws std::runtime_error on unreadable or malformed files.
std::unordered_map<std::string, std::string> load_canned_responses(const std::string& path);

// Splits a reply into word-sized fragments, each word carrying the whitespace
// before it: "Hi there!" → {"Hi", " there!"}.
std::vector<std::string> split_word_fragments(const std::string& text);

// Replays a fixed list of fragments.
class CannedFragmentStream : public FragmentStream {
public:
    explicit CannedFragmentStream(std::vector<std::string> fragments)
        : fragments_(std::move(fragments)) {}

    StreamItem next() override;
    void abandon() override { abandoned_.store(true); }

private:
    std::vector<std::string> fragments_;
    size_t index_ = 0;
    std::atomic<bool> abandoned_{false};
};

// Answers known phrases from a fixed table and delegates everything else
// (including every image prompt) to the wrapped client.
class CannedStreamClient : public StreamClient {
public:
    CannedStreamClient(std::unordered_map<std::string, std::string> responses,
                       std::unique_ptr<StreamClient> fallback);

    std::unique_ptr<FragmentStream> start_stream(const StreamRequest& request) override;

    std::string client_name() const override;

    // Reply for a prompt, or nullptr on a miss.
    const std::string* lookup(const std::string& prompt) const;

private:
    std::unordered_map<std::string, std::string> responses_;
    std::unique_ptr<StreamClient> fallback_;
};

} // namespace chatmux
