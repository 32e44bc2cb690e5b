#include "stream_client.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "streams/canned.hpp"
#include <iostream>

namespace chatmux {

std::unique_ptr<StreamClient> create_stream_client(const Config& config, HttpClient& http) {
    auto client = PluginRegistry::instance().create_stream_client(config.provider, config, http);
    if (config.canned_path.empty()) return client;

    auto responses = load_canned_responses(config.canned_path);
    std::cerr << "[canned] Loaded " << responses.size() << " canned responses from "
              << config.canned_path << "\n";
    return std::make_unique<CannedStreamClient>(std::move(responses), std::move(client));
}

} // namespace chatmux
