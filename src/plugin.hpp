#pragma once
#include "stream_client.hpp"
#include "thread_store.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace chatmux {

// Factory function types
using StreamClientFactory = std::function<std::unique_ptr<StreamClient>(
    const Config& config, HttpClient& http)>;

using StoreFactory = std::function<std::unique_ptr<ThreadStore>(const Config& config)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_stream_client(const std::string& name, StreamClientFactory factory);
    void register_store(const std::string& name, StoreFactory factory);

    // Creation
    std::unique_ptr<StreamClient> create_stream_client(const std::string& name,
                                                       const Config& config,
                                                       HttpClient& http) const;

    std::unique_ptr<ThreadStore> create_store(const std::string& name,
                                              const Config& config) const;

    // Query
    std::vector<std::string> stream_client_names() const;
    std::vector<std::string> store_names() const;
    bool has_stream_client(const std::string& name) const;
    bool has_store(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StreamClientFactory> stream_clients_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct StreamClientRegistrar {
    StreamClientRegistrar(const std::string& name, StreamClientFactory factory) {
        PluginRegistry::instance().register_stream_client(name, std::move(factory));
    }
};

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        PluginRegistry::instance().register_store(name, std::move(factory));
    }
};

} // namespace chatmux
