#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace chatmux {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_stream_client(const std::string& name, StreamClientFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_clients_[name] = std::move(factory);
}

void PluginRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

std::unique_ptr<StreamClient> PluginRegistry::create_stream_client(const std::string& name,
                                                                   const Config& config,
                                                                   HttpClient& http) const {
    StreamClientFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stream_clients_.find(name);
        if (it == stream_clients_.end()) {
            throw std::invalid_argument("Unknown stream client: " + name);
        }
        factory = it->second;
    }
    return factory(config, http);
}

std::unique_ptr<ThreadStore> PluginRegistry::create_store(const std::string& name,
                                                          const Config& config) const {
    StoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) {
            throw std::invalid_argument("Unknown thread store: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::stream_client_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(stream_clients_);
}

std::vector<std::string> PluginRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(stores_);
}

bool PluginRegistry::has_stream_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_clients_.count(name) > 0;
}

bool PluginRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

} // namespace chatmux
