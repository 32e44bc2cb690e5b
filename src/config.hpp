#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chatmux {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct ServerConfig {
    std::string listen = "0.0.0.0:8080";
    std::string ws_path = "/ws/chat";
    uint32_t max_body = 10 * 1024 * 1024;  // HTTP request bodies (uploads)
    uint32_t max_frame = 1024 * 1024;      // one reassembled WebSocket message
};

struct SessionConfig {
    uint32_t queue_capacity = 256;
    uint32_t turn_deadline_ms = 0;  // 0 = no deadline
    uint32_t persist_attempts = 3;
    std::string default_language = "English";
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path;  // empty = ~/.chatmux/threads.db
};

struct Config {
    std::string provider = "gemini";
    std::string model = "gemini-2.5-flash";
    double temperature = 0.7;

    std::unordered_map<std::string, ProviderEntry> providers;

    ServerConfig server;
    SessionConfig session;
    StoreConfig store;
    std::string upload_dir;   // empty = ~/.chatmux/uploads
    std::string canned_path;  // empty = no canned responses

    // Load from ~/.chatmux/config.json + env vars
    static Config load();

    // Load from an explicit path. Creates the file with defaults if missing
    // and rewrites it when new default keys were merged in.
    static Config load_from(const std::string& path);

    // Parse an already-merged JSON document (no env overrides).
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Environment variables always override the config file
    void apply_env_overrides();

    std::string api_key_for(const std::string& provider) const;

    std::string base_url_for(const std::string& provider) const;

    std::string resolved_store_path() const;
    std::string resolved_upload_dir() const;
};

} // namespace chatmux
