#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatmux {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "gemini"},
        {"model", "gemini-2.5-flash"},
        {"temperature", 0.7},
        {"providers", {
            {"gemini", {{"api_key", ""}, {"base_url", ""}}}
        }},
        {"server", {
            {"listen", "0.0.0.0:8080"},
            {"ws_path", "/ws/chat"},
            {"max_body", 10 * 1024 * 1024},
            {"max_frame", 1024 * 1024}
        }},
        {"session", {
            {"queue_capacity", 256},
            {"turn_deadline_ms", 0},
            {"persist_attempts", 3},
            {"default_language", "English"}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"uploads", {{"dir", ""}}},
        {"canned", {{"path", ""}}}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    Config cfg = load_from(expand_home("~/.chatmux/config.json"));
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    return from_json(j);
}

// Non-negative integer field; anything else leaves out untouched.
static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    auto v = obj[key].get<int64_t>();
    if (v >= 0 && v <= static_cast<int64_t>(UINT32_MAX)) out = static_cast<uint32_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("ws_path") && s["ws_path"].is_string())
            cfg.server.ws_path = s["ws_path"].get<std::string>();
        read_u32(s, "max_body", cfg.server.max_body);
        read_u32(s, "max_frame", cfg.server.max_frame);
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read_u32(s, "queue_capacity", cfg.session.queue_capacity);
        read_u32(s, "turn_deadline_ms", cfg.session.turn_deadline_ms);
        read_u32(s, "persist_attempts", cfg.session.persist_attempts);
        if (s.contains("default_language") && s["default_language"].is_string())
            cfg.session.default_language = s["default_language"].get<std::string>();
    }
    if (cfg.session.queue_capacity == 0) cfg.session.queue_capacity = 1;
    if (cfg.session.persist_attempts == 0) cfg.session.persist_attempts = 1;

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.store.backend = s["backend"].get<std::string>();
        if (s.contains("path") && s["path"].is_string())
            cfg.store.path = s["path"].get<std::string>();
    }

    if (j.contains("uploads") && j["uploads"].is_object()) {
        auto& u = j["uploads"];
        if (u.contains("dir") && u["dir"].is_string())
            cfg.upload_dir = u["dir"].get<std::string>();
    }

    if (j.contains("canned") && j["canned"].is_object()) {
        auto& c = j["canned"];
        if (c.contains("path") && c["path"].is_string())
            cfg.canned_path = c["path"].get<std::string>();
    }

    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("GEMINI_API_KEY"))
        providers["gemini"].api_key = v;
    if (const char* v = std::getenv("CHATMUX_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("CHATMUX_STORE_PATH"))
        store.path = v;
    if (const char* v = std::getenv("CHATMUX_UPLOAD_DIR"))
        upload_dir = v;
    if (const char* v = std::getenv("CHATMUX_CANNED_PATH"))
        canned_path = v;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::resolved_store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    return expand_home("~/.chatmux/threads.db");
}

std::string Config::resolved_upload_dir() const {
    if (!upload_dir.empty()) return expand_home(upload_dir);
    return expand_home("~/.chatmux/uploads");
}

} // namespace chatmux
