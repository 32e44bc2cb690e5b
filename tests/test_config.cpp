#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace chatmux;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "gemini");
    REQUIRE(cfg.temperature == 0.7);
    REQUIRE(cfg.server.listen == "0.0.0.0:8080");
    REQUIRE(cfg.server.ws_path == "/ws/chat");
    REQUIRE(cfg.session.queue_capacity == 256);
    REQUIRE(cfg.session.turn_deadline_ms == 0);
    REQUIRE(cfg.session.persist_attempts == 3);
    REQUIRE(cfg.session.default_language == "English");
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.api_key_for("gemini").empty());
}

TEST_CASE("Config::api_key_for: returns key per provider", "[config]") {
    Config cfg;
    cfg.providers["gemini"].api_key = "g-key";
    REQUIRE(cfg.api_key_for("gemini") == "g-key");
    REQUIRE(cfg.api_key_for("unknown").empty());
}

TEST_CASE("Config::base_url_for: returns configured URL", "[config]") {
    Config cfg;
    cfg.providers["gemini"].base_url = "http://localhost:9000/v1beta";
    REQUIRE(cfg.base_url_for("gemini") == "http://localhost:9000/v1beta");
    REQUIRE(cfg.base_url_for("other").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    nlohmann::json j = {
        {"provider", "gemini"},
        {"model", "gemini-2.0-flash"},
        {"temperature", 0.2},
        {"providers", {{"gemini", {{"api_key", "k"}, {"base_url", "http://x"}}}}},
        {"server", {{"listen", "127.0.0.1:9999"}, {"ws_path", "/ws"},
                    {"max_body", 1024}, {"max_frame", 2048}}},
        {"session", {{"queue_capacity", 8}, {"turn_deadline_ms", 5000},
                     {"persist_attempts", 5}, {"default_language", "French"}}},
        {"store", {{"backend", "memory"}, {"path", "/tmp/t.db"}}},
        {"uploads", {{"dir", "/tmp/up"}}},
        {"canned", {{"path", "/tmp/canned.json"}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "gemini-2.0-flash");
    REQUIRE(cfg.temperature == 0.2);
    REQUIRE(cfg.api_key_for("gemini") == "k");
    REQUIRE(cfg.server.listen == "127.0.0.1:9999");
    REQUIRE(cfg.server.ws_path == "/ws");
    REQUIRE(cfg.server.max_body == 1024);
    REQUIRE(cfg.server.max_frame == 2048);
    REQUIRE(cfg.session.queue_capacity == 8);
    REQUIRE(cfg.session.turn_deadline_ms == 5000);
    REQUIRE(cfg.session.persist_attempts == 5);
    REQUIRE(cfg.session.default_language == "French");
    REQUIRE(cfg.store.backend == "memory");
    REQUIRE(cfg.resolved_store_path() == "/tmp/t.db");
    REQUIRE(cfg.resolved_upload_dir() == "/tmp/up");
    REQUIRE(cfg.canned_path == "/tmp/canned.json");
}

TEST_CASE("Config::from_json: zero capacity and attempts are clamped", "[config]") {
    Config cfg = Config::from_json({{"session", {{"queue_capacity", 0}, {"persist_attempts", 0}}}});
    REQUIRE(cfg.session.queue_capacity == 1);
    REQUIRE(cfg.session.persist_attempts == 1);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    Config cfg = Config::from_json({{"session", {{"queue_capacity", "lots"}, {"turn_deadline_ms", -5}}},
                                    {"model", 42}});
    REQUIRE(cfg.session.queue_capacity == 256);
    REQUIRE(cfg.session.turn_deadline_ms == 0);
    REQUIRE(cfg.model == "gemini-2.5-flash");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "chatmux_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("GEMINI_API_KEY");
        unsetenv("CHATMUX_LISTEN");
        unsetenv("CHATMUX_STORE_PATH");
        unsetenv("CHATMUX_UPLOAD_DIR");
        unsetenv("CHATMUX_CANNED_PATH");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.chatmux/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.chatmux");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "gemini");
    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["server"]["ws_path"] == "/ws/chat");
    REQUIRE(j["session"]["queue_capacity"] == 256);
    REQUIRE(j["store"]["backend"] == "sqlite");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"providers": {"gemini": {"api_key": "sk-test"}}, "model": "gemini-pro"})");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("gemini") == "sk-test");
    REQUIRE(cfg.model == "gemini-pro");

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["providers"]["gemini"]["api_key"] == "sk-test");
    REQUIRE(j["providers"]["gemini"].contains("base_url"));
    REQUIRE(j.contains("session"));
    REQUIRE(j["session"]["persist_attempts"] == 3);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{not json");
    Config cfg = Config::load();
    REQUIRE(cfg.provider == "gemini");
    REQUIRE(cfg.session.queue_capacity == 256);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"providers": {"gemini": {"api_key": "from-file"}},
                       "server": {"listen": "127.0.0.1:1"}})");

    setenv("GEMINI_API_KEY", "from-env", 1);
    setenv("CHATMUX_LISTEN", "0.0.0.0:7000", 1);
    setenv("CHATMUX_STORE_PATH", "/tmp/env.db", 1);
    setenv("CHATMUX_UPLOAD_DIR", "/tmp/env-uploads", 1);
    setenv("CHATMUX_CANNED_PATH", "/tmp/env-canned.json", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("gemini") == "from-env");
    REQUIRE(cfg.server.listen == "0.0.0.0:7000");
    REQUIRE(cfg.resolved_store_path() == "/tmp/env.db");
    REQUIRE(cfg.resolved_upload_dir() == "/tmp/env-uploads");
    REQUIRE(cfg.canned_path == "/tmp/env-canned.json");

    unsetenv("GEMINI_API_KEY");
    unsetenv("CHATMUX_LISTEN");
    unsetenv("CHATMUX_STORE_PATH");
    unsetenv("CHATMUX_UPLOAD_DIR");
    unsetenv("CHATMUX_CANNED_PATH");
}

TEST_CASE("Config: default paths live under ~/.chatmux", "[config]") {
    ConfigTestGuard g;
    Config cfg;
    REQUIRE(cfg.resolved_store_path() == g.dir + "/.chatmux/threads.db");
    REQUIRE(cfg.resolved_upload_dir() == g.dir + "/.chatmux/uploads");
}
