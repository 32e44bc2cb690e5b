#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using namespace chatmux;

// ── trim / to_lower / split ──────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("") == "");
    REQUIRE(trim("   ") == "");
}

TEST_CASE("to_lower: lowercases ASCII only", "[util]") {
    REQUIRE(to_lower("HeLLo World") == "hello world");
}

TEST_CASE("split: splits on delimiter", "[util]") {
    auto parts = split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[2].empty());
    REQUIRE(parts[3] == "c");
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars, unique", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto id = generate_id();
        REQUIRE(id.size() == 16);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 200);
}

// ── utf8_prefix ──────────────────────────────────────────────────

TEST_CASE("utf8_prefix: counts characters, not bytes", "[util]") {
    REQUIRE(utf8_prefix("hello world", 5) == "hello");
    REQUIRE(utf8_prefix("short", 30) == "short");
    // "héllo": é is two bytes
    REQUIRE(utf8_prefix("h\xC3\xA9llo", 2) == "h\xC3\xA9");
}

TEST_CASE("utf8_prefix: never splits a truncated sequence", "[util]") {
    std::string broken = "ab\xE2\x82";  // incomplete 3-byte sequence
    REQUIRE(utf8_prefix(broken, 10) == "ab");
}

// ── base64_encode ────────────────────────────────────────────────

TEST_CASE("base64_encode: RFC 4648 vectors", "[util]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_encode: binary data", "[util]") {
    std::string bin("\x00\xFF\x10", 3);
    REQUIRE(base64_encode(bin) == "AP8Q");
}

// ── expand_home / atomic_write_file ──────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("chatmux_util_" + std::to_string(getpid()));
    std::string path = (dir / "nested" / "file.txt").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");

    std::filesystem::remove_all(dir);
}
