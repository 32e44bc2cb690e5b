#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chatmux {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// First max_chars UTF-8 characters of s; a truncated trailing sequence is dropped.
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Write via temp file + rename so readers never observe a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

// Standard base64 (RFC 4648) with padding.
std::string base64_encode(const std::string& data);

} // namespace chatmux
