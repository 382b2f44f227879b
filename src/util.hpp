#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace gaistream {

// Unix epoch milliseconds
int64_t epoch_millis();

// Unix epoch nanoseconds
int64_t epoch_nanos();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Case-sensitive substring test
bool contains(const std::string& haystack, const std::string& needle);

// Base64 (standard alphabet, padded) via OpenSSL
std::string base64_encode(const std::string& bytes);

// Returns false on malformed input
bool base64_decode(const std::string& text, std::string& out);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write a file via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace gaistream
