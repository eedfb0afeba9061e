#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace linkagent {

// Unix epoch milliseconds
uint64_t epoch_millis();

// "2024-05-01T12:00:00.123Z" (UTC)
std::string iso_timestamp(uint64_t epoch_ms);

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split into lines on '\n'. A trailing newline does not produce an empty
// last line and a '\r' before each '\n' is dropped.
std::vector<std::string> split_lines(const std::string& s);

// Collapse every whitespace run to a single space and trim the ends
std::string collapse_whitespace(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Standard base64 with padding
std::string base64_encode(const unsigned char* data, size_t len);
std::string base64_encode(const std::string& data);

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string utf8_truncate(const std::string& s, size_t max_bytes);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file in binary mode. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write through a temp file + rename
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace linkagent
