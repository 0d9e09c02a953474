#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace agentbridge {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Random RFC 4122 version 4 UUID, lowercase hex
std::string generate_uuid();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file and rename over the target
bool atomic_write_file(const std::string& path, const std::string& content);

// Leading arguments for log output, at most max_args. The final argument
// (the prompt) is always left out and marked with "..."
std::string format_command(const std::vector<std::string>& argv, size_t max_args = 6);

} // namespace agentbridge
