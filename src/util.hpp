#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace promptcache {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Fixed-point formatting, e.g. format_fixed(0.7, 2) == "0.70"
std::string format_fixed(double value, int decimals);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories as needed. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace promptcache
