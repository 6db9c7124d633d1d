#pragma once
#include <string>

namespace chatrelay {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Random 128-bit hex token (stream and connection ids)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories. Returns false on I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chatrelay
