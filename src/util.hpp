#pragma once
#include <string>

namespace thinkproxy {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a half-written file.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace thinkproxy
