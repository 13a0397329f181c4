#pragma once
#include <string>

namespace sqlsession {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace sqlsession
