#pragma once

#include <string>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Generate a job id: YYYY-MM-DDTHH-MM-SS-mmm__<kind>
std::string generate_job_id(const std::string& kind);

// Expand a leading "~/" to the user's home directory.
std::string expand_home(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Join strings with a separator: {"a","b"} → "a, b"
std::string join(const std::vector<std::string>& parts, const std::string& sep = ", ");
