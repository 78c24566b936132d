#pragma once

#include <string>
#include <vector>

// Generate a local HH:MM:SS.mmm timestamp for log lines.
std::string now_log_stamp();

// ASCII lowercase copy.
std::string to_lower(const std::string& s);

// ASCII case-insensitive equality.
bool iequals(const std::string& a, const std::string& b);

// True if s starts with prefix, ignoring ASCII case.
bool istarts_with(const std::string& s, const std::string& prefix);

// Join items with a separator.
std::string join(const std::vector<std::string>& items, const std::string& sep);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
