#pragma once

#include <string>

// ASCII-only lowercase copy. Locale settings are ignored.
std::string to_lower(const std::string& s);

// True if `s` is empty or contains only whitespace.
bool is_blank(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
