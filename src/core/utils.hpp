#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Split on runs of spaces/tabs. Empty fields are dropped.
std::vector<std::string> split_whitespace(const std::string& s);

// Wrap in single quotes for a POSIX shell; embedded ' becomes '\''
std::string shell_quote(const std::string& s);

std::string base64_encode(const std::string& input);

// Strict decode: returns false on characters outside the alphabet,
// misplaced padding, or a length that is not a multiple of 4.
bool base64_decode(const std::string& input, std::string& out);
