#pragma once

#include <string>

namespace pastebin {

constexpr const char* WHITESPACE = " \t\n\r\f\v";

/**
 * Strip leading and trailing whitespace.
 */
inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(WHITESPACE);
    return s.substr(start, end - start + 1);
}

/**
 * True if the string is empty or whitespace only.
 */
inline bool is_blank(const std::string& s) {
    return s.find_first_not_of(WHITESPACE) == std::string::npos;
}

/**
 * Truncate a string for display, adding "..." if needed.
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

}  // namespace pastebin
