#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace _ActionStreamHelpers {

static inline bool is_space(unsigned char ch) {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
}

static inline void trim_inplace(std::string& s) {
    // Remove leading/trailing whitespace in-place.
    size_t a = 0, b = s.size();
    while (a < b && is_space(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && is_space(static_cast<unsigned char>(s[b-1]))) --b;

    // Only reassign if trimming actually changes the view.
    if (a==0 && b==s.size()) return;
    s.assign(s.begin()+a, s.begin()+b);
}

static inline std::string_view trim_view(std::string_view s) {
    size_t a = 0, b = s.size();
    while (a < b && is_space(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && is_space(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static inline bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Length of the longest suffix of `s` that is a proper prefix of `marker`.
// Used to hold back bytes that may still turn into a marker.
static inline size_t partial_suffix_len(std::string_view s, std::string_view marker) {
    size_t maxLen = std::min(s.size(), marker.size() > 0 ? marker.size() - 1 : 0);
    for (size_t n = maxLen; n > 0; --n) {
        if (s.substr(s.size() - n) == marker.substr(0, n)) return n;
    }
    return 0;
}

static inline std::string sh_quote(std::string_view s) {
    // Quote a string for POSIX shell literal context.
    // - Encloses with single quotes.
    // - Internal single quotes become '\''.
    std::string t;
    t.reserve(s.size() + 2);
    t.push_back('\'');
    for (char c : s) {
        if (c == '\'') t += "'\\''";
        else t.push_back(c);
    }
    t.push_back('\'');
    return t;
}

} // namespace _ActionStreamHelpers
