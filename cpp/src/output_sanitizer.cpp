#include "../include/output_sanitizer.hpp"
#include "../include/helpers.h"

#include <array>
#include <cctype>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

namespace {

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

constexpr std::array<std::string_view, 6> kKeywords{
    "error:", "failed:", "warning:", "Error:", "Failed:", "Warning:",
};
constexpr std::string_view kNpmErr = "npm ERR!";

bool keyword_at(std::string_view s, size_t i) {
    for (auto kw : kKeywords) {
        if (s.compare(i, kw.size(), kw) == 0) return true;
    }
    return false;
}

// ":<digits>:<digits>" anywhere in `line`.
bool has_line_col(std::string_view line) {
    auto digits = [&](size_t& j) {
        size_t start = j;
        while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j]))) ++j;
        return j > start;
    };
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] != ':') continue;
        size_t j = i + 1;
        if (!digits(j)) continue;
        if (j >= line.size() || line[j] != ':') continue;
        ++j;
        if (digits(j)) return true;
    }
    return false;
}

bool stack_frame_at(std::string_view s, size_t i) {
    if (s.compare(i, 3, "at ") != 0) return false;
    size_t eol = s.find('\n', i);
    return has_line_col(s.substr(i, eol == std::string_view::npos ? std::string_view::npos : eol - i));
}

std::string normalize_controls(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
            continue;
        }
        if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7f) continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string break_before_keywords(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 16);
    bool lineHasContent = false;

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\n') {
            out.push_back(c);
            lineHasContent = false;
            continue;
        }
        if (lineHasContent) {
            const bool afterSpace = is_space(static_cast<unsigned char>(out.back()));
            if ((afterSpace && (keyword_at(s, i) || stack_frame_at(s, i))) ||
                s.compare(i, kNpmErr.size(), kNpmErr) == 0) {
                out.push_back('\n');
                lineHasContent = false;
            }
        }
        out.push_back(c);
        if (!is_space(static_cast<unsigned char>(c))) lineHasContent = true;
    }
    return out;
}

std::string trim_lines(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t start = 0;
    while (true) {
        size_t eol = s.find('\n', start);
        std::string_view line = s.substr(start, eol == std::string_view::npos ? std::string_view::npos : eol - start);
        line = trim_view(line);
        out.append(line.data(), line.size());
        if (eol == std::string_view::npos) break;
        out.push_back('\n');
        start = eol + 1;
    }
    return out;
}

std::string collapse_blank_lines(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t run = 0;
    for (char c : s) {
        if (c == '\n') {
            if (++run > 2) continue;
        } else {
            run = 0;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string strip_escape_sequences(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    const size_t n = s.size();

    size_t i = 0;
    while (i < n) {
        if (s[i] != ESC) {
            out.push_back(s[i++]);
            continue;
        }
        if (i + 1 >= n) break; // lone trailing ESC

        const char next = s[i + 1];
        if (next == '[') {
            // CSI: parameter bytes, intermediate bytes, one final byte.
            size_t j = i + 2;
            while (j < n && s[j] >= 0x30 && s[j] <= 0x3f) ++j;
            while (j < n && s[j] >= 0x20 && s[j] <= 0x2f) ++j;
            if (j < n && s[j] >= 0x40 && s[j] <= 0x7e) ++j;
            i = j;
        } else if (next == ']') {
            // OSC: up to BEL or ST; stops at a newline or another ESC if unterminated.
            size_t j = i + 2;
            while (j < n) {
                if (s[j] == BEL) { ++j; break; }
                if (s[j] == ESC) {
                    if (j + 1 < n && s[j + 1] == '\\') j += 2;
                    break;
                }
                if (s[j] == '\n') break;
                ++j;
            }
            i = j;
        } else if (next == '(' || next == ')' || next == '*' || next == '+' || next == '#' || next == '%') {
            i = std::min(n, i + 3);
        } else {
            i += 2;
        }
    }
    return out;
}

std::string sanitize(std::string_view text) {
    std::string s = strip_escape_sequences(text);
    s = normalize_controls(s);
    s = break_before_keywords(s);
    s = trim_lines(s);
    s = collapse_blank_lines(s);
    trim_inplace(s);
    return s;
}

} // namespace core
} // namespace actionstream
