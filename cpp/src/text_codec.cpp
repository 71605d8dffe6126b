#include "../include/text_codec.hpp"
#include "../include/helpers.h"

#include <array>
#include <utility>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

namespace {

constexpr size_t kMaxEntityLen = 6; // "&quot;", "&#x27;", ...

constexpr std::array<std::pair<std::string_view, char>, 8> kEntities{{
    {"&lt;",   '<'},
    {"&gt;",   '>'},
    {"&amp;",  '&'},
    {"&quot;", '"'},
    {"&apos;", '\''},
    {"&#39;",  '\''},
    {"&#x27;", '\''},
    {"&#x3D;", '='},
}};

// Returns the decoded char for an entity starting at s[0] == '&', or 0 when the
// text is not one of the known entities. `len` receives the entity length.
char match_entity(std::string_view s, size_t& len) {
    for (const auto& [name, ch] : kEntities) {
        if (s.substr(0, name.size()) == name) {
            len = name.size();
            return ch;
        }
    }
    len = 0;
    return 0;
}

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_';
}

} // namespace

std::string decode_entities(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        if (s[i] == '&') {
            size_t len = 0;
            char ch = match_entity(s.substr(i), len);
            if (ch) {
                out.push_back(ch);
                i += len;
                continue;
            }
        }
        out.push_back(s[i++]);
    }
    return out;
}

std::optional<std::string> extract_cdata(std::string_view s) {
    std::string_view t = trim_view(s);
    if (t.size() < kCDataOpen.size() + kCDataClose.size()) return std::nullopt;
    if (!t.starts_with(kCDataOpen) || !t.ends_with(kCDataClose)) return std::nullopt;

    std::string_view inner = t.substr(kCDataOpen.size(),
                                      t.size() - kCDataOpen.size() - kCDataClose.size());
    if (!inner.empty() && inner.front() == '\n') inner.remove_prefix(1);
    if (!inner.empty() && inner.back() == '\n') inner.remove_suffix(1);
    return std::string(inner);
}

std::optional<std::string> unwrap_code_fence(std::string_view s) {
    std::string_view t = trim_view(s);
    if (!t.starts_with("```")) return std::nullopt;

    // Opening line: ``` followed by an optional language word.
    size_t i = 3;
    while (i < t.size() && is_word_char(t[i])) ++i;
    if (i >= t.size() || t[i] != '\n') return std::nullopt;
    const size_t start = i + 1;

    if (t.size() < start + 3 || !t.ends_with("```")) return std::nullopt;
    const size_t close = t.size() - 3;

    // Inner text ends at the first newline of the whitespace run before the closing fence.
    size_t q = close;
    while (q > start && is_space(static_cast<unsigned char>(t[q - 1]))) --q;
    for (size_t p = q; p < close; ++p) {
        if (t[p] == '\n') return std::string(t.substr(start, p - start));
    }
    return std::nullopt;
}

std::string decode_body(std::string_view raw) {
    BodyDecoder d;
    std::string out = d.push(raw);
    out += d.finish();
    return out;
}

std::string BodyDecoder::push(std::string_view piece) {
    pending_.append(piece.data(), piece.size());
    return drain_(false);
}

std::string BodyDecoder::finish() {
    std::string out = drain_(true);
    reset();
    return out;
}

void BodyDecoder::reset() {
    pending_.clear();
    inCData_ = false;
}

std::string BodyDecoder::drain_(bool final) {
    std::string out;
    const std::string_view p(pending_);
    size_t i = 0;

    while (i < p.size()) {
        if (inCData_) {
            size_t end = p.find(kCDataClose, i);
            if (end == std::string_view::npos) {
                // Keep a possible partial "]]" at the tail.
                size_t hold = final ? 0 : partial_suffix_len(p.substr(i), kCDataClose);
                out.append(p.data() + i, p.size() - i - hold);
                i = p.size() - hold;
                break;
            }
            out.append(p.data() + i, end - i);
            i = end + kCDataClose.size();
            inCData_ = false;
            continue;
        }

        const char c = p[i];
        if (c == '&') {
            std::string_view window = p.substr(i, kMaxEntityLen);
            size_t len = 0;
            char ch = match_entity(window, len);
            if (ch) {
                out.push_back(ch);
                i += len;
                continue;
            }
            if (!final && window.size() < kMaxEntityLen &&
                window.find(';') == std::string_view::npos) {
                break; // may still complete into an entity
            }
            out.push_back(c);
            ++i;
            continue;
        }
        if (c == '<') {
            std::string_view rest = p.substr(i);
            if (rest.starts_with(kCDataOpen)) {
                inCData_ = true;
                i += kCDataOpen.size();
                continue;
            }
            if (!final && kCDataOpen.starts_with(rest)) break;
        }
        out.push_back(c);
        ++i;
    }

    pending_.erase(0, i);
    return out;
}

} // namespace core
} // namespace actionstream
