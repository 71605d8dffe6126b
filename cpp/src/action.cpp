#include "../include/action.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.h"
#include "../include/text_codec.hpp"

#include <array>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

const char* to_string(ActionType t) noexcept {
    switch (t) {
        case ActionType::File:   return "file";
        case ActionType::Modify: return "modify";
        case ActionType::Shell:  return "shell";
    }
    return "unknown";
}

const char* to_string(ActionEventKind k) noexcept {
    switch (k) {
        case ActionEventKind::Text:   return "text";
        case ActionEventKind::Open:   return "open";
        case ActionEventKind::Stream: return "stream";
        case ActionEventKind::Close:  return "close";
    }
    return "unknown";
}

ActionType ActionTag::type() const noexcept {
    switch (payload.index()) {
        case 0:  return ActionType::File;
        case 1:  return ActionType::Modify;
        default: return ActionType::Shell;
    }
}

const std::string& ActionTag::path() const noexcept {
    static const std::string kEmpty;
    if (const auto* f = std::get_if<FileAction>(&payload))   return f->path;
    if (const auto* m = std::get_if<ModifyAction>(&payload)) return m->path;
    return kEmpty;
}

std::string finalize_file_content(std::string_view rawBody) {
    std::string_view t = trim_view(rawBody);
    if (t.empty()) return {};

    std::string content;
    if (auto inner = unwrap_code_fence(t)) {
        content = decode_entities(*inner);
    } else if (auto cdata = extract_cdata(t)) {
        content = std::move(*cdata);
    } else {
        content = decode_body(t);
    }
    content.push_back('\n');
    return content;
}

std::string finalize_command(std::string_view rawBody) {
    std::string cmd;
    if (auto cdata = extract_cdata(rawBody)) {
        cmd = std::move(*cdata);
    } else {
        cmd = decode_body(trim_view(rawBody));
    }
    trim_inplace(cmd);
    return cmd;
}

namespace {

struct SubMarker {
    std::string_view name;
    bool opensPair; ///< before/find start a pair, after/replace complete it
};

constexpr std::array<SubMarker, 4> kSubMarkers{{
    {"before", true}, {"find", true}, {"after", false}, {"replace", false},
}};

// Index just past the CDATA section starting at `i`, or the end of `s` if unterminated.
size_t skip_cdata(std::string_view s, size_t i) {
    size_t end = s.find(kCDataClose, i + kCDataOpen.size());
    return end == std::string_view::npos ? s.size() : end + kCDataClose.size();
}

// Matches "<name>" at `i`; returns the sub-marker or nullptr.
const SubMarker* match_open(std::string_view s, size_t i) {
    for (const auto& m : kSubMarkers) {
        if (s.size() - i < m.name.size() + 2) continue;
        if (s.substr(i + 1, m.name.size()) == m.name && s[i + 1 + m.name.size()] == '>') {
            return &m;
        }
    }
    return nullptr;
}

// Finds "</name>" from `from`, skipping CDATA sections.
size_t find_close(std::string_view s, size_t from, std::string_view name) {
    const std::string close = "</" + std::string(name) + ">";
    for (size_t i = from; i < s.size(); ++i) {
        if (s[i] != '<') continue;
        if (s.substr(i).starts_with(kCDataOpen)) {
            i = skip_cdata(s, i) - 1;
            continue;
        }
        if (s.substr(i, close.size()) == close) return i;
    }
    return std::string_view::npos;
}

std::string edit_value(std::string_view raw) {
    std::string v;
    if (auto cdata = extract_cdata(raw)) {
        v = std::move(*cdata);
    } else {
        v = decode_entities(trim_view(raw));
    }
    trim_inplace(v);
    return v;
}

bool fence_at(std::string_view s, size_t lineStart) {
    size_t j = lineStart;
    while (j < s.size() && (s[j] == ' ' || s[j] == '\t')) ++j;
    return s.substr(j, 3) == "```";
}

} // namespace

std::vector<Edit> parse_edits(std::string_view rawBody) {
    std::vector<Edit> edits;
    std::optional<std::string> before;
    bool inFence = false;
    bool lineStart = true;

    size_t i = 0;
    while (i < rawBody.size()) {
        if (lineStart) {
            if (fence_at(rawBody, i)) inFence = !inFence;
            lineStart = false;
        }

        const char c = rawBody[i];
        if (c == '\n') {
            lineStart = true;
            ++i;
            continue;
        }
        if (c != '<') { ++i; continue; }

        if (rawBody.substr(i).starts_with(kCDataOpen)) {
            i = skip_cdata(rawBody, i);
            continue;
        }
        if (inFence) { ++i; continue; }

        const SubMarker* m = match_open(rawBody, i);
        if (!m) { ++i; continue; }

        const size_t valueStart = i + m->name.size() + 2;
        const size_t valueEnd = find_close(rawBody, valueStart, m->name);
        if (valueEnd == std::string_view::npos) {
            ASTREAM_DBG("SCAN", "parse_edits: unterminated <%.*s> at offset %zu",
                        static_cast<int>(m->name.size()), m->name.data(), i);
            break;
        }

        std::string value = edit_value(rawBody.substr(valueStart, valueEnd - valueStart));
        if (m->opensPair) {
            if (before) ASTREAM_DBG("SCAN", "parse_edits: dropping unpaired before (%zu bytes)", before->size());
            before = std::move(value);
        } else if (before) {
            edits.push_back(Edit{std::move(*before), std::move(value)});
            before.reset();
        } else {
            ASTREAM_DBG("SCAN", "parse_edits: dropping after without before");
        }
        i = valueEnd + m->name.size() + 3;
    }

    if (before) ASTREAM_DBG("SCAN", "parse_edits: dropping trailing unpaired before");
    return edits;
}

} // namespace core
} // namespace actionstream
