#include "../include/sentinel_decoder.hpp"
#include "../include/dev_debug.hpp"

#include <charconv>
#include <stdexcept>

namespace actionstream {
namespace core {

namespace {
constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';
} // namespace

const char* to_string(SentinelToken::Kind k) noexcept {
    switch (k) {
        case SentinelToken::Kind::Text:     return "text";
        case SentinelToken::Kind::Sentinel: return "sentinel";
        case SentinelToken::Kind::Partial:  return "partial";
    }
    return "unknown";
}

SentinelDecoder::SentinelDecoder(int opcode)
    : opcode_(opcode)
{
    if (opcode_ < 0) throw std::invalid_argument("SentinelDecoder: opcode must be non-negative");
    prefix_ = std::string{ESC, ']'} + std::to_string(opcode_) + ";";
}

std::vector<SentinelToken> SentinelDecoder::feed(std::string_view chunk) {
    std::vector<SentinelToken> out;
    for (char c : chunk) {
        while (!consume_(c, out)) {}
    }
    flushText_(out);
    return out;
}

std::vector<SentinelToken> SentinelDecoder::finalize() {
    std::vector<SentinelToken> out;
    flushText_(out);
    if (!held_.empty()) {
        ASTREAM_DBG("SENTINEL", "finalize: %zu bytes of an unfinished sequence", held_.size());
        SentinelToken t;
        t.kind = SentinelToken::Kind::Partial;
        t.text = std::move(held_);
        out.push_back(std::move(t));
        held_.clear();
    }
    state_ = State::Text;
    return out;
}

void SentinelDecoder::reset() {
    state_ = State::Text;
    held_.clear();
    text_.clear();
}

bool SentinelDecoder::consume_(char c, std::vector<SentinelToken>& out) {
    switch (state_) {
    case State::Text:
        if (c == ESC) {
            held_.assign(1, c);
            state_ = State::Esc;
        } else {
            text_.push_back(c);
        }
        return true;

    case State::Esc:
        if (c == ']') {
            held_.push_back(c);
            state_ = State::Osc;
            return true;
        }
        // Some other escape sequence: not ours, keep it as text.
        text_ += held_;
        held_.clear();
        state_ = State::Text;
        if (c == ESC) return false;
        text_.push_back(c);
        return true;

    case State::Osc:
        if (c == ESC) {
            text_ += held_;
            held_.clear();
            state_ = State::Text;
            return false;
        }
        held_.push_back(c);
        if (c == BEL) {
            completeOsc_(out);
            return true;
        }
        if ((held_.size() <= prefix_.size() && prefix_.compare(0, held_.size(), held_) != 0) ||
            held_.size() > kMaxSequenceLength) {
            // Different opcode or runaway sequence.
            text_ += held_;
            held_.clear();
            state_ = State::Text;
        }
        return true;
    }
    return true;
}

void SentinelDecoder::completeOsc_(std::vector<SentinelToken>& out) {
    state_ = State::Text;
    if (held_.size() <= prefix_.size() || held_.compare(0, prefix_.size(), prefix_) != 0) {
        text_ += held_;
        held_.clear();
        return;
    }

    std::string_view body(held_);
    body = body.substr(prefix_.size(), body.size() - prefix_.size() - 1); // drop prefix and BEL
    const size_t eq = body.find('=');
    std::string_view name = body.substr(0, eq);
    if (name.empty()) {
        text_ += held_;
        held_.clear();
        return;
    }

    SentinelToken t;
    t.kind = SentinelToken::Kind::Sentinel;
    t.name.assign(name.data(), name.size());
    if (eq != std::string_view::npos) t.value = std::string(body.substr(eq + 1));
    held_.clear();

    ASTREAM_DBG("SENTINEL", "sentinel name=%s value=%s", t.name.c_str(), t.value ? t.value->c_str() : "(none)");
    flushText_(out);
    out.push_back(std::move(t));
}

void SentinelDecoder::flushText_(std::vector<SentinelToken>& out) {
    if (text_.empty()) return;
    SentinelToken t;
    t.text = std::move(text_);
    text_.clear();
    out.push_back(std::move(t));
}

std::string encode_sentinel(std::string_view name, std::optional<std::string_view> value, int opcode) {
    auto bad = [](std::string_view s) {
        return s.find(BEL) != std::string_view::npos || s.find(ESC) != std::string_view::npos;
    };
    if (name.empty() || bad(name) || name.find('=') != std::string_view::npos) {
        throw std::invalid_argument("encode_sentinel: invalid sentinel name");
    }
    if (value && bad(*value)) {
        throw std::invalid_argument("encode_sentinel: invalid sentinel value");
    }
    if (opcode < 0) {
        throw std::invalid_argument("encode_sentinel: opcode must be non-negative");
    }

    std::string s{ESC, ']'};
    s += std::to_string(opcode);
    s.push_back(';');
    s.append(name.data(), name.size());
    if (value) {
        s.push_back('=');
        s.append(value->data(), value->size());
    }
    s.push_back(BEL);
    return s;
}

std::optional<int> exit_code_from(std::string_view value) {
    const size_t colon = value.rfind(':');
    std::string_view field = colon == std::string_view::npos ? value : value.substr(colon + 1);
    if (field.empty()) return std::nullopt;

    int code = 0;
    const char* first = field.data();
    const char* last  = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, code);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return code;
}

} // namespace core
} // namespace actionstream
