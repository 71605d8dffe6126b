#include "../include/tag_scanner.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.h"

#include <stdexcept>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

namespace {

bool is_attr_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-' || c == ':' || c == '.';
}

bool is_open_tag_state(ScanState s) {
    return s != ScanState::Text && s != ScanState::Body && s != ScanState::BodyCData;
}

} // namespace

const char* to_string(ScanState s) noexcept {
    switch (s) {
        case ScanState::Text:            return "Text";
        case ScanState::TagName:         return "TagName";
        case ScanState::AttrSpace:       return "AttrSpace";
        case ScanState::AttrName:        return "AttrName";
        case ScanState::AttrAfterName:   return "AttrAfterName";
        case ScanState::AttrValueStart:  return "AttrValueStart";
        case ScanState::AttrValue:       return "AttrValue";
        case ScanState::AttrValueEscape: return "AttrValueEscape";
        case ScanState::AttrAfterValue:  return "AttrAfterValue";
        case ScanState::Body:            return "Body";
        case ScanState::BodyCData:       return "BodyCData";
    }
    return "Unknown";
}

TagScanner::TagScanner(ScannerOptions opts)
    : opts_(std::move(opts))
{
    if (opts_.tagName.empty()) {
        throw std::invalid_argument("TagScanner: tagName must not be empty");
    }
    openMarker_  = "<" + opts_.tagName;
    closeMarker_ = "</" + opts_.tagName + ">";
}

std::vector<ActionEvent> TagScanner::feed(std::string_view chunk) {
    events_.clear();
    buffer_.append(chunk);

    const std::string_view in = buffer_.unprocessed();
    for (char c : in) {
        // A failed opening tag hands the current byte back for rescanning as text.
        while (!consume_(c)) {}
    }
    buffer_.advance(in.size());
    buffer_.compact();

    flushStream_(false);
    flushText_();
    return std::exchange(events_, {});
}

std::vector<ActionEvent> TagScanner::finalize() {
    events_.clear();

    if (is_open_tag_state(state_)) {
        ASTREAM_DBG("SCAN", "finalize: unterminated opening tag (%zu bytes) emitted as text",
                    buffer_.held().size());
        textRun_ += buffer_.releaseHeld();
        state_ = ScanState::Text;
        resetAttr_();
    } else if (current_) {
        ASTREAM_DBG("SCAN", "finalize: implicitly closing %s", current_->id.c_str());
        closeAction_(/*implicit=*/true);
    }
    flushText_();
    return std::exchange(events_, {});
}

void TagScanner::reset() {
    buffer_.clear();
    state_ = ScanState::Text;
    resetAttr_();
    current_.reset();
    raw_.clear();
    cdataStart_ = 0;
    streamed_ = 0;
    decoder_.reset();
    nextId_ = 0;
    textRun_.clear();
    events_.clear();
}

bool TagScanner::consume_(char c) {
    const unsigned char u = static_cast<unsigned char>(c);

    if (is_open_tag_state(state_) && buffer_.held().size() >= opts_.maxOpenTagLength) {
        ASTREAM_DBG("SCAN", "opening tag exceeds %zu bytes", opts_.maxOpenTagLength);
        return failOpen_();
    }

    switch (state_) {
    case ScanState::Text:
        if (c == '<') {
            buffer_.hold(c);
            state_ = ScanState::TagName;
        } else {
            textRun_.push_back(c);
        }
        return true;

    case ScanState::TagName: {
        const size_t n = buffer_.held().size();
        if (n < openMarker_.size()) {
            if (c != openMarker_[n]) return failOpen_();
            buffer_.hold(c);
            return true;
        }
        if (is_space(u)) {
            buffer_.hold(c);
            state_ = ScanState::AttrSpace;
            return true;
        }
        if (c == '>') {
            buffer_.hold(c);
            completeOpen_();
            return true;
        }
        return failOpen_();
    }

    case ScanState::AttrSpace:
        if (is_space(u)) { buffer_.hold(c); return true; }
        if (c == '>') { buffer_.hold(c); completeOpen_(); return true; }
        if (!is_attr_char(c)) return failOpen_();
        buffer_.hold(c);
        attrName_.assign(1, c);
        state_ = ScanState::AttrName;
        return true;

    case ScanState::AttrName:
        if (is_attr_char(c)) {
            attrName_.push_back(c);
        } else if (c == '=') {
            state_ = ScanState::AttrValueStart;
        } else if (is_space(u)) {
            state_ = ScanState::AttrAfterName;
        } else {
            return failOpen_();
        }
        buffer_.hold(c);
        return true;

    case ScanState::AttrAfterName:
        if (c == '=') state_ = ScanState::AttrValueStart;
        else if (!is_space(u)) return failOpen_();
        buffer_.hold(c);
        return true;

    case ScanState::AttrValueStart:
        if (c == '"' || c == '\'') {
            quote_ = c;
            attrValue_.clear();
            state_ = ScanState::AttrValue;
        } else if (!is_space(u)) {
            return failOpen_();
        }
        buffer_.hold(c);
        return true;

    case ScanState::AttrValue:
        buffer_.hold(c);
        if (c == '\\') {
            state_ = ScanState::AttrValueEscape;
        } else if (c == quote_) {
            attrs_.emplace_back(attrName_, decode_entities(attrValue_));
            state_ = ScanState::AttrAfterValue;
        } else {
            attrValue_.push_back(c);
        }
        return true;

    case ScanState::AttrValueEscape:
        buffer_.hold(c);
        if (c != '"' && c != '\'' && c != '\\') attrValue_.push_back('\\');
        attrValue_.push_back(c);
        state_ = ScanState::AttrValue;
        return true;

    case ScanState::AttrAfterValue:
        if (is_space(u)) {
            buffer_.hold(c);
            state_ = ScanState::AttrSpace;
            return true;
        }
        if (c == '>') {
            buffer_.hold(c);
            completeOpen_();
            return true;
        }
        return failOpen_();

    case ScanState::Body:
        raw_.push_back(c);
        if (ends_with(raw_, closeMarker_)) {
            raw_.resize(raw_.size() - closeMarker_.size());
            closeAction_(/*implicit=*/false);
        } else if (ends_with(raw_, kCDataOpen)) {
            state_ = ScanState::BodyCData;
            cdataStart_ = raw_.size();
        }
        return true;

    case ScanState::BodyCData:
        raw_.push_back(c);
        if (raw_.size() >= cdataStart_ + kCDataClose.size() && ends_with(raw_, kCDataClose)) {
            state_ = ScanState::Body;
        }
        return true;
    }
    return true;
}

bool TagScanner::failOpen_() {
    ASTREAM_DBG("SCAN", "not an action tag in state %s, %zu bytes re-emitted as text",
                to_string(state_), buffer_.held().size());
    textRun_ += buffer_.releaseHeld();
    state_ = ScanState::Text;
    resetAttr_();
    return false;
}

void TagScanner::completeOpen_() {
    std::string type;
    std::string path;
    for (const auto& [name, value] : attrs_) {
        if (name == "type") {
            if (type.empty()) type = value;
            continue;
        }
        if (!path.empty() || value.empty()) continue;
        for (const auto& attr : opts_.pathAttributes) {
            if (name == attr) { path = value; break; }
        }
    }

    ActionPayload payload;
    if (type == "file" && !path.empty()) {
        payload = FileAction{path, {}};
    } else if (type == "modify" && !path.empty()) {
        payload = ModifyAction{path, {}};
    } else if (type == "shell") {
        payload = ShellAction{};
    } else if (type == "start") {
        payload = ShellAction{{}, true};
    } else {
        ASTREAM_DBG("SCAN", "rejecting opening tag: type='%s' path='%s'", type.c_str(), path.c_str());
        textRun_ += buffer_.releaseHeld();
        state_ = ScanState::Text;
        resetAttr_();
        return;
    }

    flushText_();
    (void)buffer_.releaseHeld();
    resetAttr_();

    ActionTag tag;
    const std::string n = std::to_string(nextId_++);
    tag.id = opts_.idPrefix.empty() ? "action-" + n : opts_.idPrefix + ":action-" + n;
    tag.payload = std::move(payload);

    ASTREAM_DBG("SCAN", "open %s type=%s path='%s'", tag.id.c_str(), to_string(tag.type()), tag.path().c_str());

    events_.push_back(ActionEvent{ActionEventKind::Open, tag.id, {}, tag});
    current_ = std::move(tag);
    raw_.clear();
    streamed_ = 0;
    decoder_.reset();
    state_ = ScanState::Body;
}

void TagScanner::closeAction_(bool implicit) {
    flushText_();
    flushStream_(/*final=*/true);

    ActionTag tag = std::move(*current_);
    current_.reset();

    if (auto* f = std::get_if<FileAction>(&tag.payload)) {
        f->content = finalize_file_content(raw_);
    } else if (auto* m = std::get_if<ModifyAction>(&tag.payload)) {
        m->edits = parse_edits(raw_);
    } else if (auto* s = std::get_if<ShellAction>(&tag.payload)) {
        s->command = finalize_command(raw_);
    }
    tag.implicitlyClosed = implicit;

    ASTREAM_DBG("SCAN", "close %s raw=%zu bytes implicit=%d", tag.id.c_str(), raw_.size(), implicit ? 1 : 0);

    std::string id = tag.id;
    events_.push_back(ActionEvent{ActionEventKind::Close, std::move(id), {}, std::move(tag)});

    raw_.clear();
    streamed_ = 0;
    cdataStart_ = 0;
    decoder_.reset();
    state_ = ScanState::Text;
}

void TagScanner::flushText_() {
    if (textRun_.empty()) return;
    events_.push_back(ActionEvent{ActionEventKind::Text, {}, std::move(textRun_), std::nullopt});
    textRun_.clear();
}

void TagScanner::flushStream_(bool final) {
    if (!current_ || current_->type() != ActionType::File) return;

    size_t safe = raw_.size();
    if (!final && state_ == ScanState::Body) {
        // Bytes that may be the start of the closing marker stay unstreamed.
        safe -= partial_suffix_len(raw_, closeMarker_);
    }

    std::string inc;
    if (safe > streamed_) {
        inc = decoder_.push(std::string_view(raw_).substr(streamed_, safe - streamed_));
        streamed_ = safe;
    }
    if (final) inc += decoder_.finish();
    if (inc.empty()) return;

    std::get<FileAction>(current_->payload).content += inc;
    events_.push_back(ActionEvent{ActionEventKind::Stream, current_->id, std::move(inc), std::nullopt});
}

void TagScanner::resetAttr_() {
    attrName_.clear();
    attrValue_.clear();
    quote_ = 0;
    attrs_.clear();
}

} // namespace core
} // namespace actionstream
