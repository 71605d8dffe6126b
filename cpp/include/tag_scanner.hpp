#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "action.hpp"
#include "stream_buffer.hpp"
#include "text_codec.hpp"

namespace actionstream {
namespace core {

/**
 * @brief Markup vocabulary recognised by TagScanner.
 */
struct ScannerOptions {
    std::string tagName{"boltAction"};                      ///< Element name of action tags
    std::vector<std::string> pathAttributes{"path", "filePath"}; ///< Accepted path attribute names
    size_t maxOpenTagLength{4096};                          ///< Longer opening tags are treated as text
    std::string idPrefix{};                                 ///< Action ids are "<idPrefix>:action-<n>"
};

/// Resumable sub-states of the scanner.
enum class ScanState : std::uint8_t {
    Text,            ///< Outside any action
    TagName,         ///< Matching "<tagName"
    AttrSpace,       ///< Between attributes
    AttrName,
    AttrAfterName,   ///< Name read, waiting for '='
    AttrValueStart,  ///< '=' read, waiting for the opening quote
    AttrValue,
    AttrValueEscape, ///< Backslash inside a quoted value
    AttrAfterValue,  ///< Closing quote read, needs whitespace or '>'
    Body,            ///< Inside an action body
    BodyCData,       ///< Inside a CDATA section of an action body
};

const char* to_string(ScanState s) noexcept;

/**
 * @brief Incremental recogniser for action tags embedded in free text.
 *
 * feed() accepts chunks of any size and returns the events that became
 * recognisable; finalize() ends the stream. Close events and the concatenation
 * of Text and Stream payloads do not depend on how the input was chunked.
 *
 * Single-threaded: callers must not feed concurrently.
 */
class TagScanner {
public:
    explicit TagScanner(ScannerOptions opts = {});

    std::vector<ActionEvent> feed(std::string_view chunk);
    std::vector<ActionEvent> finalize();
    void reset();

    ScanState state() const noexcept { return state_; }
    bool insideAction() const noexcept { return current_.has_value(); }
    const StreamBuffer& buffer() const noexcept { return buffer_; }
    const ScannerOptions& options() const noexcept { return opts_; }
    size_t actionsOpened() const noexcept { return nextId_; }

private:
    bool consume_(char c);
    bool failOpen_();
    void completeOpen_();
    void closeAction_(bool implicit);
    void flushText_();
    void flushStream_(bool final);
    void resetAttr_();

    ScannerOptions opts_;
    std::string openMarker_;   ///< "<tagName"
    std::string closeMarker_;  ///< "</tagName>"

    StreamBuffer buffer_{};
    ScanState state_{ScanState::Text};

    // Opening-tag parse state
    std::string attrName_{};
    std::string attrValue_{};
    char quote_{0};
    std::vector<std::pair<std::string, std::string>> attrs_{};

    // Body state
    std::optional<ActionTag> current_{};
    std::string raw_{};        ///< Raw body text of the current action
    size_t cdataStart_{0};     ///< raw_ offset just past the active CDATA opener
    size_t streamed_{0};       ///< raw_ bytes already handed to decoder_
    BodyDecoder decoder_{};

    size_t nextId_{0};
    std::string textRun_{};
    std::vector<ActionEvent> events_{};
};

} // namespace core
} // namespace actionstream
