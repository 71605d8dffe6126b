#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace actionstream {
namespace core {

enum class ActionType { File, Modify, Shell };

const char* to_string(ActionType t) noexcept;

/**
 * @brief One textual replacement of a modify action.
 */
struct Edit {
    std::string before{}; ///< Exact text to look for
    std::string after{};  ///< Replacement text
};

struct FileAction {
    std::string path{};    ///< Target file path
    std::string content{}; ///< Complete file content (streamed increments until close)
};

struct ModifyAction {
    std::string path{};        ///< Target file path
    std::vector<Edit> edits{}; ///< Replacements in source order
};

struct ShellAction {
    std::string command{}; ///< Command line to run
    bool start{false};     ///< Long-running start command (type="start")
};

using ActionPayload = std::variant<FileAction, ModifyAction, ShellAction>;

/**
 * @brief A recognised action and its payload.
 *
 * Created when the opening marker has been parsed; immutable once the matching
 * closing marker (or finalize()) has produced the Close event.
 */
struct ActionTag {
    std::string id{};              ///< Unique within one scanner ("<prefix>:action-<n>")
    ActionPayload payload{};
    bool implicitlyClosed{false};  ///< Closed by end-of-stream instead of a closing marker

    ActionType type() const noexcept;
    /// File/modify target path; empty for shell actions.
    const std::string& path() const noexcept;
};

enum class ActionEventKind { Text, Open, Stream, Close };

const char* to_string(ActionEventKind k) noexcept;

/**
 * @brief Scanner output.
 *
 * Text:   `text` holds literal text outside of actions.
 * Open:   `action` holds the header (id, type, path) with an empty payload.
 * Stream: `text` holds the next decoded content increment of a file action.
 * Close:  `action` holds the finalized action.
 */
struct ActionEvent {
    ActionEventKind kind{ActionEventKind::Text};
    std::string actionId{};
    std::string text{};
    std::optional<ActionTag> action{};
};

// Close-time payload builders. They work on the raw body text between the
// opening and closing markers, so the result never depends on chunking.

/// Trim, unwrap a wrapping code fence or CDATA section, decode entities, append "\n".
std::string finalize_file_content(std::string_view rawBody);

/// Trim, unwrap a wrapping CDATA section (verbatim) or decode entities.
std::string finalize_command(std::string_view rawBody);

/// Extracts before/after (find/replace) pairs in source order. Sub-markers inside
/// code fences or CDATA sections are not recognised.
std::vector<Edit> parse_edits(std::string_view rawBody);

} // namespace core
} // namespace actionstream
