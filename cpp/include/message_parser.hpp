#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tag_scanner.hpp"

namespace actionstream {
namespace core {

/**
 * @brief Payload handed to parser callbacks.
 */
struct ActionCallbackData {
    const std::string& messageId;
    const ActionEvent& event;
};

using ActionCallback = std::function<void(const ActionCallbackData&)>;

/**
 * @brief Explicit listener context passed to a MessageParser.
 */
struct ParserCallbacks {
    ActionCallback onActionOpen{};
    ActionCallback onActionStream{};
    ActionCallback onActionClose{};
};

/**
 * @brief Runs one TagScanner per message id and renders the display text.
 *
 * The returned text is the message with every closed action replaced by a
 * placeholder line that carries the message and action ids.
 */
class MessageParser {
public:
    explicit MessageParser(ParserCallbacks callbacks = {}, ScannerOptions options = {});

    /// Feeds the next chunk of a message.
    std::string feed(const std::string& messageId, std::string_view chunk);

    /// Feeds the unseen suffix of the cumulative message text.
    std::string parse(const std::string& messageId, std::string_view fullText);

    /// Ends a message and forgets its scanner; unterminated actions are closed implicitly.
    std::string finalize(const std::string& messageId);

    void reset();
    size_t messageCount() const noexcept { return scanners_.size(); }

    static std::string placeholder(const std::string& messageId, const std::string& actionId);

private:
    TagScanner& scannerFor_(const std::string& messageId);
    std::string dispatch_(const std::string& messageId, const std::vector<ActionEvent>& events);
    void invoke_(const ActionCallback& cb, const std::string& messageId, const ActionEvent& ev);

    ParserCallbacks callbacks_;
    ScannerOptions options_;
    std::unordered_map<std::string, std::unique_ptr<TagScanner>> scanners_{};
};

} // namespace core
} // namespace actionstream
