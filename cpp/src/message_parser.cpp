#include "../include/message_parser.hpp"
#include "../include/dev_debug.hpp"

#include <exception>
#include <memory>

namespace actionstream {
namespace core {

MessageParser::MessageParser(ParserCallbacks callbacks, ScannerOptions options)
    : callbacks_(std::move(callbacks))
    , options_(std::move(options))
{
}

std::string MessageParser::feed(const std::string& messageId, std::string_view chunk) {
    TagScanner& scanner = scannerFor_(messageId);
    return dispatch_(messageId, scanner.feed(chunk));
}

std::string MessageParser::parse(const std::string& messageId, std::string_view fullText) {
    TagScanner& scanner = scannerFor_(messageId);
    const size_t seen = scanner.buffer().size();
    if (fullText.size() < seen) {
        ASTREAM_DBG("SCAN", "parse(%s): text shrank from %zu to %zu bytes, ignored",
                    messageId.c_str(), seen, fullText.size());
        return {};
    }
    return dispatch_(messageId, scanner.feed(fullText.substr(seen)));
}

std::string MessageParser::finalize(const std::string& messageId) {
    auto it = scanners_.find(messageId);
    if (it == scanners_.end()) return {};
    std::unique_ptr<TagScanner> scanner = std::move(it->second);
    scanners_.erase(it);
    return dispatch_(messageId, scanner->finalize());
}

void MessageParser::reset() {
    scanners_.clear();
}

std::string MessageParser::placeholder(const std::string& messageId, const std::string& actionId) {
    return "<div class=\"__actionstream__\" data-message-id=\"" + messageId +
           "\" data-action-id=\"" + actionId + "\"></div>\n";
}

TagScanner& MessageParser::scannerFor_(const std::string& messageId) {
    auto it = scanners_.find(messageId);
    if (it != scanners_.end()) return *it->second;

    ScannerOptions opts = options_;
    opts.idPrefix = messageId;
    auto pos = scanners_.emplace(messageId, std::make_unique<TagScanner>(std::move(opts))).first;
    return *pos->second;
}

std::string MessageParser::dispatch_(const std::string& messageId, const std::vector<ActionEvent>& events) {
    std::string out;
    for (const auto& ev : events) {
        switch (ev.kind) {
        case ActionEventKind::Text:
            out += ev.text;
            break;
        case ActionEventKind::Open:
            invoke_(callbacks_.onActionOpen, messageId, ev);
            break;
        case ActionEventKind::Stream:
            invoke_(callbacks_.onActionStream, messageId, ev);
            break;
        case ActionEventKind::Close:
            invoke_(callbacks_.onActionClose, messageId, ev);
            out += placeholder(messageId, ev.actionId);
            break;
        }
    }
    return out;
}

void MessageParser::invoke_(const ActionCallback& cb, const std::string& messageId, const ActionEvent& ev) {
    if (!cb) return;
    try {
        cb(ActionCallbackData{messageId, ev});
    } catch (const std::exception& ex) {
        ASTREAM_DBG("SCAN", "%s callback for %s threw: %s", to_string(ev.kind), ev.actionId.c_str(), ex.what());
    }
}

} // namespace core
} // namespace actionstream
