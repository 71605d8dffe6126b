#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "message_parser.hpp"

using namespace actionstream::core;

namespace {

struct Recorder {
    std::vector<std::string> log;

    ParserCallbacks callbacks() {
        ParserCallbacks cbs;
        cbs.onActionOpen = [this](const ActionCallbackData& d) {
            log.push_back("open " + d.messageId + " " + d.event.actionId);
        };
        cbs.onActionStream = [this](const ActionCallbackData& d) {
            log.push_back("stream " + d.event.actionId + " " + d.event.text);
        };
        cbs.onActionClose = [this](const ActionCallbackData& d) {
            log.push_back("close " + d.event.actionId + " " + d.event.action->path());
        };
        return cbs;
    }
};

} // namespace

TEST(MessageParser, ReplacesActionsWithPlaceholders) {
    Recorder rec;
    MessageParser parser(rec.callbacks());

    std::string shown = parser.feed("m1", "Hi <boltAction type=\"file\" path=\"a.txt\">");
    shown += parser.feed("m1", "hello</boltAction> bye");
    shown += parser.finalize("m1");

    EXPECT_EQ(shown, "Hi " + MessageParser::placeholder("m1", "m1:action-0") + " bye");
    EXPECT_EQ(rec.log, (std::vector<std::string>{
                           "open m1 m1:action-0",
                           "stream m1:action-0 hello",
                           "close m1:action-0 a.txt",
                       }));
}

TEST(MessageParser, ParseFeedsOnlyTheUnseenSuffix) {
    Recorder rec;
    MessageParser parser(rec.callbacks());

    const std::string full = "<boltAction type=\"shell\">npm install</boltAction>ok";
    std::string shown;
    for (size_t n = 1; n <= full.size(); n += 5) shown += parser.parse("m", full.substr(0, n));
    shown += parser.parse("m", full);
    shown += parser.finalize("m");

    EXPECT_EQ(shown, MessageParser::placeholder("m", "m:action-0") + "ok");
    EXPECT_EQ(rec.log.size(), 2u);
}

TEST(MessageParser, KeepsOneScannerPerMessage) {
    MessageParser parser;
    (void)parser.feed("a", "<boltAction type=\"shell\">ls");
    (void)parser.feed("b", "<boltAction type=\"shell\">pwd</boltAction>");
    EXPECT_EQ(parser.messageCount(), 2u);

    EXPECT_EQ(parser.finalize("a"), MessageParser::placeholder("a", "a:action-0"));
    EXPECT_EQ(parser.messageCount(), 1u);
    EXPECT_EQ(parser.finalize("a"), "");
    EXPECT_EQ(parser.finalize("missing"), "");

    parser.reset();
    EXPECT_EQ(parser.messageCount(), 0u);
}

TEST(MessageParser, ThrowingCallbackDoesNotStopParsing) {
    ParserCallbacks cbs;
    int closes = 0;
    cbs.onActionOpen = [](const ActionCallbackData&) { throw std::runtime_error("listener failed"); };
    cbs.onActionClose = [&](const ActionCallbackData&) { ++closes; };
    MessageParser parser(cbs);

    std::string shown = parser.feed("m", "<boltAction type=\"shell\">a</boltAction>x");
    EXPECT_EQ(shown, MessageParser::placeholder("m", "m:action-0") + "x");
    EXPECT_EQ(closes, 1);
}
