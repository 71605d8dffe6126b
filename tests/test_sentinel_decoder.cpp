#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "sentinel_decoder.hpp"

using namespace actionstream::core;

namespace {

// Decodes `input` in pieces of `step` bytes; adjacent text runs are merged.
std::vector<SentinelToken> decode(const std::string& input, size_t step, bool finalize = true) {
    SentinelDecoder d;
    std::vector<SentinelToken> out;
    auto take = [&out](std::vector<SentinelToken> toks) {
        for (auto& t : toks) {
            if (t.kind == SentinelToken::Kind::Text && !out.empty() &&
                out.back().kind == SentinelToken::Kind::Text) {
                out.back().text += t.text;
            } else {
                out.push_back(std::move(t));
            }
        }
    };
    for (size_t i = 0; i < input.size(); i += step) take(d.feed(std::string_view(input).substr(i, step)));
    if (finalize) take(d.finalize());
    return out;
}

} // namespace

TEST(SentinelDecoder, SeparatesOutputFromExitSentinel) {
    const auto toks = decode("Installed.\n" + encode_sentinel("exit", "0"), 4);
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, SentinelToken::Kind::Text);
    EXPECT_EQ(toks[0].text, "Installed.\n");
    EXPECT_EQ(toks[1].kind, SentinelToken::Kind::Sentinel);
    EXPECT_EQ(toks[1].name, "exit");
    ASSERT_TRUE(toks[1].value.has_value());
    EXPECT_EQ(*toks[1].value, "0");
}

TEST(SentinelDecoder, RoundTripsNamesAndValues) {
    for (const std::string name : {"exit", "ready", "interactive", "step-2"}) {
        for (int value : {0, 1, 127, -1, 65535}) {
            const auto toks = decode(encode_sentinel(name, std::to_string(value)), 1);
            ASSERT_EQ(toks.size(), 1u);
            EXPECT_EQ(toks[0].name, name);
            ASSERT_TRUE(toks[0].value.has_value());
            EXPECT_EQ(exit_code_from(*toks[0].value), value);
        }
    }
    const auto bare = decode(encode_sentinel("ready"), 2);
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_FALSE(bare[0].value.has_value());
}

TEST(SentinelDecoder, SentinelSplitAcrossEveryBoundary) {
    const std::string input = "a\x1b[32mgreen\x1b[0m" + encode_sentinel("exit", "3") + "tail";
    const auto ref = decode(input, input.size());
    for (size_t step = 1; step < input.size(); ++step) {
        const auto toks = decode(input, step);
        ASSERT_EQ(toks.size(), ref.size()) << "step=" << step;
        for (size_t i = 0; i < toks.size(); ++i) {
            EXPECT_EQ(toks[i].kind, ref[i].kind);
            EXPECT_EQ(toks[i].text, ref[i].text);
            EXPECT_EQ(toks[i].name, ref[i].name);
        }
    }
    ASSERT_EQ(ref.size(), 3u);
    EXPECT_EQ(ref[0].text, "a\x1b[32mgreen\x1b[0m");
    EXPECT_EQ(ref[2].text, "tail");
}

TEST(SentinelDecoder, LookalikesStayText) {
    const std::string input =
        "]654;exit=0\x07"           // no ESC
        "\x1b]0;window title\x07"   // other opcode
        "\x1b]6540;exit=1\x07"      // longer opcode
        "\x1b]654;exit=2\x1b\\";    // ST terminator instead of BEL
    const auto toks = decode(input, 3);
    for (const auto& t : toks) EXPECT_NE(t.kind, SentinelToken::Kind::Sentinel);

    std::string text;
    for (const auto& t : toks) text += t.text;
    EXPECT_EQ(text, input);
}

TEST(SentinelDecoder, UnfinishedSequenceIsPartialAtFinalize) {
    SentinelDecoder d;
    auto toks = d.feed("out\x1b]654;ex");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].text, "out");
    EXPECT_TRUE(d.hasPartial());

    toks = d.finalize();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].kind, SentinelToken::Kind::Partial);
    EXPECT_EQ(toks[0].text, "\x1b]654;ex");
    EXPECT_FALSE(d.hasPartial());
}

TEST(SentinelDecoder, CustomOpcode) {
    SentinelDecoder d(777);
    auto toks = d.feed(encode_sentinel("exit", "0", 777) + encode_sentinel("exit", "0"));
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, SentinelToken::Kind::Sentinel);
    EXPECT_EQ(toks[1].kind, SentinelToken::Kind::Text);
}

TEST(SentinelDecoder, ExitCodeForms) {
    EXPECT_EQ(exit_code_from("0"), 0);
    EXPECT_EQ(exit_code_from("1234:2"), 2);
    EXPECT_EQ(exit_code_from("-1"), -1);
    EXPECT_FALSE(exit_code_from("").has_value());
    EXPECT_FALSE(exit_code_from("12:").has_value());
    EXPECT_FALSE(exit_code_from("abc").has_value());
}

TEST(SentinelDecoder, EncodeRejectsInvalidNames) {
    EXPECT_THROW((void)encode_sentinel(""), std::invalid_argument);
    EXPECT_THROW((void)encode_sentinel("a=b"), std::invalid_argument);
    EXPECT_THROW((void)encode_sentinel("a\x07"), std::invalid_argument);
    EXPECT_THROW((void)encode_sentinel("exit", "1\x1b"), std::invalid_argument);
}
