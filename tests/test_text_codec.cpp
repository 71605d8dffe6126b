#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "text_codec.hpp"

using namespace actionstream::core;

namespace {

std::string decode_in_pieces(std::string_view raw, size_t step) {
    BodyDecoder d;
    std::string out;
    for (size_t i = 0; i < raw.size(); i += step) {
        out += d.push(raw.substr(i, step));
    }
    out += d.finish();
    return out;
}

} // namespace

TEST(TextCodec, DecodesKnownEntities) {
    EXPECT_EQ(decode_entities("a &lt; b &gt; c &amp; &quot;q&quot; &apos;&#39;&#x27; x&#x3D;1"),
              "a < b > c & \"q\" ''' x=1");
}

TEST(TextCodec, LeavesUnknownEntitiesVerbatim) {
    EXPECT_EQ(decode_entities("&nbsp; &amp &copy;"), "&nbsp; &amp &copy;");
}

TEST(TextCodec, ExtractsSingleCDataSection) {
    auto v = extract_cdata("  <![CDATA[\nline <1>\n]]>  ");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "line <1>");

    EXPECT_FALSE(extract_cdata("x <![CDATA[a]]>").has_value());
    EXPECT_FALSE(extract_cdata("plain").has_value());
}

TEST(TextCodec, UnwrapsCodeFence) {
    auto v = unwrap_code_fence("```ts\nconst a = 1;\nconst b = 2;\n```");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "const a = 1;\nconst b = 2;");

    auto plain = unwrap_code_fence("```\nx\n```\n");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, "x");

    EXPECT_FALSE(unwrap_code_fence("no fence").has_value());
    EXPECT_FALSE(unwrap_code_fence("```\nunterminated").has_value());
}

TEST(TextCodec, DecodeBodyKeepsCDataVerbatim) {
    EXPECT_EQ(decode_body("a &lt; <![CDATA[&lt;raw&gt;]]> &gt;"), "a < &lt;raw&gt; >");
}

TEST(TextCodec, BodyDecoderIsSplitInvariant) {
    const std::string raw = "x &amp;&amp; y <![CDATA[<b>&amp;</b>]]> &lt;/div&gt; & tail &q";
    const std::string whole = decode_body(raw);
    for (size_t step = 1; step <= raw.size(); ++step) {
        EXPECT_EQ(decode_in_pieces(raw, step), whole) << "step=" << step;
    }
}

TEST(TextCodec, BodyDecoderHoldsPartialEntity) {
    BodyDecoder d;
    EXPECT_EQ(d.push("a &am"), "a ");
    EXPECT_GT(d.heldBytes(), 0u);
    EXPECT_EQ(d.push("p; b"), "& b");
    EXPECT_EQ(d.finish(), "");
}

TEST(TextCodec, BodyDecoderTracksCDataAcrossPushes) {
    BodyDecoder d;
    std::string out = d.push("x<![CD");
    out += d.push("ATA[<y>]]");
    EXPECT_TRUE(d.inCData());
    out += d.push(">&lt;");
    EXPECT_FALSE(d.inCData());
    out += d.finish();
    EXPECT_EQ(out, "x<y><");
}
