#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tag_scanner.hpp"

using namespace actionstream::core;

namespace {

// Events with adjacent Text runs (and Stream runs of the same action) merged, so
// sequences produced from different chunkings can be compared directly.
struct Collected {
    std::vector<ActionEvent> events;
    std::string text;
    std::map<std::string, std::string> streamed;
};

void merge_into(Collected& c, std::vector<ActionEvent> evs) {
    for (auto& ev : evs) {
        if (ev.kind == ActionEventKind::Text) c.text += ev.text;
        if (ev.kind == ActionEventKind::Stream) c.streamed[ev.actionId] += ev.text;

        if (!c.events.empty()) {
            ActionEvent& last = c.events.back();
            const bool sameText = ev.kind == ActionEventKind::Text && last.kind == ActionEventKind::Text;
            const bool sameStream = ev.kind == ActionEventKind::Stream && last.kind == ActionEventKind::Stream &&
                                    last.actionId == ev.actionId;
            if (sameText || sameStream) {
                last.text += ev.text;
                continue;
            }
        }
        c.events.push_back(std::move(ev));
    }
}

Collected scan_in_chunks(std::string_view input, size_t step, ScannerOptions opts = {}) {
    TagScanner s(std::move(opts));
    Collected c;
    for (size_t i = 0; i < input.size(); i += step) {
        merge_into(c, s.feed(input.substr(i, step)));
    }
    merge_into(c, s.finalize());
    return c;
}

Collected scan_chunks(const std::vector<std::string>& chunks, ScannerOptions opts = {}) {
    TagScanner s(std::move(opts));
    Collected c;
    for (const auto& ch : chunks) merge_into(c, s.feed(ch));
    merge_into(c, s.finalize());
    return c;
}

std::vector<ActionTag> closed(const Collected& c) {
    std::vector<ActionTag> out;
    for (const auto& ev : c.events) {
        if (ev.kind == ActionEventKind::Close && ev.action) out.push_back(*ev.action);
    }
    return out;
}

void expect_same_tag(const ActionTag& a, const ActionTag& b) {
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.type(), b.type());
    EXPECT_EQ(a.path(), b.path());
    EXPECT_EQ(a.implicitlyClosed, b.implicitlyClosed);
    if (const auto* fa = std::get_if<FileAction>(&a.payload)) {
        EXPECT_EQ(fa->content, std::get<FileAction>(b.payload).content);
    } else if (const auto* ma = std::get_if<ModifyAction>(&a.payload)) {
        const auto& mb = std::get<ModifyAction>(b.payload);
        ASSERT_EQ(ma->edits.size(), mb.edits.size());
        for (size_t i = 0; i < ma->edits.size(); ++i) {
            EXPECT_EQ(ma->edits[i].before, mb.edits[i].before);
            EXPECT_EQ(ma->edits[i].after, mb.edits[i].after);
        }
    } else {
        EXPECT_EQ(std::get<ShellAction>(a.payload).command, std::get<ShellAction>(b.payload).command);
        EXPECT_EQ(std::get<ShellAction>(a.payload).start, std::get<ShellAction>(b.payload).start);
    }
}

const char* kMixedMessage =
    "Setting things up.\n"
    "<boltAction type=\"file\" filePath=\"src/main.ts\">\n"
    "if (a &lt; b &amp;&amp; c) {\n  console.log(&quot;hi&quot;);\n}\n"
    "</boltAction>\n"
    "Compare 1 < 2 and <b>bold</b>.\n"
    "<boltAction type=\"modify\" path=\"src/app.ts\">\n"
    "<before>const x = 1;</before>\n<after>const x = 2;</after>\n"
    "</boltAction>\n"
    "<boltAction type='shell'><![CDATA[echo \"</boltAction>\"]]></boltAction>\n"
    "<boltAction type=\"start\">npm run dev</boltAction>\n"
    "Done.";

} // namespace

TEST(TagScanner, SplitShellTagYieldsOpenThenClose) {
    ScannerOptions opts;
    opts.tagName = "tag";
    Collected c = scan_chunks({"<tag type=\"sh", "ell\">npm in", "stall</tag>"}, opts);

    ASSERT_EQ(c.events.size(), 2u);
    EXPECT_EQ(c.events[0].kind, ActionEventKind::Open);
    ASSERT_TRUE(c.events[0].action.has_value());
    EXPECT_EQ(c.events[0].action->type(), ActionType::Shell);

    EXPECT_EQ(c.events[1].kind, ActionEventKind::Close);
    ASSERT_TRUE(c.events[1].action.has_value());
    EXPECT_EQ(std::get<ShellAction>(c.events[1].action->payload).command, "npm install");
    EXPECT_FALSE(c.events[1].action->implicitlyClosed);
    EXPECT_EQ(c.events[0].actionId, c.events[1].actionId);
}

TEST(TagScanner, ResultsDoNotDependOnChunking) {
    const std::string input = kMixedMessage;
    const Collected whole = scan_in_chunks(input, input.size());
    const auto ref = closed(whole);
    ASSERT_EQ(ref.size(), 4u);

    for (size_t step : {1u, 2u, 3u, 7u, 13u, 64u}) {
        SCOPED_TRACE("step=" + std::to_string(step));
        const Collected c = scan_in_chunks(input, step);
        const auto tags = closed(c);
        ASSERT_EQ(tags.size(), ref.size());
        for (size_t i = 0; i < tags.size(); ++i) expect_same_tag(tags[i], ref[i]);
        EXPECT_EQ(c.text, whole.text);
        EXPECT_EQ(c.streamed, whole.streamed);
        ASSERT_EQ(c.events.size(), whole.events.size());
        for (size_t i = 0; i < c.events.size(); ++i) {
            EXPECT_EQ(c.events[i].kind, whole.events[i].kind);
            EXPECT_EQ(c.events[i].actionId, whole.events[i].actionId);
        }
    }
}

TEST(TagScanner, DecodesFinalizedPayloads) {
    const Collected c = scan_in_chunks(kMixedMessage, 5);
    const auto tags = closed(c);
    ASSERT_EQ(tags.size(), 4u);

    EXPECT_EQ(tags[0].type(), ActionType::File);
    EXPECT_EQ(tags[0].path(), "src/main.ts");
    EXPECT_EQ(std::get<FileAction>(tags[0].payload).content,
              "if (a < b && c) {\n  console.log(\"hi\");\n}\n");

    EXPECT_EQ(tags[1].type(), ActionType::Modify);
    const auto& edits = std::get<ModifyAction>(tags[1].payload).edits;
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].before, "const x = 1;");
    EXPECT_EQ(edits[0].after, "const x = 2;");

    EXPECT_EQ(std::get<ShellAction>(tags[2].payload).command, "echo \"</boltAction>\"");
    EXPECT_FALSE(std::get<ShellAction>(tags[2].payload).start);

    EXPECT_EQ(std::get<ShellAction>(tags[3].payload).command, "npm run dev");
    EXPECT_TRUE(std::get<ShellAction>(tags[3].payload).start);
}

TEST(TagScanner, TextOutsideActionsIsPreserved) {
    const Collected c = scan_in_chunks(kMixedMessage, 1);
    EXPECT_EQ(c.text,
              "Setting things up.\n\nCompare 1 < 2 and <b>bold</b>.\n\n\n\nDone.");
}

TEST(TagScanner, StreamsFileContentIncrementally) {
    TagScanner s;
    auto evs = s.feed("<boltAction type=\"file\" path=\"a.txt\">abc</bolt");
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].kind, ActionEventKind::Open);
    EXPECT_EQ(evs[1].kind, ActionEventKind::Stream);
    EXPECT_EQ(evs[1].text, "abc");
    EXPECT_TRUE(s.insideAction());

    evs = s.feed("Action>");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind, ActionEventKind::Close);
    EXPECT_EQ(std::get<FileAction>(evs[0].action->payload).content, "abc\n");
    EXPECT_FALSE(s.insideAction());
}

TEST(TagScanner, ShellAndModifyBodiesAreNotStreamed) {
    const Collected c = scan_in_chunks(
        "<boltAction type=\"shell\">ls -la</boltAction>"
        "<boltAction type=\"modify\" path=\"x\"><before>a</before><after>b</after></boltAction>", 1);
    for (const auto& ev : c.events) EXPECT_NE(ev.kind, ActionEventKind::Stream);
    EXPECT_EQ(closed(c).size(), 2u);
}

TEST(TagScanner, LookalikeMarkupIsReemittedAsText) {
    const std::string input =
        "x <boltActionX> y <boltAction type=\"bogus\">body</boltAction> "
        "<boltAction type=\"file\">no path</boltAction> <boltAction/> <<boltAction";
    for (size_t step : {1u, 4u, 1000u}) {
        const Collected c = scan_in_chunks(input, step);
        EXPECT_TRUE(closed(c).empty());
        EXPECT_EQ(c.text, input) << "step=" << step;
    }
}

TEST(TagScanner, AttributeEscapesAndEntities) {
    const Collected c = scan_in_chunks(
        "<boltAction type=\"file\" path=\"dir/a\\\"b&amp;c.ts\">x</boltAction>", 3);
    const auto tags = closed(c);
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].path(), "dir/a\"b&c.ts");
}

TEST(TagScanner, OverlongOpeningTagIsText) {
    ScannerOptions opts;
    opts.maxOpenTagLength = 32;
    const std::string input = "<boltAction type=\"shell\" note=\"" + std::string(64, 'n') + "\">ls</boltAction>";
    const Collected c = scan_in_chunks(input, 8, opts);
    EXPECT_TRUE(closed(c).empty());
    EXPECT_EQ(c.text, input);
}

TEST(TagScanner, FinalizeClosesUnterminatedAction) {
    TagScanner s;
    (void)s.feed("<boltAction type=\"shell\">ls -la");
    auto evs = s.finalize();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind, ActionEventKind::Close);
    EXPECT_TRUE(evs[0].action->implicitlyClosed);
    EXPECT_EQ(std::get<ShellAction>(evs[0].action->payload).command, "ls -la");
}

TEST(TagScanner, FinalizeReleasesUnterminatedOpeningTag) {
    TagScanner s;
    auto evs = s.feed("hello <boltAction type=\"fi");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].text, "hello ");
    EXPECT_EQ(s.state(), ScanState::AttrValue);

    evs = s.finalize();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind, ActionEventKind::Text);
    EXPECT_EQ(evs[0].text, "<boltAction type=\"fi");
    EXPECT_EQ(s.state(), ScanState::Text);
}

TEST(TagScanner, IdsUsePrefixAndCounter) {
    ScannerOptions opts;
    opts.idPrefix = "msg1";
    TagScanner s(opts);
    auto evs = s.feed("<boltAction type=\"shell\">a</boltAction><boltAction type=\"shell\">b</boltAction>");
    std::vector<std::string> ids;
    for (const auto& ev : evs) {
        if (ev.kind == ActionEventKind::Open) ids.push_back(ev.actionId);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"msg1:action-0", "msg1:action-1"}));
    EXPECT_EQ(s.actionsOpened(), 2u);

    s.reset();
    evs = s.feed("<boltAction type=\"shell\">c</boltAction>");
    ASSERT_FALSE(evs.empty());
    EXPECT_EQ(evs.front().actionId, "msg1:action-0");
}

TEST(TagScanner, RejectsEmptyTagName) {
    ScannerOptions opts;
    opts.tagName.clear();
    EXPECT_THROW(TagScanner{opts}, std::invalid_argument);
}
