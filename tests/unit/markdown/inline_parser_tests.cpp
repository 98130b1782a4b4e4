#include <gtest/gtest.h>

#include "mt/markdown/inline_parser.hpp"

#include <string>

using namespace mt::markdown;

namespace
{

std::vector<InlineNode> inlines(std::string_view raw, const ReferenceMap &references = ReferenceMap())
{
    return parseInlines(raw, Position{1, 1, 0}, references);
}

std::string textOf(const InlineNode &node)
{
    const Text *text = node.as<Text>();
    return text ? text->value : std::string("<not text>");
}

} // namespace

TEST(InlineParser, PlainTextIsOneNode)
{
    auto nodes = inlines("hello world");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(textOf(nodes[0]), "hello world");
    EXPECT_EQ(nodes[0].location(), (SourceLocation{{1, 1, 0}, {1, 12, 11}}));
}

TEST(InlineParser, SoftAndHardBreaks)
{
    auto soft = inlines("a\nb");
    ASSERT_EQ(soft.size(), 3u);
    EXPECT_EQ(soft[1].kind(), InlineKind::SoftBreak);
    EXPECT_EQ(soft[2].location().start, (Position{2, 1, 2}));

    auto spaces = inlines("a  \nb");
    ASSERT_EQ(spaces.size(), 3u);
    EXPECT_EQ(textOf(spaces[0]), "a");
    EXPECT_EQ(spaces[1].kind(), InlineKind::HardBreak);
    EXPECT_EQ(spaces[1].location().start.offset, 1u);

    auto backslash = inlines("a\\\nb");
    ASSERT_EQ(backslash.size(), 3u);
    EXPECT_EQ(textOf(backslash[0]), "a");
    EXPECT_EQ(backslash[1].kind(), InlineKind::HardBreak);
}

TEST(InlineParser, EscapedBackslashBeforeNewlineIsNotAHardBreak)
{
    auto nodes = inlines("a\\\\\nb");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(textOf(nodes[0]), "a\\");
    EXPECT_EQ(nodes[1].kind(), InlineKind::SoftBreak);
}

TEST(InlineParser, BackslashEscapesPunctuationOnly)
{
    auto nodes = inlines("\\*not emphasis\\* \\a");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(textOf(nodes[0]), "*not emphasis* \\a");
}

TEST(InlineParser, CodeSpans)
{
    auto nodes = inlines("use `` a`b `` here");
    ASSERT_EQ(nodes.size(), 3u);
    const CodeSpan *code = nodes[1].as<CodeSpan>();
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->value, "a`b");
    EXPECT_EQ(code->location.start.offset, 4u);
    EXPECT_EQ(code->location.end.offset, 13u);

    auto multiline = inlines("`a\nb`");
    ASSERT_EQ(multiline.size(), 1u);
    EXPECT_EQ(multiline[0].as<CodeSpan>()->value, "a b");
}

TEST(InlineParser, UnmatchedBackticksAreLiteral)
{
    auto nodes = inlines("``open `");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(textOf(nodes[0]), "``open `");
}

TEST(InlineParser, CodeSpanBindsTighterThanEmphasis)
{
    auto nodes = inlines("*a `*` b");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(textOf(nodes[0]), "*a ");
    EXPECT_EQ(nodes[1].as<CodeSpan>()->value, "*");
    EXPECT_EQ(textOf(nodes[2]), " b");
}

TEST(InlineParser, InlineLinkWithTitle)
{
    auto nodes = inlines("see [the *docs*](/docs \"Docs\") now");
    ASSERT_EQ(nodes.size(), 3u);
    const Link *link = nodes[1].as<Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "/docs");
    ASSERT_TRUE(link->title);
    EXPECT_EQ(*link->title, "Docs");
    EXPECT_EQ(link->location.start.offset, 4u);
    EXPECT_EQ(link->location.end.offset, 30u);

    ASSERT_EQ(link->children.size(), 2u);
    EXPECT_EQ(textOf(link->children[0]), "the ");
    EXPECT_EQ(link->children[0].location().start.offset, 5u);
    EXPECT_EQ(link->children[1].kind(), InlineKind::Emphasis);
}

TEST(InlineParser, EmptyAndAngleDestinations)
{
    auto empty = inlines("[a]()");
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0].as<Link>()->destination, "");

    auto angle = inlines("[a](<with space>)");
    ASSERT_EQ(angle.size(), 1u);
    EXPECT_EQ(angle[0].as<Link>()->destination, "with space");
}

TEST(InlineParser, ReferenceLinks)
{
    ReferenceMap references;
    references.define({"Ref", "/r", std::string("Title")});

    auto full = inlines("[text][REF]", references);
    ASSERT_EQ(full.size(), 1u);
    EXPECT_EQ(full[0].as<Link>()->destination, "/r");
    EXPECT_EQ(full[0].location().end.offset, 11u);

    auto collapsed = inlines("[ref][]", references);
    ASSERT_EQ(collapsed.size(), 1u);
    EXPECT_EQ(collapsed[0].as<Link>()->destination, "/r");

    auto shortcut = inlines("[ref] after", references);
    ASSERT_EQ(shortcut.size(), 2u);
    EXPECT_EQ(*shortcut[0].as<Link>()->title, "Title");
    EXPECT_EQ(textOf(shortcut[1]), " after");
}

TEST(InlineParser, UnknownReferenceStaysText)
{
    auto nodes = inlines("[missing] and [open");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(textOf(nodes[0]), "[missing] and [open");
}

TEST(InlineParser, ImageMarkerStaysLiteral)
{
    auto nodes = inlines("![alt](/img.png)");
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(textOf(nodes[0]), "!");
    EXPECT_EQ(nodes[1].kind(), InlineKind::Link);
}

TEST(InlineParser, PositionsFollowBase)
{
    auto nodes = parseInlines("x\ny", Position{4, 7, 30}, ReferenceMap());
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0].location().start, (Position{4, 7, 30}));
    EXPECT_EQ(nodes[2].location().start, (Position{5, 1, 32}));
}

TEST(InlineParser, LinkTextNestingIsBounded)
{
    ParserOptions options;
    options.maxNestingDepth = 1;
    EXPECT_NO_THROW(parseInlines("[a](/x)", Position{}, ReferenceMap(), options));
    EXPECT_THROW(parseInlines("[[a](/x)](/y)", Position{}, ReferenceMap(), options), ParseError);
}

TEST(InlineParser, MergesAdjacentText)
{
    std::vector<InlineNode> nodes;
    nodes.push_back(InlineNode{Text{"a", {{1, 1, 0}, {1, 2, 1}}}});
    nodes.push_back(InlineNode{Text{"b", {{1, 2, 1}, {1, 3, 2}}}});
    nodes.push_back(InlineNode{SoftBreak{{{1, 3, 2}, {2, 1, 3}}}});
    nodes.push_back(InlineNode{Text{"c", {{2, 1, 3}, {2, 2, 4}}}});
    mergeAdjacentText(nodes);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(textOf(nodes[0]), "ab");
    EXPECT_EQ(nodes[0].location().end.offset, 2u);
}
