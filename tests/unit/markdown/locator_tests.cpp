#include <gtest/gtest.h>

#include "mt/markdown/locator.hpp"
#include "mt/markdown/parser.hpp"

#include <string>
#include <vector>

using namespace mt::markdown;

TEST(Locator, MapsQuoteContentBackToDocument)
{
    const std::string input = "> hello\n";
    Document document = parse(input);
    const BlockQuote *quote = document.children[0].as<BlockQuote>();
    ASSERT_NE(quote, nullptr);

    const Paragraph *paragraph = quote->children[0].as<Paragraph>();
    ASSERT_NE(paragraph, nullptr);
    EXPECT_EQ(paragraph->location, (SourceLocation{{1, 1, 0}, {1, 6, 5}}));

    ContainerChain chain{&quote->contentMap};
    SourceLocation mapped = toDocumentLocation(paragraph->location, chain);
    EXPECT_EQ(mapped, (SourceLocation{{1, 3, 2}, {1, 8, 7}}));
    EXPECT_EQ(sourceSlice(input, mapped), "hello");
}

TEST(Locator, MapsThroughNestedListItems)
{
    const std::string input = "- a\n  - b\n";
    Document document = parse(input);
    const List *outer = document.children[0].as<List>();
    ASSERT_NE(outer, nullptr);
    const ListItem &first = outer->children[0];
    const List *inner = first.children[1].as<List>();
    ASSERT_NE(inner, nullptr);
    const ListItem &nested = inner->children[0];

    ContainerChain itemChain{&first.contentMap};
    EXPECT_EQ(toDocumentLocation(nested.location, itemChain), (SourceLocation{{2, 3, 6}, {2, 6, 9}}));
    EXPECT_EQ(sourceSlice(input, toDocumentLocation(nested.location, itemChain)), "- b");

    const Text *text = nested.children[0].as<Paragraph>()->children[0].as<Text>();
    ASSERT_NE(text, nullptr);
    ContainerChain textChain{&first.contentMap, &nested.contentMap};
    SourceLocation mapped = toDocumentLocation(text->location, textChain);
    EXPECT_EQ(mapped.start, (Position{2, 5, 8}));
    EXPECT_EQ(sourceSlice(input, mapped), "b");
}

TEST(Locator, MapsLazyContinuationLines)
{
    const std::string input = "> first\nsecond\n";
    Document document = parse(input);
    const BlockQuote *quote = document.children[0].as<BlockQuote>();
    ASSERT_NE(quote, nullptr);
    const auto &nodes = quote->children[0].as<Paragraph>()->children;
    ASSERT_EQ(nodes.size(), 3u);

    ContainerChain chain{&quote->contentMap};
    EXPECT_EQ(sourceSlice(input, toDocumentLocation(nodes[0].location(), chain)), "first");
    EXPECT_EQ(sourceSlice(input, toDocumentLocation(nodes[2].location(), chain)), "second");
}

TEST(Locator, VisitsBlocksInDocumentOrder)
{
    const std::string input = "- a\n  - b\n- c\n";
    Document document = parse(input);

    std::vector<BlockKind> kinds;
    std::vector<std::size_t> depths;
    std::vector<std::string> slices;
    forEachBlock(document, [&](const LocatedBlock &located) {
        kinds.push_back(located.kind);
        depths.push_back(located.depth);
        slices.emplace_back(sourceSlice(input, located.documentLocation));
    });

    const std::vector<BlockKind> expectedKinds = {
        BlockKind::List,     BlockKind::ListItem,  BlockKind::Paragraph, BlockKind::List,
        BlockKind::ListItem, BlockKind::Paragraph, BlockKind::ListItem,  BlockKind::Paragraph,
    };
    EXPECT_EQ(kinds, expectedKinds);
    EXPECT_EQ(depths, (std::vector<std::size_t>{0, 0, 1, 1, 1, 2, 0, 1}));
    EXPECT_EQ(slices[0], "- a\n  - b\n- c");
    EXPECT_EQ(slices[2], "a");
    EXPECT_EQ(slices[4], "- b");
    EXPECT_EQ(slices[5], "b");
    EXPECT_EQ(slices[7], "c");
}

TEST(Locator, EmptyChainIsIdentity)
{
    Position position{3, 4, 20};
    EXPECT_EQ(toDocumentPosition(position, ContainerChain{}), position);
}

TEST(Locator, SliceClampsToDocument)
{
    EXPECT_EQ(sourceSlice("abc", SourceLocation{{1, 1, 1}, {1, 9, 8}}), "bc");
    EXPECT_EQ(sourceSlice("abc", SourceLocation{{1, 9, 8}, {1, 9, 9}}), "");
}
