#include <gtest/gtest.h>

#include "mt/markdown/line_scanner.hpp"

using mt::markdown::splitLines;

TEST(LineScanner, EmptyInputHasNoLines)
{
    EXPECT_TRUE(splitLines("").empty());
}

TEST(LineScanner, KeepsUnterminatedLastLine)
{
    auto lines = splitLines("alpha\nbeta");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].raw, "alpha");
    EXPECT_TRUE(lines[0].hasNewline);
    EXPECT_EQ(lines[1].raw, "beta");
    EXPECT_FALSE(lines[1].hasNewline);
    EXPECT_EQ(lines[1].lineNumber, 2u);
    EXPECT_EQ(lines[1].offset, 6u);
}

TEST(LineScanner, TrailingNewlineDoesNotAddALine)
{
    auto lines = splitLines("one\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].raw, "one");
    EXPECT_TRUE(lines[0].hasNewline);
}

TEST(LineScanner, BlankLinesAreLines)
{
    auto lines = splitLines("a\n\n\nb");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1].raw, "");
    EXPECT_EQ(lines[2].raw, "");
    EXPECT_EQ(lines[2].offset, 3u);
    EXPECT_EQ(lines[3].offset, 4u);
    EXPECT_EQ(lines[3].lineNumber, 4u);
}

TEST(LineScanner, OnlySplitsOnLineFeed)
{
    auto lines = splitLines("a\r\nb");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].raw, "a\r");
}
