#pragma once

#include "mt/markdown/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mt::markdown
{

enum class LineKind
{
    Blank,
    AtxHeading,
    ThematicBreak,
    CodeFence,
    BlockQuote,
    ListItem,
    Paragraph
};

struct AtxHeadingMatch
{
    int level = 1;
    std::size_t contentStart = 0;
    std::string content;
};

struct ThematicBreakMatch
{
    char marker = '-';
    std::size_t indent = 0;
};

struct CodeFenceMatch
{
    std::size_t indent = 0;
    char fenceChar = '`';
    std::size_t fenceLength = 0;
    std::string info;
};

struct BlockQuoteMatch
{
    // Bytes of "   > " prefix removed from the line, optional space included.
    std::size_t prefixLength = 0;
};

enum class ListMarkerType
{
    Bullet,
    Ordered
};

struct ListItemMatch
{
    ListMarkerType type = ListMarkerType::Bullet;
    std::string marker;
    char bulletChar = 0;
    char delimiter = 0;
    long start = 1;
    std::size_t indent = 0;
    std::size_t contentIndent = 0;
    std::size_t contentStart = 0;

    bool sameFamily(const ListItemMatch &other) const noexcept
    {
        if (type != other.type)
            return false;
        if (type == ListMarkerType::Bullet)
            return bulletChar == other.bulletChar;
        return delimiter == other.delimiter;
    }
};

struct LinkReferenceMatch
{
    LinkReference reference;
    std::size_t linesConsumed = 1;
};

bool isBlankLine(std::string_view line) noexcept;
std::optional<AtxHeadingMatch> matchAtxHeading(std::string_view line);
std::optional<ThematicBreakMatch> matchThematicBreak(std::string_view line) noexcept;
std::optional<CodeFenceMatch> matchCodeFenceOpen(std::string_view line);
bool isClosingCodeFence(std::string_view line, char fenceChar, std::size_t minLength) noexcept;
std::optional<BlockQuoteMatch> matchBlockQuote(std::string_view line) noexcept;
std::optional<ListItemMatch> matchListItem(std::string_view line);

// `nextLine` may hold a title on its own; pass nullptr at end of input.
std::optional<LinkReferenceMatch> matchLinkReferenceDefinition(std::string_view line,
                                                               const std::string_view *nextLine);

// Precedence order 2..8 (reference definitions are not a line kind).
LineKind classifyLine(std::string_view line);

} // namespace mt::markdown
