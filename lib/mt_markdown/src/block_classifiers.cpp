#include "mt/markdown/block_classifiers.hpp"

#include "mt/markdown/references.hpp"
#include "mt/markdown/text_utils.hpp"

#include <charconv>

namespace mt::markdown
{
namespace
{

constexpr std::size_t kMaxIndent = 3;
constexpr std::size_t kMaxLabelLength = 999;
constexpr std::size_t kMaxOrderedDigits = 9;

std::size_t skipSpacesAndTabs(std::string_view text, std::size_t pos) noexcept
{
    while (pos < text.size() && isSpaceOrTab(text[pos]))
        ++pos;
    return pos;
}

bool onlySpacesAndTabsFrom(std::string_view text, std::size_t pos) noexcept
{
    return skipSpacesAndTabs(text, pos) == text.size();
}

// Completes a list match once the marker has been read. `afterMarker` is the
// index right behind the marker.
std::optional<ListItemMatch> finishListItem(std::string_view line, ListItemMatch match, std::size_t afterMarker)
{
    if (onlySpacesAndTabsFrom(line, afterMarker))
    {
        match.contentIndent = afterMarker + 1;
        match.contentStart = line.size();
        return match;
    }

    std::size_t spaces = 0;
    while (afterMarker + spaces < line.size() && line[afterMarker + spaces] == ' ')
        ++spaces;
    if (spaces == 0)
        return std::nullopt;

    if (spaces > 4)
        spaces = 1;
    match.contentIndent = afterMarker + spaces;
    match.contentStart = afterMarker + spaces;
    return match;
}

} // namespace

bool isBlankLine(std::string_view line) noexcept
{
    return onlySpacesAndTabsFrom(line, 0);
}

std::optional<AtxHeadingMatch> matchAtxHeading(std::string_view line)
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent)
        return std::nullopt;

    std::size_t pos = indent;
    std::size_t level = 0;
    while (pos < line.size() && line[pos] == '#')
    {
        ++level;
        ++pos;
    }
    if (level == 0 || level > 6)
        return std::nullopt;
    if (pos < line.size() && !isSpaceOrTab(line[pos]))
        return std::nullopt;

    std::string_view rest = trimmedRight(line.substr(pos));

    // Closing sequence: a trailing run of '#' preceded by a space or tab, or
    // filling the whole remainder.
    std::size_t hashStart = rest.size();
    while (hashStart > 0 && rest[hashStart - 1] == '#')
        --hashStart;
    if (hashStart < rest.size() && (hashStart == 0 || isSpaceOrTab(rest[hashStart - 1])))
        rest = trimmedRight(rest.substr(0, hashStart));

    std::size_t contentOffset = skipSpacesAndTabs(rest, 0);

    AtxHeadingMatch match;
    match.level = static_cast<int>(level);
    match.content = std::string(rest.substr(contentOffset));
    match.contentStart = match.content.empty() ? line.size() : pos + contentOffset;
    return match;
}

std::optional<ThematicBreakMatch> matchThematicBreak(std::string_view line) noexcept
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent || indent >= line.size())
        return std::nullopt;

    char marker = line[indent];
    if (marker != '-' && marker != '*' && marker != '_')
        return std::nullopt;

    std::size_t count = 0;
    for (std::size_t i = indent; i < line.size(); ++i)
    {
        char ch = line[i];
        if (ch == marker)
            ++count;
        else if (!isSpaceOrTab(ch))
            return std::nullopt;
    }
    if (count < 3)
        return std::nullopt;
    return ThematicBreakMatch{marker, indent};
}

std::optional<CodeFenceMatch> matchCodeFenceOpen(std::string_view line)
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent || indent >= line.size())
        return std::nullopt;

    char fenceChar = line[indent];
    if (fenceChar != '`' && fenceChar != '~')
        return std::nullopt;

    std::size_t pos = indent;
    while (pos < line.size() && line[pos] == fenceChar)
        ++pos;
    std::size_t length = pos - indent;
    if (length < 3)
        return std::nullopt;

    std::string_view info = trimmed(line.substr(pos));
    if (fenceChar == '`' && info.find('`') != std::string_view::npos)
        return std::nullopt;

    CodeFenceMatch match;
    match.indent = indent;
    match.fenceChar = fenceChar;
    match.fenceLength = length;
    match.info = std::string(info);
    return match;
}

bool isClosingCodeFence(std::string_view line, char fenceChar, std::size_t minLength) noexcept
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent)
        return false;
    std::size_t pos = indent;
    while (pos < line.size() && line[pos] == fenceChar)
        ++pos;
    if (pos - indent < minLength)
        return false;
    return onlySpacesAndTabsFrom(line, pos);
}

std::optional<BlockQuoteMatch> matchBlockQuote(std::string_view line) noexcept
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent || indent >= line.size() || line[indent] != '>')
        return std::nullopt;
    std::size_t prefix = indent + 1;
    if (prefix < line.size() && line[prefix] == ' ')
        ++prefix;
    return BlockQuoteMatch{prefix};
}

std::optional<ListItemMatch> matchListItem(std::string_view line)
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent || indent >= line.size())
        return std::nullopt;

    ListItemMatch match;
    match.indent = indent;

    char first = line[indent];
    if (first == '-' || first == '+' || first == '*')
    {
        match.type = ListMarkerType::Bullet;
        match.bulletChar = first;
        match.marker = std::string(1, first);
        return finishListItem(line, std::move(match), indent + 1);
    }

    std::size_t pos = indent;
    while (pos < line.size() && isAsciiDigit(line[pos]) && pos - indent < kMaxOrderedDigits + 1)
        ++pos;
    std::size_t digits = pos - indent;
    if (digits == 0 || digits > kMaxOrderedDigits || pos >= line.size())
        return std::nullopt;
    char delimiter = line[pos];
    if (delimiter != '.' && delimiter != ')')
        return std::nullopt;

    long start = 0;
    std::from_chars(line.data() + indent, line.data() + pos, start);

    match.type = ListMarkerType::Ordered;
    match.delimiter = delimiter;
    match.start = start;
    match.marker = std::string(line.substr(indent, digits + 1));
    return finishListItem(line, std::move(match), pos + 1);
}

std::optional<LinkReferenceMatch> matchLinkReferenceDefinition(std::string_view line,
                                                               const std::string_view *nextLine)
{
    std::size_t indent = leadingSpaces(line);
    if (indent > kMaxIndent || indent >= line.size() || line[indent] != '[')
        return std::nullopt;

    std::size_t pos = indent + 1;
    std::size_t labelStart = pos;
    while (pos < line.size() && line[pos] != ']')
    {
        if (line[pos] == '[')
            return std::nullopt;
        if (line[pos] == '\\' && pos + 1 < line.size())
            ++pos;
        ++pos;
    }
    if (pos >= line.size())
        return std::nullopt;
    std::string_view label = line.substr(labelStart, pos - labelStart);
    if (label.empty() || label.size() > kMaxLabelLength || trimmed(label).empty())
        return std::nullopt;

    ++pos;
    if (pos >= line.size() || line[pos] != ':')
        return std::nullopt;
    ++pos;
    if (pos >= line.size() || !isSpaceOrTab(line[pos]))
        return std::nullopt;
    pos = skipSpacesAndTabs(line, pos);

    auto destination = scanLinkDestination(line.substr(pos));
    if (!destination)
        return std::nullopt;
    pos += destination->consumed;

    LinkReferenceMatch match;
    match.reference.label = std::string(label);
    match.reference.destination = std::move(destination->destination);

    std::string_view afterDestination = line.substr(pos);
    if (!trimmed(afterDestination).empty())
    {
        // The title must be separated from the destination by whitespace.
        if (!isSpaceOrTab(afterDestination.front()))
            return std::nullopt;
        std::string_view rest = trimmed(afterDestination);
        auto title = scanLinkTitle(rest);
        if (!title || !trimmed(rest.substr(title->consumed)).empty())
            return std::nullopt;
        match.reference.title = std::move(title->title);
        return match;
    }

    if (nextLine)
    {
        std::string_view candidate = trimmed(*nextLine);
        if (!candidate.empty())
        {
            auto title = scanLinkTitle(candidate);
            if (title && trimmed(candidate.substr(title->consumed)).empty())
            {
                match.reference.title = std::move(title->title);
                match.linesConsumed = 2;
            }
        }
    }
    return match;
}

LineKind classifyLine(std::string_view line)
{
    if (isBlankLine(line))
        return LineKind::Blank;
    if (matchAtxHeading(line))
        return LineKind::AtxHeading;
    if (matchThematicBreak(line))
        return LineKind::ThematicBreak;
    if (matchCodeFenceOpen(line))
        return LineKind::CodeFence;
    if (matchBlockQuote(line))
        return LineKind::BlockQuote;
    if (matchListItem(line))
        return LineKind::ListItem;
    return LineKind::Paragraph;
}

} // namespace mt::markdown
