#include "mt/markdown/block_parser.hpp"

#include "mt/markdown/text_utils.hpp"
#include "mt/trace.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace mt::markdown
{
namespace
{

Position lineStart(const SourceLine &line) noexcept
{
    return Position{line.lineNumber, 1, line.offset};
}

Position lineEnd(const SourceLine &line) noexcept
{
    return Position{line.lineNumber, line.raw.size() + 1, line.offset + line.raw.size()};
}

SourceLocation lineLocation(const SourceLine &line) noexcept
{
    return SourceLocation{lineStart(line), lineEnd(line)};
}

// Appends `line` minus its first `removed` bytes to a container's stripped
// sub-text and records where the stripped text came from.
void appendStripped(std::vector<SourceLine> &content, ContentMap &map, const SourceLine &line, std::size_t removed)
{
    removed = std::min(removed, line.raw.size());

    SourceLine stripped;
    stripped.raw = line.raw.substr(removed);
    stripped.lineNumber = content.size() + 1;
    stripped.offset = content.empty() ? 0 : content.back().offset + content.back().raw.size() + 1;
    stripped.hasNewline = true;

    map.addLine(stripped.offset, Position{line.lineNumber, removed + 1, line.offset + removed}, removed);
    content.push_back(std::move(stripped));
}

void appendBlank(std::vector<SourceLine> &content, ContentMap &map, const SourceLine &line)
{
    SourceLine blank = line;
    blank.raw.clear();
    appendStripped(content, map, blank, 0);
}

void closeStrippedText(std::vector<SourceLine> &content)
{
    if (!content.empty())
        content.back().hasNewline = false;
}

// Lines that can still be followed by a lazy paragraph continuation.
bool continuesParagraph(std::string_view previous)
{
    switch (classifyLine(previous))
    {
    case LineKind::Blank:
    case LineKind::AtxHeading:
    case LineKind::ThematicBreak:
    case LineKind::CodeFence:
        return false;
    default:
        return true;
    }
}

// Follows fenced code through a container's stripped lines; no lazy line may
// be taken while a fence is open.
class FenceTracker
{
public:
    void feed(std::string_view stripped)
    {
        if (open)
        {
            if (isClosingCodeFence(stripped, open->fenceChar, open->fenceLength))
                open.reset();
            return;
        }
        if (auto fence = matchCodeFenceOpen(stripped))
            open = std::move(fence);
    }

    bool insideFence() const noexcept { return open.has_value(); }

private:
    std::optional<CodeFenceMatch> open;
};

bool acceptsLazyLine(const std::vector<SourceLine> &content, const FenceTracker &fences)
{
    return !content.empty() && !fences.insideFence() && continuesParagraph(content.back().raw);
}

bool containsBlankLine(const ListItem &item)
{
    return std::any_of(item.children.begin(), item.children.end(),
                       [](const BlockNode &child) { return child.kind() == BlockKind::BlankLine; });
}

} // namespace

BlockParseResult parseBlocks(std::string_view input, const ParserOptions &options)
{
    BlockParseResult result;
    std::vector<SourceLine> lines = splitLines(input);

    BlockParser parser(options, result.references);
    result.document.children = parser.parseLines(lines);

    result.document.location.start = Position{1, 1, 0};
    if (lines.empty())
        result.document.location.end = Position{1, 1, 0};
    else if (lines.back().hasNewline)
        result.document.location.end = Position{lines.back().lineNumber + 1, 1, input.size()};
    else
        result.document.location.end = lineEnd(lines.back());
    return result;
}

BlockParser::BlockParser(const ParserOptions &options, ReferenceMap &references, std::size_t depth)
    : options(options),
      references(references),
      nestingDepth(depth)
{
}

std::vector<BlockNode> BlockParser::parseLines(const std::vector<SourceLine> &lines)
{
    std::vector<BlockNode> nodes;
    std::size_t i = 0;
    while (i < lines.size())
    {
        const SourceLine &line = lines[i];

        if (auto definition = referenceAt(lines, i))
        {
            trace(line, "link_reference_definition");
            references.define(std::move(definition->reference));
            i += definition->linesConsumed;
            continue;
        }

        if (isBlankLine(line.raw))
        {
            trace(line, "blank_line");
            nodes.push_back(BlockNode{BlankLine{lineLocation(line)}});
            ++i;
            continue;
        }

        if (auto heading = matchAtxHeading(line.raw))
        {
            trace(line, "heading");
            nodes.push_back(parseHeading(line, *heading));
            ++i;
            continue;
        }

        if (matchThematicBreak(line.raw))
        {
            trace(line, "thematic_break");
            nodes.push_back(BlockNode{ThematicBreak{lineLocation(line)}});
            ++i;
            continue;
        }

        if (auto fence = matchCodeFenceOpen(line.raw))
        {
            trace(line, "code_block");
            i = parseFencedCode(lines, i, *fence, nodes);
            continue;
        }

        if (matchBlockQuote(line.raw))
        {
            trace(line, "block_quote");
            i = parseBlockQuote(lines, i, nodes);
            continue;
        }

        if (auto item = matchListItem(line.raw))
        {
            trace(line, "list");
            i = parseList(lines, i, *item, nodes);
            continue;
        }

        trace(line, "paragraph");
        i = parseParagraph(lines, i, nodes);
    }
    return nodes;
}

std::optional<LinkReferenceMatch> BlockParser::referenceAt(const std::vector<SourceLine> &lines,
                                                           std::size_t index) const
{
    std::string_view next;
    const std::string_view *nextPtr = nullptr;
    if (index + 1 < lines.size())
    {
        next = lines[index + 1].raw;
        nextPtr = &next;
    }
    return matchLinkReferenceDefinition(lines[index].raw, nextPtr);
}

BlockNode BlockParser::parseHeading(const SourceLine &line, const AtxHeadingMatch &match) const
{
    Heading heading;
    heading.level = match.level;
    heading.location = lineLocation(line);
    heading.rawContent = match.content;
    heading.contentStart = Position{line.lineNumber, match.contentStart + 1, line.offset + match.contentStart};
    return BlockNode{std::move(heading)};
}

std::size_t BlockParser::parseParagraph(const std::vector<SourceLine> &lines, std::size_t start,
                                        std::vector<BlockNode> &out) const
{
    Paragraph paragraph;
    std::size_t end = start;
    while (end < lines.size())
    {
        const SourceLine &line = lines[end];
        if (end > start)
        {
            if (classifyLine(line.raw) != LineKind::Paragraph || referenceAt(lines, end))
                break;
            paragraph.rawContent.push_back('\n');
        }
        paragraph.rawContent += line.raw;
        ++end;
    }

    paragraph.location = SourceLocation{lineStart(lines[start]), lineEnd(lines[end - 1])};
    out.push_back(BlockNode{std::move(paragraph)});
    return end;
}

std::size_t BlockParser::parseFencedCode(const std::vector<SourceLine> &lines, std::size_t start,
                                         const CodeFenceMatch &fence, std::vector<BlockNode> &out) const
{
    CodeBlock code;
    code.info = fence.info;

    std::size_t i = start + 1;
    bool hasContent = false;
    while (i < lines.size())
    {
        const SourceLine &line = lines[i];
        if (isClosingCodeFence(line.raw, fence.fenceChar, fence.fenceLength))
        {
            ++i;
            break;
        }

        std::size_t strip = std::min(fence.indent, leadingSpaces(line.raw));
        code.value.append(line.raw, strip, std::string::npos);
        code.value.push_back('\n');
        hasContent = true;
        ++i;
    }
    if (!hasContent)
        code.value.clear();

    code.location = SourceLocation{lineStart(lines[start]), lineEnd(lines[i - 1])};
    out.push_back(BlockNode{std::move(code)});
    return i;
}

std::size_t BlockParser::parseBlockQuote(const std::vector<SourceLine> &lines, std::size_t start,
                                         std::vector<BlockNode> &out)
{
    BlockQuote quote;
    std::vector<SourceLine> content;
    FenceTracker fences;

    std::size_t i = start;
    while (i < lines.size())
    {
        const SourceLine &line = lines[i];
        if (auto marker = matchBlockQuote(line.raw))
        {
            appendStripped(content, quote.contentMap, line, marker->prefixLength);
            fences.feed(content.back().raw);
            ++i;
            continue;
        }

        if (classifyLine(line.raw) == LineKind::Paragraph && acceptsLazyLine(content, fences))
        {
            appendStripped(content, quote.contentMap, line, 0);
            ++i;
            continue;
        }
        break;
    }
    closeStrippedText(content);

    quote.children = parseNested(content);
    quote.location = SourceLocation{lineStart(lines[start]), lineEnd(lines[i - 1])};
    out.push_back(BlockNode{std::move(quote)});
    return i;
}

std::size_t BlockParser::parseList(const std::vector<SourceLine> &lines, std::size_t start,
                                   const ListItemMatch &first, std::vector<BlockNode> &out)
{
    List list;
    list.ordered = first.type == ListMarkerType::Ordered;
    list.start = list.ordered ? first.start : 1;

    bool blankBetweenItems = false;
    std::size_t i = start;
    while (i < lines.size())
    {
        if (matchThematicBreak(lines[i].raw))
            break;
        auto match = matchListItem(lines[i].raw);
        if (!match || !match->sameFamily(first))
            break;

        PendingItem pending = collectListItem(lines, i, *match);
        i = pending.nextIndex;

        if (i < lines.size() && isBlankLine(lines[i].raw))
        {
            std::size_t j = i;
            while (j < lines.size() && isBlankLine(lines[j].raw))
                ++j;

            std::optional<ListItemMatch> next;
            if (j < lines.size() && !matchThematicBreak(lines[j].raw))
                next = matchListItem(lines[j].raw);

            if (next && next->sameFamily(first))
            {
                blankBetweenItems = true;
                for (std::size_t k = i; k < j; ++k)
                    appendBlank(pending.content, pending.contentMap, lines[k]);
                pending.lastLine = j - 1;
                list.children.push_back(finishListItem(lines, pending));
                i = j;
                continue;
            }

            list.children.push_back(finishListItem(lines, pending));
            break;
        }

        list.children.push_back(finishListItem(lines, pending));
    }

    list.tight = !blankBetweenItems && std::none_of(list.children.begin(), list.children.end(), containsBlankLine);
    list.location = SourceLocation{lineStart(lines[start]), list.children.back().location.end};
    out.push_back(BlockNode{std::move(list)});
    return i;
}

BlockParser::PendingItem BlockParser::collectListItem(const std::vector<SourceLine> &lines, std::size_t start,
                                                      const ListItemMatch &match) const
{
    PendingItem pending;
    pending.match = match;
    pending.firstLine = start;

    const std::size_t contentIndent = match.contentIndent;
    appendStripped(pending.content, pending.contentMap, lines[start], match.contentStart);
    FenceTracker fences;
    fences.feed(pending.content.back().raw);

    std::size_t i = start + 1;
    while (i < lines.size())
    {
        const SourceLine &line = lines[i];

        if (isBlankLine(line.raw))
        {
            std::size_t j = i + 1;
            while (j < lines.size() && isBlankLine(lines[j].raw))
                ++j;
            if (j >= lines.size())
                break;

            const SourceLine &next = lines[j];
            auto nextItem = matchListItem(next.raw);
            bool nestedContent = leadingSpaces(next.raw) >= contentIndent && !nextItem;
            bool nestedList = nextItem && nextItem->indent >= contentIndent;
            if (!nestedContent && !nestedList)
                break;

            appendBlank(pending.content, pending.contentMap, line);
            ++i;
            continue;
        }

        std::size_t indent = leadingSpaces(line.raw);
        if (indent < contentIndent && matchThematicBreak(line.raw))
            break;

        if (auto nested = matchListItem(line.raw))
        {
            if (nested->indent < contentIndent)
                break;
            appendStripped(pending.content, pending.contentMap, line, contentIndent);
            fences.feed(pending.content.back().raw);
            ++i;
            continue;
        }

        if (indent >= contentIndent)
        {
            appendStripped(pending.content, pending.contentMap, line, contentIndent);
            fences.feed(pending.content.back().raw);
            ++i;
            continue;
        }

        if (acceptsLazyLine(pending.content, fences) && classifyLine(line.raw) == LineKind::Paragraph)
        {
            appendStripped(pending.content, pending.contentMap, line, indent);
            ++i;
            continue;
        }
        break;
    }

    pending.lastLine = i - 1;
    pending.nextIndex = i;
    return pending;
}

ListItem BlockParser::finishListItem(const std::vector<SourceLine> &lines, PendingItem &pending)
{
    closeStrippedText(pending.content);

    ListItem item;
    item.marker = pending.match.marker;
    item.children = parseNested(pending.content);
    // An item that starts with an empty marker line has no leading blank
    // child; the marker line itself is not a blank line between blocks.
    if (!item.children.empty() && item.children.front().kind() == BlockKind::BlankLine)
        item.children.erase(item.children.begin());
    item.location = SourceLocation{lineStart(lines[pending.firstLine]), lineEnd(lines[pending.lastLine])};
    item.contentMap = std::move(pending.contentMap);
    return item;
}

std::vector<BlockNode> BlockParser::parseNested(const std::vector<SourceLine> &content)
{
    if (nestingDepth + 1 > options.maxNestingDepth)
        throw ParseError(ParseErrorKind::TooDeeplyNested,
                         "container nesting exceeds the limit of " + std::to_string(options.maxNestingDepth));
    BlockParser nested(options, references, nestingDepth + 1);
    return nested.parseLines(content);
}

void BlockParser::trace(const SourceLine &line, std::string_view construct) const
{
    if (!diag::traceEnabled())
        return;
    diag::traceLine("[marktree][block] depth=" + std::to_string(nestingDepth) +
                    " line=" + std::to_string(line.lineNumber) + " construct=" + std::string(construct));
}

} // namespace mt::markdown
