#include "mt/markdown/inline_parser.hpp"

#include "mt/markdown/text_utils.hpp"

#include <algorithm>
#include <utility>

namespace mt::markdown
{
namespace
{

bool isSpecialCharacter(char ch) noexcept
{
    return ch == '\n' || ch == '*' || ch == '_' || ch == '[' || ch == '\\' || ch == '`';
}

bool isLinkWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n';
}

std::string codeSpanContent(std::string_view raw)
{
    std::string content(raw);
    std::replace(content.begin(), content.end(), '\n', ' ');
    bool allSpaces = std::all_of(content.begin(), content.end(), [](char ch) { return ch == ' '; });
    if (content.size() >= 2 && content.front() == ' ' && content.back() == ' ' && !allSpaces)
        content = content.substr(1, content.size() - 2);
    return content;
}

} // namespace

std::vector<InlineNode> parseInlines(std::string_view raw, const Position &base, const ReferenceMap &references,
                                     const ParserOptions &options, std::size_t depth)
{
    if (depth > options.maxNestingDepth)
        throw ParseError(ParseErrorKind::TooDeeplyNested,
                         "link text nesting exceeds the limit of " + std::to_string(options.maxNestingDepth));
    InlineParser parser(raw, base, references, options, depth);
    return parser.parse();
}

void mergeAdjacentText(std::vector<InlineNode> &nodes)
{
    std::vector<InlineNode> merged;
    merged.reserve(nodes.size());
    for (InlineNode &node : nodes)
    {
        if (auto *emphasis = node.as<Emphasis>())
            mergeAdjacentText(emphasis->children);
        else if (auto *strong = node.as<Strong>())
            mergeAdjacentText(strong->children);

        Text *current = node.as<Text>();
        Text *previous = merged.empty() ? nullptr : merged.back().as<Text>();
        if (current && previous)
        {
            previous->value += current->value;
            previous->location.end = current->location.end;
            continue;
        }
        merged.push_back(std::move(node));
    }
    nodes = std::move(merged);
}

InlineParser::InlineParser(std::string_view input, const Position &base, const ReferenceMap &references,
                           const ParserOptions &options, std::size_t depth)
    : input(input),
      base(base),
      references(references),
      options(options),
      depth(depth)
{
    lineStarts.push_back(0);
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        if (input[i] == '\n')
            lineStarts.push_back(i + 1);
    }
}

std::vector<InlineNode> InlineParser::parse()
{
    while (pos < input.size())
    {
        char ch = input[pos];
        if (ch == '\n')
            parseLineEnding();
        else if (ch == '*' || ch == '_')
            parseDelimiterRun();
        else if (ch == '[')
        {
            if (!tryParseLink())
            {
                pushText("[", pos, pos + 1);
                ++pos;
            }
        }
        else if (ch == '`')
            parseCodeSpan();
        else if (ch == '\\')
            parseBackslash();
        else
            parseText();
    }

    resolveDelimiters(slots, delimiters);

    std::vector<InlineNode> nodes;
    nodes.reserve(slots.size());
    for (auto &slot : slots)
    {
        if (slot)
            nodes.push_back(std::move(*slot));
    }
    mergeAdjacentText(nodes);
    return nodes;
}

Position InlineParser::positionAt(std::size_t index) const
{
    auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), index);
    std::size_t line = static_cast<std::size_t>(it - lineStarts.begin()) - 1;

    Position position;
    position.line = base.line + line;
    position.column = line == 0 ? base.column + index : index - lineStarts[line] + 1;
    position.offset = base.offset + index;
    return position;
}

SourceLocation InlineParser::locationOf(std::size_t start, std::size_t end) const
{
    return SourceLocation{positionAt(start), positionAt(end)};
}

void InlineParser::pushNode(InlineNode node)
{
    slots.emplace_back(std::move(node));
}

void InlineParser::pushText(std::string value, std::size_t start, std::size_t end)
{
    pushNode(InlineNode{Text{std::move(value), locationOf(start, end)}});
}

void InlineParser::trimLastText(std::size_t count)
{
    for (auto it = slots.rbegin(); it != slots.rend(); ++it)
    {
        if (!*it)
            continue;
        Text *text = (*it)->as<Text>();
        if (!text || text->value.size() < count)
            return;
        text->value.resize(text->value.size() - count);
        text->location.end.column -= count;
        text->location.end.offset -= count;
        if (text->value.empty())
            it->reset();
        return;
    }
}

void InlineParser::parseLineEnding()
{
    std::size_t spaces = 0;
    while (spaces < pos && input[pos - 1 - spaces] == ' ')
        ++spaces;

    if (spaces >= 2)
    {
        trimLastText(spaces);
        pushNode(InlineNode{HardBreak{locationOf(pos - spaces, pos + 1)}});
    }
    else if (pos > 0 && literalBackslashAt == pos - 1)
    {
        trimLastText(1);
        pushNode(InlineNode{HardBreak{locationOf(pos - 1, pos + 1)}});
    }
    else
    {
        pushNode(InlineNode{SoftBreak{locationOf(pos, pos + 1)}});
    }
    ++pos;
}

void InlineParser::parseDelimiterRun()
{
    const char ch = input[pos];
    std::size_t start = pos;
    while (pos < input.size() && input[pos] == ch)
        ++pos;
    std::size_t length = pos - start;

    std::size_t slot = slots.size();
    pushText(std::string(length, ch), start, pos);

    Delimiter delimiter = makeDelimiter(input, start, length, slot);
    if (delimiter.canOpen || delimiter.canClose)
        delimiters.push_back(delimiter);
}

void InlineParser::parseCodeSpan()
{
    std::size_t start = pos;
    std::size_t openLength = 0;
    while (start + openLength < input.size() && input[start + openLength] == '`')
        ++openLength;

    std::size_t i = start + openLength;
    while (i < input.size())
    {
        if (input[i] != '`')
        {
            ++i;
            continue;
        }
        std::size_t closeStart = i;
        while (i < input.size() && input[i] == '`')
            ++i;
        if (i - closeStart == openLength)
        {
            std::string value = codeSpanContent(input.substr(start + openLength, closeStart - start - openLength));
            pushNode(InlineNode{CodeSpan{std::move(value), locationOf(start, i)}});
            pos = i;
            return;
        }
    }

    // Unclosed: the whole opening run is literal.
    pushText(std::string(openLength, '`'), start, start + openLength);
    pos = start + openLength;
}

void InlineParser::parseBackslash()
{
    if (pos + 1 < input.size() && isAsciiPunctuation(input[pos + 1]))
    {
        pushText(std::string(1, input[pos + 1]), pos, pos + 2);
        pos += 2;
        return;
    }
    literalBackslashAt = pos;
    pushText("\\", pos, pos + 1);
    ++pos;
}

void InlineParser::parseText()
{
    std::size_t start = pos;
    while (pos < input.size() && !isSpecialCharacter(input[pos]))
        ++pos;
    pushText(std::string(input.substr(start, pos - start)), start, pos);
}

bool InlineParser::tryParseLink()
{
    const std::size_t open = pos;
    const std::size_t close = findBracketClose(open);
    if (close == std::string_view::npos)
        return false;

    std::string_view text = input.substr(open + 1, close - open - 1);
    const std::size_t after = close + 1;

    if (after < input.size() && input[after] == '(')
    {
        if (auto tail = parseInlineLinkTail(after))
        {
            pushNode(makeLink(open, close, tail->end + 1, std::move(tail->destination), std::move(tail->title)));
            pos = tail->end + 1;
            return true;
        }
    }

    if (after < input.size() && input[after] == '[')
    {
        std::size_t labelClose = findBracketClose(after);
        if (labelClose != std::string_view::npos)
        {
            std::string_view label = input.substr(after + 1, labelClose - after - 1);
            const LinkReference *reference = nullptr;
            if (trimmed(label).empty())
                reference = references.find(text);
            else
                reference = references.find(label);
            if (reference)
            {
                pushNode(makeLink(open, close, labelClose + 1, reference->destination, reference->title));
                pos = labelClose + 1;
                return true;
            }
        }
    }

    if (const LinkReference *reference = references.find(text))
    {
        pushNode(makeLink(open, close, after, reference->destination, reference->title));
        pos = after;
        return true;
    }
    return false;
}

std::size_t InlineParser::findBracketClose(std::size_t open) const
{
    int bracketDepth = 1;
    std::size_t i = open + 1;
    while (i < input.size())
    {
        char ch = input[i];
        if (ch == '\\')
        {
            i += 2;
            continue;
        }
        if (ch == '[')
            ++bracketDepth;
        else if (ch == ']' && --bracketDepth == 0)
            return i;
        ++i;
    }
    return std::string_view::npos;
}

std::optional<InlineParser::LinkTail> InlineParser::parseInlineLinkTail(std::size_t open) const
{
    std::size_t i = skipWhitespace(open + 1);
    if (i >= input.size())
        return std::nullopt;

    LinkTail tail;
    if (input[i] == ')')
    {
        tail.end = i;
        return tail;
    }

    auto destination = scanLinkDestination(input.substr(i));
    if (!destination)
        return std::nullopt;
    tail.destination = std::move(destination->destination);
    i += destination->consumed;

    std::size_t afterSpace = skipWhitespace(i);
    if (afterSpace > i && afterSpace < input.size() &&
        (input[afterSpace] == '"' || input[afterSpace] == '\'' || input[afterSpace] == '('))
    {
        auto title = scanLinkTitle(input.substr(afterSpace));
        if (!title)
            return std::nullopt;
        tail.title = std::move(title->title);
        afterSpace = skipWhitespace(afterSpace + title->consumed);
    }

    if (afterSpace >= input.size() || input[afterSpace] != ')')
        return std::nullopt;
    tail.end = afterSpace;
    return tail;
}

std::size_t InlineParser::skipWhitespace(std::size_t index) const
{
    while (index < input.size() && isLinkWhitespace(input[index]))
        ++index;
    return index;
}

InlineNode InlineParser::makeLink(std::size_t textOpen, std::size_t textClose, std::size_t end,
                                  std::string destination, std::optional<std::string> title) const
{
    Link link;
    link.destination = std::move(destination);
    link.title = std::move(title);
    link.children = parseInlines(input.substr(textOpen + 1, textClose - textOpen - 1), positionAt(textOpen + 1),
                                 references, options, depth + 1);
    link.location = locationOf(textOpen, end);
    return InlineNode{std::move(link)};
}

} // namespace mt::markdown
