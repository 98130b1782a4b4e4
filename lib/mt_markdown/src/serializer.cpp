#include "mt/markdown/serializer.hpp"

#include "mt/markdown/block_classifiers.hpp"
#include "mt/markdown/text_utils.hpp"

#include <algorithm>
#include <string_view>

namespace mt::markdown
{
namespace
{

std::size_t longestRun(std::string_view text, char ch) noexcept
{
    std::size_t longest = 0;
    std::size_t current = 0;
    for (char c : text)
    {
        current = c == ch ? current + 1 : 0;
        longest = std::max(longest, current);
    }
    return longest;
}

std::vector<std::string> splitOnNewline(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true)
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            lines.emplace_back(text.substr(start));
            return lines;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
}

void appendEscapedText(std::string &out, std::string_view value)
{
    for (char ch : value)
    {
        if (ch == '\\' || ch == '`' || ch == '*' || ch == '_' || ch == '[' || ch == ']' || ch == '#')
            out.push_back('\\');
        out.push_back(ch);
    }
}

void appendCodeSpan(std::string &out, const std::string &value)
{
    std::string fence(longestRun(value, '`') + 1, '`');
    bool allSpaces = std::all_of(value.begin(), value.end(), [](char ch) { return ch == ' '; });
    bool pad = !value.empty() && (value.front() == '`' || value.back() == '`' ||
                                  (value.size() >= 2 && value.front() == ' ' && value.back() == ' ' && !allSpaces));
    out += fence;
    if (pad)
        out.push_back(' ');
    out += value;
    if (pad)
        out.push_back(' ');
    out += fence;
}

bool needsAngleDestination(const std::string &destination)
{
    if (destination.empty())
        return true;
    return std::any_of(destination.begin(), destination.end(), [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '<' || ch == '>' || ch == '(' || ch == ')' || ch == '\\' ||
               static_cast<unsigned char>(ch) < 0x20;
    });
}

void appendLink(std::string &out, const Link &link)
{
    out.push_back('[');
    out += inlinesToMarkdown(link.children);
    out += "](";
    if (!needsAngleDestination(link.destination))
    {
        out += link.destination;
    }
    else if (!link.destination.empty() || link.title)
    {
        out.push_back('<');
        for (char ch : link.destination)
        {
            if (ch == '<' || ch == '>' || ch == '\\')
                out.push_back('\\');
            out.push_back(ch);
        }
        out.push_back('>');
    }
    if (link.title)
    {
        out += " \"";
        for (char ch : *link.title)
        {
            if (ch == '"' || ch == '\\')
                out.push_back('\\');
            out.push_back(ch);
        }
        out.push_back('"');
    }
    out.push_back(')');
}

// Emphasis and strong alternate '*' and '_' at shared boundaries so that
// nested runs such as Strong(Emphasis) do not merge into one "***" run.
void appendInlines(std::string &out, const std::vector<InlineNode> &nodes, char parentDelimiter);

void appendWrapped(std::string &out, const std::vector<InlineNode> &children, std::size_t width, bool atBoundary,
                   char parentDelimiter)
{
    char delimiter = atBoundary && parentDelimiter == '*' ? '_' : '*';
    std::string run(width, delimiter);
    out += run;
    appendInlines(out, children, delimiter);
    out += run;
}

void appendInlines(std::string &out, const std::vector<InlineNode> &nodes, char parentDelimiter)
{
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        const InlineNode &node = nodes[i];
        bool atBoundary = parentDelimiter != 0 && (i == 0 || i + 1 == nodes.size());
        switch (node.kind())
        {
        case InlineKind::Text:
            appendEscapedText(out, node.as<Text>()->value);
            break;
        case InlineKind::Emphasis:
            appendWrapped(out, node.as<Emphasis>()->children, 1, atBoundary, parentDelimiter);
            break;
        case InlineKind::Strong:
            appendWrapped(out, node.as<Strong>()->children, 2, atBoundary, parentDelimiter);
            break;
        case InlineKind::Link:
            appendLink(out, *node.as<Link>());
            break;
        case InlineKind::SoftBreak:
            out.push_back('\n');
            break;
        case InlineKind::HardBreak:
            out += "\\\n";
            break;
        case InlineKind::CodeSpan:
            appendCodeSpan(out, node.as<CodeSpan>()->value);
            break;
        }
    }
}

// Escapes the start of a paragraph line that would otherwise open another
// construct ("- x", "> x", "1. x", "---", "[a]: b").
void protectLineStart(std::string &line)
{
    if (classifyLine(line) == LineKind::Paragraph && !matchLinkReferenceDefinition(line, nullptr))
        return;

    std::size_t k = leadingSpaces(line);
    if (k >= line.size())
        return;
    if (isAsciiDigit(line[k]))
    {
        while (k < line.size() && isAsciiDigit(line[k]))
            ++k;
        if (k < line.size())
            line.insert(k, 1, '\\');
        return;
    }
    if (isAsciiPunctuation(line[k]) && (k == 0 || line[k - 1] != '\\'))
        line.insert(k, 1, '\\');
}

void appendBlocks(std::vector<std::string> &lines, const std::vector<BlockNode> &blocks);

void appendPrefixed(std::vector<std::string> &lines, const std::vector<std::string> &content,
                    const std::string &firstPrefix, const std::string &restPrefix, const std::string &blankPrefix)
{
    for (std::size_t i = 0; i < content.size(); ++i)
    {
        const std::string &line = content[i];
        if (i == 0)
        {
            std::string first = firstPrefix;
            if (!line.empty())
                first += " " + line;
            lines.push_back(std::move(first));
        }
        else if (line.empty())
        {
            lines.push_back(blankPrefix);
        }
        else
        {
            lines.push_back(restPrefix + line);
        }
    }
    if (content.empty())
        lines.push_back(firstPrefix);
}

void appendCodeBlock(std::vector<std::string> &lines, const CodeBlock &code)
{
    char fenceChar = code.info.find('`') == std::string::npos ? '`' : '~';
    std::string fence(std::max<std::size_t>(3, longestRun(code.value, fenceChar) + 1), fenceChar);

    lines.push_back(fence + code.info);
    if (!code.value.empty())
    {
        std::string_view body = code.value;
        if (body.back() == '\n')
            body.remove_suffix(1);
        for (auto &line : splitOnNewline(body))
            lines.push_back(std::move(line));
    }
    lines.push_back(fence);
}

void appendBlocks(std::vector<std::string> &lines, const std::vector<BlockNode> &blocks)
{
    for (const BlockNode &block : blocks)
    {
        switch (block.kind())
        {
        case BlockKind::Heading:
        {
            const auto &heading = *block.as<Heading>();
            std::string line(static_cast<std::size_t>(heading.level), '#');
            std::string content = inlinesToMarkdown(heading.children);
            if (!content.empty())
                line += " " + content;
            lines.push_back(std::move(line));
            break;
        }
        case BlockKind::Paragraph:
            for (auto &line : splitOnNewline(inlinesToMarkdown(block.as<Paragraph>()->children)))
            {
                protectLineStart(line);
                lines.push_back(std::move(line));
            }
            break;
        case BlockKind::BlankLine:
            lines.emplace_back();
            break;
        case BlockKind::List:
            for (const ListItem &item : block.as<List>()->children)
            {
                std::vector<std::string> content;
                appendBlocks(content, item.children);
                appendPrefixed(lines, content, item.marker, std::string(item.marker.size() + 1, ' '), "");
            }
            break;
        case BlockKind::ListItem:
        {
            const auto &item = *block.as<ListItem>();
            std::vector<std::string> content;
            appendBlocks(content, item.children);
            appendPrefixed(lines, content, item.marker, std::string(item.marker.size() + 1, ' '), "");
            break;
        }
        case BlockKind::ThematicBreak:
            lines.emplace_back("---");
            break;
        case BlockKind::CodeBlock:
            appendCodeBlock(lines, *block.as<CodeBlock>());
            break;
        case BlockKind::BlockQuote:
        {
            std::vector<std::string> content;
            appendBlocks(content, block.as<BlockQuote>()->children);
            for (const auto &line : content)
                lines.push_back(line.empty() ? std::string(">") : "> " + line);
            if (content.empty())
                lines.emplace_back(">");
            break;
        }
        }
    }
}

} // namespace

std::string inlinesToMarkdown(const std::vector<InlineNode> &nodes)
{
    std::string out;
    appendInlines(out, nodes, 0);
    return out;
}

std::string toMarkdown(const Document &document)
{
    std::vector<std::string> lines;
    appendBlocks(lines, document.children);

    std::string out;
    for (const auto &line : lines)
    {
        out += line;
        out.push_back('\n');
    }
    return out;
}

} // namespace mt::markdown
