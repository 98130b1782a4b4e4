#include "outline.hpp"

#include "mt/markdown/locator.hpp"

#include <sstream>

namespace mt::dump
{
namespace
{

using namespace mt::markdown;

constexpr std::size_t kSummaryLimit = 48;

void appendPlainText(std::string &out, const std::vector<InlineNode> &nodes)
{
    for (const InlineNode &node : nodes)
    {
        if (const auto *text = node.as<Text>())
            out += text->value;
        else if (const auto *code = node.as<CodeSpan>())
            out += code->value;
        else if (node.kind() == InlineKind::SoftBreak || node.kind() == InlineKind::HardBreak)
            out.push_back(' ');
        else if (const auto *children = node.children())
            appendPlainText(out, *children);
    }
}

std::string quoted(std::string text)
{
    if (text.size() > kSummaryLimit)
    {
        text.resize(kSummaryLimit);
        text += "...";
    }
    std::string out = "\"";
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        if (ch == '\n')
        {
            out += "\\n";
            continue;
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void writeLocation(std::ostream &out, const SourceLocation &location)
{
    out << location.start.line << ':' << location.start.column << '-' << location.end.line << ':'
        << location.end.column;
}

void writeSummary(std::ostream &out, const LocatedBlock &located)
{
    if (located.item)
    {
        out << " marker=" << quoted(located.item->marker);
        return;
    }

    const BlockNode &block = *located.block;
    switch (block.kind())
    {
    case BlockKind::Heading:
        out << " level=" << block.as<Heading>()->level << ' ' << quoted(plainText(block.as<Heading>()->children));
        break;
    case BlockKind::Paragraph:
        out << ' ' << quoted(plainText(block.as<Paragraph>()->children));
        break;
    case BlockKind::List:
    {
        const auto &list = *block.as<List>();
        out << (list.ordered ? " ordered start=" + std::to_string(list.start) : std::string(" bullet"))
            << (list.tight ? " tight" : " loose") << " items=" << list.children.size();
        break;
    }
    case BlockKind::CodeBlock:
    {
        const auto &code = *block.as<CodeBlock>();
        if (!code.info.empty())
            out << " info=" << quoted(code.info);
        out << " bytes=" << code.value.size();
        break;
    }
    case BlockKind::BlockQuote:
        out << " children=" << block.as<BlockQuote>()->children.size();
        break;
    case BlockKind::ListItem:
    case BlockKind::BlankLine:
    case BlockKind::ThematicBreak:
        break;
    }
}

} // namespace

std::string plainText(const std::vector<InlineNode> &nodes)
{
    std::string out;
    appendPlainText(out, nodes);
    return out;
}

std::string formatOutline(const Document &document, bool documentOffsets)
{
    std::ostringstream out;
    out << "document ";
    writeLocation(out, document.location);
    out << '\n';

    forEachBlock(document, [&](const LocatedBlock &located) {
        std::size_t level = 1 + located.depth * 2 + (located.item ? 1 : 0);
        out << std::string(level * 2, ' ') << blockTypeName(located.kind) << ' ';
        if (documentOffsets)
            writeLocation(out, located.documentLocation);
        else
            writeLocation(out, located.item ? located.item->location : located.block->location());
        writeSummary(out, located);
        out << '\n';
    });
    return out.str();
}

} // namespace mt::dump
