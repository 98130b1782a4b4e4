#include "mt/markdown/ast.hpp"

#include <algorithm>

namespace mt::markdown
{

void ContentMap::addLine(std::size_t strippedOffset, Position parent, std::size_t removed)
{
    entries.push_back(StrippedLine{strippedOffset, parent, removed});
}

Position ContentMap::toParent(const Position &position) const noexcept
{
    if (entries.empty())
        return position;

    std::size_t index = position.line > 0 ? position.line - 1 : 0;
    index = std::min(index, entries.size() - 1);
    const StrippedLine &entry = entries[index];

    Position mapped = entry.parent;
    mapped.column += position.column > 0 ? position.column - 1 : 0;
    if (position.offset >= entry.strippedOffset)
        mapped.offset += position.offset - entry.strippedOffset;
    return mapped;
}

SourceLocation ContentMap::toParent(const SourceLocation &location) const noexcept
{
    return SourceLocation{toParent(location.start), toParent(location.end)};
}

const SourceLocation &InlineNode::location() const noexcept
{
    return std::visit([](const auto &node) -> const SourceLocation & { return node.location; }, value);
}

SourceLocation &InlineNode::location() noexcept
{
    return std::visit([](auto &node) -> SourceLocation & { return node.location; }, value);
}

const std::vector<InlineNode> *InlineNode::children() const noexcept
{
    if (auto *emphasis = std::get_if<Emphasis>(&value))
        return &emphasis->children;
    if (auto *strong = std::get_if<Strong>(&value))
        return &strong->children;
    if (auto *link = std::get_if<Link>(&value))
        return &link->children;
    return nullptr;
}

const SourceLocation &BlockNode::location() const noexcept
{
    return std::visit([](const auto &node) -> const SourceLocation & { return node.location; }, value);
}

SourceLocation &BlockNode::location() noexcept
{
    return std::visit([](auto &node) -> SourceLocation & { return node.location; }, value);
}

std::string_view blockTypeName(BlockKind kind) noexcept
{
    switch (kind)
    {
    case BlockKind::Heading:
        return "heading";
    case BlockKind::Paragraph:
        return "paragraph";
    case BlockKind::BlankLine:
        return "blank_line";
    case BlockKind::List:
        return "list";
    case BlockKind::ListItem:
        return "list_item";
    case BlockKind::ThematicBreak:
        return "thematic_break";
    case BlockKind::CodeBlock:
        return "code_block";
    case BlockKind::BlockQuote:
        return "block_quote";
    }
    return "unknown";
}

std::string_view inlineTypeName(InlineKind kind) noexcept
{
    switch (kind)
    {
    case InlineKind::Text:
        return "text";
    case InlineKind::Emphasis:
        return "emphasis";
    case InlineKind::Strong:
        return "strong";
    case InlineKind::Link:
        return "link";
    case InlineKind::SoftBreak:
        return "softbreak";
    case InlineKind::HardBreak:
        return "hardbreak";
    case InlineKind::CodeSpan:
        return "code_span";
    }
    return "unknown";
}

} // namespace mt::markdown
