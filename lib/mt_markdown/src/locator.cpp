#include "mt/markdown/locator.hpp"

#include <algorithm>

namespace mt::markdown
{
namespace
{

void visitBlocks(const std::vector<BlockNode> &blocks, ContainerChain &chain, const BlockVisitor &visitor);

void visitItem(const ListItem &item, ContainerChain &chain, const BlockVisitor &visitor)
{
    LocatedBlock located;
    located.kind = BlockKind::ListItem;
    located.item = &item;
    located.documentLocation = toDocumentLocation(item.location, chain);
    located.depth = chain.size();
    located.chain = &chain;
    visitor(located);

    chain.push_back(&item.contentMap);
    visitBlocks(item.children, chain, visitor);
    chain.pop_back();
}

void visitBlocks(const std::vector<BlockNode> &blocks, ContainerChain &chain, const BlockVisitor &visitor)
{
    for (const BlockNode &block : blocks)
    {
        if (const auto *item = block.as<ListItem>())
        {
            visitItem(*item, chain, visitor);
            continue;
        }

        LocatedBlock located;
        located.kind = block.kind();
        located.block = &block;
        located.documentLocation = toDocumentLocation(block.location(), chain);
        located.depth = chain.size();
        located.chain = &chain;
        visitor(located);

        if (const auto *list = block.as<List>())
        {
            for (const ListItem &child : list->children)
                visitItem(child, chain, visitor);
        }
        else if (const auto *quote = block.as<BlockQuote>())
        {
            chain.push_back(&quote->contentMap);
            visitBlocks(quote->children, chain, visitor);
            chain.pop_back();
        }
    }
}

} // namespace

Position toDocumentPosition(const Position &position, const ContainerChain &chain) noexcept
{
    Position mapped = position;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        if (*it)
            mapped = (*it)->toParent(mapped);
    }
    return mapped;
}

SourceLocation toDocumentLocation(const SourceLocation &location, const ContainerChain &chain) noexcept
{
    return SourceLocation{toDocumentPosition(location.start, chain), toDocumentPosition(location.end, chain)};
}

void forEachBlock(const Document &document, const BlockVisitor &visitor)
{
    ContainerChain chain;
    visitBlocks(document.children, chain, visitor);
}

std::string_view sourceSlice(std::string_view document, const SourceLocation &documentLocation) noexcept
{
    std::size_t start = std::min(documentLocation.start.offset, document.size());
    std::size_t end = std::min(std::max(documentLocation.end.offset, start), document.size());
    return document.substr(start, end - start);
}

} // namespace mt::markdown
