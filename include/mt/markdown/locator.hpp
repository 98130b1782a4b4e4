#pragma once

#include "mt/markdown/ast.hpp"

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

namespace mt::markdown
{

// Content maps of the enclosing containers, outermost first.
using ContainerChain = std::vector<const ContentMap *>;

Position toDocumentPosition(const Position &position, const ContainerChain &chain) noexcept;
SourceLocation toDocumentLocation(const SourceLocation &location, const ContainerChain &chain) noexcept;

struct LocatedBlock
{
    BlockKind kind = BlockKind::Paragraph;
    // Exactly one of these is set; list items are not BlockNodes.
    const BlockNode *block = nullptr;
    const ListItem *item = nullptr;
    SourceLocation documentLocation;
    std::size_t depth = 0;
    const ContainerChain *chain = nullptr;
};

using BlockVisitor = std::function<void(const LocatedBlock &)>;

// Pre-order walk over every block, list items included, with locations
// translated to document space.
void forEachBlock(const Document &document, const BlockVisitor &visitor);

// Slice of the original document covered by a document-space location.
std::string_view sourceSlice(std::string_view document, const SourceLocation &documentLocation) noexcept;

} // namespace mt::markdown
