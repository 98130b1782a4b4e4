#pragma once

#include "mt/markdown/ast.hpp"
#include "mt/markdown/block_classifiers.hpp"
#include "mt/markdown/line_scanner.hpp"
#include "mt/markdown/parse_error.hpp"
#include "mt/markdown/references.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace mt::markdown
{

struct BlockParseResult
{
    Document document;
    ReferenceMap references;
};

// Phase 1: builds the block tree and harvests reference definitions.
// Heading and Paragraph nodes come back with rawContent set and no children.
BlockParseResult parseBlocks(std::string_view input, const ParserOptions &options = {});

class BlockParser
{
public:
    BlockParser(const ParserOptions &options, ReferenceMap &references, std::size_t depth = 0);

    // Parses a sequence of lines that share one coordinate space. Container
    // children are parsed by nested BlockParser instances over stripped lines.
    std::vector<BlockNode> parseLines(const std::vector<SourceLine> &lines);

    std::size_t depth() const noexcept { return nestingDepth; }

private:
    struct PendingItem
    {
        ListItemMatch match;
        std::vector<SourceLine> content;
        ContentMap contentMap;
        std::size_t firstLine = 0;
        std::size_t lastLine = 0;
        std::size_t nextIndex = 0;
    };

    std::optional<LinkReferenceMatch> referenceAt(const std::vector<SourceLine> &lines, std::size_t index) const;

    BlockNode parseHeading(const SourceLine &line, const AtxHeadingMatch &match) const;
    std::size_t parseParagraph(const std::vector<SourceLine> &lines, std::size_t start, std::vector<BlockNode> &out) const;
    std::size_t parseFencedCode(const std::vector<SourceLine> &lines, std::size_t start, const CodeFenceMatch &fence,
                                std::vector<BlockNode> &out) const;
    std::size_t parseBlockQuote(const std::vector<SourceLine> &lines, std::size_t start, std::vector<BlockNode> &out);
    std::size_t parseList(const std::vector<SourceLine> &lines, std::size_t start, const ListItemMatch &first,
                          std::vector<BlockNode> &out);

    PendingItem collectListItem(const std::vector<SourceLine> &lines, std::size_t start,
                                const ListItemMatch &match) const;
    ListItem finishListItem(const std::vector<SourceLine> &lines, PendingItem &pending);

    std::vector<BlockNode> parseNested(const std::vector<SourceLine> &content);
    void trace(const SourceLine &line, std::string_view construct) const;

    const ParserOptions &options;
    ReferenceMap &references;
    std::size_t nestingDepth;
};

} // namespace mt::markdown
