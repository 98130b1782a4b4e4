#pragma once

#include "mt/markdown/ast.hpp"
#include "mt/markdown/delimiter_resolver.hpp"
#include "mt/markdown/parse_error.hpp"
#include "mt/markdown/references.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mt::markdown
{

// Parses one leaf block's raw inline source. `base` is the position of
// raw[0] in the block's coordinate space; later lines start at column 1.
std::vector<InlineNode> parseInlines(std::string_view raw, const Position &base, const ReferenceMap &references,
                                     const ParserOptions &options = {}, std::size_t depth = 0);

// Merges neighbouring Text nodes, recursing into emphasis and strong.
void mergeAdjacentText(std::vector<InlineNode> &nodes);

class InlineParser
{
public:
    InlineParser(std::string_view input, const Position &base, const ReferenceMap &references,
                 const ParserOptions &options, std::size_t depth);

    std::vector<InlineNode> parse();

private:
    struct LinkTail
    {
        std::string destination;
        std::optional<std::string> title;
        std::size_t end = 0;
    };

    Position positionAt(std::size_t index) const;
    SourceLocation locationOf(std::size_t start, std::size_t end) const;

    void pushNode(InlineNode node);
    void pushText(std::string value, std::size_t start, std::size_t end);
    void trimLastText(std::size_t count);

    void parseLineEnding();
    void parseDelimiterRun();
    void parseCodeSpan();
    void parseBackslash();
    void parseText();
    bool tryParseLink();

    std::size_t findBracketClose(std::size_t open) const;
    std::optional<LinkTail> parseInlineLinkTail(std::size_t open) const;
    std::size_t skipWhitespace(std::size_t index) const;
    InlineNode makeLink(std::size_t textOpen, std::size_t textClose, std::size_t end, std::string destination,
                        std::optional<std::string> title) const;

    std::string_view input;
    Position base;
    const ReferenceMap &references;
    const ParserOptions &options;
    std::size_t depth;

    std::vector<std::size_t> lineStarts;
    InlineSlots slots;
    std::vector<Delimiter> delimiters;
    std::size_t pos = 0;
    std::size_t literalBackslashAt = std::string_view::npos;
};

} // namespace mt::markdown
