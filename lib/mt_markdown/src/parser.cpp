#include "mt/markdown/parser.hpp"

#include "mt/markdown/block_parser.hpp"
#include "mt/markdown/inline_parser.hpp"

#include <string>

namespace mt::markdown
{
namespace
{

void processInlines(std::vector<BlockNode> &blocks, const ReferenceMap &references, const ParserOptions &options)
{
    for (BlockNode &block : blocks)
    {
        switch (block.kind())
        {
        case BlockKind::Heading:
        {
            auto &heading = std::get<Heading>(block.value);
            heading.children = parseInlines(heading.rawContent, heading.contentStart, references, options);
            break;
        }
        case BlockKind::Paragraph:
        {
            auto &paragraph = std::get<Paragraph>(block.value);
            paragraph.children = parseInlines(paragraph.rawContent, paragraph.location.start, references, options);
            break;
        }
        case BlockKind::List:
            for (ListItem &item : std::get<List>(block.value).children)
                processInlines(item.children, references, options);
            break;
        case BlockKind::ListItem:
            processInlines(std::get<ListItem>(block.value).children, references, options);
            break;
        case BlockKind::BlockQuote:
            processInlines(std::get<BlockQuote>(block.value).children, references, options);
            break;
        case BlockKind::BlankLine:
        case BlockKind::ThematicBreak:
        case BlockKind::CodeBlock:
            break;
        }
    }
}

} // namespace

Document parse(std::string_view input, const ParserOptions &options)
{
    BlockParseResult blocks = parseBlocks(input, options);
    processInlines(blocks.document.children, blocks.references, options);
    return std::move(blocks.document);
}

} // namespace mt::markdown
