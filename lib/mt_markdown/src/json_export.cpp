#include "mt/markdown/json_export.hpp"

#include "mt/markdown/locator.hpp"

#include <string>

namespace mt::markdown
{
namespace
{

class JsonWriter
{
public:
    explicit JsonWriter(const JsonExportOptions &options)
        : options(options)
    {
    }

    nlohmann::json blocks(const std::vector<BlockNode> &nodes)
    {
        nlohmann::json array = nlohmann::json::array();
        for (const BlockNode &node : nodes)
            array.push_back(block(node));
        return array;
    }

private:
    nlohmann::json location(const SourceLocation &local) const
    {
        if (!options.documentOffsets)
            return toJson(local);
        return toJson(toDocumentLocation(local, chain));
    }

    nlohmann::json node(std::string_view type, const SourceLocation &local) const
    {
        nlohmann::json object = nlohmann::json::object();
        object["type"] = std::string(type);
        object["location"] = location(local);
        return object;
    }

    nlohmann::json contained(const ContentMap &map, const std::vector<BlockNode> &children)
    {
        chain.push_back(&map);
        nlohmann::json array = blocks(children);
        chain.pop_back();
        return array;
    }

    nlohmann::json item(const ListItem &listItem)
    {
        nlohmann::json object = node(blockTypeName(BlockKind::ListItem), listItem.location);
        object["marker"] = listItem.marker;
        object["children"] = contained(listItem.contentMap, listItem.children);
        return object;
    }

    nlohmann::json block(const BlockNode &block)
    {
        nlohmann::json object = node(blockTypeName(block.kind()), block.location());
        switch (block.kind())
        {
        case BlockKind::Heading:
        {
            const auto &heading = *block.as<Heading>();
            object["level"] = heading.level;
            object["children"] = inlines(heading.children);
            break;
        }
        case BlockKind::Paragraph:
            object["children"] = inlines(block.as<Paragraph>()->children);
            break;
        case BlockKind::List:
        {
            const auto &list = *block.as<List>();
            object["ordered"] = list.ordered;
            if (list.ordered)
                object["start"] = list.start;
            object["tight"] = list.tight;
            nlohmann::json children = nlohmann::json::array();
            for (const ListItem &listItem : list.children)
                children.push_back(item(listItem));
            object["children"] = std::move(children);
            break;
        }
        case BlockKind::ListItem:
            return item(*block.as<ListItem>());
        case BlockKind::CodeBlock:
        {
            const auto &code = *block.as<CodeBlock>();
            object["info"] = code.info;
            object["value"] = code.value;
            break;
        }
        case BlockKind::BlockQuote:
        {
            const auto &quote = *block.as<BlockQuote>();
            object["children"] = contained(quote.contentMap, quote.children);
            break;
        }
        case BlockKind::BlankLine:
        case BlockKind::ThematicBreak:
            break;
        }
        return object;
    }

    nlohmann::json inlines(const std::vector<InlineNode> &nodes) const
    {
        nlohmann::json array = nlohmann::json::array();
        for (const InlineNode &child : nodes)
            array.push_back(inlineNode(child));
        return array;
    }

    nlohmann::json inlineNode(const InlineNode &inline_) const
    {
        nlohmann::json object = node(inlineTypeName(inline_.kind()), inline_.location());
        switch (inline_.kind())
        {
        case InlineKind::Text:
            object["value"] = inline_.as<Text>()->value;
            break;
        case InlineKind::CodeSpan:
            object["value"] = inline_.as<CodeSpan>()->value;
            break;
        case InlineKind::Link:
        {
            const auto &link = *inline_.as<Link>();
            object["destination"] = link.destination;
            object["title"] = link.title ? nlohmann::json(*link.title) : nlohmann::json();
            object["children"] = inlines(link.children);
            break;
        }
        case InlineKind::Emphasis:
        case InlineKind::Strong:
            object["children"] = inlines(*inline_.children());
            break;
        case InlineKind::SoftBreak:
        case InlineKind::HardBreak:
            break;
        }
        return object;
    }

    const JsonExportOptions &options;
    ContainerChain chain;
};

} // namespace

nlohmann::json toJson(const Position &position)
{
    return nlohmann::json{{"line", position.line}, {"column", position.column}, {"offset", position.offset}};
}

nlohmann::json toJson(const SourceLocation &location)
{
    return nlohmann::json{{"start", toJson(location.start)}, {"end", toJson(location.end)}};
}

nlohmann::json toJson(const Document &document, const JsonExportOptions &options)
{
    JsonWriter writer(options);
    nlohmann::json object = nlohmann::json::object();
    object["type"] = "document";
    object["location"] = toJson(document.location);
    object["children"] = writer.blocks(document.children);
    return object;
}

} // namespace mt::markdown
