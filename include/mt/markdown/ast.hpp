#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mt::markdown
{

struct Position
{
    std::size_t line = 1;
    std::size_t column = 1;
    std::size_t offset = 0;

    bool operator==(const Position &other) const noexcept
    {
        return line == other.line && column == other.column && offset == other.offset;
    }
    bool operator!=(const Position &other) const noexcept { return !(*this == other); }
};

struct SourceLocation
{
    Position start;
    Position end;

    bool operator==(const SourceLocation &other) const noexcept
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const SourceLocation &other) const noexcept { return !(*this == other); }
};

// One line of a container's stripped sub-text. `strippedOffset` is where the
// line starts in the container's content space; `parent` is where the same
// text starts in the space the container itself lives in (after the removed
// prefix). `removed` is the number of prefix bytes that were stripped.
struct StrippedLine
{
    std::size_t strippedOffset = 0;
    Position parent;
    std::size_t removed = 0;
};

class ContentMap
{
public:
    ContentMap() = default;

    void addLine(std::size_t strippedOffset, Position parent, std::size_t removed);

    const std::vector<StrippedLine> &lines() const noexcept { return entries; }
    bool empty() const noexcept { return entries.empty(); }

    Position toParent(const Position &position) const noexcept;
    SourceLocation toParent(const SourceLocation &location) const noexcept;

private:
    std::vector<StrippedLine> entries;
};

// --- Inline nodes ---

struct InlineNode;

enum class InlineKind
{
    Text,
    Emphasis,
    Strong,
    Link,
    SoftBreak,
    HardBreak,
    CodeSpan
};

struct Text
{
    std::string value;
    SourceLocation location;
};

struct Emphasis
{
    std::vector<InlineNode> children;
    SourceLocation location;
};

struct Strong
{
    std::vector<InlineNode> children;
    SourceLocation location;
};

struct Link
{
    std::string destination;
    std::optional<std::string> title;
    std::vector<InlineNode> children;
    SourceLocation location;
};

struct SoftBreak
{
    SourceLocation location;
};

struct HardBreak
{
    SourceLocation location;
};

struct CodeSpan
{
    std::string value;
    SourceLocation location;
};

struct InlineNode
{
    using Value = std::variant<Text, Emphasis, Strong, Link, SoftBreak, HardBreak, CodeSpan>;

    Value value;

    InlineKind kind() const noexcept { return static_cast<InlineKind>(value.index()); }
    const SourceLocation &location() const noexcept;
    SourceLocation &location() noexcept;

    template <typename T>
    const T *as() const noexcept
    {
        return std::get_if<T>(&value);
    }

    template <typename T>
    T *as() noexcept
    {
        return std::get_if<T>(&value);
    }

    const std::vector<InlineNode> *children() const noexcept;
};

// --- Block nodes ---

struct BlockNode;

enum class BlockKind
{
    Heading,
    Paragraph,
    BlankLine,
    List,
    ListItem,
    ThematicBreak,
    CodeBlock,
    BlockQuote
};

struct Heading
{
    int level = 1;
    std::vector<InlineNode> children;
    SourceLocation location;
    // Raw inline source and where it starts; children are parsed from it.
    std::string rawContent;
    Position contentStart;
};

struct Paragraph
{
    std::vector<InlineNode> children;
    SourceLocation location;
    std::string rawContent;
};

struct BlankLine
{
    SourceLocation location;
};

struct ListItem
{
    std::string marker;
    std::vector<BlockNode> children;
    SourceLocation location;
    ContentMap contentMap;
};

struct List
{
    bool ordered = false;
    long start = 1;
    bool tight = true;
    std::vector<ListItem> children;
    SourceLocation location;
};

struct ThematicBreak
{
    SourceLocation location;
};

struct CodeBlock
{
    std::string info;
    std::string value;
    SourceLocation location;
};

struct BlockQuote
{
    std::vector<BlockNode> children;
    SourceLocation location;
    ContentMap contentMap;
};

struct BlockNode
{
    using Value = std::variant<Heading, Paragraph, BlankLine, List, ListItem, ThematicBreak, CodeBlock, BlockQuote>;

    Value value;

    BlockKind kind() const noexcept { return static_cast<BlockKind>(value.index()); }
    const SourceLocation &location() const noexcept;
    SourceLocation &location() noexcept;

    template <typename T>
    const T *as() const noexcept
    {
        return std::get_if<T>(&value);
    }

    template <typename T>
    T *as() noexcept
    {
        return std::get_if<T>(&value);
    }
};

struct Document
{
    std::vector<BlockNode> children;
    SourceLocation location;
};

struct LinkReference
{
    std::string label;
    std::string destination;
    std::optional<std::string> title;
};

std::string_view blockTypeName(BlockKind kind) noexcept;
std::string_view inlineTypeName(InlineKind kind) noexcept;

} // namespace mt::markdown
