#pragma once

#include "mt/markdown/ast.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace mt::markdown
{

// Inline nodes under construction. Slots are never removed or shifted; a
// consumed slot is reset to std::nullopt so delimiter slot indices stay valid.
using InlineSlots = std::vector<std::optional<InlineNode>>;

struct Delimiter
{
    char type = '*';
    std::size_t count = 0;
    std::size_t origCount = 0;
    bool canOpen = false;
    bool canClose = false;
    // Original capability, before a failed closer is demoted to opener-only.
    bool opensAndCloses = false;
    bool active = true;
    std::size_t slot = 0;
};

struct Flanking
{
    bool canOpen = false;
    bool canClose = false;
};

// Flanking classification of the run text[start, start + length).
Flanking classifyDelimiterRun(std::string_view text, std::size_t start, std::size_t length, char delimiter) noexcept;

Delimiter makeDelimiter(std::string_view text, std::size_t start, std::size_t length, std::size_t slot);

// Pairs openers with closers and wraps the slots in between into Emphasis or
// Strong nodes. Throws ParseError(MalformedDelimiterState) if the loop does
// not settle within its bound.
void resolveDelimiters(InlineSlots &slots, std::vector<Delimiter> &delimiters);

} // namespace mt::markdown
