#pragma once

#include "mt/markdown/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mt::markdown
{

// Trims, collapses internal whitespace runs to one space and case-folds
// (ASCII) so that "  Foo\t BAR " and "foo bar" name the same reference.
std::string normalizeLabel(std::string_view label);

class ReferenceMap
{
public:
    // Returns false (and keeps the existing entry) if the label is taken.
    bool define(LinkReference reference);

    const LinkReference *find(std::string_view label) const;
    std::size_t size() const noexcept { return entries.size(); }
    bool empty() const noexcept { return entries.empty(); }

private:
    std::unordered_map<std::string, LinkReference> entries;
};

struct ScannedDestination
{
    std::string destination;
    std::size_t consumed = 0;
};

struct ScannedTitle
{
    std::string title;
    std::size_t consumed = 0;
};

// `<...>` or a non-blank run with balanced parentheses. Backslash escapes are
// resolved in the returned destination.
std::optional<ScannedDestination> scanLinkDestination(std::string_view input);

// "title", 'title' or (title), with backslash escapes.
std::optional<ScannedTitle> scanLinkTitle(std::string_view input);

} // namespace mt::markdown
