#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mt::markdown
{

struct ParserOptions
{
    // Ceiling for container nesting (quotes, list items) and link-text nesting.
    std::size_t maxNestingDepth = 64;
};

enum class ParseErrorKind
{
    TooDeeplyNested,
    MalformedDelimiterState
};

class ParseError : public std::runtime_error
{
public:
    ParseError(ParseErrorKind kind, const std::string &message)
        : std::runtime_error(message),
          errorKind(kind)
    {
    }

    ParseErrorKind kind() const noexcept { return errorKind; }

private:
    ParseErrorKind errorKind;
};

} // namespace mt::markdown
