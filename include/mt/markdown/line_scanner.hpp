#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mt::markdown
{

struct SourceLine
{
    std::string raw;
    std::size_t lineNumber = 1;
    std::size_t offset = 0;
    bool hasNewline = false;
};

// Splits on '\n' only. A final unterminated line is kept; the empty segment
// after a trailing '\n' is not a line.
std::vector<SourceLine> splitLines(std::string_view input);

} // namespace mt::markdown
