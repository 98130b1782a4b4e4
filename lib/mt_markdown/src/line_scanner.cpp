#include "mt/markdown/line_scanner.hpp"

namespace mt::markdown
{

std::vector<SourceLine> splitLines(std::string_view input)
{
    std::vector<SourceLine> lines;
    std::size_t offset = 0;
    std::size_t lineNumber = 1;
    while (offset < input.size())
    {
        std::size_t end = input.find('\n', offset);
        SourceLine line;
        line.lineNumber = lineNumber++;
        line.offset = offset;
        if (end == std::string_view::npos)
        {
            line.raw = std::string(input.substr(offset));
            offset = input.size();
        }
        else
        {
            line.raw = std::string(input.substr(offset, end - offset));
            line.hasNewline = true;
            offset = end + 1;
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace mt::markdown
