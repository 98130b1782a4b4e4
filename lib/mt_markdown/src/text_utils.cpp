#include "mt/markdown/text_utils.hpp"

namespace mt::markdown
{
namespace
{

bool isContinuationByte(unsigned char byte) noexcept
{
    return (byte & 0xC0) == 0x80;
}

char32_t decodeAt(std::string_view text, std::size_t index) noexcept
{
    auto lead = static_cast<unsigned char>(text[index]);
    std::size_t length = 0;
    char32_t cp = 0;
    if (lead < 0x80)
        return lead;
    if ((lead & 0xE0) == 0xC0)
    {
        length = 2;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        length = 3;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        length = 4;
        cp = lead & 0x07;
    }
    else
    {
        return lead;
    }
    if (index + length > text.size())
        return lead;
    for (std::size_t i = 1; i < length; ++i)
    {
        auto byte = static_cast<unsigned char>(text[index + i]);
        if (!isContinuationByte(byte))
            return lead;
        cp = (cp << 6) | (byte & 0x3F);
    }
    return cp;
}

} // namespace

char32_t codePointBefore(std::string_view text, std::size_t index) noexcept
{
    if (index == 0 || index > text.size())
        return U'\n';
    std::size_t start = index - 1;
    std::size_t steps = 0;
    while (start > 0 && steps < 3 && isContinuationByte(static_cast<unsigned char>(text[start])))
    {
        --start;
        ++steps;
    }
    return decodeAt(text, start);
}

char32_t codePointAt(std::string_view text, std::size_t index) noexcept
{
    if (index >= text.size())
        return U'\n';
    return decodeAt(text, index);
}

bool isUnicodeWhitespace(char32_t cp) noexcept
{
    switch (cp)
    {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\f':
    case U'\v':
    case 0x00A0:
    case 0x1680:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isUnicodePunctuation(char32_t cp) noexcept
{
    if (cp < 0x80)
        return isAsciiPunctuation(static_cast<char>(cp));
    return (cp >= 0x00A1 && cp <= 0x00BF) || cp == 0x00D7 || cp == 0x00F7 || (cp >= 0x2010 && cp <= 0x2027) ||
           (cp >= 0x2030 && cp <= 0x205E) || (cp >= 0x2308 && cp <= 0x2318) || (cp >= 0x3001 && cp <= 0x3003) ||
           (cp >= 0x3008 && cp <= 0x3011);
}

std::size_t leadingSpaces(std::string_view line) noexcept
{
    std::size_t count = 0;
    while (count < line.size() && line[count] == ' ')
        ++count;
    return count;
}

std::string_view trimmed(std::string_view view) noexcept
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && (isSpaceOrTab(view[start]) || view[start] == '\n' || view[start] == '\r'))
        ++start;
    while (end > start && (isSpaceOrTab(view[end - 1]) || view[end - 1] == '\n' || view[end - 1] == '\r'))
        --end;
    return view.substr(start, end - start);
}

std::string_view trimmedRight(std::string_view view) noexcept
{
    std::size_t end = view.size();
    while (end > 0 && isSpaceOrTab(view[end - 1]))
        --end;
    return view.substr(0, end);
}

} // namespace mt::markdown
