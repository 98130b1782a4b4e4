#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mt::markdown
{

inline bool isSpaceOrTab(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

inline bool isAsciiPunctuation(char ch) noexcept
{
    return (ch >= '!' && ch <= '/') || (ch >= ':' && ch <= '@') || (ch >= '[' && ch <= '`') ||
           (ch >= '{' && ch <= '~');
}

inline bool isAsciiDigit(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

// Code point helpers for the flanking rules. Malformed UTF-8 decodes as the
// raw byte value.
char32_t codePointBefore(std::string_view text, std::size_t index) noexcept;
char32_t codePointAt(std::string_view text, std::size_t index) noexcept;

bool isUnicodeWhitespace(char32_t cp) noexcept;
bool isUnicodePunctuation(char32_t cp) noexcept;

std::size_t leadingSpaces(std::string_view line) noexcept;
std::string_view trimmed(std::string_view view) noexcept;
std::string_view trimmedRight(std::string_view view) noexcept;

} // namespace mt::markdown
