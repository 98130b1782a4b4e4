#include "mt/markdown/references.hpp"

#include "mt/markdown/text_utils.hpp"

#include <cctype>

namespace mt::markdown
{
namespace
{

bool isLabelWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

} // namespace

std::string normalizeLabel(std::string_view label)
{
    std::string result;
    result.reserve(label.size());
    bool pendingSpace = false;
    for (char ch : label)
    {
        if (isLabelWhitespace(ch))
        {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace)
        {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return result;
}

bool ReferenceMap::define(LinkReference reference)
{
    std::string key = normalizeLabel(reference.label);
    if (key.empty())
        return false;
    return entries.emplace(std::move(key), std::move(reference)).second;
}

const LinkReference *ReferenceMap::find(std::string_view label) const
{
    auto it = entries.find(normalizeLabel(label));
    if (it == entries.end())
        return nullptr;
    return &it->second;
}

std::optional<ScannedDestination> scanLinkDestination(std::string_view input)
{
    ScannedDestination result;
    if (!input.empty() && input.front() == '<')
    {
        std::size_t i = 1;
        while (i < input.size() && input[i] != '>')
        {
            char ch = input[i];
            if (ch == '<' || ch == '\n')
                return std::nullopt;
            if (ch == '\\' && i + 1 < input.size() && isAsciiPunctuation(input[i + 1]))
            {
                result.destination.push_back(input[i + 1]);
                i += 2;
                continue;
            }
            result.destination.push_back(ch);
            ++i;
        }
        if (i >= input.size())
            return std::nullopt;
        result.consumed = i + 1;
        return result;
    }

    std::size_t i = 0;
    int parenDepth = 0;
    while (i < input.size())
    {
        char ch = input[i];
        if (ch == ' ' || ch == '\t' || ch == '\n' || static_cast<unsigned char>(ch) < 0x20)
            break;
        if (ch == '\\' && i + 1 < input.size() && isAsciiPunctuation(input[i + 1]))
        {
            result.destination.push_back(input[i + 1]);
            i += 2;
            continue;
        }
        if (ch == '(')
        {
            ++parenDepth;
        }
        else if (ch == ')')
        {
            if (parenDepth == 0)
                break;
            --parenDepth;
        }
        result.destination.push_back(ch);
        ++i;
    }
    if (i == 0 || parenDepth != 0)
        return std::nullopt;
    result.consumed = i;
    return result;
}

std::optional<ScannedTitle> scanLinkTitle(std::string_view input)
{
    if (input.empty())
        return std::nullopt;

    char open = input.front();
    char close = 0;
    if (open == '"' || open == '\'')
        close = open;
    else if (open == '(')
        close = ')';
    else
        return std::nullopt;

    ScannedTitle result;
    std::size_t i = 1;
    while (i < input.size())
    {
        char ch = input[i];
        if (ch == '\\' && i + 1 < input.size() && isAsciiPunctuation(input[i + 1]))
        {
            result.title.push_back(input[i + 1]);
            i += 2;
            continue;
        }
        if (ch == close)
        {
            result.consumed = i + 1;
            return result;
        }
        if (open == '(' && ch == '(')
            return std::nullopt;
        result.title.push_back(ch);
        ++i;
    }
    return std::nullopt;
}

} // namespace mt::markdown
