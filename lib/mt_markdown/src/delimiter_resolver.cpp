#include "mt/markdown/delimiter_resolver.hpp"

#include "mt/markdown/parse_error.hpp"
#include "mt/markdown/text_utils.hpp"
#include "mt/trace.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace mt::markdown
{
namespace
{

bool isLeftFlanking(char32_t before, char32_t after) noexcept
{
    if (isUnicodeWhitespace(after))
        return false;
    if (!isUnicodePunctuation(after))
        return true;
    return isUnicodeWhitespace(before) || isUnicodePunctuation(before);
}

bool isRightFlanking(char32_t before, char32_t after) noexcept
{
    if (isUnicodeWhitespace(before))
        return false;
    if (!isUnicodePunctuation(before))
        return true;
    return isUnicodeWhitespace(after) || isUnicodePunctuation(after);
}

bool multipleOfThreeForbids(const Delimiter &opener, const Delimiter &closer) noexcept
{
    if (!opener.opensAndCloses && !closer.opensAndCloses)
        return false;
    return (opener.origCount + closer.origCount) % 3 == 0 && opener.origCount % 3 != 0 &&
           closer.origCount % 3 != 0;
}

Text &delimiterText(InlineSlots &slots, const Delimiter &delimiter)
{
    auto &slot = slots[delimiter.slot];
    Text *text = slot ? slot->as<Text>() : nullptr;
    if (!text)
        throw ParseError(ParseErrorKind::MalformedDelimiterState,
                         "delimiter slot " + std::to_string(delimiter.slot) + " no longer holds its text run");
    return *text;
}

void wrapBetween(InlineSlots &slots, const Delimiter &opener, const Delimiter &closer, std::size_t used)
{
    if (opener.slot + 1 >= closer.slot || closer.slot >= slots.size())
        throw ParseError(ParseErrorKind::MalformedDelimiterState, "opener and closer slots are not ordered");

    Text &openText = delimiterText(slots, opener);
    Text &closeText = delimiterText(slots, closer);

    SourceLocation location;
    location.start = openText.location.end;
    location.start.column -= used;
    location.start.offset -= used;
    location.end = closeText.location.start;
    location.end.column += used;
    location.end.offset += used;

    std::vector<InlineNode> children;
    for (std::size_t s = opener.slot + 1; s < closer.slot; ++s)
    {
        if (slots[s])
        {
            children.push_back(std::move(*slots[s]));
            slots[s].reset();
        }
    }

    if (used == 2)
        slots[opener.slot + 1] = InlineNode{Strong{std::move(children), location}};
    else
        slots[opener.slot + 1] = InlineNode{Emphasis{std::move(children), location}};

    openText.value.resize(openText.value.size() - used);
    openText.location.end = location.start;
    if (openText.value.empty())
        slots[opener.slot].reset();

    closeText.value.erase(0, used);
    closeText.location.start = location.end;
    if (closeText.value.empty())
        slots[closer.slot].reset();
}

} // namespace

Flanking classifyDelimiterRun(std::string_view text, std::size_t start, std::size_t length, char delimiter) noexcept
{
    char32_t before = codePointBefore(text, start);
    char32_t after = codePointAt(text, start + length);

    bool left = isLeftFlanking(before, after);
    bool right = isRightFlanking(before, after);

    if (delimiter == '*')
        return Flanking{left, right};
    return Flanking{left && (!right || isUnicodePunctuation(before)), right && (!left || isUnicodePunctuation(after))};
}

Delimiter makeDelimiter(std::string_view text, std::size_t start, std::size_t length, std::size_t slot)
{
    Flanking flanking = classifyDelimiterRun(text, start, length, text[start]);
    Delimiter delimiter;
    delimiter.type = text[start];
    delimiter.count = length;
    delimiter.origCount = length;
    delimiter.canOpen = flanking.canOpen;
    delimiter.canClose = flanking.canClose;
    delimiter.opensAndCloses = flanking.canOpen && flanking.canClose;
    delimiter.slot = slot;
    return delimiter;
}

void resolveDelimiters(InlineSlots &slots, std::vector<Delimiter> &delimiters)
{
    if (delimiters.empty())
        return;

    // Every round either demotes a closer or consumes at least one character.
    std::size_t bound = delimiters.size() + 1;
    for (const Delimiter &delimiter : delimiters)
        bound += delimiter.origCount;

    for (std::size_t round = 0;; ++round)
    {
        if (round > bound)
            throw ParseError(ParseErrorKind::MalformedDelimiterState,
                             "delimiter resolution did not settle after " + std::to_string(bound) + " rounds");

        std::size_t closerIndex = delimiters.size();
        for (std::size_t i = 0; i < delimiters.size(); ++i)
        {
            const Delimiter &candidate = delimiters[i];
            if (candidate.active && candidate.canClose && candidate.count > 0)
            {
                closerIndex = i;
                break;
            }
        }
        if (closerIndex == delimiters.size())
            return;

        Delimiter &closer = delimiters[closerIndex];

        std::size_t openerIndex = closerIndex;
        for (std::size_t j = closerIndex; j-- > 0;)
        {
            const Delimiter &candidate = delimiters[j];
            if (!candidate.active || !candidate.canOpen || candidate.count == 0 || candidate.type != closer.type)
                continue;
            if (multipleOfThreeForbids(candidate, closer))
                continue;
            openerIndex = j;
            break;
        }

        if (openerIndex == closerIndex)
        {
            closer.canClose = false;
            continue;
        }

        Delimiter &opener = delimiters[openerIndex];
        std::size_t used = opener.count >= 2 && closer.count >= 2 ? 2 : 1;

        if (diag::traceEnabled())
        {
            std::ostringstream message;
            message << "[marktree][emphasis] opener=" << openerIndex << " closer=" << closerIndex
                    << " type=" << closer.type << " used=" << used;
            diag::traceLine(message.str());
        }

        wrapBetween(slots, opener, closer, used);

        for (std::size_t k = openerIndex + 1; k < closerIndex; ++k)
            delimiters[k].active = false;

        opener.count -= used;
        closer.count -= used;
        if (opener.count == 0)
            opener.active = false;
        if (closer.count == 0)
            closer.active = false;
    }
}

} // namespace mt::markdown
