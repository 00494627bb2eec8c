#include "EmojiClassifier.hpp"
#include "EmojiTable.hpp"

namespace processing
{

namespace
{

bool isPictographic(char32_t cp) noexcept { return isPresentationEmoji(cp) || isTextDefaultEmoji(cp); }

// A text-default symbol is only an emoji when something after it asks for emoji presentation
bool qualifiesTextDefault(std::u32string_view text, std::size_t next) noexcept
{
    if (next >= text.size())
        return false;

    const char32_t cp = text[next];
    if (cp == VARIATION_SELECTOR_EMOJI || isEmojiModifier(cp))
        return true;

    return cp == ZERO_WIDTH_JOINER && next + 1 < text.size() && isPictographic(text[next + 1]);
}

// Consumes the marks that attach to a single emoji element
std::size_t extendElement(std::u32string_view text, std::size_t pos) noexcept
{
    while (pos < text.size())
    {
        const char32_t cp = text[pos];
        if (isVariationSelector(cp) || isEmojiModifier(cp) || cp == COMBINING_ENCLOSING_KEYCAP)
        {
            ++pos;
            continue;
        }
        // Subdivision flags carry their region as tag characters ending in CANCEL TAG
        if (isTagCharacter(cp))
        {
            ++pos;
            continue;
        }
        break;
    }
    return pos;
}

bool isKeycapSequence(std::u32string_view text, std::size_t offset) noexcept
{
    std::size_t pos = offset + 1;
    if (pos < text.size() && text[pos] == VARIATION_SELECTOR_EMOJI)
        ++pos;
    return pos < text.size() && text[pos] == COMBINING_ENCLOSING_KEYCAP;
}

// Length of the first element, before any attached marks
std::optional<std::size_t> matchBase(std::u32string_view text, std::size_t offset) noexcept
{
    const char32_t cp = text[offset];

    // ASCII only matters as a keycap base
    if (cp < 0x80)
    {
        if (isKeycapBase(cp) && isKeycapSequence(text, offset))
            return 1;
        return std::nullopt;
    }

    if (isRegionalIndicator(cp))
    {
        if (offset + 1 < text.size() && isRegionalIndicator(text[offset + 1]))
            return 2;
        return 1;
    }

    if (isEmojiModifier(cp))
        return std::nullopt;

    if (isPresentationEmoji(cp) || (isTextDefaultEmoji(cp) && qualifiesTextDefault(text, offset + 1)))
        return 1;

    return std::nullopt;
}

} // namespace

std::optional<std::size_t> classify(std::u32string_view text, std::size_t offset) noexcept
{
    if (offset >= text.size())
        return std::nullopt;

    auto base = matchBase(text, offset);
    if (!base)
        return std::nullopt;

    std::size_t end = extendElement(text, offset + *base);
    while (end + 1 < text.size() && text[end] == ZERO_WIDTH_JOINER && isPictographic(text[end + 1]))
    {
        end = extendElement(text, end + 2);
    }

    return end - offset;
}

std::vector<text_processing::CodepointSpan> scan(std::u32string_view text)
{
    std::vector<text_processing::CodepointSpan> spans;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (auto length = classify(text, pos))
        {
            text_processing::CodepointSpan span;
            span.start = pos;
            span.length = *length;
            spans.push_back(span);
            pos += *length;
        }
        else
        {
            ++pos;
        }
    }
    return spans;
}

} // namespace processing
