#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace processing
{

/// Inclusive code point interval
struct CodepointRange
{
    char32_t first;
    char32_t last;
};

/// Unicode Emoji data release the tables below were transcribed from (emoji-data.txt)
constexpr std::string_view kEmojiDataVersion = "15.1";

constexpr char32_t ZERO_WIDTH_JOINER = U'\u200D';
constexpr char32_t VARIATION_SELECTOR_TEXT = U'\uFE0E';
constexpr char32_t VARIATION_SELECTOR_EMOJI = U'\uFE0F';
constexpr char32_t COMBINING_ENCLOSING_KEYCAP = U'\u20E3';
constexpr char32_t TAG_CANCEL = U'\U000E007F';

[[nodiscard]] std::string_view emojiTableVersion() noexcept;

/// Emoji_Presentation=Yes: rendered as emoji without a variation selector.
/// Skin-tone modifiers are excluded, they only count after a base.
[[nodiscard]] std::span<const CodepointRange> presentationRanges() noexcept;

/// Emoji=Yes, Emoji_Presentation=No, excluding keycap bases:
/// symbols that are emoji only as part of a qualified sequence.
[[nodiscard]] std::span<const CodepointRange> textDefaultRanges() noexcept;

[[nodiscard]] bool inRanges(std::span<const CodepointRange> ranges, char32_t cp) noexcept;

[[nodiscard]] bool isPresentationEmoji(char32_t cp) noexcept;
[[nodiscard]] bool isTextDefaultEmoji(char32_t cp) noexcept;
[[nodiscard]] bool isEmojiModifier(char32_t cp) noexcept;
[[nodiscard]] bool isRegionalIndicator(char32_t cp) noexcept;
[[nodiscard]] bool isKeycapBase(char32_t cp) noexcept;
[[nodiscard]] bool isVariationSelector(char32_t cp) noexcept;
[[nodiscard]] bool isTagCharacter(char32_t cp) noexcept;

} // namespace processing
