#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace processing
{

/**
 * @brief Decides whether the scalar value at an offset starts an emoji sequence
 *
 * Matching is maximal: once a base is accepted the span grows over variation
 * selectors, skin-tone modifiers, tag sequences, keycap marks and ZWJ links to
 * further emoji, so nothing that belongs to the sequence is left behind.
 * Modifiers, joiners and selectors that do not follow a base are never matched.
 *
 * @param text   Decoded scalar values
 * @param offset Index of a scalar value in @p text
 * @return Span length in scalar values, or nullopt when @p offset does not start an emoji
 */
[[nodiscard]] std::optional<std::size_t> classify(std::u32string_view text, std::size_t offset) noexcept;

/// Every maximal emoji span in @p text, in order. Byte fields are left at zero.
[[nodiscard]] std::vector<text_processing::CodepointSpan> scan(std::u32string_view text);

} // namespace processing
