#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

/// Scalar values of a UTF-8 buffer together with where each one came from.
/// codepoints[i] was decoded from bytes [offsets[i], offsets[i] + lengths[i]).
struct DecodedText
{
    std::u32string codepoints;
    std::vector<std::size_t> offsets;
    std::vector<std::size_t> lengths;
};

/// Replacement value used for bytes that are not valid UTF-8
constexpr char32_t REPLACEMENT_CHAR = U'\uFFFD';

/// Decodes a UTF-8 buffer. Malformed bytes become one REPLACEMENT_CHAR each,
/// so every input byte belongs to exactly one decoded unit.
DecodedText decodeUtf8(std::string_view utf8_str);

/// Byte offset of the first malformed sequence, or nullopt when the buffer is valid UTF-8
std::optional<std::size_t> findInvalidUtf8(std::string_view utf8_str);

} // namespace processing
