#pragma once

#include "TextProcessingTypes.hpp"

#include <string_view>

namespace processing
{

/// Removes every emoji sequence from a UTF-8 buffer. Bytes outside matched
/// spans, malformed ones included, are copied through unchanged.
[[nodiscard]] text_processing::StripResult strip(std::string_view text);

[[nodiscard]] bool containsEmoji(std::string_view text);

} // namespace processing
