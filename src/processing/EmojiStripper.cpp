#include "EmojiStripper.hpp"
#include "EmojiClassifier.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace processing
{

text_processing::StripResult strip(std::string_view text)
{
    PROFILE_SCOPE_FUNCTION();

    text_processing::StripResult result;
    result.original_bytes = text.size();
    if (text.empty())
        return result;

    const DecodedText decoded = decodeUtf8(text);
    result.text.reserve(text.size());

    // Bytes between spans are copied as-is, so malformed input survives untouched
    std::size_t copied_to = 0;
    for (auto span : scan(decoded.codepoints))
    {
        const std::size_t last = span.start + span.length - 1;
        span.byte_offset = decoded.offsets[span.start];
        span.byte_length = decoded.offsets[last] + decoded.lengths[last] - span.byte_offset;

        PLOG_VERBOSE << "Removing emoji span at byte " << span.byte_offset << " (" << span.length
                     << " code points, " << span.byte_length << " bytes)";

        result.text.append(text.substr(copied_to, span.byte_offset - copied_to));
        copied_to = span.byte_offset + span.byte_length;

        ++result.removed_spans;
        result.removed_chars += span.length;
        result.removed_bytes += span.byte_length;
    }
    result.text.append(text.substr(copied_to));

    return result;
}

bool containsEmoji(std::string_view text)
{
    const DecodedText decoded = decodeUtf8(text);
    const std::u32string_view codepoints(decoded.codepoints);
    for (std::size_t pos = 0; pos < codepoints.size(); ++pos)
    {
        if (classify(codepoints, pos))
            return true;
    }
    return false;
}

} // namespace processing
