#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

namespace
{

utf8proc_ssize_t nextCodepoint(std::string_view text, std::size_t pos, utf8proc_int32_t& codepoint)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    return utf8proc_iterate(str + pos, static_cast<utf8proc_ssize_t>(text.size() - pos), &codepoint);
}

} // namespace

DecodedText decodeUtf8(std::string_view utf8_str)
{
    DecodedText decoded;
    decoded.codepoints.reserve(utf8_str.size());
    decoded.offsets.reserve(utf8_str.size());
    decoded.lengths.reserve(utf8_str.size());

    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        utf8proc_int32_t codepoint = -1;
        utf8proc_ssize_t bytes = nextCodepoint(utf8_str, pos, codepoint);
        if (bytes <= 0 || codepoint < 0)
        {
            // Keep the offending byte as its own unit so the caller can copy it back verbatim
            decoded.codepoints.push_back(REPLACEMENT_CHAR);
            decoded.offsets.push_back(pos);
            decoded.lengths.push_back(1);
            ++pos;
            continue;
        }
        decoded.codepoints.push_back(static_cast<char32_t>(codepoint));
        decoded.offsets.push_back(pos);
        decoded.lengths.push_back(static_cast<std::size_t>(bytes));
        pos += static_cast<std::size_t>(bytes);
    }
    return decoded;
}

std::optional<std::size_t> findInvalidUtf8(std::string_view utf8_str)
{
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        utf8proc_int32_t codepoint = -1;
        utf8proc_ssize_t bytes = nextCodepoint(utf8_str, pos, codepoint);
        if (bytes <= 0 || codepoint < 0)
            return pos;
        pos += static_cast<std::size_t>(bytes);
    }
    return std::nullopt;
}

} // namespace processing
