/**
 * @file text_width.cpp
 */
#include "stepview/common/text_width.hpp"

namespace stepview
{

namespace
{

bool is_continuation_byte(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

} // namespace

size_t text_width(const std::string& text) noexcept
{
    size_t width = 0;
    for (char c : text)
    {
        if (!is_continuation_byte(c))
        {
            ++width;
        }
    }
    return width;
}

size_t last_char_offset(const std::string& text) noexcept
{
    size_t offset = text.size();
    while (offset > 0)
    {
        --offset;
        if (!is_continuation_byte(text[offset]))
        {
            break;
        }
    }
    return offset;
}

} // namespace stepview
