/**
 * @file text_width.hpp
 * @brief Character counts of UTF-8 text.
 */
#pragma once
#include "stepview/common/common.hpp"

namespace stepview
{

/**
 * @brief Count the characters (UTF-8 code points) of a string.
 *
 * @details
 * Every byte that is not a UTF-8 continuation byte starts a character, so
 * plain ASCII text has as many characters as bytes. Columns of the diagram
 * and key alignment in the listing are measured with this count.
 */
size_t text_width(const std::string& text) noexcept;

/**
 * @brief Get the byte offset where the last character of a string starts.
 * @return The offset, or 0 for an empty string.
 */
size_t last_char_offset(const std::string& text) noexcept;

} // namespace stepview
