/**
 * @file arrow_row.hpp
 * @brief Marker rows aligned under the fields of a header row.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/render/render_enums.hpp"

namespace stepview
{

/**
 * @brief Derive a marker row from a centered header row.
 *
 * @details
 * The row is split on `|`. Each segment holding a field becomes a marker
 * centered in a run of spaces as wide as the segment's characters; blank
 * segments become empty strings. The pieces are joined with single spaces,
 * which puts every marker under its field. The result is plain ASCII.
 *
 * @param row A centered bar-delimited row.
 * @param marker The character to draw.
 * @return The marker row, or an empty string if the row has no fields.
 */
std::string arrowify(const std::string& row, char marker = arrow_marker);

/**
 * @brief Get the column of every marker in a marker row, left to right.
 */
std::vector<size_t> marker_columns(const std::string& marker_row, char marker = arrow_marker);

/**
 * @brief Replace every marker of a marker row with another character.
 */
std::string remark(const std::string& marker_row, char from, char to);

} // namespace stepview
