/**
 * @file column_layout.hpp
 * @brief Header rows of the step box and their common width.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"

namespace stepview
{

/**
 * @brief Build a bar-delimited row from port names.
 * @details `{"a", "b"}` gives `"| a | b |"`; an empty list gives `"|  |"`.
 */
std::string make_port_row(const std::vector<std::string>& ports);

/**
 * @brief Build the bar-delimited row holding the step name.
 */
std::string make_name_row(const std::string& name);

/**
 * @brief Spread the fields of a bar-delimited row over a given width.
 *
 * @details
 * The row is split on whitespace into tokens. The spaces left over once the
 * tokens are placed are divided evenly between the gaps, and the remainder
 * goes immediately before the last character. A row with a single token is
 * returned unchanged. Widths count characters, not bytes.
 *
 * @param row A bar-delimited row.
 * @param width The target width.
 * @return The re-centered row, exactly `width` characters long.
 * @throw std::invalid_argument if the tokens alone are wider than `width`.
 */
std::string recenter(const std::string& row, size_t width);

/**
 * @brief The three header rows of a step box, re-centered to one width.
 */
struct ColumnLayout
{
    /// Width in characters shared by all rows (the longest natural row).
    size_t width{0};

    std::string inputs_row;
    std::string name_row;
    std::string outputs_row;
};

/**
 * @brief Compute the box layout of a step.
 */
ColumnLayout compute_layout(const StepRecord& record);

} // namespace stepview
