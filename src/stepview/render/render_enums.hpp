/**
 * @file render_enums.hpp
 */
#pragma once
#include "stepview/common/common.hpp"

namespace stepview
{

/**
 * @brief Type alias for port indices.
 *
 * @details
 * `PortIdx` is the position of a port in its step's declared input or output
 * list. This alias exists for clarity in API signatures, not for
 * compile-time type safety.
 */
using PortIdx = size_t;

/// Marker drawn where a connector meets the box.
constexpr char arrow_marker = 'V';

/// Vertical connector segment.
constexpr char trunk_marker = '|';

/// Connector segment next to a label.
constexpr char junction_marker = '+';

/**
 * @brief State of one port's column in a connector line.
 *
 * @details
 * - `Absent`: the port has no edges; its column is always blank.
 * - `Hidden`: the port has edges but its trunk is not drawn on this line.
 * - `Trunk`: a vertical segment passes through this line.
 * - `Junction`: this line carries a label for the port.
 * - `Arrow`: the line touching the box (input side) or the first line of
 *   a port's consumers (output side).
 */
enum class ColumnState
{
    Absent,
    Hidden,
    Trunk,
    Junction,
    Arrow
};

/**
 * @brief Get the character drawn for a column state.
 */
constexpr char to_char(ColumnState state) noexcept
{
    switch (state)
    {
        case ColumnState::Trunk:
            return trunk_marker;
        case ColumnState::Junction:
            return junction_marker;
        case ColumnState::Arrow:
            return arrow_marker;
        case ColumnState::Absent:
        case ColumnState::Hidden:
            break;
    }
    return ' ';
}

} // namespace stepview
