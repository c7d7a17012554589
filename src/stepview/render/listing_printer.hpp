/**
 * @file listing_printer.hpp
 * @brief Parameter, flag and source listing of a step.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"

namespace stepview
{

/**
 * @brief Render the listing printed under the diagram.
 *
 * @details
 * Sections, each preceded by an empty line:
 * - `Parameters`, if the record has parameters. One `- key : value` bullet
 *   per parameter with keys right-aligned; a list value prints the key alone
 *   followed by one indented bullet per element.
 * - `Flags`, if the record sets the sandbox flag.
 * - `Source: <path>`, always.
 */
std::string render_listing(const StepRecord& record);

} // namespace stepview
