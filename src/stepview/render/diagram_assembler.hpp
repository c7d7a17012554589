/**
 * @file diagram_assembler.hpp
 * @brief Stitches connector lines and the step box into a diagram.
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"

namespace stepview
{

/**
 * @brief Options controlling how a step is rendered.
 */
struct RenderOptions
{
    /// Draw two plain rows per side instead of labeled edges.
    bool simple{false};
};

/**
 * @brief Render the diagram of a step, one entry per line.
 *
 * @details
 * Top to bottom: input connectors, border, inputs row, border, padding,
 * name row, padding, border, outputs row, border, output connectors.
 */
std::vector<std::string> render_diagram_lines(const StepRecord& record, const RenderOptions& options);

/**
 * @brief Render the diagram of a step as text, each line ending in a newline.
 */
std::string render_diagram(const StepRecord& record, const RenderOptions& options);

} // namespace stepview
