/**
 * @file step_renderer.hpp
 */
#pragma once
#include "stepview/common/common.hpp"
#include "stepview/common/step_record.hpp"
#include "stepview/render/diagram_assembler.hpp"

namespace stepview
{

/**
 * @brief Render a step: the diagram followed by the listing.
 *
 * @details
 * The result depends only on `record` and `options`, so rendering the same
 * record twice gives byte-identical text.
 */
std::string render_step(const StepRecord& record, const RenderOptions& options);

} // namespace stepview
