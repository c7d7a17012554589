/**
 * @file step_renderer.cpp
 */
#include "stepview/render/step_renderer.hpp"
#include "stepview/render/listing_printer.hpp"

namespace stepview
{

std::string render_step(const StepRecord& record, const RenderOptions& options)
{
    return render_diagram(record, options) + render_listing(record);
}

} // namespace stepview
