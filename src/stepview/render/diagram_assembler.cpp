/**
 * @file diagram_assembler.cpp
 */
#include "stepview/render/diagram_assembler.hpp"
#include "stepview/render/arrow_row.hpp"
#include "stepview/render/column_layout.hpp"
#include "stepview/render/connector_stack.hpp"

namespace stepview
{

std::vector<std::string> render_diagram_lines(const StepRecord& record, const RenderOptions& options)
{
    const ColumnLayout layout = compute_layout(record);
    const std::string inputs_arrows = arrowify(layout.inputs_row);
    const std::string outputs_arrows = arrowify(layout.outputs_row);

    std::vector<std::string> above;
    std::vector<std::string> below;
    if (options.simple)
    {
        above = build_simple_connectors(inputs_arrows);
        below = build_simple_connectors(outputs_arrows);
    }
    else
    {
        above = build_input_connectors(record.inputs, record.edges_i, inputs_arrows);
        below = build_output_connectors(record.outputs, record.edges_o, outputs_arrows);
    }

    const std::string border(layout.width, '-');
    std::string padding(layout.width, ' ');
    padding.front() = '|';
    padding.back() = '|';

    std::vector<std::string> lines = std::move(above);
    lines.push_back(border);
    lines.push_back(layout.inputs_row);
    lines.push_back(border);
    lines.push_back(padding);
    lines.push_back(layout.name_row);
    lines.push_back(padding);
    lines.push_back(border);
    lines.push_back(layout.outputs_row);
    lines.push_back(border);
    lines.insert(lines.end(), below.begin(), below.end());
    return lines;
}

std::string render_diagram(const StepRecord& record, const RenderOptions& options)
{
    std::string text;
    for (const auto& line : render_diagram_lines(record, options))
    {
        text += line;
        text += '\n';
    }
    return text;
}

} // namespace stepview
