/**
 * @file column_layout.cpp
 */
#include "stepview/render/column_layout.hpp"
#include "stepview/common/text_width.hpp"

#include <algorithm>
#include <sstream>

namespace stepview
{

std::string make_port_row(const std::vector<std::string>& ports)
{
    std::string row = "| ";
    for (size_t i = 0; i < ports.size(); ++i)
    {
        if (i > 0)
        {
            row += " | ";
        }
        row += ports[i];
    }
    row += " |";
    return row;
}

std::string make_name_row(const std::string& name)
{
    return "| " + name + " |";
}

std::string recenter(const std::string& row, size_t width)
{
    std::vector<std::string> tokens;
    std::istringstream iss(row);
    std::string token;
    while (iss >> token)
    {
        tokens.push_back(token);
    }
    if (tokens.size() <= 1)
    {
        return row;
    }

    size_t token_total = 0;
    for (const auto& t : tokens)
    {
        token_total += text_width(t);
    }
    if (token_total > width)
    {
        throw std::invalid_argument(
            "Row '" + row + "' does not fit in width " + std::to_string(width));
    }

    const size_t gaps = tokens.size() - 1;
    const size_t extra = width - token_total;
    const std::string gap(extra / gaps, ' ');

    std::string result;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        if (i > 0)
        {
            result += gap;
        }
        result += tokens[i];
    }
    result.insert(last_char_offset(result), extra % gaps, ' ');
    return result;
}

ColumnLayout compute_layout(const StepRecord& record)
{
    const std::string inputs_row = make_port_row(record.inputs);
    const std::string name_row = make_name_row(record.name);
    const std::string outputs_row = make_port_row(record.outputs);

    ColumnLayout layout;
    layout.width = std::max({text_width(inputs_row), text_width(name_row), text_width(outputs_row)});
    layout.inputs_row = recenter(inputs_row, layout.width);
    layout.name_row = recenter(name_row, layout.width);
    layout.outputs_row = recenter(outputs_row, layout.width);
    return layout;
}

} // namespace stepview
