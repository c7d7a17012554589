/**
 * @file arrow_row.cpp
 */
#include "stepview/render/arrow_row.hpp"
#include "stepview/common/text_width.hpp"

#include <algorithm>

namespace stepview
{

namespace
{

std::vector<std::string> split_on_bars(const std::string& row)
{
    std::vector<std::string> segments;
    size_t start = 0;
    while (true)
    {
        const size_t bar = row.find('|', start);
        if (bar == std::string::npos)
        {
            segments.push_back(row.substr(start));
            return segments;
        }
        segments.push_back(row.substr(start, bar - start));
        start = bar + 1;
    }
}

bool is_blank(const std::string& segment)
{
    return segment.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

std::string arrowify(const std::string& row, char marker)
{
    const std::vector<std::string> segments = split_on_bars(row);
    if (std::all_of(segments.begin(), segments.end(), is_blank))
    {
        return std::string{};
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        if (i > 0)
        {
            result += ' ';
        }
        if (is_blank(segments[i]))
        {
            continue;
        }
        std::string field(text_width(segments[i]), ' ');
        field[(field.size() - 1) / 2] = marker;
        result += field;
    }
    return result;
}

std::vector<size_t> marker_columns(const std::string& marker_row, char marker)
{
    std::vector<size_t> columns;
    for (size_t col = 0; col < marker_row.size(); ++col)
    {
        if (marker_row[col] == marker)
        {
            columns.push_back(col);
        }
    }
    return columns;
}

std::string remark(const std::string& marker_row, char from, char to)
{
    std::string result = marker_row;
    std::replace(result.begin(), result.end(), from, to);
    return result;
}

} // namespace stepview
