/**
 * @file listing_printer.cpp
 */
#include "stepview/render/listing_printer.hpp"
#include "stepview/common/text_width.hpp"

#include <algorithm>
#include <sstream>

namespace stepview
{

namespace
{

const char* const list_item_indent = "    ";

void print_section(std::ostringstream& oss, const std::string& title, const ParameterList& entries)
{
    oss << "\n" << title << "\n\n";

    size_t key_width = 0;
    for (const auto& [key, value] : entries)
    {
        key_width = std::max(key_width, text_width(key));
    }

    for (const auto& [key, value] : entries)
    {
        const std::string padded = std::string(key_width - text_width(key), ' ') + key;
        if (const auto* items = std::get_if<std::vector<std::string>>(&value))
        {
            oss << "- " << padded << " :\n";
            for (const auto& item : *items)
            {
                oss << list_item_indent << "- " << item << "\n";
            }
        }
        else
        {
            oss << "- " << padded << " : " << std::get<std::string>(value) << "\n";
        }
    }
}

} // namespace

std::string render_listing(const StepRecord& record)
{
    std::ostringstream oss;

    if (record.parameters)
    {
        print_section(oss, "Parameters", *record.parameters);
    }

    if (record.sandbox)
    {
        ParameterList flags;
        flags.emplace_back("sandbox", std::string(*record.sandbox ? "true" : "false"));
        print_section(oss, "Flags", flags);
    }

    oss << "\nSource: " << record.source << "\n";
    return oss.str();
}

} // namespace stepview
