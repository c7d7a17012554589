/**
 * @file step_id.cpp
 */
#include "stepview/common/step_id.hpp"

#include <charconv>

namespace stepview
{

namespace
{

std::optional<uint64_t> parse_order_prefix(const std::string& text)
{
    const size_t digits_end = text.find_first_not_of("0123456789");
    const size_t digit_count = (digits_end == std::string::npos) ? text.size() : digits_end;
    if (digit_count == 0)
    {
        return std::nullopt;
    }
    if (digit_count < text.size() && text[digit_count] != '-')
    {
        return std::nullopt;
    }

    uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + digit_count;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

StepId::StepId(std::string text)
    : m_text{std::move(text)}
    , m_order{parse_order_prefix(m_text)}
{}

bool precedes_by_order(const StepId& lhs, const StepId& rhs) noexcept
{
    if (!lhs.order())
    {
        return false;
    }
    if (!rhs.order())
    {
        return true;
    }
    return *lhs.order() < *rhs.order();
}

} // namespace stepview
