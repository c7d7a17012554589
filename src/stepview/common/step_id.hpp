/**
 * @file step_id.hpp
 * @brief Typed step identifier with its numeric ordering prefix.
 */
#pragma once
#include "stepview/common/common.hpp"

namespace stepview
{

/**
 * @brief Identifier of a step in a resolved pipeline.
 *
 * @details
 * Build directories number their steps, so identifiers usually look like
 * `5-cadence-innovus-eco`. The leading integer is the step's ordering prefix.
 * It is parsed once when the identifier is constructed.
 *
 * @par Prefix rules
 * - The prefix is the run of decimal digits at the start of the text, and
 *   it counts only when followed by `-` or by the end of the text.
 * - `"5-foo"` has prefix 5, `"12"` has prefix 12, `"foo-5"` and `"5foo"`
 *   have none, and so does a digit run too large for `uint64_t`.
 */
class StepId
{
public:
    StepId() = default;

    explicit StepId(std::string text);

    const std::string& text() const noexcept
    {
        return m_text;
    }

    /**
     * @brief Get the numeric ordering prefix, if the identifier has one.
     */
    const std::optional<uint64_t>& order() const noexcept
    {
        return m_order;
    }

    bool operator==(const StepId& other) const noexcept
    {
        return m_text == other.m_text;
    }

    bool operator!=(const StepId& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_text;
    std::optional<uint64_t> m_order;
};

/**
 * @brief Strict weak ordering of steps by their ordering prefix.
 *
 * @details
 * Identifiers with a prefix come before identifiers without one; two
 * identifiers without a prefix are equivalent. Equivalent identifiers
 * (including equal prefixes) are not reordered by a stable sort, so the
 * original list order is the tie-break.
 */
bool precedes_by_order(const StepId& lhs, const StepId& rhs) noexcept;

} // namespace stepview
