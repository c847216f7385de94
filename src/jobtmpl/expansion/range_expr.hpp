/**
 * @file range_expr.hpp
 * @brief Integer range expressions such as `1-380:11,380`.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/errors.hpp"

namespace jobtmpl
{

/**
 * @brief Upper bound on the number of values one expression may produce.
 */
inline constexpr size_t k_max_range_values = 1000000;

/**
 * @brief One comma-separated component of a range expression.
 *
 * @details
 * A single value `n` is stored as `{n, n, 1}`.
 */
struct IntRangeComponent
{
    int64_t start{0};
    int64_t end{0};
    int64_t step{1};

    /**
     * @brief The last value the component produces: the largest
     *        `start + k*step` not exceeding `end`.
     */
    int64_t last() const noexcept;

    /**
     * @brief Number of values the component produces, saturated at
     *        `SIZE_MAX`.
     */
    size_t size() const noexcept;
};

/**
 * @brief A parsed, validated integer range expression.
 *
 * @details
 * Grammar (whitespace around tokens is ignored):
 * @code
 *   expr      := component (',' component)*
 *   component := int | int '-' int (':' int)?
 * @endcode
 * A range component `a-b:s` produces `a, a+s, a+2s, ...` stopping at or before
 * `b`; the step defaults to 1. Components must appear in strictly ascending
 * order: each component's first value must be greater than the previous
 * component's last value. `1-380:11,380` therefore appends 380 after 375 as a
 * final, non-uniform element.
 *
 * @par Failure modes (RangeExpansionError)
 * - Malformed text.
 * - Non-increasing bounds (`b <= a`).
 * - Non-positive step.
 * - A component out of ascending order or overlapping the previous one.
 * - More than `k_max_range_values` values in total.
 */
class IntRangeExpr
{
public:
    /**
     * @brief Parse and validate `text`.
     * @throw RangeExpansionError describing the first problem found.
     */
    static IntRangeExpr parse(const std::string& text);

    const std::vector<IntRangeComponent>& components() const noexcept
    {
        return m_components;
    }

    /**
     * @brief Total number of values.
     */
    size_t size() const noexcept;

    /**
     * @brief All values in ascending order.
     */
    std::vector<int64_t> values() const;

    const std::string& text() const noexcept
    {
        return m_text;
    }

private:
    std::string m_text;
    std::vector<IntRangeComponent> m_components;
};

} // namespace jobtmpl
