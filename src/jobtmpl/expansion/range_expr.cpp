/**
 * @file range_expr.cpp
 */
#include "jobtmpl/expansion/range_expr.hpp"

#include <cctype>
#include <limits>

namespace jobtmpl
{

namespace
{

/// Hand-written scanner over the expression text.
class RangeScanner
{
public:
    explicit RangeScanner(const std::string& text)
        : m_text(text)
    {
    }

    void skip_space()
    {
        while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])))
        {
            ++m_pos;
        }
    }

    bool at_end()
    {
        skip_space();
        return m_pos >= m_text.size();
    }

    bool accept(char c)
    {
        skip_space();
        if (m_pos < m_text.size() && m_text[m_pos] == c)
        {
            ++m_pos;
            return true;
        }
        return false;
    }

    int64_t expect_int()
    {
        skip_space();
        const size_t begin = m_pos;
        if (m_pos < m_text.size() && (m_text[m_pos] == '-' || m_text[m_pos] == '+'))
        {
            ++m_pos;
        }
        while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
        {
            ++m_pos;
        }
        const std::string token = m_text.substr(begin, m_pos - begin);
        if (token.empty() || token == "-" || token == "+")
        {
            fail("expected an integer at offset " + std::to_string(begin));
        }
        try
        {
            size_t used = 0;
            long long value = std::stoll(token, &used);
            return static_cast<int64_t>(value);
        }
        catch (const std::out_of_range&)
        {
            fail("integer '" + token + "' is out of range");
        }
        return 0;
    }

    [[noreturn]] void fail(const std::string& detail) const
    {
        throw RangeExpansionError("Invalid range expression '" + m_text + "': " + detail);
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;
};

} // namespace

int64_t IntRangeComponent::last() const noexcept
{
    // (end - start) fits in uint64 because start <= end
    const uint64_t span = static_cast<uint64_t>(end) - static_cast<uint64_t>(start);
    const uint64_t steps = span / static_cast<uint64_t>(step);
    return static_cast<int64_t>(static_cast<uint64_t>(start) + steps * static_cast<uint64_t>(step));
}

size_t IntRangeComponent::size() const noexcept
{
    const uint64_t span = static_cast<uint64_t>(end) - static_cast<uint64_t>(start);
    const uint64_t steps = span / static_cast<uint64_t>(step);
    // saturates for the full int64 range with step 1
    if (steps >= static_cast<uint64_t>(std::numeric_limits<size_t>::max()))
    {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(steps) + 1;
}

IntRangeExpr IntRangeExpr::parse(const std::string& text)
{
    IntRangeExpr result;
    result.m_text = text;

    RangeScanner scanner(text);
    if (scanner.at_end())
    {
        scanner.fail("expression is empty");
    }

    do
    {
        IntRangeComponent component;
        component.start = scanner.expect_int();
        component.end = component.start;

        if (scanner.accept('-'))
        {
            component.end = scanner.expect_int();
            if (component.end <= component.start)
            {
                scanner.fail("bounds " + std::to_string(component.start) + "-" +
                             std::to_string(component.end) + " are not increasing");
            }
            if (scanner.accept(':'))
            {
                component.step = scanner.expect_int();
                if (component.step <= 0)
                {
                    scanner.fail("step " + std::to_string(component.step) + " must be positive");
                }
            }
        }
        else if (scanner.accept(':'))
        {
            scanner.fail("a step requires a start-end range");
        }

        if (!result.m_components.empty())
        {
            const int64_t previous_last = result.m_components.back().last();
            if (component.start <= previous_last)
            {
                scanner.fail("value " + std::to_string(component.start) +
                             " is out of ascending order (previous value is " +
                             std::to_string(previous_last) + ")");
            }
        }
        result.m_components.push_back(component);
        if (result.size() > k_max_range_values)
        {
            scanner.fail("expands to more than " + std::to_string(k_max_range_values) + " values");
        }
    } while (scanner.accept(','));

    if (!scanner.at_end())
    {
        scanner.fail("unexpected trailing text");
    }

    return result;
}

size_t IntRangeExpr::size() const noexcept
{
    size_t total = 0;
    for (const auto& component : m_components)
    {
        const size_t count = component.size();
        if (count > std::numeric_limits<size_t>::max() - total)
        {
            return std::numeric_limits<size_t>::max();
        }
        total += count;
    }
    return total;
}

std::vector<int64_t> IntRangeExpr::values() const
{
    std::vector<int64_t> result;
    result.reserve(size());
    for (const auto& component : m_components)
    {
        const size_t count = component.size();
        for (size_t k = 0; k < count; ++k)
        {
            result.push_back(static_cast<int64_t>(static_cast<uint64_t>(component.start) +
                                                  k * static_cast<uint64_t>(component.step)));
        }
    }
    return result;
}

} // namespace jobtmpl
