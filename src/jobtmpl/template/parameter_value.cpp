/**
 * @file parameter_value.cpp
 */
#include "jobtmpl/template/parameter_value.hpp"
#include "jobtmpl/common/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace jobtmpl
{

std::optional<int64_t> parse_int64(const std::string& text) noexcept
{
    if (text.empty())
    {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+')
    {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size())
    {
        return std::nullopt;
    }

    // Accumulate as a negative number so INT64_MIN is representable
    int64_t value = 0;
    const int64_t limit = std::numeric_limits<int64_t>::min();
    for (; pos < text.size(); ++pos)
    {
        const char c = text[pos];
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        const int digit = c - '0';
        if (value < (limit + digit) / 10)
        {
            return std::nullopt;
        }
        value = value * 10 - digit;
    }

    if (!negative)
    {
        if (value == limit)
        {
            return std::nullopt;
        }
        return -value;
    }
    return value;
}

std::optional<double> parse_float(const std::string& text) noexcept
{
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())))
    {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value))
    {
        return std::nullopt;
    }
    // strtod accepts hex floats and "inf"/"nan"; only decimal notation is allowed
    for (char c : text)
    {
        if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' ||
              c == 'e' || c == 'E'))
        {
            return std::nullopt;
        }
    }
    return value;
}

std::optional<ParameterValue> ParameterValue::make(ParameterType type, const std::string& text)
{
    switch (type)
    {
    case ParameterType::Int:
    {
        auto value = parse_int64(text);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        return ParameterValue{type, std::to_string(*value)};
    }
    case ParameterType::Float:
        if (!parse_float(text).has_value())
        {
            return std::nullopt;
        }
        return ParameterValue{type, text};
    case ParameterType::String:
    case ParameterType::Path:
        return ParameterValue{type, text};
    }
    return std::nullopt;
}

int64_t ParameterValue::as_int() const
{
    auto value = parse_int64(text);
    if (!value.has_value())
    {
        throw ValidationError("Value '" + text + "' is not an INT");
    }
    return *value;
}

double ParameterValue::as_float() const
{
    auto value = parse_float(text);
    if (!value.has_value())
    {
        throw ValidationError("Value '" + text + "' is not a FLOAT");
    }
    return *value;
}

} // namespace jobtmpl
