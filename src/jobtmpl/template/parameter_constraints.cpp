/**
 * @file parameter_constraints.cpp
 */
#include "jobtmpl/template/parameter_constraints.hpp"
#include "jobtmpl/template/parameter_value.hpp"

#include <array>

namespace jobtmpl
{

namespace
{

std::string describe(const JobParameterDefinition& def)
{
    return "Parameter '" + def.name + "'";
}

std::optional<std::string> check_length(const std::optional<size_t>& min_length,
                                        const std::optional<size_t>& max_length,
                                        const std::string& text)
{
    if (min_length.has_value() && text.size() < *min_length)
    {
        return "value '" + text + "' is shorter than minLength " + std::to_string(*min_length);
    }
    if (max_length.has_value() && text.size() > *max_length)
    {
        return "value '" + text + "' is longer than maxLength " + std::to_string(*max_length);
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Value checks, one per type
// ----------------------------------------------------------------------------

std::optional<std::string> string_value_violation(const JobParameterDefinition& def,
                                                  const std::string& text)
{
    const auto& c = std::get<StringConstraints>(def.constraints);
    return check_length(c.min_length, c.max_length, text);
}

std::optional<std::string> path_value_violation(const JobParameterDefinition& def,
                                                const std::string& text)
{
    const auto& c = std::get<PathConstraints>(def.constraints);
    return check_length(c.min_length, c.max_length, text);
}

std::optional<std::string> int_value_violation(const JobParameterDefinition& def,
                                               const std::string& text)
{
    const auto value = parse_int64(text);
    if (!value.has_value())
    {
        return "value '" + text + "' is not an INT";
    }
    const auto& c = std::get<IntConstraints>(def.constraints);
    if (c.min_value.has_value() && *value < *c.min_value)
    {
        return "value " + text + " is less than minValue " + std::to_string(*c.min_value);
    }
    if (c.max_value.has_value() && *value > *c.max_value)
    {
        return "value " + text + " is greater than maxValue " + std::to_string(*c.max_value);
    }
    return std::nullopt;
}

std::optional<std::string> float_value_violation(const JobParameterDefinition& def,
                                                 const std::string& text)
{
    const auto value = parse_float(text);
    if (!value.has_value())
    {
        return "value '" + text + "' is not a FLOAT";
    }
    const auto& c = std::get<FloatConstraints>(def.constraints);
    if (c.min_value.has_value() && *value < *c.min_value)
    {
        return "value " + text + " is less than minValue " + std::to_string(*c.min_value);
    }
    if (c.max_value.has_value() && *value > *c.max_value)
    {
        return "value " + text + " is greater than maxValue " + std::to_string(*c.max_value);
    }
    return std::nullopt;
}

using ValueCheck = std::optional<std::string> (*)(const JobParameterDefinition&, const std::string&);

// Indexed by ParameterType
const std::array<ValueCheck, 4> k_value_checks = {
    &string_value_violation,
    &path_value_violation,
    &int_value_violation,
    &float_value_violation,
};

// ----------------------------------------------------------------------------
// Bound consistency, one per type
// ----------------------------------------------------------------------------

template <typename T>
void check_bounds(const JobParameterDefinition& def, const std::optional<T>& low,
                  const std::optional<T>& high, const char* low_name, const char* high_name,
                  Diagnostics& diagnostics)
{
    if (low.has_value() && high.has_value() && *low > *high)
    {
        diagnostics.add_error(ErrorCode::Validation, def.location,
                              describe(def) + ": " + low_name + " is greater than " + high_name);
    }
}

void string_bounds(const JobParameterDefinition& def, Diagnostics& diagnostics)
{
    const auto& c = std::get<StringConstraints>(def.constraints);
    check_bounds(def, c.min_length, c.max_length, "minLength", "maxLength", diagnostics);
}

void path_bounds(const JobParameterDefinition& def, Diagnostics& diagnostics)
{
    const auto& c = std::get<PathConstraints>(def.constraints);
    check_bounds(def, c.min_length, c.max_length, "minLength", "maxLength", diagnostics);
}

void int_bounds(const JobParameterDefinition& def, Diagnostics& diagnostics)
{
    const auto& c = std::get<IntConstraints>(def.constraints);
    check_bounds(def, c.min_value, c.max_value, "minValue", "maxValue", diagnostics);
}

void float_bounds(const JobParameterDefinition& def, Diagnostics& diagnostics)
{
    const auto& c = std::get<FloatConstraints>(def.constraints);
    check_bounds(def, c.min_value, c.max_value, "minValue", "maxValue", diagnostics);
}

using BoundsCheck = void (*)(const JobParameterDefinition&, Diagnostics&);

const std::array<BoundsCheck, 4> k_bounds_checks = {
    &string_bounds,
    &path_bounds,
    &int_bounds,
    &float_bounds,
};

ValueCheck value_check_for(ParameterType type)
{
    return k_value_checks[static_cast<size_t>(type)];
}

bool is_allowed(const JobParameterDefinition& def, const std::string& text)
{
    if (def.allowed_values.empty())
    {
        return true;
    }
    const auto candidate = ParameterValue::make(def.type, text);
    for (const auto& allowed : def.allowed_values)
    {
        const auto entry = ParameterValue::make(def.type, allowed);
        if (candidate.has_value() && entry.has_value() ? *candidate == *entry : allowed == text)
        {
            return true;
        }
    }
    return false;
}

} // namespace

void check_constraint_consistency(const JobParameterDefinition& def, Diagnostics& diagnostics)
{
    k_bounds_checks[static_cast<size_t>(def.type)](def, diagnostics);

    const ValueCheck value_check = value_check_for(def.type);
    for (const auto& allowed : def.allowed_values)
    {
        if (auto violation = value_check(def, allowed))
        {
            diagnostics.add_error(ErrorCode::Validation, def.location,
                                  describe(def) + ": allowedValues entry " + *violation);
        }
    }

    if (def.default_value.has_value())
    {
        if (auto violation = value_check(def, *def.default_value))
        {
            diagnostics.add_error(ErrorCode::Validation, def.location,
                                  describe(def) + ": default " + *violation);
        }
        else if (!is_allowed(def, *def.default_value))
        {
            diagnostics.add_error(ErrorCode::Validation, def.location,
                                  describe(def) + ": default '" + *def.default_value +
                                      "' is not one of allowedValues");
        }
    }
}

std::optional<std::string> find_value_violation(const JobParameterDefinition& def,
                                                const std::string& text)
{
    if (auto violation = value_check_for(def.type)(def, text))
    {
        return violation;
    }
    if (!is_allowed(def, text))
    {
        return "value '" + text + "' is not one of allowedValues";
    }
    return std::nullopt;
}

} // namespace jobtmpl
