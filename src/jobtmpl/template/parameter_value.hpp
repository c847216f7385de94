/**
 * @file parameter_value.hpp
 * @brief Typed parameter values kept in their textual form.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"

namespace jobtmpl
{

/**
 * @brief Parse a base-10 signed 64-bit integer; surrounding whitespace is not allowed.
 */
std::optional<int64_t> parse_int64(const std::string& text) noexcept;

/**
 * @brief Parse a finite floating point number in decimal or exponent notation.
 */
std::optional<double> parse_float(const std::string& text) noexcept;

/**
 * @brief A parameter value with its type tag.
 *
 * @details
 * Values stay textual because every consumer (format strings, command
 * arguments, events) needs the text. INT values are normalized to their
 * canonical decimal form by `make()`; FLOAT, STRING and PATH values keep the
 * text as written.
 */
struct ParameterValue
{
    ParameterType type{ParameterType::String};
    std::string text;

    /**
     * @brief Build a value of `type` from `text`.
     * @return nullopt if `text` is not a valid INT or FLOAT for those types.
     */
    static std::optional<ParameterValue> make(ParameterType type, const std::string& text);

    int64_t as_int() const;
    double as_float() const;

    bool operator==(const ParameterValue& other) const
    {
        return type == other.type && text == other.text;
    }
};

} // namespace jobtmpl
