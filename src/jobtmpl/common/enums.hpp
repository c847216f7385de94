/**
 * @file enums.hpp
 */
#pragma once
#include "jobtmpl/common/common.hpp"

namespace jobtmpl
{

// ============================================================================
// Handle type aliases
// ============================================================================

/**
 * @brief Handle of a Step: its position in `JobTemplate::steps`.
 *
 * @details
 * Handles are resolved from names once, during validation. After that,
 * execution-time lookups index the owning table directly. The aliases exist
 * for clarity in API signatures, not for compile-time type safety.
 */
using StepIdx = size_t;

/**
 * @brief Handle of a job parameter: its position in `JobTemplate::parameter_definitions`.
 */
using ParamIdx = size_t;

/**
 * @brief Handle of a task parameter within its Step's parameter space.
 */
using TaskParamIdx = size_t;

/**
 * @brief Handle of an embedded file within its owning script.
 */
using FileIdx = size_t;

/**
 * @brief Index of a Task in a JobPlan task table.
 */
using TaskIdx = size_t;

/**
 * @brief Marker for a handle that has not been resolved.
 */
inline constexpr size_t k_unbound_handle = std::numeric_limits<size_t>::max();

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Value type of a job or task parameter.
 */
enum class ParameterType
{
    String,
    Path,
    Int,
    Float
};

/**
 * @brief Path convention of a host: separator and case sensitivity.
 *
 * @details
 * - `Posix`: `/` separator, case-sensitive comparison.
 * - `Windows`: `\` separator (`/` also accepted on input), case-insensitive
 *   comparison, optional drive letter or UNC prefix.
 */
enum class PathFormat
{
    Posix,
    Windows
};

/**
 * @brief Declared direction of data for PATH job parameters.
 */
enum class DataFlow
{
    None,
    In,
    Out,
    InOut
};

/**
 * @brief Declared kind of filesystem object for PATH job parameters.
 */
enum class ObjectType
{
    File,
    Directory
};

const char* to_string(ParameterType type) noexcept;
const char* to_string(PathFormat format) noexcept;
const char* to_string(DataFlow flow) noexcept;
const char* to_string(ObjectType type) noexcept;

std::optional<ParameterType> parse_parameter_type(const std::string& text) noexcept;
std::optional<PathFormat> parse_path_format(const std::string& text) noexcept;
std::optional<DataFlow> parse_data_flow(const std::string& text) noexcept;
std::optional<ObjectType> parse_object_type(const std::string& text) noexcept;

/**
 * @brief Path format of the host this process runs on.
 */
PathFormat host_path_format() noexcept;

} // namespace jobtmpl
