/**
 * @file enums.cpp
 */
#include "jobtmpl/common/enums.hpp"

namespace jobtmpl
{

const char* to_string(ParameterType type) noexcept
{
    switch (type)
    {
    case ParameterType::String: return "STRING";
    case ParameterType::Path:   return "PATH";
    case ParameterType::Int:    return "INT";
    case ParameterType::Float:  return "FLOAT";
    }
    return "UNKNOWN";
}

const char* to_string(PathFormat format) noexcept
{
    switch (format)
    {
    case PathFormat::Posix:   return "POSIX";
    case PathFormat::Windows: return "WINDOWS";
    }
    return "UNKNOWN";
}

const char* to_string(DataFlow flow) noexcept
{
    switch (flow)
    {
    case DataFlow::None:  return "NONE";
    case DataFlow::In:    return "IN";
    case DataFlow::Out:   return "OUT";
    case DataFlow::InOut: return "INOUT";
    }
    return "UNKNOWN";
}

const char* to_string(ObjectType type) noexcept
{
    switch (type)
    {
    case ObjectType::File:      return "FILE";
    case ObjectType::Directory: return "DIRECTORY";
    }
    return "UNKNOWN";
}

std::optional<ParameterType> parse_parameter_type(const std::string& text) noexcept
{
    if (text == "STRING") return ParameterType::String;
    if (text == "PATH") return ParameterType::Path;
    if (text == "INT") return ParameterType::Int;
    if (text == "FLOAT") return ParameterType::Float;
    return std::nullopt;
}

std::optional<PathFormat> parse_path_format(const std::string& text) noexcept
{
    if (text == "POSIX") return PathFormat::Posix;
    if (text == "WINDOWS") return PathFormat::Windows;
    return std::nullopt;
}

std::optional<DataFlow> parse_data_flow(const std::string& text) noexcept
{
    if (text == "NONE") return DataFlow::None;
    if (text == "IN") return DataFlow::In;
    if (text == "OUT") return DataFlow::Out;
    if (text == "INOUT") return DataFlow::InOut;
    return std::nullopt;
}

std::optional<ObjectType> parse_object_type(const std::string& text) noexcept
{
    if (text == "FILE") return ObjectType::File;
    if (text == "DIRECTORY") return ObjectType::Directory;
    return std::nullopt;
}

PathFormat host_path_format() noexcept
{
#ifdef _WIN32
    return PathFormat::Windows;
#else
    return PathFormat::Posix;
#endif
}

} // namespace jobtmpl
