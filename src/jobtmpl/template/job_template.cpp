/**
 * @file job_template.cpp
 */
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

ParameterConstraints make_constraints(ParameterType type)
{
    switch (type)
    {
    case ParameterType::String:
        return StringConstraints{};
    case ParameterType::Path:
        return PathConstraints{};
    case ParameterType::Int:
        return IntConstraints{};
    case ParameterType::Float:
        return FloatConstraints{};
    }
    return StringConstraints{};
}

std::vector<std::string> StepParameterSpace::parameter_names() const
{
    std::vector<std::string> names;
    names.reserve(task_parameter_definitions.size());
    for (const auto& def : task_parameter_definitions)
    {
        names.push_back(def.name);
    }
    return names;
}

std::optional<StepIdx> JobTemplate::find_step(const std::string& step_name) const
{
    for (StepIdx i = 0; i < steps.size(); ++i)
    {
        if (steps[i].name == step_name)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<ParamIdx> JobTemplate::find_parameter(const std::string& parameter_name) const
{
    for (ParamIdx i = 0; i < parameter_definitions.size(); ++i)
    {
        if (parameter_definitions[i].name == parameter_name)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> JobTemplate::parameter_names() const
{
    std::vector<std::string> names;
    names.reserve(parameter_definitions.size());
    for (const auto& def : parameter_definitions)
    {
        names.push_back(def.name);
    }
    return names;
}

std::vector<std::string> embedded_file_names(const std::vector<EmbeddedFile>& files)
{
    std::vector<std::string> names;
    names.reserve(files.size());
    for (const auto& file : files)
    {
        names.push_back(file.name);
    }
    return names;
}

} // namespace jobtmpl
