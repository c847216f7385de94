/**
 * @file job.cpp
 */
#include "jobtmpl/template/job.hpp"
#include "jobtmpl/common/diagnostics.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/template/parameter_constraints.hpp"

namespace jobtmpl
{

Job::Job(std::shared_ptr<const JobTemplate> job_template, std::vector<ParameterValue> parameters,
         std::string name)
    : m_template(std::move(job_template))
    , m_parameters(std::move(parameters))
    , m_name(std::move(name))
{
    if (!m_template)
    {
        throw ValidationError("Job requires a template");
    }
    if (m_parameters.size() != m_template->parameter_definitions.size())
    {
        throw ValidationError("Job has " + std::to_string(m_parameters.size()) +
                              " parameter values but the template declares " +
                              std::to_string(m_template->parameter_definitions.size()));
    }
}

const ParameterValue* Job::find_parameter(const std::string& name) const
{
    auto idx = m_template->find_parameter(name);
    if (!idx.has_value())
    {
        return nullptr;
    }
    return &m_parameters[*idx];
}

SymbolValues Job::job_scope_values() const
{
    std::vector<std::string> raw;
    raw.reserve(m_parameters.size());
    for (const auto& value : m_parameters)
    {
        raw.push_back(value.text);
    }
    SymbolValues values;
    values.set_values(SymbolScope::Param, raw);
    values.set_values(SymbolScope::RawParam, std::move(raw));
    return values;
}

SymbolValues Job::session_scope_values(const PathMapper& mapper) const
{
    std::vector<std::string> mapped;
    std::vector<std::string> raw;
    mapped.reserve(m_parameters.size());
    raw.reserve(m_parameters.size());
    for (const auto& value : m_parameters)
    {
        raw.push_back(value.text);
        mapped.push_back(value.type == ParameterType::Path ? mapper.translate(value.text) : value.text);
    }
    SymbolValues values;
    values.set_values(SymbolScope::Param, std::move(mapped));
    values.set_values(SymbolScope::RawParam, std::move(raw));
    return values;
}

std::shared_ptr<const Job> create_job(std::shared_ptr<const JobTemplate> job_template,
                                      const JobParameterInputs& inputs)
{
    if (!job_template)
    {
        throw ValidationError("create_job requires a validated template");
    }

    Diagnostics diagnostics;
    for (const auto& input : inputs)
    {
        if (!job_template->find_parameter(input.first).has_value())
        {
            diagnostics.add_error(ErrorCode::Validation, input.first,
                                  "Unknown job parameter '" + input.first + "'");
        }
    }

    std::vector<ParameterValue> values;
    values.reserve(job_template->parameter_definitions.size());
    for (const auto& def : job_template->parameter_definitions)
    {
        auto it = inputs.find(def.name);
        const std::string* text = nullptr;
        if (it != inputs.end())
        {
            text = &it->second;
        }
        else if (def.default_value.has_value())
        {
            text = &*def.default_value;
        }

        if (text == nullptr)
        {
            diagnostics.add_error(ErrorCode::Validation, def.name,
                                  "Job parameter '" + def.name + "' has no value and no default");
            values.push_back(ParameterValue{def.type, std::string()});
            continue;
        }
        if (auto violation = find_value_violation(def, *text))
        {
            diagnostics.add_error(ErrorCode::Validation, def.name,
                                  "Job parameter '" + def.name + "': " + *violation);
            values.push_back(ParameterValue{def.type, *text});
            continue;
        }
        values.push_back(*ParameterValue::make(def.type, *text));
    }

    diagnostics.throw_if_errors();

    // A temporary Job provides the job-scope values used to resolve the name
    Job unnamed(job_template, values, std::string());
    std::string name = resolve(job_template->name, unnamed.job_scope_values(), "job name");

    JOBTMPL_LOG_INFO("Created job '" + name + "' with " + std::to_string(values.size()) +
                     " parameter value(s)");
    return std::make_shared<const Job>(std::move(job_template), std::move(values), std::move(name));
}

} // namespace jobtmpl
