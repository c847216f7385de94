/**
 * @file job.hpp
 * @brief A Job: a validated template bound to concrete parameter values.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/format/resolver.hpp"
#include "jobtmpl/pathmap/path_mapping.hpp"
#include "jobtmpl/template/job_template.hpp"
#include "jobtmpl/template/parameter_value.hpp"

namespace jobtmpl
{

/**
 * @brief One submission of a template.
 *
 * @details
 * Immutable after construction and shared by every Session that runs part of
 * it. Parameter values are indexed by `ParamIdx` and hold the text as
 * submitted (INT values normalized).
 */
class Job
{
public:
    Job(std::shared_ptr<const JobTemplate> job_template, std::vector<ParameterValue> parameters,
        std::string name);

    const JobTemplate& job_template() const noexcept
    {
        return *m_template;
    }

    const std::shared_ptr<const JobTemplate>& template_ptr() const noexcept
    {
        return m_template;
    }

    /**
     * @brief The job name with its references resolved.
     */
    const std::string& name() const noexcept
    {
        return m_name;
    }

    const std::vector<ParameterValue>& parameters() const noexcept
    {
        return m_parameters;
    }

    const ParameterValue& parameter(ParamIdx idx) const
    {
        return m_parameters.at(idx);
    }

    /**
     * @brief Value of the parameter named `name`, if declared.
     */
    const ParameterValue* find_parameter(const std::string& name) const;

    /**
     * @brief Values for job-scope resolution: `Param.*` and `RawParam.*` both
     *        hold the submitted text.
     */
    SymbolValues job_scope_values() const;

    /**
     * @brief Values for a Session on the execution host: `Param.*` PATH values
     *        pass through `mapper`, `RawParam.*` stay as submitted.
     */
    SymbolValues session_scope_values(const PathMapper& mapper) const;

private:
    std::shared_ptr<const JobTemplate> m_template;
    std::vector<ParameterValue> m_parameters;
    std::string m_name;
};

using JobParameterInputs = std::map<std::string, std::string>;

/**
 * @brief Bind job parameter inputs and resolve the job name.
 *
 * @details
 * Parameters without an input take their default. Every value is parsed per
 * its declared type and checked against its constraints.
 *
 * @throw ValidationError listing every unknown input, missing value and
 *        constraint violation.
 * @throw UnresolvedReferenceError if the job name cannot be resolved.
 */
std::shared_ptr<const Job> create_job(std::shared_ptr<const JobTemplate> job_template,
                                      const JobParameterInputs& inputs);

} // namespace jobtmpl
