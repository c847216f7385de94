/**
 * @file task_expansion.hpp
 * @brief Expansion of a Step's parameter space into ordered TaskRuns.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/format/resolver.hpp"
#include "jobtmpl/template/job.hpp"

namespace jobtmpl
{

/**
 * @brief One concrete binding of a Step's task parameters.
 *
 * @details
 * `values[h]` is the value of the task parameter with handle `h`, i.e. the
 * `h`-th entry of the Step's `taskParameterDefinitions`. A Step without a
 * parameter space has a single TaskRun with no values.
 */
struct TaskRun
{
    std::vector<std::string> values;

    bool operator==(const TaskRun& other) const
    {
        return values == other.values;
    }
};

/**
 * @brief Resolve and expand the range of one task parameter.
 *
 * @details
 * Range text and list items are resolved with `job_values` first. INT values
 * come out in canonical decimal form; other types keep their text.
 *
 * @throw RangeExpansionError for an invalid range expression or a list item
 *        that is not a valid value of the declared type.
 * @throw UnresolvedReferenceError if a reference has no value.
 */
std::vector<std::string> expand_range(const TaskParameterDefinition& def,
                                      const SymbolValues& job_values);

/**
 * @brief Expand Step `step_idx` of `job` into TaskRuns, in the deterministic
 *        nested-loop order of its combination expression.
 * @throw RangeExpansionError, AssociationCardinalityError
 */
std::vector<TaskRun> expand_step(const Job& job, StepIdx step_idx);

/**
 * @brief Build TaskRuns from explicit `name -> value` tuples instead of
 *        expanding the parameter space.
 * @throw ValidationError if a tuple misses a task parameter, names an unknown
 *        one, or holds a value that is invalid for the declared type.
 */
std::vector<TaskRun> task_runs_from_overrides(const Step& step,
                                              const std::vector<std::map<std::string, std::string>>& overrides);

/**
 * @brief Render a TaskRun as `Name=Value, ...` in declaration order.
 */
std::string describe_task_run(const Step& step, const TaskRun& run);

} // namespace jobtmpl
