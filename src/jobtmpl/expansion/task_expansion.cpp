/**
 * @file task_expansion.cpp
 */
#include "jobtmpl/expansion/task_expansion.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/expansion/combination_expr.hpp"
#include "jobtmpl/expansion/range_expr.hpp"

namespace jobtmpl
{

std::vector<std::string> expand_range(const TaskParameterDefinition& def,
                                      const SymbolValues& job_values)
{
    const std::string context = "range of task parameter '" + def.name + "'";
    std::vector<std::string> result;

    if (def.range_expression.has_value())
    {
        const std::string text = resolve(*def.range_expression, job_values, context);
        const IntRangeExpr expr = IntRangeExpr::parse(text);
        const auto values = expr.values();
        result.reserve(values.size());
        for (int64_t value : values)
        {
            result.push_back(std::to_string(value));
        }
    }
    else
    {
        result.reserve(def.range_values.size());
        for (const auto& item : def.range_values)
        {
            const std::string text = resolve(item, job_values, context);
            auto value = ParameterValue::make(def.type, text);
            if (!value.has_value())
            {
                throw RangeExpansionError("Task parameter '" + def.name + "': '" + text +
                                          "' is not a valid " + to_string(def.type) + " value");
            }
            result.push_back(std::move(value->text));
        }
    }
    if (result.empty())
    {
        throw RangeExpansionError("Task parameter '" + def.name + "' has an empty range");
    }
    return result;
}

std::vector<TaskRun> expand_step(const Job& job, StepIdx step_idx)
{
    const auto& steps = job.job_template().steps;
    if (step_idx >= steps.size())
    {
        throw std::out_of_range("expand_step: step index " + std::to_string(step_idx) +
                                " is out of range");
    }
    const Step& step = steps[step_idx];
    if (!step.parameter_space.has_value())
    {
        return {TaskRun{}};
    }

    const auto& space = *step.parameter_space;
    if (!space.combination_tree)
    {
        throw ValidationError("Step '" + step.name + "' has not been validated");
    }

    const SymbolValues job_values = job.job_scope_values();
    std::vector<std::vector<std::string>> sequences;
    std::vector<size_t> counts;
    sequences.reserve(space.task_parameter_definitions.size());
    for (const auto& def : space.task_parameter_definitions)
    {
        sequences.push_back(expand_range(def, job_values));
        counts.push_back(sequences.back().size());
    }

    std::vector<CombinationRow> rows;
    try
    {
        rows = evaluate_combination(*space.combination_tree, counts);
    }
    catch (const AssociationCardinalityError& e)
    {
        throw AssociationCardinalityError("Step '" + step.name + "': " + e.what());
    }

    std::vector<TaskRun> runs;
    runs.reserve(rows.size());
    for (const auto& row : rows)
    {
        TaskRun run;
        run.values.reserve(row.size());
        for (TaskParamIdx h = 0; h < row.size(); ++h)
        {
            run.values.push_back(sequences[h][row[h]]);
        }
        runs.push_back(std::move(run));
    }

    JOBTMPL_LOG_DEBUG("Step '" + step.name + "' expanded to " + std::to_string(runs.size()) +
                      " task(s) using '" + to_string(*space.combination_tree) + "'");
    return runs;
}

std::vector<TaskRun> task_runs_from_overrides(const Step& step,
                                              const std::vector<std::map<std::string, std::string>>& overrides)
{
    static const std::vector<TaskParameterDefinition> k_no_definitions;
    const auto& defs = step.parameter_space.has_value()
                           ? step.parameter_space->task_parameter_definitions
                           : k_no_definitions;

    std::vector<TaskRun> runs;
    runs.reserve(overrides.size());
    for (size_t i = 0; i < overrides.size(); ++i)
    {
        const auto& tuple = overrides[i];
        const std::string where = "Task override " + std::to_string(i) + " for step '" + step.name + "'";
        for (const auto& entry : tuple)
        {
            bool declared = false;
            for (const auto& def : defs)
            {
                declared = declared || def.name == entry.first;
            }
            if (!declared)
            {
                throw ValidationError(where + " names unknown task parameter '" + entry.first + "'");
            }
        }

        TaskRun run;
        run.values.reserve(defs.size());
        for (const auto& def : defs)
        {
            auto it = tuple.find(def.name);
            if (it == tuple.end())
            {
                throw ValidationError(where + " has no value for task parameter '" + def.name + "'");
            }
            auto value = ParameterValue::make(def.type, it->second);
            if (!value.has_value())
            {
                throw ValidationError(where + ": '" + it->second + "' is not a valid " +
                                      to_string(def.type) + " value for '" + def.name + "'");
            }
            run.values.push_back(std::move(value->text));
        }
        runs.push_back(std::move(run));
    }
    return runs;
}

std::string describe_task_run(const Step& step, const TaskRun& run)
{
    if (!step.parameter_space.has_value() || run.values.empty())
    {
        return "(no parameters)";
    }
    const auto& defs = step.parameter_space->task_parameter_definitions;
    std::string text;
    for (size_t h = 0; h < run.values.size() && h < defs.size(); ++h)
    {
        if (h > 0)
        {
            text += ", ";
        }
        text += defs[h].name + "=" + run.values[h];
    }
    return text;
}

} // namespace jobtmpl
