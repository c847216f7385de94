/**
 * @file engine.hpp
 * @brief Entry points used by drivers and schedulers.
 *
 * @details
 * The engine is driven in four stages:
 * 1. `validate()` a template document into an immutable JobTemplate.
 * 2. `create_job()` with concrete parameter values.
 * 3. `expand()` a Step into its ordered TaskRuns.
 * 4. `run_session()` for a chosen set of TaskRuns, or `run_job()` to run
 *    every Step in dependency order through an executor.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/execution/executor.hpp"
#include "jobtmpl/execution/job_plan.hpp"
#include "jobtmpl/execution/job_result.hpp"
#include "jobtmpl/expansion/task_expansion.hpp"
#include "jobtmpl/session/session.hpp"
#include "jobtmpl/template/job.hpp"
#include "jobtmpl/template/template_validator.hpp"

namespace jobtmpl
{

/**
 * @brief Expand a Step, looked up by name, into its ordered TaskRuns.
 * @throws ValidationError if the Job has no Step with that name.
 * @throws RangeExpansionError, AssociationCardinalityError
 */
std::vector<TaskRun> expand(const Job& job, const std::string& step_name);

/**
 * @brief Options for run_job().
 */
struct JobRunOptions
{
    ExecutorConfig executor;
    SessionConfig session;
    /// Replace the expansion of selected Steps with literal TaskRuns.
    TaskOverrides overrides;
};

/**
 * @brief Run every Task of a Job, one Session per Task.
 *
 * @details
 * Builds the JobPlan, then executes it with the executor selected by
 * `options.executor.thread_count`. Task failures are reported in the
 * JobResult; only plan construction errors throw.
 */
JobResult run_job(std::shared_ptr<const Job> job, const JobRunOptions& options = {});

} // namespace jobtmpl
