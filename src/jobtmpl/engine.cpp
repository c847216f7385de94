#include "jobtmpl/engine.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/execution/task_runner.hpp"

namespace jobtmpl
{

std::vector<TaskRun> expand(const Job& job, const std::string& step_name)
{
    auto step_idx = job.job_template().find_step(step_name);
    if (!step_idx)
    {
        throw ValidationError("Job '" + job.name() + "' has no step named '" + step_name + "'");
    }
    return expand_step(job, *step_idx);
}

JobResult run_job(std::shared_ptr<const Job> job, const JobRunOptions& options)
{
    if (!job)
    {
        throw ValidationError("Cannot run a null job");
    }
    auto plan = build_job_plan(job, options.overrides);
    JOBTMPL_LOG_INFO("Running job '" + job->name() + "'");

    auto runner = std::make_shared<SessionTaskRunner>(options.session);
    auto executor = make_executor(options.executor, runner);
    return executor->execute(plan);
}

} // namespace jobtmpl
