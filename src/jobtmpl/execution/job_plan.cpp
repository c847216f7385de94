#include "jobtmpl/execution/job_plan.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/common/step_graph.hpp"

namespace jobtmpl
{

std::string JobPlan::describe_task(TaskIdx task_idx) const
{
    const PlannedTask& task = tasks.at(task_idx);
    const Step& step = job->job_template().steps[task.step_idx];
    return step.name + "#" + std::to_string(task.task_index) + " [" + describe_task_run(step, task.run) + "]";
}

std::shared_ptr<const JobPlan> build_job_plan(std::shared_ptr<const Job> job, const TaskOverrides& overrides)
{
    if (!job)
    {
        throw ValidationError("build_job_plan requires a Job");
    }
    const auto& steps = job->job_template().steps;

    StepGraph graph;
    for (StepIdx s = 0; s < steps.size(); ++s)
    {
        graph.add_step(s);
    }
    for (StepIdx s = 0; s < steps.size(); ++s)
    {
        for (const auto& dep : steps[s].dependencies)
        {
            if (dep.handle == k_unbound_handle)
            {
                throw ValidationError("Step '" + steps[s].name + "' dependency '" + dep.depends_on +
                                      "' is not bound; validate the template first");
            }
            graph.link_steps(dep.handle, s);
        }
    }

    for (const auto& entry : overrides)
    {
        if (entry.first >= steps.size())
        {
            throw ValidationError("Task override names step index " + std::to_string(entry.first) +
                                  " but the template has " + std::to_string(steps.size()) + " step(s)");
        }
    }

    auto plan = std::make_shared<JobPlan>();
    plan->job = job;
    plan->step_tasks.resize(steps.size());
    plan->step_predecessors.resize(steps.size());
    plan->step_successors.resize(steps.size());
    plan->step_transitive_successors.resize(steps.size());
    plan->step_order = graph.topological_order();

    for (StepIdx s = 0; s < steps.size(); ++s)
    {
        plan->step_predecessors[s] = graph.predecessors(s);
        plan->step_successors[s] = graph.successors(s);
        plan->step_transitive_successors[s] = graph.transitive_successors(s);

        auto it = overrides.find(s);
        std::vector<TaskRun> runs = it != overrides.end() ? task_runs_from_overrides(steps[s], it->second)
                                                          : expand_step(*job, s);
        for (size_t i = 0; i < runs.size(); ++i)
        {
            plan->step_tasks[s].push_back(plan->tasks.size());
            plan->tasks.push_back(PlannedTask{s, i, std::move(runs[i])});
        }
    }

    JOBTMPL_LOG_INFO("Planned job '" + job->name() + "': " + std::to_string(plan->step_count()) +
                     " step(s), " + std::to_string(plan->task_count()) + " task(s)");
    return plan;
}

} // namespace jobtmpl
