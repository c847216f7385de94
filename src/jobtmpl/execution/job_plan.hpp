/**
 * @file job_plan.hpp
 * @brief Definition of JobPlan, the execution plan of a Job.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/expansion/task_expansion.hpp"
#include "jobtmpl/template/job.hpp"

namespace jobtmpl
{

/**
 * @brief One TaskRun of one Step, ready to be assigned to a Session.
 */
struct PlannedTask
{
    StepIdx step_idx{0};
    /// Position of the TaskRun within its Step's expansion.
    size_t task_index{0};
    TaskRun run;
};

/**
 * @brief Immutable execution plan produced by build_job_plan().
 *
 * @details
 * JobPlan contains all information needed to execute a Job:
 * - Every TaskRun of every Step, grouped by Step in step index order
 * - Step-level predecessor and successor lists from the validated
 *   dependency handles
 * - The transitive successors of each Step, used to mark Tasks not
 *   runnable when a dependency fails
 *
 * A Task of Step S may start only after every Task of every predecessor of
 * S has succeeded.
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 * - Execution state is tracked externally (in TaskWrapper).
 */
struct JobPlan
{
    std::shared_ptr<const Job> job;

    /**
     * @brief All tasks, indexed by TaskIdx.
     */
    std::vector<PlannedTask> tasks;

    /**
     * @brief Task indices of each Step, in expansion order.
     */
    std::vector<std::vector<TaskIdx>> step_tasks;

    /**
     * @brief predecessors[s] lists the Steps that s depends on.
     */
    std::vector<std::vector<StepIdx>> step_predecessors;

    /**
     * @brief successors[s] lists the Steps that depend on s.
     */
    std::vector<std::vector<StepIdx>> step_successors;

    /**
     * @brief All Steps that transitively depend on each Step, ascending.
     */
    std::vector<std::vector<StepIdx>> step_transitive_successors;

    /**
     * @brief A dependency-respecting order of the Steps.
     */
    std::vector<StepIdx> step_order;

    size_t step_count() const noexcept
    {
        return step_tasks.size();
    }

    size_t task_count() const noexcept
    {
        return tasks.size();
    }

    /**
     * @brief Get indices of Steps with no predecessors.
     */
    std::vector<StepIdx> get_initial_ready_steps() const
    {
        std::vector<StepIdx> result;
        for (StepIdx s = 0; s < step_predecessors.size(); ++s)
        {
            if (step_predecessors[s].empty())
            {
                result.push_back(s);
            }
        }
        return result;
    }

    /**
     * @brief Human-readable label of a task, e.g. `Render#3 [Frame=4]`.
     */
    std::string describe_task(TaskIdx task_idx) const;
};

/**
 * @brief Explicit TaskRun tuples that replace the expansion of a Step.
 */
using TaskOverrides = std::map<StepIdx, std::vector<std::map<std::string, std::string>>>;

/**
 * @brief Expand every Step of `job` and wire the Step dependency graph.
 * @throw RangeExpansionError, AssociationCardinalityError,
 *        UnresolvedReferenceError from expansion.
 * @throw ValidationError for invalid overrides.
 * @throw CyclicDependencyError if the dependencies form a cycle.
 */
std::shared_ptr<const JobPlan> build_job_plan(std::shared_ptr<const Job> job,
                                              const TaskOverrides& overrides = {});

} // namespace jobtmpl
