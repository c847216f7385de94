/**
 * @file job_result.hpp
 * @brief Definition of JobResult returned by Executor::execute().
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/common/enums.hpp"

namespace jobtmpl
{

/**
 * @brief Execution state of one planned task.
 */
enum class TaskState
{
    NotReady,    ///< Waiting for predecessor Steps.
    Ready,       ///< Predecessors succeeded; not yet queued.
    Queued,      ///< In the ready queue.
    Executing,   ///< Running in a Session.
    Succeeded,   ///< Completed successfully.
    Failed,      ///< Its Session reported a failure.
    Canceled,    ///< Skipped because a stop was requested.
    NotRunnable  ///< A dependency Step failed.
};

const char* to_string(TaskState state) noexcept;

/**
 * @brief Result of executing a JobPlan.
 *
 * @details
 * JobResult captures the outcome of running every task of a plan:
 * - Success/failure status
 * - Which tasks failed and their errors
 * - Which tasks were canceled or not runnable
 * - Timing information (if collected)
 */
struct JobResult
{
    /**
     * @brief Overall success status.
     * @details True if all tasks completed successfully.
     */
    bool success{true};

    /**
     * @brief Final state of every task, indexed by TaskIdx.
     */
    std::vector<TaskState> task_states;

    /**
     * @brief Indices of tasks that failed.
     */
    std::vector<TaskIdx> failed_tasks;

    /**
     * @brief Error messages for failed tasks, parallel to failed_tasks.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Indices of tasks that were canceled.
     */
    std::vector<TaskIdx> canceled_tasks;

    /**
     * @brief Indices of tasks that could not run because a dependency failed.
     */
    std::vector<TaskIdx> not_runnable_tasks;

    /**
     * @brief Indices of tasks that completed successfully, in completion order
     *        for the single-threaded executor, ascending otherwise.
     */
    std::vector<TaskIdx> completed_tasks;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-task durations, indexed by TaskIdx.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<std::chrono::nanoseconds> task_durations;

    /**
     * @brief Check if execution was stopped by request.
     */
    bool stopped{false};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Job succeeded";
        }
        else if (stopped)
        {
            result = "Job stopped by request";
        }
        else
        {
            result = "Job failed";
        }
        result += " (completed=" + std::to_string(completed_tasks.size());
        result += ", failed=" + std::to_string(failed_tasks.size());
        result += ", canceled=" + std::to_string(canceled_tasks.size());
        result += ", not_runnable=" + std::to_string(not_runnable_tasks.size()) + ")";
        return result;
    }
};

} // namespace jobtmpl
