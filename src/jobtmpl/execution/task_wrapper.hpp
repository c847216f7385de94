/**
 * @file task_wrapper.hpp
 * @brief TaskWrapper wraps one planned task for execution with framework orchestration.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/execution/job_result.hpp"

namespace jobtmpl
{

// Forward declarations
class Executor;
class TaskWrapper;

using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;

/**
 * @brief Wraps a planned task for execution with pre/post orchestration.
 *
 * @details
 * TaskWrapper is the unit of work sent to workers. It handles:
 * - Pre-execution: state transition, stop check, timing start
 * - Running the task through the executor's ITaskRunner
 * - Post-execution: state transition, timing, Step gate notification
 *
 * Unlike a per-task dependency count, readiness is decided per Step: the
 * executor moves every task of a Step to Ready at once when all of its
 * predecessor Steps have finished successfully.
 *
 * @par Ownership Model
 * - Executor owns all TaskWrapper instances via shared_ptr.
 * - TaskWrappers hold weak_ptr to Executor (for queue access).
 * - Workers receive references, don't own TaskWrappers.
 *
 * @par Thread Safety
 * - State uses an atomic with compare-and-swap transitions.
 * - Results are written once by the worker that runs the task.
 */
class TaskWrapper : public std::enable_shared_from_this<TaskWrapper>
{
public:
    /**
     * @brief Construct a TaskWrapper.
     * @param task_idx Index of the task in the plan.
     * @param step_idx Step the task belongs to.
     * @param executor Weak reference to the owning executor.
     */
    TaskWrapper(TaskIdx task_idx, StepIdx step_idx, std::weak_ptr<Executor> executor);

    // Non-copyable, non-movable
    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    /**
     * @brief Execute this task (called by Worker).
     *
     * @details
     * Performs the full execution lifecycle:
     * 1. Check stop flag
     * 2. Transition to Executing state
     * 3. Call the executor's task runner
     * 4. Catch exceptions, transition to Succeeded/Failed
     * 5. Report to the executor's Step gates, which enqueue released tasks
     * 6. Notify Executor of completion
     */
    void run();

    TaskState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    /**
     * @brief Transition from NotReady to Ready.
     * @return True if the transition succeeded.
     */
    bool mark_ready();

    /**
     * @brief Transition from Ready to Queued state.
     * @return True if transition succeeded.
     */
    bool mark_queued();

    /**
     * @brief Transition from NotReady to NotRunnable.
     * @return True if the transition succeeded.
     */
    bool mark_not_runnable();

    /**
     * @brief Mark this task as canceled.
     * @pre Task must be in NotReady, Ready, or Queued state.
     */
    void cancel();

    /**
     * @brief Get the captured exception (if Failed).
     * @return exception_ptr, or nullptr if not failed.
     */
    std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Get execution duration.
     * @return Duration of the run, or zero if not completed.
     */
    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    TaskIdx task_idx() const noexcept
    {
        return m_task_idx;
    }

    StepIdx step_idx() const noexcept
    {
        return m_step_idx;
    }

private:
    bool transition_state(TaskState expected, TaskState desired);

    // Configuration (immutable after construction)
    TaskIdx m_task_idx;
    StepIdx m_step_idx;
    std::weak_ptr<Executor> m_executor;

    // Execution state (atomic)
    std::atomic<TaskState> m_state{TaskState::NotReady};

    // Results (written once after execution)
    std::exception_ptr m_exception{};
    std::chrono::nanoseconds m_duration{0};
};

} // namespace jobtmpl
