/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/execution/job_plan.hpp"
#include "jobtmpl/execution/job_result.hpp"
#include "jobtmpl/execution/task_runner.hpp"

namespace jobtmpl
{

// Forward declaration
class TaskWrapper;
using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means single-threaded execution.
     */
    size_t thread_count{1};

    /**
     * @brief Whether to collect per-task timing.
     */
    bool collect_timing{false};

    /**
     * @brief Whether to abort on first failure.
     * @details If true, remaining tasks are canceled on first failure.
     *          If false, independent Steps continue execution.
     */
    bool abort_on_failure{false};
};

/**
 * @brief Interface for job plan executors.
 *
 * @details
 * IExecutor defines the contract for executing a JobPlan.
 * Implementations may be single-threaded or multi-threaded.
 *
 * @par Thread Safety
 * - execute() may be called from any thread.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Execute a job plan.
     * @param plan The plan to run.
     * @return JobResult with outcome details.
     */
    virtual JobResult execute(std::shared_ptr<const JobPlan> plan) = 0;

    /**
     * @brief Request stop of execution.
     *
     * @details
     * Sets a flag that workers check and asks the task runner to cancel
     * running tasks. Pending tasks are canceled.
     */
    virtual void request_stop() = 0;

    /**
     * @brief Check if stop has been requested.
     * @return True if request_stop() has been called.
     */
    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides common functionality for executors including:
 * - Stop request handling
 * - TaskWrapper creation and management
 * - Step gates: a Step's tasks are released when all predecessor Steps
 *   finished successfully; a failed Step marks the tasks of its transitive
 *   successors NotRunnable
 * - Result building
 *
 * Derived classes implement the actual scheduling and worker management.
 */
class Executor : public IExecutor, public std::enable_shared_from_this<Executor>
{
public:
    Executor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner);
    virtual ~Executor() = default;

    void request_stop() override;
    bool stop_requested() const noexcept override;

    /**
     * @brief Enqueue a task for execution.
     * @param task The task to enqueue, already in Queued state.
     * @note Called when a Step is released.
     */
    virtual void enqueue(TaskWrapperPtr task) = 0;

    /**
     * @brief Notify that a task has completed.
     * @param task The completed task.
     * @note Called by TaskWrapper after run() completes.
     */
    virtual void notify_completion(TaskWrapper* task) = 0;

    /**
     * @brief Record a finished task in its Step gate.
     * @note Called by TaskWrapper before notify_completion().
     */
    void task_finished(TaskWrapper* task);

    ITaskRunner& runner() noexcept
    {
        return *m_runner;
    }

    const JobPlan& plan() const noexcept
    {
        return *m_plan;
    }

protected:
    /**
     * @brief Create TaskWrappers and Step gates for a plan.
     */
    void prepare(std::shared_ptr<const JobPlan> plan);

    /**
     * @brief Release every Step without predecessors.
     */
    void release_initial_steps();

    /**
     * @brief Move every task that never started into Canceled.
     *
     * Called once no task can start any more, after a stop was requested.
     */
    void cancel_pending_tasks();

    /**
     * @brief Build the result from the final task states.
     */
    JobResult build_result(std::chrono::steady_clock::time_point start_time) const;

    /**
     * @brief Drop the plan and the task references.
     */
    void reset();

    ExecutorConfig m_config;
    std::shared_ptr<ITaskRunner> m_runner;
    std::atomic<bool> m_stop_requested{false};

    std::shared_ptr<const JobPlan> m_plan;
    std::vector<TaskWrapperPtr> m_all_tasks;

private:
    void step_ready(StepIdx step_idx);
    void step_finished(StepIdx step_idx);

    std::unique_ptr<std::atomic<size_t>[]> m_step_tasks_remaining;
    std::unique_ptr<std::atomic<size_t>[]> m_step_predecessors_remaining;
    std::unique_ptr<std::atomic<bool>[]> m_step_failed;
};

/**
 * @brief Create the executor matching `config.thread_count`.
 */
std::shared_ptr<Executor> make_executor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner);

} // namespace jobtmpl
