/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential task execution.
 */
#pragma once
#include "jobtmpl/execution/executor.hpp"
#include <queue>

namespace jobtmpl
{

/**
 * @brief Single-threaded executor.
 *
 * @details
 * Runs tasks one at a time on the calling thread in FIFO order. Tasks of a
 * released Step run in task order, so for a given plan the execution order
 * is deterministic. This is the default executor of the driver.
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored, always 1).
     * @param runner Runs each task.
     */
    SingleThreadedExecutor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner);

    JobResult execute(std::shared_ptr<const JobPlan> plan) override;

    void enqueue(TaskWrapperPtr task) override;

    void notify_completion(TaskWrapper* task) override;

private:
    // Ready queue (FIFO for fairness)
    std::queue<TaskWrapperPtr> m_ready_queue;
    size_t m_completed_count{0};
};

inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config), std::move(runner));
}

} // namespace jobtmpl
