#include "jobtmpl/execution/single_threaded_executor.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/execution/task_wrapper.hpp"

namespace jobtmpl
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
    : Executor(std::move(config), std::move(runner))
{}

JobResult SingleThreadedExecutor::execute(std::shared_ptr<const JobPlan> plan)
{
    if (!plan)
    {
        throw ValidationError("Cannot execute a null job plan");
    }
    auto start_time = std::chrono::steady_clock::now();

    // Reset internal state (but not stop flag - that's set externally)
    while (!m_ready_queue.empty())
    {
        m_ready_queue.pop();
    }
    m_completed_count = 0;

    prepare(std::move(plan));
    JOBTMPL_LOG_INFO("Executing " + std::to_string(m_plan->task_count()) + " task(s) in " +
                     std::to_string(m_plan->step_count()) + " step(s) on one thread");

    release_initial_steps();

    // Process queue until empty or stopped
    while (!m_ready_queue.empty() && !stop_requested())
    {
        auto task = m_ready_queue.front();
        m_ready_queue.pop();
        task->run();
    }

    if (stop_requested())
    {
        cancel_pending_tasks();
    }
    JobResult result = build_result(start_time);
    JOBTMPL_LOG_INFO(result.summary());
    reset();
    return result;
}

void SingleThreadedExecutor::enqueue(TaskWrapperPtr task)
{
    m_ready_queue.push(std::move(task));
}

void SingleThreadedExecutor::notify_completion(TaskWrapper* task)
{
    (void)task;
    m_completed_count++;
}

} // namespace jobtmpl
