#include "jobtmpl/execution/task_wrapper.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/execution/executor.hpp"

namespace jobtmpl
{

TaskWrapper::TaskWrapper(TaskIdx task_idx, StepIdx step_idx, std::weak_ptr<Executor> executor)
    : m_task_idx{task_idx}
    , m_step_idx{step_idx}
    , m_executor{std::move(executor)}
{}

void TaskWrapper::run()
{
    auto executor = m_executor.lock();
    if (!executor)
    {
        JOBTMPL_LOG_ERROR("Task " + std::to_string(m_task_idx) + " has no executor");
        return;
    }

    // Check stop request before starting
    if (executor->stop_requested())
    {
        m_state.store(TaskState::Canceled, std::memory_order_release);
        executor->notify_completion(this);
        return;
    }

    if (!transition_state(TaskState::Queued, TaskState::Executing))
    {
        // State was not Queued (maybe already canceled)
        executor->notify_completion(this);
        return;
    }

    auto start_time = std::chrono::steady_clock::now();
    try
    {
        executor->runner().run_task(executor->plan(), m_task_idx);
        m_state.store(TaskState::Succeeded, std::memory_order_release);
    }
    catch (const std::exception& e)
    {
        JOBTMPL_LOG_WARN("Task " + executor->plan().describe_task(m_task_idx) + " failed: " + e.what());
        m_exception = std::current_exception();
        m_state.store(TaskState::Failed, std::memory_order_release);
    }
    catch (...)
    {
        JOBTMPL_LOG_WARN("Task " + executor->plan().describe_task(m_task_idx) + " failed: unknown exception");
        m_exception = std::current_exception();
        m_state.store(TaskState::Failed, std::memory_order_release);
    }
    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    // Release or block the successor Steps
    executor->task_finished(this);

    executor->notify_completion(this);
}

bool TaskWrapper::mark_ready()
{
    return transition_state(TaskState::NotReady, TaskState::Ready);
}

bool TaskWrapper::mark_queued()
{
    return transition_state(TaskState::Ready, TaskState::Queued);
}

bool TaskWrapper::mark_not_runnable()
{
    return transition_state(TaskState::NotReady, TaskState::NotRunnable);
}

void TaskWrapper::cancel()
{
    TaskState current = m_state.load(std::memory_order_acquire);
    while (current == TaskState::NotReady || current == TaskState::Ready || current == TaskState::Queued)
    {
        if (m_state.compare_exchange_weak(current, TaskState::Canceled, std::memory_order_acq_rel))
        {
            return;
        }
    }
}

bool TaskWrapper::transition_state(TaskState expected, TaskState desired)
{
    return m_state.compare_exchange_strong(expected, desired, std::memory_order_acq_rel);
}

} // namespace jobtmpl
