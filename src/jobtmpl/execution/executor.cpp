#include "jobtmpl/execution/executor.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/execution/single_threaded_executor.hpp"
#include "jobtmpl/execution/task_wrapper.hpp"
#include "jobtmpl/execution/thread_pool_executor.hpp"

namespace jobtmpl
{

const char* to_string(TaskState state) noexcept
{
    switch (state)
    {
    case TaskState::NotReady:
        return "NOT_READY";
    case TaskState::Ready:
        return "READY";
    case TaskState::Queued:
        return "QUEUED";
    case TaskState::Executing:
        return "EXECUTING";
    case TaskState::Succeeded:
        return "SUCCEEDED";
    case TaskState::Failed:
        return "FAILED";
    case TaskState::Canceled:
        return "CANCELED";
    case TaskState::NotRunnable:
        return "NOT_RUNNABLE";
    }
    return "UNKNOWN";
}

Executor::Executor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
    : m_config{std::move(config)}
    , m_runner{std::move(runner)}
{
    if (!m_runner)
    {
        throw ValidationError("Executor requires a task runner");
    }
}

void Executor::request_stop()
{
    if (!m_stop_requested.exchange(true, std::memory_order_acq_rel))
    {
        JOBTMPL_LOG_INFO("Executor stop requested");
        m_runner->request_cancel();
    }
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

void Executor::prepare(std::shared_ptr<const JobPlan> plan)
{
    m_plan = std::move(plan);
    const size_t step_count = m_plan->step_count();

    m_step_tasks_remaining = std::make_unique<std::atomic<size_t>[]>(step_count);
    m_step_predecessors_remaining = std::make_unique<std::atomic<size_t>[]>(step_count);
    m_step_failed = std::make_unique<std::atomic<bool>[]>(step_count);
    for (StepIdx s = 0; s < step_count; ++s)
    {
        m_step_tasks_remaining[s].store(m_plan->step_tasks[s].size());
        m_step_predecessors_remaining[s].store(m_plan->step_predecessors[s].size());
        m_step_failed[s].store(false);
    }

    auto self = shared_from_this();
    m_all_tasks.clear();
    m_all_tasks.reserve(m_plan->task_count());
    for (TaskIdx t = 0; t < m_plan->task_count(); ++t)
    {
        m_all_tasks.push_back(std::make_shared<TaskWrapper>(t, m_plan->tasks[t].step_idx, self));
    }
}

void Executor::release_initial_steps()
{
    for (StepIdx s : m_plan->get_initial_ready_steps())
    {
        step_ready(s);
    }
}

void Executor::step_ready(StepIdx step_idx)
{
    const auto& tasks = m_plan->step_tasks[step_idx];
    if (tasks.empty())
    {
        step_finished(step_idx);
        return;
    }
    JOBTMPL_LOG_DEBUG("Releasing " + std::to_string(tasks.size()) + " task(s) of step '" +
                      m_plan->job->job_template().steps[step_idx].name + "'");
    for (TaskIdx t : tasks)
    {
        auto& task = m_all_tasks[t];
        if (task->mark_ready() && task->mark_queued())
        {
            enqueue(task);
        }
    }
}

void Executor::task_finished(TaskWrapper* task)
{
    const StepIdx s = task->step_idx();
    if (task->state() != TaskState::Succeeded)
    {
        m_step_failed[s].store(true, std::memory_order_release);
        if (m_config.abort_on_failure)
        {
            request_stop();
        }
    }
    if (m_step_tasks_remaining[s].fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
        step_finished(s);
    }
}

void Executor::step_finished(StepIdx step_idx)
{
    const auto& steps = m_plan->job->job_template().steps;
    if (m_step_failed[step_idx].load(std::memory_order_acquire))
    {
        for (StepIdx succ : m_plan->step_transitive_successors[step_idx])
        {
            for (TaskIdx t : m_plan->step_tasks[succ])
            {
                m_all_tasks[t]->mark_not_runnable();
            }
        }
        JOBTMPL_LOG_WARN("Step '" + steps[step_idx].name + "' failed; " +
                         std::to_string(m_plan->step_transitive_successors[step_idx].size()) +
                         " dependent step(s) are not runnable");
        return;
    }

    JOBTMPL_LOG_DEBUG("Step '" + steps[step_idx].name + "' finished");
    for (StepIdx succ : m_plan->step_successors[step_idx])
    {
        if (m_step_predecessors_remaining[succ].fetch_sub(1, std::memory_order_acq_rel) == 1)
        {
            step_ready(succ);
        }
    }
}

void Executor::cancel_pending_tasks()
{
    for (const auto& task : m_all_tasks)
    {
        task->cancel();
    }
}

JobResult Executor::build_result(std::chrono::steady_clock::time_point start_time) const
{
    JobResult result;
    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
    result.stopped = stop_requested();
    if (m_config.collect_timing)
    {
        result.task_durations.resize(m_all_tasks.size(), std::chrono::nanoseconds{0});
    }

    for (const auto& task : m_all_tasks)
    {
        const TaskState state = task->state();
        const TaskIdx t = task->task_idx();
        result.task_states.push_back(state);

        switch (state)
        {
        case TaskState::Succeeded:
            result.completed_tasks.push_back(t);
            if (m_config.collect_timing)
            {
                result.task_durations[t] = task->duration();
            }
            break;

        case TaskState::Failed:
            result.failed_tasks.push_back(t);
            if (task->exception())
            {
                try
                {
                    std::rethrow_exception(task->exception());
                }
                catch (const std::exception& e)
                {
                    result.error_messages.push_back(e.what());
                }
                catch (...)
                {
                    result.error_messages.push_back("Unknown exception");
                }
            }
            else
            {
                result.error_messages.push_back("Unknown error");
            }
            if (m_config.collect_timing)
            {
                result.task_durations[t] = task->duration();
            }
            break;

        case TaskState::NotRunnable:
            result.not_runnable_tasks.push_back(t);
            break;

        case TaskState::Canceled:
        case TaskState::NotReady:
        case TaskState::Ready:
        case TaskState::Queued:
            result.canceled_tasks.push_back(t);
            break;

        case TaskState::Executing:
            // Should not happen once execute() has returned
            result.failed_tasks.push_back(t);
            result.error_messages.push_back("Task stuck in Executing state");
            break;
        }
    }

    result.success = result.failed_tasks.empty() && result.canceled_tasks.empty() &&
                     result.not_runnable_tasks.empty();
    return result;
}

void Executor::reset()
{
    m_all_tasks.clear();
    m_plan.reset();
}

std::shared_ptr<Executor> make_executor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
{
    if (config.thread_count == 1)
    {
        return make_single_threaded_executor(std::move(config), std::move(runner));
    }
    return make_thread_pool_executor(std::move(config), std::move(runner));
}

} // namespace jobtmpl
