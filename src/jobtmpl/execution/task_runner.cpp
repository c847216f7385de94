#include "jobtmpl/execution/task_runner.hpp"
#include "jobtmpl/common/logger.hpp"

namespace jobtmpl
{

SessionTaskRunner::SessionTaskRunner(SessionConfig config)
    : m_config{std::move(config)}
{}

void SessionTaskRunner::run_task(const JobPlan& plan, TaskIdx task_idx)
{
    const PlannedTask& task = plan.tasks.at(task_idx);
    Session session(plan.job, SessionPlan{task.step_idx, {task.run}}, m_config);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancel_requested)
        {
            session.cancel();
        }
        m_active.insert(&session);
    }

    SessionResult result;
    try
    {
        result = session.run();
    }
    catch (const std::exception&)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(&session);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(&session);
    }

    if (result.success)
    {
        return;
    }

    const std::string message = plan.describe_task(task_idx) + ": " + result.failure_message;
    if (result.setup_failed)
    {
        throw SessionSetupError(message);
    }
    if (!result.tasks.empty() && !result.tasks.front().actions.empty() &&
        result.tasks.front().actions.back().status == ActionStatus::Timeout)
    {
        throw ActionTimeoutError(message);
    }
    throw ActionFailureError(message);
}

void SessionTaskRunner::request_cancel()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancel_requested = true;
    for (Session* session : m_active)
    {
        session->cancel();
    }
}

} // namespace jobtmpl
