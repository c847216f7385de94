/**
 * @file session_events.cpp
 */
#include "jobtmpl/session/session_events.hpp"

#include <sstream>

namespace jobtmpl
{

const char* to_string(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Initializing:
        return "INITIALIZING";
    case SessionState::EnteringEnvironments:
        return "ENTERING_ENVIRONMENTS";
    case SessionState::Ready:
        return "READY";
    case SessionState::RunningTask:
        return "RUNNING_TASK";
    case SessionState::ExitingEnvironments:
        return "EXITING_ENVIRONMENTS";
    case SessionState::EndedSuccess:
        return "ENDED_SUCCESS";
    case SessionState::EndedFailed:
        return "ENDED_FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(ActionStatus status) noexcept
{
    switch (status)
    {
    case ActionStatus::Success:
        return "SUCCESS";
    case ActionStatus::Failed:
        return "FAILED";
    case ActionStatus::Canceled:
        return "CANCELED";
    case ActionStatus::Timeout:
        return "TIMEOUT";
    }
    return "UNKNOWN";
}

const char* to_string(TaskStatus status) noexcept
{
    switch (status)
    {
    case TaskStatus::Success:
        return "SUCCESS";
    case TaskStatus::Failed:
        return "FAILED";
    case TaskStatus::Canceled:
        return "CANCELED";
    }
    return "UNKNOWN";
}

const char* to_string(SessionEventKind kind) noexcept
{
    switch (kind)
    {
    case SessionEventKind::StateChanged:
        return "StateChanged";
    case SessionEventKind::EnvironmentEntered:
        return "EnvironmentEntered";
    case SessionEventKind::EnvironmentExited:
        return "EnvironmentExited";
    case SessionEventKind::TaskStarted:
        return "TaskStarted";
    case SessionEventKind::TaskCompleted:
        return "TaskCompleted";
    case SessionEventKind::ActionStarted:
        return "ActionStarted";
    case SessionEventKind::ActionOutput:
        return "ActionOutput";
    case SessionEventKind::ActionProgress:
        return "ActionProgress";
    case SessionEventKind::ActionStatusMessage:
        return "ActionStatusMessage";
    case SessionEventKind::ActionCompleted:
        return "ActionCompleted";
    case SessionEventKind::SessionEnded:
        return "SessionEnded";
    }
    return "Unknown";
}

std::string SessionEvent::to_string() const
{
    std::ostringstream out;
    out << jobtmpl::to_string(kind);
    switch (kind)
    {
    case SessionEventKind::StateChanged:
    case SessionEventKind::SessionEnded:
        out << " " << jobtmpl::to_string(state);
        break;
    case SessionEventKind::EnvironmentEntered:
    case SessionEventKind::EnvironmentExited:
        out << " '" << environment << "'";
        break;
    case SessionEventKind::TaskStarted:
        out << " #" << task_index.value_or(0) << " [" << parameters << "]";
        break;
    case SessionEventKind::TaskCompleted:
        out << " #" << task_index.value_or(0);
        if (task_status.has_value())
        {
            out << " " << jobtmpl::to_string(*task_status);
        }
        break;
    case SessionEventKind::ActionCompleted:
        out << " " << action;
        if (action_status.has_value())
        {
            out << " " << jobtmpl::to_string(*action_status);
        }
        if (exit_code.has_value())
        {
            out << " (exit " << *exit_code << ")";
        }
        break;
    case SessionEventKind::ActionProgress:
        out << " " << action << " " << progress << "%";
        break;
    case SessionEventKind::ActionStarted:
    case SessionEventKind::ActionOutput:
    case SessionEventKind::ActionStatusMessage:
        out << " " << action;
        break;
    }
    if (!text.empty())
    {
        out << ": " << text;
    }
    return out.str();
}

std::string SessionResult::summary() const
{
    std::string result = success ? "Session succeeded" : "Session failed";
    result += " (succeeded=" + std::to_string(tasks_succeeded);
    result += ", failed=" + std::to_string(tasks_failed);
    result += ", canceled=" + std::to_string(tasks_canceled);
    result += ", duration=" +
              std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()) +
              "ms)";
    if (!failure_message.empty())
    {
        result += ": " + failure_message;
    }
    return result;
}

} // namespace jobtmpl
