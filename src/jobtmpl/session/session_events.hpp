/**
 * @file session_events.hpp
 * @brief Events and results reported by a Session.
 */
#pragma once
#include "jobtmpl/common/common.hpp"

namespace jobtmpl
{

/**
 * @brief Lifecycle states of a Session.
 *
 * @details
 * INITIALIZING -> ENTERING_ENVIRONMENTS -> READY -> RUNNING_TASK (repeats)
 * -> EXITING_ENVIRONMENTS -> ENDED_SUCCESS | ENDED_FAILED.
 * A setup failure goes from INITIALIZING straight to ENDED_FAILED.
 */
enum class SessionState
{
    Initializing,
    EnteringEnvironments,
    Ready,
    RunningTask,
    ExitingEnvironments,
    EndedSuccess,
    EndedFailed
};

enum class ActionStatus
{
    Success,
    Failed,
    Canceled,
    Timeout
};

enum class TaskStatus
{
    Success,
    Failed,
    Canceled
};

enum class SessionEventKind
{
    StateChanged,
    EnvironmentEntered,
    EnvironmentExited,
    TaskStarted,
    TaskCompleted,
    ActionStarted,
    ActionOutput,
    ActionProgress,
    ActionStatusMessage,
    ActionCompleted,
    SessionEnded
};

const char* to_string(SessionState state) noexcept;
const char* to_string(ActionStatus status) noexcept;
const char* to_string(TaskStatus status) noexcept;
const char* to_string(SessionEventKind kind) noexcept;

/**
 * @brief One entry of the Session event stream.
 *
 * @details
 * Only the fields relevant to `kind` are filled in:
 * - `environment`: environment events and environment actions.
 * - `task_index`, `parameters`: task events and task actions.
 * - `action`: action events (`onEnter`, `onRun`, `onExit`).
 * - `text`: output line, status message, failure message, or the
 *   `command args...` line of ActionStarted.
 * - `action_status`, `exit_code`: ActionCompleted.
 * - `task_status`: TaskCompleted.
 * - `progress`: ActionProgress.
 */
struct SessionEvent
{
    SessionEventKind kind{SessionEventKind::StateChanged};
    SessionState state{SessionState::Initializing};
    std::string environment;
    std::optional<size_t> task_index;
    std::string parameters;
    std::string action;
    std::string text;
    std::optional<ActionStatus> action_status;
    std::optional<TaskStatus> task_status;
    std::optional<int> exit_code;
    double progress{0.0};

    /**
     * @brief One-line rendering for logs and the driver.
     */
    std::string to_string() const;
};

using SessionEventCallback = std::function<void(const SessionEvent&)>;

/**
 * @brief Outcome of one action run by a Session.
 */
struct ActionResult
{
    std::string action;
    ActionStatus status{ActionStatus::Failed};
    std::optional<int> exit_code;
    /// Set by a `jobtmpl_fail:` directive or by the Session itself.
    std::string failure_message;
    std::chrono::nanoseconds duration{0};
};

struct TaskReport
{
    size_t task_index{0};
    std::string parameters;
    TaskStatus status{TaskStatus::Canceled};
    std::string failure_message;
    std::vector<ActionResult> actions;
};

/**
 * @brief Everything a Session reports after it ends.
 */
struct SessionResult
{
    bool success{false};
    /// True when INITIALIZING failed and no Environment was entered.
    bool setup_failed{false};
    SessionState final_state{SessionState::EndedFailed};
    std::vector<SessionEvent> events;
    std::vector<TaskReport> tasks;
    size_t tasks_succeeded{0};
    size_t tasks_failed{0};
    size_t tasks_canceled{0};
    std::chrono::nanoseconds duration{0};
    /// First failure that ended the Session, empty on success.
    std::string failure_message;

    std::string summary() const;
};

} // namespace jobtmpl
