/**
 * @file task_runner.hpp
 * @brief ITaskRunner interface and the Session-backed runner.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/execution/job_plan.hpp"
#include "jobtmpl/session/session.hpp"

#include <mutex>
#include <set>

namespace jobtmpl
{

/**
 * @brief Runs one planned task.
 *
 * @details
 * `run_task()` returns normally when the task succeeded and throws when it
 * did not; the executor records the exception as the task's failure.
 *
 * @par Thread Safety
 * - `run_task()` may be called concurrently from several workers.
 * - `request_cancel()` may be called from any thread.
 */
class ITaskRunner
{
public:
    virtual ~ITaskRunner() = default;

    virtual void run_task(const JobPlan& plan, TaskIdx task_idx) = 0;

    /**
     * @brief Ask running tasks to stop.
     */
    virtual void request_cancel()
    {
    }
};

/**
 * @brief Runs each task in its own Session.
 *
 * @details
 * A failed Session is reported by throwing:
 * - `ActionTimeoutError` when the task's action timed out,
 * - `SessionSetupError` when the Session could not be set up,
 * - `ActionFailureError` otherwise (failed or canceled actions, failed
 *   environment actions).
 */
class SessionTaskRunner : public ITaskRunner
{
public:
    explicit SessionTaskRunner(SessionConfig config = {});

    void run_task(const JobPlan& plan, TaskIdx task_idx) override;

    /**
     * @brief Cancel every running Session and any started later.
     */
    void request_cancel() override;

private:
    SessionConfig m_config;
    std::mutex m_mutex;
    std::set<Session*> m_active;
    bool m_cancel_requested{false};
};

} // namespace jobtmpl
