/**
 * @file session.hpp
 * @brief The Session state machine: setup, environments, tasks, teardown.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/expansion/task_expansion.hpp"
#include "jobtmpl/pathmap/path_mapping.hpp"
#include "jobtmpl/session/session_context.hpp"
#include "jobtmpl/session/session_events.hpp"
#include "jobtmpl/template/job.hpp"

namespace jobtmpl
{

/**
 * @brief Configuration for a Session.
 */
struct SessionConfig
{
    /**
     * @brief Directory under which the Session working directory is created.
     * @details Empty means the system temporary directory.
     */
    std::filesystem::path session_root;

    /**
     * @brief Rules applied to PATH values on this host, in priority order.
     */
    std::vector<PathMappingRule> path_mapping_rules;

    /**
     * @brief Path convention of the execution host.
     */
    PathFormat host_format{jobtmpl::host_path_format()};

    /**
     * @brief Whether actions start from this process's environment variables.
     */
    bool inherit_process_environment{true};

    /**
     * @brief Whether `jobtmpl_*:` output lines are interpreted.
     */
    bool output_directives{true};

    /**
     * @brief Called synchronously for every event, on the thread running the Session.
     */
    SessionEventCallback on_event;
};

/**
 * @brief The work assigned to one Session: TaskRuns of a single Step.
 */
struct SessionPlan
{
    StepIdx step_idx{0};
    std::vector<TaskRun> task_runs;
};

/**
 * @brief Runs the TaskRuns of one Step inside its stacked Environments.
 *
 * @details
 * The Environments are the job environments followed by the Step's own, in
 * declaration order. `run()` drives the state machine:
 *
 * 1. INITIALIZING: create a private working directory, write the path
 *    mapping rules file, materialize environment embedded files. Any failure
 *    ends the Session as ENDED_FAILED without entering an Environment.
 * 2. ENTERING_ENVIRONMENTS: apply each Environment's variables and run its
 *    `onEnter`. A failure stops entering; no Task runs.
 * 3. RUNNING_TASK: for each TaskRun, materialize the step embedded files and
 *    run `onRun`. A failed Task does not prevent the next one.
 * 4. EXITING_ENVIRONMENTS: run `onExit` of every entered Environment in
 *    reverse order, then delete the working directory.
 *
 * Execution is strictly sequential: at most one action process is alive at
 * any time.
 *
 * @par Thread safety
 * - `run()` must be called once, from one thread.
 * - `cancel()`, `cancel_requested()` and `state()` may be called from any thread.
 */
class Session
{
public:
    /**
     * @throw PathMappingError if a path mapping rule is malformed.
     * @throw ValidationError if `plan.step_idx` is not a Step of the Job.
     */
    Session(std::shared_ptr<const Job> job, SessionPlan plan, SessionConfig config = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Run the Session to the end.
     * @throw SessionSetupError if called more than once.
     */
    SessionResult run();

    /**
     * @brief Cancel the running action and skip the remaining Tasks.
     *
     * @details
     * The exit phase still runs. Safe to call before, during or after `run()`.
     */
    void cancel() noexcept;

    bool cancel_requested() const noexcept
    {
        return m_cancel_requested.load(std::memory_order_acquire);
    }

    SessionState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    /**
     * @brief The working directory; empty until INITIALIZING created it.
     */
    const std::filesystem::path& working_directory() const noexcept
    {
        return m_working_directory;
    }

private:
    std::shared_ptr<const Job> m_job;
    SessionPlan m_plan;
    SessionConfig m_config;
    std::shared_ptr<const PathMapper> m_path_mapper;
    std::vector<const Environment*> m_environments;

    std::atomic<SessionState> m_state{SessionState::Initializing};
    std::atomic<bool> m_cancel_requested{false};
    bool m_started{false};

    std::filesystem::path m_working_directory;
    std::unique_ptr<SymbolValues> m_base_values;
    std::vector<std::unique_ptr<SymbolValues>> m_environment_values;
    SessionResult m_result;

    void initialize();
    std::vector<SessionContext> enter_environments(const SessionContext& root);
    void run_tasks(const SessionContext& context);
    void run_task(size_t task_index, const SessionContext& context);
    void exit_environments(const std::vector<SessionContext>& entered);
    void cleanup();

    ActionResult run_action(const Action& action, const std::string& label, const SymbolValues& values,
                            const SessionContext& context, EnvironmentFrame* frame,
                            const std::string& environment, std::optional<size_t> task_index,
                            const std::atomic<bool>* cancel_flag);

    void set_state(SessionState state);
    void emit(SessionEvent event);
    void record_failure(const std::string& message);
};

/**
 * @brief Run one Session for `plan` and return its result.
 */
SessionResult run_session(std::shared_ptr<const Job> job, SessionPlan plan, SessionConfig config = {});

} // namespace jobtmpl
