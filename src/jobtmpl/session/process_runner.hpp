/**
 * @file process_runner.hpp
 * @brief Running one external command with a deadline and cancelation.
 */
#pragma once
#include "jobtmpl/common/common.hpp"
#include "jobtmpl/template/job_template.hpp"

namespace jobtmpl
{

struct ProcessSpec
{
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path working_directory;
    /// Complete child environment as `NAME=VALUE` entries.
    std::vector<std::string> environment;
    std::optional<std::chrono::milliseconds> timeout;
    CancelationMethod cancelation;
};

struct ProcessResult
{
    bool launched{false};
    /// Why the command could not be started (when `launched` is false).
    std::string launch_error;
    /// Exit status for a normal exit.
    std::optional<int> exit_code;
    /// Terminating signal when the process was killed.
    std::optional<int> term_signal;
    bool timed_out{false};
    bool canceled{false};
    std::chrono::nanoseconds duration{0};

    bool succeeded() const noexcept
    {
        return launched && !timed_out && !canceled && exit_code.has_value() && *exit_code == 0;
    }
};

using OutputLineHandler = std::function<void(const std::string&)>;

/**
 * @brief Run `spec` to completion and return how it ended.
 *
 * @details
 * The child runs in its own process group with stdin on /dev/null and
 * stdout and stderr merged into one pipe; every complete output line is
 * passed to `on_line` on the calling thread.
 *
 * When the timeout elapses, or `cancel_flag` becomes true, the cancelation
 * method is applied to the whole process group:
 * - `Terminate`: SIGKILL immediately.
 * - `NotifyThenTerminate`: SIGTERM, then SIGKILL once the notify period
 *   has passed if any member of the group is still running.
 *
 * Once a cancelation has started, the call does not return while other
 * members of the group outlive the child. A timeout too large to
 * represent as a deadline never fires.
 *
 * Blocks the calling thread; the flag and the deadline are checked at least
 * every 50 ms. Launch failures (missing command, bad working directory) are
 * reported in the result rather than thrown.
 *
 * @throw SessionSetupError if the pipes or the child cannot be created.
 */
ProcessResult run_process(const ProcessSpec& spec, const OutputLineHandler& on_line,
                          const std::atomic<bool>* cancel_flag = nullptr);

} // namespace jobtmpl
