/**
 * @file process_runner.cpp
 */
#include "jobtmpl/session/process_runner.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/session/action_output.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace jobtmpl
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds k_poll_interval{50};

// Stages reported by the child through the launch pipe
constexpr int k_stage_chdir = 1;
constexpr int k_stage_exec = 2;

/**
 * @brief Owns one file descriptor.
 */
class FileDescriptor
{
public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd)
        : m_fd(fd)
    {
    }

    ~FileDescriptor()
    {
        reset();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const noexcept
    {
        return m_fd;
    }

    void reset() noexcept
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    void assign(int fd) noexcept
    {
        reset();
        m_fd = fd;
    }

private:
    int m_fd{-1};
};

void make_pipe(FileDescriptor& read_end, FileDescriptor& write_end)
{
    // Close-on-exec from creation so children forked by other Sessions never inherit it
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        throw SessionSetupError(std::string("pipe failed: ") + std::strerror(errno));
    }
    read_end.assign(fds[0]);
    write_end.assign(fds[1]);
}

/// Runs in the forked child; only async-signal-safe calls are made.
[[noreturn]] void exec_child(const ProcessSpec& spec, char* const* argv, char** envp, int output_fd,
                             int launch_fd)
{
    ::setpgid(0, 0);

    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0)
    {
        ::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }
    ::dup2(output_fd, STDOUT_FILENO);
    ::dup2(output_fd, STDERR_FILENO);

    int report[2] = {0, 0};
    if (!spec.working_directory.empty() && ::chdir(spec.working_directory.c_str()) != 0)
    {
        report[0] = k_stage_chdir;
        report[1] = errno;
        ssize_t ignored = ::write(launch_fd, report, sizeof(report));
        (void)ignored;
        ::_exit(127);
    }

    environ = envp;
    ::execvp(argv[0], argv);

    report[0] = k_stage_exec;
    report[1] = errno;
    ssize_t ignored = ::write(launch_fd, report, sizeof(report));
    (void)ignored;
    ::_exit(127);
}

void signal_group(pid_t pid, int sig)
{
    if (::killpg(pid, sig) != 0 && errno != ESRCH)
    {
        JOBTMPL_LOG_WARN("killpg(" + std::to_string(pid) + ", " + std::to_string(sig) +
                         ") failed: " + std::strerror(errno));
    }
}

bool group_alive(pid_t pid)
{
    return ::killpg(pid, 0) == 0 || errno == EPERM;
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec, const OutputLineHandler& on_line,
                          const std::atomic<bool>* cancel_flag)
{
    ProcessResult result;
    const auto start = Clock::now();

    if (spec.command.empty())
    {
        result.launch_error = "empty command";
        return result;
    }

    // Everything the child needs is built before fork()
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = spec.environment;
    std::vector<char*> envp;
    for (auto& entry : env_storage)
    {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    FileDescriptor output_read;
    FileDescriptor output_write;
    FileDescriptor launch_read;
    FileDescriptor launch_write;
    make_pipe(output_read, output_write);
    make_pipe(launch_read, launch_write);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        throw SessionSetupError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0)
    {
        exec_child(spec, argv.data(), envp.data(), output_write.get(), launch_write.get());
    }

    // Both sides call setpgid so killpg works whichever runs first
    ::setpgid(pid, pid);
    output_write.reset();
    launch_write.reset();

    int report[2] = {0, 0};
    ssize_t report_size;
    do
    {
        report_size = ::read(launch_read.get(), report, sizeof(report));
    } while (report_size < 0 && errno == EINTR);
    launch_read.reset();

    if (report_size == static_cast<ssize_t>(sizeof(report)))
    {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        result.launch_error = (report[0] == k_stage_chdir ? "cannot enter working directory '" +
                                                                spec.working_directory.string() + "': "
                                                          : "cannot execute '" + spec.command + "': ") +
                              std::strerror(report[1]);
        result.duration = Clock::now() - start;
        return result;
    }
    result.launched = true;

    ::fcntl(output_read.get(), F_SETFL, ::fcntl(output_read.get(), F_GETFL) | O_NONBLOCK);

    std::optional<Clock::time_point> deadline;
    if (spec.timeout.has_value())
    {
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
        if (*spec.timeout < headroom)
        {
            deadline = start + *spec.timeout;
        }
    }
    std::optional<Clock::time_point> kill_deadline;
    bool cancel_started = false;
    bool killed = false;
    bool exited = false;
    bool pipe_open = true;
    int status = 0;
    LineSplitter splitter;
    char buffer[4096];

    auto begin_cancel = [&](Clock::time_point now) {
        cancel_started = true;
        if (spec.cancelation.mode == CancelationMode::NotifyThenTerminate)
        {
            JOBTMPL_LOG_DEBUG("Sending SIGTERM to process group " + std::to_string(pid));
            signal_group(pid, SIGTERM);
            kill_deadline = now + spec.cancelation.notify_period;
        }
        else
        {
            JOBTMPL_LOG_DEBUG("Sending SIGKILL to process group " + std::to_string(pid));
            signal_group(pid, SIGKILL);
            killed = true;
        }
    };

    // Returns false once the pipe reports end of file or no more data
    auto read_available = [&]() {
        while (pipe_open)
        {
            const ssize_t n = ::read(output_read.get(), buffer, sizeof(buffer));
            if (n > 0)
            {
                for (const auto& line : splitter.feed(buffer, static_cast<size_t>(n)))
                {
                    on_line(line);
                }
                continue;
            }
            if (n == 0)
            {
                pipe_open = false;
                output_read.reset();
                break;
            }
            if (errno == EINTR)
            {
                continue;
            }
            // EAGAIN or a real error: nothing more to read now
            if (errno != EAGAIN && errno != EWOULDBLOCK)
            {
                pipe_open = false;
                output_read.reset();
            }
            break;
        }
    };

    while (true)
    {
        if (!exited)
        {
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid)
            {
                exited = true;
            }
            else if (r < 0 && errno != EINTR)
            {
                JOBTMPL_LOG_ERROR(std::string("waitpid failed: ") + std::strerror(errno));
                exited = true;
            }
        }
        if (exited)
        {
            // Output still buffered in the pipe belongs to this action
            read_available();
            if (!cancel_started || killed || !group_alive(pid))
            {
                break;
            }
            // The child is gone but the rest of its group ignored SIGTERM
        }

        const auto now = Clock::now();
        if (!cancel_started)
        {
            if (cancel_flag != nullptr && cancel_flag->load(std::memory_order_acquire))
            {
                result.canceled = true;
                begin_cancel(now);
            }
            else if (deadline.has_value() && now >= *deadline)
            {
                result.timed_out = true;
                begin_cancel(now);
            }
        }
        else if (!killed && kill_deadline.has_value() && now >= *kill_deadline)
        {
            JOBTMPL_LOG_DEBUG("Notify period elapsed; sending SIGKILL to process group " +
                              std::to_string(pid));
            signal_group(pid, SIGKILL);
            killed = true;
        }

        auto wait = k_poll_interval;
        if (!cancel_started && deadline.has_value())
        {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                std::chrono::milliseconds(1);
            wait = std::max(std::chrono::milliseconds(1), std::min(wait, remaining));
        }

        if (pipe_open)
        {
            struct pollfd pfd;
            pfd.fd = output_read.get();
            pfd.events = POLLIN;
            pfd.revents = 0;
            const int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
            if (ready > 0)
            {
                read_available();
            }
        }
        else
        {
            std::this_thread::sleep_for(wait);
        }
    }

    if (auto rest = splitter.flush())
    {
        on_line(*rest);
    }

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.term_signal = WTERMSIG(status);
    }
    result.duration = Clock::now() - start;
    return result;
}

} // namespace jobtmpl
