#include "stepflow/execution/process_runner.hpp"
#include "stepflow/common/stepflow_exceptions.hpp"
#include "stepflow/common/workflow_definition.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace stepflow
{

namespace
{

constexpr std::chrono::milliseconds kWaitPollInterval{5};

// Exit status used by the child when exec (or fd setup) fails. The parent
// learns the real reason through the status pipe.
constexpr int kExecFailedStatus = 127;

std::string errno_message(int err)
{
    return std::strerror(err);
}

/**
 * @brief Fork and exec `argv` with stdout/stderr redirected.
 *
 * @details
 * A close-on-exec pipe reports exec failures back to the parent: a successful
 * exec closes it without data, a failed one writes errno first. This lets a
 * missing binary surface as a launch error rather than as exit status 127.
 *
 * @return The child's pid.
 * @throws StepflowError `LaunchFailed`.
 */
pid_t spawn(const std::vector<std::string>& argv, int out_fd, int err_fd)
{
    // Build everything the child needs before fork(); only async-signal-safe
    // calls are made in the child.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0)
    {
        throw StepflowError(StepflowErrorCode::LaunchFailed,
                            "Cannot create status pipe: " + errno_message(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        throw StepflowError(StepflowErrorCode::LaunchFailed, "fork() failed: " + errno_message(err));
    }

    if (pid == 0)
    {
        ::close(status_pipe[0]);
        if (::dup2(out_fd, STDOUT_FILENO) >= 0 && ::dup2(err_fd, STDERR_FILENO) >= 0)
        {
            ::execvp(args[0], args.data());
        }
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(kExecFailedStatus);
    }

    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do
    {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0)
    {
        int ignored_status = 0;
        while (::waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR)
        {
        }
        throw StepflowError(StepflowErrorCode::LaunchFailed,
                            "Cannot execute '" + argv[0] + "': " + errno_message(child_errno));
    }
    return pid;
}

int exit_status_of(int wait_status)
{
    if (WIFEXITED(wait_status))
    {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status))
    {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

} // namespace

ProcessRunner::ProcessRunner(RunnerOptions options)
    : m_options{std::move(options)}
{
    if (!m_options.sink)
    {
        throw std::invalid_argument("ProcessRunner requires a sink");
    }
    if (!m_options.notifier)
    {
        throw std::invalid_argument("ProcessRunner requires a notifier");
    }
}

ProcessOutcome ProcessRunner::execute(const std::string& step_name, const std::string& command) const
{
    using Clock = std::chrono::steady_clock;

    push(step_name, EventKind::RunRequested);

    const bool has_timeout = m_options.timeout.count() > 0;
    const auto start_time = Clock::now();
    const auto deadline = start_time + m_options.timeout;

    // Launch
    pid_t pid = -1;
    try
    {
        auto argv = split_command(command);
        if (argv.empty())
        {
            throw StepflowError(StepflowErrorCode::LaunchFailed,
                                "Step '" + step_name + "' has an empty command");
        }
        pid = spawn(argv, m_options.sink->stdout_fd(), m_options.sink->stderr_fd());
    }
    catch (const StepflowError& e)
    {
        spdlog::debug("Step '{}' failed to launch: {}", step_name, e.what());
        push(step_name, EventKind::RunError);
        throw;
    }

    push(step_name, EventKind::RunStarted);
    spdlog::debug("Step '{}' started as pid {}", step_name, pid);

    // Wait
    int wait_status = 0;
    bool killed_by_timeout = false;
    while (true)
    {
        pid_t result = ::waitpid(pid, &wait_status, WNOHANG);
        if (result == pid)
        {
            break;
        }
        if (result < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            int err = errno;
            // ECHILD: the pid was reaped elsewhere and may already be reused.
            if (err != ECHILD)
            {
                ::kill(pid, SIGKILL);
                int ignored_status = 0;
                while (::waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR)
                {
                }
            }
            push(step_name, EventKind::RunWaitError);
            throw StepflowError(StepflowErrorCode::WaitFailed,
                                "Waiting for step '" + step_name + "' (pid " +
                                    std::to_string(pid) + ") failed: " + errno_message(err));
        }

        auto now = Clock::now();
        if (has_timeout && now >= deadline)
        {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR)
            {
            }
            killed_by_timeout = true;
            break;
        }

        auto sleep_for = kWaitPollInterval;
        if (has_timeout)
        {
            sleep_for = std::min(sleep_for,
                                 std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                                     std::chrono::milliseconds{1});
        }
        std::this_thread::sleep_for(sleep_for);
    }

    const auto elapsed = Clock::now() - start_time;
    if (killed_by_timeout || (has_timeout && elapsed > m_options.timeout))
    {
        push(step_name, EventKind::RunTimeout);
        throw StepflowError(StepflowErrorCode::DeadlineExceeded,
                            "Step '" + step_name + "' exceeded its timeout of " +
                                std::to_string(m_options.timeout.count()) + " ms");
    }

    ProcessOutcome outcome{exit_status_of(wait_status)};
    if (!outcome.succeeded())
    {
        push(step_name, EventKind::RunFail, outcome.exit_status);
        return outcome;
    }

    push(step_name, EventKind::RunSuccess);
    return outcome;
}

void ProcessRunner::push(const std::string& step_name, EventKind kind,
                         std::optional<int> payload) const
{
    auto event = make_event(step_name, kind, payload);
    try
    {
        if (!m_options.notifier->notify(event))
        {
            spdlog::warn("Notifier rejected event {}", event.to_string());
        }
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Notifier failed on event {}: {}", event.to_string(), e.what());
    }
    catch (...)
    {
        spdlog::warn("Notifier failed on event {}: unknown exception", event.to_string());
    }
}

} // namespace stepflow
