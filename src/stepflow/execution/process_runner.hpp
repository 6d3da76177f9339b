/**
 * @file process_runner.hpp
 * @brief ProcessRunner executes one step's command and classifies its outcome.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/execution/notifier.hpp"
#include "stepflow/execution/sink.hpp"

namespace stepflow
{

/**
 * @brief Options shared by every execution of a runner.
 */
struct RunnerOptions
{
    /**
     * @brief Receives the child's stdout and stderr.
     */
    SinkPtr sink;

    /**
     * @brief Receives the lifecycle events.
     */
    NotifierPtr notifier;

    /**
     * @brief Limit on launch plus wait for one execution.
     * @details Zero disables the limit.
     */
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Outcome of a process that ran to completion within its timeout.
 */
struct ProcessOutcome
{
    /**
     * @brief Raw exit status; `128 + signal` if the child was killed by a
     *        signal the runner did not send.
     */
    int exit_status{0};

    bool succeeded() const noexcept
    {
        return exit_status == 0;
    }
};

/**
 * @brief Runs one command as an external process with a timeout.
 *
 * @details
 * execute() emits, in order:
 * 1. `RunRequested`
 * 2. `RunStarted`, or `RunError` followed by a `LaunchFailed` throw
 * 3. exactly one of
 *    - `RunTimeout`, then a `DeadlineExceeded` throw; the child is killed with
 *      SIGKILL. This wins over any exit status observed after the deadline.
 *    - `RunWaitError`, then a `WaitFailed` throw
 *    - `RunFail(exit_status)` for a non-zero exit (returned, not thrown)
 *    - `RunSuccess` for exit status 0
 *
 * The command is split on whitespace. The first token is the executable,
 * looked up on `PATH`; the rest are passed verbatim as arguments. There is no
 * shell, quoting or expansion.
 *
 * @par Thread Safety
 * - execute() is const and may run concurrently for different steps.
 */
class ProcessRunner
{
public:
    /**
     * @throws std::invalid_argument if the sink or notifier is missing.
     */
    explicit ProcessRunner(RunnerOptions options);

    /**
     * @brief Run `command` on behalf of `step_name`.
     * @return The outcome of a process that exited before the timeout.
     * @throws StepflowError `LaunchFailed`, `WaitFailed` or `DeadlineExceeded`.
     */
    ProcessOutcome execute(const std::string& step_name, const std::string& command) const;

    const RunnerOptions& options() const noexcept
    {
        return m_options;
    }

private:
    /**
     * @brief Deliver an event; failures are logged, never propagated.
     */
    void push(const std::string& step_name, EventKind kind,
              std::optional<int> payload = std::nullopt) const;

    RunnerOptions m_options;
};

} // namespace stepflow
