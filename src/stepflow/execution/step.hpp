/**
 * @file step.hpp
 * @brief Step is the state machine around one external command.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/stepflow_enums.hpp"
#include "stepflow/common/stepflow_exceptions.hpp"

namespace stepflow
{

class ProcessRunner;
class Step;

using StepPtr = std::shared_ptr<Step>;

/**
 * @brief Read-only view of the sibling steps' statuses.
 *
 * @details
 * Handed to Step::should_run() by the scheduler so a step can check its
 * dependencies without holding a reference back to its workflow.
 */
class StepStatusView
{
public:
    explicit StepStatusView(const std::vector<StepPtr>& steps) noexcept
        : m_steps{&steps}
    {}

    StepStatus status(StepIdx sidx) const;

    size_t size() const noexcept
    {
        return m_steps->size();
    }

private:
    const std::vector<StepPtr>* m_steps;
};

/**
 * @brief Wraps one command with its dependencies and execution status.
 *
 * @details
 * Step handles:
 * - Eligibility: should_run() is true only when Idle and every dependency
 *   is Success.
 * - Reservation: claim() performs Idle -> Pending. The scheduler calls it
 *   under its workflow mutex.
 * - Execution: run() performs Pending -> Running, calls the ProcessRunner and
 *   records Success or Failed.
 *
 * Transitions are monotonic and the command runs at most once. A Failed step
 * is never retried.
 *
 * @par Ownership Model
 * - Workflow owns all Step instances via shared_ptr, in declaration order.
 * - Dependencies are indices into that arena, fixed at construction.
 *
 * @par Thread Safety
 * - Status uses an atomic; transitions use compare-exchange.
 * - Results (exit status, exception, duration) are written once by the
 *   thread running the step, before the terminal status is published.
 */
class Step
{
public:
    /**
     * @brief Construct a Step.
     * @param name Unique name within the workflow.
     * @param command Command line to execute.
     * @param dependencies Indices of the steps that must succeed first.
     */
    Step(std::string name, std::string command, std::vector<StepIdx> dependencies);

    // Non-copyable, non-movable
    Step(const Step&) = delete;
    Step(Step&&) = delete;
    Step& operator=(const Step&) = delete;
    Step& operator=(Step&&) = delete;

    /**
     * @brief Check if the step may be claimed.
     * @param siblings Statuses of every step in the workflow.
     * @return True if Idle and every dependency is Success.
     */
    bool should_run(const StepStatusView& siblings) const;

    /**
     * @brief Check if the step has reached Success or Failed.
     */
    bool is_done() const noexcept
    {
        return is_terminal(status());
    }

    /**
     * @brief Transition from Idle to Pending.
     * @return True if the transition succeeded.
     */
    bool claim();

    /**
     * @brief Execute this step (called by the dispatched task).
     *
     * @details
     * 1. Transition Pending -> Running
     * 2. Call runner.execute()
     * 3. Record exit status, or capture the thrown error
     * 4. Transition to Success or Failed
     *
     * Errors from the runner are captured, not thrown; see exception().
     *
     * @throws StepflowError `InvalidState` if the step is not Pending.
     */
    void run(const ProcessRunner& runner);

    StepStatus status() const noexcept
    {
        return m_status.load(std::memory_order_acquire);
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

    const std::string& command() const noexcept
    {
        return m_command;
    }

    const std::vector<StepIdx>& dependencies() const noexcept
    {
        return m_dependencies;
    }

    /**
     * @brief Exit status, if the process ran to completion.
     */
    std::optional<int> exit_status() const noexcept
    {
        return m_exit_status;
    }

    /**
     * @brief Get the captured error (launch, wait or timeout failure).
     * @return exception_ptr, or nullptr for a normal exit.
     */
    std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Code of the captured StepflowError, if the runner threw one.
     */
    std::optional<StepflowErrorCode> error_code() const noexcept
    {
        return m_error_code;
    }

    /**
     * @brief Wall-clock time spent in the runner, or zero if never run.
     */
    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

private:
    bool transition_status(StepStatus expected, StepStatus desired);

    // Configuration (immutable after construction)
    std::string m_name;
    std::string m_command;
    std::vector<StepIdx> m_dependencies;

    // Execution state (atomic)
    std::atomic<StepStatus> m_status{StepStatus::Idle};

    // Results (written once before the terminal status is stored)
    std::optional<int> m_exit_status;
    std::exception_ptr m_exception{};
    std::optional<StepflowErrorCode> m_error_code;
    std::chrono::nanoseconds m_duration{0};
};

} // namespace stepflow
