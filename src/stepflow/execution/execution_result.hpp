/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by Workflow::run().
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/stepflow_enums.hpp"

namespace stepflow
{

/**
 * @brief Result of running a workflow.
 *
 * @details
 * A non-zero exit, a launch failure or a stop request does not make
 * Workflow::run() throw; this structure is where a caller finds out that the
 * workflow did not fully succeed.
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True only if every step reached Success.
     */
    bool success{true};

    /**
     * @brief True if the stop flag was raised (by a failure or request_stop()).
     */
    bool stopped{false};

    /**
     * @brief Indices of steps that completed successfully.
     */
    std::vector<StepIdx> completed_steps;

    /**
     * @brief Indices of steps that failed.
     */
    std::vector<StepIdx> failed_steps;

    /**
     * @brief Error messages for failed steps, parallel to failed_steps.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Indices of steps never dispatched (left Idle or Pending).
     * @details Includes dependents of failed steps and steps skipped after a stop.
     */
    std::vector<StepIdx> unscheduled_steps;

    /**
     * @brief Exit status per step, indexed by StepIdx.
     * @details Empty optional when the process never exited on its own.
     */
    std::vector<std::optional<int>> exit_statuses;

    /**
     * @brief Per-step durations, indexed by StepIdx.
     */
    std::vector<std::chrono::nanoseconds> step_durations;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Workflow succeeded";
        }
        else if (stopped)
        {
            result = "Workflow stopped";
        }
        else
        {
            result = "Workflow incomplete";
        }
        result += " (succeeded=" + std::to_string(completed_steps.size());
        result += ", failed=" + std::to_string(failed_steps.size());
        result += ", unscheduled=" + std::to_string(unscheduled_steps.size()) + ")";
        return result;
    }
};

} // namespace stepflow
