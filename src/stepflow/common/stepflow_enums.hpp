/**
 * @file stepflow_enums.hpp
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for step indices.
 *
 * @details
 * `StepIdx` is a type alias for `size_t` used to identify steps in a workflow's
 * step arena. Dependencies are stored as `StepIdx` values resolved at load time.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using StepIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Execution status of a step.
 *
 * @details
 * A step moves through its states monotonically and never re-enters an
 * earlier state:
 *
 *     Idle -> Pending -> Running -> { Success, Failed }
 *
 * `Pending` is the reservation state. Only the scheduler's claim routine moves
 * a step from `Idle` to `Pending`, which prevents the same step from being
 * selected twice.
 */
enum class StepStatus
{
    Idle,
    Pending,
    Running,
    Success,
    Failed
};

/**
 * @brief Kinds of lifecycle events emitted by the process runner.
 *
 * @details
 * For one execution the emitted sequence is always a prefix of
 * `RunRequested, RunStarted, {RunFail | RunWaitError | RunTimeout | RunSuccess}`,
 * with `RunError` taking the place of `RunStarted` when the launch fails.
 */
enum class EventKind
{
    RunRequested,
    RunStarted,
    RunError,
    RunFail,
    RunWaitError,
    RunTimeout,
    RunSuccess
};

/**
 * @brief Check whether a status is terminal.
 */
inline bool is_terminal(StepStatus status) noexcept
{
    return status == StepStatus::Success || status == StepStatus::Failed;
}

inline const char* to_string(StepStatus status) noexcept
{
    switch (status)
    {
        case StepStatus::Idle: return "Idle";
        case StepStatus::Pending: return "Pending";
        case StepStatus::Running: return "Running";
        case StepStatus::Success: return "Success";
        case StepStatus::Failed: return "Failed";
    }
    return "Unknown";
}

inline const char* to_string(EventKind kind) noexcept
{
    switch (kind)
    {
        case EventKind::RunRequested: return "RunRequested";
        case EventKind::RunStarted: return "RunStarted";
        case EventKind::RunError: return "RunError";
        case EventKind::RunFail: return "RunFail";
        case EventKind::RunWaitError: return "RunWaitError";
        case EventKind::RunTimeout: return "RunTimeout";
        case EventKind::RunSuccess: return "RunSuccess";
    }
    return "Unknown";
}

} // namespace stepflow
