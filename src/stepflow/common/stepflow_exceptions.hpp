/**
 * @file stepflow_exceptions.hpp
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief Error codes for scheduling and process execution.
 */
enum class StepflowErrorCode
{
    InvalidArgument,
    InvalidState,
    LaunchFailed,
    WaitFailed,
    DeadlineExceeded,
    Cancelled
};

inline const char* to_string(StepflowErrorCode code) noexcept
{
    switch (code)
    {
        case StepflowErrorCode::InvalidArgument: return "InvalidArgument";
        case StepflowErrorCode::InvalidState: return "InvalidState";
        case StepflowErrorCode::LaunchFailed: return "LaunchFailed";
        case StepflowErrorCode::WaitFailed: return "WaitFailed";
        case StepflowErrorCode::DeadlineExceeded: return "DeadlineExceeded";
        case StepflowErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Exception class for scheduler, admission and process runner errors.
 *
 * @details
 * `StepflowError` is thrown when a step's process cannot be launched or
 * monitored, when a deadline expires, when admission is cancelled, and when an
 * operation is invoked in the wrong state. Each exception carries an error code
 * and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads (the scheduler captures it as
 *   `std::exception_ptr` in the worker thread and rethrows it from `run()`).
 */
class StepflowError : public std::exception
{
public:
    /**
     * @brief Construct a StepflowError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    StepflowError(StepflowErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    StepflowErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    StepflowErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a workflow document cannot be read or has the
 * wrong shape (syntax error, missing mandatory field, wrong node type).
 */
class WorkflowLoadError : public std::runtime_error
{
public:
    explicit WorkflowLoadError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

} // namespace stepflow
