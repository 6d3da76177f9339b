/**
 * @file cancellation.hpp
 * @brief Externally supplied cancellation and deadline signal.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/stepflow_exceptions.hpp"

namespace stepflow
{

class CancellationSource;

/**
 * @brief Read side of a cancellation signal.
 *
 * @details
 * A token fires either when its source calls cancel() or when its deadline
 * passes. A default-constructed token never fires.
 *
 * @par Thread Safety
 * - All methods may be called from any thread.
 */
class CancellationToken
{
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /**
     * @brief Check whether the token has fired.
     */
    bool is_cancelled() const noexcept;

    /**
     * @brief Deadline of this token, if it has one.
     */
    std::optional<Clock::time_point> deadline() const noexcept;

    /**
     * @brief Throw the matching StepflowError if the token has fired.
     * @throws StepflowError with `Cancelled` after cancel(), or
     *         `DeadlineExceeded` once the deadline has passed.
     */
    void throw_if_cancelled(const std::string& context) const;

private:
    friend class CancellationSource;

    struct State
    {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };

    explicit CancellationToken(std::shared_ptr<const State> state)
        : m_state{std::move(state)}
    {}

    std::shared_ptr<const State> m_state;
};

/**
 * @brief Write side of a cancellation signal.
 */
class CancellationSource
{
public:
    CancellationSource();

    /**
     * @brief Create a source whose tokens also fire after `timeout`.
     */
    static CancellationSource with_timeout(std::chrono::milliseconds timeout);

    void cancel() noexcept;
    bool is_cancelled() const noexcept;
    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> m_state;
};

} // namespace stepflow
