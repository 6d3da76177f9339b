/**
 * @file admission_gate.hpp
 * @brief Counting admission control bounding concurrent step execution.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/execution/cancellation.hpp"
#include <condition_variable>

namespace stepflow
{

/**
 * @brief Bounded-capacity concurrency limiter.
 *
 * @details
 * The gate holds `capacity` units. acquire() blocks until the requested units
 * are free, release() hands them back. The in-use count never exceeds the
 * capacity and never goes negative. There is no priority or fairness beyond
 * the order in which waiters happen to wake.
 *
 * @par Thread Safety
 * - All methods are thread-safe. The gate has its own mutex and is never
 *   acquired while the scheduler's workflow mutex is held.
 */
class AdmissionGate
{
public:
    /**
     * @brief Construct a gate.
     * @throws StepflowError `InvalidArgument` if capacity is 0.
     */
    explicit AdmissionGate(size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /**
     * @brief Block until `n` units are available, then take them.
     * @param n Units to acquire.
     * @param token Cancellation signal observed while waiting.
     * @throws StepflowError `Cancelled` or `DeadlineExceeded` if the token
     *         fires first (nothing is acquired), `InvalidArgument` if `n`
     *         exceeds the capacity.
     */
    void acquire(size_t n, const CancellationToken& token = {});

    /**
     * @brief Take `n` units if they are available right now.
     * @return True if the units were taken.
     */
    bool try_acquire(size_t n);

    /**
     * @brief Return `n` units. Always succeeds.
     * @note Releasing more than is held clamps the count at zero and logs an error.
     */
    void release(size_t n) noexcept;

    size_t capacity() const noexcept
    {
        return m_capacity;
    }

    size_t in_use() const;

private:
    const size_t m_capacity;
    size_t m_in_use{0};
    mutable std::mutex m_mutex;
    std::condition_variable m_released;
};

} // namespace stepflow
