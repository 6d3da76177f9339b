#include "stepflow/execution/admission_gate.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace stepflow
{

namespace
{

// Upper bound on how long a waiter sleeps before re-checking its token.
constexpr std::chrono::milliseconds kCancellationPollInterval{10};

} // namespace

AdmissionGate::AdmissionGate(size_t capacity)
    : m_capacity{capacity}
{
    if (capacity == 0)
    {
        throw StepflowError(StepflowErrorCode::InvalidArgument,
                            "AdmissionGate capacity must be at least 1");
    }
}

void AdmissionGate::acquire(size_t n, const CancellationToken& token)
{
    if (n > m_capacity)
    {
        throw StepflowError(StepflowErrorCode::InvalidArgument,
                            "Cannot acquire " + std::to_string(n) +
                                " units from a gate of capacity " + std::to_string(m_capacity));
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_in_use + n > m_capacity)
    {
        token.throw_if_cancelled("Admission");

        auto wake_at = std::chrono::steady_clock::now() + kCancellationPollInterval;
        if (auto deadline = token.deadline())
        {
            wake_at = std::min(wake_at, *deadline);
        }
        m_released.wait_until(lock, wake_at);
    }
    // Capacity is available, but a fired token still wins.
    token.throw_if_cancelled("Admission");
    m_in_use += n;
}

bool AdmissionGate::try_acquire(size_t n)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_use + n > m_capacity)
    {
        return false;
    }
    m_in_use += n;
    return true;
}

void AdmissionGate::release(size_t n) noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (n > m_in_use)
        {
            spdlog::error("AdmissionGate: releasing {} units but only {} are held", n, m_in_use);
            m_in_use = 0;
        }
        else
        {
            m_in_use -= n;
        }
    }
    m_released.notify_all();
}

size_t AdmissionGate::in_use() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_use;
}

} // namespace stepflow
