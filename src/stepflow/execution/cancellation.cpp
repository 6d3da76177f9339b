#include "stepflow/execution/cancellation.hpp"

namespace stepflow
{

bool CancellationToken::is_cancelled() const noexcept
{
    if (!m_state)
    {
        return false;
    }
    if (m_state->cancelled.load(std::memory_order_acquire))
    {
        return true;
    }
    return m_state->deadline && Clock::now() >= *m_state->deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const noexcept
{
    if (!m_state)
    {
        return std::nullopt;
    }
    return m_state->deadline;
}

void CancellationToken::throw_if_cancelled(const std::string& context) const
{
    if (!m_state)
    {
        return;
    }
    if (m_state->cancelled.load(std::memory_order_acquire))
    {
        throw StepflowError(StepflowErrorCode::Cancelled, context + ": cancelled");
    }
    if (m_state->deadline && Clock::now() >= *m_state->deadline)
    {
        throw StepflowError(StepflowErrorCode::DeadlineExceeded, context + ": deadline exceeded");
    }
}

CancellationSource::CancellationSource()
    : m_state{std::make_shared<CancellationToken::State>()}
{}

CancellationSource CancellationSource::with_timeout(std::chrono::milliseconds timeout)
{
    CancellationSource source;
    source.m_state->deadline = CancellationToken::Clock::now() + timeout;
    return source;
}

void CancellationSource::cancel() noexcept
{
    m_state->cancelled.store(true, std::memory_order_release);
}

bool CancellationSource::is_cancelled() const noexcept
{
    return CancellationToken(m_state).is_cancelled();
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(m_state);
}

} // namespace stepflow
