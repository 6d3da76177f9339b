#include "stepflow/execution/step.hpp"
#include "stepflow/execution/process_runner.hpp"

#include <spdlog/spdlog.h>

namespace stepflow
{

StepStatus StepStatusView::status(StepIdx sidx) const
{
    return m_steps->at(sidx)->status();
}

Step::Step(std::string name, std::string command, std::vector<StepIdx> dependencies)
    : m_name{std::move(name)}
    , m_command{std::move(command)}
    , m_dependencies{std::move(dependencies)}
{}

bool Step::should_run(const StepStatusView& siblings) const
{
    if (status() != StepStatus::Idle)
    {
        return false;
    }
    for (StepIdx dep : m_dependencies)
    {
        if (siblings.status(dep) != StepStatus::Success)
        {
            return false;
        }
    }
    return true;
}

bool Step::claim()
{
    return transition_status(StepStatus::Idle, StepStatus::Pending);
}

void Step::run(const ProcessRunner& runner)
{
    if (!transition_status(StepStatus::Pending, StepStatus::Running))
    {
        throw StepflowError(StepflowErrorCode::InvalidState,
                            "Step '" + m_name + "' cannot run from status " +
                                to_string(status()));
    }

    auto start_time = std::chrono::steady_clock::now();
    StepStatus final_status = StepStatus::Failed;

    try
    {
        ProcessOutcome outcome = runner.execute(m_name, m_command);
        m_exit_status = outcome.exit_status;
        if (outcome.succeeded())
        {
            final_status = StepStatus::Success;
        }
    }
    catch (const StepflowError& e)
    {
        spdlog::debug("Step '{}' raised {}: {}", m_name, to_string(e.code()), e.what());
        m_error_code = e.code();
        m_exception = std::current_exception();
    }
    catch (const std::exception& e)
    {
        spdlog::debug("Step '{}' raised: {}", m_name, e.what());
        m_exception = std::current_exception();
    }
    catch (...)
    {
        m_exception = std::current_exception();
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    m_status.store(final_status, std::memory_order_release);
}

bool Step::transition_status(StepStatus expected, StepStatus desired)
{
    return m_status.compare_exchange_strong(expected, desired, std::memory_order_acq_rel);
}

} // namespace stepflow
