#include "stepflow/execution/workflow.hpp"
#include "stepflow/common/workflow_loader.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <system_error>

namespace stepflow
{

namespace
{

bool propagates_out_of_run(std::optional<StepflowErrorCode> code)
{
    return code == StepflowErrorCode::WaitFailed || code == StepflowErrorCode::DeadlineExceeded;
}

long long to_millis(std::chrono::nanoseconds duration)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

} // namespace

Workflow::Workflow(const WorkflowDefinition& definition, WorkflowOptions options)
    : m_version{definition.version}
    , m_metadata{definition.metadata}
    , m_config{options.config}
    , m_runner{RunnerOptions{std::move(options.sink), std::move(options.notifier),
                             options.config.step_timeout}}
    , m_gate{options.config.concurrency}
{
    ensure_valid(definition);

    for (StepIdx sidx = 0; sidx < definition.steps.size(); ++sidx)
    {
        m_step_index.emplace(definition.steps[sidx].name, sidx);
    }

    m_steps.reserve(definition.steps.size());
    for (const auto& step_def : definition.steps)
    {
        // Duplicate references collapse; first occurrence keeps its position.
        std::vector<StepIdx> deps;
        for (const auto& dep_name : step_def.depends_on)
        {
            StepIdx dep = m_step_index.at(dep_name);
            if (std::find(deps.begin(), deps.end(), dep) == deps.end())
            {
                deps.push_back(dep);
            }
        }
        m_steps.push_back(std::make_shared<Step>(step_def.name, step_def.command, std::move(deps)));
    }
}

Workflow::~Workflow()
{
    for (auto& task : m_tasks)
    {
        if (task.joinable())
        {
            task.join();
        }
    }
}

ExecutionResult Workflow::run(const CancellationToken& token)
{
    if (m_run_started.exchange(true))
    {
        throw StepflowError(StepflowErrorCode::InvalidState, "Workflow::run() may only be called once");
    }

    auto start_time = std::chrono::steady_clock::now();
    spdlog::info("Running workflow: {} step(s), concurrency={}, step timeout={}ms",
                 m_steps.size(), m_config.concurrency, m_config.step_timeout.count());

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true)
        {
            if (m_stop_requested)
            {
                spdlog::info("Stop requested; no further steps will be dispatched");
                break;
            }
            if (all_done_locked())
            {
                break;
            }

            StepPtr next = claim_next_locked();
            if (!next)
            {
                if (m_in_flight == 0)
                {
                    // Nothing running can make the remaining steps eligible.
                    spdlog::warn("No runnable steps remain; the rest cannot be scheduled");
                    break;
                }
                m_step_finished.wait(lock);
                continue;
            }

            ++m_in_flight;
            lock.unlock();

            try
            {
                m_gate.acquire(1, token);
            }
            catch (const StepflowError& e)
            {
                spdlog::error("Admission of step '{}' aborted: {}", next->name(), e.what());
                lock.lock();
                --m_in_flight;
                record_error_locked(std::current_exception());
                break;
            }

            lock.lock();
            if (m_stop_requested)
            {
                // A failure landed while this step waited for admission.
                spdlog::info("Stop requested; step '{}' will not be dispatched", next->name());
                m_gate.release(1);
                --m_in_flight;
                break;
            }

            try
            {
                m_tasks.emplace_back([this, next] { run_dispatched(next); });
            }
            catch (const std::system_error& e)
            {
                spdlog::error("Cannot start a thread for step '{}': {}", next->name(), e.what());
                m_gate.release(1);
                --m_in_flight;
                record_error_locked(std::current_exception());
                break;
            }
        }
    }

    for (auto& task : m_tasks)
    {
        task.join();
    }
    m_tasks.clear();

    ExecutionResult result = build_result(start_time);
    spdlog::info("{} in {}ms", result.summary(), to_millis(result.total_duration));

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        error = m_error;
    }
    if (error)
    {
        std::rethrow_exception(error);
    }
    return result;
}

void Workflow::request_stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_step_finished.notify_all();
}

bool Workflow::stop_requested() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stop_requested;
}

std::optional<StepIdx> Workflow::find_step(const std::string& name) const
{
    auto it = m_step_index.find(name);
    if (it == m_step_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

StepStatus Workflow::status_of(const std::string& name) const
{
    auto sidx = find_step(name);
    if (!sidx)
    {
        throw std::out_of_range("No step named '" + name + "'");
    }
    return m_steps[*sidx]->status();
}

StepPtr Workflow::claim_next_locked()
{
    StepStatusView view(m_steps);
    for (const auto& step : m_steps)
    {
        if (step->should_run(view) && step->claim())
        {
            spdlog::debug("Claimed step '{}'", step->name());
            return step;
        }
    }
    return nullptr;
}

bool Workflow::all_done_locked() const
{
    for (const auto& step : m_steps)
    {
        if (!step->is_done())
        {
            return false;
        }
    }
    return true;
}

void Workflow::run_dispatched(const StepPtr& step)
{
    std::exception_ptr dispatch_error;
    try
    {
        step->run(m_runner);
    }
    catch (...)
    {
        dispatch_error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_in_flight;

        if (dispatch_error)
        {
            record_error_locked(dispatch_error);
        }
        else if (step->status() == StepStatus::Failed)
        {
            if (step->exit_status())
            {
                spdlog::info("Step '{}' failed with exit status {} after {}ms",
                             step->name(), *step->exit_status(), to_millis(step->duration()));
            }
            else
            {
                spdlog::info("Step '{}' failed after {}ms", step->name(), to_millis(step->duration()));
            }
            if (m_config.abort_on_failure && !m_stop_requested)
            {
                spdlog::info("Stopping dispatch after failure of step '{}'", step->name());
                m_stop_requested = true;
            }
            if (propagates_out_of_run(step->error_code()))
            {
                record_error_locked(step->exception());
            }
        }
        else
        {
            spdlog::info("Step '{}' succeeded after {}ms", step->name(), to_millis(step->duration()));
        }

        // Released only once the stop flag reflects this outcome, so a step
        // waiting for admission observes it.
        m_gate.release(1);
    }

    m_step_finished.notify_all();
}

void Workflow::record_error_locked(std::exception_ptr error)
{
    if (!m_error)
    {
        m_error = std::move(error);
    }
}

ExecutionResult Workflow::build_result(std::chrono::steady_clock::time_point start_time) const
{
    ExecutionResult result;
    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
    result.stopped = stop_requested();
    result.exit_statuses.resize(m_steps.size());
    result.step_durations.resize(m_steps.size(), std::chrono::nanoseconds{0});

    for (StepIdx sidx = 0; sidx < m_steps.size(); ++sidx)
    {
        const Step& step = *m_steps[sidx];
        result.exit_statuses[sidx] = step.exit_status();
        result.step_durations[sidx] = step.duration();

        switch (step.status())
        {
            case StepStatus::Success:
                result.completed_steps.push_back(sidx);
                break;

            case StepStatus::Failed:
                result.success = false;
                result.failed_steps.push_back(sidx);
                if (step.exception())
                {
                    try
                    {
                        std::rethrow_exception(step.exception());
                    }
                    catch (const std::exception& e)
                    {
                        result.error_messages.push_back(e.what());
                    }
                    catch (...)
                    {
                        result.error_messages.push_back("Unknown exception");
                    }
                }
                else if (step.exit_status())
                {
                    result.error_messages.push_back(
                        "Step '" + step.name() + "' exited with status " +
                        std::to_string(*step.exit_status()));
                }
                else
                {
                    result.error_messages.push_back("Unknown error");
                }
                break;

            case StepStatus::Idle:
            case StepStatus::Pending:
                result.success = false;
                result.unscheduled_steps.push_back(sidx);
                break;

            case StepStatus::Running:
                // Every dispatched thread has been joined by now
                result.success = false;
                result.failed_steps.push_back(sidx);
                result.error_messages.push_back("Step '" + step.name() + "' stuck in Running state");
                break;
        }
    }

    return result;
}

WorkflowPtr load_workflow_from_file(const std::string& path, WorkflowOptions options)
{
    return std::make_shared<Workflow>(load_workflow_definition_from_file(path), std::move(options));
}

WorkflowPtr load_workflow_from_string(const std::string& text, WorkflowOptions options)
{
    return std::make_shared<Workflow>(load_workflow_definition_from_string(text), std::move(options));
}

} // namespace stepflow
