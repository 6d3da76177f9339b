/**
 * @file workflow.hpp
 * @brief Workflow owns the steps and schedules them under dependency and
 *        concurrency constraints.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/workflow_definition.hpp"
#include "stepflow/execution/admission_gate.hpp"
#include "stepflow/execution/cancellation.hpp"
#include "stepflow/execution/execution_result.hpp"
#include "stepflow/execution/notifier.hpp"
#include "stepflow/execution/process_runner.hpp"
#include "stepflow/execution/sink.hpp"
#include "stepflow/execution/step.hpp"
#include <condition_variable>
#include <thread>
#include <unordered_map>

namespace stepflow
{

/**
 * @brief Configuration for scheduler behavior.
 */
struct SchedulerConfig
{
    /**
     * @brief Maximum number of steps executing at once. Must be at least 1.
     */
    size_t concurrency{1};

    /**
     * @brief Timeout applied to every step's process (launch plus wait).
     * @details Zero means no timeout.
     */
    std::chrono::milliseconds step_timeout{0};

    /**
     * @brief Whether a failed step stops further dispatch.
     * @details If true, the first failure raises the stop flag; steps already
     *          running finish, nothing new starts. If false, independent
     *          branches keep running and only the failed step's dependents
     *          stay Idle.
     */
    bool abort_on_failure{true};
};

/**
 * @brief Collaborators and configuration supplied by the caller.
 */
struct WorkflowOptions
{
    SchedulerConfig config;
    NotifierPtr notifier;
    SinkPtr sink;
};

/**
 * @brief Dependency-aware, concurrency-bounded executor of a step set.
 *
 * @details
 * run() repeats a selection loop:
 * 1. Stop flag raised: stop dispatching.
 * 2. Every step done: stop dispatching.
 * 3. Under the workflow mutex, claim the first step (declaration order) whose
 *    dependencies all succeeded, marking it Pending.
 * 4. Nothing claimable: wait until a running step completes. If nothing is
 *    running either, the remaining steps can never become eligible and the
 *    loop ends.
 * 5. Acquire one AdmissionGate unit outside the mutex (may block; aborts the
 *    run if the cancellation token fires).
 * 6. Run the step on its own thread. On completion the thread releases the
 *    unit, raises the stop flag on failure (per abort_on_failure) and wakes
 *    the loop.
 * Finally every dispatched thread is joined before run() returns or throws.
 *
 * @par Error propagation
 * - Non-zero exits and launch failures: reported in ExecutionResult only.
 * - Timeouts (`DeadlineExceeded`), wait failures (`WaitFailed`) and admission
 *   cancellation: the first one recorded is rethrown from run() after the join.
 *
 * @par Thread Safety
 * - run() may be called once per instance, from one thread.
 * - request_stop() and the status accessors may be called from any thread.
 */
class Workflow
{
public:
    /**
     * @brief Build a workflow from a definition.
     * @throws WorkflowValidationError listing every validation issue.
     * @throws StepflowError `InvalidArgument` if concurrency is 0.
     * @throws std::invalid_argument if the notifier or sink is missing.
     */
    Workflow(const WorkflowDefinition& definition, WorkflowOptions options);

    Workflow(const Workflow&) = delete;
    Workflow& operator=(const Workflow&) = delete;

    ~Workflow();

    /**
     * @brief Execute every runnable step.
     * @param token Cancellation signal observed while waiting for admission.
     * @return ExecutionResult with the outcome of every step.
     * @throws StepflowError `DeadlineExceeded`, `WaitFailed` or `Cancelled`
     *         (see Error propagation), or `InvalidState` on a second call.
     */
    ExecutionResult run(const CancellationToken& token = {});

    /**
     * @brief Request graceful stop.
     *
     * @details
     * Raises the stop flag. Running steps complete normally; no new step is
     * dispatched. This is cooperative, not preemptive.
     */
    void request_stop();

    bool stop_requested() const;

    const std::string& version() const noexcept
    {
        return m_version;
    }

    const std::map<std::string, std::string>& metadata() const noexcept
    {
        return m_metadata;
    }

    const SchedulerConfig& config() const noexcept
    {
        return m_config;
    }

    size_t step_count() const noexcept
    {
        return m_steps.size();
    }

    /**
     * @brief Steps in declaration order, indexed by StepIdx.
     */
    const std::vector<StepPtr>& steps() const noexcept
    {
        return m_steps;
    }

    /**
     * @throws std::out_of_range for an invalid index.
     */
    const Step& step(StepIdx sidx) const
    {
        return *m_steps.at(sidx);
    }

    /**
     * @brief Look up a step index by name.
     */
    std::optional<StepIdx> find_step(const std::string& name) const;

    /**
     * @brief Current status of the named step.
     * @throws std::out_of_range if no step has that name.
     */
    StepStatus status_of(const std::string& name) const;

private:
    /**
     * @brief Claim the first eligible step. Caller holds m_mutex.
     * @return The claimed step, or nullptr.
     */
    StepPtr claim_next_locked();

    bool all_done_locked() const;

    /**
     * @brief Body of a dispatched step thread.
     */
    void run_dispatched(const StepPtr& step);

    /**
     * @brief Keep the first hard error only. Caller holds m_mutex.
     */
    void record_error_locked(std::exception_ptr error);

    ExecutionResult build_result(std::chrono::steady_clock::time_point start_time) const;

    // Definition (immutable after construction)
    std::string m_version;
    std::map<std::string, std::string> m_metadata;
    std::vector<StepPtr> m_steps;
    std::unordered_map<std::string, StepIdx> m_step_index;

    SchedulerConfig m_config;
    ProcessRunner m_runner;
    AdmissionGate m_gate;

    // Scheduling state guarded by m_mutex
    mutable std::mutex m_mutex;
    std::condition_variable m_step_finished;
    bool m_stop_requested{false};
    size_t m_in_flight{0};
    std::exception_ptr m_error{};

    std::atomic<bool> m_run_started{false};

    // Touched only by the thread inside run()
    std::vector<std::thread> m_tasks;
};

using WorkflowPtr = std::shared_ptr<Workflow>;

/**
 * @brief Load, validate and build a workflow from a YAML file.
 * @throws WorkflowLoadError, WorkflowValidationError.
 */
WorkflowPtr load_workflow_from_file(const std::string& path, WorkflowOptions options);

/**
 * @brief Load, validate and build a workflow from YAML text.
 * @throws WorkflowLoadError, WorkflowValidationError.
 */
WorkflowPtr load_workflow_from_string(const std::string& text, WorkflowOptions options);

} // namespace stepflow
