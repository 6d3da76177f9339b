/**
 * @file workflow_tests.cpp
 * @brief Scheduler tests: ordering, concurrency limits, failure propagation,
 *        timeouts and cancellation.
 */
#include <gtest/gtest.h>
#include "stepflow/execution/workflow.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace stepflow;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class WorkflowTests : public ::testing::Test
{
protected:
    void add_step(const std::string& name, const std::string& command,
                  std::vector<std::string> depends_on = {})
    {
        m_definition.steps.push_back(StepDefinition{name, command, std::move(depends_on)});
    }

    WorkflowOptions make_options() const
    {
        return WorkflowOptions{m_config, m_recorder, std::make_shared<NullSink>()};
    }

    std::unique_ptr<Workflow> make_workflow() const
    {
        return std::make_unique<Workflow>(m_definition, make_options());
    }

    std::vector<EventKind> kinds(const std::string& step) const
    {
        return m_recorder->kinds_for(step);
    }

    /**
     * @brief Highest number of steps between RunStarted and their terminal
     *        event at any point of the recorded history.
     */
    size_t max_concurrent_from_events() const
    {
        size_t current = 0;
        size_t highest = 0;
        for (const auto& event : m_recorder->events())
        {
            if (event.kind == EventKind::RunStarted)
            {
                highest = std::max(highest, ++current);
            }
            else if (event.kind == EventKind::RunFail || event.kind == EventKind::RunSuccess ||
                     event.kind == EventKind::RunTimeout || event.kind == EventKind::RunWaitError)
            {
                --current;
            }
        }
        return highest;
    }

    WorkflowDefinition m_definition{kSupportedWorkflowVersion, {}, {}};
    SchedulerConfig m_config;
    std::shared_ptr<EventRecorder> m_recorder = std::make_shared<EventRecorder>();
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(WorkflowTests, Construction_IndexesStepsInDeclarationOrder)
{
    m_definition.metadata["owner"] = "ci";
    add_step("a", "true");
    add_step("b", "true", {"a", "a"});
    auto workflow = make_workflow();

    EXPECT_EQ(workflow->version(), "1");
    EXPECT_EQ(workflow->metadata().at("owner"), "ci");
    ASSERT_EQ(workflow->step_count(), 2u);
    EXPECT_EQ(workflow->find_step("b"), std::optional<StepIdx>(1));
    EXPECT_FALSE(workflow->find_step("zzz").has_value());
    EXPECT_EQ(workflow->step(1).dependencies(), (std::vector<StepIdx>{0}));
    EXPECT_EQ(workflow->status_of("a"), StepStatus::Idle);
    EXPECT_THROW(workflow->status_of("zzz"), std::out_of_range);
}

TEST_F(WorkflowTests, Construction_DanglingDependencyRejected)
{
    add_step("real", "true", {"ghost"});
    try
    {
        make_workflow();
        FAIL() << "Expected WorkflowValidationError";
    }
    catch (const WorkflowValidationError& e)
    {
        std::string what = e.what();
        EXPECT_NE(what.find("real"), std::string::npos);
        EXPECT_NE(what.find("ghost"), std::string::npos);
        ASSERT_NE(e.diagnostics(), nullptr);
        EXPECT_TRUE(e.diagnostics()->has(ValidationCategory::DanglingDependency));
    }
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(WorkflowTests, Construction_ZeroConcurrencyRejected)
{
    m_config.concurrency = 0;
    add_step("a", "true");
    try
    {
        make_workflow();
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::InvalidArgument);
    }
}

TEST_F(WorkflowTests, Construction_MissingNotifierRejected)
{
    add_step("a", "true");
    WorkflowOptions options{m_config, nullptr, std::make_shared<NullSink>()};
    EXPECT_THROW(Workflow workflow(m_definition, options), std::invalid_argument);
}

TEST_F(WorkflowTests, Construction_FromYamlYieldsIndependentInstances)
{
    const std::string text = R"(
version: "1"
steps:
  - name: first
    command: "true"
  - name: second
    command: "true"
    depends_on: [first]
)";
    auto one = load_workflow_from_string(text, make_options());
    auto two = load_workflow_from_string(text, make_options());

    auto result = one->run();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(one->status_of("second"), StepStatus::Success);
    EXPECT_EQ(two->status_of("first"), StepStatus::Idle);
    EXPECT_EQ(two->status_of("second"), StepStatus::Idle);
}

// =============================================================================
// Ordering
// =============================================================================

TEST_F(WorkflowTests, Run_EmptyWorkflowSucceeds)
{
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.stopped);
    EXPECT_TRUE(result.completed_steps.empty());
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(WorkflowTests, Run_DependencyOrdering)
{
    add_step("A", "true");
    add_step("B", "true", {"A"});
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.completed_steps, (std::vector<StepIdx>{0, 1}));
    EXPECT_EQ(workflow->status_of("A"), StepStatus::Success);
    EXPECT_EQ(workflow->status_of("B"), StepStatus::Success);

    auto a_done = m_recorder->index_of("A", EventKind::RunSuccess);
    auto b_started = m_recorder->index_of("B", EventKind::RunStarted);
    ASSERT_TRUE(a_done.has_value());
    ASSERT_TRUE(b_started.has_value());
    EXPECT_LT(*a_done, *b_started);
}

TEST_F(WorkflowTests, Run_DependenciesSucceedBeforeDependentIsRequested)
{
    m_config.concurrency = 4;
    add_step("fetch", "true");
    add_step("configure", "true", {"fetch"});
    add_step("lint", "true", {"fetch"});
    add_step("build", "true", {"configure"});
    add_step("package", "true", {"build", "lint"});
    auto workflow = make_workflow();
    ASSERT_TRUE(workflow->run().success);

    for (StepIdx sidx = 0; sidx < workflow->step_count(); ++sidx)
    {
        const Step& step = workflow->step(sidx);
        auto requested = m_recorder->index_of(step.name(), EventKind::RunRequested);
        ASSERT_TRUE(requested.has_value()) << step.name();
        for (StepIdx dep : step.dependencies())
        {
            auto dep_done = m_recorder->index_of(workflow->step(dep).name(), EventKind::RunSuccess);
            ASSERT_TRUE(dep_done.has_value());
            EXPECT_LT(*dep_done, *requested) << step.name();
        }
    }
}

TEST_F(WorkflowTests, Run_DeclarationOrderBreaksTies)
{
    add_step("c", "true");
    add_step("a", "true");
    add_step("b", "true");
    auto workflow = make_workflow();
    ASSERT_TRUE(workflow->run().success);

    auto c = m_recorder->index_of("c", EventKind::RunRequested);
    auto a = m_recorder->index_of("a", EventKind::RunRequested);
    auto b = m_recorder->index_of("b", EventKind::RunRequested);
    ASSERT_TRUE(c && a && b);
    EXPECT_LT(*c, *a);
    EXPECT_LT(*a, *b);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(WorkflowTests, Run_ConcurrencyLimitRespected)
{
    m_config.concurrency = 2;
    add_step("s1", "sleep 0.2");
    add_step("s2", "sleep 0.2");
    add_step("s3", "sleep 0.2");
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.completed_steps.size(), 3u);
    EXPECT_LE(max_concurrent_from_events(), 2u);
}

TEST_F(WorkflowTests, Run_IndependentStepsOverlap)
{
    m_config.concurrency = 3;
    add_step("s1", "sleep 0.3");
    add_step("s2", "sleep 0.3");
    add_step("s3", "sleep 0.3");
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_TRUE(result.success);
    EXPECT_GE(max_concurrent_from_events(), 2u);
    EXPECT_LT(result.total_duration, std::chrono::nanoseconds{900ms});
}

// =============================================================================
// Failure propagation
// =============================================================================

TEST_F(WorkflowTests, Run_FailureStopsDispatch)
{
    add_step("C", "false");
    add_step("D", "true");
    auto workflow = make_workflow();

    ExecutionResult result;
    ASSERT_NO_THROW(result = workflow->run());

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.failed_steps, (std::vector<StepIdx>{0}));
    EXPECT_EQ(result.unscheduled_steps, (std::vector<StepIdx>{1}));
    EXPECT_EQ(result.exit_statuses[0], std::optional<int>(1));
    ASSERT_EQ(result.error_messages.size(), 1u);
    EXPECT_NE(result.error_messages[0].find("status 1"), std::string::npos);

    auto events = m_recorder->events_for("C");
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, EventKind::RunFail);
    EXPECT_EQ(events.back().payload, std::optional<int>(1));
    EXPECT_TRUE(kinds("D").empty());
    EXPECT_EQ(workflow->status_of("C"), StepStatus::Failed);
    // Claimed before C failed, never dispatched.
    EXPECT_EQ(workflow->status_of("D"), StepStatus::Pending);
}

TEST_F(WorkflowTests, Run_FailureLeavesWaitingDependentIdle)
{
    m_config.concurrency = 2;
    add_step("slow", "sleep 0.3");
    add_step("C", "false");
    add_step("D", "true", {"slow"});
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.completed_steps, (std::vector<StepIdx>{0}));
    EXPECT_EQ(result.failed_steps, (std::vector<StepIdx>{1}));
    EXPECT_EQ(result.unscheduled_steps, (std::vector<StepIdx>{2}));
    EXPECT_EQ(workflow->status_of("D"), StepStatus::Idle);
    EXPECT_TRUE(kinds("D").empty());
}

TEST_F(WorkflowTests, Run_LaunchFailureIsReportedNotThrown)
{
    add_step("ghost", "/nonexistent/stepflow-binary");
    add_step("after", "true");
    auto workflow = make_workflow();

    ExecutionResult result;
    ASSERT_NO_THROW(result = workflow->run());

    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.failed_steps, (std::vector<StepIdx>{0}));
    EXPECT_FALSE(result.exit_statuses[0].has_value());
    ASSERT_EQ(result.error_messages.size(), 1u);
    EXPECT_NE(result.error_messages[0].find("/nonexistent/stepflow-binary"), std::string::npos);
    EXPECT_EQ(kinds("ghost"), (std::vector<EventKind>{EventKind::RunRequested, EventKind::RunError}));
    EXPECT_TRUE(kinds("after").empty());
}

TEST_F(WorkflowTests, Run_KeepGoingRunsIndependentBranches)
{
    m_config.abort_on_failure = false;
    add_step("broken", "false");
    add_step("dependent", "true", {"broken"});
    add_step("independent", "true");
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.stopped);
    EXPECT_EQ(result.failed_steps, (std::vector<StepIdx>{0}));
    EXPECT_EQ(result.completed_steps, (std::vector<StepIdx>{2}));
    EXPECT_EQ(result.unscheduled_steps, (std::vector<StepIdx>{1}));
    EXPECT_EQ(workflow->status_of("dependent"), StepStatus::Idle);
    EXPECT_TRUE(kinds("dependent").empty());
}

TEST_F(WorkflowTests, Run_TimeoutIsThrownAfterJoin)
{
    m_config.step_timeout = 200ms;
    add_step("E", "sleep 10");
    auto workflow = make_workflow();

    auto start = std::chrono::steady_clock::now();
    try
    {
        workflow->run();
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::DeadlineExceeded);
        EXPECT_NE(std::string(e.what()).find("E"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_EQ(workflow->status_of("E"), StepStatus::Failed);
    EXPECT_EQ(kinds("E"), (std::vector<EventKind>{
                              EventKind::RunRequested, EventKind::RunStarted, EventKind::RunTimeout}));
}

TEST_F(WorkflowTests, Run_WaitFailureIsThrownAfterJoin)
{
    stepflow_test::IgnoreChildSignals ignore_children;
    add_step("W", "true");
    add_step("after", "true");
    auto workflow = make_workflow();

    try
    {
        workflow->run();
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::WaitFailed);
    }

    EXPECT_EQ(workflow->status_of("W"), StepStatus::Failed);
    EXPECT_EQ(kinds("W"), (std::vector<EventKind>{
                              EventKind::RunRequested, EventKind::RunStarted, EventKind::RunWaitError}));
    EXPECT_TRUE(kinds("after").empty());
}

TEST_F(WorkflowTests, Run_CycleLeavesStepsUnscheduled)
{
    add_step("x", "true", {"y"});
    add_step("y", "true", {"x"});
    add_step("free", "true");
    auto workflow = make_workflow();
    auto result = workflow->run();

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.stopped);
    EXPECT_EQ(result.completed_steps, (std::vector<StepIdx>{2}));
    EXPECT_EQ(result.unscheduled_steps, (std::vector<StepIdx>{0, 1}));
    EXPECT_EQ(result.summary(), "Workflow incomplete (succeeded=1, failed=0, unscheduled=2)");
}

// =============================================================================
// Stop and cancellation
// =============================================================================

TEST_F(WorkflowTests, Run_StopBeforeRunDispatchesNothing)
{
    add_step("a", "true");
    add_step("b", "true");
    auto workflow = make_workflow();
    workflow->request_stop();
    EXPECT_TRUE(workflow->stop_requested());

    auto result = workflow->run();
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.unscheduled_steps.size(), 2u);
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(WorkflowTests, Run_StopWhileRunningLetsStepFinish)
{
    add_step("slow", "sleep 0.3");
    add_step("next", "true", {"slow"});
    auto workflow = make_workflow();

    std::thread stopper([&] {
        std::this_thread::sleep_for(100ms);
        workflow->request_stop();
    });
    auto result = workflow->run();
    stopper.join();

    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.completed_steps, (std::vector<StepIdx>{0}));
    EXPECT_EQ(result.unscheduled_steps, (std::vector<StepIdx>{1}));
    EXPECT_TRUE(kinds("next").empty());
}

TEST_F(WorkflowTests, Run_SecondCallRejected)
{
    add_step("a", "true");
    auto workflow = make_workflow();
    workflow->run();

    try
    {
        workflow->run();
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::InvalidState);
    }
    EXPECT_EQ(kinds("a").size(), 3u);
}

TEST_F(WorkflowTests, Run_CancelledAdmissionThrowsAfterRunningStepFinishes)
{
    add_step("holder", "sleep 0.3");
    add_step("waiter", "true");
    auto workflow = make_workflow();
    auto source = CancellationSource::with_timeout(50ms);

    try
    {
        workflow->run(source.token());
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::DeadlineExceeded);
    }

    // The running step was joined, not abandoned.
    EXPECT_EQ(workflow->status_of("holder"), StepStatus::Success);
    EXPECT_EQ(workflow->status_of("waiter"), StepStatus::Pending);
    EXPECT_TRUE(kinds("waiter").empty());
}

TEST_F(WorkflowTests, Run_ExplicitCancelDuringAdmission)
{
    add_step("holder", "sleep 0.3");
    add_step("waiter", "true");
    auto workflow = make_workflow();
    CancellationSource source;

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        source.cancel();
    });
    try
    {
        workflow->run(source.token());
        FAIL() << "Expected StepflowError";
    }
    catch (const StepflowError& e)
    {
        EXPECT_EQ(e.code(), StepflowErrorCode::Cancelled);
    }
    canceller.join();

    EXPECT_EQ(workflow->status_of("holder"), StepStatus::Success);
    EXPECT_TRUE(kinds("waiter").empty());
}
