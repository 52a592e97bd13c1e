/**
 * @file execution_tests.cpp
 * @brief Tests for the single-threaded and thread-pool executors.
 */
#include <gtest/gtest.h>
#include "buildplan/common/graph_builder.hpp"
#include "buildplan/execution/single_threaded_executor.hpp"
#include "buildplan/execution/thread_pool_executor.hpp"
#include "buildplan/planning/requirement_propagator.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace buildplan;

// =============================================================================
// Test Fixture
// =============================================================================

/**
 * @brief Records the order in which task actions start and finish.
 */
class EventLog
{
public:
    void record(const std::string& event)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<std::string> events() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    /// Position of an event, or -1 if it was never recorded.
    int position(const std::string& event) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find(m_events.begin(), m_events.end(), event);
        return it == m_events.end() ? -1 : static_cast<int>(it - m_events.begin());
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_events;
};

class ExecutionTests : public ::testing::Test
{
protected:
    /// Task that records "start<path>" and "end<path>" (e.g. "start:a") and
    /// returns `result`.
    TaskPtr task(const std::string& path,
                 TaskResult result = TaskResult::success(),
                 std::vector<std::string> resources = {})
    {
        auto created = make_task(
            path,
            [this, path, result]() {
                m_log.record("start" + path);
                m_log.record("end" + path);
                return result;
            },
            std::move(resources));
        m_builder.add_task(created);
        return created;
    }

    TaskPtr action_task(const std::string& path, FunctionTask::Action action,
                        std::vector<std::string> resources = {})
    {
        auto created = make_task(path, std::move(action), std::move(resources));
        m_builder.add_task(created);
        return created;
    }

    /// Build from the requested tasks and propagate requirements.
    TaskGraph& prepare(const std::vector<TaskPtr>& requested)
    {
        m_graph = m_builder.build(requested);
        std::vector<NodeIdx> nodes;
        for (const auto& t : requested)
        {
            nodes.push_back(*m_graph->find_node(t->identity_path()));
        }
        RequirementPropagator propagator(*m_graph);
        propagator.propagate(nodes);
        return *m_graph;
    }

    NodeState state_of(const std::string& path) const
    {
        return m_graph->node(*m_graph->find_node(path)).state();
    }

    static ExecutorConfig config(FailurePolicyKind policy, size_t threads = 1)
    {
        ExecutorConfig cfg;
        cfg.failure_policy = policy;
        cfg.thread_count = threads;
        return cfg;
    }

    GraphBuilder m_builder;
    EventLog m_log;
    std::unique_ptr<TaskGraph> m_graph;
};

// =============================================================================
// SingleThreadedExecutor Tests
// =============================================================================

TEST_F(ExecutionTests, Execute_EmptyGraph_Succeeds)
{
    auto& graph = prepare({});
    auto executor = make_single_threaded_executor();
    auto result = executor->execute(graph);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.executed.empty());
}

TEST_F(ExecutionTests, Execute_DependsOnAndMustRunAfter_ExecutesInOrder)
{
    auto a = task(":a");
    auto b = task(":b");
    auto c = task(":c");
    m_builder.depends_on(b, a);
    m_builder.must_run_after(c, b);
    auto& graph = prepare({c, b, a});

    auto result = make_single_threaded_executor()->execute(graph);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(m_log.events(), (std::vector<std::string>{
        "start:a", "end:a", "start:b", "end:b", "start:c", "end:c"}));
}

TEST_F(ExecutionTests, Execute_OnlyRequiredTasksRun)
{
    auto a = task(":a");
    auto b = task(":b");
    auto other = task(":other");
    m_builder.depends_on(b, a);
    m_builder.must_run_after(b, other);
    auto& graph = prepare({b});

    auto result = make_single_threaded_executor()->execute(graph);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.executed.size(), 2u);
    EXPECT_EQ(m_log.position("start:other"), -1);
    EXPECT_EQ(state_of(":other"), NodeState::NotRequired);
}

TEST_F(ExecutionTests, Execute_FailFast_NoNewWorkAfterFailure)
{
    auto compile = task(":compile", TaskResult::failure("syntax error"));
    auto docs = task(":docs");
    auto lint = task(":lint");
    auto cleanup = task(":zcleanup");
    m_builder.finalized_by(compile, cleanup);
    auto& graph = prepare({compile, docs, lint});

    auto result = make_single_threaded_executor(config(FailurePolicyKind::FailFast))->execute(graph);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].identity_path, ":compile");
    EXPECT_EQ(result.failures[0].kind, FailureKind::TaskFailure);
    EXPECT_EQ(result.abandoned_count(), 2u);

    // Only the finalizer starts after the failure
    int failed_at = m_log.position("end:compile");
    ASSERT_GE(failed_at, 0);
    auto events = m_log.events();
    for (size_t i = static_cast<size_t>(failed_at) + 1; i < events.size(); ++i)
    {
        if (events[i].rfind("start:", 0) == 0)
        {
            EXPECT_EQ(events[i], "start:zcleanup");
        }
    }
    EXPECT_EQ(state_of(":zcleanup"), NodeState::Executed);
    EXPECT_EQ(state_of(":docs"), NodeState::Skipped);
}

TEST_F(ExecutionTests, Execute_Continue_IndependentSubgraphCompletes)
{
    auto a1 = task(":a1", TaskResult::failure("broken"));
    auto a2 = task(":a2");
    auto b1 = task(":b1");
    auto b2 = task(":b2");
    m_builder.depends_on(a2, a1);
    m_builder.depends_on(b2, b1);
    auto& graph = prepare({a2, b2});

    auto result = make_single_threaded_executor(config(FailurePolicyKind::Continue))->execute(graph);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(state_of(":b1"), NodeState::Executed);
    EXPECT_EQ(state_of(":b2"), NodeState::Executed);
    EXPECT_EQ(state_of(":a2"), NodeState::Skipped);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].reason, SkipReason::UpstreamFailure);
    EXPECT_EQ(result.skipped[0].upstream, std::optional<std::string>(":a1"));
}

TEST_F(ExecutionTests, Execute_Continue_ReportsAllFailures)
{
    auto a = task(":a", TaskResult::failure("first"));
    auto b = task(":b", TaskResult::failure("second"));
    auto& graph = prepare({a, b});

    auto result = make_single_threaded_executor(config(FailurePolicyKind::Continue))->execute(graph);
    ASSERT_EQ(result.failures.size(), 2u);
    std::string summary = result.summary();
    EXPECT_NE(summary.find("2 failure(s)"), std::string::npos);
    EXPECT_NE(summary.find(":a (task failure): first"), std::string::npos);
    EXPECT_NE(summary.find(":b (task failure): second"), std::string::npos);
}

TEST_F(ExecutionTests, Execute_ThrowingAction_IsExecutionFault)
{
    auto a = action_task(":a", []() -> TaskResult { throw std::runtime_error("segfault in compiler"); });
    auto b = action_task(":b", []() -> TaskResult { throw 42; });
    auto& graph = prepare({a, b});

    auto result = make_single_threaded_executor(config(FailurePolicyKind::Continue))->execute(graph);
    ASSERT_EQ(result.failures.size(), 2u);
    EXPECT_EQ(result.failures[0].kind, FailureKind::ExecutionFault);
    EXPECT_EQ(result.failures[0].cause, "segfault in compiler");
    EXPECT_EQ(result.failures[1].kind, FailureKind::ExecutionFault);
    EXPECT_EQ(result.failures[1].cause, "Unknown exception");
    EXPECT_EQ(state_of(":a"), NodeState::Executed);
}

TEST_F(ExecutionTests, Execute_FinalizerRunsWhenFinalizedTaskFails)
{
    auto test = task(":test", TaskResult::failure("3 tests failed"));
    auto report = task(":report");
    m_builder.finalized_by(test, report);
    auto& graph = prepare({test});

    auto result = make_single_threaded_executor()->execute(graph);
    EXPECT_FALSE(result.success);
    EXPECT_GT(m_log.position("start:report"), m_log.position("end:test"));
    EXPECT_EQ(state_of(":report"), NodeState::Executed);
}

TEST_F(ExecutionTests, Execute_StopRequestedByAction_CancelsPending)
{
    auto executor = make_single_threaded_executor();
    auto a = action_task(":a", [&executor]() {
        executor->request_stop();
        return TaskResult::success();
    });
    auto b = task(":b");
    auto& graph = prepare({a, b});

    auto result = executor->execute(graph);
    EXPECT_TRUE(executor->stop_requested());
    EXPECT_TRUE(result.stopped);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(state_of(":a"), NodeState::Executed);
    EXPECT_EQ(state_of(":b"), NodeState::Skipped);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].reason, SkipReason::Cancelled);
}

TEST_F(ExecutionTests, Execute_CollectTiming_FillsDurations)
{
    auto a = action_task(":a", []() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return TaskResult::success();
    });
    auto& graph = prepare({a});

    ExecutorConfig cfg;
    cfg.collect_timing = true;
    auto result = make_single_threaded_executor(cfg)->execute(graph);
    ASSERT_EQ(result.node_durations.size(), 1u);
    EXPECT_GE(result.node_durations[0], std::chrono::milliseconds(5));
    EXPECT_GE(result.total_duration, result.node_durations[0]);
}

// =============================================================================
// ThreadPoolExecutor Tests
// =============================================================================

TEST_F(ExecutionTests, ThreadPool_ZeroThreadsUsesHardwareConcurrency)
{
    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 0));
    EXPECT_GE(executor.worker_count(), 1u);
}

TEST_F(ExecutionTests, ThreadPool_Diamond_RespectsDependencies)
{
    auto a = task(":a");
    auto b = task(":b");
    auto c = task(":c");
    auto d = task(":d");
    m_builder.depends_on(b, a);
    m_builder.depends_on(c, a);
    m_builder.depends_on(d, b);
    m_builder.depends_on(d, c);
    auto& graph = prepare({d});

    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 4));
    auto result = executor.execute(graph);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.executed.size(), 4u);
    EXPECT_LT(m_log.position("end:a"), m_log.position("start:b"));
    EXPECT_LT(m_log.position("end:a"), m_log.position("start:c"));
    EXPECT_LT(m_log.position("end:b"), m_log.position("start:d"));
    EXPECT_LT(m_log.position("end:c"), m_log.position("start:d"));
}

TEST_F(ExecutionTests, ThreadPool_IndependentTasksRunConcurrently)
{
    std::mutex mutex;
    std::condition_variable cv;
    int started = 0;

    // Each task waits until both have started
    auto rendezvous = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        ++started;
        cv.notify_all();
        bool both = cv.wait_for(lock, std::chrono::seconds(5), [&]() { return started == 2; });
        return both ? TaskResult::success() : TaskResult::failure("ran alone");
    };
    auto a = action_task(":a", rendezvous);
    auto b = action_task(":b", rendezvous);
    auto& graph = prepare({a, b});

    ThreadPoolExecutor executor(config(FailurePolicyKind::Continue, 2));
    auto result = executor.execute(graph);
    EXPECT_TRUE(result.success) << result.summary();
}

TEST_F(ExecutionTests, ThreadPool_OverlappingResourcesAreExclusive)
{
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    auto exclusive = [&]() {
        int now = ++running;
        int seen = max_running.load();
        while (now > seen && !max_running.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --running;
        return TaskResult::success();
    };

    std::vector<TaskPtr> tasks;
    tasks.push_back(action_task(":p1", exclusive, {"build/out"}));
    tasks.push_back(action_task(":p2", exclusive, {"build/out/classes"}));
    tasks.push_back(action_task(":p3", exclusive, {"build/out"}));
    auto& graph = prepare(tasks);

    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 3));
    auto result = executor.execute(graph);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(max_running.load(), 1);
}

TEST_F(ExecutionTests, ThreadPool_FailFast_RunsFinalizerAndAbandonsRest)
{
    auto compile = task(":compile", TaskResult::failure("syntax error"));
    auto package = task(":package");
    auto cleanup = task(":cleanup");
    m_builder.depends_on(package, compile);
    m_builder.finalized_by(compile, cleanup);
    auto& graph = prepare({package});

    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 2));
    auto result = executor.execute(graph);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(state_of(":cleanup"), NodeState::Executed);
    EXPECT_EQ(state_of(":package"), NodeState::Skipped);
    EXPECT_EQ(m_log.position("start:package"), -1);
    EXPECT_EQ(result.summary().rfind("Execution failed: :compile (task failure): syntax error", 0), 0u);
}

TEST_F(ExecutionTests, ThreadPool_StopFromWorkerWakesCoordinator)
{
    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 1));
    auto a = action_task(":a", [&executor]() {
        executor.request_stop();
        return TaskResult::success();
    });
    auto b = task(":b");
    auto& graph = prepare({a, b});

    auto result = executor.execute(graph);
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(state_of(":b"), NodeState::Skipped);
    EXPECT_EQ(m_log.position("start:b"), -1);
}

TEST_F(ExecutionTests, ThreadPool_ExecutorIsReusable)
{
    ThreadPoolExecutor executor(config(FailurePolicyKind::FailFast, 2));

    auto a = task(":a");
    auto& first = prepare({a});
    EXPECT_TRUE(executor.execute(first).success);

    GraphBuilder other;
    auto b = make_task(":b");
    other.add_task(b);
    auto second = other.build({b});
    RequirementPropagator propagator(*second);
    propagator.propagate({0});
    auto result = executor.execute(*second);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.executed.size(), 1u);
}
