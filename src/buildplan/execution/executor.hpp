/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/task_graph.hpp"
#include "buildplan/execution/execution_result.hpp"
#include "buildplan/execution/scheduler.hpp"

namespace buildplan
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          Ignored by SingleThreadedExecutor.
     */
    size_t thread_count{1};

    /**
     * @brief What happens to the rest of the run after a failure.
     */
    FailurePolicyKind failure_policy{FailurePolicyKind::FailFast};

    /**
     * @brief Whether to collect per-node timing.
     */
    bool collect_timing{false};
};

/**
 * @brief Interface for task graph executors.
 *
 * @details
 * IExecutor defines the contract for running a TaskGraph whose requirements
 * have already been propagated. Implementations may be single-threaded or
 * multi-threaded; in both cases the calling thread is the coordinator and is
 * the only thread that touches node state.
 *
 * @par Thread Safety
 * - execute() may be called from any thread, one run at a time.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Execute a task graph.
     * @param graph A validated graph with requirements propagated.
     * @return ExecutionResult with outcome details.
     * @throw GraphError for configuration faults. Task failures never throw.
     */
    virtual ExecutionResult execute(TaskGraph& graph) = 0;

    /**
     * @brief Request graceful stop of execution.
     *
     * @details
     * Pending required nodes are cancelled on the coordinator's next step.
     * In-progress actions complete normally and enforced finalizers still
     * run. This is cooperative, not preemptive.
     */
    virtual void request_stop() = 0;

    /**
     * @brief Check if stop has been requested.
     * @return True if request_stop() has been called.
     */
    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides common functionality for executors including:
 * - Stop request handling
 * - Scheduler creation from the configuration
 * - Running a ticket's action with fault capture and timing
 *
 * Derived classes implement the actual dispatch and worker management.
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);
    virtual ~Executor() = default;

    void request_stop() override;
    bool stop_requested() const noexcept override;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Run the action of a dispatched node.
     *
     * @details
     * Never throws: an exception escaping the action is captured in
     * `TaskCompletion::fault`. Safe to call from any thread.
     */
    static TaskCompletion run_ticket(const DispatchTicket& ticket, bool collect_timing);

protected:
    /**
     * @brief Create the scheduler for one run.
     * @param graph The graph to run.
     * @param max_parallel Concurrency limit for the run.
     */
    std::unique_ptr<Scheduler> make_scheduler(TaskGraph& graph, size_t max_parallel) const;

    /**
     * @brief Forward a pending stop request to the scheduler.
     */
    void apply_stop_request(Scheduler& scheduler) const;

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace buildplan
