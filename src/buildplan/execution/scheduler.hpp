/**
 * @file scheduler.hpp
 * @brief Scheduler: selects eligible nodes and applies reported outcomes.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/task_graph.hpp"
#include "buildplan/execution/execution_result.hpp"
#include "buildplan/execution/failure_policy.hpp"

namespace buildplan
{

/**
 * @brief Configuration for scheduler behavior.
 */
struct SchedulerConfig
{
    /**
     * @brief Maximum number of nodes executing at the same time.
     * @details Values below 1 are treated as 1.
     */
    size_t max_parallel{1};

    /**
     * @brief Whether build_result() fills per-node durations.
     */
    bool collect_timing{false};
};

/**
 * @brief Immutable snapshot handed to whoever runs a node's action.
 */
struct DispatchTicket
{
    NodeIdx node{};
    TaskPtr task;
    std::string identity_path;
};

/**
 * @brief Message posted back to the coordinator when an action finishes.
 */
struct TaskCompletion
{
    NodeIdx node{};

    /// The outcome reported by the action. Ignored if `fault` is set.
    TaskResult result{};

    /// Exception thrown by the action, if any.
    std::exception_ptr fault{};

    std::chrono::nanoseconds duration{0};
};

/**
 * @brief True if two resource sets contain overlapping locations.
 *
 * @details
 * Two locations overlap when they are equal or when one is a prefix of the
 * other ending at a `/` boundary ("out/lib" overlaps "out/lib/a" but not
 * "out/library").
 */
bool resources_overlap(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief The coordinator of a run over a validated, propagated TaskGraph.
 *
 * @details
 * The scheduler owns every node-state mutation of a run. It is driven by an
 * executor through a poll/report protocol:
 * 1. `select_ready()` returns the nodes to start now, already moved to
 *    `Executing`.
 * 2. The executor runs each ticket's action (inline or on workers) and posts a
 *    `TaskCompletion` per ticket.
 * 3. `report_outcome()` records the completion and applies the failure policy.
 * 4. Repeat until `is_finished()`.
 *
 * @par Selection
 * Candidates are visited in the graph's execution order. A candidate must be
 * `is_ready()` and have all dependency, must and finalizing successors
 * complete. A candidate with an unsuccessful dependency is moved to
 * `Skipped` (reason `UpstreamFailure`) instead of being dispatched. A candidate
 * whose resources overlap those of an executing node is passed over for this
 * step.
 *
 * @par Finalizers
 * When a node is dispatched its finalizers, with their dependency closure,
 * are enforced (`MustRun`). Required finalizers and their dependency closure
 * are never abandoned or cancelled, even when the node they finalize is; they
 * run once that node is terminal.
 *
 * @par Thread Safety
 * - No internal synchronization. Call from the coordinator thread only.
 */
class Scheduler
{
public:
    /**
     * @brief Construct a scheduler.
     * @throw GraphError with `InvalidState` if the graph is not validated or
     *        the policy is null.
     */
    Scheduler(TaskGraph& graph, std::shared_ptr<IFailurePolicy> policy, SchedulerConfig config = {});

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Select and start every node that may start now.
     *
     * @return Tickets in execution order; empty if nothing is eligible.
     * @throw GraphError with `InvariantViolation` if nothing is eligible,
     *        nothing is in flight and the run is not finished.
     */
    std::vector<DispatchTicket> select_ready();

    /**
     * @brief Select and start at most one node.
     * @return The ticket, or nullopt if nothing may start now.
     */
    std::optional<DispatchTicket> select_next();

    /**
     * @brief Record the outcome of a dispatched node.
     * @throw GraphError with `InvariantViolation` if the node is not in flight.
     */
    void report_outcome(const TaskCompletion& completion);

    /**
     * @brief Cancel every required node that has not started.
     * @details Required finalizers, their dependencies and enforced
     * (`MustRun`) nodes still run. In-flight nodes finish.
     */
    void request_stop();

    bool stop_requested() const noexcept
    {
        return m_stop_requested;
    }

    /**
     * @brief True once the fail-fast policy abandoned pending work.
     */
    bool halted() const noexcept
    {
        return m_halted;
    }

    /**
     * @brief True if every node is complete and nothing is in flight.
     */
    bool is_finished() const;

    size_t in_flight() const noexcept
    {
        return m_in_flight.size();
    }

    /**
     * @brief Assemble the result of the run so far.
     */
    ExecutionResult build_result(std::chrono::nanoseconds total_duration) const;

    const TaskGraph& graph() const noexcept
    {
        return m_graph;
    }

private:
    bool conflicts_with_in_flight(const std::vector<std::string>& resources) const;

    void skip_for_upstream_failure(NodeIdx idx);

    void enforce_finalizers(NodeIdx idx);

    void check_dispatch_invariant(NodeIdx idx, const std::vector<std::string>& resources) const;

    /// Required finalizers and everything they depend on, by node index.
    std::vector<bool> required_finalizer_closure() const;

    void abandon_pending(NodeIdx failed);

    void abort_dependents(NodeIdx failed);

    /// Record a node that reached Skipped without executing.
    void record_skip(NodeIdx idx);

    TaskGraph& m_graph;
    std::shared_ptr<IFailurePolicy> m_policy;
    SchedulerConfig m_config;

    bool m_stop_requested{false};
    bool m_halted{false};

    /// Executing nodes and the resources they hold.
    std::map<NodeIdx, std::vector<std::string>> m_in_flight;

    std::vector<NodeIdx> m_completion_order;
    std::vector<NodeIdx> m_failure_order;
    std::vector<NodeIdx> m_skip_order;
    std::vector<std::chrono::nanoseconds> m_durations;
};

} // namespace buildplan
