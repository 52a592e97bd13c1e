/**
 * @file task_node.hpp
 * @brief TaskNode: one schedulable unit and its execution-state machine.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/graph_enums.hpp"
#include "buildplan/common/graph_exceptions.hpp"
#include "buildplan/common/task_items.hpp"

namespace buildplan
{

/**
 * @brief A node of the task graph wrapping exactly one task.
 *
 * @details
 * TaskNode holds the execution state of its task and the indices of the nodes
 * it is related to. It has no knowledge of graph-wide invariants; edges are
 * inserted by `TaskGraph`, which keeps each edge list sorted by the identity
 * path of the target node and keeps dependency successors/predecessors in sync.
 *
 * @par State machine
 * | From                           | Operation            | To          |
 * |--------------------------------|----------------------|-------------|
 * | any                            | require()            | ShouldRun   |
 * | any                            | do_not_require()     | NotRequired |
 * | any                            | must_not_run()       | MustNotRun  |
 * | ShouldRun/MustNotRun/MustRun   | enforce_run()        | MustRun     |
 * | ShouldRun/MustRun              | start_execution()    | Executing   |
 * | Executing                      | finish_execution()   | Executed    |
 * | ShouldRun                      | skip_execution()     | Skipped     |
 * | ShouldRun/MustRun              | abort_execution()    | Skipped     |
 *
 * Any other transition throws `GraphError` with `IllegalStateTransition`.
 *
 * @par Thread Safety
 * - No internal synchronization. Only the coordinator mutates a node.
 */
class TaskNode
{
public:
    TaskNode(NodeIdx idx, TaskPtr task);

    TaskNode(const TaskNode&) = delete;
    TaskNode& operator=(const TaskNode&) = delete;

    NodeIdx index() const noexcept
    {
        return m_idx;
    }

    const TaskPtr& task() const noexcept
    {
        return m_task;
    }

    const std::string& identity_path() const
    {
        return m_task->identity_path();
    }

    NodeState state() const noexcept
    {
        return m_state;
    }

    // -------------------------------------------------------------------------
    // Derived predicates
    // -------------------------------------------------------------------------

    bool is_required() const noexcept
    {
        return m_state == NodeState::ShouldRun;
    }

    bool is_must_not_run() const noexcept
    {
        return m_state == NodeState::MustNotRun;
    }

    /**
     * @brief True while the node has not been classified as required.
     * @details Used by requirement propagation to decide whether to visit.
     */
    bool is_include_in_graph() const noexcept
    {
        return m_state == NodeState::Unknown || m_state == NodeState::NotRequired;
    }

    /**
     * @brief True if the node is eligible for dispatch once its edges allow.
     */
    bool is_ready() const noexcept
    {
        return m_state == NodeState::ShouldRun || m_state == NodeState::MustRun;
    }

    bool is_in_known_state() const noexcept
    {
        return m_state != NodeState::Unknown;
    }

    /**
     * @brief True if no further action is pending for this node.
     */
    bool is_complete() const noexcept;

    bool is_successful() const noexcept;

    bool is_failed() const noexcept
    {
        return m_task_failure.has_value() || m_execution_failure != nullptr;
    }

    // -------------------------------------------------------------------------
    // Classification (idempotent, most recent call wins)
    // -------------------------------------------------------------------------

    void require();
    void do_not_require();
    void must_not_run();

    // -------------------------------------------------------------------------
    // Execution transitions
    // -------------------------------------------------------------------------

    void enforce_run();
    void start_execution();
    void finish_execution();

    /**
     * @brief Skip a ShouldRun node without executing it.
     * @param reason Why the node is skipped.
     * @param upstream The node whose failure caused the skip, if any.
     */
    void skip_execution(SkipReason reason, std::optional<NodeIdx> upstream = std::nullopt);

    /**
     * @brief Abort a ShouldRun or MustRun node without executing it.
     */
    void abort_execution(SkipReason reason, std::optional<NodeIdx> upstream = std::nullopt);

    // -------------------------------------------------------------------------
    // Outcome recording (only while Executing)
    // -------------------------------------------------------------------------

    void set_task_failure(std::string cause);
    void set_execution_failure(std::exception_ptr failure);
    void set_action_skipped(std::string reason);

    const std::optional<std::string>& task_failure() const noexcept
    {
        return m_task_failure;
    }

    std::exception_ptr execution_failure() const noexcept
    {
        return m_execution_failure;
    }

    SkipReason skip_reason() const noexcept
    {
        return m_skip_reason;
    }

    std::optional<NodeIdx> upstream_failure() const noexcept
    {
        return m_upstream_failure;
    }

    /**
     * @brief True if the action ran and reported `TaskResult::skipped()`.
     */
    bool action_skipped() const noexcept
    {
        return m_action_skip_reason.has_value();
    }

    const std::optional<std::string>& action_skip_reason() const noexcept
    {
        return m_action_skip_reason;
    }

    // -------------------------------------------------------------------------
    // Construction bookkeeping
    // -------------------------------------------------------------------------

    bool dependencies_processed() const noexcept
    {
        return m_dependencies_processed;
    }

    void mark_dependencies_processed() noexcept
    {
        m_dependencies_processed = true;
    }

    // -------------------------------------------------------------------------
    // Edge sets (sorted by target identity path)
    // -------------------------------------------------------------------------

    const std::vector<NodeIdx>& dependency_successors() const noexcept
    {
        return m_dependency_successors;
    }

    const std::vector<NodeIdx>& dependency_predecessors() const noexcept
    {
        return m_dependency_predecessors;
    }

    const std::vector<NodeIdx>& must_successors() const noexcept
    {
        return m_must_successors;
    }

    const std::vector<NodeIdx>& should_successors() const noexcept
    {
        return m_should_successors;
    }

    const std::vector<NodeIdx>& finalizers() const noexcept
    {
        return m_finalizers;
    }

    const std::vector<NodeIdx>& finalizing_successors() const noexcept
    {
        return m_finalizing_successors;
    }

    // Allow TaskGraph to maintain edge sets
    friend class TaskGraph;

private:
    [[noreturn]] void throw_illegal_transition(const char* operation) const;

    NodeIdx m_idx;
    TaskPtr m_task;
    NodeState m_state{NodeState::Unknown};
    bool m_dependencies_processed{false};

    std::optional<std::string> m_task_failure;
    std::exception_ptr m_execution_failure{};
    std::optional<std::string> m_action_skip_reason;
    SkipReason m_skip_reason{SkipReason::None};
    std::optional<NodeIdx> m_upstream_failure;

    std::vector<NodeIdx> m_dependency_successors;
    std::vector<NodeIdx> m_dependency_predecessors;
    std::vector<NodeIdx> m_must_successors;
    std::vector<NodeIdx> m_should_successors;
    std::vector<NodeIdx> m_finalizers;
    std::vector<NodeIdx> m_finalizing_successors;
};

} // namespace buildplan
