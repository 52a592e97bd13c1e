/**
 * @file task_node.cpp
 */
#include "buildplan/common/task_node.hpp"

namespace buildplan
{

TaskNode::TaskNode(NodeIdx idx, TaskPtr task)
    : m_idx{idx}
    , m_task{std::move(task)}
{
    if (!m_task)
    {
        throw GraphError(
            GraphErrorCode::InvalidState,
            "Node " + std::to_string(idx) + " created without a task");
    }
}

// ============================================================================
// Derived predicates
// ============================================================================

bool TaskNode::is_complete() const noexcept
{
    switch (m_state)
    {
    case NodeState::Executed:
    case NodeState::Skipped:
    case NodeState::Unknown:
    case NodeState::NotRequired:
    case NodeState::MustNotRun:
        return true;
    case NodeState::ShouldRun:
    case NodeState::MustRun:
    case NodeState::Executing:
        return false;
    }
    return false;
}

bool TaskNode::is_successful() const noexcept
{
    return (m_state == NodeState::Executed && !is_failed())
        || m_state == NodeState::NotRequired
        || m_state == NodeState::MustNotRun;
}

// ============================================================================
// Classification
// ============================================================================

void TaskNode::require()
{
    m_state = NodeState::ShouldRun;
}

void TaskNode::do_not_require()
{
    m_state = NodeState::NotRequired;
}

void TaskNode::must_not_run()
{
    m_state = NodeState::MustNotRun;
}

// ============================================================================
// Execution transitions
// ============================================================================

void TaskNode::enforce_run()
{
    if (m_state != NodeState::ShouldRun &&
        m_state != NodeState::MustNotRun &&
        m_state != NodeState::MustRun)
    {
        throw_illegal_transition("enforce_run");
    }
    m_state = NodeState::MustRun;
}

void TaskNode::start_execution()
{
    if (!is_ready())
    {
        throw_illegal_transition("start_execution");
    }
    m_state = NodeState::Executing;
}

void TaskNode::finish_execution()
{
    if (m_state != NodeState::Executing)
    {
        throw_illegal_transition("finish_execution");
    }
    m_state = NodeState::Executed;
}

void TaskNode::skip_execution(SkipReason reason, std::optional<NodeIdx> upstream)
{
    if (m_state != NodeState::ShouldRun)
    {
        throw_illegal_transition("skip_execution");
    }
    m_state = NodeState::Skipped;
    m_skip_reason = reason;
    m_upstream_failure = upstream;
}

void TaskNode::abort_execution(SkipReason reason, std::optional<NodeIdx> upstream)
{
    if (!is_ready())
    {
        throw_illegal_transition("abort_execution");
    }
    m_state = NodeState::Skipped;
    m_skip_reason = reason;
    m_upstream_failure = upstream;
}

// ============================================================================
// Outcome recording
// ============================================================================

void TaskNode::set_task_failure(std::string cause)
{
    if (m_state != NodeState::Executing)
    {
        throw_illegal_transition("set_task_failure");
    }
    m_task_failure = std::move(cause);
}

void TaskNode::set_execution_failure(std::exception_ptr failure)
{
    if (m_state != NodeState::Executing)
    {
        throw_illegal_transition("set_execution_failure");
    }
    m_execution_failure = std::move(failure);
}

void TaskNode::set_action_skipped(std::string reason)
{
    if (m_state != NodeState::Executing)
    {
        throw_illegal_transition("set_action_skipped");
    }
    m_action_skip_reason = std::move(reason);
}

void TaskNode::throw_illegal_transition(const char* operation) const
{
    throw GraphError(
        GraphErrorCode::IllegalStateTransition,
        std::string("Illegal transition for task ") + identity_path() + ": " +
            operation + "() called in state " + to_string(m_state));
}

} // namespace buildplan
