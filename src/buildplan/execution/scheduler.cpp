/**
 * @file scheduler.cpp
 */
#include "buildplan/execution/scheduler.hpp"
#include "buildplan/common/log.hpp"
#include <deque>
#include <set>

namespace buildplan
{

namespace
{

bool locations_overlap(const std::string& a, const std::string& b)
{
    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer = a.size() <= b.size() ? b : a;
    if (longer.compare(0, shorter.size(), shorter) != 0)
    {
        return false;
    }
    return longer.size() == shorter.size()
        || (!shorter.empty() && shorter.back() == '/')
        || longer[shorter.size()] == '/';
}

std::string describe_exception(const std::exception_ptr& fault)
{
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

} // namespace

bool resources_overlap(const std::vector<std::string>& a, const std::vector<std::string>& b)
{
    for (const auto& left : a)
    {
        for (const auto& right : b)
        {
            if (locations_overlap(left, right))
            {
                return true;
            }
        }
    }
    return false;
}

// ============================================================================
// Construction
// ============================================================================

Scheduler::Scheduler(TaskGraph& graph, std::shared_ptr<IFailurePolicy> policy, SchedulerConfig config)
    : m_graph{graph}
    , m_policy{std::move(policy)}
    , m_config{config}
    , m_durations(graph.node_count(), std::chrono::nanoseconds{0})
{
    if (!m_graph.is_validated())
    {
        throw GraphError(GraphErrorCode::InvalidState, "Cannot schedule a graph that has not been validated");
    }
    if (!m_policy)
    {
        throw GraphError(GraphErrorCode::InvalidState, "Scheduler requires a failure policy");
    }
    if (m_config.max_parallel == 0)
    {
        m_config.max_parallel = 1;
    }
}

// ============================================================================
// Selection
// ============================================================================

std::vector<DispatchTicket> Scheduler::select_ready()
{
    std::vector<DispatchTicket> tickets;
    while (auto ticket = select_next())
    {
        tickets.push_back(std::move(*ticket));
    }

    if (tickets.empty() && m_in_flight.empty() && !is_finished())
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "No task is eligible and none is executing, but the run is not finished");
    }
    return tickets;
}

std::optional<DispatchTicket> Scheduler::select_next()
{
    if (m_in_flight.size() >= m_config.max_parallel)
    {
        return std::nullopt;
    }

    for (NodeIdx idx : m_graph.execution_order())
    {
        TaskNode& node = m_graph.node(idx);
        if (!node.is_ready() || !m_graph.all_dependencies_complete(idx))
        {
            continue;
        }
        if (!m_graph.all_dependencies_successful(idx))
        {
            skip_for_upstream_failure(idx);
            continue;
        }

        std::vector<std::string> resources = node.task()->resources();
        if (conflicts_with_in_flight(resources))
        {
            continue;
        }

        enforce_finalizers(idx);
        check_dispatch_invariant(idx, resources);
        node.start_execution();
        m_in_flight.emplace(idx, std::move(resources));

        get_logger()->debug("Dispatching {}", node.identity_path());
        return DispatchTicket{idx, node.task(), node.identity_path()};
    }
    return std::nullopt;
}

bool Scheduler::conflicts_with_in_flight(const std::vector<std::string>& resources) const
{
    if (resources.empty())
    {
        return false;
    }
    for (const auto& [idx, held] : m_in_flight)
    {
        if (resources_overlap(resources, held))
        {
            return true;
        }
    }
    return false;
}

void Scheduler::skip_for_upstream_failure(NodeIdx idx)
{
    TaskNode& node = m_graph.node(idx);

    // Report the root cause rather than the nearest skipped dependency
    std::optional<NodeIdx> upstream;
    for (NodeIdx dep : node.dependency_successors())
    {
        const TaskNode& dep_node = m_graph.node(dep);
        if (dep_node.is_successful())
        {
            continue;
        }
        upstream = dep_node.upstream_failure().has_value() ? dep_node.upstream_failure() : dep;
        break;
    }

    if (node.state() == NodeState::ShouldRun)
    {
        node.skip_execution(SkipReason::UpstreamFailure, upstream);
    }
    else
    {
        node.abort_execution(SkipReason::UpstreamFailure, upstream);
    }
    record_skip(idx);
}

void Scheduler::enforce_finalizers(NodeIdx idx)
{
    std::set<NodeIdx> visited;
    std::deque<NodeIdx> candidates(
        m_graph.node(idx).finalizers().begin(), m_graph.node(idx).finalizers().end());

    while (!candidates.empty())
    {
        NodeIdx current = candidates.front();
        candidates.pop_front();
        if (!visited.insert(current).second)
        {
            continue;
        }

        TaskNode& node = m_graph.node(current);
        const auto& deps = node.dependency_successors();
        candidates.insert(candidates.end(), deps.begin(), deps.end());

        if (node.state() == NodeState::ShouldRun || node.state() == NodeState::MustNotRun)
        {
            get_logger()->debug("Enforcing {} (finalizes {})",
                                node.identity_path(), m_graph.node(idx).identity_path());
            node.enforce_run();
        }
    }
}

void Scheduler::check_dispatch_invariant(NodeIdx idx, const std::vector<std::string>& resources) const
{
    const TaskNode& node = m_graph.node(idx);
    if (!m_graph.all_dependencies_complete(idx))
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "Task " + node.identity_path() + " dispatched before its predecessors completed");
    }
    if (m_in_flight.size() >= m_config.max_parallel || conflicts_with_in_flight(resources))
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "Task " + node.identity_path() + " dispatched beyond the concurrency or resource limits");
    }
}

// ============================================================================
// Outcomes
// ============================================================================

void Scheduler::report_outcome(const TaskCompletion& completion)
{
    auto it = m_in_flight.find(completion.node);
    if (it == m_in_flight.end())
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "Outcome reported for node " + std::to_string(completion.node) + " which is not executing");
    }
    m_in_flight.erase(it);

    NodeIdx idx = completion.node;
    TaskNode& node = m_graph.node(idx);
    m_durations[idx] = completion.duration;

    if (completion.fault)
    {
        node.set_execution_failure(completion.fault);
    }
    else if (completion.result.outcome == TaskOutcome::Failure)
    {
        node.set_task_failure(completion.result.message);
    }
    else if (completion.result.outcome == TaskOutcome::Skipped)
    {
        node.set_action_skipped(completion.result.message);
    }
    node.finish_execution();
    m_completion_order.push_back(idx);

    if (!node.is_failed())
    {
        get_logger()->debug("Finished {}{}", node.identity_path(), node.action_skipped() ? " (up-to-date)" : "");
        return;
    }

    m_failure_order.push_back(idx);
    if (completion.fault)
    {
        get_logger()->warn("Task {} failed with an execution fault: {}",
                           node.identity_path(), describe_exception(completion.fault));
    }
    else
    {
        get_logger()->warn("Task {} failed: {}", node.identity_path(), completion.result.message);
    }

    FailureDecision decision = m_policy->on_failure(m_graph, idx);
    if (decision.abandon_pending)
    {
        abandon_pending(idx);
    }
    if (decision.abort_dependents)
    {
        abort_dependents(idx);
    }
}

std::vector<bool> Scheduler::required_finalizer_closure() const
{
    std::vector<bool> closure(m_graph.node_count(), false);
    std::deque<NodeIdx> queue;
    for (NodeIdx idx = 0; idx < m_graph.node_count(); ++idx)
    {
        const TaskNode& node = m_graph.node(idx);
        if (node.is_ready() && !node.finalizing_successors().empty())
        {
            closure[idx] = true;
            queue.push_back(idx);
        }
    }

    while (!queue.empty())
    {
        NodeIdx current = queue.front();
        queue.pop_front();
        for (NodeIdx dep : m_graph.node(current).dependency_successors())
        {
            if (!closure[dep])
            {
                closure[dep] = true;
                queue.push_back(dep);
            }
        }
    }
    return closure;
}

void Scheduler::abandon_pending(NodeIdx failed)
{
    m_halted = true;
    const std::vector<bool> exempt = required_finalizer_closure();
    size_t count = 0;
    for (NodeIdx idx : m_graph.execution_order())
    {
        TaskNode& node = m_graph.node(idx);
        if (node.state() == NodeState::ShouldRun && !exempt[idx])
        {
            node.skip_execution(SkipReason::Abandoned, failed);
            record_skip(idx);
            ++count;
        }
    }
    if (count > 0)
    {
        get_logger()->info("Abandoned {} task(s) after {} failed", count, m_graph.node(failed).identity_path());
    }
}

void Scheduler::abort_dependents(NodeIdx failed)
{
    std::vector<bool> visited(m_graph.node_count(), false);
    std::deque<NodeIdx> queue{failed};
    visited[failed] = true;

    while (!queue.empty())
    {
        NodeIdx current = queue.front();
        queue.pop_front();
        for (NodeIdx pred : m_graph.node(current).dependency_predecessors())
        {
            if (visited[pred])
            {
                continue;
            }
            visited[pred] = true;
            queue.push_back(pred);

            TaskNode& node = m_graph.node(pred);
            if (node.is_ready())
            {
                node.abort_execution(SkipReason::UpstreamFailure, failed);
                record_skip(pred);
            }
        }
    }
}

void Scheduler::record_skip(NodeIdx idx)
{
    const TaskNode& node = m_graph.node(idx);
    m_skip_order.push_back(idx);
    get_logger()->debug("Skipping {} ({})", node.identity_path(), to_string(node.skip_reason()));
}

void Scheduler::request_stop()
{
    if (m_stop_requested)
    {
        return;
    }
    m_stop_requested = true;

    const std::vector<bool> exempt = required_finalizer_closure();
    size_t count = 0;
    for (NodeIdx idx : m_graph.execution_order())
    {
        TaskNode& node = m_graph.node(idx);
        if (node.state() == NodeState::ShouldRun && !exempt[idx])
        {
            node.abort_execution(SkipReason::Cancelled);
            record_skip(idx);
            ++count;
        }
    }
    get_logger()->info("Stop requested: cancelled {} pending task(s)", count);
}

bool Scheduler::is_finished() const
{
    if (!m_in_flight.empty())
    {
        return false;
    }
    for (NodeIdx idx = 0; idx < m_graph.node_count(); ++idx)
    {
        if (!m_graph.node(idx).is_complete())
        {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Result
// ============================================================================

ExecutionResult Scheduler::build_result(std::chrono::nanoseconds total_duration) const
{
    ExecutionResult result;
    result.policy = m_policy->kind();
    result.stopped = m_stop_requested;
    result.total_duration = total_duration;
    result.executed = m_completion_order;

    for (NodeIdx idx : m_completion_order)
    {
        if (m_graph.node(idx).action_skipped())
        {
            result.up_to_date.push_back(idx);
        }
    }

    for (NodeIdx idx : m_failure_order)
    {
        const TaskNode& node = m_graph.node(idx);
        NodeFailure failure;
        failure.node = idx;
        failure.identity_path = node.identity_path();
        if (node.execution_failure())
        {
            failure.kind = FailureKind::ExecutionFault;
            failure.cause = describe_exception(node.execution_failure());
        }
        else
        {
            failure.kind = FailureKind::TaskFailure;
            failure.cause = node.task_failure().value_or(std::string{});
        }
        result.failures.push_back(std::move(failure));
    }

    for (NodeIdx idx : m_skip_order)
    {
        const TaskNode& node = m_graph.node(idx);
        SkippedNode skipped;
        skipped.node = idx;
        skipped.identity_path = node.identity_path();
        skipped.reason = node.skip_reason();
        if (node.upstream_failure().has_value())
        {
            skipped.upstream = m_graph.node(*node.upstream_failure()).identity_path();
        }
        result.skipped.push_back(std::move(skipped));
    }

    if (m_config.collect_timing)
    {
        result.node_durations = m_durations;
    }

    result.success = result.failures.empty() && result.skipped.empty();
    return result;
}

} // namespace buildplan
