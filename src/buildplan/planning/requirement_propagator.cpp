/**
 * @file requirement_propagator.cpp
 */
#include "buildplan/planning/requirement_propagator.hpp"
#include "buildplan/common/log.hpp"
#include <deque>

namespace buildplan
{

RequirementPropagator::RequirementPropagator(TaskGraph& graph, TaskFilter filter)
    : m_graph{graph}
    , m_filter{std::move(filter)}
{}

bool RequirementPropagator::is_excluded(const TaskNode& node) const
{
    return m_filter && !m_filter(*node.task());
}

void RequirementPropagator::propagate(const std::vector<NodeIdx>& requested)
{
    std::vector<bool> visited(m_graph.node_count(), false);
    std::deque<NodeIdx> worklist(requested.begin(), requested.end());

    while (!worklist.empty())
    {
        NodeIdx idx = worklist.front();
        worklist.pop_front();

        TaskNode& node = m_graph.node(idx);
        if (visited[idx])
        {
            continue;
        }
        visited[idx] = true;

        if (is_excluded(node))
        {
            get_logger()->debug("Task {} excluded by filter", node.identity_path());
            node.must_not_run();
            continue;
        }
        if (node.is_include_in_graph())
        {
            node.require();
        }
        if (!node.is_required())
        {
            continue;
        }

        for (NodeIdx dep : node.dependency_successors())
        {
            worklist.push_back(dep);
        }
        for (NodeIdx finalizer : node.finalizers())
        {
            worklist.push_back(finalizer);
        }
    }

    for (NodeIdx idx = 0; idx < m_graph.node_count(); ++idx)
    {
        TaskNode& node = m_graph.node(idx);
        if (!node.is_in_known_state())
        {
            node.do_not_require();
        }
    }

    get_logger()->debug("Requirement propagation: {} of {} node(s) required",
                        required_count(), m_graph.node_count());
}

size_t RequirementPropagator::required_count() const
{
    size_t count = 0;
    for (NodeIdx idx = 0; idx < m_graph.node_count(); ++idx)
    {
        if (m_graph.node(idx).is_required())
        {
            ++count;
        }
    }
    return count;
}

} // namespace buildplan
