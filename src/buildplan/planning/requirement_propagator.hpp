/**
 * @file requirement_propagator.hpp
 * @brief Marks the nodes of a TaskGraph that have to execute.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/task_graph.hpp"

namespace buildplan
{

/**
 * @brief Predicate deciding whether a task may be scheduled at all.
 * @details Returns false for tasks excluded from the run.
 */
using TaskFilter = std::function<bool(const ITask&)>;

/**
 * @brief Backward reachability walk from the explicitly requested nodes.
 *
 * @details
 * Every requested node is required, then the walk visits its dependency
 * successors and its finalizers, requiring each visited node that is still
 * `is_include_in_graph()`. A finalizer is therefore required as soon as any
 * node it finalizes is required, whether or not it was requested itself.
 *
 * Must- and should-run-after targets are not walked: those relations order
 * nodes that are scheduled anyway but never pull a node into the run.
 *
 * Nodes rejected by the filter are classified `must_not_run()` and the walk
 * stops there. Nodes still `Unknown` when the walk ends are classified
 * `NotRequired`.
 *
 * @par Idempotence
 * Propagation may be repeated (for example with more requested nodes); a node
 * is visited at most once per pass and classifications follow the node's
 * "most recent call wins" rule.
 */
class RequirementPropagator
{
public:
    explicit RequirementPropagator(TaskGraph& graph, TaskFilter filter = {});

    /**
     * @brief Run one propagation pass.
     * @param requested Nodes explicitly requested for execution.
     * @throw GraphError with `UnknownNode` if a requested index is invalid.
     */
    void propagate(const std::vector<NodeIdx>& requested);

    /**
     * @brief Number of nodes currently classified `ShouldRun`.
     */
    size_t required_count() const;

private:
    bool is_excluded(const TaskNode& node) const;

    TaskGraph& m_graph;
    TaskFilter m_filter;
};

} // namespace buildplan
