/**
 * @file task_graph.cpp
 */
#include "buildplan/common/task_graph.hpp"
#include "buildplan/common/log.hpp"

#include <deque>
#include <set>

namespace buildplan
{

// ============================================================================
// Constructor
// ============================================================================

TaskGraph::TaskGraph(bool eager_validation)
    : m_eager_validation(eager_validation)
{
}

// ============================================================================
// Node management
// ============================================================================

size_t TaskGraph::node_count() const noexcept
{
    return m_nodes.size();
}

NodeIdx TaskGraph::add_node(TaskPtr task)
{
    check_not_validated("add_node");
    if (!task)
    {
        throw GraphError(GraphErrorCode::InvalidState, "Cannot add a node without a task");
    }

    const std::string& path = task->identity_path();
    if (m_index_by_path.count(path) > 0)
    {
        throw GraphError(
            GraphErrorCode::DuplicateNode,
            "Task " + path + " has already been added to the graph");
    }

    NodeIdx idx = m_nodes.size();
    m_nodes.push_back(std::make_unique<TaskNode>(idx, std::move(task)));
    m_index_by_path.emplace(path, idx);
    return idx;
}

std::optional<NodeIdx> TaskGraph::find_node(const std::string& identity_path) const
{
    auto it = m_index_by_path.find(identity_path);
    if (it == m_index_by_path.end())
    {
        return std::nullopt;
    }
    return it->second;
}

TaskNode& TaskGraph::node(NodeIdx idx)
{
    check_node_index(idx, "Node");
    return *m_nodes[idx];
}

const TaskNode& TaskGraph::node(NodeIdx idx) const
{
    check_node_index(idx, "Node");
    return *m_nodes[idx];
}

void TaskGraph::mark_dependencies_processed(NodeIdx idx)
{
    node(idx).mark_dependencies_processed();
}

// ============================================================================
// Linking
// ============================================================================

void TaskGraph::link(NodeIdx from, NodeIdx to, EdgeKind kind)
{
    check_not_validated("link");
    check_node_index(from, "Source node");
    check_node_index(to, "Target node");

    TaskNode& from_node = *m_nodes[from];
    TaskNode& to_node = *m_nodes[to];

    if (kind == EdgeKind::ShouldRunAfter)
    {
        // Soft ordering: a self-reference or a cycle-closing edge is dropped
        if (from == to)
        {
            record_dropped_should_edge(from, to);
            return;
        }
        if (m_eager_validation)
        {
            Adjacency ordering = gating_adjacency();
            for (NodeIdx n = 0; n < m_nodes.size(); ++n)
            {
                const auto& should = m_nodes[n]->m_should_successors;
                ordering[n].insert(ordering[n].end(), should.begin(), should.end());
            }
            if (find_path(ordering, to, from).has_value())
            {
                record_dropped_should_edge(from, to);
                return;
            }
        }
        if (insert_sorted(from_node.m_should_successors, to))
        {
            get_logger()->debug("Linked {} should run after {}",
                                from_node.identity_path(), to_node.identity_path());
        }
        return;
    }

    if (from == to)
    {
        throw GraphError(
            GraphErrorCode::SelfReference,
            "Cannot link task " + from_node.identity_path() + " to itself (" +
                to_string(kind) + ")");
    }

    // A finalizer waits for the node it finalizes
    NodeIdx waiter = (kind == EdgeKind::FinalizedBy) ? to : from;
    NodeIdx waited = (kind == EdgeKind::FinalizedBy) ? from : to;

    if (m_eager_validation)
    {
        auto path = find_path(gating_adjacency(), waited, waiter);
        if (path.has_value())
        {
            std::vector<NodeIdx> cycle;
            cycle.push_back(waiter);
            cycle.insert(cycle.end(), path->begin(), path->end());
            throw CycleError(to_paths(cycle));
        }
    }

    bool inserted = false;
    switch (kind)
    {
    case EdgeKind::Dependency:
        inserted = insert_sorted(from_node.m_dependency_successors, to);
        insert_sorted(to_node.m_dependency_predecessors, from);
        break;
    case EdgeKind::MustRunAfter:
        inserted = insert_sorted(from_node.m_must_successors, to);
        break;
    case EdgeKind::FinalizedBy:
        inserted = insert_sorted(from_node.m_finalizers, to);
        insert_sorted(to_node.m_finalizing_successors, from);
        break;
    case EdgeKind::ShouldRunAfter:
        break;
    }

    if (inserted)
    {
        get_logger()->debug("Linked {} -[{}]-> {}",
                            from_node.identity_path(), to_string(kind), to_node.identity_path());
    }
}

// ============================================================================
// Queries
// ============================================================================

const std::vector<NodeIdx>& TaskGraph::successors(NodeIdx idx, EdgeKind kind) const
{
    const TaskNode& n = node(idx);
    switch (kind)
    {
    case EdgeKind::Dependency:
        return n.dependency_successors();
    case EdgeKind::MustRunAfter:
        return n.must_successors();
    case EdgeKind::ShouldRunAfter:
        return n.should_successors();
    case EdgeKind::FinalizedBy:
        return n.finalizers();
    }
    throw GraphError(GraphErrorCode::InvariantViolation, "Unhandled edge kind");
}

bool TaskGraph::all_dependencies_complete(NodeIdx idx) const
{
    const TaskNode& n = node(idx);
    auto complete = [this](NodeIdx dep) { return m_nodes[dep]->is_complete(); };

    return std::all_of(n.must_successors().begin(), n.must_successors().end(), complete)
        && std::all_of(n.dependency_successors().begin(), n.dependency_successors().end(), complete)
        && std::all_of(n.finalizing_successors().begin(), n.finalizing_successors().end(), complete);
}

bool TaskGraph::all_dependencies_successful(NodeIdx idx) const
{
    const TaskNode& n = node(idx);
    return std::all_of(
        n.dependency_successors().begin(), n.dependency_successors().end(),
        [this](NodeIdx dep) { return m_nodes[dep]->is_successful(); });
}

// ============================================================================
// Diagnostics and validation
// ============================================================================

std::shared_ptr<GraphDiagnostics> TaskGraph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<GraphDiagnostics>();

    auto add_dropped = [&](NodeIdx from, NodeIdx to) {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Warning;
        item.category = DiagnosticCategory::DroppedShouldEdge;
        item.message = "Ignoring " + m_nodes[from]->identity_path() + " should run after " +
                       m_nodes[to]->identity_path() + " as it would introduce a cycle";
        item.involved_nodes = {from, to};
        item.involved_paths = to_paths(item.involved_nodes);
        diagnostics->m_warnings.push_back(std::move(item));
    };

    for (const auto& [from, to] : m_dropped_should_edges)
    {
        add_dropped(from, to);
    }

    Adjacency ordering = gating_adjacency();
    auto cycle = find_shortest_cycle(ordering);
    if (cycle.has_value())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::Cycle;
        item.involved_nodes = *cycle;
        item.involved_paths = to_paths(*cycle);
        item.message = CycleError(item.involved_paths).what();
        diagnostics->m_errors.push_back(std::move(item));
        return diagnostics;
    }

    for (const auto& [from, to] : plan_should_edges(ordering))
    {
        add_dropped(from, to);
    }
    return diagnostics;
}

void TaskGraph::validate()
{
    Adjacency ordering = gating_adjacency();

    auto cycle = find_shortest_cycle(ordering);
    if (cycle.has_value())
    {
        CycleError error(to_paths(*cycle));
        get_logger()->error("Graph validation failed: {}", error.what());
        throw error;
    }

    auto dropped = plan_should_edges(ordering);
    for (const auto& [from, to] : dropped)
    {
        auto& edges = m_nodes[from]->m_should_successors;
        edges.erase(std::remove(edges.begin(), edges.end(), to), edges.end());
        record_dropped_should_edge(from, to);
    }

    m_execution_order = compute_execution_order(ordering);
    m_validated = true;

    get_logger()->debug("Validated task graph with {} node(s)", m_nodes.size());
}

const std::vector<NodeIdx>& TaskGraph::execution_order() const
{
    if (!m_validated)
    {
        throw GraphError(
            GraphErrorCode::InvalidState,
            "Execution order requested before the graph was validated");
    }
    return m_execution_order;
}

// ============================================================================
// Helpers
// ============================================================================

void TaskGraph::check_node_index(NodeIdx idx, const char* role) const
{
    if (idx >= m_nodes.size())
    {
        throw GraphError(
            GraphErrorCode::UnknownNode,
            std::string(role) + " index " + std::to_string(idx) + " does not exist");
    }
}

void TaskGraph::check_not_validated(const char* operation) const
{
    if (m_validated)
    {
        throw GraphError(
            GraphErrorCode::InvalidState,
            std::string("Cannot call ") + operation + "() after the graph has been validated");
    }
}

bool TaskGraph::insert_sorted(std::vector<NodeIdx>& edges, NodeIdx target) const
{
    const std::string& target_path = m_nodes[target]->identity_path();
    auto it = std::lower_bound(
        edges.begin(), edges.end(), target_path,
        [this](NodeIdx existing, const std::string& path) {
            return m_nodes[existing]->identity_path() < path;
        });
    if (it != edges.end() && *it == target)
    {
        return false;
    }
    edges.insert(it, target);
    return true;
}

std::vector<std::string> TaskGraph::to_paths(const std::vector<NodeIdx>& nodes) const
{
    std::vector<std::string> paths;
    paths.reserve(nodes.size());
    for (NodeIdx idx : nodes)
    {
        paths.push_back(m_nodes[idx]->identity_path());
    }
    return paths;
}

std::vector<NodeIdx> TaskGraph::nodes_by_path() const
{
    std::vector<NodeIdx> result;
    result.reserve(m_index_by_path.size());
    for (const auto& [path, idx] : m_index_by_path)
    {
        result.push_back(idx);
    }
    return result;
}

TaskGraph::Adjacency TaskGraph::gating_adjacency() const
{
    Adjacency adj(m_nodes.size());
    for (NodeIdx idx = 0; idx < m_nodes.size(); ++idx)
    {
        const TaskNode& n = *m_nodes[idx];
        auto& out = adj[idx];
        out.insert(out.end(), n.dependency_successors().begin(), n.dependency_successors().end());
        out.insert(out.end(), n.must_successors().begin(), n.must_successors().end());
        out.insert(out.end(), n.finalizing_successors().begin(), n.finalizing_successors().end());

        std::sort(out.begin(), out.end(), [this](NodeIdx a, NodeIdx b) {
            return m_nodes[a]->identity_path() < m_nodes[b]->identity_path();
        });
        out.erase(std::unique(out.begin(), out.end()), out.end());
    }
    return adj;
}

std::optional<std::vector<NodeIdx>> TaskGraph::find_path(
    const Adjacency& adj, NodeIdx from, NodeIdx target)
{
    if (from == target)
    {
        return std::vector<NodeIdx>{from};
    }

    // Breadth-first search so the path found is a shortest one
    constexpr NodeIdx k_unvisited = std::numeric_limits<NodeIdx>::max();
    std::vector<NodeIdx> parent(adj.size(), k_unvisited);
    std::deque<NodeIdx> queue;
    parent[from] = from;
    queue.push_back(from);

    while (!queue.empty())
    {
        NodeIdx current = queue.front();
        queue.pop_front();

        for (NodeIdx next : adj[current])
        {
            if (parent[next] != k_unvisited)
            {
                continue;
            }
            parent[next] = current;
            if (next == target)
            {
                std::vector<NodeIdx> path;
                for (NodeIdx n = target; n != from; n = parent[n])
                {
                    path.push_back(n);
                }
                path.push_back(from);
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(next);
        }
    }
    return std::nullopt;
}

std::optional<std::vector<NodeIdx>> TaskGraph::find_shortest_cycle(const Adjacency& adj) const
{
    const size_t n = adj.size();

    // Peel off every node whose successors can all be ordered; what remains
    // lies on a cycle or waits for one.
    std::vector<size_t> pending(n, 0);
    Adjacency reverse(n);
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        pending[idx] = adj[idx].size();
        for (NodeIdx succ : adj[idx])
        {
            reverse[succ].push_back(idx);
        }
    }

    std::vector<NodeIdx> ready;
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        if (pending[idx] == 0)
        {
            ready.push_back(idx);
        }
    }
    size_t processed = 0;
    while (!ready.empty())
    {
        NodeIdx idx = ready.back();
        ready.pop_back();
        ++processed;
        for (NodeIdx pred : reverse[idx])
        {
            if (--pending[pred] == 0)
            {
                ready.push_back(pred);
            }
        }
    }

    if (processed == n)
    {
        return std::nullopt;
    }

    // Restrict the search to the unresolved nodes
    Adjacency remaining(n);
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        if (pending[idx] == 0)
        {
            continue;
        }
        for (NodeIdx succ : adj[idx])
        {
            if (pending[succ] > 0)
            {
                remaining[idx].push_back(succ);
            }
        }
    }

    std::optional<std::vector<NodeIdx>> best;
    for (NodeIdx start : nodes_by_path())
    {
        if (pending[start] == 0)
        {
            continue;
        }
        for (NodeIdx succ : remaining[start])
        {
            auto path = find_path(remaining, succ, start);
            if (!path.has_value())
            {
                continue;
            }
            if (!best.has_value() || path->size() + 1 < best->size())
            {
                std::vector<NodeIdx> cycle;
                cycle.push_back(start);
                cycle.insert(cycle.end(), path->begin(), path->end());
                best = std::move(cycle);
            }
        }
    }

    if (!best.has_value())
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "Unordered nodes remain but no cycle could be traced");
    }
    return best;
}

std::vector<std::pair<NodeIdx, NodeIdx>> TaskGraph::plan_should_edges(Adjacency& ordering) const
{
    std::vector<std::pair<NodeIdx, NodeIdx>> dropped;
    for (NodeIdx from : nodes_by_path())
    {
        for (NodeIdx to : m_nodes[from]->should_successors())
        {
            if (find_path(ordering, to, from).has_value())
            {
                dropped.emplace_back(from, to);
                continue;
            }
            ordering[from].push_back(to);
        }
    }
    return dropped;
}

std::vector<NodeIdx> TaskGraph::compute_execution_order(const Adjacency& ordering) const
{
    const size_t n = ordering.size();
    std::vector<size_t> pending(n, 0);
    Adjacency reverse(n);
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        pending[idx] = ordering[idx].size();
        for (NodeIdx succ : ordering[idx])
        {
            reverse[succ].push_back(idx);
        }
    }

    auto by_path = [this](NodeIdx a, NodeIdx b) {
        return m_nodes[a]->identity_path() < m_nodes[b]->identity_path();
    };
    std::set<NodeIdx, decltype(by_path)> ready(by_path);
    for (NodeIdx idx = 0; idx < n; ++idx)
    {
        if (pending[idx] == 0)
        {
            ready.insert(idx);
        }
    }

    std::vector<NodeIdx> order;
    order.reserve(n);
    while (!ready.empty())
    {
        NodeIdx idx = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(idx);
        for (NodeIdx pred : reverse[idx])
        {
            if (--pending[pred] == 0)
            {
                ready.insert(pred);
            }
        }
    }

    if (order.size() != n)
    {
        throw GraphError(
            GraphErrorCode::InvariantViolation,
            "Execution order is incomplete after cycle checks passed");
    }
    return order;
}

void TaskGraph::record_dropped_should_edge(NodeIdx from, NodeIdx to)
{
    m_dropped_should_edges.emplace_back(from, to);
    get_logger()->warn("Ignoring {} should run after {} as it would introduce a cycle",
                       m_nodes[from]->identity_path(), m_nodes[to]->identity_path());
}

} // namespace buildplan
