/**
 * @file task_graph.hpp
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/graph_diagnostics.hpp"
#include "buildplan/common/graph_enums.hpp"
#include "buildplan/common/graph_exceptions.hpp"
#include "buildplan/common/task_node.hpp"

namespace buildplan
{

/**
 * @brief The collection of task nodes and the edges between them.
 *
 * @details
 * `TaskGraph` owns one `TaskNode` per task and maintains four kinds of edges
 * (see `EdgeKind`). Nodes are addressed by `NodeIdx`; every edge list is kept
 * sorted by the identity path of its target so that graph walks are
 * reproducible across runs.
 *
 * @par Construction workflow
 * 1. Add nodes via `add_node()` - one per task, identity paths must be unique.
 * 2. Link nodes via `link()`.
 * 3. Mark nodes whose relations are fully linked via
 *    `mark_dependencies_processed()`.
 * 4. Call `validate()`. Construction is complete only after it passes.
 *
 * @par Ordering-significant edges
 * Dependency, must-run-after and finalizer edges gate execution order. A cycle
 * among them is a fatal `CycleError`. Should-run-after edges only influence the
 * execution order; one that would close a cycle is dropped and reported as a
 * warning in the diagnostics.
 *
 * @par Validation
 * With eager validation, `link()` rejects a gating edge that would close a
 * cycle and drops a should-run-after edge that would close one, at insertion
 * time. With lazy validation both checks happen in `validate()`. `validate()`
 * always re-checks the whole graph, so both modes end in a state where no
 * cycle exists and no surviving should-run-after edge closes one.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - During a run, the coordinator is the only writer.
 */
class TaskGraph
{
public:
    /**
     * @brief Constructor for TaskGraph.
     * @param eager_validation If true, cycles are checked on each `link()`.
     *        If false, checks are deferred until `validate()` or
     *        `get_diagnostics()`.
     */
    explicit TaskGraph(bool eager_validation = false);

    TaskGraph(const TaskGraph&) = delete;
    TaskGraph& operator=(const TaskGraph&) = delete;

    /**
     * @brief Get the current number of nodes in the graph.
     */
    size_t node_count() const noexcept;

    /**
     * @brief Add a node for a task.
     * @param task The task. Its identity path must not already be present.
     * @return Index of the new node.
     * @throw GraphError with `DuplicateNode` if the identity path exists, or
     *        `InvalidState` if the graph has already been validated.
     */
    NodeIdx add_node(TaskPtr task);

    /**
     * @brief Look up a node by the identity path of its task.
     */
    std::optional<NodeIdx> find_node(const std::string& identity_path) const;

    /**
     * @brief Access a node.
     * @throw GraphError with `UnknownNode` if idx is out of range.
     */
    TaskNode& node(NodeIdx idx);
    const TaskNode& node(NodeIdx idx) const;

    /**
     * @brief Link two nodes: "from <kind> to".
     * @param from The node declaring the relation.
     * @param to The node it refers to.
     * @param kind The relation kind.
     * @throw GraphError with `UnknownNode` if either index is invalid,
     *        `SelfReference` if from == to for a gating edge,
     *        `CycleDetected` (as `CycleError`) if a gating edge would close a
     *        cycle and eager validation is enabled, or `InvalidState` if the
     *        graph has already been validated.
     * @note Linking the same pair twice with the same kind is a no-op.
     */
    void link(NodeIdx from, NodeIdx to, EdgeKind kind);

    /**
     * @brief Mark that a node's relations have been resolved and linked.
     */
    void mark_dependencies_processed(NodeIdx idx);

    /**
     * @brief Query the targets of a node's edges of a given kind.
     * @return For `Dependency` the dependency successors, for `FinalizedBy`
     *         the finalizers, otherwise the must/should successors.
     */
    const std::vector<NodeIdx>& successors(NodeIdx idx, EdgeKind kind) const;

    /**
     * @brief True if every dependency, must and finalizing successor of the
     *        node is complete.
     */
    bool all_dependencies_complete(NodeIdx idx) const;

    /**
     * @brief True if every dependency successor of the node is successful.
     */
    bool all_dependencies_successful(NodeIdx idx) const;

    /**
     * @brief Get diagnostics information about the graph.
     * @return Cycle errors and (would-be) dropped should-run-after edges.
     */
    std::shared_ptr<GraphDiagnostics> get_diagnostics() const;

    /**
     * @brief Run the full topological check.
     *
     * @details
     * Rejects cycles among gating edges, drops should-run-after edges that
     * would close a cycle, and computes the execution order.
     *
     * @throw CycleError if gating edges form a cycle.
     */
    void validate();

    bool is_validated() const noexcept
    {
        return m_validated;
    }

    /**
     * @brief All nodes in a deterministic order compatible with every
     *        surviving edge: each node appears after the nodes it waits for.
     *        Ties are broken by identity path.
     * @throw GraphError with `InvalidState` if `validate()` has not passed.
     */
    const std::vector<NodeIdx>& execution_order() const;

    /**
     * @brief Should-run-after edges dropped so far, as (from, to) pairs.
     */
    const std::vector<std::pair<NodeIdx, NodeIdx>>& dropped_should_edges() const noexcept
    {
        return m_dropped_should_edges;
    }

private:
    using Adjacency = std::vector<std::vector<NodeIdx>>;

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    void check_node_index(NodeIdx idx, const char* role) const;

    void check_not_validated(const char* operation) const;

    /// Insert target keeping the list sorted by identity path.
    /// Returns false if target is already present.
    bool insert_sorted(std::vector<NodeIdx>& edges, NodeIdx target) const;

    std::vector<std::string> to_paths(const std::vector<NodeIdx>& nodes) const;

    /// Nodes ordered by identity path.
    std::vector<NodeIdx> nodes_by_path() const;

    /// Edges that gate execution: dependency, must and finalizing successors.
    Adjacency gating_adjacency() const;

    /// Shortest path from -> ... -> target (inclusive) over adj, if any.
    static std::optional<std::vector<NodeIdx>> find_path(
        const Adjacency& adj, NodeIdx from, NodeIdx target);

    /// Shortest closed walk among nodes that cannot be ordered.
    std::optional<std::vector<NodeIdx>> find_shortest_cycle(const Adjacency& adj) const;

    /// Add surviving should-run-after edges to ordering, returning the ones
    /// that would close a cycle.
    std::vector<std::pair<NodeIdx, NodeIdx>> plan_should_edges(Adjacency& ordering) const;

    std::vector<NodeIdx> compute_execution_order(const Adjacency& ordering) const;

    void record_dropped_should_edge(NodeIdx from, NodeIdx to);

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    bool m_eager_validation;
    bool m_validated{false};

    /// Nodes indexed by NodeIdx. Held by unique_ptr so references stay stable.
    std::vector<std::unique_ptr<TaskNode>> m_nodes;

    /// Identity path to node index. Iteration order is identity-path order.
    std::map<std::string, NodeIdx> m_index_by_path;

    std::vector<std::pair<NodeIdx, NodeIdx>> m_dropped_should_edges;

    std::vector<NodeIdx> m_execution_order;
};

} // namespace buildplan
