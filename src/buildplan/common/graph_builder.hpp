/**
 * @file graph_builder.hpp
 * @brief GraphBuilder turns task declarations into a validated TaskGraph.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/task_graph.hpp"
#include "buildplan/common/task_items.hpp"

namespace buildplan
{

/**
 * @brief Builder class that bridges task objects to the index-based TaskGraph.
 *
 * @details
 * GraphBuilder records the relations declared between tasks, keyed by the
 * identity path of the declaring task, and materializes the part of them that
 * is reachable from a set of requested tasks.
 *
 * @par Usage
 * 1. Create a GraphBuilder with eager or deferred validation.
 * 2. Register tasks via add_task() (optional; tasks named in a relation are
 *    registered automatically).
 * 3. Declare relations via depends_on(), must_run_after(), should_run_after()
 *    and finalized_by().
 * 4. Optionally install a DependencyResolver for dependencies that are only
 *    known once the task is about to be scheduled.
 * 5. Call build() with the requested tasks.
 *
 * @par Graph closure
 * build() walks from the requested tasks over dependency and finalizer
 * relations. Tasks named only as must/should-run-after targets get a node (so
 * the ordering can be honored should they be scheduled) but their own
 * relations are not walked unless they are reached another way.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class GraphBuilder
{
public:
    /**
     * @brief Resolves additional dependencies of a task on demand.
     * @details Invoked at most once per node during build().
     */
    using DependencyResolver = std::function<std::vector<TaskPtr>(const ITask&)>;

    /**
     * @brief Construct a GraphBuilder.
     * @param eager_validation If true, cycles are checked on each link.
     */
    explicit GraphBuilder(bool eager_validation = false);

    /**
     * @brief Register a task.
     * @throw GraphError with `DuplicateNode` if a different task with the same
     *        identity path is already registered.
     */
    void add_task(const TaskPtr& task);

    /**
     * @brief Declare that `task` depends on `dependency`.
     */
    void depends_on(const TaskPtr& task, const TaskPtr& dependency);

    /**
     * @brief Declare that `task` must run after `other` if both are scheduled.
     */
    void must_run_after(const TaskPtr& task, const TaskPtr& other);

    /**
     * @brief Declare that `task` should run after `other` if both are
     *        scheduled and the ordering does not introduce a cycle.
     */
    void should_run_after(const TaskPtr& task, const TaskPtr& other);

    /**
     * @brief Declare that `finalizer` finalizes `task`.
     */
    void finalized_by(const TaskPtr& task, const TaskPtr& finalizer);

    void set_dependency_resolver(DependencyResolver resolver);

    /**
     * @brief Build and validate the graph reachable from the requested tasks.
     *
     * @return The validated graph. Every node is in state `Unknown`; run a
     *         `RequirementPropagator` before scheduling.
     * @throw CycleError if dependency, must-run-after and finalizer relations
     *        form a cycle.
     * @throw GraphError with `DuplicateNode` if two distinct task objects share
     *        an identity path.
     */
    std::unique_ptr<TaskGraph> build(const std::vector<TaskPtr>& requested);

    /**
     * @brief Get the number of registered tasks.
     */
    size_t task_count() const noexcept
    {
        return m_declarations.size();
    }

private:
    struct Declaration
    {
        TaskPtr task;
        std::vector<TaskPtr> dependencies;
        std::vector<TaskPtr> must_run_after;
        std::vector<TaskPtr> should_run_after;
        std::vector<TaskPtr> finalizers;
    };

    Declaration& declare(const TaskPtr& task);

    bool m_eager_validation{};
    DependencyResolver m_resolver{};

    /// Declarations keyed by identity path.
    std::map<std::string, Declaration> m_declarations{};
};

} // namespace buildplan
