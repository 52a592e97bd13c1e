/**
 * @file task_items.hpp
 * @brief Interfaces for graph items: ITask and TaskResult.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/graph_enums.hpp"

namespace buildplan
{

/**
 * @brief Result returned by a task action.
 *
 * @details
 * A task action reports one of three outcomes:
 * - `success()`: the work was done.
 * - `failure(cause)`: the work failed in a way the task itself detected.
 * - `skipped(reason)`: the task decided there was nothing to do (for example
 *   its outputs are up to date). A skipped result counts as successful for
 *   its dependents.
 *
 * Exceptions thrown by the action are not part of this protocol; they are
 * recorded as execution faults.
 */
struct TaskResult
{
    TaskOutcome outcome{TaskOutcome::Success};

    /// Failure cause or skip reason; empty on success.
    std::string message;

    static TaskResult success()
    {
        return TaskResult{TaskOutcome::Success, {}};
    }

    static TaskResult failure(std::string cause)
    {
        return TaskResult{TaskOutcome::Failure, std::move(cause)};
    }

    static TaskResult skipped(std::string reason)
    {
        return TaskResult{TaskOutcome::Skipped, std::move(reason)};
    }
};

/**
 * @brief Interface for executable tasks in a task graph.
 *
 * @details
 * ITask is the unit of work wrapped by a `TaskNode`. The graph never inspects
 * what a task does; it only needs a stable identity, the action callback, and
 * the resources the task must use exclusively.
 *
 * @par Thread Safety
 * - execute() may be called from any worker thread, once per run.
 * - identity_path() and resources() must be safe for concurrent reads.
 *
 * @par Lifecycle
 * - Created by the caller and registered with GraphBuilder.
 * - Object lifetime managed via shared_ptr; nodes and dispatch tickets share
 *   ownership.
 */
class ITask
{
public:
    virtual ~ITask() = 0;

    /**
     * @brief Get the identity path of this task (e.g. ":app:compileJava").
     *
     * @details
     * Identity paths are unique within a graph and define the deterministic
     * ordering used for every edge set and tie-break.
     */
    virtual const std::string& identity_path() const = 0;

    /**
     * @brief Execute this task's action.
     *
     * @return The outcome of the action.
     * @throws Any exception to signal an execution fault. The exception is
     *         captured and the node is reported as failed.
     */
    virtual TaskResult execute() = 0;

    /**
     * @brief Resources this task must use exclusively while executing.
     *
     * @details
     * Resources are `/`-separated locations (typically output directories).
     * Two tasks whose resources are equal, or where one is a path prefix of
     * the other, are never executed concurrently.
     */
    virtual std::vector<std::string> resources() const
    {
        return {};
    }

protected:
    ITask() = default;

private:
    ITask(const ITask&) = delete;
    ITask(ITask&&) = delete;
    ITask& operator=(const ITask&) = delete;
    ITask& operator=(ITask&&) = delete;
};

using TaskPtr = std::shared_ptr<ITask>;

inline ITask::~ITask() = default;

/**
 * @brief ITask adapter around a callable.
 */
class FunctionTask : public ITask
{
public:
    using Action = std::function<TaskResult()>;

    FunctionTask(std::string identity_path, Action action, std::vector<std::string> resources = {})
        : m_identity_path{std::move(identity_path)}
        , m_action{std::move(action)}
        , m_resources{std::move(resources)}
    {}

    const std::string& identity_path() const override
    {
        return m_identity_path;
    }

    TaskResult execute() override
    {
        if (!m_action)
        {
            return TaskResult::success();
        }
        return m_action();
    }

    std::vector<std::string> resources() const override
    {
        return m_resources;
    }

private:
    std::string m_identity_path;
    Action m_action;
    std::vector<std::string> m_resources;
};

/**
 * @brief Factory function to create a FunctionTask.
 */
inline TaskPtr make_task(
    std::string identity_path,
    FunctionTask::Action action = {},
    std::vector<std::string> resources = {})
{
    return std::make_shared<FunctionTask>(
        std::move(identity_path), std::move(action), std::move(resources));
}

} // namespace buildplan
