/**
 * @file failure_policy.hpp
 * @brief Policies deciding how a task failure affects the rest of a run.
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/task_graph.hpp"

namespace buildplan
{

/**
 * @brief What the scheduler should do after a node failed.
 */
struct FailureDecision
{
    /// Abandon every required node that has not started yet.
    bool abandon_pending{false};

    /// Abort the failed node's transitive dependency predecessors.
    bool abort_dependents{false};
};

/**
 * @brief Interface for failure policies.
 *
 * @details
 * A policy only decides; the scheduler applies the decision. Enforced
 * finalizers (state `MustRun`) are exempt from both kinds of abortion, so a
 * policy can never prevent a finalizer from running.
 *
 * @par Thread Safety
 * - Called on the coordinator thread only.
 */
class IFailurePolicy
{
public:
    virtual ~IFailurePolicy() = default;

    virtual FailurePolicyKind kind() const noexcept = 0;

    /**
     * @brief Decide the downstream effect of a failure.
     * @param graph The graph being executed.
     * @param failed The node whose failure was just recorded.
     */
    virtual FailureDecision on_failure(const TaskGraph& graph, NodeIdx failed) const = 0;
};

/**
 * @brief Stop scheduling new work after the first failure.
 */
class FailFastPolicy : public IFailurePolicy
{
public:
    FailurePolicyKind kind() const noexcept override
    {
        return FailurePolicyKind::FailFast;
    }

    FailureDecision on_failure(const TaskGraph& graph, NodeIdx failed) const override;
};

/**
 * @brief Skip the dependents of a failed node and keep running everything else.
 */
class ContinuePolicy : public IFailurePolicy
{
public:
    FailurePolicyKind kind() const noexcept override
    {
        return FailurePolicyKind::Continue;
    }

    FailureDecision on_failure(const TaskGraph& graph, NodeIdx failed) const override;
};

/**
 * @brief Factory function to create a failure policy.
 */
std::shared_ptr<IFailurePolicy> make_failure_policy(FailurePolicyKind kind);

} // namespace buildplan
