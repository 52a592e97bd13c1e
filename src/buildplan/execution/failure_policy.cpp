/**
 * @file failure_policy.cpp
 */
#include "buildplan/execution/failure_policy.hpp"

namespace buildplan
{

FailureDecision FailFastPolicy::on_failure(const TaskGraph& graph, NodeIdx failed) const
{
    (void)graph;
    (void)failed;
    FailureDecision decision;
    decision.abandon_pending = true;
    return decision;
}

FailureDecision ContinuePolicy::on_failure(const TaskGraph& graph, NodeIdx failed) const
{
    FailureDecision decision;
    decision.abort_dependents = !graph.node(failed).dependency_predecessors().empty();
    return decision;
}

std::shared_ptr<IFailurePolicy> make_failure_policy(FailurePolicyKind kind)
{
    switch (kind)
    {
    case FailurePolicyKind::FailFast:
        return std::make_shared<FailFastPolicy>();
    case FailurePolicyKind::Continue:
        return std::make_shared<ContinuePolicy>();
    }
    throw GraphError(GraphErrorCode::InvalidState, "Unknown failure policy kind");
}

} // namespace buildplan
