/**
 * @file graph_enums.hpp
 */
#pragma once
#include "buildplan/common/common.hpp"

namespace buildplan
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` identifies a node inside a `TaskGraph`. Indices are assigned in
 * insertion order and stay stable for the lifetime of the graph. Edge sets and
 * the coordinator's state arena are keyed by this index, never by pointers.
 */
using NodeIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Kinds of relations between two tasks.
 *
 * @details
 * `TaskGraph::link(from, to, kind)` reads as "from <kind> to":
 * - `Dependency`: `from` depends on `to`. Gates ordering and success.
 * - `MustRunAfter`: `from` must run after `to`. Gates ordering only.
 * - `ShouldRunAfter`: `from` should run after `to`. Advisory; dropped when it
 *   would close a cycle.
 * - `FinalizedBy`: `from` is finalized by `to`. `to` waits for `from` to reach
 *   a terminal state and becomes required whenever `from` is required.
 */
enum class EdgeKind
{
    Dependency,
    MustRunAfter,
    ShouldRunAfter,
    FinalizedBy
};

/**
 * @brief Execution state of a node.
 *
 * @details
 * `Unknown`, `NotRequired`, `ShouldRun`, `MustRun` and `MustNotRun` are
 * classifications assigned during planning. `Executing`, `Executed` and
 * `Skipped` are reached during a run.
 */
enum class NodeState
{
    Unknown,
    NotRequired,
    ShouldRun,
    MustRun,
    MustNotRun,
    Executing,
    Executed,
    Skipped
};

/**
 * @brief Why a node was moved to `Skipped` without executing.
 */
enum class SkipReason
{
    None,            ///< Not skipped.
    UpstreamFailure, ///< A dependency failed or was itself skipped.
    Abandoned,       ///< Fail-fast policy stopped pending work.
    Cancelled        ///< An external stop request was applied.
};

/**
 * @brief Outcome reported by a task action.
 */
enum class TaskOutcome
{
    Success,
    Failure,
    Skipped
};

/**
 * @brief Distinguishes reported task failures from unexpected faults.
 */
enum class FailureKind
{
    TaskFailure,   ///< The action returned a failed `TaskResult`.
    ExecutionFault ///< The action threw an exception.
};

/**
 * @brief Selects the failure policy applied for a run.
 */
enum class FailurePolicyKind
{
    FailFast,
    Continue
};

// ============================================================================
// String conversions (for logging and diagnostics)
// ============================================================================

inline const char* to_string(EdgeKind kind) noexcept
{
    switch (kind)
    {
    case EdgeKind::Dependency:
        return "Dependency";
    case EdgeKind::MustRunAfter:
        return "MustRunAfter";
    case EdgeKind::ShouldRunAfter:
        return "ShouldRunAfter";
    case EdgeKind::FinalizedBy:
        return "FinalizedBy";
    }
    return "?";
}

inline const char* to_string(NodeState state) noexcept
{
    switch (state)
    {
    case NodeState::Unknown:
        return "Unknown";
    case NodeState::NotRequired:
        return "NotRequired";
    case NodeState::ShouldRun:
        return "ShouldRun";
    case NodeState::MustRun:
        return "MustRun";
    case NodeState::MustNotRun:
        return "MustNotRun";
    case NodeState::Executing:
        return "Executing";
    case NodeState::Executed:
        return "Executed";
    case NodeState::Skipped:
        return "Skipped";
    }
    return "?";
}

inline const char* to_string(SkipReason reason) noexcept
{
    switch (reason)
    {
    case SkipReason::None:
        return "None";
    case SkipReason::UpstreamFailure:
        return "UpstreamFailure";
    case SkipReason::Abandoned:
        return "Abandoned";
    case SkipReason::Cancelled:
        return "Cancelled";
    }
    return "?";
}

inline const char* to_string(FailureKind kind) noexcept
{
    switch (kind)
    {
    case FailureKind::TaskFailure:
        return "task failure";
    case FailureKind::ExecutionFault:
        return "execution fault";
    }
    return "?";
}

inline const char* to_string(FailurePolicyKind kind) noexcept
{
    switch (kind)
    {
    case FailurePolicyKind::FailFast:
        return "FailFast";
    case FailurePolicyKind::Continue:
        return "Continue";
    }
    return "?";
}

} // namespace buildplan
