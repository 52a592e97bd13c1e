/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by IExecutor::execute().
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/graph_enums.hpp"

namespace buildplan
{

/**
 * @brief A node that executed and failed.
 */
struct NodeFailure
{
    NodeIdx node{};
    std::string identity_path;

    /// Whether the action reported the failure or threw.
    FailureKind kind{FailureKind::TaskFailure};

    /// Reported cause, or the `what()` of the captured exception.
    std::string cause;
};

/**
 * @brief A required node that was moved to Skipped without executing.
 */
struct SkippedNode
{
    NodeIdx node{};
    std::string identity_path;
    SkipReason reason{SkipReason::None};

    /// Identity path of the failure that caused the skip, if any.
    std::optional<std::string> upstream;
};

/**
 * @brief Result of executing a task graph.
 *
 * @details
 * ExecutionResult captures the outcome of a run:
 * - Success/failure status
 * - Which nodes failed, how, and why (in failure order)
 * - Which nodes executed (in completion order) and which of those reported
 *   that they had nothing to do
 * - Which required nodes were skipped, and why
 * - Timing information (if collected)
 *
 * Nodes that were never required (NotRequired, MustNotRun) appear in none of
 * the lists.
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True if no node failed and no required node was skipped.
     */
    bool success{true};

    /**
     * @brief True if the run was stopped by request.
     */
    bool stopped{false};

    /**
     * @brief The failure policy the run used.
     */
    FailurePolicyKind policy{FailurePolicyKind::FailFast};

    std::vector<NodeFailure> failures;

    /**
     * @brief Nodes that executed, in completion order (failed ones included).
     */
    std::vector<NodeIdx> executed;

    /**
     * @brief Executed nodes whose action reported `TaskResult::skipped()`.
     */
    std::vector<NodeIdx> up_to_date;

    std::vector<SkippedNode> skipped;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-node durations, indexed by NodeIdx.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<std::chrono::nanoseconds> node_durations;

    /**
     * @brief The failure that was recorded first, or nullptr.
     */
    const NodeFailure* first_failure() const noexcept
    {
        return failures.empty() ? nullptr : &failures.front();
    }

    /**
     * @brief Number of nodes abandoned by the fail-fast policy.
     */
    size_t abandoned_count() const noexcept
    {
        return static_cast<size_t>(std::count_if(
            skipped.begin(), skipped.end(),
            [](const SkippedNode& s) { return s.reason == SkipReason::Abandoned; }));
    }

    /**
     * @brief Get a summary string for logging.
     *
     * @details
     * Under fail-fast the summary names the triggering failure and the amount
     * of abandoned work; under continue it lists every failure.
     */
    std::string summary() const
    {
        auto describe = [](const NodeFailure& f) {
            return f.identity_path + " (" + to_string(f.kind) + "): " + f.cause;
        };

        std::string result;
        if (success)
        {
            result = "Execution succeeded";
        }
        else if (failures.empty())
        {
            result = stopped ? "Execution stopped by request" : "Execution incomplete";
        }
        else if (policy == FailurePolicyKind::FailFast)
        {
            result = "Execution failed: " + describe(failures.front());
            result += "; " + std::to_string(abandoned_count()) + " task(s) abandoned";
        }
        else
        {
            result = "Execution failed with " + std::to_string(failures.size()) + " failure(s):";
            for (const auto& failure : failures)
            {
                result += "\n  - " + describe(failure);
            }
        }
        result += (failures.empty() ? " (" : "\n(");
        result += "executed=" + std::to_string(executed.size());
        result += ", up-to-date=" + std::to_string(up_to_date.size());
        result += ", failed=" + std::to_string(failures.size());
        result += ", skipped=" + std::to_string(skipped.size()) + ")";
        return result;
    }
};

} // namespace buildplan
