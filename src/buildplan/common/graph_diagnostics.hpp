/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "buildplan/common/common.hpp"
#include "buildplan/common/graph_enums.hpp"

namespace buildplan
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue; the graph can still be validated.
    Error     ///< Blocking issue that prevents validation.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    Cycle,              ///< Dependency, must-run-after and finalizer edges form a cycle.
    DroppedShouldEdge   ///< A should-run-after edge was dropped to avoid a cycle.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Node indices involved in this issue. For a cycle, the closed walk
    /// (first == last); for a dropped should-edge, `{from, to}`.
    std::vector<NodeIdx> involved_nodes;

    /// Identity paths parallel to `involved_nodes`.
    std::vector<std::string> involved_paths;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected from a TaskGraph instance.
 *
 * @details
 * `GraphDiagnostics` is produced by `TaskGraph::get_diagnostics()`.
 *
 * @par Error vs Warning
 * - **Errors** prevent validation. Only `Cycle` is an error.
 * - **Warnings** describe should-run-after edges that were (or would be)
 *   dropped because they close a cycle. Soft ordering is advisory, so these
 *   never block validation.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph is valid for execution.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    // Allow TaskGraph to populate diagnostics
    friend class TaskGraph;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace buildplan
