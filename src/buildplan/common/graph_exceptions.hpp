/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "buildplan/common/common.hpp"

namespace buildplan
{

/**
 * @brief Error codes for configuration faults.
 *
 * @details
 * All codes describe programming or configuration errors. They are never
 * retried and never used for task failures, which are recorded on the node
 * and reported through `ExecutionResult` instead.
 */
enum class GraphErrorCode
{
    UnknownNode,
    DuplicateNode,
    SelfReference,
    CycleDetected,
    IllegalStateTransition,
    InvalidState,
    InvariantViolation
};

/**
 * @brief Exception class for task graph configuration faults.
 *
 * @details
 * `GraphError` is thrown by `TaskGraph`, `TaskNode`, `GraphBuilder` and
 * `Scheduler` when preconditions are violated, indices are invalid, or graph
 * invariants would be broken by an operation. Each exception carries an error
 * code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class GraphError : public std::exception
{
public:
    /**
     * @brief Construct a GraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    GraphError(GraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief A `GraphError` raised when ordering-significant edges form a cycle.
 *
 * @details
 * The cycle is reported as a closed walk of identity paths: the first and last
 * entries are the same node, and each consecutive pair `(a, b)` is an edge
 * where `a` waits for `b` (dependency, must-run-after or finalizer edge).
 * The reported walk is a shortest cycle through the offending nodes.
 */
class CycleError : public GraphError
{
public:
    explicit CycleError(std::vector<std::string> cycle)
        : GraphError(GraphErrorCode::CycleDetected, format_message(cycle))
        , m_cycle(std::move(cycle))
    {
    }

    /**
     * @brief Ordered identity paths forming the cycle (first == last).
     */
    const std::vector<std::string>& cycle() const noexcept
    {
        return m_cycle;
    }

private:
    static std::string format_message(const std::vector<std::string>& cycle)
    {
        std::string message = "Circular dependency between the following tasks: ";
        for (size_t i = 0; i < cycle.size(); ++i)
        {
            if (i > 0)
            {
                message += " -> ";
            }
            message += cycle[i];
        }
        return message;
    }

    std::vector<std::string> m_cycle;
};

} // namespace buildplan
