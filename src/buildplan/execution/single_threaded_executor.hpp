/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential task execution.
 */
#pragma once
#include "buildplan/execution/executor.hpp"

namespace buildplan
{

/**
 * @brief Single-threaded executor for debugging and testing.
 *
 * @details
 * Runs each dispatched action inline on the calling thread, one at a time,
 * in the graph's execution order. Useful for:
 * - Debugging execution issues without thread complexity
 * - Testing graph correctness
 * - Reference implementation for verifying parallel executors
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including from inside a
 *   running action.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored, always 1).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    ExecutionResult execute(TaskGraph& graph) override;
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 * @param config Configuration options.
 * @return Shared pointer to the executor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace buildplan
