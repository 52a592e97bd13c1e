/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor runs task actions on a bounded worker pool.
 */
#pragma once
#include "buildplan/execution/executor.hpp"
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace buildplan
{

/**
 * @brief Executor that runs actions on a fixed set of worker threads.
 *
 * @details
 * The thread calling execute() is the coordinator: it selects nodes, posts
 * their tickets to the worker queue, and applies completions as workers post
 * them back. Workers never touch node state; they only run the action and
 * report a `TaskCompletion`.
 *
 * The number of concurrently executing nodes is bounded by the number of
 * workers. The coordinator blocks only while nothing is eligible and at least
 * one node is in flight.
 *
 * @par Lifecycle
 * - Workers start in the constructor and are joined in the destructor.
 * - The same executor may run several graphs, one at a time.
 *
 * @par Thread Safety
 * - execute() is not reentrant; call from one thread at a time.
 * - request_stop() can be called from any thread and wakes the coordinator.
 */
class ThreadPoolExecutor : public Executor
{
public:
    /**
     * @brief Construct the executor and start its workers.
     * @param config Configuration; thread_count 0 means hardware concurrency.
     */
    explicit ThreadPoolExecutor(ExecutorConfig config = {});
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ExecutionResult execute(TaskGraph& graph) override;

    void request_stop() override;

    size_t worker_count() const noexcept
    {
        return m_workers.size();
    }

private:
    void worker_thread();

    void post(DispatchTicket ticket);

    /// Block until at least one completion is available or a stop request
    /// has not yet been applied, then take every available completion.
    std::vector<TaskCompletion> wait_for_completions(const Scheduler& scheduler);

    /// Wait for the given number of outstanding completions and discard them.
    void drain(size_t outstanding);

    std::vector<std::thread> m_workers;
    std::queue<DispatchTicket> m_tickets;
    std::queue<TaskCompletion> m_completions;

    std::mutex m_mutex;
    std::condition_variable m_cv_work; // Notify workers of new tickets
    std::condition_variable m_cv_done; // Notify coordinator of completions and stop requests

    bool m_shutdown{false};
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(ExecutorConfig config = {})
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config));
}

} // namespace buildplan
