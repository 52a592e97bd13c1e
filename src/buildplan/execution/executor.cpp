/**
 * @file executor.cpp
 */
#include "buildplan/execution/executor.hpp"

namespace buildplan
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

TaskCompletion Executor::run_ticket(const DispatchTicket& ticket, bool collect_timing)
{
    TaskCompletion completion;
    completion.node = ticket.node;

    auto start_time = std::chrono::steady_clock::now();

    // Execute user code
    try
    {
        completion.result = ticket.task->execute();
    }
    catch (...)
    {
        completion.fault = std::current_exception();
    }

    if (collect_timing)
    {
        auto end_time = std::chrono::steady_clock::now();
        completion.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            end_time - start_time);
    }
    return completion;
}

std::unique_ptr<Scheduler> Executor::make_scheduler(TaskGraph& graph, size_t max_parallel) const
{
    SchedulerConfig scheduler_config;
    scheduler_config.max_parallel = max_parallel;
    scheduler_config.collect_timing = m_config.collect_timing;
    return std::make_unique<Scheduler>(
        graph, make_failure_policy(m_config.failure_policy), scheduler_config);
}

void Executor::apply_stop_request(Scheduler& scheduler) const
{
    if (stop_requested() && !scheduler.stop_requested())
    {
        scheduler.request_stop();
    }
}

} // namespace buildplan
