/**
 * @file thread_pool_executor.cpp
 */
#include "buildplan/execution/thread_pool_executor.hpp"
#include "buildplan/common/log.hpp"

namespace buildplan
{

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    size_t count = m_config.thread_count;
    if (count == 0)
    {
        count = std::thread::hardware_concurrency();
        if (count == 0)
        {
            count = 1; // Fallback
        }
    }

    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        m_workers.emplace_back(&ThreadPoolExecutor::worker_thread, this);
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv_work.notify_all();
    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::request_stop()
{
    Executor::request_stop();
    {
        // Pairs with the predicate check in wait_for_completions()
        std::lock_guard<std::mutex> lock(m_mutex);
    }
    m_cv_done.notify_all();
}

ExecutionResult ThreadPoolExecutor::execute(TaskGraph& graph)
{
    auto start_time = std::chrono::steady_clock::now();
    auto scheduler = make_scheduler(graph, m_workers.size());

    get_logger()->debug("Executing {} node(s) on {} worker(s) ({})",
                        graph.node_count(), m_workers.size(), to_string(m_config.failure_policy));

    size_t outstanding = 0;
    try
    {
        while (!scheduler->is_finished())
        {
            apply_stop_request(*scheduler);
            for (auto& ticket : scheduler->select_ready())
            {
                post(std::move(ticket));
                ++outstanding;
            }

            if (scheduler->in_flight() == 0)
            {
                continue;
            }

            auto completions = wait_for_completions(*scheduler);
            outstanding -= completions.size();
            for (const auto& completion : completions)
            {
                scheduler->report_outcome(completion);
            }
        }
    }
    catch (const std::exception& e)
    {
        get_logger()->error("Execution aborted: {}", e.what());
        drain(outstanding);
        throw;
    }

    auto end_time = std::chrono::steady_clock::now();
    ExecutionResult result = scheduler->build_result(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time));

    get_logger()->info("{}", result.summary());
    return result;
}

void ThreadPoolExecutor::post(DispatchTicket ticket)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tickets.push(std::move(ticket));
    }
    m_cv_work.notify_one();
}

std::vector<TaskCompletion> ThreadPoolExecutor::wait_for_completions(const Scheduler& scheduler)
{
    std::vector<TaskCompletion> completions;
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv_done.wait(lock, [this, &scheduler]() {
        return !m_completions.empty() || (stop_requested() && !scheduler.stop_requested());
    });

    while (!m_completions.empty())
    {
        completions.push_back(std::move(m_completions.front()));
        m_completions.pop();
    }
    return completions;
}

void ThreadPoolExecutor::drain(size_t outstanding)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (outstanding > 0)
    {
        m_cv_done.wait(lock, [this]() { return !m_completions.empty(); });
        while (!m_completions.empty() && outstanding > 0)
        {
            m_completions.pop();
            --outstanding;
        }
    }
}

void ThreadPoolExecutor::worker_thread()
{
    while (true)
    {
        DispatchTicket ticket;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv_work.wait(lock, [this]() { return m_shutdown || !m_tickets.empty(); });

            if (m_shutdown && m_tickets.empty())
            {
                return;
            }

            ticket = std::move(m_tickets.front());
            m_tickets.pop();
        }

        TaskCompletion completion = run_ticket(ticket, m_config.collect_timing);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_completions.push(std::move(completion));
        }
        m_cv_done.notify_all();
    }
}

} // namespace buildplan
