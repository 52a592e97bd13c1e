/**
 * @file single_threaded_executor.cpp
 */
#include "buildplan/execution/single_threaded_executor.hpp"
#include "buildplan/common/log.hpp"

namespace buildplan
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

ExecutionResult SingleThreadedExecutor::execute(TaskGraph& graph)
{
    auto start_time = std::chrono::steady_clock::now();
    auto scheduler = make_scheduler(graph, 1);

    get_logger()->debug("Executing {} node(s) on the calling thread ({})",
                        graph.node_count(), to_string(m_config.failure_policy));

    // Stop flag is not reset here; it is set externally
    while (!scheduler->is_finished())
    {
        apply_stop_request(*scheduler);
        for (const auto& ticket : scheduler->select_ready())
        {
            scheduler->report_outcome(run_ticket(ticket, m_config.collect_timing));
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    ExecutionResult result = scheduler->build_result(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time));

    get_logger()->info("{}", result.summary());
    return result;
}

} // namespace buildplan
