/**
 * @file main.cpp
 */
#include "buildplan/common/graph_builder.hpp"
#include "buildplan/common/log.hpp"
#include "buildplan/execution/thread_pool_executor.hpp"
#include "buildplan/planning/requirement_propagator.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace buildplan;

namespace
{

TaskPtr make_demo_task(const std::string& path, std::vector<std::string> resources = {})
{
    return make_task(
        path,
        [path]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            get_logger()->info("  running {}", path);
            return TaskResult::success();
        },
        std::move(resources));
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== buildplan ======\n" << std::flush;

        bool continue_on_failure = false;
        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--continue")
            {
                continue_on_failure = true;
            }
        }

        auto compile = make_demo_task(":app:compileJava", {"app/build/classes"});
        auto resources = make_demo_task(":app:processResources", {"app/build/resources"});
        auto test = make_task(":app:test", []() {
            return TaskResult::failure("2 tests failed");
        });
        auto jar = make_demo_task(":app:jar", {"app/build/libs"});
        auto lint = make_demo_task(":app:lint");
        auto report = make_demo_task(":app:testReport", {"app/build/reports"});
        auto cleanup = make_demo_task(":app:stopTestServer");

        GraphBuilder builder;
        builder.depends_on(test, compile);
        builder.depends_on(test, resources);
        builder.depends_on(jar, compile);
        builder.depends_on(jar, resources);
        builder.must_run_after(jar, test);
        builder.should_run_after(lint, compile);
        builder.finalized_by(test, report);
        builder.finalized_by(test, cleanup);

        std::vector<TaskPtr> requested{jar, test, lint};
        auto graph = builder.build(requested);

        for (const auto& warning : graph->get_diagnostics()->warnings())
        {
            get_logger()->warn("{}", warning.message);
        }

        std::vector<NodeIdx> requested_nodes;
        for (const auto& task : requested)
        {
            requested_nodes.push_back(*graph->find_node(task->identity_path()));
        }
        RequirementPropagator propagator(*graph);
        propagator.propagate(requested_nodes);

        ExecutorConfig config;
        config.thread_count = 2;
        config.collect_timing = true;
        config.failure_policy = continue_on_failure ? FailurePolicyKind::Continue : FailurePolicyKind::FailFast;

        ThreadPoolExecutor executor(config);
        ExecutionResult result = executor.execute(*graph);

        for (NodeIdx idx = 0; idx < graph->node_count(); ++idx)
        {
            const TaskNode& node = graph->node(idx);
            get_logger()->info("{:<26} {}", node.identity_path(), to_string(node.state()));
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
        return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        get_logger()->error("{}", e.what());
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
}
