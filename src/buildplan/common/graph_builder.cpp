/**
 * @file graph_builder.cpp
 */
#include "buildplan/common/graph_builder.hpp"
#include "buildplan/common/log.hpp"
#include <deque>

namespace buildplan
{

GraphBuilder::GraphBuilder(bool eager_validation)
    : m_eager_validation{eager_validation}
    , m_resolver{}
    , m_declarations{}
{}

GraphBuilder::Declaration& GraphBuilder::declare(const TaskPtr& task)
{
    if (!task)
    {
        throw GraphError(GraphErrorCode::InvalidState, "Cannot declare a null task");
    }
    auto it = m_declarations.find(task->identity_path());
    if (it == m_declarations.end())
    {
        Declaration decl;
        decl.task = task;
        it = m_declarations.emplace(task->identity_path(), std::move(decl)).first;
    }
    else if (it->second.task != task)
    {
        throw GraphError(
            GraphErrorCode::DuplicateNode,
            "Another task with identity path " + task->identity_path() + " is already registered");
    }
    return it->second;
}

void GraphBuilder::add_task(const TaskPtr& task)
{
    declare(task);
}

void GraphBuilder::depends_on(const TaskPtr& task, const TaskPtr& dependency)
{
    declare(dependency);
    declare(task).dependencies.push_back(dependency);
}

void GraphBuilder::must_run_after(const TaskPtr& task, const TaskPtr& other)
{
    declare(other);
    declare(task).must_run_after.push_back(other);
}

void GraphBuilder::should_run_after(const TaskPtr& task, const TaskPtr& other)
{
    declare(other);
    declare(task).should_run_after.push_back(other);
}

void GraphBuilder::finalized_by(const TaskPtr& task, const TaskPtr& finalizer)
{
    declare(finalizer);
    declare(task).finalizers.push_back(finalizer);
}

void GraphBuilder::set_dependency_resolver(DependencyResolver resolver)
{
    m_resolver = std::move(resolver);
}

std::unique_ptr<TaskGraph> GraphBuilder::build(const std::vector<TaskPtr>& requested)
{
    auto graph = std::make_unique<TaskGraph>(m_eager_validation);
    std::deque<NodeIdx> worklist;

    // Find or create the node of a task, rejecting a second object under the same path
    auto node_for = [&graph](const TaskPtr& task) -> NodeIdx {
        if (!task)
        {
            throw GraphError(GraphErrorCode::InvalidState, "Cannot schedule a null task");
        }
        auto existing = graph->find_node(task->identity_path());
        if (!existing.has_value())
        {
            return graph->add_node(task);
        }
        if (graph->node(*existing).task() != task)
        {
            throw GraphError(
                GraphErrorCode::DuplicateNode,
                "Task " + task->identity_path() + " refers to two different task objects");
        }
        return *existing;
    };

    for (const auto& task : requested)
    {
        worklist.push_back(node_for(task));
    }

    while (!worklist.empty())
    {
        NodeIdx idx = worklist.front();
        worklist.pop_front();
        if (graph->node(idx).dependencies_processed())
        {
            continue;
        }

        TaskPtr task = graph->node(idx).task();
        std::vector<TaskPtr> dependencies;
        const Declaration* decl = nullptr;
        auto it = m_declarations.find(task->identity_path());
        if (it != m_declarations.end())
        {
            decl = &it->second;
            dependencies = decl->dependencies;
        }
        if (m_resolver)
        {
            auto resolved = m_resolver(*task);
            dependencies.insert(dependencies.end(), resolved.begin(), resolved.end());
        }

        for (const auto& dependency : dependencies)
        {
            NodeIdx target = node_for(dependency);
            graph->link(idx, target, EdgeKind::Dependency);
            worklist.push_back(target);
        }

        if (decl != nullptr)
        {
            for (const auto& other : decl->must_run_after)
            {
                graph->link(idx, node_for(other), EdgeKind::MustRunAfter);
            }
            for (const auto& other : decl->should_run_after)
            {
                graph->link(idx, node_for(other), EdgeKind::ShouldRunAfter);
            }
            for (const auto& finalizer : decl->finalizers)
            {
                NodeIdx target = node_for(finalizer);
                graph->link(idx, target, EdgeKind::FinalizedBy);
                worklist.push_back(target);
            }
        }

        graph->mark_dependencies_processed(idx);
    }

    graph->validate();

    get_logger()->debug("Built task graph with {} node(s) from {} requested task(s)",
                        graph->node_count(), requested.size());
    return graph;
}

} // namespace buildplan
