/**
 * @file requirement_propagator_tests.cpp
 * @brief Unit tests for RequirementPropagator.
 */
#include <gtest/gtest.h>
#include "buildplan/common/graph_builder.hpp"
#include "buildplan/planning/requirement_propagator.hpp"

using namespace buildplan;

/**
 * @brief Fixture holding a builder and the graph built from it.
 */
class RequirementPropagatorTest : public ::testing::Test
{
protected:
    TaskPtr task(const std::string& path)
    {
        auto it = m_tasks.find(path);
        if (it != m_tasks.end())
        {
            return it->second;
        }
        auto created = make_task(path);
        m_tasks.emplace(path, created);
        m_builder.add_task(created);
        return created;
    }

    void build(const std::vector<std::string>& requested)
    {
        std::vector<TaskPtr> tasks;
        for (const auto& path : requested)
        {
            tasks.push_back(task(path));
        }
        m_graph = m_builder.build(tasks);
        m_requested.clear();
        for (const auto& path : requested)
        {
            m_requested.push_back(*m_graph->find_node(path));
        }
    }

    NodeState state_of(const std::string& path) const
    {
        auto idx = m_graph->find_node(path);
        if (!idx.has_value())
        {
            ADD_FAILURE() << path << " is not in the graph";
            return NodeState::Unknown;
        }
        return m_graph->node(*idx).state();
    }

    GraphBuilder m_builder;
    std::map<std::string, TaskPtr> m_tasks;
    std::unique_ptr<TaskGraph> m_graph;
    std::vector<NodeIdx> m_requested;
};

TEST_F(RequirementPropagatorTest, RequestedNodeAndDependenciesAreRequired)
{
    m_builder.depends_on(task(":b"), task(":a"));
    m_builder.depends_on(task(":c"), task(":b"));
    build({":c"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);

    EXPECT_EQ(state_of(":a"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":b"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":c"), NodeState::ShouldRun);
    EXPECT_EQ(propagator.required_count(), 3u);
}

TEST_F(RequirementPropagatorTest, DiamondIsVisitedOnce)
{
    m_builder.depends_on(task(":b"), task(":a"));
    m_builder.depends_on(task(":c"), task(":a"));
    m_builder.depends_on(task(":d"), task(":b"));
    m_builder.depends_on(task(":d"), task(":c"));
    build({":d"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);
    EXPECT_EQ(propagator.required_count(), 4u);
}

TEST_F(RequirementPropagatorTest, FinalizerOfRequiredNodeIsRequired)
{
    m_builder.finalized_by(task(":test"), task(":cleanup"));
    build({":test"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);

    EXPECT_EQ(state_of(":test"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":cleanup"), NodeState::ShouldRun);
}

TEST_F(RequirementPropagatorTest, FinalizerOfFilteredNodeStaysNotRequired)
{
    m_builder.finalized_by(task(":test"), task(":cleanup"));
    build({":test"});

    RequirementPropagator propagator(*m_graph, [](const ITask& t) {
        return t.identity_path() != ":test";
    });
    propagator.propagate(m_requested);

    EXPECT_EQ(state_of(":test"), NodeState::MustNotRun);
    EXPECT_EQ(state_of(":cleanup"), NodeState::NotRequired);
    EXPECT_EQ(propagator.required_count(), 0u);
}

TEST_F(RequirementPropagatorTest, FilterStopsWalkThroughExcludedDependency)
{
    m_builder.depends_on(task(":a"), task(":b"));
    m_builder.depends_on(task(":b"), task(":c"));
    build({":a"});

    RequirementPropagator propagator(*m_graph, [](const ITask& t) {
        return t.identity_path() != ":b";
    });
    propagator.propagate(m_requested);

    EXPECT_EQ(state_of(":a"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":b"), NodeState::MustNotRun);
    EXPECT_EQ(state_of(":c"), NodeState::NotRequired);
}

TEST_F(RequirementPropagatorTest, OrderingTargetsAreNotRequired)
{
    m_builder.must_run_after(task(":a"), task(":b"));
    m_builder.should_run_after(task(":a"), task(":c"));
    build({":a"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);

    EXPECT_EQ(state_of(":a"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":b"), NodeState::NotRequired);
    EXPECT_EQ(state_of(":c"), NodeState::NotRequired);
}

TEST_F(RequirementPropagatorTest, PropagationIsIdempotent)
{
    m_builder.depends_on(task(":b"), task(":a"));
    m_builder.finalized_by(task(":b"), task(":f"));
    m_builder.must_run_after(task(":b"), task(":x"));
    build({":b"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);
    std::vector<NodeState> first;
    for (NodeIdx idx = 0; idx < m_graph->node_count(); ++idx)
    {
        first.push_back(m_graph->node(idx).state());
    }

    propagator.propagate(m_requested);
    for (NodeIdx idx = 0; idx < m_graph->node_count(); ++idx)
    {
        EXPECT_EQ(m_graph->node(idx).state(), first[idx]);
    }
}

TEST_F(RequirementPropagatorTest, LaterPassCanRequireMoreNodes)
{
    m_builder.must_run_after(task(":a"), task(":b"));
    build({":a"});

    RequirementPropagator propagator(*m_graph);
    propagator.propagate(m_requested);
    EXPECT_EQ(state_of(":b"), NodeState::NotRequired);

    propagator.propagate({*m_graph->find_node(":b")});
    EXPECT_EQ(state_of(":a"), NodeState::ShouldRun);
    EXPECT_EQ(state_of(":b"), NodeState::ShouldRun);
}

TEST_F(RequirementPropagatorTest, UnknownRequestedIndexThrows)
{
    build({":a"});
    RequirementPropagator propagator(*m_graph);
    EXPECT_THROW(propagator.propagate({42}), GraphError);
}
