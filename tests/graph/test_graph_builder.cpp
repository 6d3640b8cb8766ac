/**
 * @file test_graph_builder.cpp
 * @brief GraphBuilder node registration and edge direction
 */

#include "depimpact/graph_builder.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace depimpact::graph::test {

namespace {

/// Row in which @p dependent (source) relies on @p dependency (target).
DependencyGraphRow make_row(std::string dependent_type,
                            std::int64_t dependent_id,
                            std::string dependency_entity_type,
                            std::int64_t dependency_id,
                            std::string usage,
                            std::optional<int> dependent_criticality = std::nullopt,
                            std::optional<int> dependency_criticality = std::nullopt)
{
    return DependencyGraphRow{.source_type = std::move(dependent_type),
                              .source_id = dependent_id,
                              .source_name = std::nullopt,
                              .source_criticality = dependent_criticality,
                              .target_type = std::move(dependency_entity_type),
                              .target_id = dependency_id,
                              .target_name = std::nullopt,
                              .target_criticality = dependency_criticality,
                              .dependency_type = std::move(usage)};
}

const EntityRef kOrders{.type = EntityType::kTable, .id = 1, .name = {}};
const EntityRef kOrderView{.type = EntityType::kView, .id = 2, .name = {}};
const EntityRef kSyncProc{.type = EntityType::kStoredProcedure, .id = 3, .name = {}};

TEST(GraphBuilder, EdgesRunFromDependencyToDependent)
{
    const std::vector<DependencyGraphRow> rows{
        make_row("View", 2, "Table", 1, "Select"),
        make_row("StoredProcedure", 3, "Table", 1, "Update"),
    };
    auto graph = GraphBuilder{}.build(rows);
    ASSERT_TRUE(graph);

    EXPECT_EQ(graph->node_count(), 3U);
    EXPECT_EQ(graph->edge_count(), 2U);

    const auto edges = graph->dependents_of(kOrders);
    ASSERT_EQ(edges.size(), 2U);
    EXPECT_EQ(edges[0].from, kOrders);
    EXPECT_EQ(edges[0].to, kOrderView);
    EXPECT_EQ(edges[0].dependency_type, DependencyType::kSelect);
    EXPECT_EQ(edges[1].to, kSyncProc);
    EXPECT_EQ(edges[1].dependency_type, DependencyType::kUpdate);

    EXPECT_TRUE(graph->dependents_of(kOrderView).empty());
}

TEST(GraphBuilder, ExplicitCriticalityWinsRegardlessOfRowOrder)
{
    const std::vector<DependencyGraphRow> explicit_last{
        make_row("View", 2, "Table", 1, "Select"),
        make_row("StoredProcedure", 3, "Table", 1, "Update", std::nullopt, 5),
    };
    const std::vector<DependencyGraphRow> explicit_first{
        make_row("StoredProcedure", 3, "Table", 1, "Update", std::nullopt, 5),
        make_row("View", 2, "Table", 1, "Select"),
    };

    for (const auto& rows : {explicit_last, explicit_first}) {
        auto graph = GraphBuilder{}.build(rows);
        ASSERT_TRUE(graph);
        const GraphNode* node = graph->find_node(kOrders);
        ASSERT_NE(node, nullptr);
        EXPECT_EQ(node->criticality_level, 5);
        EXPECT_TRUE(node->explicit_criticality);
    }
}

TEST(GraphBuilder, FirstExplicitCriticalityIsKept)
{
    const std::vector<DependencyGraphRow> rows{
        make_row("View", 2, "Table", 1, "Select", 4, std::nullopt),
        make_row("View", 2, "Function", 9, "Select", 1, std::nullopt),
    };
    auto graph = GraphBuilder{}.build(rows);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph->find_node(kOrderView)->criticality_level, 4);
}

TEST(GraphBuilder, DefaultsAndClampsCriticality)
{
    const std::vector<DependencyGraphRow> rows{
        make_row("View", 2, "Table", 1, "Select", 11, std::nullopt),
    };
    auto graph = GraphBuilder{}.build(rows);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph->find_node(kOrderView)->criticality_level, kMaxCriticality);
    EXPECT_EQ(graph->find_node(kOrders)->criticality_level, kDefaultCriticality);
    EXPECT_FALSE(graph->find_node(kOrders)->explicit_criticality);
}

TEST(GraphBuilder, UnknownDependencyTypeStillProducesEdge)
{
    const std::vector<DependencyGraphRow> rows{
        make_row("Function", 4, "Table", 1, "MERGE_INTO"),
    };
    auto graph = GraphBuilder{}.build(rows);
    ASSERT_TRUE(graph);
    const auto edges = graph->dependents_of(kOrders);
    ASSERT_EQ(edges.size(), 1U);
    EXPECT_EQ(edges[0].dependency_type, DependencyType::kUnknown);
}

TEST(GraphBuilder, UnknownEntityTypeFailsTheBuild)
{
    const std::vector<DependencyGraphRow> rows{
        make_row("View", 2, "Table", 1, "Select"),
        make_row("Trigger", 5, "Table", 1, "Insert"),
    };
    auto graph = GraphBuilder{}.build(rows);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "UnknownEntityType");
}

TEST(GraphBuilder, LaterRowFillsMissingName)
{
    auto first = make_row("View", 2, "Table", 1, "Select");
    auto second = make_row("Function", 4, "Table", 1, "Select");
    second.target_name = "Orders";
    const std::vector<DependencyGraphRow> rows{first, second};

    auto graph = GraphBuilder{}.build(rows);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph->find_node(kOrders)->entity.name, "Orders");
}

TEST(GraphBuilder, EmptyRowsGiveEmptyGraph)
{
    auto graph = GraphBuilder{}.build({});
    ASSERT_TRUE(graph);
    EXPECT_TRUE(graph->empty());
    EXPECT_EQ(graph->edge_count(), 0U);
}

}  // namespace

}  // namespace depimpact::graph::test
