/**
 * @file graph_builder.cpp
 * @brief Normalization of raw dependency rows into an ImpactGraph
 *
 * No traversal and no scoring happen here.
 */

#include "depimpact/graph_builder.hpp"

#include <optional>
#include <string>
#include <utility>

namespace depimpact::graph {

namespace {

void register_node(ImpactGraph::NodeMap& nodes,
                   const EntityRef& entity,
                   std::optional<int> criticality)
{
    auto it = nodes.find(entity);
    if (it == nodes.end()) {
        nodes.emplace(entity,
                      GraphNode{.entity = entity,
                                .criticality_level = criticality ? clamp_criticality(*criticality)
                                                                 : kDefaultCriticality,
                                .explicit_criticality = criticality.has_value()});
        return;
    }

    GraphNode& node = it->second;
    // First explicit value wins; a defaulted node is upgraded, never downgraded.
    if (criticality && !node.explicit_criticality) {
        node.criticality_level = clamp_criticality(*criticality);
        node.explicit_criticality = true;
    }
    if (node.entity.name.empty() && !entity.name.empty()) {
        node.entity.name = entity.name;
    }
}

[[nodiscard]] depimpact::Result<EntityRef> make_entity(const std::string& type,
                                                       std::int64_t id,
                                                       const std::optional<std::string>& name)
{
    auto parsed = parse_entity_type(type);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return EntityRef{.type = *parsed, .id = id, .name = name.value_or(std::string{})};
}

}  // namespace

depimpact::Result<ImpactGraph> GraphBuilder::build(std::span<const DependencyGraphRow> rows) const
{
    ImpactGraph::NodeMap nodes;
    ImpactGraph::AdjacencyMap adjacency;

    for (const auto& row : rows) {
        auto dependent = make_entity(row.source_type, row.source_id, row.source_name);
        if (!dependent) {
            return std::unexpected(dependent.error());
        }
        auto dependency = make_entity(row.target_type, row.target_id, row.target_name);
        if (!dependency) {
            return std::unexpected(dependency.error());
        }

        register_node(nodes, *dependent, row.source_criticality);
        register_node(nodes, *dependency, row.target_criticality);

        adjacency[*dependency].push_back(
            GraphEdge{.from = *dependency,
                      .to = *dependent,
                      .dependency_type = parse_dependency_type(row.dependency_type)});
    }

    return ImpactGraph(std::move(nodes), std::move(adjacency));
}

}  // namespace depimpact::graph
