/**
 * @file dependency_path.cpp
 * @brief PathState expansion and path freezing
 */

#include "depimpact/dependency_path.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace depimpact::pathing {

std::string_view to_string(ImpactLevel level) noexcept
{
    switch (level) {
        case ImpactLevel::kNone:
            return "None";
        case ImpactLevel::kLow:
            return "Low";
        case ImpactLevel::kMedium:
            return "Medium";
        case ImpactLevel::kHigh:
            return "High";
        case ImpactLevel::kCritical:
            return "Critical";
    }
    return "None";
}

depimpact::Result<ImpactLevel> parse_impact_level(std::string_view raw)
{
    for (auto level : {ImpactLevel::kNone,
                       ImpactLevel::kLow,
                       ImpactLevel::kMedium,
                       ImpactLevel::kHigh,
                       ImpactLevel::kCritical}) {
        if (to_string(level) == raw) {
            return level;
        }
    }
    return std::unexpected(
        Error::make("InvalidArgument", std::format("Unknown impact level '{}'", raw)));
}

PathState::PathState(std::vector<graph::EntityRef> nodes,
                     std::vector<graph::DependencyType> edges,
                     graph::DependencyType max_dependency_type,
                     int max_criticality_level)
    : m_nodes(std::move(nodes))
    , m_edges(std::move(edges))
    , m_max_dependency_type(max_dependency_type)
    , m_max_criticality_level(max_criticality_level)
{}

PathState PathState::seed(const graph::EntityRef& root, int root_criticality)
{
    return PathState({root}, {}, graph::DependencyType::kUnknown, root_criticality);
}

PathState PathState::extend(const graph::GraphEdge& edge, const graph::GraphNode& target) const
{
    auto nodes = m_nodes;
    nodes.push_back(target.entity);
    auto edges = m_edges;
    edges.push_back(edge.dependency_type);
    return PathState(std::move(nodes),
                     std::move(edges),
                     graph::max_severity(m_max_dependency_type, edge.dependency_type),
                     std::max(m_max_criticality_level, target.criticality_level));
}

bool PathState::contains(const graph::EntityRef& entity) const
{
    return std::ranges::find(m_nodes, entity) != m_nodes.end();
}

std::string make_path_id(const std::vector<graph::EntityRef>& nodes)
{
    std::string id;
    for (const auto& node : nodes) {
        if (!id.empty()) {
            id += "->";
        }
        id += node.stable_key();
    }
    return id;
}

DependencyPath make_dependency_path(const PathState& state)
{
    return DependencyPath{.path_id = make_path_id(state.nodes()),
                          .nodes = state.nodes(),
                          .edges = state.edges(),
                          .depth = state.depth(),
                          .max_dependency_type = state.max_dependency_type(),
                          .max_criticality_level = state.max_criticality_level(),
                          .risk_score = 0,
                          .impact_level = ImpactLevel::kNone,
                          .dominant_entity = state.current(),
                          .dominant_dependency_type = state.max_dependency_type()};
}

}  // namespace depimpact::pathing
