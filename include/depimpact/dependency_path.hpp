#pragma once

/**
 * @file dependency_path.hpp
 * @brief Traversal state and enumerated/scored dependency paths
 */

#include "depimpact/graph.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace depimpact::pathing {

/**
 * Impact classification of a scored path.
 * Ordered: kNone < kLow < kMedium < kHigh < kCritical.
 */
enum class ImpactLevel {
    kNone,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

[[nodiscard]] std::string_view to_string(ImpactLevel level) noexcept;
[[nodiscard]] depimpact::Result<ImpactLevel> parse_impact_level(std::string_view raw);

/**
 * @brief In-progress BFS path. Immutable: extend() returns a new state.
 *
 * nodes().size() == edges().size() + 1 always holds.
 */
class PathState
{
public:
    /// Depth-0 state holding only the root.
    [[nodiscard]] static PathState seed(const graph::EntityRef& root, int root_criticality);

    /**
     * New state one hop further along @p edge into @p target.
     * The caller guarantees target is not already on this path.
     */
    [[nodiscard]] PathState extend(const graph::GraphEdge& edge,
                                   const graph::GraphNode& target) const;

    [[nodiscard]] bool contains(const graph::EntityRef& entity) const;

    [[nodiscard]] const graph::EntityRef& current() const { return m_nodes.back(); }
    [[nodiscard]] const std::vector<graph::EntityRef>& nodes() const noexcept { return m_nodes; }
    [[nodiscard]] const std::vector<graph::DependencyType>& edges() const noexcept { return m_edges; }
    [[nodiscard]] int depth() const noexcept { return static_cast<int>(m_edges.size()); }
    [[nodiscard]] graph::DependencyType max_dependency_type() const noexcept
    {
        return m_max_dependency_type;
    }
    [[nodiscard]] int max_criticality_level() const noexcept { return m_max_criticality_level; }

private:
    PathState(std::vector<graph::EntityRef> nodes,
              std::vector<graph::DependencyType> edges,
              graph::DependencyType max_dependency_type,
              int max_criticality_level);

    std::vector<graph::EntityRef> m_nodes;
    std::vector<graph::DependencyType> m_edges;
    graph::DependencyType m_max_dependency_type;
    int m_max_criticality_level;
};

/**
 * @brief A root-to-dependent path. Scoring fields are zero/None until evaluated.
 */
struct DependencyPath
{
    std::string path_id;  ///< node stable keys joined by "->"
    std::vector<graph::EntityRef> nodes;
    std::vector<graph::DependencyType> edges;
    int depth = 0;
    graph::DependencyType max_dependency_type = graph::DependencyType::kUnknown;
    int max_criticality_level = graph::kDefaultCriticality;

    int risk_score = 0;
    ImpactLevel impact_level = ImpactLevel::kNone;
    graph::EntityRef dominant_entity;
    graph::DependencyType dominant_dependency_type = graph::DependencyType::kUnknown;
};

/// Freeze a traversal state into an unscored path.
[[nodiscard]] DependencyPath make_dependency_path(const PathState& state);

/// Stable keys of @p nodes joined by "->".
[[nodiscard]] std::string make_path_id(const std::vector<graph::EntityRef>& nodes);

}  // namespace depimpact::pathing
