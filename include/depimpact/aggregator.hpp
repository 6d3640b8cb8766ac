#pragma once

/**
 * @file aggregator.hpp
 * @brief Scored paths -> per-entity worst case and overall impact
 */

#include "depimpact/dependency_path.hpp"
#include "depimpact/graph.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace depimpact::aggregation {

/**
 * @brief Every path that ends at one entity, reduced to its worst case.
 */
struct EntityImpact
{
    graph::EntityRef entity;
    std::vector<pathing::DependencyPath> paths;  ///< enumeration order
    pathing::ImpactLevel worst_case_impact_level = pathing::ImpactLevel::kNone;
    int worst_case_risk_score = 0;
    int cumulative_risk_score = 0;
    std::string dominant_path_id;  ///< highest score; earliest path on ties
};

struct OverallImpact
{
    pathing::ImpactLevel worst_impact_level = pathing::ImpactLevel::kNone;
    int worst_risk_score = 0;
    std::optional<graph::EntityRef> triggering_entity;
    std::string triggering_path_id;
    bool requires_approval = false;  ///< set by an ApprovalPolicy, never by aggregation
};

struct AggregationResult
{
    std::vector<EntityImpact> entity_impacts;  ///< order of first appearance
    OverallImpact overall;
};

class ImpactAggregator
{
public:
    ImpactAggregator() = default;

    /**
     * Group @p scored_paths by terminal entity (EntityRef equality) so an entity
     * reached through several paths is reported once with its worst level.
     * Paths without nodes are ignored.
     */
    [[nodiscard]] AggregationResult
    aggregate(std::span<const pathing::DependencyPath> scored_paths) const;
};

}  // namespace depimpact::aggregation
