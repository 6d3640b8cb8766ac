/**
 * @file aggregator.cpp
 * @brief Worst-case aggregation of scored paths
 */

#include "depimpact/aggregator.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_map>

namespace depimpact::aggregation {

namespace {

void fold_path(EntityImpact& impact, const pathing::DependencyPath& path)
{
    if (impact.paths.empty() || path.risk_score > impact.worst_case_risk_score) {
        impact.worst_case_risk_score = path.risk_score;
        impact.dominant_path_id = path.path_id;
    }
    impact.worst_case_impact_level = std::max(impact.worst_case_impact_level, path.impact_level);
    impact.cumulative_risk_score += path.risk_score;
    impact.paths.push_back(path);
}

[[nodiscard]] bool outranks(const EntityImpact& candidate, const EntityImpact& current)
{
    if (candidate.worst_case_impact_level != current.worst_case_impact_level) {
        return candidate.worst_case_impact_level > current.worst_case_impact_level;
    }
    return candidate.worst_case_risk_score > current.worst_case_risk_score;
}

}  // namespace

AggregationResult
ImpactAggregator::aggregate(std::span<const pathing::DependencyPath> scored_paths) const
{
    AggregationResult result;
    std::unordered_map<graph::EntityRef, std::size_t, graph::EntityRefHash> index;

    for (const auto& path : scored_paths) {
        if (path.nodes.empty()) {
            continue;
        }
        const graph::EntityRef& terminal = path.nodes.back();
        auto [it, inserted] = index.try_emplace(terminal, result.entity_impacts.size());
        if (inserted) {
            result.entity_impacts.push_back(EntityImpact{.entity = terminal});
        }
        fold_path(result.entity_impacts[it->second], path);
    }

    const EntityImpact* triggering = nullptr;
    for (const auto& impact : result.entity_impacts) {
        if (triggering == nullptr || outranks(impact, *triggering)) {
            triggering = &impact;
        }
    }
    if (triggering != nullptr) {
        result.overall = OverallImpact{.worst_impact_level = triggering->worst_case_impact_level,
                                       .worst_risk_score = triggering->worst_case_risk_score,
                                       .triggering_entity = triggering->entity,
                                       .triggering_path_id = triggering->dominant_path_id,
                                       .requires_approval = false};
    }
    return result;
}

}  // namespace depimpact::aggregation
