#pragma once

/**
 * @file impact_result.hpp
 * @brief Authoritative, plain-data outcome of one impact analysis
 */

#include "depimpact/aggregator.hpp"
#include "depimpact/dependency_path.hpp"
#include "depimpact/graph.hpp"
#include "depimpact/path_enumerator.hpp"
#include "depimpact/risk_evaluator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace depimpact::analysis {

/// Reason recorded when enumeration stops at max_paths.
constexpr const char* kTruncatedByPathLimit = "PATH_LIMIT";

struct AnalysisStats
{
    int rows_fetched = 0;
    int graph_nodes = 0;
    int graph_edges = 0;
};

struct ImpactResult
{
    graph::EntityRef root_entity;
    scoring::ChangeType change_type = scoring::ChangeType::kModify;

    std::string scoring_version;
    scoring::PolicySnapshot policy_snapshot;
    std::string approval_policy_version;

    pathing::EnumerationLimits limits;
    int total_paths = 0;
    int total_entities = 0;
    int max_depth_reached = 0;
    bool depth_limit_reached = false;

    bool is_truncated = false;
    std::optional<std::string> truncation_reason;

    aggregation::OverallImpact overall_impact;
    std::vector<aggregation::EntityImpact> entity_impacts;
    std::vector<pathing::DependencyPath> paths;

    AnalysisStats stats;
};

}  // namespace depimpact::analysis
