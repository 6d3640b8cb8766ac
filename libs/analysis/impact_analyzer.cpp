/**
 * @file impact_analyzer.cpp
 * @brief Impact analysis pipeline
 */

#include "depimpact/impact_analyzer.hpp"

#include <utility>
#include <vector>

namespace depimpact::analysis {

namespace {

[[nodiscard]] ImpactResult empty_result(const graph::EntityRef& root,
                                        scoring::ChangeType change,
                                        const pathing::EnumerationLimits& limits,
                                        const scoring::PathRiskEvaluator& evaluator,
                                        const approval::ApprovalPolicy& approval_policy)
{
    ImpactResult result;
    result.root_entity = root;
    result.change_type = change;
    result.scoring_version = evaluator.version();
    result.policy_snapshot = evaluator.policy_snapshot();
    result.approval_policy_version = std::string(approval_policy.version());
    result.limits = limits;
    result.overall_impact.requires_approval =
        approval_policy.requires_approval(result.overall_impact, false);
    return result;
}

}  // namespace

ImpactAnalyzer::ImpactAnalyzer()
    : ImpactAnalyzer(scoring::PathRiskEvaluator{}, std::make_unique<approval::ApprovalPolicyV1>())
{}

ImpactAnalyzer::ImpactAnalyzer(scoring::PathRiskEvaluator evaluator,
                               std::unique_ptr<approval::ApprovalPolicy> approval_policy)
    : m_evaluator(std::move(evaluator))
    , m_approval_policy(approval_policy ? std::move(approval_policy)
                                        : std::make_unique<approval::ApprovalPolicyV1>())
{}

depimpact::Result<ImpactResult> ImpactAnalyzer::analyze(const DependencyRepository& repository,
                                                        const graph::EntityRef& root,
                                                        scoring::ChangeType change,
                                                        const pathing::EnumerationLimits& limits,
                                                        const FetchContext& context) const
{
    if (auto valid = pathing::validate_limits(limits); !valid) {
        return std::unexpected(valid.error());
    }
    auto rows = repository.fetch_downstream(root, context);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    return analyze_rows(*rows, root, change, limits);
}

depimpact::Result<ImpactResult>
ImpactAnalyzer::analyze_rows(std::span<const graph::DependencyGraphRow> rows,
                             const graph::EntityRef& root,
                             scoring::ChangeType change,
                             const pathing::EnumerationLimits& limits) const
{
    if (auto valid = pathing::validate_limits(limits); !valid) {
        return std::unexpected(valid.error());
    }

    ImpactResult result = empty_result(root, change, limits, m_evaluator, *m_approval_policy);
    result.stats.rows_fetched = static_cast<int>(rows.size());
    if (rows.empty()) {
        return result;
    }

    auto graph = m_graph_builder.build(rows);
    if (!graph) {
        return std::unexpected(graph.error());
    }
    result.stats.graph_nodes = static_cast<int>(graph->node_count());
    result.stats.graph_edges = static_cast<int>(graph->edge_count());

    const graph::GraphNode* root_node = graph->find_node(root);
    if (root_node == nullptr) {
        // Every row registers both endpoints, so an absent root has no dependents.
        return result;
    }
    if (result.root_entity.name.empty()) {
        result.root_entity.name = root_node->entity.name;
    }

    auto enumeration = pathing::enumerate_paths(*graph, root, limits);
    if (!enumeration) {
        return std::unexpected(enumeration.error());
    }

    std::vector<pathing::DependencyPath> scored;
    scored.reserve(enumeration->paths.size());
    for (const auto& path : enumeration->paths) {
        auto scored_path = m_evaluator.evaluate(path, change);
        if (!scored_path) {
            return std::unexpected(scored_path.error());
        }
        scored.push_back(std::move(*scored_path));
    }

    auto aggregation = m_aggregator.aggregate(scored);
    aggregation.overall.requires_approval =
        m_approval_policy->requires_approval(aggregation.overall, enumeration->truncated);

    result.total_paths = static_cast<int>(scored.size());
    result.total_entities = static_cast<int>(aggregation.entity_impacts.size());
    result.max_depth_reached = enumeration->max_depth_reached;
    result.depth_limit_reached = enumeration->depth_limit_reached;
    result.is_truncated = enumeration->truncated;
    if (enumeration->truncated) {
        result.truncation_reason = kTruncatedByPathLimit;
    }
    result.overall_impact = std::move(aggregation.overall);
    result.entity_impacts = std::move(aggregation.entity_impacts);
    result.paths = std::move(scored);
    return result;
}

}  // namespace depimpact::analysis
