#pragma once

/**
 * @file impact_analyzer.hpp
 * @brief Orchestrates fetch -> graph -> paths -> scores -> aggregation -> approval
 */

#include "depimpact/aggregator.hpp"
#include "depimpact/approval_policy.hpp"
#include "depimpact/common.hpp"
#include "depimpact/dependency_repository.hpp"
#include "depimpact/graph_builder.hpp"
#include "depimpact/impact_result.hpp"
#include "depimpact/path_enumerator.hpp"
#include "depimpact/risk_evaluator.hpp"

#include <memory>
#include <span>

namespace depimpact::analysis {

/**
 * @brief One analyzer serves any number of independent requests; it keeps no
 * per-request state.
 */
class ImpactAnalyzer
{
public:
    /// v1 scoring and v1 approval.
    ImpactAnalyzer();
    /// A null @p approval_policy selects ApprovalPolicyV1; approval_policy().version()
    /// reports which policy is in effect and is stamped on every result.
    ImpactAnalyzer(scoring::PathRiskEvaluator evaluator,
                   std::unique_ptr<approval::ApprovalPolicy> approval_policy);

    /**
     * Fetch rows for @p root from @p repository, then run analyze_rows().
     * Limits are validated before any I/O.
     */
    [[nodiscard]] depimpact::Result<ImpactResult> analyze(const DependencyRepository& repository,
                                                          const graph::EntityRef& root,
                                                          scoring::ChangeType change,
                                                          const pathing::EnumerationLimits& limits,
                                                          const FetchContext& context = {}) const;

    /**
     * Pure in-memory pipeline over already fetched rows. No rows, or a root
     * without dependents, yields an empty result that still carries the policy.
     */
    [[nodiscard]] depimpact::Result<ImpactResult>
    analyze_rows(std::span<const graph::DependencyGraphRow> rows,
                 const graph::EntityRef& root,
                 scoring::ChangeType change,
                 const pathing::EnumerationLimits& limits) const;

    [[nodiscard]] const scoring::PathRiskEvaluator& evaluator() const noexcept
    {
        return m_evaluator;
    }
    [[nodiscard]] const approval::ApprovalPolicy& approval_policy() const noexcept
    {
        return *m_approval_policy;
    }

private:
    graph::GraphBuilder m_graph_builder;
    scoring::PathRiskEvaluator m_evaluator;
    aggregation::ImpactAggregator m_aggregator;
    std::unique_ptr<approval::ApprovalPolicy> m_approval_policy;
};

}  // namespace depimpact::analysis
