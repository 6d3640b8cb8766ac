#pragma once

/**
 * @file verdict.hpp
 * @brief Human-readable verdict synthesized from an ImpactResult
 */

#include "depimpact/graph.hpp"
#include "depimpact/impact_result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace depimpact::verdict {

enum class RiskLevel {
    kUnknown,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

[[nodiscard]] std::string_view to_string(RiskLevel risk) noexcept;

/// Critical/High/Medium/Low map across; None maps to Unknown.
[[nodiscard]] RiskLevel map_risk(pathing::ImpactLevel level) noexcept;

struct VerdictReason
{
    int priority = 1;  ///< 1 = most important
    std::string statement;
    std::string implication;
    std::vector<std::string> evidence;  ///< entity stable keys
};

struct ImpactVerdict
{
    RiskLevel risk = RiskLevel::kUnknown;
    bool requires_approval = false;
    std::string summary;
    std::vector<VerdictReason> reasons;  ///< priority order
    std::vector<std::string> limitations;
    std::string generated_at;
};

/**
 * @brief Direct (depth-1) dependents sharing an entity type and dependency type.
 */
struct DirectDependentGroup
{
    graph::EntityType entity_type = graph::EntityType::kTable;
    graph::DependencyType dependency_type = graph::DependencyType::kUnknown;
    std::vector<graph::EntityRef> entities;  ///< distinct, enumeration order

    [[nodiscard]] std::size_t count() const noexcept { return entities.size(); }
};

/**
 * Group depth-1 dependents by (entity type, dominant dependency type).
 * Largest group first; equal sizes keep first-appearance order.
 */
[[nodiscard]] std::vector<DirectDependentGroup>
group_direct_dependents(const analysis::ImpactResult& result);

class VerdictBuilder
{
public:
    VerdictBuilder() = default;

    /// Verdict stamped with the current UTC time.
    [[nodiscard]] ImpactVerdict build(const analysis::ImpactResult& result) const;

    /// Verdict stamped with @p generated_at (for reproducible output).
    [[nodiscard]] ImpactVerdict build(const analysis::ImpactResult& result,
                                      std::string generated_at) const;
};

}  // namespace depimpact::verdict
