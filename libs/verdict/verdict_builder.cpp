/**
 * @file verdict_builder.cpp
 * @brief Verdict synthesis: risk mapping, ranked reasons, limitations
 */

#include "depimpact/verdict.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

namespace depimpact::verdict {

namespace {

constexpr int kDeepChainThreshold = 3;

[[nodiscard]] std::string_view entity_noun(graph::EntityType type) noexcept
{
    switch (type) {
        case graph::EntityType::kTable:
            return "table";
        case graph::EntityType::kView:
            return "view";
        case graph::EntityType::kStoredProcedure:
            return "stored procedure";
        case graph::EntityType::kFunction:
            return "function";
    }
    return "entity";
}

[[nodiscard]] std::string_view dependency_verb(graph::DependencyType type) noexcept
{
    switch (type) {
        case graph::DependencyType::kSelect:
            return "read from";
        case graph::DependencyType::kInsert:
            return "insert into";
        case graph::DependencyType::kUpdate:
            return "update";
        case graph::DependencyType::kDelete:
            return "delete from";
        default:
            return "depend on";
    }
}

[[nodiscard]] std::string group_statement(const DirectDependentGroup& group,
                                          graph::EntityType root_type)
{
    return std::format("{} {}{} {} this {}",
                       group.count(),
                       entity_noun(group.entity_type),
                       group.count() == 1 ? "" : "s",
                       dependency_verb(group.dependency_type),
                       entity_noun(root_type));
}

[[nodiscard]] std::string group_implication(const DirectDependentGroup& group)
{
    if (group.dependency_type == graph::DependencyType::kUpdate
        || group.dependency_type == graph::DependencyType::kDelete) {
        return "IMPORTANT: Data modification logic will be affected; coordinate testing "
               "of these dependents before deployment";
    }
    switch (group.entity_type) {
        case graph::EntityType::kStoredProcedure:
            return "Coordinate testing across these procedures";
        case graph::EntityType::kView:
            return "View results may change";
        case graph::EntityType::kFunction:
            return "Function behavior may change";
        case graph::EntityType::kTable:
            break;
    }
    return "Review dependent components during testing";
}

[[nodiscard]] bool all_edges_read_only(const analysis::ImpactResult& result)
{
    return std::ranges::all_of(result.paths, [](const pathing::DependencyPath& path) {
        return std::ranges::all_of(path.edges, [](graph::DependencyType type) {
            return type == graph::DependencyType::kSelect;
        });
    });
}

[[nodiscard]] std::vector<VerdictReason> build_reasons(const analysis::ImpactResult& result)
{
    std::vector<VerdictReason> reasons;
    const auto groups = group_direct_dependents(result);

    if (groups.empty()) {
        reasons.push_back(VerdictReason{
            .priority = 1,
            .statement = "No dependent entities detected",
            .implication = "Either the entity is unused or dependency metadata is incomplete",
            .evidence = {}});
        return reasons;
    }

    const DirectDependentGroup& primary = groups.front();
    std::vector<std::string> evidence;
    evidence.reserve(primary.entities.size());
    for (const auto& entity : primary.entities) {
        evidence.push_back(entity.stable_key());
    }
    reasons.push_back(VerdictReason{.priority = 1,
                                    .statement = group_statement(primary, result.root_entity.type),
                                    .implication = group_implication(primary),
                                    .evidence = std::move(evidence)});

    if (all_edges_read_only(result)) {
        reasons.push_back(VerdictReason{.priority = 3,
                                        .statement = "All detected dependencies are read-only",
                                        .implication = "Lower risk of data corruption",
                                        .evidence = {}});
    }
    return reasons;
}

[[nodiscard]] std::vector<std::string> detect_limitations(const analysis::ImpactResult& result)
{
    std::vector<std::string> limitations;
    if (result.is_truncated) {
        limitations.push_back(
            std::format("Analysis was truncated at {} paths; the reported impact is a lower bound",
                        result.limits.max_paths));
    }
    if (result.max_depth_reached > kDeepChainThreshold) {
        limitations.emplace_back("Deep dependency chains detected; indirect effects may exist");
    }
    if (result.depth_limit_reached) {
        limitations.push_back(
            std::format("Dependents beyond the depth limit of {} were not explored",
                        result.limits.max_depth));
    }
    if (result.entity_impacts.empty()) {
        limitations.emplace_back("No entity impacts found; metadata may be incomplete");
    }
    return limitations;
}

}  // namespace

std::string_view to_string(RiskLevel risk) noexcept
{
    switch (risk) {
        case RiskLevel::kUnknown:
            return "Unknown";
        case RiskLevel::kLow:
            return "Low";
        case RiskLevel::kMedium:
            return "Medium";
        case RiskLevel::kHigh:
            return "High";
        case RiskLevel::kCritical:
            return "Critical";
    }
    return "Unknown";
}

RiskLevel map_risk(pathing::ImpactLevel level) noexcept
{
    switch (level) {
        case pathing::ImpactLevel::kCritical:
            return RiskLevel::kCritical;
        case pathing::ImpactLevel::kHigh:
            return RiskLevel::kHigh;
        case pathing::ImpactLevel::kMedium:
            return RiskLevel::kMedium;
        case pathing::ImpactLevel::kLow:
            return RiskLevel::kLow;
        case pathing::ImpactLevel::kNone:
            break;
    }
    return RiskLevel::kUnknown;
}

std::vector<DirectDependentGroup> group_direct_dependents(const analysis::ImpactResult& result)
{
    std::vector<DirectDependentGroup> groups;
    for (const auto& impact : result.entity_impacts) {
        for (const auto& path : impact.paths | std::views::filter([](const auto& p) {
                                    return p.depth == 1;
                                })) {
            auto group = std::ranges::find_if(groups, [&](const DirectDependentGroup& g) {
                return g.entity_type == impact.entity.type
                       && g.dependency_type == path.dominant_dependency_type;
            });
            if (group == groups.end()) {
                groups.push_back(DirectDependentGroup{.entity_type = impact.entity.type,
                                                      .dependency_type =
                                                          path.dominant_dependency_type,
                                                      .entities = {}});
                group = std::prev(groups.end());
            }
            if (std::ranges::find(group->entities, impact.entity) == group->entities.end()) {
                group->entities.push_back(impact.entity);
            }
        }
    }
    std::ranges::stable_sort(groups, [](const DirectDependentGroup& lhs,
                                        const DirectDependentGroup& rhs) {
        return lhs.count() > rhs.count();
    });
    return groups;
}

ImpactVerdict VerdictBuilder::build(const analysis::ImpactResult& result) const
{
    return build(result, common::current_time_utc());
}

ImpactVerdict VerdictBuilder::build(const analysis::ImpactResult& result,
                                    std::string generated_at) const
{
    const RiskLevel risk = map_risk(result.overall_impact.worst_impact_level);
    auto reasons = build_reasons(result);
    std::string summary = reasons.empty()
                              ? std::string("No significant impact detected")
                              : std::format("{} risk – {}", to_string(risk),
                                            reasons.front().statement);

    return ImpactVerdict{.risk = risk,
                         .requires_approval = result.overall_impact.requires_approval,
                         .summary = std::move(summary),
                         .reasons = std::move(reasons),
                         .limitations = detect_limitations(result),
                         .generated_at = std::move(generated_at)};
}

}  // namespace depimpact::verdict
