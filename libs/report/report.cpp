/**
 * @file report.cpp
 * @brief impact_result.v1 documents, text rendering and audit replay
 */

#include "depimpact/report.hpp"

#include "depimpact/canonical_json.hpp"
#include "depimpact/risk_evaluator.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <ranges>
#include <string_view>

namespace depimpact::report {

namespace {

[[nodiscard]] std::string describe(const graph::EntityRef& entity)
{
    if (entity.name.empty()) {
        return entity.stable_key();
    }
    return std::format("{} ({})", entity.stable_key(), entity.name);
}

[[nodiscard]] std::string_view yes_no(bool value)
{
    return value ? "yes" : "no";
}

[[nodiscard]] nlohmann::json overall_to_json(const aggregation::OverallImpact& overall)
{
    nlohmann::json j = {
        {"worst_impact_level", std::string(pathing::to_string(overall.worst_impact_level))},
        {  "worst_risk_score",                                     overall.worst_risk_score},
        {"triggering_path_id",                                   overall.triggering_path_id},
        { "requires_approval",                                    overall.requires_approval}
    };
    if (overall.triggering_entity) {
        j["triggering_entity"] = entity_to_json(*overall.triggering_entity);
    }
    return j;
}

[[nodiscard]] nlohmann::json entity_impact_to_json(const aggregation::EntityImpact& impact)
{
    nlohmann::json path_ids = nlohmann::json::array();
    for (const auto& path : impact.paths) {
        path_ids.push_back(path.path_id);
    }
    return nlohmann::json{
        {                 "entity",                                           entity_to_json(impact.entity)},
        {"worst_case_impact_level", std::string(pathing::to_string(impact.worst_case_impact_level))},
        {  "worst_case_risk_score",                                          impact.worst_case_risk_score},
        {  "cumulative_risk_score",                                          impact.cumulative_risk_score},
        {       "dominant_path_id",                                               impact.dominant_path_id},
        {               "path_ids",                                                     std::move(path_ids)}
    };
}

[[nodiscard]] nlohmann::json reason_to_json(const verdict::VerdictReason& reason)
{
    return nlohmann::json{
        {   "priority",    reason.priority},
        {  "statement",   reason.statement},
        {"implication", reason.implication},
        {   "evidence",    reason.evidence}
    };
}

/// Worst level first, then highest score; equal entities keep enumeration order.
[[nodiscard]] std::vector<const aggregation::EntityImpact*>
rank_entities(const std::vector<aggregation::EntityImpact>& impacts)
{
    std::vector<const aggregation::EntityImpact*> ranked;
    ranked.reserve(impacts.size());
    for (const auto& impact : impacts) {
        ranked.push_back(&impact);
    }
    std::ranges::stable_sort(ranked, [](const auto* lhs, const auto* rhs) {
        if (lhs->worst_case_impact_level != rhs->worst_case_impact_level) {
            return lhs->worst_case_impact_level > rhs->worst_case_impact_level;
        }
        return lhs->worst_case_risk_score > rhs->worst_case_risk_score;
    });
    return ranked;
}

}  // namespace

nlohmann::json entity_to_json(const graph::EntityRef& entity)
{
    return nlohmann::json{
        {"type", std::string(graph::to_string(entity.type))},
        {  "id",                                   entity.id},
        {"name",                                 entity.name},
        { "key",                         entity.stable_key()}
    };
}

depimpact::Result<graph::EntityRef> entity_from_json(const nlohmann::json& j)
{
    try {
        auto type = graph::parse_entity_type(j.at("type").get<std::string>());
        if (!type) {
            return std::unexpected(type.error());
        }
        return graph::EntityRef{.type = *type,
                                .id = j.at("id").get<std::int64_t>(),
                                .name = j.value("name", std::string{})};
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Malformed entity: {}", ex.what())));
    }
}

nlohmann::json path_to_json(const pathing::DependencyPath& path)
{
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : path.nodes) {
        nodes.push_back(entity_to_json(node));
    }
    nlohmann::json edges = nlohmann::json::array();
    for (const auto edge : path.edges) {
        edges.push_back(std::string(graph::to_string(edge)));
    }
    return nlohmann::json{
        {                 "path_id",                                                  path.path_id},
        {                   "nodes",                                              std::move(nodes)},
        {                   "edges",                                              std::move(edges)},
        {                   "depth",                                                    path.depth},
        {     "max_dependency_type",      std::string(graph::to_string(path.max_dependency_type))},
        {   "max_criticality_level",                                    path.max_criticality_level},
        {              "risk_score",                                               path.risk_score},
        {            "impact_level",          std::string(pathing::to_string(path.impact_level))},
        {         "dominant_entity",                          entity_to_json(path.dominant_entity)},
        {"dominant_dependency_type", std::string(graph::to_string(path.dominant_dependency_type))}
    };
}

depimpact::Result<pathing::DependencyPath> path_from_json(const nlohmann::json& j)
{
    try {
        pathing::DependencyPath path;
        path.path_id = j.at("path_id").get<std::string>();
        for (const auto& node : j.at("nodes")) {
            auto entity = entity_from_json(node);
            if (!entity) {
                return std::unexpected(entity.error());
            }
            path.nodes.push_back(std::move(*entity));
        }
        for (const auto& edge : j.at("edges")) {
            path.edges.push_back(graph::parse_dependency_type(edge.get<std::string>()));
        }
        const auto depth = canonical::as_int(j.at("depth"));
        const auto criticality = canonical::as_int(j.at("max_criticality_level"));
        const auto score = canonical::as_int(j.at("risk_score"));
        if (!depth || !criticality || !score) {
            return std::unexpected(Error::make(
                "ParseError",
                std::format("Malformed path '{}': depth, criticality and score must fit in an int",
                            path.path_id)));
        }
        path.depth = *depth;
        path.max_dependency_type =
            graph::parse_dependency_type(j.at("max_dependency_type").get<std::string>());
        path.max_criticality_level = *criticality;
        path.risk_score = *score;
        auto level = pathing::parse_impact_level(j.at("impact_level").get<std::string>());
        if (!level) {
            return std::unexpected(level.error());
        }
        path.impact_level = *level;
        if (j.contains("dominant_entity")) {
            auto dominant = entity_from_json(j.at("dominant_entity"));
            if (!dominant) {
                return std::unexpected(dominant.error());
            }
            path.dominant_entity = std::move(*dominant);
        }
        path.dominant_dependency_type = path.max_dependency_type;
        if (j.contains("dominant_dependency_type")) {
            path.dominant_dependency_type =
                graph::parse_dependency_type(j.at("dominant_dependency_type").get<std::string>());
        }
        return path;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Malformed path: {}", ex.what())));
    }
}

nlohmann::json impact_result_to_json(const analysis::ImpactResult& result)
{
    nlohmann::json entity_impacts = nlohmann::json::array();
    for (const auto& impact : result.entity_impacts) {
        entity_impacts.push_back(entity_impact_to_json(impact));
    }
    nlohmann::json paths = nlohmann::json::array();
    for (const auto& path : result.paths) {
        paths.push_back(path_to_json(path));
    }

    nlohmann::json j = {
        {            "root_entity",                                 entity_to_json(result.root_entity)},
        {            "change_type",          std::string(scoring::to_string(result.change_type))},
        {        "scoring_version",                                          result.scoring_version},
        {        "policy_snapshot",       scoring::policy_snapshot_to_json(result.policy_snapshot)},
        {"approval_policy_version",                                  result.approval_policy_version},
        {                 "limits",
         {{"max_depth", result.limits.max_depth}, {"max_paths", result.limits.max_paths}}             },
        {            "total_paths",                                              result.total_paths},
        {         "total_entities",                                           result.total_entities},
        {      "max_depth_reached",                                        result.max_depth_reached},
        {    "depth_limit_reached",                                      result.depth_limit_reached},
        {           "is_truncated",                                             result.is_truncated},
        {         "overall_impact",                            overall_to_json(result.overall_impact)},
        {         "entity_impacts",                                        std::move(entity_impacts)},
        {                  "paths",                                                 std::move(paths)},
        {                  "stats",
         {{"rows_fetched", result.stats.rows_fetched},
          {"graph_nodes", result.stats.graph_nodes},
          {"graph_edges", result.stats.graph_edges}}                                                  }
    };
    if (result.truncation_reason) {
        j["truncation_reason"] = *result.truncation_reason;
    }
    return j;
}

nlohmann::json verdict_to_json(const verdict::ImpactVerdict& verdict)
{
    nlohmann::json reasons = nlohmann::json::array();
    for (const auto& reason : verdict.reasons) {
        reasons.push_back(reason_to_json(reason));
    }
    return nlohmann::json{
        {             "risk", std::string(verdict::to_string(verdict.risk))},
        {"requires_approval",                     verdict.requires_approval},
        {          "summary",                               verdict.summary},
        {          "reasons",                            std::move(reasons)},
        {      "limitations",                           verdict.limitations},
        {     "generated_at",                          verdict.generated_at}
    };
}

nlohmann::json build_result_document(const analysis::ImpactResult& result,
                                     const verdict::ImpactVerdict& verdict,
                                     const ToolInfo& tool)
{
    nlohmann::json document = impact_result_to_json(result);
    document["schema_version"] = kResultSchemaVersion;
    document["tool"] = {
        {    "name",     tool.name},
        { "version",  tool.version},
        {"build_id", tool.build_id}
    };
    document["generated_at"] = verdict.generated_at;
    document["verdict"] = verdict_to_json(verdict);
    return document;
}

std::vector<std::string> render_text(const analysis::ImpactResult& result,
                                     const verdict::ImpactVerdict& verdict,
                                     std::size_t max_entities)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("Impact analysis: {} [{}]",
                                describe(result.root_entity),
                                scoring::to_string(result.change_type)));
    lines.push_back(std::format("Verdict: {}", verdict.summary));
    lines.push_back(std::format("Approval required: {}", yes_no(verdict.requires_approval)));

    if (!verdict.reasons.empty()) {
        lines.emplace_back("Reasons:");
        for (const auto& reason : verdict.reasons) {
            lines.push_back(std::format("  {}. {}", reason.priority, reason.statement));
            lines.push_back(std::format("     {}", reason.implication));
            if (!reason.evidence.empty()) {
                std::string evidence;
                for (const auto& [index, key] : std::views::enumerate(reason.evidence)) {
                    if (index > 0) {
                        evidence += ", ";
                    }
                    evidence += key;
                }
                lines.push_back(std::format("     Evidence: {}", evidence));
            }
        }
    }

    if (!verdict.limitations.empty()) {
        lines.emplace_back("Limitations:");
        for (const auto& limitation : verdict.limitations) {
            lines.push_back(std::format("  - {}", limitation));
        }
    }

    if (!result.entity_impacts.empty()) {
        const auto ranked = rank_entities(result.entity_impacts);
        lines.emplace_back("Impacted entities:");
        const auto shown = static_cast<std::ptrdiff_t>(max_entities);
        for (const auto* impact : ranked | std::views::take(shown)) {
            lines.push_back(std::format("  {:<8} score {:>4}  paths {:>3}  {}",
                                        pathing::to_string(impact->worst_case_impact_level),
                                        impact->worst_case_risk_score,
                                        impact->paths.size(),
                                        describe(impact->entity)));
        }
        if (ranked.size() > max_entities) {
            lines.push_back(std::format("  ... and {} more", ranked.size() - max_entities));
        }
    }

    lines.push_back(std::format("Paths: {} (max depth reached {}, limits depth {} / paths {}{})",
                                result.total_paths,
                                result.max_depth_reached,
                                result.limits.max_depth,
                                result.limits.max_paths,
                                result.is_truncated ? ", truncated" : ""));
    lines.push_back(std::format("Policy: scoring {}, approval {}",
                                result.scoring_version,
                                result.approval_policy_version));
    return lines;
}

depimpact::Result<ReplayReport> replay_result(const nlohmann::json& document)
{
    if (!document.is_object() || !document.contains("policy_snapshot")
        || !document.contains("paths") || !document.at("paths").is_array()) {
        return std::unexpected(Error::make(
            "ParseError", "Result document needs 'policy_snapshot' and a 'paths' array"));
    }

    auto snapshot = scoring::policy_snapshot_from_json(document.at("policy_snapshot"));
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    std::string stored_version = snapshot->version;
    if (const auto it = document.find("scoring_version"); it != document.end()) {
        if (!it->is_string()) {
            return std::unexpected(
                Error::make("ParseError", "Result document 'scoring_version' must be a string"));
        }
        stored_version = it->get<std::string>();
    }
    if (stored_version != snapshot->version) {
        return std::unexpected(Error::make(
            "InvalidPolicySnapshot",
            std::format("Scoring version '{}' does not match embedded policy '{}'",
                        stored_version,
                        snapshot->version)));
    }
    auto evaluator = scoring::PathRiskEvaluator::from_snapshot(std::move(*snapshot));
    if (!evaluator) {
        return std::unexpected(evaluator.error());
    }

    if (!document.contains("change_type") || !document.at("change_type").is_string()) {
        return std::unexpected(Error::make("ParseError", "Result document has no 'change_type'"));
    }
    auto change = scoring::parse_change_type(document.at("change_type").get<std::string>());
    if (!change) {
        return std::unexpected(change.error());
    }

    ReplayReport report{.policy_version = evaluator->version(), .paths_checked = 0, .mismatches = {}};
    for (const auto& stored_json : document.at("paths")) {
        auto stored = path_from_json(stored_json);
        if (!stored) {
            return std::unexpected(stored.error());
        }
        auto replayed = evaluator->evaluate(*stored, *change);
        if (!replayed) {
            return std::unexpected(replayed.error());
        }
        ++report.paths_checked;
        if (replayed->risk_score != stored->risk_score
            || replayed->impact_level != stored->impact_level) {
            report.mismatches.push_back(ReplayMismatch{.path_id = stored->path_id,
                                                       .stored_score = stored->risk_score,
                                                       .replayed_score = replayed->risk_score,
                                                       .stored_level = stored->impact_level,
                                                       .replayed_level = replayed->impact_level});
        }
    }
    return report;
}

}  // namespace depimpact::report
