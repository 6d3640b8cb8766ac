/**
 * @file risk_evaluator.cpp
 * @brief Path risk evaluation, policy v1.0
 */

#include "depimpact/risk_evaluator.hpp"

#include "depimpact/canonical_json.hpp"
#include "depimpact/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace depimpact::scoring {

namespace {

constexpr int kPermille = 1000;

[[nodiscard]] Error invalid_snapshot(std::string message)
{
    return Error::make("InvalidPolicySnapshot", std::move(message));
}

[[nodiscard]] std::string lowercase(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

/// Throws std::out_of_range for anything that is not an int-sized integer.
[[nodiscard]] int int_value(const nlohmann::json& value, std::string_view key)
{
    const auto parsed = canonical::as_int(value);
    if (!parsed) {
        throw std::out_of_range(
            std::format("'{}' must be an integer within the int range (got {})", key, value.dump()));
    }
    return *parsed;
}

[[nodiscard]] int int_at(const nlohmann::json& j, std::string_view key)
{
    return int_value(j.at(std::string(key)), key);
}

[[nodiscard]] depimpact::Result<PolicySnapshot> parse_snapshot(const nlohmann::json& j)
{
    PolicySnapshot policy;
    policy.version = j.at("version").get<std::string>();
    policy.depth_decay_permille = int_at(j, "depth_decay_permille");
    policy.depth_factor_floor_permille = int_at(j, "depth_factor_floor_permille");
    policy.default_dependency_weight = int_at(j, "default_dependency_weight");
    policy.default_change_multiplier = int_at(j, "default_change_multiplier");

    for (const auto& [key, value] : j.at("dependency_weights").items()) {
        const auto type = graph::parse_dependency_type(key);
        if (graph::to_string(type) != key) {
            return std::unexpected(
                invalid_snapshot(std::format("Unknown dependency type in weights: '{}'", key)));
        }
        policy.dependency_weights.emplace(type, int_value(value, key));
    }
    for (const auto& [key, value] : j.at("change_type_multipliers").items()) {
        auto change = parse_change_type(key);
        if (!change) {
            return std::unexpected(
                invalid_snapshot(std::format("Unknown change type in multipliers: '{}'", key)));
        }
        policy.change_type_multipliers.emplace(*change, int_value(value, key));
    }

    const auto& scale = j.at("criticality_scale");
    policy.criticality_scale = CriticalityScale{.min = int_at(scale, "min"),
                                                .max = int_at(scale, "max"),
                                                .default_level = int_at(scale, "default")};
    const auto& thresholds = j.at("impact_thresholds");
    policy.impact_thresholds = ImpactThresholds{.critical = int_at(thresholds, "critical"),
                                                .high = int_at(thresholds, "high"),
                                                .medium = int_at(thresholds, "medium")};
    return policy;
}

}  // namespace

std::string_view to_string(ChangeType change) noexcept
{
    switch (change) {
        case ChangeType::kCreate:
            return "Create";
        case ChangeType::kModify:
            return "Modify";
        case ChangeType::kDelete:
            return "Delete";
    }
    return "Modify";
}

depimpact::Result<ChangeType> parse_change_type(std::string_view raw)
{
    const std::string token = lowercase(raw);
    if (token == "create") {
        return ChangeType::kCreate;
    }
    if (token == "modify") {
        return ChangeType::kModify;
    }
    if (token == "delete") {
        return ChangeType::kDelete;
    }
    return std::unexpected(Error::make(
        "InvalidArgument",
        std::format("Unsupported change type '{}' (expected Create, Modify or Delete)", raw)));
}

PolicySnapshot make_policy_v1()
{
    using graph::DependencyType;
    return PolicySnapshot{
        .version = kScoringPolicyVersion,
        .depth_decay_permille = 200,
        .depth_factor_floor_permille = 200,
        .dependency_weights = {{DependencyType::kDelete, 10},
                               {DependencyType::kSchemaDependency, 9},
                               {DependencyType::kUpdate, 8},
                               {DependencyType::kInsert, 7},
                               {DependencyType::kApiCall, 6},
                               {DependencyType::kLogicalFk, 6},
                               {DependencyType::kUnknown, 5},
                               {DependencyType::kSelect, 4}},
        .default_dependency_weight = 5,
        .change_type_multipliers = {{ChangeType::kDelete, 3},
                                    {ChangeType::kModify, 2},
                                    {ChangeType::kCreate, 1}},
        .default_change_multiplier = 1,
        .criticality_scale = CriticalityScale{},
        .impact_thresholds = ImpactThresholds{},
    };
}

depimpact::VoidResult validate_policy(const PolicySnapshot& policy)
{
    if (policy.version.empty()) {
        return std::unexpected(invalid_snapshot("Policy version must not be empty"));
    }
    if (policy.depth_decay_permille < 0 || policy.depth_decay_permille > kPermille) {
        return std::unexpected(invalid_snapshot(
            std::format("depth_decay_permille out of range: {}", policy.depth_decay_permille)));
    }
    if (policy.depth_factor_floor_permille <= 0 || policy.depth_factor_floor_permille > kPermille) {
        return std::unexpected(invalid_snapshot(std::format(
            "depth_factor_floor_permille out of range: {}", policy.depth_factor_floor_permille)));
    }
    if (policy.default_dependency_weight <= 0 || policy.default_change_multiplier <= 0) {
        return std::unexpected(invalid_snapshot("Default weight and multiplier must be positive"));
    }
    for (const auto& [type, weight] : policy.dependency_weights) {
        if (weight <= 0) {
            return std::unexpected(invalid_snapshot(
                std::format("Weight for {} must be positive", graph::to_string(type))));
        }
    }
    for (const auto& [change, multiplier] : policy.change_type_multipliers) {
        if (multiplier <= 0) {
            return std::unexpected(invalid_snapshot(
                std::format("Multiplier for {} must be positive", to_string(change))));
        }
    }
    const auto& scale = policy.criticality_scale;
    if (scale.min < 1 || scale.min > scale.max || scale.default_level < scale.min
        || scale.default_level > scale.max) {
        return std::unexpected(invalid_snapshot("Criticality scale is not ordered"));
    }
    const auto& thresholds = policy.impact_thresholds;
    if (thresholds.medium <= 0 || thresholds.medium > thresholds.high
        || thresholds.high > thresholds.critical) {
        return std::unexpected(invalid_snapshot("Impact thresholds are not ordered"));
    }
    return {};
}

nlohmann::json policy_snapshot_to_json(const PolicySnapshot& policy)
{
    nlohmann::json weights = nlohmann::json::object();
    for (const auto& [type, weight] : policy.dependency_weights) {
        weights[std::string(graph::to_string(type))] = weight;
    }
    nlohmann::json multipliers = nlohmann::json::object();
    for (const auto& [change, multiplier] : policy.change_type_multipliers) {
        multipliers[std::string(to_string(change))] = multiplier;
    }
    return nlohmann::json{
        {                    "version",                    policy.version},
        {       "depth_decay_permille",       policy.depth_decay_permille},
        {"depth_factor_floor_permille", policy.depth_factor_floor_permille},
        {         "dependency_weights",                           weights},
        {  "default_dependency_weight",  policy.default_dependency_weight},
        {    "change_type_multipliers",                       multipliers},
        {  "default_change_multiplier",  policy.default_change_multiplier},
        {          "criticality_scale",
         {{"min", policy.criticality_scale.min},
         {"max", policy.criticality_scale.max},
         {"default", policy.criticality_scale.default_level}}             },
        {          "impact_thresholds",
         {{"critical", policy.impact_thresholds.critical},
         {"high", policy.impact_thresholds.high},
         {"medium", policy.impact_thresholds.medium}}                     }
    };
}

depimpact::Result<PolicySnapshot> policy_snapshot_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_snapshot("Policy snapshot must be a JSON object"));
    }
    depimpact::Result<PolicySnapshot> policy;
    try {
        policy = parse_snapshot(j);
    } catch (const std::exception& ex) {
        return std::unexpected(
            invalid_snapshot(std::string("Malformed policy snapshot: ") + ex.what()));
    }
    if (!policy) {
        return std::unexpected(policy.error());
    }
    if (auto valid = validate_policy(*policy); !valid) {
        return std::unexpected(valid.error());
    }
    return policy;
}

PathRiskEvaluator::PathRiskEvaluator()
    : m_policy(make_policy_v1())
{}

PathRiskEvaluator::PathRiskEvaluator(PolicySnapshot policy)
    : m_policy(std::move(policy))
{}

depimpact::Result<PathRiskEvaluator> PathRiskEvaluator::from_snapshot(PolicySnapshot policy)
{
    if (auto valid = validate_policy(policy); !valid) {
        return std::unexpected(valid.error());
    }
    return PathRiskEvaluator(std::move(policy));
}

int PathRiskEvaluator::dependency_weight(graph::DependencyType type) const
{
    if (auto it = m_policy.dependency_weights.find(type); it != m_policy.dependency_weights.end()) {
        return it->second;
    }
    return m_policy.default_dependency_weight;
}

int PathRiskEvaluator::change_multiplier(ChangeType change) const
{
    if (auto it = m_policy.change_type_multipliers.find(change);
        it != m_policy.change_type_multipliers.end()) {
        return it->second;
    }
    return m_policy.default_change_multiplier;
}

int PathRiskEvaluator::depth_factor_permille(int depth) const noexcept
{
    const int decayed = kPermille - (m_policy.depth_decay_permille * (std::max(depth, 1) - 1));
    return std::max(m_policy.depth_factor_floor_permille, decayed);
}

double PathRiskEvaluator::depth_factor(int depth) const noexcept
{
    return static_cast<double>(depth_factor_permille(depth)) / kPermille;
}

pathing::ImpactLevel PathRiskEvaluator::classify_impact(int score) const noexcept
{
    const auto& thresholds = m_policy.impact_thresholds;
    if (score >= thresholds.critical) {
        return pathing::ImpactLevel::kCritical;
    }
    if (score >= thresholds.high) {
        return pathing::ImpactLevel::kHigh;
    }
    if (score >= thresholds.medium) {
        return pathing::ImpactLevel::kMedium;
    }
    if (score > 0) {
        return pathing::ImpactLevel::kLow;
    }
    return pathing::ImpactLevel::kNone;
}

depimpact::Result<pathing::DependencyPath>
PathRiskEvaluator::evaluate(const pathing::DependencyPath& path, ChangeType change) const
{
    if (path.nodes.empty()) {
        return std::unexpected(
            Error::make("InvalidArgument",
                        std::format("Path '{}' must have at least one node", path.path_id)));
    }
    if (path.depth < 1) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("Path '{}' has depth {}; scored paths need depth >= 1",
                        path.path_id,
                        path.depth)));
    }
    if (path.nodes.size() != path.edges.size() + 1
        || path.edges.size() != static_cast<std::size_t>(path.depth)) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("Path '{}' is malformed: {} nodes, {} edges, depth {}",
                        path.path_id,
                        path.nodes.size(),
                        path.edges.size(),
                        path.depth)));
    }

    const auto& scale = m_policy.criticality_scale;
    const std::int64_t weight = dependency_weight(path.max_dependency_type);
    const std::int64_t multiplier = change_multiplier(change);
    const std::int64_t criticality = std::clamp(path.max_criticality_level, scale.min, scale.max);
    const std::int64_t factor = depth_factor_permille(path.depth);

    // Every factor is non-negative, so +half then truncate rounds half away from zero.
    const std::int64_t raw_permille = weight * multiplier * criticality * factor;
    const auto score = static_cast<int>((raw_permille + (kPermille / 2)) / kPermille);

    pathing::DependencyPath scored = path;
    scored.risk_score = score;
    scored.impact_level = classify_impact(score);
    scored.dominant_entity = path.nodes.back();
    scored.dominant_dependency_type = path.max_dependency_type;
    return scored;
}

}  // namespace depimpact::scoring
