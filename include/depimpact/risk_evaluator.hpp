#pragma once

/**
 * @file risk_evaluator.hpp
 * @brief Deterministic, depth-aware path risk scoring with an auditable policy
 *
 * Score = weight(max dependency type) x multiplier(change type)
 *         x max criticality x depth factor, rounded half away from zero.
 *
 * The evaluator holds a PolicySnapshot and reads every constant from it, so the
 * snapshot embedded in a result is exactly the policy that scored it.
 * All constants are integers (the depth factor is kept in per-mille) so the
 * snapshot survives canonical JSON unchanged.
 */

#include "depimpact/common.hpp"
#include "depimpact/dependency_path.hpp"
#include "depimpact/graph.hpp"

#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace depimpact::scoring {

enum class ChangeType {
    kCreate,
    kModify,
    kDelete,
};

[[nodiscard]] std::string_view to_string(ChangeType change) noexcept;

/// Case-insensitive; InvalidArgument for anything but Create/Modify/Delete.
[[nodiscard]] depimpact::Result<ChangeType> parse_change_type(std::string_view raw);

struct CriticalityScale
{
    int min = graph::kMinCriticality;
    int max = graph::kMaxCriticality;
    int default_level = graph::kDefaultCriticality;
};

/// Lower bounds (inclusive) of each level; any positive score below medium is Low.
struct ImpactThresholds
{
    int critical = 50;
    int high = 30;
    int medium = 15;
};

/**
 * @brief Serializable record of every scoring constant.
 */
struct PolicySnapshot
{
    std::string version;
    int depth_decay_permille = 0;         ///< factor lost per hop beyond the first
    int depth_factor_floor_permille = 0;  ///< deep chains keep at least this much
    std::map<graph::DependencyType, int> dependency_weights;
    int default_dependency_weight = 0;
    std::map<ChangeType, int> change_type_multipliers;
    int default_change_multiplier = 0;
    CriticalityScale criticality_scale;
    ImpactThresholds impact_thresholds;
};

/// The v1.0 scoring policy.
[[nodiscard]] PolicySnapshot make_policy_v1();

/**
 * Check that a snapshot can score: positive weights/multipliers, a depth factor
 * within (0, 1000] per-mille, an ordered criticality scale and ordered thresholds.
 */
[[nodiscard]] depimpact::VoidResult validate_policy(const PolicySnapshot& policy);

[[nodiscard]] nlohmann::json policy_snapshot_to_json(const PolicySnapshot& policy);

/**
 * Rebuild a snapshot from its JSON form (as embedded in impact_result.v1).
 * @return Snapshot, or InvalidPolicySnapshot
 */
[[nodiscard]] depimpact::Result<PolicySnapshot> policy_snapshot_from_json(const nlohmann::json& j);

class PathRiskEvaluator
{
public:
    /// Evaluator for the v1.0 policy.
    PathRiskEvaluator();

    /**
     * Evaluator for an arbitrary (e.g. replayed) policy.
     * @return Evaluator, or InvalidPolicySnapshot when validate_policy() fails
     */
    [[nodiscard]] static depimpact::Result<PathRiskEvaluator> from_snapshot(PolicySnapshot policy);

    [[nodiscard]] const std::string& version() const noexcept { return m_policy.version; }
    [[nodiscard]] const PolicySnapshot& policy_snapshot() const noexcept { return m_policy; }

    /**
     * Score @p path under @p change. Pure: returns a new path, the input is untouched.
     * @return Scored path, or InvalidArgument for an empty path, depth < 1, or
     *         a node/edge count mismatch
     */
    [[nodiscard]] depimpact::Result<pathing::DependencyPath>
    evaluate(const pathing::DependencyPath& path, ChangeType change) const;

    [[nodiscard]] int dependency_weight(graph::DependencyType type) const;
    [[nodiscard]] int change_multiplier(ChangeType change) const;

    /// max(floor, 1000 - decay * (depth - 1)); depth must be >= 1
    [[nodiscard]] int depth_factor_permille(int depth) const noexcept;
    [[nodiscard]] double depth_factor(int depth) const noexcept;

    [[nodiscard]] pathing::ImpactLevel classify_impact(int score) const noexcept;

private:
    explicit PathRiskEvaluator(PolicySnapshot policy);

    PolicySnapshot m_policy;
};

}  // namespace depimpact::scoring
