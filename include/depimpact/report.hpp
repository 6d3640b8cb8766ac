#pragma once

/**
 * @file report.hpp
 * @brief impact_result.v1 documents, text rendering and audit replay
 */

#include "depimpact/common.hpp"
#include "depimpact/dependency_path.hpp"
#include "depimpact/graph.hpp"
#include "depimpact/impact_result.hpp"
#include "depimpact/verdict.hpp"
#include "depimpact/version.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace depimpact::report {

/// Entities listed in the text report before the rest are summarized.
constexpr std::size_t kDefaultTopEntities = 10;

[[nodiscard]] nlohmann::json entity_to_json(const graph::EntityRef& entity);
[[nodiscard]] depimpact::Result<graph::EntityRef> entity_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json path_to_json(const pathing::DependencyPath& path);

/**
 * Rebuild a stored path. Scoring fields are read back as stored so that a
 * replay can compare them against a fresh evaluation.
 * @return Path, or ParseError for a malformed entry
 */
[[nodiscard]] depimpact::Result<pathing::DependencyPath> path_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json impact_result_to_json(const analysis::ImpactResult& result);
[[nodiscard]] nlohmann::json verdict_to_json(const verdict::ImpactVerdict& verdict);

/**
 * Full impact_result.v1 document: result fields, embedded policy snapshot,
 * verdict and tool information.
 */
[[nodiscard]] nlohmann::json build_result_document(const analysis::ImpactResult& result,
                                                   const verdict::ImpactVerdict& verdict,
                                                   const ToolInfo& tool);

/**
 * Human-readable report, one entry per line.
 * Entity impacts are listed worst level first, then by score.
 */
[[nodiscard]] std::vector<std::string>
render_text(const analysis::ImpactResult& result,
            const verdict::ImpactVerdict& verdict,
            std::size_t max_entities = kDefaultTopEntities);

struct ReplayMismatch
{
    std::string path_id;
    int stored_score = 0;
    int replayed_score = 0;
    pathing::ImpactLevel stored_level = pathing::ImpactLevel::kNone;
    pathing::ImpactLevel replayed_level = pathing::ImpactLevel::kNone;
};

struct ReplayReport
{
    std::string policy_version;
    std::size_t paths_checked = 0;
    std::vector<ReplayMismatch> mismatches;

    [[nodiscard]] bool clean() const noexcept { return mismatches.empty(); }
};

/**
 * Re-score every stored path of an impact_result.v1 document with the policy
 * snapshot embedded in it and report paths whose stored score or level differ.
 * @return Report, or ParseError / InvalidPolicySnapshot / InvalidArgument
 */
[[nodiscard]] depimpact::Result<ReplayReport> replay_result(const nlohmann::json& document);

}  // namespace depimpact::report
