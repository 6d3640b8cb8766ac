#pragma once

/**
 * @file config.hpp
 * @brief analysis_config.v1: traversal limits and run defaults
 */

#include "depimpact/common.hpp"
#include "depimpact/path_enumerator.hpp"
#include "depimpact/risk_evaluator.hpp"
#include "depimpact/version.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace depimpact::config {

/**
 * @brief Settings for one analysis run.
 *
 * Limits are optional here because the engine has no built-in defaults:
 * they must come from the file or from the command line.
 */
struct AnalysisConfig
{
    std::optional<int> max_depth;
    std::optional<int> max_paths;
    scoring::ChangeType change_type = scoring::ChangeType::kModify;
    std::optional<int> fetch_timeout_ms;
    std::string approval_policy_version = kApprovalPolicyVersion;
};

/**
 * Build a config from an analysis_config.v1 document (already schema-checked).
 * @return Config, or InvalidArgument for a bad change type or non-positive value
 */
[[nodiscard]] depimpact::Result<AnalysisConfig> config_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json config_to_json(const AnalysisConfig& config);

/**
 * Read @p path and validate it against analysis_config.v1.schema.json in @p schema_dir.
 * @return Config, or IOError / ParseError / SchemaInvalid / InvalidArgument
 */
[[nodiscard]] depimpact::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                                            const std::filesystem::path& schema_dir);

/**
 * Limits ready for the enumerator.
 * @return Limits, or MissingArgument when either is unset, InvalidArgument when non-positive
 */
[[nodiscard]] depimpact::Result<pathing::EnumerationLimits>
resolve_limits(const AnalysisConfig& config);

}  // namespace depimpact::config
