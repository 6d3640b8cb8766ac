/**
 * @file config.cpp
 * @brief analysis_config.v1 loading and limit resolution
 */

#include "depimpact/config.hpp"

#include "depimpact/canonical_json.hpp"
#include "depimpact/schema_validate.hpp"

#include <format>
#include <limits>
#include <string_view>

namespace depimpact::config {

namespace {

[[nodiscard]] depimpact::Result<std::optional<int>> positive_field(const nlohmann::json& j,
                                                                   std::string_view key)
{
    const auto it = j.find(std::string(key));
    if (it == j.end()) {
        return std::optional<int>{};
    }
    const auto value = canonical::as_int(*it);
    if (!value || *value <= 0) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("'{}' must be a positive integer no larger than {} (got {})",
                        key,
                        std::numeric_limits<int>::max(),
                        it->dump())));
    }
    return std::optional<int>{*value};
}

}  // namespace

depimpact::Result<AnalysisConfig> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidArgument", "Config must be a JSON object"));
    }

    AnalysisConfig config;
    auto max_depth = positive_field(j, "max_depth");
    if (!max_depth) {
        return std::unexpected(max_depth.error());
    }
    config.max_depth = *max_depth;

    auto max_paths = positive_field(j, "max_paths");
    if (!max_paths) {
        return std::unexpected(max_paths.error());
    }
    config.max_paths = *max_paths;

    auto timeout = positive_field(j, "fetch_timeout_ms");
    if (!timeout) {
        return std::unexpected(timeout.error());
    }
    config.fetch_timeout_ms = *timeout;

    if (const auto it = j.find("change_type"); it != j.end()) {
        if (!it->is_string()) {
            return std::unexpected(Error::make("InvalidArgument", "'change_type' must be a string"));
        }
        auto change = scoring::parse_change_type(it->get<std::string>());
        if (!change) {
            return std::unexpected(change.error());
        }
        config.change_type = *change;
    }

    if (const auto it = j.find("approval_policy_version"); it != j.end()) {
        if (!it->is_string()) {
            return std::unexpected(
                Error::make("InvalidArgument", "'approval_policy_version' must be a string"));
        }
        config.approval_policy_version = it->get<std::string>();
    }
    return config;
}

nlohmann::json config_to_json(const AnalysisConfig& config)
{
    nlohmann::json j = {
        {         "schema_version",                                kConfigSchemaVersion},
        {            "change_type", std::string(scoring::to_string(config.change_type))},
        {"approval_policy_version",                       config.approval_policy_version}
    };
    if (config.max_depth) {
        j["max_depth"] = *config.max_depth;
    }
    if (config.max_paths) {
        j["max_paths"] = *config.max_paths;
    }
    if (config.fetch_timeout_ms) {
        j["fetch_timeout_ms"] = *config.fetch_timeout_ms;
    }
    return j;
}

depimpact::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                              const std::filesystem::path& schema_dir)
{
    auto document = canonical::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const auto schema_path = schema_dir / (std::string(kConfigSchemaVersion) + ".schema.json");
    if (auto validation = common::validate_json(*document, schema_path.string()); !validation) {
        return std::unexpected(
            Error::make("SchemaInvalid",
                        std::format("{}: config schema validation failed: {}",
                                    path.string(),
                                    validation.error().message)));
    }
    return config_from_json(*document);
}

depimpact::Result<pathing::EnumerationLimits> resolve_limits(const AnalysisConfig& config)
{
    if (!config.max_depth) {
        return std::unexpected(
            Error::make("MissingArgument", "max_depth is required (config file or --max-depth)"));
    }
    if (!config.max_paths) {
        return std::unexpected(
            Error::make("MissingArgument", "max_paths is required (config file or --max-paths)"));
    }
    pathing::EnumerationLimits limits{.max_depth = *config.max_depth,
                                      .max_paths = *config.max_paths};
    if (auto valid = pathing::validate_limits(limits); !valid) {
        return std::unexpected(valid.error());
    }
    return limits;
}

}  // namespace depimpact::config
