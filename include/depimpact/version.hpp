#pragma once

/**
 * @file version.hpp
 * @brief depimpact version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include <string>

namespace depimpact {

/// depimpact version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Policy and document versions (embedded in all outputs)
constexpr const char* kScoringPolicyVersion = "v1.0";
constexpr const char* kApprovalPolicyVersion = "approval.v1";
constexpr const char* kResultSchemaVersion = "impact_result.v1";
constexpr const char* kRowsSchemaVersion = "dependency_rows.v1";
constexpr const char* kConfigSchemaVersion = "analysis_config.v1";

struct ToolInfo
{
    std::string name;
    std::string version;
    std::string build_id;
};

[[nodiscard]] inline ToolInfo default_tool_info()
{
    return ToolInfo{.name = "depimpact", .version = kVersion, .build_id = kBuildId};
}

}  // namespace depimpact
