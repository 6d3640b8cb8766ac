/**
 * @file test_config.cpp
 * @brief analysis_config.v1 parsing and limit resolution
 */

#include "depimpact/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace depimpact::config::test {

namespace {

using json = nlohmann::json;

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

std::filesystem::path write_config(const TempDir& dir, const json& document)
{
    const auto path = dir.path() / "config.json";
    std::ofstream out(path);
    out << document.dump(2);
    return path;
}

json full_config()
{
    return json{
        {         "schema_version", "analysis_config.v1"},
        {              "max_depth",                    6},
        {              "max_paths",                  250},
        {            "change_type",             "delete"},
        {       "fetch_timeout_ms",                 5000},
        {"approval_policy_version",        "approval.v1"}
    };
}

TEST(ConfigFromJson, ReadsEveryField)
{
    auto config = config_from_json(full_config());
    ASSERT_TRUE(config);
    EXPECT_EQ(config->max_depth, 6);
    EXPECT_EQ(config->max_paths, 250);
    EXPECT_EQ(config->change_type, scoring::ChangeType::kDelete);
    EXPECT_EQ(config->fetch_timeout_ms, 5000);
    EXPECT_EQ(config->approval_policy_version, "approval.v1");
}

TEST(ConfigFromJson, OmittedFieldsStayUnset)
{
    auto config = config_from_json(json{{"schema_version", "analysis_config.v1"}});
    ASSERT_TRUE(config);
    EXPECT_FALSE(config->max_depth.has_value());
    EXPECT_FALSE(config->max_paths.has_value());
    EXPECT_FALSE(config->fetch_timeout_ms.has_value());
    EXPECT_EQ(config->change_type, scoring::ChangeType::kModify);
    EXPECT_EQ(config->approval_policy_version, kApprovalPolicyVersion);
}

TEST(ConfigFromJson, RejectsBadValues)
{
    auto zero_depth = full_config();
    zero_depth["max_depth"] = 0;
    auto config = config_from_json(zero_depth);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");

    auto text_paths = full_config();
    text_paths["max_paths"] = "many";
    config = config_from_json(text_paths);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");

    auto bad_change = full_config();
    bad_change["change_type"] = "Rename";
    config = config_from_json(bad_change);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");

    config = config_from_json(json::array());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");
}

TEST(ConfigFromJson, RejectsValuesBeyondIntRange)
{
    // 2^32 + 1 would narrow to 1 and 3e9 to a negative timeout.
    auto wide_paths = full_config();
    wide_paths["max_paths"] = 4294967297ULL;
    auto config = config_from_json(wide_paths);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");
    EXPECT_NE(config.error().message.find("max_paths"), std::string::npos);

    auto wide_timeout = full_config();
    wide_timeout["fetch_timeout_ms"] = 3000000000LL;
    config = config_from_json(wide_timeout);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "InvalidArgument");

    auto largest = full_config();
    largest["max_paths"] = 2147483647;
    config = config_from_json(largest);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->max_paths, 2147483647);
}

TEST(LoadConfig, OversizedLimitFailsSchema)
{
    TempDir dir("depimpact_config_oversized");
    auto document = full_config();
    document["max_depth"] = 4294967297ULL;
    auto config = load_config(write_config(dir, document), DEPIMPACT_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "SchemaInvalid");
}

TEST(ConfigToJson, EmitsOnlyPresentLimits)
{
    AnalysisConfig config;
    config.max_depth = 3;
    const auto j = config_to_json(config);
    EXPECT_EQ(j.at("schema_version"), "analysis_config.v1");
    EXPECT_EQ(j.at("max_depth"), 3);
    EXPECT_FALSE(j.contains("max_paths"));
    EXPECT_EQ(j.at("change_type"), "Modify");

    auto parsed = config_from_json(j);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->max_depth, 3);
}

TEST(ResolveLimits, BothLimitsRequired)
{
    AnalysisConfig config;
    config.max_paths = 10;
    auto limits = resolve_limits(config);
    ASSERT_FALSE(limits);
    EXPECT_EQ(limits.error().code, "MissingArgument");
    EXPECT_NE(limits.error().message.find("max_depth"), std::string::npos);

    config.max_depth = 4;
    config.max_paths.reset();
    limits = resolve_limits(config);
    ASSERT_FALSE(limits);
    EXPECT_NE(limits.error().message.find("max_paths"), std::string::npos);

    config.max_paths = 10;
    limits = resolve_limits(config);
    ASSERT_TRUE(limits);
    EXPECT_EQ(limits->max_depth, 4);
    EXPECT_EQ(limits->max_paths, 10);
}

TEST(ResolveLimits, NonPositiveRejected)
{
    AnalysisConfig config;
    config.max_depth = 4;
    config.max_paths = -1;
    auto limits = resolve_limits(config);
    ASSERT_FALSE(limits);
    EXPECT_EQ(limits.error().code, "InvalidArgument");
}

TEST(LoadConfig, ValidFile)
{
    TempDir temp("depimpact_config_valid");
    auto config = load_config(write_config(temp, full_config()), DEPIMPACT_SCHEMA_DIR);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->max_paths, 250);
}

TEST(LoadConfig, UnknownKeyFailsSchema)
{
    TempDir temp("depimpact_config_unknown_key");
    auto document = full_config();
    document["max_width"] = 3;
    auto config = load_config(write_config(temp, document), DEPIMPACT_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "SchemaInvalid");
}

TEST(LoadConfig, MissingFile)
{
    TempDir temp("depimpact_config_missing");
    auto config = load_config(temp.path() / "absent.json", DEPIMPACT_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "IOError");
}

}  // namespace

}  // namespace depimpact::config::test
