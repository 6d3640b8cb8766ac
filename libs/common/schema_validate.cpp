/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 *
 * valijson understands draft-07 "definitions"; schemas written with draft
 * 2020-12 "$defs" are rewritten before parsing.
 */

#include "depimpact/schema_validate.hpp"

#include "depimpact/canonical_json.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace depimpact::common {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";
constexpr std::string_view kSchemaUriPrefix = "depimpact:schema/";

/// Errors listed in a failure message; the rest are counted.
constexpr std::size_t kMaxReportedErrors = 8;

void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsRefPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] depimpact::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    auto schema = canonical::read_json_file(path);
    if (!schema) {
        const bool open_failed = schema.error().code == "IOError";
        return std::unexpected(
            Error::make(open_failed ? "SchemaFileOpenFailed" : "SchemaParseFailed",
                        schema.error().message));
    }
    rewrite_defs(*schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    std::size_t reported = 0;
    std::size_t total = 0;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        ++total;
        if (reported == kMaxReportedErrors) {
            continue;
        }
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
        ++reported;
    }
    if (total > reported) {
        text += std::format("\n... and {} more", total - reported);
    }
    return text;
}

}  // namespace

depimpact::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    // Referenced schemas stay alive until populateSchema() has copied what it needs.
    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaUriPrefix.size());
        auto document = load_schema(schema_dir / (name + ".schema.json"));
        if (!document) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*document)));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed",
            std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (validator.validate(schema, target, &results)) {
        return {};
    }
    std::string message = describe_errors(results);
    if (message.empty()) {
        message = "Schema validation failed.";
    }
    return std::unexpected(Error::make("SchemaValidationFailed", std::move(message)));
}

}  // namespace depimpact::common
