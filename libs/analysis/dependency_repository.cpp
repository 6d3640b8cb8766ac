/**
 * @file dependency_repository.cpp
 * @brief Fetch context checks and the JSON-file row repository
 */

#include "depimpact/dependency_repository.hpp"

#include "depimpact/canonical_json.hpp"
#include "depimpact/schema_validate.hpp"
#include "depimpact/version.hpp"

#include <cstddef>
#include <exception>
#include <format>
#include <stdexcept>
#include <utility>

namespace depimpact::analysis {

namespace {

/// Rows parsed between two deadline/cancellation checks.
constexpr std::size_t kCheckInterval = 1024;

struct Endpoint
{
    std::string type;
    std::int64_t id = 0;
    std::optional<std::string> name;
    std::optional<int> criticality;
};

[[nodiscard]] Endpoint parse_endpoint(const nlohmann::json& j)
{
    Endpoint endpoint{.type = j.at("type").get<std::string>(),
                      .id = j.at("id").get<std::int64_t>(),
                      .name = std::nullopt,
                      .criticality = std::nullopt};
    if (auto name = j.find("name"); name != j.end() && !name->is_null()) {
        endpoint.name = name->get<std::string>();
    }
    if (auto criticality = j.find("criticality"); criticality != j.end() && !criticality->is_null()) {
        endpoint.criticality = canonical::as_int(*criticality);
        if (!endpoint.criticality) {
            throw std::out_of_range(
                std::format("criticality {} is not an int-sized integer", criticality->dump()));
        }
    }
    return endpoint;
}

[[nodiscard]] graph::DependencyGraphRow parse_row(const nlohmann::json& j)
{
    auto source = parse_endpoint(j.at("source"));
    auto target = parse_endpoint(j.at("target"));
    return graph::DependencyGraphRow{.source_type = std::move(source.type),
                                     .source_id = source.id,
                                     .source_name = std::move(source.name),
                                     .source_criticality = source.criticality,
                                     .target_type = std::move(target.type),
                                     .target_id = target.id,
                                     .target_name = std::move(target.name),
                                     .target_criticality = target.criticality,
                                     .dependency_type = j.at("dependency_type").get<std::string>()};
}

}  // namespace

depimpact::VoidResult FetchContext::check() const
{
    if (stop_token.stop_requested()) {
        return std::unexpected(Error::make("Cancelled", "Dependency fetch was cancelled"));
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        return std::unexpected(
            Error::make("DeadlineExceeded", "Dependency fetch exceeded its deadline"));
    }
    return {};
}

FetchContext FetchContext::with_timeout(std::chrono::milliseconds timeout,
                                        std::stop_token stop_token)
{
    return FetchContext{.deadline = std::chrono::steady_clock::now() + timeout,
                        .stop_token = std::move(stop_token)};
}

depimpact::Result<std::vector<graph::DependencyGraphRow>>
parse_dependency_rows(const nlohmann::json& document, const FetchContext& context)
{
    if (!document.is_object() || !document.contains("rows") || !document.at("rows").is_array()) {
        return std::unexpected(
            Error::make("SchemaInvalid", "dependency rows document missing rows array"));
    }
    std::vector<graph::DependencyGraphRow> rows;
    rows.reserve(document.at("rows").size());
    std::size_t index = 0;
    for (const auto& row : document.at("rows")) {
        if (index % kCheckInterval == 0) {
            if (auto live = context.check(); !live) {
                return std::unexpected(live.error());
            }
        }
        try {
            rows.push_back(parse_row(row));
        } catch (const std::exception& ex) {
            return std::unexpected(Error::make(
                "SchemaInvalid",
                std::format("Malformed dependency row {}: {}", index, ex.what())));
        }
        ++index;
    }
    return rows;
}

JsonFileDependencyRepository::JsonFileDependencyRepository(std::filesystem::path rows_path,
                                                           std::string schema_dir)
    : m_rows_path(std::move(rows_path))
    , m_schema_dir(std::move(schema_dir))
{}

depimpact::Result<std::vector<graph::DependencyGraphRow>>
JsonFileDependencyRepository::fetch_downstream(const graph::EntityRef& /*root*/,
                                               const FetchContext& context) const
{
    if (auto live = context.check(); !live) {
        return std::unexpected(live.error());
    }

    auto document = canonical::read_json_file(m_rows_path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const std::filesystem::path schema_path =
        std::filesystem::path(m_schema_dir) / (std::string(kRowsSchemaVersion) + ".schema.json");
    if (auto validation = depimpact::common::validate_json(*document, schema_path.string());
        !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid",
            std::string("dependency_rows schema validation failed: ") + validation.error().message));
    }
    return parse_dependency_rows(*document, context);
}

}  // namespace depimpact::analysis
