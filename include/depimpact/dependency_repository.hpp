#pragma once

/**
 * @file dependency_repository.hpp
 * @brief Source of raw dependency rows (the only I/O in an analysis)
 */

#include "depimpact/common.hpp"
#include "depimpact/graph.hpp"
#include "depimpact/graph_builder.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace depimpact::analysis {

/**
 * @brief Deadline and cancellation for a repository fetch.
 */
struct FetchContext
{
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stop_token;

    /// @return Empty while the fetch may continue, Cancelled or DeadlineExceeded otherwise
    [[nodiscard]] depimpact::VoidResult check() const;

    /// Context whose deadline is @p timeout from now.
    [[nodiscard]] static FetchContext with_timeout(std::chrono::milliseconds timeout,
                                                   std::stop_token stop_token = {});
};

class DependencyRepository
{
public:
    virtual ~DependencyRepository() = default;

    /**
     * Rows describing the dependents of @p root (transitively). Implementations
     * must honor @p context and stop with its error once it fires.
     */
    [[nodiscard]] virtual depimpact::Result<std::vector<graph::DependencyGraphRow>>
    fetch_downstream(const graph::EntityRef& root, const FetchContext& context) const = 0;
};

/**
 * Parse a dependency_rows.v1 document (already schema-checked or not),
 * checking @p context periodically.
 * @return Rows, SchemaInvalid when a row is missing a required field, or the
 *         context's error once it fires
 */
[[nodiscard]] depimpact::Result<std::vector<graph::DependencyGraphRow>>
parse_dependency_rows(const nlohmann::json& document, const FetchContext& context = {});

/**
 * @brief Repository backed by a dependency_rows.v1 JSON export.
 *
 * The export covers a whole project; every row is returned and the
 * enumerator decides what is reachable from the root.
 */
class JsonFileDependencyRepository final : public DependencyRepository
{
public:
    explicit JsonFileDependencyRepository(std::filesystem::path rows_path,
                                          std::string schema_dir = "schemas");

    [[nodiscard]] depimpact::Result<std::vector<graph::DependencyGraphRow>>
    fetch_downstream(const graph::EntityRef& root, const FetchContext& context) const override;

private:
    std::filesystem::path m_rows_path;
    std::string m_schema_dir;
};

}  // namespace depimpact::analysis
