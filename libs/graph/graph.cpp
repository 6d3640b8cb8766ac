/**
 * @file graph.cpp
 * @brief Entity/dependency token parsing and ImpactGraph lookups
 */

#include "depimpact/graph.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

namespace depimpact::graph {

namespace {

/// Lowercase and drop separators so "LOGICAL_FK", "LogicalFk" and "logical-fk" compare equal.
[[nodiscard]] std::string normalize_token(std::string_view raw)
{
    std::string token;
    token.reserve(raw.size());
    for (char c : raw) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return token;
}

}  // namespace

std::string_view to_string(EntityType type) noexcept
{
    switch (type) {
        case EntityType::kTable:
            return "Table";
        case EntityType::kView:
            return "View";
        case EntityType::kStoredProcedure:
            return "StoredProcedure";
        case EntityType::kFunction:
            return "Function";
    }
    return "Table";
}

std::string_view to_string(DependencyType type) noexcept
{
    switch (type) {
        case DependencyType::kUnknown:
            return "Unknown";
        case DependencyType::kSelect:
            return "Select";
        case DependencyType::kInsert:
            return "Insert";
        case DependencyType::kUpdate:
            return "Update";
        case DependencyType::kDelete:
            return "Delete";
        case DependencyType::kSchemaDependency:
            return "SchemaDependency";
        case DependencyType::kApiCall:
            return "ApiCall";
        case DependencyType::kLogicalFk:
            return "LogicalFk";
    }
    return "Unknown";
}

depimpact::Result<EntityType> parse_entity_type(std::string_view raw)
{
    const std::string token = normalize_token(raw);
    if (token == "table") {
        return EntityType::kTable;
    }
    if (token == "view") {
        return EntityType::kView;
    }
    if (token == "storedprocedure" || token == "sp" || token == "procedure") {
        return EntityType::kStoredProcedure;
    }
    if (token == "function") {
        return EntityType::kFunction;
    }
    return std::unexpected(Error::make(
        "UnknownEntityType",
        std::format("Unknown entity type '{}'; dependency metadata must be fixed", raw)));
}

DependencyType parse_dependency_type(std::string_view raw)
{
    const std::string token = normalize_token(raw);
    if (token == "select") {
        return DependencyType::kSelect;
    }
    if (token == "insert") {
        return DependencyType::kInsert;
    }
    if (token == "update") {
        return DependencyType::kUpdate;
    }
    if (token == "delete") {
        return DependencyType::kDelete;
    }
    if (token == "schemadependency") {
        return DependencyType::kSchemaDependency;
    }
    if (token == "apicall") {
        return DependencyType::kApiCall;
    }
    if (token == "logicalfk") {
        return DependencyType::kLogicalFk;
    }
    return DependencyType::kUnknown;
}

int severity_rank(DependencyType type) noexcept
{
    switch (type) {
        case DependencyType::kDelete:
            return 6;
        case DependencyType::kSchemaDependency:
            return 5;
        case DependencyType::kUpdate:
            return 4;
        case DependencyType::kInsert:
            return 3;
        case DependencyType::kApiCall:
        case DependencyType::kLogicalFk:
            return 2;
        case DependencyType::kSelect:
            return 1;
        case DependencyType::kUnknown:
            return 0;
    }
    return 0;
}

DependencyType max_severity(DependencyType running, DependencyType next) noexcept
{
    return severity_rank(next) > severity_rank(running) ? next : running;
}

int clamp_criticality(int raw) noexcept
{
    return std::clamp(raw, kMinCriticality, kMaxCriticality);
}

std::string EntityRef::stable_key() const
{
    return std::format("{}:{}", to_string(type), id);
}

std::size_t EntityRefHash::operator()(const EntityRef& entity) const noexcept
{
    const std::size_t type_hash = std::hash<int>{}(static_cast<int>(entity.type));
    const std::size_t id_hash = std::hash<std::int64_t>{}(entity.id);
    return id_hash ^ (type_hash + 0x9e3779b97f4a7c15ULL + (id_hash << 6U) + (id_hash >> 2U));
}

depimpact::Result<EntityRef> parse_stable_key(std::string_view key)
{
    const auto colon = key.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == key.size()) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("Invalid entity key '{}'; expected <Type>:<Id>", key)));
    }
    auto type = parse_entity_type(key.substr(0, colon));
    if (!type) {
        return std::unexpected(type.error());
    }
    const std::string_view id_text = key.substr(colon + 1);
    std::int64_t id = 0;
    auto [ptr, ec] = std::from_chars(id_text.data(), id_text.data() + id_text.size(), id);
    if (ec != std::errc{} || ptr != id_text.data() + id_text.size()) {
        return std::unexpected(
            Error::make("InvalidArgument", std::format("Invalid entity id in key '{}'", key)));
    }
    return EntityRef{.type = *type, .id = id, .name = {}};
}

ImpactGraph::ImpactGraph(NodeMap nodes, AdjacencyMap adjacency)
    : m_nodes(std::move(nodes))
    , m_adjacency(std::move(adjacency))
{
    for (const auto& [_, edges] : m_adjacency) {
        m_edge_count += edges.size();
    }
}

bool ImpactGraph::contains(const EntityRef& entity) const
{
    return m_nodes.contains(entity);
}

const GraphNode* ImpactGraph::find_node(const EntityRef& entity) const
{
    if (auto it = m_nodes.find(entity); it != m_nodes.end()) {
        return &it->second;
    }
    return nullptr;
}

std::span<const GraphEdge> ImpactGraph::dependents_of(const EntityRef& entity) const
{
    if (auto it = m_adjacency.find(entity); it != m_adjacency.end()) {
        return it->second;
    }
    return {};
}

}  // namespace depimpact::graph
