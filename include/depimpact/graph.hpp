#pragma once

/**
 * @file graph.hpp
 * @brief Entity identity, edge primitives and the immutable impact graph
 */

#include "depimpact/common.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace depimpact::graph {

/**
 * Kind of database object taking part in the dependency graph.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class EntityType {
    kTable,
    kView,
    kStoredProcedure,
    kFunction,
};

/**
 * How a dependent uses its dependency.
 * Severity ordering is defined by severity_rank(), not by the enumerator values.
 */
enum class DependencyType {
    kUnknown,
    kSelect,
    kInsert,
    kUpdate,
    kDelete,
    kSchemaDependency,
    kApiCall,
    kLogicalFk,
};

/// Bounded business-criticality scale
constexpr int kMinCriticality = 1;
constexpr int kMaxCriticality = 5;
constexpr int kDefaultCriticality = 3;

[[nodiscard]] std::string_view to_string(EntityType type) noexcept;
[[nodiscard]] std::string_view to_string(DependencyType type) noexcept;

/**
 * Parse an entity-type token (case-insensitive, '_', '-' and ' ' ignored).
 * Accepts "SP" and "Procedure" as aliases of StoredProcedure.
 * @return Parsed type, or UnknownEntityType error
 */
[[nodiscard]] depimpact::Result<EntityType> parse_entity_type(std::string_view raw);

/**
 * Parse a dependency-type token (case-insensitive, '_', '-' and ' ' ignored).
 * Unrecognized tokens map to DependencyType::kUnknown.
 */
[[nodiscard]] DependencyType parse_dependency_type(std::string_view raw);

/**
 * Severity rank used to track the worst interaction along a path:
 * Delete > SchemaDependency > Update > Insert > ApiCall = LogicalFk > Select > Unknown.
 */
[[nodiscard]] int severity_rank(DependencyType type) noexcept;

/// Higher-severity of the two; @p running wins ties.
[[nodiscard]] DependencyType max_severity(DependencyType running, DependencyType next) noexcept;

/// Clamp an explicit criticality into [kMinCriticality, kMaxCriticality].
[[nodiscard]] int clamp_criticality(int raw) noexcept;

/**
 * @brief Identity of a database entity.
 *
 * Equality and hashing use (type, id) only; the name is display metadata.
 */
struct EntityRef
{
    EntityType type = EntityType::kTable;
    std::int64_t id = 0;
    std::string name;

    /// "<Type>:<Id>", e.g. "Table:42"
    [[nodiscard]] std::string stable_key() const;

    friend bool operator==(const EntityRef& lhs, const EntityRef& rhs) noexcept
    {
        return lhs.type == rhs.type && lhs.id == rhs.id;
    }
};

struct EntityRefHash
{
    [[nodiscard]] std::size_t operator()(const EntityRef& entity) const noexcept;
};

/**
 * Parse "<Type>:<Id>" into an EntityRef (name left empty).
 */
[[nodiscard]] depimpact::Result<EntityRef> parse_stable_key(std::string_view key);

struct GraphNode
{
    EntityRef entity;
    int criticality_level = kDefaultCriticality;
    bool explicit_criticality = false;
};

/**
 * @brief Directed edge from a dependency to one of its dependents.
 */
struct GraphEdge
{
    EntityRef from;  ///< dependency (the entity relied upon)
    EntityRef to;    ///< dependent
    DependencyType dependency_type = DependencyType::kUnknown;
};

/**
 * @brief Immutable directed graph keyed for "who depends on me" lookups.
 */
class ImpactGraph
{
public:
    using NodeMap = std::unordered_map<EntityRef, GraphNode, EntityRefHash>;
    using AdjacencyMap = std::unordered_map<EntityRef, std::vector<GraphEdge>, EntityRefHash>;

    ImpactGraph() = default;
    ImpactGraph(NodeMap nodes, AdjacencyMap adjacency);

    [[nodiscard]] bool contains(const EntityRef& entity) const;

    /// @return Node for @p entity, or nullptr when absent
    [[nodiscard]] const GraphNode* find_node(const EntityRef& entity) const;

    /// Edges whose dependency is @p entity (empty when it has no dependents)
    [[nodiscard]] std::span<const GraphEdge> dependents_of(const EntityRef& entity) const;

    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edge_count; }
    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }

private:
    NodeMap m_nodes;
    AdjacencyMap m_adjacency;
    std::size_t m_edge_count = 0;
};

}  // namespace depimpact::graph
