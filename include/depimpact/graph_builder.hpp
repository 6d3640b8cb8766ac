#pragma once

/**
 * @file graph_builder.hpp
 * @brief Raw dependency rows -> immutable ImpactGraph
 */

#include "depimpact/common.hpp"
#include "depimpact/graph.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace depimpact::graph {

/**
 * @brief One dependency as delivered by the metadata repository.
 *
 * The source is the dependent, the target is the dependency it relies on.
 * Type strings are parsed by GraphBuilder.
 */
struct DependencyGraphRow
{
    std::string source_type;
    std::int64_t source_id = 0;
    std::optional<std::string> source_name;
    std::optional<int> source_criticality;

    std::string target_type;
    std::int64_t target_id = 0;
    std::optional<std::string> target_name;
    std::optional<int> target_criticality;

    std::string dependency_type;
};

class GraphBuilder
{
public:
    GraphBuilder() = default;

    /**
     * Build the impact graph. Pure: the same rows always give the same graph.
     *
     * - Both endpoints become nodes; an explicit criticality replaces a defaulted
     *   one for the same entity, never the reverse.
     * - Each row adds the edge target (dependency) -> source (dependent).
     *
     * @return Graph, or UnknownEntityType when a row names an unrecognized entity type
     */
    [[nodiscard]] depimpact::Result<ImpactGraph> build(std::span<const DependencyGraphRow> rows) const;
};

}  // namespace depimpact::graph
