/**
 * @file path_enumerator.cpp
 * @brief Bounded BFS path enumeration with per-path cycle avoidance
 */

#include "depimpact/path_enumerator.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <format>
#include <utility>

namespace depimpact::pathing {

namespace {

[[nodiscard]] bool has_unvisited_dependent(const graph::ImpactGraph& graph, const PathState& state)
{
    return std::ranges::any_of(graph.dependents_of(state.current()),
                               [&state](const graph::GraphEdge& edge) {
                                   return !state.contains(edge.to);
                               });
}

}  // namespace

depimpact::VoidResult validate_limits(const EnumerationLimits& limits)
{
    if (limits.max_depth <= 0) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("max_depth must be positive (got {})", limits.max_depth)));
    }
    if (limits.max_paths <= 0) {
        return std::unexpected(Error::make(
            "InvalidArgument",
            std::format("max_paths must be positive (got {})", limits.max_paths)));
    }
    return {};
}

depimpact::Result<PathEnumeration> enumerate_paths(const graph::ImpactGraph& graph,
                                                   const graph::EntityRef& root,
                                                   const EnumerationLimits& limits)
{
    if (auto valid = validate_limits(limits); !valid) {
        return std::unexpected(valid.error());
    }
    const graph::GraphNode* root_node = graph.find_node(root);
    if (root_node == nullptr) {
        return std::unexpected(Error::make(
            "RootNotFound",
            std::format("Root entity '{}' is not present in the graph", root.stable_key())));
    }

    const auto max_paths = static_cast<std::size_t>(limits.max_paths);
    PathEnumeration result;
    std::deque<PathState> queue;
    queue.push_back(PathState::seed(root_node->entity, root_node->criticality_level));

    while (!queue.empty() && !result.truncated) {
        const PathState current = std::move(queue.front());
        queue.pop_front();

        for (const auto& edge : graph.dependents_of(current.current())) {
            if (current.contains(edge.to)) {
                continue;
            }
            const graph::GraphNode* target = graph.find_node(edge.to);
            if (target == nullptr) {
                continue;
            }
            // Another path exists but the budget is spent.
            if (result.paths.size() >= max_paths) {
                result.truncated = true;
                break;
            }

            PathState next = current.extend(edge, *target);
            result.paths.push_back(make_dependency_path(next));
            result.max_depth_reached = std::max(result.max_depth_reached, next.depth());

            if (next.depth() < limits.max_depth) {
                queue.push_back(std::move(next));
            } else if (has_unvisited_dependent(graph, next)) {
                result.depth_limit_reached = true;
            }
        }
    }

    return result;
}

}  // namespace depimpact::pathing
