#pragma once

/**
 * @file path_enumerator.hpp
 * @brief Bounded breadth-first enumeration of dependent paths
 */

#include "depimpact/common.hpp"
#include "depimpact/dependency_path.hpp"
#include "depimpact/graph.hpp"

#include <vector>

namespace depimpact::pathing {

/// Both limits are required and must be positive.
struct EnumerationLimits
{
    int max_depth = 0;
    int max_paths = 0;
};

struct PathEnumeration
{
    std::vector<DependencyPath> paths;  ///< BFS order, unscored
    bool truncated = false;             ///< max_paths reached while more paths existed
    int max_depth_reached = 0;
    bool depth_limit_reached = false;  ///< a path at max_depth still had unexplored dependents
};

/**
 * @return Empty on success, InvalidArgument when a limit is not positive
 */
[[nodiscard]] depimpact::VoidResult validate_limits(const EnumerationLimits& limits);

/**
 * Enumerate every acyclic path of depth 1..max_depth that starts at @p root and
 * follows dependency -> dependent edges. Intermediate paths are emitted, not
 * only leaves. Stops once max_paths paths exist; if another path could still
 * have been produced the result is marked truncated and is a lower bound.
 *
 * @return Enumeration, InvalidArgument for bad limits, RootNotFound when
 *         @p root is not a node of @p graph
 */
[[nodiscard]] depimpact::Result<PathEnumeration>
enumerate_paths(const graph::ImpactGraph& graph,
                const graph::EntityRef& root,
                const EnumerationLimits& limits);

}  // namespace depimpact::pathing
