// =============================================================================
// FILE: gtrav/kernel/bfs.h
// BRIEF: API reference for unweighted breadth-first traversals
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/kernel/shortest_paths.hpp"

namespace gtrav::kernel::bfs {

namespace config {
    constexpr Size PARALLEL_FRONTIER_THRESHOLD = 256;
    constexpr Size PREFETCH_DISTANCE = 4;
}

/* -----------------------------------------------------------------------------
 * FUNCTION: bfs_distances
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Hop distance of every node from its nearest source, computed one
 *     frontier per round with the frontier expanded in parallel.
 *
 * PARAMETERS:
 *     graph         [in] CSR graph
 *     sources       [in] Source node ids (non-empty)
 *     maximal_depth [in] Optional depth after which expansion stops
 *
 * PRECONDITIONS:
 *     - sources is non-empty (ValueError)
 *     - every source id is < n_nodes (IndexOutOfBoundsError)
 *
 * POSTCONDITIONS:
 *     - distances[s] == 0 for every source
 *     - distances[v] == NOT_PRESENT for nodes not reached
 *     - eccentricity is the depth of the last non-empty frontier
 *     - most_distant_node lies on that frontier (which one is unspecified)
 *     - predecessors are not computed
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes + n_edges)
 *     Space: O(n_nodes) for two frontiers
 *
 * THREAD SAFETY:
 *     Safe - nodes are claimed with a compare-and-swap from NOT_PRESENT
 * -------------------------------------------------------------------------- */
template <typename T>
ShortestPathsResultBFS bfs_distances(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
);

/* -----------------------------------------------------------------------------
 * FUNCTION: bfs_predecessors
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Parallel BFS recording, for every reached node, one neighbour on the
 *     previous frontier.
 *
 * POSTCONDITIONS:
 *     - predecessors[s] == s for every source
 *     - predecessors[v] == NOT_PRESENT for nodes not reached
 *     - the predecessor tree is valid but which parent wins is unspecified
 *     - distances are not computed
 * -------------------------------------------------------------------------- */
template <typename T>
ShortestPathsResultBFS bfs_predecessors(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
);

/* -----------------------------------------------------------------------------
 * FUNCTION: bfs
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Sequential FIFO traversal with optional early exit on a destination.
 *
 * PARAMETERS:
 *     graph                [in] CSR graph
 *     sources              [in] Source node ids (non-empty)
 *     dst                  [in] Optional destination; traversal stops once found
 *     compute_predecessors [in] Whether to record the predecessor tree
 *     maximal_depth        [in] Optional depth limit
 *
 * POSTCONDITIONS:
 *     - distances are always present
 *     - with dst, only nodes discovered before dst carry distances
 *     - predecessors are deterministic (first discovering node in FIFO order)
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes + n_edges)
 *     Space: O(n_nodes)
 *
 * THREAD SAFETY:
 *     Safe - owns all traversal state
 * -------------------------------------------------------------------------- */
template <typename T>
ShortestPathsResultBFS bfs(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt
);

/* -----------------------------------------------------------------------------
 * FUNCTION: shortest_path_node_ids
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Node ids of one unweighted shortest path, both endpoints included.
 *
 * ERRORS:
 *     SelfLoopError        src == dst
 *     UnreachableNodeError dst is not reachable from src
 * -------------------------------------------------------------------------- */
template <typename T>
std::vector<NodeId> shortest_path_node_ids(const CSRGraph<T>& graph, NodeId src, NodeId dst);

// Same, starting from the nearest of several sources; dst must not be a source.
template <typename T>
std::vector<NodeId> shortest_path_node_ids_from_sources(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    NodeId dst
);

} // namespace gtrav::kernel::bfs
