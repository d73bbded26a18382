// =============================================================================
// FILE: gtrav/kernel/dijkstra.h
// BRIEF: API reference for weighted shortest paths
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/kernel/shortest_paths.hpp"

namespace gtrav::kernel::dijkstra {

/* -----------------------------------------------------------------------------
 * FUNCTION: dijkstra
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Multi-source Dijkstra over an indexed binary heap.
 *
 * PARAMETERS:
 *     graph                [in] CSR graph, unit weights when unweighted
 *     sources              [in] Source node ids (non-empty)
 *     dst                  [in] Optional node; stops once it is settled
 *     dsts                 [in] Optional node set; stops once all are settled
 *     compute_predecessors [in] Whether to record the predecessor tree
 *     maximal_depth        [in] Only nodes within this many hops are relaxed
 *     use_probabilities    [in] Weights are probabilities, edges cost -ln(w)
 *
 * PRECONDITIONS:
 *     - weights > 0 (DomainError), in (0, 1] with use_probabilities
 *     - use_probabilities requires edge weights (MissingDataError)
 *
 * POSTCONDITIONS:
 *     - plain mode: distances are path lengths, +inf when unreachable
 *     - probability mode: distances are path probabilities, 0 when unreachable
 *     - total_distance sums the settled distances; log_total_distance is its
 *       natural log (plain) or the raw sum of -ln p (probability mode)
 *     - total_harmonic_distance sums 1/d over settled nodes with d > 0
 *     - when every source is isolated no traversal happens and every distance
 *       is the unreachable value
 *
 * COMPLEXITY:
 *     Time:  O((n_nodes + n_edges) log n_nodes)
 *     Space: O(n_nodes)
 *
 * THREAD SAFETY:
 *     Safe - owns all traversal state
 * -------------------------------------------------------------------------- */
template <typename T>
ShortestPathsDijkstra dijkstra(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    const std::optional<std::vector<NodeId>>& dsts = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt,
    bool use_probabilities = false
);

/* -----------------------------------------------------------------------------
 * FUNCTION: weighted_shortest_path_node_ids
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Distance (or probability) and node ids of one weighted shortest path.
 *
 * ERRORS:
 *     SelfLoopError        src == dst
 *     UnreachableNodeError dst is not reachable from src
 * -------------------------------------------------------------------------- */
template <typename T>
std::pair<Real, std::vector<NodeId>> weighted_shortest_path_node_ids(
    const CSRGraph<T>& graph,
    NodeId src,
    NodeId dst,
    bool use_probabilities = false
);

} // namespace gtrav::kernel::dijkstra
