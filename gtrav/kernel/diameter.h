// =============================================================================
// FILE: gtrav/kernel/diameter.h
// BRIEF: API reference for eccentricity and diameter computation
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/graph.hpp"

namespace gtrav::kernel::diameter {

// Hop eccentricity of a node over the nodes it reaches
template <typename T>
NodeId eccentricity(const CSRGraph<T>& graph, NodeId node);

template <typename T>
std::pair<NodeId, NodeId> eccentricity_and_most_distant_node(const CSRGraph<T>& graph, NodeId node);

// Dijkstra eccentricity; requires positive (or probability) weights
template <typename T>
Real weighted_eccentricity(const CSRGraph<T>& graph, NodeId node, bool use_probabilities = false);

template <typename T>
std::pair<Real, NodeId> weighted_eccentricity_and_most_distant_node(
    const CSRGraph<T>& graph, NodeId node, bool use_probabilities = false);

/* -----------------------------------------------------------------------------
 * FUNCTION: four_sweep
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Lower bound of the diameter and a node of low eccentricity from four
 *     BFS runs started at the most central node.
 *
 * POSTCONDITIONS:
 *     - lower_bound <= diameter of the start node's component
 *
 * COMPLEXITY:
 *     Time:  O(4 * (n_nodes + n_edges))
 * -------------------------------------------------------------------------- */
struct FourSweepResult {
    NodeId lower_bound;
    NodeId low_eccentricity_node;
};

template <typename T>
FourSweepResult four_sweep(const CSRGraph<T>& graph);

/* -----------------------------------------------------------------------------
 * FUNCTION: diameter_ifub
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Exact diameter of an undirected graph by iFUB, the maximum over its
 *     connected components.
 *
 * ALGORITHM:
 *     1. Four-sweep gives the bound lb and a low-eccentricity node u
 *     2. BFS from u; keep nodes with 2 * d(u, v) > lb, sorted by decreasing d
 *     3. For each distance level d: stop once lb >= 2 * d, otherwise raise
 *        lb to the eccentricity of every node of the level
 *
 * ERRORS:
 *     FeatureUnavailableError on directed graphs
 *
 * COMPLEXITY:
 *     Time:  O(k * (n_nodes + n_edges)), k eccentricity BFS runs, usually small
 * -------------------------------------------------------------------------- */
template <typename T>
Real diameter_ifub(const CSRGraph<T>& graph);

/* -----------------------------------------------------------------------------
 * FUNCTION: diameter_naive
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Maximum eccentricity over all nodes, one BFS per node in parallel.
 *
 * POSTCONDITIONS:
 *     - +inf when some node does not reach every node and ignore_infinity
 *       is false
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes * (n_nodes + n_edges))
 *     Space: O(n_threads * n_nodes)
 * -------------------------------------------------------------------------- */
template <typename T>
Real diameter_naive(const CSRGraph<T>& graph, bool ignore_infinity = false, bool verbose = false);

template <typename T>
Real weighted_diameter_naive(
    const CSRGraph<T>& graph,
    bool ignore_infinity = false,
    bool use_probabilities = false,
    bool verbose = false
);

/* -----------------------------------------------------------------------------
 * FUNCTION: diameter
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     +inf without edges or when disconnected and ignore_infinity is false;
 *     naive on directed graphs; iFUB otherwise.
 * -------------------------------------------------------------------------- */
template <typename T>
Real diameter(const CSRGraph<T>& graph, bool ignore_infinity = false, bool verbose = false);

} // namespace gtrav::kernel::diameter
