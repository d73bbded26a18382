// =============================================================================
// FILE: gtrav/kernel/centrality.h
// BRIEF: API reference for closeness, harmonic, betweenness and stress centralities
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/graph.hpp"

namespace gtrav::kernel::centrality {

/* -----------------------------------------------------------------------------
 * FUNCTION: closeness_centrality
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     1 / (sum of hop distances to the reached nodes) for every node.
 *
 * PARAMETERS:
 *     graph      [in]  CSR graph
 *     centrality [out] Scores [n_nodes]
 *
 * PRECONDITIONS:
 *     - centrality.size() >= n_nodes (DimensionError)
 *
 * POSTCONDITIONS:
 *     - nodes reaching no other node score 0
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes * (n_nodes + n_edges))
 *     Space: O(n_threads * n_nodes)
 *
 * THREAD SAFETY:
 *     Safe - parallel over source nodes with per-thread workspaces
 * -------------------------------------------------------------------------- */
template <typename T>
void closeness_centrality(const CSRGraph<T>& graph, Array<Real> centrality);

// Sum of 1 / d over the reached nodes
template <typename T>
void harmonic_centrality(const CSRGraph<T>& graph, Array<Real> centrality);

template <typename T>
Real closeness_centrality_from_node_id(const CSRGraph<T>& graph, NodeId node);

template <typename T>
Real harmonic_centrality_from_node_id(const CSRGraph<T>& graph, NodeId node);

template <typename T>
void weighted_closeness_centrality(
    const CSRGraph<T>& graph, Array<Real> centrality,
    bool use_probabilities = false, bool verbose = false);

template <typename T>
void weighted_harmonic_centrality(
    const CSRGraph<T>& graph, Array<Real> centrality,
    bool use_probabilities = false, bool verbose = false);

/* -----------------------------------------------------------------------------
 * FUNCTION: betweenness_centrality
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Brandes betweenness over unit edge costs: for every node, the sum over
 *     pairs (s, t), s and t distinct from it, of the share of shortest s-t
 *     paths passing through it.
 *
 * PARAMETERS:
 *     graph                 [in]  CSR graph
 *     centrality            [out] Scores [n_nodes]
 *     edges_normalization   [in]  Divide by (n - 1)(n - 2), halved if undirected
 *     min_max_normalization [in]  Map onto [0, 1]; wins over edges_normalization
 *     verbose               [in]  Progress slot and a stderr summary
 *
 * PRECONDITIONS:
 *     - centrality.size() >= n_nodes (DimensionError)
 *
 * POSTCONDITIONS:
 *     - undirected graphs count each unordered pair once
 *     - min-max normalization of equal scores yields zeros
 *
 * COMPLEXITY:
 *     Time:  O(n_nodes * (n_nodes + n_edges))
 *     Space: O(n_threads * n_nodes)
 *
 * THREAD SAFETY:
 *     Safe - parallel over sources, per-thread totals reduced at the end
 * -------------------------------------------------------------------------- */
template <typename T>
void betweenness_centrality(
    const CSRGraph<T>& graph, Array<Real> centrality,
    bool edges_normalization = false, bool min_max_normalization = false,
    bool verbose = false);

// Number of shortest paths through each node, endpoints excluded
template <typename T>
void stress_centrality(const CSRGraph<T>& graph, Array<Real> centrality, bool verbose = false);

/* -----------------------------------------------------------------------------
 * FUNCTION: approximated_betweenness_centrality_from_node_id
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Adaptive-sampling estimate of one node's betweenness. Sources are the
 *     node's neighbours, then connected nodes drawn from `random_state`,
 *     until the summed dependency reaches constant * n_nodes or the sample
 *     cap is hit. Returns n_nodes / samples * sum, halved if undirected.
 *
 * PARAMETERS:
 *     graph                  [in] CSR graph
 *     node                   [in] Queried node
 *     constant               [in] Stopping factor, at least 2 (default 2)
 *     maximum_samples_number [in] Sample cap (default n_nodes / 20)
 *     random_state           [in] Seed of the source sampler (default 42)
 *
 * ERRORS:
 *     IndexOutOfBoundsError for an unknown node
 *     ValueError if constant < 2
 *
 * POSTCONDITIONS:
 *     - 0 when no sampled neighbour routes a shortest path through the node
 * -------------------------------------------------------------------------- */
template <typename T>
Real approximated_betweenness_centrality_from_node_id(
    const CSRGraph<T>& graph, NodeId node, Real constant = 2,
    std::optional<Real> maximum_samples_number = std::nullopt,
    std::uint64_t random_state = 42);

/* -----------------------------------------------------------------------------
 * FUNCTION: approximated_total_distances
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     HyperLogLog estimate of each node's sum of distances: every increase of
 *     the node-ball estimate in round r contributes r times the increase.
 *
 * PARAMETERS:
 *     graph      [in]  CSR graph
 *     centrality [out] Estimates [n_nodes]
 *     precision  [in]  log2 of the register count, in [4, 16] (default 6)
 *     bits       [in]  Register width, 5 or 6 (default 6)
 *
 * ERRORS:
 *     ConfigurationError for unsupported (precision, bits)
 *
 * COMPLEXITY:
 *     Time:  O(rounds * n_edges * 2^precision / 32 * bits)
 *     Space: O(2 * n_nodes * 2^precision * bits / 8) bytes
 * -------------------------------------------------------------------------- */
template <typename T>
void approximated_total_distances(
    const CSRGraph<T>& graph, Array<Real> centrality,
    std::uint8_t precision = 6, std::uint8_t bits = 6);

// Reciprocal of the non-zero approximated total distances
template <typename T>
void approximated_closeness_centrality(
    const CSRGraph<T>& graph, Array<Real> centrality,
    std::uint8_t precision = 6, std::uint8_t bits = 6);

// Every increase in round r contributes increase / r
template <typename T>
void approximated_harmonic_centrality(
    const CSRGraph<T>& graph, Array<Real> centrality,
    std::uint8_t precision = 6, std::uint8_t bits = 6);

} // namespace gtrav::kernel::centrality
