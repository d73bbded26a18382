#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/threading/parallel_for.hpp"
#include "gtrav/threading/scheduler.hpp"
#include "gtrav/threading/workspace.hpp"
#include "gtrav/include/progress.hpp"
#include "gtrav/kernel/bfs.hpp"
#include "gtrav/kernel/dijkstra.hpp"
#include "gtrav/kernel/components.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/diameter.hpp
// BRIEF: Eccentricities and graph diameter
//
// Undirected graphs use the iFUB scheme seeded by a four-sweep lower bound;
// directed graphs fall back to one BFS per node.
// =============================================================================

namespace gtrav::kernel::diameter {

// =============================================================================
// Eccentricity
// =============================================================================

/// (eccentricity, most distant node) of a node over the nodes it reaches.
template <typename T>
std::pair<NodeId, NodeId> eccentricity_and_most_distant_node_unchecked(const CSRGraph<T>& graph, NodeId node) {
    const auto result = bfs::bfs_predecessors_unchecked(graph, {node});
    return {result.get_eccentricity(), result.get_most_distant_node()};
}

template <typename T>
NodeId eccentricity_unchecked(const CSRGraph<T>& graph, NodeId node) {
    return eccentricity_and_most_distant_node_unchecked(graph, node).first;
}

template <typename T>
std::pair<NodeId, NodeId> eccentricity_and_most_distant_node(const CSRGraph<T>& graph, NodeId node) {
    graph.validate_node_id(node);
    return eccentricity_and_most_distant_node_unchecked(graph, node);
}

template <typename T>
NodeId eccentricity(const CSRGraph<T>& graph, NodeId node) {
    graph.validate_node_id(node);
    return eccentricity_unchecked(graph, node);
}

/// Weighted eccentricity and most distant node. In probability mode the
/// eccentricity is the probability of reaching the least probable node.
template <typename T>
std::pair<Real, NodeId> weighted_eccentricity_and_most_distant_node(
    const CSRGraph<T>& graph,
    NodeId node,
    bool use_probabilities = false
) {
    graph.validate_node_id(node);
    if (use_probabilities) {
        graph.must_have_edge_weights_representing_probabilities();
    } else {
        graph.must_have_positive_edge_weights();
    }
    const auto result = dijkstra::dijkstra_unchecked(graph, {node}, std::nullopt, std::nullopt,
                                                     false, std::nullopt, use_probabilities);
    return {result.get_eccentricity(), result.get_most_distant_node()};
}

template <typename T>
Real weighted_eccentricity(const CSRGraph<T>& graph, NodeId node, bool use_probabilities = false) {
    return weighted_eccentricity_and_most_distant_node(graph, node, use_probabilities).first;
}

// =============================================================================
// Four-Sweep Lower Bound
// =============================================================================

struct FourSweepResult {
    NodeId lower_bound;
    NodeId low_eccentricity_node;
};

/// Two double sweeps: r1 -> a1 -> median r2 -> a2 -> median. Returns the best
/// lower bound seen and the median of the last sweep, a node of low
/// eccentricity.
template <typename T>
FourSweepResult four_sweep_unchecked(const CSRGraph<T>& graph, NodeId start) {
    const NodeId first_far = eccentricity_and_most_distant_node_unchecked(graph, start).second;
    const auto first_sweep = bfs::bfs_predecessors_unchecked(graph, {first_far});
    const NodeId second_start = first_sweep.get_median_point_to_most_distant_node();

    const NodeId second_far = eccentricity_and_most_distant_node_unchecked(graph, second_start).second;
    const auto second_sweep = bfs::bfs_predecessors_unchecked(graph, {second_far});

    return FourSweepResult{
        std::max(first_sweep.get_eccentricity(), second_sweep.get_eccentricity()),
        second_sweep.get_median_point_to_most_distant_node()
    };
}

template <typename T>
FourSweepResult four_sweep(const CSRGraph<T>& graph) {
    return four_sweep_unchecked(graph, graph.get_most_central_node_id());
}

// =============================================================================
// iFUB
// =============================================================================

namespace detail {

// Diameter of the component of `central`, or `lower_bound` when the component
// cannot beat it.
template <typename T>
NodeId ifub_component_unchecked(const CSRGraph<T>& graph, NodeId central, NodeId lower_bound) {
    if (graph.is_disconnected_node_unchecked(central)) {
        return lower_bound;
    }

    const auto sweep = four_sweep_unchecked(graph, central);
    NodeId tentative = std::max(sweep.lower_bound, lower_bound);

    const auto layers = bfs::bfs_distances_unchecked(graph, {sweep.low_eccentricity_node});
    const auto& distances = *layers.distances();

    // Nodes closer than half the bound cannot be diameter endpoints
    std::vector<NodeId> crown;
    for (NodeId node = 0; node < static_cast<NodeId>(distances.size()); ++node) {
        const NodeId d = distances[node];
        if (d != NOT_PRESENT && 2 * static_cast<EdgeId>(d) > tentative) {
            crown.push_back(node);
        }
    }
    std::stable_sort(crown.begin(), crown.end(), [&](NodeId a, NodeId b) {
        return distances[a] > distances[b];
    });

    Size i = 0;
    while (i < crown.size()) {
        const NodeId level = distances[crown[i]];
        if (tentative >= 2 * static_cast<EdgeId>(level)) {
            break;
        }
        for (; i < crown.size() && distances[crown[i]] == level; ++i) {
            tentative = std::max(tentative, eccentricity_unchecked(graph, crown[i]));
        }
    }
    return tentative;
}

} // namespace detail

/// Exact diameter of an undirected graph, taken over each connected
/// component separately. Components too small to exceed the current best are
/// skipped.
template <typename T>
Real diameter_ifub(const CSRGraph<T>& graph) {
    if (GTRAV_UNLIKELY(graph.is_directed())) {
        throw FeatureUnavailableError("iFUB diameter is only available on undirected graphs.");
    }
    const Size N = graph.get_number_of_nodes();
    if (N == 0 || !graph.has_edges()) {
        return Real(0);
    }

    std::vector<NodeId> labels(N);
    const NodeId n_components = components::connected_components(graph, Array<NodeId>(labels.data(), N));
    if (n_components == 1) {
        return static_cast<Real>(detail::ifub_component_unchecked(graph, graph.get_most_central_node_id(), 0));
    }

    const auto sizes = components::component_sizes(Array<const NodeId>(labels.data(), N), n_components);

    // Highest-degree node of each component
    std::vector<NodeId> central(n_components, NOT_PRESENT);
    for (NodeId node = 0; node < static_cast<NodeId>(N); ++node) {
        NodeId& best = central[labels[node]];
        if (best == NOT_PRESENT || graph.degree_unchecked(node) > graph.degree_unchecked(best)) {
            best = node;
        }
    }

    std::vector<NodeId> order(n_components);
    std::iota(order.begin(), order.end(), NodeId(0));
    std::stable_sort(order.begin(), order.end(), [&](NodeId a, NodeId b) {
        return sizes[a] > sizes[b];
    });

    NodeId best = 0;
    for (NodeId component : order) {
        // A component of s nodes has diameter at most s - 1
        if (sizes[component] - 1 <= best) {
            break;
        }
        best = std::max(best, detail::ifub_component_unchecked(graph, central[component], best));
    }
    return static_cast<Real>(best);
}

// =============================================================================
// Naive Diameter
// =============================================================================

/// Maximum eccentricity over all nodes, one BFS per node. Returns +infinity
/// when some node cannot reach every other node, unless `ignore_infinity`.
template <typename T>
Real diameter_naive(const CSRGraph<T>& graph, bool ignore_infinity = false, bool verbose = false) {
    const Size N = graph.get_number_of_nodes();
    if (N == 0) {
        return Real(0);
    }

    const size_t n_threads = gtrav::threading::Scheduler::get_num_threads();
    gtrav::threading::WorkspacePool<NodeId> distance_pool(n_threads, N);
    gtrav::threading::WorkspacePool<NodeId> queue_pool(n_threads, N);
    std::vector<NodeId> thread_max(n_threads, 0);

    std::atomic<bool> found_infinite{false};
    std::atomic<Size> done{0};
    gtrav::progress::ProgressGuard progress(verbose);

    gtrav::threading::parallel_for(Size(0), N, [&](size_t i, size_t rank) {
        if (found_infinite.load(std::memory_order_relaxed)) {
            return;
        }
        NodeId* GTRAV_RESTRICT dist = distance_pool.get(rank);
        NodeId* GTRAV_RESTRICT queue = queue_pool.get(rank);
        distance_pool.fill(rank, NOT_PRESENT);

        const auto src = static_cast<NodeId>(i);
        Size head = 0;
        Size tail = 0;
        dist[src] = 0;
        queue[tail++] = src;
        NodeId ecc = 0;
        while (head < tail) {
            const NodeId u = queue[head++];
            const NodeId du = dist[u];
            for (NodeId v : graph.neighbors_unchecked(u)) {
                if (dist[v] == NOT_PRESENT) {
                    dist[v] = du + 1;
                    ecc = du + 1;
                    queue[tail++] = v;
                }
            }
        }

        if (tail < N && !ignore_infinity) {
            found_infinite.store(true, std::memory_order_relaxed);
            return;
        }
        thread_max[rank] = std::max(thread_max[rank], ecc);
        progress.update(done.fetch_add(1, std::memory_order_relaxed) + 1, N);
    });

    if (found_infinite.load(std::memory_order_relaxed)) {
        if (verbose) {
            std::fprintf(stderr, "diameter_naive: some node does not reach every other node\n");
        }
        return REAL_INFINITY;
    }
    const NodeId result = *std::max_element(thread_max.begin(), thread_max.end());
    if (verbose) {
        std::fprintf(stderr, "diameter_naive: %zu nodes, diameter %u\n", N, static_cast<unsigned>(result));
    }
    return static_cast<Real>(result);
}

/// Weighted counterpart of diameter_naive. In probability mode the result is
/// the smallest eccentricity probability, and 0 stands for unreachable.
template <typename T>
Real weighted_diameter_naive(
    const CSRGraph<T>& graph,
    bool ignore_infinity = false,
    bool use_probabilities = false,
    bool verbose = false
) {
    if (use_probabilities) {
        graph.must_have_edge_weights_representing_probabilities();
    } else {
        graph.must_have_positive_edge_weights();
    }
    const Size N = graph.get_number_of_nodes();
    const Real unreachable = use_probabilities ? Real(0) : REAL_INFINITY;
    if (N == 0) {
        return use_probabilities ? Real(1) : Real(0);
    }

    const size_t n_threads = gtrav::threading::Scheduler::get_num_threads();
    std::vector<Real> thread_best(n_threads, use_probabilities ? Real(1) : Real(0));
    std::atomic<bool> found_infinite{false};
    std::atomic<Size> done{0};
    gtrav::progress::ProgressGuard progress(verbose);

    gtrav::threading::parallel_for(Size(0), N, [&](size_t i, size_t rank) {
        if (found_infinite.load(std::memory_order_relaxed)) {
            return;
        }
        const auto result = dijkstra::dijkstra_unchecked(
            graph, {static_cast<NodeId>(i)}, std::nullopt, std::nullopt, false,
            std::nullopt, use_probabilities);

        // The source itself counts as reached even when isolated
        bool reaches_all = true;
        const auto& distances = result.distances();
        for (Size j = 0; j < N && reaches_all; ++j) {
            reaches_all = j == i || distances[j] != unreachable;
        }
        if (!reaches_all && !ignore_infinity) {
            found_infinite.store(true, std::memory_order_relaxed);
            return;
        }

        Real ecc = result.get_eccentricity();
        if (ecc == unreachable) {
            ecc = use_probabilities ? Real(1) : Real(0);
        }
        thread_best[rank] = use_probabilities ? std::min(thread_best[rank], ecc)
                                              : std::max(thread_best[rank], ecc);
        progress.update(done.fetch_add(1, std::memory_order_relaxed) + 1, N);
    });

    if (found_infinite.load(std::memory_order_relaxed)) {
        return unreachable;
    }
    return use_probabilities ? *std::min_element(thread_best.begin(), thread_best.end())
                             : *std::max_element(thread_best.begin(), thread_best.end());
}

// =============================================================================
// Dispatch
// =============================================================================

/// Diameter of the graph. +infinity for graphs without edges and for
/// disconnected graphs unless `ignore_infinity`.
template <typename T>
Real diameter(const CSRGraph<T>& graph, bool ignore_infinity = false, bool verbose = false) {
    if (!graph.has_edges()) {
        return REAL_INFINITY;
    }
    if (!ignore_infinity && !components::is_connected(graph)) {
        return REAL_INFINITY;
    }
    if (graph.is_directed()) {
        return diameter_naive(graph, ignore_infinity, verbose);
    }
    return diameter_ifub(graph);
}

} // namespace gtrav::kernel::diameter
