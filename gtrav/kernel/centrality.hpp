#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/memory.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/threading/parallel_for.hpp"
#include "gtrav/threading/scheduler.hpp"
#include "gtrav/threading/workspace.hpp"
#include "gtrav/include/progress.hpp"
#include "gtrav/kernel/bfs.hpp"
#include "gtrav/kernel/dijkstra.hpp"
#include "gtrav/kernel/hyper_edge_ball.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/centrality.hpp
// BRIEF: Closeness, harmonic, betweenness and stress centralities
//
// Closeness and harmonic come exact (one BFS or Dijkstra per node) and
// HyperLogLog-approximated (one node-ball propagation). Betweenness and
// stress count shortest paths with Brandes' two-pass scheme, one unweighted
// BFS per source; the per-source passes run in parallel over per-thread
// workspaces and are reduced at the end.
// =============================================================================

namespace gtrav::kernel::centrality {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    inline constexpr std::uint8_t DEFAULT_PRECISION = sketch::config::DEFAULT_PRECISION;
    inline constexpr std::uint8_t DEFAULT_BITS = sketch::config::DEFAULT_BITS;
}

namespace detail {

// Distance sum and harmonic sum of one BFS run into per-thread buffers
template <typename T>
std::pair<std::uint64_t, Real> bfs_sums(const CSRGraph<T>& graph, NodeId src, NodeId* dist, NodeId* queue) {
    Size head = 0;
    Size tail = 0;
    dist[src] = 0;
    queue[tail++] = src;

    std::uint64_t total = 0;
    Real harmonic = 0;
    while (head < tail) {
        const NodeId u = queue[head++];
        const NodeId du = dist[u];
        if (du > 0) {
            total += du;
            harmonic += Real(1) / static_cast<Real>(du);
        }
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (dist[v] == NOT_PRESENT) {
                dist[v] = du + 1;
                queue[tail++] = v;
            }
        }
    }
    return {total, harmonic};
}

template <typename T, typename Store>
void exact_unweighted(const CSRGraph<T>& graph, Array<Real> centrality, Store&& store) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= N, "Centrality: output buffer too small");
    if (N == 0) {
        return;
    }

    const size_t n_threads = gtrav::threading::Scheduler::get_num_threads();
    gtrav::threading::WorkspacePool<NodeId> dist_pool(n_threads, N);
    gtrav::threading::WorkspacePool<NodeId> queue_pool(n_threads, N);

    gtrav::threading::parallel_for(Size(0), N, [&](size_t s, size_t rank) {
        dist_pool.fill(rank, NOT_PRESENT);
        const auto [total, harmonic] =
            bfs_sums(graph, static_cast<NodeId>(s), dist_pool.get(rank), queue_pool.get(rank));
        centrality[s] = store(total, harmonic);
    });
}

template <typename T, typename Store>
void exact_weighted(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    bool use_probabilities,
    bool verbose,
    const char* name,
    Store&& store
) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= N, "Centrality: output buffer too small");
    if (use_probabilities) {
        graph.must_have_edge_weights_representing_probabilities();
    } else {
        graph.must_have_positive_edge_weights();
    }

    std::atomic<Size> done{0};
    gtrav::progress::ProgressGuard progress(verbose);

    gtrav::threading::parallel_for(Size(0), N, [&](size_t s) {
        const auto node = static_cast<NodeId>(s);
        if (graph.is_disconnected_node_unchecked(node)) {
            centrality[s] = Real(0);
        } else {
            const auto result = dijkstra::dijkstra_unchecked(
                graph, {node}, std::nullopt, std::nullopt, false, std::nullopt, use_probabilities);
            centrality[s] = store(result);
        }
        progress.update(done.fetch_add(1, std::memory_order_relaxed) + 1, N);
    });

    if (verbose) {
        std::fprintf(stderr, "%s: computed %zu nodes\n", name, N);
    }
}

GTRAV_FORCE_INLINE Real reciprocal_or_zero(Real x) noexcept {
    return x > Real(0) ? Real(1) / x : Real(0);
}

// =============================================================================
// Shortest Path Counting
// =============================================================================

// xorshift128 seeded through splitmix64
struct alignas(16) FastRNG {
    std::array<std::uint32_t, 4> s{};

    GTRAV_FORCE_INLINE explicit FastRNG(std::uint64_t seed) noexcept {
        std::uint64_t z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            s[i] = static_cast<std::uint32_t>(z >> 32);
        }
    }

    GTRAV_FORCE_INLINE std::uint32_t next() noexcept {
        std::uint32_t t = s[3];
        const std::uint32_t x = s[0];
        s[3] = s[2];
        s[2] = s[1];
        s[1] = x;
        t ^= t >> 11;
        t ^= t << 8;
        s[0] = t ^ x ^ (x << 19);
        return s[0];
    }

    GTRAV_FORCE_INLINE NodeId bounded(NodeId n) noexcept {
        return static_cast<NodeId>(next() % n);
    }
};

// Forward pass. Expects dist at NOT_PRESENT and sigma at 0 for every node;
// leaves the reached nodes in `order` by nondecreasing distance, source
// first, and returns how many there are.
template <typename T>
Size count_shortest_paths(const CSRGraph<T>& graph, NodeId src, NodeId* dist, double* sigma, NodeId* order) {
    Size head = 0;
    Size tail = 0;
    dist[src] = 0;
    sigma[src] = 1.0;
    order[tail++] = src;

    while (head < tail) {
        const NodeId u = order[head++];
        const NodeId next = dist[u] + 1;
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (dist[v] == NOT_PRESENT) {
                dist[v] = next;
                order[tail++] = v;
            }
            if (dist[v] == next) {
                sigma[v] += sigma[u];
            }
        }
    }
    return tail;
}

// Backward pass over `order`, source excluded. Betweenness accumulates
//   delta[u] = sum over successors v of sigma[u] / sigma[v] * (1 + delta[v])
// and stress the number of shortest path continuations
//   delta[u] = sum over successors v of (1 + delta[v])
// reporting sigma[u] * delta[u].
template <bool STRESS, typename T, typename Accumulate>
void accumulate_dependencies(
    const CSRGraph<T>& graph,
    const NodeId* dist,
    const double* sigma,
    double* delta,
    const NodeId* order,
    Size reached,
    Accumulate&& accumulate
) {
    for (Size i = reached; i-- > 1;) {
        const NodeId u = order[i];
        const NodeId next = dist[u] + 1;
        double dependency = 0.0;
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (dist[v] != next) continue;
            if constexpr (STRESS) {
                dependency += 1.0 + delta[v];
            } else {
                dependency += sigma[u] / sigma[v] * (1.0 + delta[v]);
            }
        }
        delta[u] = dependency;
        accumulate(u, STRESS ? sigma[u] * dependency : dependency);
    }
}

GTRAV_FORCE_INLINE void reset_reached(const NodeId* order, Size reached, NodeId* dist, double* sigma,
                                      double* delta) noexcept {
    for (Size i = 0; i < reached; ++i) {
        const NodeId u = order[i];
        dist[u] = NOT_PRESENT;
        sigma[u] = 0.0;
        delta[u] = 0.0;
    }
}

template <bool STRESS, typename T>
void path_centrality(const CSRGraph<T>& graph, Array<Real> centrality, bool verbose, const char* name) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= N, "Centrality: output buffer too small");
    if (N == 0) {
        return;
    }

    const size_t n_threads = gtrav::threading::Scheduler::get_num_threads();
    gtrav::threading::WorkspacePool<NodeId> dist_pool(n_threads, N);
    gtrav::threading::WorkspacePool<NodeId> order_pool(n_threads, N);
    gtrav::threading::WorkspacePool<double> sigma_pool(n_threads, N);
    gtrav::threading::WorkspacePool<double> delta_pool(n_threads, N);
    gtrav::threading::WorkspacePool<double> totals_pool(n_threads, N);
    for (size_t t = 0; t < n_threads; ++t) {
        dist_pool.fill(t, NOT_PRESENT);
        sigma_pool.fill(t, 0.0);
        delta_pool.fill(t, 0.0);
        totals_pool.fill(t, 0.0);
    }

    std::atomic<Size> done{0};
    gtrav::progress::ProgressGuard progress(verbose);

    gtrav::threading::parallel_for(Size(0), N, [&](size_t s, size_t rank) {
        NodeId* dist = dist_pool.get(rank);
        NodeId* order = order_pool.get(rank);
        double* sigma = sigma_pool.get(rank);
        double* delta = delta_pool.get(rank);
        double* totals = totals_pool.get(rank);

        const Size reached = count_shortest_paths(graph, static_cast<NodeId>(s), dist, sigma, order);
        accumulate_dependencies<STRESS>(graph, dist, sigma, delta, order, reached,
            [totals](NodeId u, double value) { totals[u] += value; });
        reset_reached(order, reached, dist, sigma, delta);
        progress.update(done.fetch_add(1, std::memory_order_relaxed) + 1, N);
    });

    // Undirected graphs see every pair from both ends
    const double scale = graph.is_directed() ? 1.0 : 0.5;
    gtrav::threading::parallel_for(Size(0), N, [&](size_t i) {
        double total = 0.0;
        for (size_t t = 0; t < n_threads; ++t) {
            total += totals_pool.get(t)[i];
        }
        centrality[i] = static_cast<Real>(total * scale);
    });

    if (verbose) {
        std::fprintf(stderr, "%s: processed %zu sources\n", name, N);
    }
}

} // namespace detail

// =============================================================================
// Exact Closeness and Harmonic Centrality
// =============================================================================

/// 1 / (sum of distances to the reached nodes), 0 for nodes reaching nothing.
template <typename T>
void closeness_centrality(const CSRGraph<T>& graph, Array<Real> centrality) {
    detail::exact_unweighted(graph, centrality, [](std::uint64_t total, Real) {
        return total > 0 ? Real(1) / static_cast<Real>(total) : Real(0);
    });
}

/// Sum of 1 / d over the reached nodes.
template <typename T>
void harmonic_centrality(const CSRGraph<T>& graph, Array<Real> centrality) {
    detail::exact_unweighted(graph, centrality, [](std::uint64_t, Real harmonic) {
        return harmonic;
    });
}

template <typename T>
Real closeness_centrality_from_node_id(const CSRGraph<T>& graph, NodeId node) {
    graph.validate_node_id(node);
    const auto result = bfs::bfs_distances_unchecked(graph, {node});
    std::uint64_t total = 0;
    for (NodeId d : *result.distances()) {
        if (d != NOT_PRESENT) total += d;
    }
    return total > 0 ? Real(1) / static_cast<Real>(total) : Real(0);
}

template <typename T>
Real harmonic_centrality_from_node_id(const CSRGraph<T>& graph, NodeId node) {
    graph.validate_node_id(node);
    const auto result = bfs::bfs_distances_unchecked(graph, {node});
    Real harmonic = 0;
    for (NodeId d : *result.distances()) {
        if (d != NOT_PRESENT && d > 0) harmonic += Real(1) / static_cast<Real>(d);
    }
    return harmonic;
}

// =============================================================================
// Weighted Centralities
// =============================================================================

/// 1 / total distance, or 1 / (sum of -ln p) in probability mode. Isolated
/// nodes get 0.
template <typename T>
void weighted_closeness_centrality(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    bool use_probabilities = false,
    bool verbose = false
) {
    detail::exact_weighted(graph, centrality, use_probabilities, verbose, "weighted_closeness_centrality",
        [use_probabilities](const shortest_paths::ShortestPathsDijkstra& result) {
            return detail::reciprocal_or_zero(use_probabilities ? result.get_log_total_distance()
                                                                : result.get_total_distance());
        });
}

template <typename T>
void weighted_harmonic_centrality(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    bool use_probabilities = false,
    bool verbose = false
) {
    detail::exact_weighted(graph, centrality, use_probabilities, verbose, "weighted_harmonic_centrality",
        [](const shortest_paths::ShortestPathsDijkstra& result) {
            return result.get_total_harmonic_distance();
        });
}

// =============================================================================
// Betweenness and Stress
// =============================================================================

/// Sum over pairs (s, t) of the fraction of shortest s-t paths through the
/// node, endpoints excluded, with unit edge costs. Undirected graphs count each
/// pair once. Min-max normalization maps the scores onto [0, 1] (all zero when
/// they are equal) and takes precedence over dividing by the number of pairs,
/// (n - 1)(n - 2), halved when undirected.
template <typename T>
void betweenness_centrality(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    bool edges_normalization = false,
    bool min_max_normalization = false,
    bool verbose = false
) {
    detail::path_centrality<false>(graph, centrality, verbose, "betweenness_centrality");

    const Size N = graph.get_number_of_nodes();
    if (N == 0) {
        return;
    }
    if (min_max_normalization) {
        const auto [lowest, highest] = std::minmax_element(centrality.data(), centrality.data() + N);
        const Real min_value = *lowest;
        const Real range = *highest - *lowest;
        gtrav::threading::parallel_for(Size(0), N, [&](size_t i) {
            centrality[i] = range > Real(0) ? (centrality[i] - min_value) / range : Real(0);
        });
    } else if (edges_normalization && N > 2) {
        const Real denominator = static_cast<Real>(N - 1) * static_cast<Real>(N - 2) /
                                 (graph.is_directed() ? Real(1) : Real(2));
        gtrav::threading::parallel_for(Size(0), N, [&](size_t i) {
            centrality[i] /= denominator;
        });
    }
}

/// Number of shortest paths through the node, endpoints excluded, with unit
/// edge costs. Undirected graphs count each pair once.
template <typename T>
void stress_centrality(const CSRGraph<T>& graph, Array<Real> centrality, bool verbose = false) {
    detail::path_centrality<true>(graph, centrality, verbose, "stress_centrality");
}

/// Betweenness of one node estimated from sampled sources (Bader et al.,
/// "Approximating Betweenness Centrality"). The neighbours of the node are
/// sampled first, then uniformly drawn connected nodes, until the summed
/// dependency reaches `constant * n` or `maximum_samples_number` sources
/// (n / 20 by default) were used. Returns n / k times the sum, halved on
/// undirected graphs.
template <typename T>
Real approximated_betweenness_centrality_from_node_id(
    const CSRGraph<T>& graph,
    NodeId node,
    Real constant = Real(2),
    std::optional<Real> maximum_samples_number = std::nullopt,
    std::uint64_t random_state = 42
) {
    graph.validate_node_id(node);
    if (GTRAV_UNLIKELY(!(constant >= Real(2)))) {
        throw ValueError("Betweenness: the constant must be at least 2, got " + std::to_string(constant));
    }

    const Size N = graph.get_number_of_nodes();
    const Real n = static_cast<Real>(N);
    const Real maximum_samples = maximum_samples_number.value_or(n / Real(20));

    std::vector<NodeId> dist(N, NOT_PRESENT);
    std::vector<NodeId> order(N);
    std::vector<double> sigma(N, 0.0);
    std::vector<double> delta(N, 0.0);

    auto dependency_from = [&](NodeId src) {
        if (src == node) {
            return 0.0;
        }
        const Size reached = detail::count_shortest_paths(graph, src, dist.data(), sigma.data(), order.data());
        double dependency = 0.0;
        if (dist[node] != NOT_PRESENT) {
            detail::accumulate_dependencies<false>(graph, dist.data(), sigma.data(), delta.data(),
                order.data(), reached, [&dependency, node](NodeId u, double value) {
                    if (u == node) dependency = value;
                });
        }
        detail::reset_reached(order.data(), reached, dist.data(), sigma.data(), delta.data());
        return dependency;
    };

    double running_sum = 0.0;
    Real samples = 0;
    const double target = static_cast<double>(n) * static_cast<double>(constant);

    for (NodeId neighbor : graph.neighbors_unchecked(node)) {
        if (running_sum >= target || samples > maximum_samples) {
            break;
        }
        samples += Real(1);
        running_sum += dependency_from(neighbor);
    }
    // No shortest path crosses the node from its own neighbourhood
    if (running_sum == 0.0) {
        return Real(0);
    }

    detail::FastRNG rng(random_state);
    while (running_sum < target && samples < maximum_samples) {
        const NodeId sampled = rng.bounded(static_cast<NodeId>(N));
        if (graph.is_disconnected_node_unchecked(sampled)) {
            continue;
        }
        samples += Real(1);
        running_sum += dependency_from(sampled);
    }

    const double estimate = static_cast<double>(n) / static_cast<double>(samples) * running_sum;
    return static_cast<Real>(graph.is_directed() ? estimate : estimate / 2.0);
}

// =============================================================================
// HyperLogLog Approximations
// =============================================================================

/// Approximate sum of distances of every node: the nodes first reached in
/// round r contribute r each.
template <typename T>
void approximated_total_distances(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    std::uint8_t precision = config::DEFAULT_PRECISION,
    std::uint8_t bits = config::DEFAULT_BITS
) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= N, "Centrality: output buffer too small");
    gtrav::memory::zero(centrality.data(), N);
    hyper_edge_ball::dispatch_hyper_ball(graph, precision, bits, centrality,
        [](Real& c, Real new_estimate, Real old_estimate, NodeId round) noexcept {
            c += static_cast<Real>(round) * (new_estimate - old_estimate);
        });
}

template <typename T>
void approximated_closeness_centrality(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    std::uint8_t precision = config::DEFAULT_PRECISION,
    std::uint8_t bits = config::DEFAULT_BITS
) {
    approximated_total_distances(graph, centrality, precision, bits);
    const Size N = graph.get_number_of_nodes();
    gtrav::threading::parallel_for(Size(0), N, [&](size_t i) {
        centrality[i] = detail::reciprocal_or_zero(centrality[i]);
    });
}

template <typename T>
void approximated_harmonic_centrality(
    const CSRGraph<T>& graph,
    Array<Real> centrality,
    std::uint8_t precision = config::DEFAULT_PRECISION,
    std::uint8_t bits = config::DEFAULT_BITS
) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= N, "Centrality: output buffer too small");
    gtrav::memory::zero(centrality.data(), N);
    hyper_edge_ball::dispatch_hyper_ball(graph, precision, bits, centrality,
        [](Real& c, Real new_estimate, Real old_estimate, NodeId round) noexcept {
            c += (new_estimate - old_estimate) / static_cast<Real>(round);
        });
}

} // namespace gtrav::kernel::centrality
