#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/kernel/shortest_paths.hpp"
#include "gtrav/kernel/bfs.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/dijkstra.hpp
// BRIEF: Multi-source Dijkstra over positive weights or edge probabilities
//
// In probability mode an edge of weight w costs -ln(w), so the shortest path
// is the most probable one. Distances are turned back into probabilities with
// exp(-d) once the traversal ends.
// =============================================================================

namespace gtrav::kernel::dijkstra {

using shortest_paths::ShortestPathsDijkstra;

namespace detail {

// =============================================================================
// Indexed Binary Heap
// =============================================================================

// Min-heap keyed by node id with decrease-key. A popped node is settled and
// never re-enters the heap.
class DijkstraQueue {
public:
    explicit DijkstraQueue(Size n_nodes)
        : distances_(n_nodes, REAL_INFINITY)
        , positions_(n_nodes, NOT_IN_HEAP) {
        heap_.reserve(std::min<Size>(n_nodes, 1024));
    }

    [[nodiscard]] GTRAV_FORCE_INLINE bool empty() const noexcept { return heap_.empty(); }

    GTRAV_FORCE_INLINE Real operator[](NodeId node) const noexcept { return distances_[node]; }

    /// Lowers the tentative distance of `node`. Returns false when `distance`
    /// is not an improvement or the node is already settled.
    bool push(NodeId node, Real distance) {
        const NodeId position = positions_[node];
        if (position == SETTLED || !(distance < distances_[node])) {
            return false;
        }
        distances_[node] = distance;
        if (position == NOT_IN_HEAP) {
            heap_.push_back(node);
            positions_[node] = static_cast<NodeId>(heap_.size() - 1);
            sift_up(heap_.size() - 1);
        } else {
            sift_up(position);
        }
        return true;
    }

    NodeId pop() {
        const NodeId top = heap_.front();
        const NodeId last = heap_.back();
        heap_.pop_back();
        positions_[top] = SETTLED;
        if (!heap_.empty()) {
            heap_[0] = last;
            positions_[last] = 0;
            sift_down(0);
        }
        return top;
    }

    std::vector<Real> take_distances() noexcept { return std::move(distances_); }

private:
    static constexpr NodeId NOT_IN_HEAP = NOT_PRESENT;
    static constexpr NodeId SETTLED = NOT_PRESENT - 1;

    std::vector<Real> distances_;
    std::vector<NodeId> positions_;
    std::vector<NodeId> heap_;

    GTRAV_FORCE_INLINE bool less(NodeId a, NodeId b) const noexcept {
        return distances_[a] < distances_[b];
    }

    GTRAV_FORCE_INLINE void place(Size i, NodeId node) noexcept {
        heap_[i] = node;
        positions_[node] = static_cast<NodeId>(i);
    }

    void sift_up(Size i) noexcept {
        const NodeId node = heap_[i];
        while (i > 0) {
            const Size parent = (i - 1) / 2;
            if (!less(node, heap_[parent])) break;
            place(i, heap_[parent]);
            i = parent;
        }
        place(i, node);
    }

    void sift_down(Size i) noexcept {
        const Size n = heap_.size();
        const NodeId node = heap_[i];
        while (true) {
            Size child = 2 * i + 1;
            if (child >= n) break;
            if (child + 1 < n && less(heap_[child + 1], heap_[child])) ++child;
            if (!less(heap_[child], node)) break;
            place(i, heap_[child]);
            i = child;
        }
        place(i, node);
    }
};

} // namespace detail

// =============================================================================
// Dijkstra (unchecked)
// =============================================================================

/// Weighted traversal from `sources`. Stops when `dst` is settled or when every
/// node of `dsts` is settled. With `maximal_depth` only nodes within that many
/// hops of a source are relaxed. Unweighted graphs use unit weights.
template <typename T>
ShortestPathsDijkstra dijkstra_unchecked(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    const std::optional<std::vector<NodeId>>& dsts = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt,
    bool use_probabilities = false
) {
    const Size N = graph.get_number_of_nodes();
    const Real unreachable = use_probabilities ? Real(0) : REAL_INFINITY;

    std::optional<std::vector<NodeId>> predecessors;
    if (compute_predecessors) {
        predecessors.emplace(N, NOT_PRESENT);
    }

    const bool all_isolated = std::all_of(sources.begin(), sources.end(), [&](NodeId s) {
        return graph.is_disconnected_node_unchecked(s);
    });
    if (all_isolated) {
        return ShortestPathsDijkstra(
            std::vector<Real>(N, unreachable), std::move(predecessors),
            dst ? std::optional<Real>(unreachable) : std::nullopt,
            unreachable, sources.front(), Real(0), Real(0), Real(0), use_probabilities);
    }

    std::optional<std::vector<NodeId>> within_depth;
    if (maximal_depth) {
        within_depth = bfs::bfs_distances_unchecked(graph, sources, maximal_depth).distances();
    }

    std::vector<Byte> pending;
    Size n_pending = 0;
    if (dsts) {
        pending.assign(N, 0);
        for (NodeId d : *dsts) {
            n_pending += pending[d] ? 0 : 1;
            pending[d] = 1;
        }
    }

    detail::DijkstraQueue queue(N);
    for (NodeId s : sources) {
        queue.push(s, Real(0));
    }

    Real eccentricity = 0;
    NodeId most_distant_node = sources.front();
    Real total_distance = 0;
    Real total_harmonic_distance = 0;
    std::optional<Real> dst_node_distance;

    while (!queue.empty()) {
        const NodeId u = queue.pop();
        const Real du = queue[u];

        if (du > eccentricity) {
            eccentricity = du;
            most_distant_node = u;
        }
        total_distance += du;
        if (du > Real(0)) {
            total_harmonic_distance += Real(1) / du;
        }

        if (dst && *dst == u) {
            dst_node_distance = du;
            break;
        }
        if (dsts && pending[u]) {
            pending[u] = 0;
            if (--n_pending == 0) break;
        }

        auto neighbors = graph.neighbors_unchecked(u);
        auto weights = graph.weights_unchecked(u);
        const bool weighted = !weights.empty();
        for (Size k = 0; k < neighbors.size(); ++k) {
            const NodeId v = neighbors[k];
            if (within_depth && (*within_depth)[v] == NOT_PRESENT) continue;
            const Real w = weighted ? static_cast<Real>(weights[k]) : Real(1);
            const Real candidate = use_probabilities ? du - std::log(w) : du + w;
            if (queue.push(v, candidate) && predecessors) {
                (*predecessors)[v] = u;
            }
        }
    }

    std::vector<Real> distances = queue.take_distances();
    if (dst && !dst_node_distance) {
        dst_node_distance = distances[*dst];
    }

    Real log_total_distance;
    if (use_probabilities) {
        for (Real& d : distances) {
            d = std::exp(-d);
        }
        eccentricity = std::exp(-eccentricity);
        log_total_distance = total_distance;
        total_distance = std::exp(-total_distance);
        if (dst_node_distance) {
            dst_node_distance = std::exp(-*dst_node_distance);
        }
    } else {
        log_total_distance = std::log(total_distance);
    }

    return ShortestPathsDijkstra(
        std::move(distances), std::move(predecessors), dst_node_distance,
        eccentricity, most_distant_node, total_distance, log_total_distance,
        total_harmonic_distance, use_probabilities);
}

// =============================================================================
// Checked Entry Points
// =============================================================================

namespace detail {

template <typename T>
void validate_weights(const CSRGraph<T>& graph, bool use_probabilities) {
    if (use_probabilities) {
        graph.must_have_edge_weights_representing_probabilities();
    } else if (graph.has_edge_weights()) {
        graph.must_have_positive_edge_weights();
    }
}

} // namespace detail

template <typename T>
ShortestPathsDijkstra dijkstra(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    const std::optional<std::vector<NodeId>>& dsts = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt,
    bool use_probabilities = false
) {
    GTRAV_CHECK_ARG(!sources.empty(), "Dijkstra: the given list of source nodes is empty.");
    graph.validate_node_ids(sources);
    if (dst) graph.validate_node_id(*dst);
    if (dsts) graph.validate_node_ids(*dsts);
    detail::validate_weights(graph, use_probabilities);
    return dijkstra_unchecked(graph, sources, dst, dsts, compute_predecessors,
                              maximal_depth, use_probabilities);
}

/// Distance and nodes of one weighted shortest path, src and dst included.
/// In probability mode the distance is the probability of the path.
template <typename T>
std::pair<Real, std::vector<NodeId>> weighted_shortest_path_node_ids(
    const CSRGraph<T>& graph,
    NodeId src,
    NodeId dst,
    bool use_probabilities = false
) {
    graph.validate_node_id(src);
    graph.validate_node_id(dst);
    if (GTRAV_UNLIKELY(src == dst)) {
        throw SelfLoopError(src);
    }
    detail::validate_weights(graph, use_probabilities);

    const auto result = dijkstra_unchecked(graph, {src}, dst, std::nullopt, true,
                                           std::nullopt, use_probabilities);
    if (GTRAV_UNLIKELY(!result.has_path_to_node_id(dst))) {
        throw UnreachableNodeError(src, dst);
    }

    const auto& predecessors = *result.predecessors();
    std::vector<NodeId> path{dst};
    NodeId node = dst;
    while (predecessors[node] != NOT_PRESENT) {
        node = predecessors[node];
        path.push_back(node);
    }
    std::reverse(path.begin(), path.end());
    return {result.get_distance_from_node_id(dst), std::move(path)};
}

} // namespace gtrav::kernel::dijkstra
