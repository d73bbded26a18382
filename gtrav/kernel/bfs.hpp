#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/memory.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/threading/parallel_for.hpp"
#include "gtrav/kernel/shortest_paths.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/bfs.hpp
// BRIEF: Unweighted traversals: level-synchronous parallel BFS and the
//        sequential general-purpose BFS with early exit
//
// Parallel rounds claim nodes with a single compare-and-swap from NOT_PRESENT,
// so exactly one writer wins per node. For distances every racing writer
// writes the same round number; for predecessors the winner is arbitrary but
// always a node of the previous frontier.
// =============================================================================

namespace gtrav::kernel::bfs {

using shortest_paths::ShortestPathsResultBFS;

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    // Frontiers smaller than this are expanded on the calling thread
    constexpr Size PARALLEL_FRONTIER_THRESHOLD = 256;
    constexpr Size PREFETCH_DISTANCE = 4;
}

namespace detail {

// =============================================================================
// Frontier Buffers
// =============================================================================

// Append-only frontier shared by all threads of a round. Every node enters a
// frontier at most once per traversal, so capacity N never overflows.
class Frontier {
public:
    explicit Frontier(Size capacity)
        : data_(gtrav::memory::aligned_alloc<NodeId>(capacity, GTRAV_ALIGNMENT))
        , tail_(0) {}

    Frontier(const Frontier&) = delete;
    Frontier& operator=(const Frontier&) = delete;

    GTRAV_FORCE_INLINE void push(NodeId v) noexcept {
        data_[tail_.fetch_add(1, std::memory_order_relaxed)] = v;
    }

    GTRAV_FORCE_INLINE void push_unsynchronized(NodeId v) noexcept {
        const Size t = tail_.load(std::memory_order_relaxed);
        data_[t] = v;
        tail_.store(t + 1, std::memory_order_relaxed);
    }

    [[nodiscard]] GTRAV_FORCE_INLINE Size size() const noexcept { return tail_.load(std::memory_order_relaxed); }
    [[nodiscard]] GTRAV_FORCE_INLINE bool empty() const noexcept { return size() == 0; }
    GTRAV_FORCE_INLINE NodeId operator[](Size i) const noexcept { return data_[i]; }
    GTRAV_FORCE_INLINE void clear() noexcept { tail_.store(0, std::memory_order_relaxed); }

    void swap(Frontier& other) noexcept {
        std::swap(data_, other.data_);
        const Size t = tail_.load(std::memory_order_relaxed);
        tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        other.tail_.store(t, std::memory_order_relaxed);
    }

private:
    gtrav::memory::AlignedPtr<NodeId> data_;
    std::atomic<Size> tail_;
};

// Single-threaded FIFO over a preallocated ring of N slots (no wrap needed).
class FastQueue {
public:
    explicit FastQueue(Size capacity)
        : data_(gtrav::memory::aligned_alloc<NodeId>(capacity, GTRAV_ALIGNMENT)), head_(0), tail_(0) {}

    FastQueue(const FastQueue&) = delete;
    FastQueue& operator=(const FastQueue&) = delete;

    GTRAV_FORCE_INLINE bool empty() const noexcept { return head_ == tail_; }
    GTRAV_FORCE_INLINE void push(NodeId v) noexcept { data_[tail_++] = v; }

    GTRAV_FORCE_INLINE NodeId pop() noexcept {
        if (GTRAV_LIKELY(head_ + config::PREFETCH_DISTANCE < tail_)) {
            GTRAV_PREFETCH_READ(&data_[head_ + config::PREFETCH_DISTANCE], 0);
        }
        return data_[head_++];
    }

private:
    gtrav::memory::AlignedPtr<NodeId> data_;
    Size head_;
    Size tail_;
};

// First write wins
GTRAV_FORCE_INLINE bool claim(NodeId* slot, NodeId value) noexcept {
    NodeId expected = NOT_PRESENT;
    if (__atomic_load_n(slot, __ATOMIC_RELAXED) != NOT_PRESENT) {
        return false;
    }
    return __atomic_compare_exchange_n(slot, &expected, value, false,
                                       __ATOMIC_RELAXED, __ATOMIC_RELAXED);
}

// Runs the level-synchronous loop. `visit(u, v)` returns true when v was
// claimed by this call. Returns (eccentricity, most_distant_node).
template <typename T, typename Visit>
std::pair<NodeId, NodeId> level_synchronous(
    const CSRGraph<T>& graph,
    Frontier& frontier,
    NodeId first_source,
    std::optional<NodeId> maximal_depth,
    Visit&& visit
) {
    const Size N = graph.get_number_of_nodes();
    Frontier next(N);

    NodeId most_distant_node = first_source;
    // Counts the round being expanded; one too many once the loop drains
    NodeId eccentricity = 0;

    while (!frontier.empty()) {
        ++eccentricity;
        if (maximal_depth && eccentricity > *maximal_depth) {
            break;
        }
        next.clear();

        const Size n_frontier = frontier.size();
        auto expand = [&](size_t i) {
            const NodeId u = frontier[i];
            auto neighbors = graph.neighbors_unchecked(u);
            for (NodeId v : neighbors) {
                if (visit(u, v, eccentricity)) {
                    next.push(v);
                }
            }
        };

        if (n_frontier < config::PARALLEL_FRONTIER_THRESHOLD) {
            for (Size i = 0; i < n_frontier; ++i) expand(i);
        } else {
            gtrav::threading::parallel_for(Size(0), n_frontier, expand);
        }

        if (!next.empty()) {
            most_distant_node = next[0];
        }
        frontier.swap(next);
    }

    if (eccentricity > 0) {
        --eccentricity;
    }
    return {eccentricity, most_distant_node};
}

} // namespace detail

// =============================================================================
// Parallel Multi-Source BFS (unchecked)
// =============================================================================

/// Distances from the nearest source. Sources are assumed valid and non-empty.
template <typename T>
ShortestPathsResultBFS bfs_distances_unchecked(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    const Size N = graph.get_number_of_nodes();
    std::vector<NodeId> distances(N, NOT_PRESENT);
    detail::Frontier frontier(N);

    for (NodeId s : sources) {
        if (distances[s] == NOT_PRESENT) {
            distances[s] = 0;
            frontier.push_unsynchronized(s);
        }
    }

    NodeId* dist = distances.data();
    auto [eccentricity, most_distant_node] = detail::level_synchronous(
        graph, frontier, sources.front(), maximal_depth,
        [dist](NodeId, NodeId v, NodeId round) { return detail::claim(dist + v, round); });

    return ShortestPathsResultBFS(std::move(distances), std::nullopt, eccentricity, most_distant_node);
}

/// Predecessors towards the nearest source. Sources are their own predecessor.
template <typename T>
ShortestPathsResultBFS bfs_predecessors_unchecked(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    const Size N = graph.get_number_of_nodes();
    std::vector<NodeId> predecessors(N, NOT_PRESENT);
    detail::Frontier frontier(N);

    for (NodeId s : sources) {
        if (predecessors[s] == NOT_PRESENT) {
            predecessors[s] = s;
            frontier.push_unsynchronized(s);
        }
    }

    NodeId* pred = predecessors.data();
    auto [eccentricity, most_distant_node] = detail::level_synchronous(
        graph, frontier, sources.front(), maximal_depth,
        [pred](NodeId u, NodeId v, NodeId) { return detail::claim(pred + v, u); });

    return ShortestPathsResultBFS(std::nullopt, std::move(predecessors), eccentricity, most_distant_node);
}

// =============================================================================
// Sequential General BFS (unchecked)
// =============================================================================

/// FIFO traversal computing distances and, optionally, predecessors. Stops as
/// soon as `dst` is discovered. Nodes at `maximal_depth` are not expanded.
template <typename T>
ShortestPathsResultBFS bfs_general_unchecked(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    const Size N = graph.get_number_of_nodes();
    std::vector<NodeId> distances(N, NOT_PRESENT);
    std::optional<std::vector<NodeId>> predecessors;
    if (compute_predecessors) {
        predecessors.emplace(N, NOT_PRESENT);
    }

    NodeId eccentricity = 0;
    NodeId most_distant_node = sources.front();
    bool found = false;

    detail::FastQueue queue(N);
    for (NodeId s : sources) {
        if (distances[s] != NOT_PRESENT) continue;
        distances[s] = 0;
        if (predecessors) (*predecessors)[s] = s;
        queue.push(s);
        if (dst && *dst == s) found = true;
    }

    while (!found && !queue.empty()) {
        const NodeId u = queue.pop();
        const NodeId du = distances[u];
        if (maximal_depth && du >= *maximal_depth) {
            continue;
        }
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (distances[v] != NOT_PRESENT) continue;
            distances[v] = du + 1;
            if (predecessors) (*predecessors)[v] = u;
            if (du + 1 > eccentricity) {
                eccentricity = du + 1;
                most_distant_node = v;
            }
            if (dst && *dst == v) {
                found = true;
                break;
            }
            queue.push(v);
        }
    }

    return ShortestPathsResultBFS(std::move(distances), std::move(predecessors),
                                  eccentricity, most_distant_node);
}

// =============================================================================
// Checked Entry Points
// =============================================================================

namespace detail {

template <typename T>
void validate_sources(const CSRGraph<T>& graph, const std::vector<NodeId>& sources) {
    GTRAV_CHECK_ARG(!sources.empty(), "BFS: the given list of source nodes is empty.");
    graph.validate_node_ids(sources);
}

inline std::vector<NodeId> path_from_predecessors(const std::vector<NodeId>& predecessors, NodeId dst) {
    std::vector<NodeId> path{dst};
    NodeId node = dst;
    while (predecessors[node] != node) {
        node = predecessors[node];
        path.push_back(node);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace detail

template <typename T>
ShortestPathsResultBFS bfs_distances(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    detail::validate_sources(graph, sources);
    return bfs_distances_unchecked(graph, sources, maximal_depth);
}

template <typename T>
ShortestPathsResultBFS bfs_predecessors(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    detail::validate_sources(graph, sources);
    return bfs_predecessors_unchecked(graph, sources, maximal_depth);
}

template <typename T>
ShortestPathsResultBFS bfs(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    std::optional<NodeId> dst = std::nullopt,
    bool compute_predecessors = true,
    std::optional<NodeId> maximal_depth = std::nullopt
) {
    detail::validate_sources(graph, sources);
    if (dst) graph.validate_node_id(*dst);
    return bfs_general_unchecked(graph, sources, dst, compute_predecessors, maximal_depth);
}

// =============================================================================
// Shortest Path Node Ids
// =============================================================================

/// Nodes of one unweighted shortest path, src and dst included.
template <typename T>
std::vector<NodeId> shortest_path_node_ids(const CSRGraph<T>& graph, NodeId src, NodeId dst) {
    graph.validate_node_id(src);
    graph.validate_node_id(dst);
    if (GTRAV_UNLIKELY(src == dst)) {
        throw SelfLoopError(src);
    }
    const auto result = bfs_general_unchecked(graph, {src}, dst, true);
    if (GTRAV_UNLIKELY(!result.has_path_to_node_id(dst))) {
        throw UnreachableNodeError(src, dst);
    }
    return detail::path_from_predecessors(*result.predecessors(), dst);
}

/// Shortest path from the nearest of several sources. dst must not be a source.
template <typename T>
std::vector<NodeId> shortest_path_node_ids_from_sources(
    const CSRGraph<T>& graph,
    const std::vector<NodeId>& sources,
    NodeId dst
) {
    detail::validate_sources(graph, sources);
    graph.validate_node_id(dst);
    if (GTRAV_UNLIKELY(std::find(sources.begin(), sources.end(), dst) != sources.end())) {
        throw SelfLoopError(dst);
    }
    const auto result = bfs_general_unchecked(graph, sources, dst, true);
    if (GTRAV_UNLIKELY(!result.has_path_to_node_id(dst))) {
        throw UnreachableNodeError("There is no path starting from the given source nodes and "
                                   "reaching the given destination node " +
                                   std::to_string(dst) + ".");
    }
    return detail::path_from_predecessors(*result.predecessors(), dst);
}

} // namespace gtrav::kernel::bfs
