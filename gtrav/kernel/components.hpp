#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/memory.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/threading/parallel_for.hpp"
#include "gtrav/threading/scheduler.hpp"

#include <atomic>
#include <memory>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/components.hpp
// BRIEF: Weakly connected components over the stored edges
//
// Every stored edge joins its endpoints, so for undirected graphs these are
// the connected components and for directed graphs the weak ones.
// =============================================================================

namespace gtrav::kernel::components {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr NodeId INVALID_COMPONENT = NOT_PRESENT;
    constexpr Size PARALLEL_NODES_THRESHOLD = 1000;
}

namespace detail {

// =============================================================================
// Lock-Free Union-Find with Path Splitting
// =============================================================================

class ParallelUnionFind {
public:
    explicit ParallelUnionFind(Size size)
        : parent_(std::make_unique<std::atomic<NodeId>[]>(size)) {
        for (Size i = 0; i < size; ++i) {
            parent_[i].store(static_cast<NodeId>(i), std::memory_order_relaxed);
        }
    }

    GTRAV_FORCE_INLINE NodeId find(NodeId x) noexcept {
        while (true) {
            NodeId p = parent_[x].load(std::memory_order_relaxed);
            if (p == x) return x;
            const NodeId gp = parent_[p].load(std::memory_order_relaxed);
            if (gp == p) return p;
            parent_[x].compare_exchange_weak(p, gp, std::memory_order_relaxed);
            x = gp;
        }
    }

    // Roots always point to the smaller id
    GTRAV_FORCE_INLINE bool unite(NodeId x, NodeId y) noexcept {
        while (true) {
            NodeId rx = find(x);
            NodeId ry = find(y);
            if (rx == ry) return false;
            if (rx > ry) std::swap(rx, ry);
            NodeId expected = ry;
            if (parent_[ry].compare_exchange_weak(expected, rx, std::memory_order_relaxed)) {
                return true;
            }
        }
    }

private:
    std::unique_ptr<std::atomic<NodeId>[]> parent_;  // NOLINT(modernize-avoid-c-arrays)
};

// Sequential Union-Find, union by rank with full path compression
class UnionFind {
public:
    explicit UnionFind(Size size)
        : parent_(gtrav::memory::aligned_alloc<NodeId>(size, GTRAV_ALIGNMENT))
        , rank_(gtrav::memory::aligned_alloc<Byte>(size, GTRAV_ALIGNMENT)) {
        for (Size i = 0; i < size; ++i) {
            parent_[i] = static_cast<NodeId>(i);
        }
    }

    GTRAV_FORCE_INLINE NodeId find(NodeId x) noexcept {
        NodeId root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[x] != root) {
            const NodeId next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    GTRAV_FORCE_INLINE bool unite(NodeId x, NodeId y) noexcept {
        const NodeId rx = find(x);
        const NodeId ry = find(y);
        if (rx == ry) return false;
        if (rank_[rx] < rank_[ry]) {
            parent_[rx] = ry;
        } else if (rank_[rx] > rank_[ry]) {
            parent_[ry] = rx;
        } else {
            parent_[ry] = rx;
            ++rank_[rx];
        }
        return true;
    }

private:
    gtrav::memory::AlignedPtr<NodeId> parent_;
    gtrav::memory::AlignedPtr<Byte> rank_;
};

// Contiguous labels in order of first appearance
template <typename Find>
NodeId assign_labels(Size N, Find&& find, Array<NodeId> labels) {
    std::vector<NodeId> root_to_label(N, config::INVALID_COMPONENT);
    NodeId n_components = 0;
    for (Size i = 0; i < N; ++i) {
        const NodeId root = find(static_cast<NodeId>(i));
        if (root_to_label[root] == config::INVALID_COMPONENT) {
            root_to_label[root] = n_components++;
        }
        labels[i] = root_to_label[root];
    }
    return n_components;
}

} // namespace detail

// =============================================================================
// Connected Components
// =============================================================================

/// Writes a component label in [0, n_components) for every node and returns
/// n_components. Labels follow the order of each component's lowest node id.
template <typename T>
NodeId connected_components(const CSRGraph<T>& graph, Array<NodeId> component_labels) {
    const Size N = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(component_labels.size() >= N, "Components: output buffer too small");

    if (N == 0) {
        return 0;
    }

    const size_t n_threads = gtrav::threading::Scheduler::get_num_threads();
    if (N >= config::PARALLEL_NODES_THRESHOLD && n_threads > 1) {
        detail::ParallelUnionFind uf(N);
        gtrav::threading::parallel_for(Size(0), N, [&](size_t i) {
            const auto u = static_cast<NodeId>(i);
            for (NodeId v : graph.neighbors_unchecked(u)) {
                if (v != u) uf.unite(u, v);
            }
        });
        return detail::assign_labels(N, [&](NodeId x) { return uf.find(x); }, component_labels);
    }

    detail::UnionFind uf(N);
    for (NodeId u = 0; u < static_cast<NodeId>(N); ++u) {
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (v != u) uf.unite(u, v);
        }
    }
    return detail::assign_labels(N, [&](NodeId x) { return uf.find(x); }, component_labels);
}

/// Number of nodes of each component, indexed by label.
inline std::vector<NodeId> component_sizes(Array<const NodeId> component_labels, NodeId n_components) {
    std::vector<NodeId> sizes(n_components, 0);
    for (NodeId label : component_labels) {
        GTRAV_CHECK_BOUNDS(label, n_components, "Components: label out of range");
        ++sizes[label];
    }
    return sizes;
}

template <typename T>
bool is_connected(const CSRGraph<T>& graph) {
    const Size N = graph.get_number_of_nodes();
    if (N <= 1) return true;
    std::vector<NodeId> labels(N);
    return connected_components(graph, Array<NodeId>(labels.data(), N)) == 1;
}

} // namespace gtrav::kernel::components
