#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// =============================================================================
/// @file graph.hpp
/// @brief Read-only CSR graph consumed by the traversal kernels.
///
/// Row `u` of the adjacency holds the outgoing edges of node `u`. The edge id
/// of an edge is its position in the CSR arrays, so the edge ids of node `u`
/// are the contiguous range returned by `edge_range_unchecked(u)`, aligned
/// with `neighbors_unchecked(u)` and `weights_unchecked(u)`.
///
/// @section Undirected graphs
/// Undirected graphs store both directions of every edge; a self-loop is
/// stored once.
///
/// @section Checked and unchecked access
/// Methods with the `_unchecked` suffix never validate node ids. Every public
/// kernel validates ids through `validate_node_id` first.
// =============================================================================

namespace gtrav {

template <typename T = Real>
class CSRGraph {
public:
    using WeightType = T;
    using Edge = std::pair<NodeId, NodeId>;
    using WeightedEdge = std::tuple<NodeId, NodeId, T>;

    CSRGraph() = default;

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    /// @brief Build an unweighted graph. Duplicate edges are merged.
    static CSRGraph from_edges(NodeId n_nodes, const std::vector<Edge>& edges, bool directed) {
        std::vector<WeightedEdge> weighted;
        weighted.reserve(edges.size());
        for (const auto& [src, dst] : edges) {
            weighted.emplace_back(src, dst, T(1));
        }
        return build(n_nodes, std::move(weighted), directed, false);
    }

    /// @brief Build a weighted graph. For duplicate edges the first weight wins.
    static CSRGraph from_weighted_edges(NodeId n_nodes, const std::vector<WeightedEdge>& edges, bool directed) {
        return build(n_nodes, edges, directed, true);
    }

    // -------------------------------------------------------------------------
    // Graph Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] GTRAV_FORCE_INLINE NodeId get_number_of_nodes() const noexcept { return n_nodes_; }

    /// @brief Number of stored (directed) edges; undirected edges count twice.
    [[nodiscard]] GTRAV_FORCE_INLINE EdgeId get_number_of_directed_edges() const noexcept {
        return static_cast<EdgeId>(destinations_.size());
    }

    [[nodiscard]] GTRAV_FORCE_INLINE bool is_directed() const noexcept { return directed_; }
    [[nodiscard]] GTRAV_FORCE_INLINE bool has_edges() const noexcept { return !destinations_.empty(); }
    [[nodiscard]] GTRAV_FORCE_INLINE bool has_edge_weights() const noexcept { return weighted_; }

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    NodeId validate_node_id(NodeId node_id) const {
        if (GTRAV_UNLIKELY(node_id >= n_nodes_)) {
            throw IndexOutOfBoundsError(
                "The given node id (" + std::to_string(node_id) +
                ") is higher than the number of nodes within the graph (" +
                std::to_string(n_nodes_) + ").");
        }
        return node_id;
    }

    void validate_node_ids(const std::vector<NodeId>& node_ids) const {
        for (NodeId node_id : node_ids) {
            validate_node_id(node_id);
        }
    }

    void must_have_edge_weights() const {
        if (GTRAV_UNLIKELY(!weighted_)) {
            throw MissingDataError("The current graph instance does not have edge weights.");
        }
    }

    void must_have_positive_edge_weights() const {
        must_have_edge_weights();
        for (T w : weights_) {
            if (GTRAV_UNLIKELY(!(w > T(0)))) {
                throw DomainError(
                    "The current graph instance contains negative, zero or NaN edge weights.");
            }
        }
    }

    void must_have_edge_weights_representing_probabilities() const {
        must_have_edge_weights();
        for (T w : weights_) {
            if (GTRAV_UNLIKELY(!(w > T(0) && w <= T(1)))) {
                throw DomainError(
                    "The current graph instance contains edge weights that do not represent "
                    "probabilities, that is weights outside of the (0, 1] interval.");
            }
        }
    }

    // -------------------------------------------------------------------------
    // Traversal API
    // -------------------------------------------------------------------------

    [[nodiscard]] GTRAV_FORCE_INLINE NodeId degree_unchecked(NodeId src) const noexcept {
        return static_cast<NodeId>(offsets_[src + 1] - offsets_[src]);
    }

    [[nodiscard]] GTRAV_FORCE_INLINE Array<const NodeId> neighbors_unchecked(NodeId src) const noexcept {
        const EdgeId begin = offsets_[src];
        return Array<const NodeId>(destinations_.data() + begin,
                                   static_cast<Size>(offsets_[src + 1] - begin));
    }

    /// @brief Half-open range of the outgoing edge ids of `src`.
    [[nodiscard]] GTRAV_FORCE_INLINE std::pair<EdgeId, EdgeId> edge_range_unchecked(NodeId src) const noexcept {
        return {offsets_[src], offsets_[src + 1]};
    }

    /// @brief Edge weights of `src`, aligned with its neighbours. Empty when
    /// the graph is unweighted.
    [[nodiscard]] GTRAV_FORCE_INLINE Array<const T> weights_unchecked(NodeId src) const noexcept {
        if (!weighted_) {
            return Array<const T>();
        }
        const EdgeId begin = offsets_[src];
        return Array<const T>(weights_.data() + begin,
                              static_cast<Size>(offsets_[src + 1] - begin));
    }

    /// @brief True when the node has neither outgoing nor incoming edges.
    [[nodiscard]] GTRAV_FORCE_INLINE bool is_disconnected_node_unchecked(NodeId node) const noexcept {
        return degree_unchecked(node) == 0 && in_degrees_[node] == 0;
    }

    /// @brief Node with the highest out-degree, lowest id on ties.
    NodeId get_most_central_node_id() const {
        if (GTRAV_UNLIKELY(n_nodes_ == 0)) {
            throw ValueError("The current graph instance does not have any node.");
        }
        NodeId best = 0;
        NodeId best_degree = degree_unchecked(0);
        for (NodeId u = 1; u < n_nodes_; ++u) {
            const NodeId d = degree_unchecked(u);
            if (d > best_degree) {
                best = u;
                best_degree = d;
            }
        }
        return best;
    }

private:
    NodeId n_nodes_ = 0;
    bool directed_ = false;
    bool weighted_ = false;
    std::vector<EdgeId> offsets_{0};
    std::vector<NodeId> destinations_;
    std::vector<T> weights_;
    std::vector<NodeId> in_degrees_;

    // Sorted by (src, dst); the first occurrence of a duplicate keeps its weight
    static void sort_and_deduplicate(std::vector<WeightedEdge>& edges) {
        std::stable_sort(edges.begin(), edges.end(), [](const WeightedEdge& a, const WeightedEdge& b) {
            return std::tie(std::get<0>(a), std::get<1>(a)) < std::tie(std::get<0>(b), std::get<1>(b));
        });
        edges.erase(std::unique(edges.begin(), edges.end(), [](const WeightedEdge& a, const WeightedEdge& b) {
            return std::get<0>(a) == std::get<0>(b) && std::get<1>(a) == std::get<1>(b);
        }), edges.end());
    }

    static CSRGraph build(NodeId n_nodes, std::vector<WeightedEdge> edges, bool directed, bool weighted) {
        for (const auto& [src, dst, w] : edges) {
            GTRAV_CHECK_BOUNDS(src, n_nodes, "Graph: edge source node id out of range");
            GTRAV_CHECK_BOUNDS(dst, n_nodes, "Graph: edge destination node id out of range");
        }

        if (!directed) {
            // One weight per undirected pair, shared by both directions
            for (auto& [src, dst, w] : edges) {
                if (src > dst) {
                    std::swap(src, dst);
                }
            }
            sort_and_deduplicate(edges);
            const Size n_input = edges.size();
            edges.reserve(2 * n_input);
            for (Size i = 0; i < n_input; ++i) {
                const auto [src, dst, w] = edges[i];
                if (src != dst) {
                    edges.emplace_back(dst, src, w);
                }
            }
        }
        sort_and_deduplicate(edges);

        CSRGraph graph;
        graph.n_nodes_ = n_nodes;
        graph.directed_ = directed;
        graph.weighted_ = weighted;
        graph.offsets_.assign(static_cast<Size>(n_nodes) + 1, 0);
        graph.in_degrees_.assign(n_nodes, 0);
        graph.destinations_.reserve(edges.size());
        if (weighted) {
            graph.weights_.reserve(edges.size());
        }

        for (const auto& [src, dst, w] : edges) {
            ++graph.offsets_[static_cast<Size>(src) + 1];
            ++graph.in_degrees_[dst];
            graph.destinations_.push_back(dst);
            if (weighted) {
                graph.weights_.push_back(w);
            }
        }
        std::partial_sum(graph.offsets_.begin(), graph.offsets_.end(), graph.offsets_.begin());
        return graph;
    }
};

// =============================================================================
// Common Aliases
// =============================================================================

using Graph = CSRGraph<Real>;

} // namespace gtrav
