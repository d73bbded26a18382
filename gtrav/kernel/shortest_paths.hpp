#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/threading/parallel_for.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/shortest_paths.hpp
// BRIEF: Immutable results of BFS and Dijkstra traversals and their queries
// =============================================================================

namespace gtrav::kernel::shortest_paths {

// =============================================================================
// BFS Result
// =============================================================================

// Distances and/or predecessors of an unweighted traversal.
// Predecessor arrays mark roots with their own id and unreachable nodes with
// NOT_PRESENT; distance arrays mark unreachable nodes with NOT_PRESENT.
class ShortestPathsResultBFS {
public:
    ShortestPathsResultBFS(
        std::optional<std::vector<NodeId>> distances,
        std::optional<std::vector<NodeId>> predecessors,
        NodeId eccentricity,
        NodeId most_distant_node
    )
        : distances_(std::move(distances))
        , predecessors_(std::move(predecessors))
        , eccentricity_(eccentricity)
        , most_distant_node_(most_distant_node) {}

    // -------------------------------------------------------------------------
    // Raw Data
    // -------------------------------------------------------------------------

    [[nodiscard]] bool has_distances() const noexcept { return distances_.has_value(); }
    [[nodiscard]] bool has_predecessors() const noexcept { return predecessors_.has_value(); }

    [[nodiscard]] const std::optional<std::vector<NodeId>>& distances() const noexcept { return distances_; }
    [[nodiscard]] const std::optional<std::vector<NodeId>>& predecessors() const noexcept { return predecessors_; }

    [[nodiscard]] NodeId get_eccentricity() const noexcept { return eccentricity_; }
    [[nodiscard]] NodeId get_most_distant_node() const noexcept { return most_distant_node_; }

    [[nodiscard]] NodeId get_number_of_nodes() const noexcept {
        if (distances_) return static_cast<NodeId>(distances_->size());
        if (predecessors_) return static_cast<NodeId>(predecessors_->size());
        return 0;
    }

    // -------------------------------------------------------------------------
    // Per-Node Queries
    // -------------------------------------------------------------------------

    bool has_path_to_node_id(NodeId node_id) const {
        validate_node_id(node_id);
        if (distances_) {
            return (*distances_)[node_id] != NOT_PRESENT;
        }
        must_have_predecessors();
        return (*predecessors_)[node_id] != NOT_PRESENT;
    }

    NodeId get_distance_from_node_id(NodeId node_id) const {
        must_have_distances();
        validate_node_id(node_id);
        return (*distances_)[node_id];
    }

    NodeId get_parent_from_node_id(NodeId node_id) const {
        must_have_predecessors();
        validate_node_id(node_id);
        return (*predecessors_)[node_id];
    }

    /// Node reached walking k predecessor steps back from dst. Walking past
    /// the root stays on the root.
    NodeId get_kth_point_on_shortest_path(NodeId dst, NodeId k) const {
        must_have_predecessors();
        validate_node_id(dst);
        if (GTRAV_UNLIKELY((*predecessors_)[dst] == NOT_PRESENT)) {
            throw UnreachableNodeError("There is no path to the given destination node " +
                                       std::to_string(dst) + ".");
        }
        if (GTRAV_UNLIKELY(k > eccentricity_)) {
            throw ValueError("The requested number of steps (" + std::to_string(k) +
                             ") is higher than the eccentricity of the traversal (" +
                             std::to_string(eccentricity_) + ").");
        }
        NodeId node = dst;
        for (NodeId step = 0; step < k; ++step) {
            node = (*predecessors_)[node];
        }
        return node;
    }

    /// Point distance(dst) / 2 steps back from dst.
    NodeId get_median_point(NodeId dst) const {
        must_have_predecessors();
        validate_node_id(dst);
        if (GTRAV_UNLIKELY((*predecessors_)[dst] == NOT_PRESENT)) {
            throw UnreachableNodeError("There is no path to the given destination node " +
                                       std::to_string(dst) + ".");
        }
        const NodeId distance = distances_ ? (*distances_)[dst] : depth_unchecked(dst);
        return get_kth_point_on_shortest_path(dst, distance / 2);
    }

    NodeId get_median_point_to_most_distant_node() const {
        return get_median_point(most_distant_node_);
    }

    /// Number of reachable nodes that are not roots.
    NodeId get_number_of_shortest_paths() const {
        must_have_predecessors();
        const auto& predecessors = *predecessors_;
        NodeId count = 0;
        for (NodeId node = 0; node < static_cast<NodeId>(predecessors.size()); ++node) {
            const NodeId parent = predecessors[node];
            count += (parent != NOT_PRESENT && parent != node) ? 1 : 0;
        }
        return count;
    }

    /// Number of shortest paths going through node_id, the node's own path
    /// included.
    NodeId get_number_of_shortest_paths_from_node_id(NodeId node_id) const {
        return static_cast<NodeId>(get_successors_from_node_id(node_id).size());
    }

    /// Nodes whose predecessor chain climbs to src, src included, ascending.
    std::vector<NodeId> get_successors_from_node_id(NodeId src) const {
        must_have_predecessors();
        validate_node_id(src);
        const auto& predecessors = *predecessors_;
        const Size n = predecessors.size();

        std::vector<Byte> reaches(n, 0);
        gtrav::threading::parallel_for(Size(0), n, [&](size_t i) {
            NodeId node = static_cast<NodeId>(i);
            while (true) {
                if (node == src) {
                    reaches[i] = 1;
                    return;
                }
                const NodeId parent = predecessors[node];
                if (parent == NOT_PRESENT || parent == node) {
                    return;
                }
                node = parent;
            }
        });

        std::vector<NodeId> successors;
        for (Size i = 0; i < n; ++i) {
            if (reaches[i]) {
                successors.push_back(static_cast<NodeId>(i));
            }
        }
        return successors;
    }

    /// Chain [src, parent(src), ..., root]. An unreachable node yields [src].
    std::vector<NodeId> get_predecessors_from_node_id(NodeId src) const {
        must_have_predecessors();
        validate_node_id(src);
        const auto& predecessors = *predecessors_;
        std::vector<NodeId> chain{src};
        NodeId node = src;
        while (true) {
            const NodeId parent = predecessors[node];
            if (parent == NOT_PRESENT || parent == node) {
                break;
            }
            chain.push_back(parent);
            node = parent;
        }
        return chain;
    }

    /// Length of the common root-side prefix of the two ancestor chains.
    NodeId get_shared_ancestors_size(NodeId first, NodeId second) const {
        const auto first_chain = get_predecessors_from_node_id(first);
        const auto second_chain = get_predecessors_from_node_id(second);
        return shared_suffix_size(first_chain, second_chain);
    }

    Real get_ancestors_jaccard_index(NodeId first, NodeId second) const {
        const auto first_chain = get_predecessors_from_node_id(first);
        const auto second_chain = get_predecessors_from_node_id(second);
        const NodeId shared = shared_suffix_size(first_chain, second_chain);
        const Size union_size = first_chain.size() + second_chain.size() - shared;
        return static_cast<Real>(shared) / static_cast<Real>(union_size);
    }

private:
    std::optional<std::vector<NodeId>> distances_;
    std::optional<std::vector<NodeId>> predecessors_;
    NodeId eccentricity_;
    NodeId most_distant_node_;

    void must_have_distances() const {
        GTRAV_CHECK_DATA(distances_.has_value(),
            "Distances were not computed for this BFS result.");
    }

    void must_have_predecessors() const {
        GTRAV_CHECK_DATA(predecessors_.has_value(),
            "Predecessors were not computed for this BFS result.");
    }

    void validate_node_id(NodeId node_id) const {
        const NodeId n = get_number_of_nodes();
        if (GTRAV_UNLIKELY(node_id >= n)) {
            throw IndexOutOfBoundsError(
                "The given node id (" + std::to_string(node_id) +
                ") is higher than the number of nodes within the BFS result (" +
                std::to_string(n) + ").");
        }
    }

    NodeId depth_unchecked(NodeId node) const {
        const auto& predecessors = *predecessors_;
        NodeId depth = 0;
        while (predecessors[node] != node) {
            node = predecessors[node];
            ++depth;
        }
        return depth;
    }

    static NodeId shared_suffix_size(const std::vector<NodeId>& a, const std::vector<NodeId>& b) {
        NodeId shared = 0;
        auto ia = a.rbegin();
        auto ib = b.rbegin();
        while (ia != a.rend() && ib != b.rend() && *ia == *ib) {
            ++shared;
            ++ia;
            ++ib;
        }
        return shared;
    }
};

// =============================================================================
// Dijkstra Result
// =============================================================================

// Distances of a weighted traversal. In probability mode distances are
// probabilities in [0, 1] (0 for unreachable nodes), otherwise path lengths
// (+infinity for unreachable nodes). Predecessor arrays use NOT_PRESENT for
// "no predecessor", which includes the sources.
class ShortestPathsDijkstra {
public:
    ShortestPathsDijkstra(
        std::vector<Real> distances,
        std::optional<std::vector<NodeId>> predecessors,
        std::optional<Real> dst_node_distance,
        Real eccentricity,
        NodeId most_distant_node,
        Real total_distance,
        Real log_total_distance,
        Real total_harmonic_distance,
        bool use_probabilities
    )
        : distances_(std::move(distances))
        , predecessors_(std::move(predecessors))
        , dst_node_distance_(dst_node_distance)
        , eccentricity_(eccentricity)
        , most_distant_node_(most_distant_node)
        , total_distance_(total_distance)
        , log_total_distance_(log_total_distance)
        , total_harmonic_distance_(total_harmonic_distance)
        , use_probabilities_(use_probabilities) {}

    [[nodiscard]] NodeId get_number_of_nodes() const noexcept { return static_cast<NodeId>(distances_.size()); }
    [[nodiscard]] bool has_predecessors() const noexcept { return predecessors_.has_value(); }
    [[nodiscard]] bool uses_probabilities() const noexcept { return use_probabilities_; }

    [[nodiscard]] const std::vector<Real>& distances() const noexcept { return distances_; }
    [[nodiscard]] const std::optional<std::vector<NodeId>>& predecessors() const noexcept { return predecessors_; }

    [[nodiscard]] std::optional<Real> get_dst_node_distance() const noexcept { return dst_node_distance_; }
    [[nodiscard]] Real get_eccentricity() const noexcept { return eccentricity_; }
    [[nodiscard]] NodeId get_most_distant_node() const noexcept { return most_distant_node_; }
    [[nodiscard]] Real get_total_distance() const noexcept { return total_distance_; }
    [[nodiscard]] Real get_log_total_distance() const noexcept { return log_total_distance_; }
    [[nodiscard]] Real get_total_harmonic_distance() const noexcept { return total_harmonic_distance_; }

    bool has_path_to_node_id(NodeId node_id) const {
        validate_node_id(node_id);
        return is_reachable_unchecked(node_id);
    }

    Real get_distance_from_node_id(NodeId node_id) const {
        validate_node_id(node_id);
        return distances_[node_id];
    }

    std::optional<NodeId> get_parent_from_node_id(NodeId node_id) const {
        must_have_predecessors();
        validate_node_id(node_id);
        const NodeId parent = (*predecessors_)[node_id];
        if (parent == NOT_PRESENT) {
            return std::nullopt;
        }
        return parent;
    }

    /// Walks back from dst while the predecessor is still at least `distance`
    /// away from the sources. In probability mode "farther" means less
    /// probable, so the comparison is mirrored.
    NodeId get_point_at_given_distance_on_shortest_path(NodeId dst, Real distance) const {
        must_have_predecessors();
        validate_node_id(dst);
        if (GTRAV_UNLIKELY(!is_reachable_unchecked(dst))) {
            throw UnreachableNodeError("There is no path to the given destination node " +
                                       std::to_string(dst) + ".");
        }
        const Real dst_distance = distances_[dst];
        if (GTRAV_UNLIKELY(is_farther(distance, dst_distance))) {
            throw ValueError("The requested distance (" + std::to_string(distance) +
                             ") is larger than the distance of the destination node (" +
                             std::to_string(dst_distance) + ").");
        }
        const auto& predecessors = *predecessors_;
        NodeId node = dst;
        while (true) {
            const NodeId parent = predecessors[node];
            if (parent == NOT_PRESENT || is_farther(distance, distances_[parent])) {
                break;
            }
            node = parent;
        }
        return node;
    }

    NodeId get_median_point(NodeId dst) const {
        validate_node_id(dst);
        const Real dst_distance = distances_[dst];
        // Half of a negative log-probability is the square root of the probability
        const Real half = use_probabilities_ ? std::sqrt(dst_distance) : dst_distance / Real(2);
        return get_point_at_given_distance_on_shortest_path(dst, half);
    }

    NodeId get_median_point_to_most_distant_node() const {
        return get_median_point(most_distant_node_);
    }

    /// Number of nodes reached through a predecessor.
    NodeId get_number_of_shortest_paths() const {
        must_have_predecessors();
        NodeId count = 0;
        for (NodeId parent : *predecessors_) {
            count += parent != NOT_PRESENT ? 1 : 0;
        }
        return count;
    }

    // Bit-pattern comparison keeps NaN and signed zero well defined
    friend bool operator==(const ShortestPathsDijkstra& a, const ShortestPathsDijkstra& b) noexcept {
        if (a.distances_.size() != b.distances_.size()) return false;
        for (Size i = 0; i < a.distances_.size(); ++i) {
            if (bits(a.distances_[i]) != bits(b.distances_[i])) return false;
        }
        if (a.dst_node_distance_.has_value() != b.dst_node_distance_.has_value()) return false;
        if (a.dst_node_distance_ && bits(*a.dst_node_distance_) != bits(*b.dst_node_distance_)) return false;
        return a.predecessors_ == b.predecessors_ &&
               bits(a.eccentricity_) == bits(b.eccentricity_) &&
               a.most_distant_node_ == b.most_distant_node_ &&
               bits(a.total_distance_) == bits(b.total_distance_) &&
               bits(a.log_total_distance_) == bits(b.log_total_distance_) &&
               bits(a.total_harmonic_distance_) == bits(b.total_harmonic_distance_) &&
               a.use_probabilities_ == b.use_probabilities_;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        std::uint64_t h = 0xCBF29CE484222325ULL;
        auto mix = [&h](std::uint64_t v) {
            h ^= v + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
        };
        for (Real d : distances_) mix(bits(d));
        if (predecessors_) {
            for (NodeId p : *predecessors_) mix(p);
        }
        mix(dst_node_distance_ ? bits(*dst_node_distance_) : 0xFFFFFFFFFFULL);
        mix(bits(eccentricity_));
        mix(most_distant_node_);
        mix(bits(total_distance_));
        mix(bits(log_total_distance_));
        mix(bits(total_harmonic_distance_));
        mix(use_probabilities_ ? 1 : 0);
        return static_cast<std::size_t>(h);
    }

private:
    std::vector<Real> distances_;
    std::optional<std::vector<NodeId>> predecessors_;
    std::optional<Real> dst_node_distance_;
    Real eccentricity_;
    NodeId most_distant_node_;
    Real total_distance_;
    Real log_total_distance_;
    Real total_harmonic_distance_;
    bool use_probabilities_;

    static std::uint32_t bits(Real value) noexcept {
        return std::bit_cast<std::uint32_t>(value);
    }

    bool is_reachable_unchecked(NodeId node_id) const noexcept {
        const Real d = distances_[node_id];
        return use_probabilities_ ? d > Real(0) : std::isfinite(d);
    }

    // True when `a` lies farther from the sources than `b`
    bool is_farther(Real a, Real b) const noexcept {
        return use_probabilities_ ? a < b : a > b;
    }

    void must_have_predecessors() const {
        GTRAV_CHECK_DATA(predecessors_.has_value(),
            "Predecessors were not computed for this Dijkstra result.");
    }

    void validate_node_id(NodeId node_id) const {
        if (GTRAV_UNLIKELY(node_id >= distances_.size())) {
            throw IndexOutOfBoundsError(
                "The given node id (" + std::to_string(node_id) +
                ") is higher than the number of nodes within the Dijkstra result (" +
                std::to_string(distances_.size()) + ").");
        }
    }
};

} // namespace gtrav::kernel::shortest_paths

template <>
struct std::hash<gtrav::kernel::shortest_paths::ShortestPathsDijkstra> {
    std::size_t operator()(const gtrav::kernel::shortest_paths::ShortestPathsDijkstra& result) const noexcept {
        return result.hash();
    }
};
