#pragma once

#include "gtrav/config.hpp"
#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/macros.hpp"
#include "gtrav/core/graph.hpp"
#include "gtrav/core/hyperloglog.hpp"
#include "gtrav/threading/parallel_for.hpp"
#include "gtrav/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/hyper_edge_ball.hpp
// BRIEF: Round-synchronous HyperLogLog propagation of node and edge balls
//
// Round 0 gives every node a sketch of its own id (hyper_ball) or of its own
// outgoing edge ids (hyper_edge_ball). Round r merges into each node the
// round r - 1 sketches of its neighbours, so the sketch of a node at round r
// counts the nodes, or the edges, within r hops. Rounds repeat until no
// sketch changes.
//
// In every round the caller's operator receives (centrality[node],
// new_estimate, old_estimate, r) for each node, unchanged nodes included,
// which lets one traversal drive several centrality measures. The operator
// runs concurrently for distinct nodes and must not throw.
//
// Threads claim nodes from per-thread ranges and steal from the others once
// their own range is exhausted. Rank 0 coordinates the end of each round; the
// others spin until it publishes the next round.
// =============================================================================

namespace gtrav::kernel::hyper_edge_ball {

/// What a node's round-0 sketch holds.
enum class Seeding : std::uint8_t {
    NODE_IDS,
    EDGE_IDS
};

namespace detail {

// =============================================================================
// Shared Round State
// =============================================================================

struct GTRAV_CACHE_ALIGNED PaddedCursor {
    std::atomic<std::uint64_t> value{0};
};

struct GTRAV_CACHE_ALIGNED PaddedFlag {
    std::atomic<bool> value{false};
};

class SharedRoundState {
public:
    SharedRoundState(Size n_threads, NodeId n_nodes)
        : cursors(n_threads), changed(n_threads), n_threads_(n_threads), n_nodes_(n_nodes) {
        reset_cursors();
    }

    std::atomic<NodeId> round{1};
    std::atomic<bool> converged{false};
    std::atomic<Size> finished{0};
    std::vector<PaddedCursor> cursors;
    std::vector<PaddedFlag> changed;

    [[nodiscard]] Size n_threads() const noexcept { return n_threads_; }

    GTRAV_FORCE_INLINE std::uint64_t range_begin(Size t) const noexcept {
        return static_cast<std::uint64_t>(n_nodes_ / n_threads_) * t;
    }

    // The last range absorbs the remainder
    GTRAV_FORCE_INLINE std::uint64_t range_end(Size t) const noexcept {
        return t + 1 == n_threads_ ? n_nodes_ : range_begin(t + 1);
    }

    void reset_cursors() noexcept {
        for (Size t = 0; t < n_threads_; ++t) {
            cursors[t].value.store(range_begin(t), std::memory_order_relaxed);
        }
    }

    /// Next unprocessed node, own range first, then the other ranges in
    /// rank order. Ranges of ranks missing from the team are stolen too.
    std::optional<NodeId> claim(Size rank) noexcept {
        for (Size i = 0; i < n_threads_; ++i) {
            const Size t = (rank + i) % n_threads_;
            const std::uint64_t end = range_end(t);
            if (cursors[t].value.load(std::memory_order_relaxed) >= end) {
                continue;
            }
            const std::uint64_t previous = cursors[t].value.fetch_add(1, std::memory_order_relaxed);
            if (previous < end) {
                return static_cast<NodeId>(previous);
            }
        }
        return std::nullopt;
    }

private:
    Size n_threads_;
    NodeId n_nodes_;
};

// =============================================================================
// Propagation
// =============================================================================

template <Seeding SEEDING, std::uint8_t PRECISION, std::uint8_t BITS, typename T, typename Ops>
void propagate(const CSRGraph<T>& graph, Array<Real> centrality, Ops& ops) {
    using Sketch = sketch::HyperLogLog<PRECISION, BITS>;

    const NodeId n_nodes = graph.get_number_of_nodes();
    GTRAV_CHECK_DIM(centrality.size() >= n_nodes, "HyperBall: output buffer too small");
    if (n_nodes == 0) {
        return;
    }

    std::array<std::vector<Sketch>, 2> sketches{std::vector<Sketch>(n_nodes), std::vector<Sketch>(n_nodes)};
    gtrav::threading::parallel_for(Size(0), Size(n_nodes), [&](size_t i) {
        if constexpr (SEEDING == Seeding::NODE_IDS) {
            sketches[0][i].insert(static_cast<std::uint64_t>(i));
        } else {
            const auto [begin, end] = graph.edge_range_unchecked(static_cast<NodeId>(i));
            for (EdgeId e = begin; e < end; ++e) {
                sketches[0][i].insert(e);
            }
        }
    });

    const Size n_threads = std::max<Size>(
        1, std::min<Size>(gtrav::threading::Scheduler::get_num_threads(), n_nodes));
    SharedRoundState state(n_threads, n_nodes);

    gtrav::threading::parallel_region(n_threads, [&](size_t rank, size_t team) {
        NodeId round = 1;
        while (true) {
            const std::vector<Sketch>& previous = sketches[(round + 1) % 2];
            std::vector<Sketch>& current = sketches[round % 2];
            bool changed = false;

            while (const auto claimed = state.claim(rank)) {
                const NodeId node = *claimed;
                Sketch merged = previous[node];
                for (NodeId v : graph.neighbors_unchecked(node)) {
                    merged |= previous[v];
                }
                changed |= !(merged == previous[node]);
                ops(centrality[node], merged.estimate_cardinality(),
                    previous[node].estimate_cardinality(), round);
                current[node] = merged;
            }

            state.changed[rank].value.store(changed, std::memory_order_relaxed);
            state.finished.fetch_add(1, std::memory_order_acq_rel);

            if (rank == 0) {
                while (state.finished.load(std::memory_order_acquire) < team) {
                    GTRAV_CPU_RELAX();
                }
                bool any_changed = false;
                for (Size t = 0; t < state.n_threads(); ++t) {
                    any_changed |= state.changed[t].value.exchange(false, std::memory_order_relaxed);
                }
                state.finished.store(0, std::memory_order_relaxed);
                if (any_changed) {
                    state.reset_cursors();
                } else {
                    state.converged.store(true, std::memory_order_relaxed);
                }
                state.round.store(round + 1, std::memory_order_release);
            } else {
                while (state.round.load(std::memory_order_acquire) == round) {
                    GTRAV_CPU_RELAX();
                }
            }

            if (state.converged.load(std::memory_order_relaxed)) {
                break;
            }
            ++round;
        }
    });
}

} // namespace detail

/// Runs the node-ball propagation to convergence and applies `ops` to
/// `centrality`, which must hold one entry per node and is not reset.
template <std::uint8_t PRECISION, std::uint8_t BITS, typename T, typename Ops>
void hyper_ball(const CSRGraph<T>& graph, Array<Real> centrality, Ops& ops) {
    detail::propagate<Seeding::NODE_IDS, PRECISION, BITS>(graph, centrality, ops);
}

/// Same as hyper_ball over edge balls.
template <std::uint8_t PRECISION, std::uint8_t BITS, typename T, typename Ops>
void hyper_edge_ball(const CSRGraph<T>& graph, Array<Real> centrality, Ops& ops) {
    detail::propagate<Seeding::EDGE_IDS, PRECISION, BITS>(graph, centrality, ops);
}

// =============================================================================
// Runtime Parameter Dispatch
// =============================================================================

namespace detail {

inline constexpr std::size_t PRECISION_COUNT =
    sketch::config::MAX_PRECISION - sketch::config::MIN_PRECISION + 1;

template <typename T, typename Ops>
using Kernel = void (*)(const CSRGraph<T>&, Array<Real>, Ops&);

template <Seeding SEEDING, typename T, typename Ops, std::size_t I>
void run_entry(const CSRGraph<T>& graph, Array<Real> centrality, Ops& ops) {
    constexpr auto precision = static_cast<std::uint8_t>(sketch::config::MIN_PRECISION + I / 2);
    constexpr auto bits = static_cast<std::uint8_t>(5 + I % 2);
    propagate<SEEDING, precision, bits>(graph, centrality, ops);
}

// Entry 2 * (precision - MIN_PRECISION) + (bits - 5)
template <Seeding SEEDING, typename T, typename Ops, std::size_t... I>
constexpr std::array<Kernel<T, Ops>, sizeof...(I)> make_table(std::index_sequence<I...>) {
    return {&run_entry<SEEDING, T, Ops, I>...};
}

template <Seeding SEEDING, typename T, typename Ops>
void dispatch(
    const CSRGraph<T>& graph,
    std::uint8_t precision,
    std::uint8_t bits,
    Array<Real> centrality,
    Ops& ops
) {
    if (GTRAV_UNLIKELY(precision < sketch::config::MIN_PRECISION ||
                       precision > sketch::config::MAX_PRECISION ||
                       (bits != 5 && bits != 6))) {
        throw ConfigurationError(
            "HyperBall: unsupported sketch parameters (precision " +
            std::to_string(precision) + ", bits " + std::to_string(bits) +
            "); precision must be in [" + std::to_string(sketch::config::MIN_PRECISION) +
            ", " + std::to_string(sketch::config::MAX_PRECISION) + "] and bits must be 5 or 6.");
    }

    static constexpr auto table =
        make_table<SEEDING, T, Ops>(std::make_index_sequence<2 * PRECISION_COUNT>{});
    table[2 * (precision - sketch::config::MIN_PRECISION) + (bits - 5)](graph, centrality, ops);
}

} // namespace detail

/// Selects the sketch parameters at run time. Precision must lie in [4, 16]
/// and bits must be 5 or 6.
template <typename T, typename Ops>
void dispatch_hyper_ball(
    const CSRGraph<T>& graph,
    std::uint8_t precision,
    std::uint8_t bits,
    Array<Real> centrality,
    Ops&& ops
) {
    detail::dispatch<Seeding::NODE_IDS, T, std::remove_reference_t<Ops>>(graph, precision, bits, centrality, ops);
}

template <typename T, typename Ops>
void dispatch_hyper_edge_ball(
    const CSRGraph<T>& graph,
    std::uint8_t precision,
    std::uint8_t bits,
    Array<Real> centrality,
    Ops&& ops
) {
    detail::dispatch<Seeding::EDGE_IDS, T, std::remove_reference_t<Ops>>(graph, precision, bits, centrality, ops);
}

} // namespace gtrav::kernel::hyper_edge_ball
