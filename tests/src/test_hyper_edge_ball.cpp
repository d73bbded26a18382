// =============================================================================
// gtrav - Hyper-Edge-Ball Tests
// =============================================================================
//
// Tests for gtrav/kernel/hyper_edge_ball.hpp
//
// Functions tested:
//   - hyper_ball
//   - hyper_edge_ball
//   - dispatch_hyper_ball
//   - dispatch_hyper_edge_ball
//   - SharedRoundState::claim
//
// =============================================================================

#include "test.hpp"

#include "gtrav/kernel/hyper_edge_ball.hpp"
#include "gtrav/kernel/diameter.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <vector>

using namespace gtrav;
using namespace gtrav::test;
namespace heb = gtrav::kernel::hyper_edge_ball;

namespace {

// Records what the propagation reports through the operator.
// last_round is the last round in which some estimate grew.
struct Recorder {
    std::atomic<NodeId> last_round{0};
    std::atomic<Size> calls{0};
    std::atomic<Size> decreases{0};

    void operator()(Real& value, Real new_estimate, Real old_estimate, NodeId round) noexcept {
        if (new_estimate != old_estimate) {
            NodeId seen = last_round.load(std::memory_order_relaxed);
            while (round > seen && !last_round.compare_exchange_weak(seen, round, std::memory_order_relaxed)) {
            }
        }
        calls.fetch_add(1, std::memory_order_relaxed);
        if (new_estimate < old_estimate) {
            decreases.fetch_add(1, std::memory_order_relaxed);
        }
        value += new_estimate - old_estimate;
    }
};

template <std::uint8_t P, std::uint8_t B>
void run(const Graph& graph, std::vector<Real>& values, Recorder& recorder) {
    values.assign(graph.get_number_of_nodes(), Real(0));
    heb::hyper_edge_ball<P, B>(graph, Array<Real>(values.data(), values.size()), recorder);
}

template <std::uint8_t P, std::uint8_t B>
void run_nodes(const Graph& graph, std::vector<Real>& values, Recorder& recorder) {
    values.assign(graph.get_number_of_nodes(), Real(0));
    heb::hyper_ball<P, B>(graph, Array<Real>(values.data(), values.size()), recorder);
}

} // namespace

GTRAV_TEST_BEGIN

// =============================================================================
// Round Protocol
// =============================================================================

GTRAV_TEST_SUITE(rounds)

GTRAV_TEST_CASE(terminates_within_diameter_rounds) {
    std::vector<Graph> graphs;
    graphs.push_back(fixture::path(6));
    graphs.push_back(fixture::cycle(11));
    graphs.push_back(fixture::star(9));
    graphs.push_back(fixture::grid(6, 8));
    graphs.push_back(fixture::complete(6));
    for (const auto& g : graphs) {
        const Real diameter = gtrav::kernel::diameter::diameter_ifub(g);
        Recorder recorder;
        std::vector<Real> values;
        run<10, 6>(g, values, recorder);
        GTRAV_ASSERT_GT(recorder.calls.load(), Size(0));
        GTRAV_ASSERT_LE(static_cast<Real>(recorder.last_round.load()), diameter);
    }
}

GTRAV_TEST_CASE(estimates_never_decrease) {
    for (std::uint64_t seed = 1; seed <= 4; ++seed) {
        auto g = fixture::random_unweighted(80, 0.04, seed % 2 == 0, seed);
        Recorder recorder;
        std::vector<Real> values;
        run<12, 6>(g, values, recorder);
        GTRAV_ASSERT_EQ(recorder.decreases.load(), Size(0));
    }
}

GTRAV_TEST_CASE(telescoping_sum_reaches_final_estimate) {
    // The per-node sum of (new - old) is the estimate of the whole edge ball;
    // on a directed cycle every node ends up seeing all n edges
    auto g = fixture::cycle(12, true);
    Recorder recorder;
    std::vector<Real> values;
    run<12, 6>(g, values, recorder);
    for (NodeId node = 0; node < 12; ++node) {
        // Round 0 already holds the node's own edge
        GTRAV_ASSERT_NEAR(values[node] + 1.0, 12.0, 0.5);
    }
    GTRAV_ASSERT_EQ(recorder.last_round.load(), 11u);
}

GTRAV_TEST_CASE(isolated_nodes_never_reported) {
    auto g = Graph::from_edges(5, {{0, 1}}, false);
    Recorder recorder;
    std::vector<Real> values;
    run<8, 6>(g, values, recorder);
    for (NodeId node = 2; node < 5; ++node) {
        GTRAV_ASSERT_EQ(values[node], 0.0f);
    }
}

GTRAV_TEST_CASE(edgeless_and_empty_graphs) {
    // A single round finds nothing to merge, each node is still reported once
    Recorder edgeless;
    std::vector<Real> values;
    run<6, 6>(Graph::from_edges(4, {}, false), values, edgeless);
    GTRAV_ASSERT_EQ(edgeless.calls.load(), Size(4));
    GTRAV_ASSERT_EQ(edgeless.last_round.load(), 0u);

    Recorder empty;
    run<6, 6>(Graph::from_edges(0, {}, false), values, empty);
    GTRAV_ASSERT_EQ(empty.calls.load(), Size(0));
}

GTRAV_TEST_CASE(operator_runs_for_every_node_each_round) {
    // Rounds 1..11 grow the balls, round 12 confirms convergence
    auto g = fixture::cycle(12, true);
    Recorder recorder;
    std::vector<Real> values;
    run<12, 6>(g, values, recorder);
    GTRAV_ASSERT_EQ(recorder.last_round.load(), 11u);
    GTRAV_ASSERT_EQ(recorder.calls.load(), Size(12 * 12));

    Recorder star;
    run_nodes<12, 6>(fixture::star(7), values, star);
    GTRAV_ASSERT_EQ(star.last_round.load(), 2u);
    GTRAV_ASSERT_EQ(star.calls.load(), Size(7 * 3));
}

GTRAV_TEST_CASE(node_ball_counts_reachable_nodes) {
    auto g = fixture::cycle(12, true);
    Recorder recorder;
    std::vector<Real> values;
    run_nodes<12, 6>(g, values, recorder);
    for (NodeId node = 0; node < 12; ++node) {
        // Round 0 already holds the node itself
        GTRAV_ASSERT_NEAR(values[node] + 1.0, 12.0, 0.5);
    }
    GTRAV_ASSERT_EQ(recorder.last_round.load(), 11u);

    // Nodes 0-3 of the path component never see the triangle
    Recorder split;
    run_nodes<12, 6>(fixture::disconnected(), values, split);
    GTRAV_ASSERT_NEAR(values[0] + 1.0, 4.0, 0.2);
    GTRAV_ASSERT_NEAR(values[5] + 1.0, 3.0, 0.2);
    GTRAV_ASSERT_EQ(values[7], 0.0f);
}

GTRAV_TEST_CASE(node_and_edge_balls_differ) {
    // A leaf of a star sees 2 nodes but, through the centre, every edge
    auto g = fixture::star(6);
    Recorder nodes;
    Recorder edges;
    std::vector<Real> node_values;
    std::vector<Real> edge_values;
    run_nodes<12, 6>(g, node_values, nodes);
    run<12, 6>(g, edge_values, edges);
    GTRAV_ASSERT_NEAR(node_values[1] + 1.0, 6.0, 0.2);
    GTRAV_ASSERT_NEAR(edge_values[1] + 1.0, 10.0, 0.3);
}

GTRAV_TEST_CASE(work_stealing_covers_every_node) {
    // Larger than the thread count so every range is non-trivial
    auto g = fixture::grid(40, 40);
    Recorder recorder;
    std::vector<Real> values;
    run<8, 5>(g, values, recorder);
    for (NodeId node = 0; node < 1600; ++node) {
        GTRAV_ASSERT_GT(values[node], 0.0f);
    }
    GTRAV_ASSERT_LE(recorder.last_round.load(), 78u);
}

GTRAV_TEST_CASE(claim_visits_each_node_once) {
    heb::detail::SharedRoundState state(3, 10);
    std::vector<int> seen(10, 0);
    // Rank 1 drains its own range first, then steals from the others
    while (const auto node = state.claim(1)) {
        ++seen[*node];
    }
    for (int count : seen) {
        GTRAV_ASSERT_EQ(count, 1);
    }
    state.reset_cursors();
    const auto first = state.claim(2);
    GTRAV_ASSERT_TRUE(first.has_value());
    GTRAV_ASSERT_EQ(*first, 6u);
    GTRAV_ASSERT_EQ(state.range_end(2), std::uint64_t(10));
}

GTRAV_TEST_SUITE_END

// =============================================================================
// Runtime Dispatch
// =============================================================================

GTRAV_TEST_SUITE(dispatch)

GTRAV_TEST_CASE(every_supported_combination) {
    auto g = fixture::path(5);
    std::vector<Real> values(5);
    for (std::uint8_t precision = 4; precision <= 16; ++precision) {
        for (std::uint8_t bits = 5; bits <= 6; ++bits) {
            std::atomic<Size> calls{0};
            std::fill(values.begin(), values.end(), Real(0));
            heb::dispatch_hyper_edge_ball(g, precision, bits, Array<Real>(values.data(), 5),
                [&calls](Real&, Real, Real, NodeId) noexcept { calls.fetch_add(1); });
            GTRAV_ASSERT_GT(calls.load(), Size(0));
        }
    }
}

GTRAV_TEST_CASE(node_ball_combinations) {
    auto g = fixture::cycle(6, true);
    std::vector<Real> values(6);
    for (std::uint8_t precision = 4; precision <= 16; precision += 4) {
        for (std::uint8_t bits = 5; bits <= 6; ++bits) {
            std::fill(values.begin(), values.end(), Real(0));
            heb::dispatch_hyper_ball(g, precision, bits, Array<Real>(values.data(), 6),
                [](Real& value, Real new_estimate, Real old_estimate, NodeId) noexcept {
                    value += new_estimate - old_estimate;
                });
            GTRAV_ASSERT_GT(values[0], 0.0f);
        }
    }
    auto noop = [](Real&, Real, Real, NodeId) noexcept {};
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_ball(g, 3, 6, Array<Real>(values.data(), 6), noop),
                        ConfigurationError);
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_ball(g, 8, 6, Array<Real>(values.data(), 5), noop),
                        DimensionError);
}

GTRAV_TEST_CASE(unsupported_parameters) {
    auto g = fixture::path(3);
    std::vector<Real> values(3);
    auto noop = [](Real&, Real, Real, NodeId) noexcept {};
    Array<Real> out(values.data(), 3);
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_edge_ball(g, 3, 6, out, noop), ConfigurationError);
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_edge_ball(g, 17, 6, out, noop), ConfigurationError);
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_edge_ball(g, 8, 4, out, noop), ConfigurationError);
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_edge_ball(g, 8, 7, out, noop), ConfigurationError);
}

GTRAV_TEST_CASE(output_buffer_too_small) {
    auto g = fixture::path(4);
    std::vector<Real> values(2);
    auto noop = [](Real&, Real, Real, NodeId) noexcept {};
    GTRAV_ASSERT_THROWS(heb::dispatch_hyper_edge_ball(g, 6, 6, Array<Real>(values.data(), 2), noop),
                        DimensionError);
}

GTRAV_TEST_SUITE_END

GTRAV_TEST_END

GTRAV_TEST_MAIN()
