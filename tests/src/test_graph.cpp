// =============================================================================
// gtrav - Graph and Core Tests
// =============================================================================
//
// Coverage for gtrav/core/graph.hpp and gtrav/core/error.hpp
//
//   - CSR construction (directed, undirected, weighted, duplicates, self-loops)
//   - node validation and weight guards
//   - most central node
//   - exception hierarchy and error codes
//
// =============================================================================

#include "test.hpp"

#include "gtrav/core/graph.hpp"

#include <vector>

using namespace gtrav;
using namespace gtrav::test;

GTRAV_TEST_BEGIN

// =============================================================================
// Construction
// =============================================================================

GTRAV_TEST_SUITE(construction)

GTRAV_TEST_CASE(undirected_stores_both_directions) {
    auto g = Graph::from_edges(3, {{0, 1}, {1, 2}}, false);
    GTRAV_ASSERT_EQ(g.get_number_of_nodes(), 3u);
    GTRAV_ASSERT_EQ(g.get_number_of_directed_edges(), EdgeId(4));
    GTRAV_ASSERT_FALSE(g.is_directed());
    GTRAV_ASSERT_FALSE(g.has_edge_weights());

    auto n1 = g.neighbors_unchecked(1);
    std::vector<NodeId> got(n1.begin(), n1.end());
    GTRAV_ASSERT_EQ(got, (std::vector<NodeId>{0, 2}));
}

GTRAV_TEST_CASE(directed_keeps_orientation) {
    auto g = Graph::from_edges(3, {{0, 1}, {1, 2}}, true);
    GTRAV_ASSERT_EQ(g.get_number_of_directed_edges(), EdgeId(2));
    GTRAV_ASSERT_EQ(g.degree_unchecked(0), 1u);
    GTRAV_ASSERT_EQ(g.degree_unchecked(2), 0u);
    // Node 2 has an incoming edge, so it is not disconnected
    GTRAV_ASSERT_FALSE(g.is_disconnected_node_unchecked(2));
}

GTRAV_TEST_CASE(neighbors_sorted_and_deduplicated) {
    auto g = Graph::from_weighted_edges(4, {{0, 3, 1.0f}, {0, 1, 2.0f}, {0, 3, 9.0f}, {0, 2, 3.0f}}, true);
    auto n0 = g.neighbors_unchecked(0);
    GTRAV_ASSERT_EQ(std::vector<NodeId>(n0.begin(), n0.end()), (std::vector<NodeId>{1, 2, 3}));
    auto w0 = g.weights_unchecked(0);
    // First weight of a duplicate edge wins
    GTRAV_ASSERT_NEAR(w0[2], 1.0, 1e-6);
}

GTRAV_TEST_CASE(undirected_pair_shares_one_weight) {
    // Both orientations of the pair are listed with different weights
    auto g = Graph::from_weighted_edges(3, {{0, 1, 0.5f}, {1, 0, 0.9f}, {2, 1, 3.0f}}, false);
    GTRAV_ASSERT_EQ(g.get_number_of_directed_edges(), EdgeId(4));
    GTRAV_ASSERT_NEAR(g.weights_unchecked(0)[0], 0.5, 1e-6);
    GTRAV_ASSERT_NEAR(g.weights_unchecked(1)[0], 0.5, 1e-6);
    GTRAV_ASSERT_NEAR(g.weights_unchecked(1)[1], 3.0, 1e-6);
    GTRAV_ASSERT_NEAR(g.weights_unchecked(2)[0], 3.0, 1e-6);
}

GTRAV_TEST_CASE(edge_ranges_align_with_neighbors) {
    auto g = fixture::star(4);
    EdgeId expected_begin = 0;
    for (NodeId u = 0; u < 4; ++u) {
        auto [begin, end] = g.edge_range_unchecked(u);
        GTRAV_ASSERT_EQ(begin, expected_begin);
        GTRAV_ASSERT_EQ(end - begin, EdgeId(g.degree_unchecked(u)));
        expected_begin = end;
    }
    GTRAV_ASSERT_EQ(expected_begin, g.get_number_of_directed_edges());
}

GTRAV_TEST_CASE(self_loop_stored_once) {
    auto g = Graph::from_edges(2, {{0, 0}, {0, 1}}, false);
    GTRAV_ASSERT_EQ(g.degree_unchecked(0), 2u);
    GTRAV_ASSERT_EQ(g.degree_unchecked(1), 1u);
}

GTRAV_TEST_CASE(isolated_nodes) {
    auto g = fixture::disconnected();
    GTRAV_ASSERT_TRUE(g.is_disconnected_node_unchecked(7));
    GTRAV_ASSERT_FALSE(g.is_disconnected_node_unchecked(0));
}

GTRAV_TEST_CASE(edge_out_of_range_rejected) {
    GTRAV_ASSERT_THROWS(Graph::from_edges(2, {{0, 2}}, false), IndexOutOfBoundsError);
}

GTRAV_TEST_SUITE_END

// =============================================================================
// Validation
// =============================================================================

GTRAV_TEST_SUITE(validation)

GTRAV_TEST_CASE(node_id_bounds) {
    auto g = fixture::path(3);
    GTRAV_ASSERT_EQ(g.validate_node_id(2), 2u);
    GTRAV_ASSERT_THROWS(g.validate_node_id(3), IndexOutOfBoundsError);
    GTRAV_ASSERT_THROWS(g.validate_node_ids({0, 1, 5}), IndexOutOfBoundsError);
}

GTRAV_TEST_CASE(weight_guards) {
    auto unweighted = fixture::path(3);
    GTRAV_ASSERT_THROWS(unweighted.must_have_edge_weights(), MissingDataError);
    GTRAV_ASSERT_THROWS(unweighted.must_have_positive_edge_weights(), MissingDataError);

    auto negative = Graph::from_weighted_edges(2, {{0, 1, -1.0f}}, false);
    GTRAV_ASSERT_THROWS(negative.must_have_positive_edge_weights(), DomainError);

    auto large = Graph::from_weighted_edges(2, {{0, 1, 2.0f}}, false);
    GTRAV_ASSERT_NO_THROW(large.must_have_positive_edge_weights());
    GTRAV_ASSERT_THROWS(large.must_have_edge_weights_representing_probabilities(), DomainError);

    auto probabilities = Graph::from_weighted_edges(2, {{0, 1, 1.0f}}, false);
    GTRAV_ASSERT_NO_THROW(probabilities.must_have_edge_weights_representing_probabilities());
}

GTRAV_TEST_CASE(most_central_node) {
    GTRAV_ASSERT_EQ(fixture::star(5).get_most_central_node_id(), 0u);
    // Ties go to the lowest id
    GTRAV_ASSERT_EQ(fixture::path(5).get_most_central_node_id(), 1u);
    GTRAV_ASSERT_THROWS(Graph::from_edges(0, {}, false).get_most_central_node_id(), ValueError);
}

GTRAV_TEST_SUITE_END

// =============================================================================
// Errors
// =============================================================================

GTRAV_TEST_SUITE(errors)

GTRAV_TEST_CASE(error_codes) {
    GTRAV_ASSERT_TRUE(UnreachableNodeError(0, 1).code() == ErrorCode::UNREACHABLE_NODE);
    GTRAV_ASSERT_TRUE(SelfLoopError(3).code() == ErrorCode::SELF_LOOP);
    GTRAV_ASSERT_TRUE(MissingDataError("x").code() == ErrorCode::MISSING_DATA);
    GTRAV_ASSERT_TRUE(ConfigurationError("x").code() == ErrorCode::CONFIGURATION_ERROR);
    GTRAV_ASSERT_TRUE(FeatureUnavailableError("x").code() == ErrorCode::FEATURE_UNAVAILABLE);
}

GTRAV_TEST_CASE(hierarchy) {
    // Path errors are argument errors, and every error is a gtrav::Exception
    GTRAV_ASSERT_THROWS(throw UnreachableNodeError(0, 1), ValueError);
    GTRAV_ASSERT_THROWS(throw SelfLoopError(0), ValueError);
    GTRAV_ASSERT_THROWS(throw DomainError("x"), Exception);
    GTRAV_ASSERT_THROWS(GTRAV_CHECK_ARG(false, "bad"), ValueError);
    GTRAV_ASSERT_THROWS(GTRAV_CHECK_DATA(false, "missing"), MissingDataError);
}

GTRAV_TEST_SUITE_END

GTRAV_TEST_END

GTRAV_TEST_MAIN()
