// =============================================================================
// gtrav - Shortest Path Result Tests
// =============================================================================
//
// Tests for gtrav/kernel/shortest_paths.hpp
//
// Functions tested:
//   ShortestPathsResultBFS
//     - get_kth_point_on_shortest_path
//     - get_median_point / get_median_point_to_most_distant_node
//     - get_number_of_shortest_paths / get_number_of_shortest_paths_from_node_id
//     - get_successors_from_node_id / get_predecessors_from_node_id
//     - get_shared_ancestors_size / get_ancestors_jaccard_index
//   ShortestPathsDijkstra
//     - has_path_to_node_id / get_parent_from_node_id
//     - get_point_at_given_distance_on_shortest_path
//     - get_median_point
//     - get_number_of_shortest_paths
//     - equality and hashing
//
// =============================================================================

#include "test.hpp"

#include "gtrav/kernel/bfs.hpp"
#include "gtrav/kernel/shortest_paths.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <unordered_set>
#include <vector>

using namespace gtrav;
using namespace gtrav::test;
using gtrav::kernel::shortest_paths::ShortestPathsDijkstra;
using gtrav::kernel::shortest_paths::ShortestPathsResultBFS;
namespace bfs = gtrav::kernel::bfs;

// 0 is the root, 1 and 2 its children, 3 and 4 the children of 1
static ShortestPathsResultBFS small_tree() {
    return ShortestPathsResultBFS(std::vector<NodeId>{0, 1, 1, 2, 2},
                                  std::vector<NodeId>{0, 0, 0, 1, 1}, 2, 3);
}

// Path 0 - 1 - 2 - 3 with weights 1, 2, 3
static ShortestPathsDijkstra weighted_path() {
    return ShortestPathsDijkstra({0.0f, 1.0f, 3.0f, 6.0f},
                                 std::vector<NodeId>{NOT_PRESENT, 0, 1, 2},
                                 std::nullopt, 6.0f, 3, 10.0f, std::log(10.0f), 1.0f + 0.5f + 1.0f / 3.0f,
                                 false);
}

// Path 0 -> 1 -> 2 -> 3 with every edge probability 0.5
static ShortestPathsDijkstra probability_path() {
    return ShortestPathsDijkstra({1.0f, 0.5f, 0.25f, 0.125f},
                                 std::vector<NodeId>{NOT_PRESENT, 0, 1, 2},
                                 std::nullopt, 0.125f, 3, 0.0f, 0.0f, 0.0f, true);
}

GTRAV_TEST_BEGIN

// =============================================================================
// BFS Result: Walking Predecessors
// =============================================================================

GTRAV_TEST_SUITE(bfs_walk)

GTRAV_TEST_CASE(kth_point) {
    auto result = bfs::bfs(fixture::path(5), {0});
    GTRAV_ASSERT_EQ(result.get_kth_point_on_shortest_path(4, 0), 4u);
    GTRAV_ASSERT_EQ(result.get_kth_point_on_shortest_path(4, 1), 3u);
    GTRAV_ASSERT_EQ(result.get_kth_point_on_shortest_path(4, 4), 0u);
    // Walking past the root stays on the root
    GTRAV_ASSERT_EQ(result.get_kth_point_on_shortest_path(2, 4), 0u);
    GTRAV_ASSERT_THROWS(result.get_kth_point_on_shortest_path(4, 5), ValueError);
}

GTRAV_TEST_CASE(kth_point_unreachable) {
    auto result = bfs::bfs(fixture::disconnected(), {0});
    GTRAV_ASSERT_THROWS(result.get_kth_point_on_shortest_path(5, 1), UnreachableNodeError);
    GTRAV_ASSERT_THROWS(result.get_median_point(7), UnreachableNodeError);
}

GTRAV_TEST_CASE(median_point) {
    auto result = bfs::bfs(fixture::path(5), {0});
    GTRAV_ASSERT_EQ(result.get_median_point(4), 2u);
    GTRAV_ASSERT_EQ(result.get_median_point_to_most_distant_node(), 2u);
    // Odd distances walk back distance / 2 steps from the destination
    GTRAV_ASSERT_EQ(result.get_median_point(3), 2u);
    GTRAV_ASSERT_EQ(result.get_median_point(3), result.get_kth_point_on_shortest_path(3, 3 / 2));
    GTRAV_ASSERT_EQ(result.get_median_point(1), 1u);
    GTRAV_ASSERT_EQ(result.get_median_point(0), 0u);
}

GTRAV_TEST_CASE(median_point_without_distances) {
    auto result = bfs::bfs_predecessors(fixture::path(5), {0});
    GTRAV_ASSERT_EQ(result.get_median_point(4), 2u);
    GTRAV_ASSERT_EQ(result.get_median_point(3), 2u);
}

GTRAV_TEST_CASE(predecessor_chain) {
    auto result = bfs::bfs(fixture::path(5), {0});
    GTRAV_ASSERT_EQ(result.get_predecessors_from_node_id(4), (std::vector<NodeId>{4, 3, 2, 1, 0}));
    GTRAV_ASSERT_EQ(result.get_predecessors_from_node_id(0), (std::vector<NodeId>{0}));

    auto disconnected = bfs::bfs(fixture::disconnected(), {0});
    GTRAV_ASSERT_EQ(disconnected.get_predecessors_from_node_id(6), (std::vector<NodeId>{6}));
}

GTRAV_TEST_SUITE_END

// =============================================================================
// BFS Result: Counting and Ancestors
// =============================================================================

GTRAV_TEST_SUITE(bfs_counts)

GTRAV_TEST_CASE(number_of_shortest_paths) {
    auto star = bfs::bfs(fixture::star(6), {0});
    GTRAV_ASSERT_EQ(star.get_number_of_shortest_paths(), 5u);

    auto disconnected = bfs::bfs(fixture::disconnected(), {0});
    GTRAV_ASSERT_EQ(disconnected.get_number_of_shortest_paths(), 3u);

    auto multi = bfs::bfs(fixture::path(5), {0, 4});
    GTRAV_ASSERT_EQ(multi.get_number_of_shortest_paths(), 3u);
}

GTRAV_TEST_CASE(successors) {
    auto result = small_tree();
    GTRAV_ASSERT_EQ(result.get_successors_from_node_id(1), (std::vector<NodeId>{1, 3, 4}));
    GTRAV_ASSERT_EQ(result.get_successors_from_node_id(0), (std::vector<NodeId>{0, 1, 2, 3, 4}));
    GTRAV_ASSERT_EQ(result.get_successors_from_node_id(4), (std::vector<NodeId>{4}));
    GTRAV_ASSERT_EQ(result.get_number_of_shortest_paths_from_node_id(1), 3u);
    GTRAV_ASSERT_EQ(result.get_number_of_shortest_paths_from_node_id(0), 5u);
}

GTRAV_TEST_CASE(shared_ancestors) {
    auto result = small_tree();
    // [3, 1, 0] and [4, 1, 0]
    GTRAV_ASSERT_EQ(result.get_shared_ancestors_size(3, 4), 2u);
    GTRAV_ASSERT_NEAR(result.get_ancestors_jaccard_index(3, 4), 0.5, 1e-6);
    // [3, 1, 0] and [2, 0]
    GTRAV_ASSERT_EQ(result.get_shared_ancestors_size(3, 2), 1u);
    GTRAV_ASSERT_NEAR(result.get_ancestors_jaccard_index(3, 2), 0.25, 1e-6);
    GTRAV_ASSERT_NEAR(result.get_ancestors_jaccard_index(3, 3), 1.0, 1e-6);
}

GTRAV_TEST_CASE(missing_data) {
    auto distances_only = bfs::bfs_distances(fixture::path(4), {0});
    GTRAV_ASSERT_THROWS(distances_only.get_parent_from_node_id(1), MissingDataError);
    GTRAV_ASSERT_THROWS(distances_only.get_successors_from_node_id(1), MissingDataError);
    GTRAV_ASSERT_THROWS(distances_only.get_number_of_shortest_paths(), MissingDataError);

    auto predecessors_only = bfs::bfs_predecessors(fixture::path(4), {0});
    GTRAV_ASSERT_THROWS(predecessors_only.get_distance_from_node_id(1), MissingDataError);
    GTRAV_ASSERT_TRUE(predecessors_only.has_path_to_node_id(3));
}

GTRAV_TEST_CASE(node_bounds) {
    auto result = small_tree();
    GTRAV_ASSERT_EQ(result.get_number_of_nodes(), 5u);
    GTRAV_ASSERT_THROWS(result.get_distance_from_node_id(5), IndexOutOfBoundsError);
    GTRAV_ASSERT_THROWS(result.get_predecessors_from_node_id(9), IndexOutOfBoundsError);
}

GTRAV_TEST_SUITE_END

// =============================================================================
// Dijkstra Result
// =============================================================================

GTRAV_TEST_SUITE(dijkstra_result)

GTRAV_TEST_CASE(reachability) {
    ShortestPathsDijkstra plain({0.0f, 2.0f, REAL_INFINITY}, std::nullopt, std::nullopt,
                                2.0f, 1, 2.0f, std::log(2.0f), 0.5f, false);
    GTRAV_ASSERT_TRUE(plain.has_path_to_node_id(1));
    GTRAV_ASSERT_FALSE(plain.has_path_to_node_id(2));
    GTRAV_ASSERT_FALSE(plain.has_predecessors());
    GTRAV_ASSERT_THROWS(plain.get_parent_from_node_id(1), MissingDataError);
    GTRAV_ASSERT_THROWS(plain.has_path_to_node_id(3), IndexOutOfBoundsError);

    ShortestPathsDijkstra probabilities({1.0f, 0.5f, 0.0f}, std::nullopt, std::nullopt,
                                        0.5f, 1, 0.0f, 0.0f, 0.0f, true);
    GTRAV_ASSERT_TRUE(probabilities.has_path_to_node_id(1));
    GTRAV_ASSERT_FALSE(probabilities.has_path_to_node_id(2));
}

GTRAV_TEST_CASE(parents) {
    auto result = weighted_path();
    GTRAV_ASSERT_FALSE(result.get_parent_from_node_id(0).has_value());
    const auto parent = result.get_parent_from_node_id(3);
    GTRAV_ASSERT_TRUE(parent.has_value());
    GTRAV_ASSERT_EQ(*parent, 2u);
    GTRAV_ASSERT_EQ(result.get_number_of_shortest_paths(), 3u);
}

GTRAV_TEST_CASE(point_at_distance) {
    auto result = weighted_path();
    GTRAV_ASSERT_EQ(result.get_point_at_given_distance_on_shortest_path(3, 3.0f), 2u);
    GTRAV_ASSERT_EQ(result.get_point_at_given_distance_on_shortest_path(3, 3.5f), 3u);
    GTRAV_ASSERT_EQ(result.get_point_at_given_distance_on_shortest_path(3, 0.0f), 0u);
    GTRAV_ASSERT_THROWS(result.get_point_at_given_distance_on_shortest_path(3, 7.0f), ValueError);
    GTRAV_ASSERT_EQ(result.get_median_point(3), 2u);
    GTRAV_ASSERT_EQ(result.get_median_point_to_most_distant_node(), 2u);
}

GTRAV_TEST_CASE(point_at_probability) {
    auto result = probability_path();
    // sqrt(0.125) lies between 0.25 and 0.5
    GTRAV_ASSERT_EQ(result.get_median_point(3), 2u);
    GTRAV_ASSERT_EQ(result.get_point_at_given_distance_on_shortest_path(3, 0.5f), 1u);
    GTRAV_ASSERT_THROWS(result.get_point_at_given_distance_on_shortest_path(3, 0.1f), ValueError);
}

GTRAV_TEST_CASE(point_on_unreachable_node) {
    ShortestPathsDijkstra result({0.0f, REAL_INFINITY}, std::vector<NodeId>{NOT_PRESENT, NOT_PRESENT},
                                 std::nullopt, 0.0f, 0, 0.0f, 0.0f, 0.0f, false);
    GTRAV_ASSERT_THROWS(result.get_point_at_given_distance_on_shortest_path(1, 0.0f), UnreachableNodeError);
}

GTRAV_TEST_CASE(equality_and_hash) {
    auto a = weighted_path();
    auto b = weighted_path();
    GTRAV_ASSERT_TRUE(a == b);
    GTRAV_ASSERT_EQ(a.hash(), b.hash());
    GTRAV_ASSERT_FALSE(a == probability_path());

    std::unordered_set<ShortestPathsDijkstra> seen;
    seen.insert(a);
    seen.insert(b);
    seen.insert(probability_path());
    GTRAV_ASSERT_EQ(seen.size(), Size(2));
}

GTRAV_TEST_CASE(nan_distances_compare_equal) {
    const Real nan = std::numeric_limits<Real>::quiet_NaN();
    ShortestPathsDijkstra a({0.0f, nan}, std::nullopt, std::nullopt, 0.0f, 0, 0.0f, 0.0f, 0.0f, false);
    ShortestPathsDijkstra b({0.0f, nan}, std::nullopt, std::nullopt, 0.0f, 0, 0.0f, 0.0f, 0.0f, false);
    GTRAV_ASSERT_TRUE(a == b);
}

GTRAV_TEST_SUITE_END

GTRAV_TEST_END

GTRAV_TEST_MAIN()
