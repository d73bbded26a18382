// =============================================================================
// gtrav - K-Shortest-Paths Tests
// =============================================================================
//
// Tests for gtrav/kernel/k_shortest_paths.hpp
//
// Functions tested:
//   - k_shortest_paths
//   - k_shortest_paths_unchecked
//
// =============================================================================

#include "test.hpp"

#include "gtrav/kernel/k_shortest_paths.hpp"
#include "gtrav/kernel/bfs.hpp"

#include <algorithm>
#include <set>
#include <vector>

using namespace gtrav;
using namespace gtrav::test;
using gtrav::kernel::k_shortest_paths::k_shortest_paths;

namespace {

void check_is_path(const Graph& graph, const std::vector<NodeId>& path, NodeId src, NodeId dst) {
    GTRAV_ASSERT_EQ(path.front(), src);
    GTRAV_ASSERT_EQ(path.back(), dst);
    for (Size i = 0; i + 1 < path.size(); ++i) {
        auto neighbors = graph.neighbors_unchecked(path[i]);
        GTRAV_ASSERT_TRUE(std::find(neighbors.begin(), neighbors.end(), path[i + 1]) != neighbors.end());
    }
    // Simple paths only
    std::set<NodeId> unique(path.begin(), path.end());
    GTRAV_ASSERT_EQ(unique.size(), path.size());
}

} // namespace

GTRAV_TEST_BEGIN

// =============================================================================
// Enumeration
// =============================================================================

GTRAV_TEST_SUITE(enumeration)

GTRAV_TEST_CASE(star_has_single_path) {
    auto g = fixture::star(4);
    auto paths = k_shortest_paths(g, 1, 2, 5);
    GTRAV_ASSERT_EQ(paths.size(), Size(1));
    GTRAV_ASSERT_EQ(paths[0], (std::vector<NodeId>{1, 0, 2}));
}

GTRAV_TEST_CASE(cycle_has_two_paths) {
    auto g = fixture::cycle(6);
    auto one = k_shortest_paths(g, 0, 3, 1);
    GTRAV_ASSERT_EQ(one.size(), Size(1));
    GTRAV_ASSERT_EQ(one[0].size(), Size(4));

    auto all = k_shortest_paths(g, 0, 3, 5);
    GTRAV_ASSERT_EQ(all.size(), Size(2));
    std::set<std::vector<NodeId>> found(all.begin(), all.end());
    GTRAV_ASSERT_TRUE(found.count({0, 1, 2, 3}) == 1);
    GTRAV_ASSERT_TRUE(found.count({0, 5, 4, 3}) == 1);
}

GTRAV_TEST_CASE(grid_paths_in_hop_order) {
    // Six monotone routes of four hops join the corners of a 3 x 3 grid
    auto g = fixture::grid(3, 3);
    auto paths = k_shortest_paths(g, 0, 8, 3);
    GTRAV_ASSERT_EQ(paths.size(), Size(3));
    std::set<std::vector<NodeId>> distinct(paths.begin(), paths.end());
    GTRAV_ASSERT_EQ(distinct.size(), Size(3));
    for (const auto& path : paths) {
        check_is_path(g, path, 0, 8);
        GTRAV_ASSERT_EQ(path.size(), Size(5));
    }
}

GTRAV_TEST_CASE(at_most_k_and_nondecreasing_length) {
    for (std::uint64_t seed = 1; seed <= 5; ++seed) {
        auto g = fixture::random_unweighted(30, 0.15, seed % 2 == 0, seed);
        for (NodeId k : {NodeId(1), NodeId(4), NodeId(10)}) {
            auto paths = k_shortest_paths(g, 0, 29, k);
            GTRAV_ASSERT_LE(paths.size(), Size(k));
            for (Size i = 0; i < paths.size(); ++i) {
                check_is_path(g, paths[i], 0, 29);
                if (i > 0) GTRAV_ASSERT_LE(paths[i - 1].size(), paths[i].size());
            }
            if (!paths.empty()) {
                // The first path found has the BFS hop count
                auto shortest = gtrav::kernel::bfs::shortest_path_node_ids(g, 0, 29);
                GTRAV_ASSERT_EQ(paths[0].size(), shortest.size());
            }
        }
    }
}

GTRAV_TEST_CASE(deterministic) {
    auto g = fixture::random_unweighted(25, 0.2, false, 8);
    auto first = k_shortest_paths(g, 2, 20, 6);
    auto second = k_shortest_paths(g, 2, 20, 6);
    GTRAV_ASSERT_EQ(first, second);
}

GTRAV_TEST_CASE(unreachable_destination) {
    auto g = fixture::disconnected();
    GTRAV_ASSERT_TRUE(k_shortest_paths(g, 0, 5, 3).empty());

    auto directed = fixture::path(4, true);
    GTRAV_ASSERT_TRUE(k_shortest_paths(directed, 3, 0, 3).empty());
    GTRAV_ASSERT_EQ(k_shortest_paths(directed, 0, 3, 3).size(), Size(1));
}

GTRAV_TEST_SUITE_END

// =============================================================================
// Validation
// =============================================================================

GTRAV_TEST_SUITE(validation)

GTRAV_TEST_CASE(rejects_invalid_arguments) {
    auto g = fixture::path(4);
    GTRAV_ASSERT_THROWS(k_shortest_paths(g, 0, 3, 0), ValueError);
    GTRAV_ASSERT_THROWS(k_shortest_paths(g, 2, 2, 3), SelfLoopError);
    GTRAV_ASSERT_THROWS(k_shortest_paths(g, 0, 4, 3), IndexOutOfBoundsError);
    GTRAV_ASSERT_THROWS(k_shortest_paths(g, 7, 1, 3), IndexOutOfBoundsError);
}

GTRAV_TEST_SUITE_END

GTRAV_TEST_END

GTRAV_TEST_MAIN()
