#pragma once

#include "gtrav/core/type.hpp"
#include "gtrav/core/error.hpp"
#include "gtrav/core/graph.hpp"

#include <algorithm>
#include <deque>
#include <vector>

// =============================================================================
// FILE: gtrav/kernel/k_shortest_paths.hpp
// BRIEF: Up to k simple unweighted paths between two nodes, shortest first
//
// Paths are extended breadth-first. A node is expanded at most k times and the
// search ends as soon as the destination has been reached k times.
// =============================================================================

namespace gtrav::kernel::k_shortest_paths {

template <typename T>
std::vector<std::vector<NodeId>> k_shortest_paths_unchecked(
    const CSRGraph<T>& graph,
    NodeId src,
    NodeId dst,
    NodeId k
) {
    std::vector<NodeId> counts(graph.get_number_of_nodes(), 0);
    std::deque<std::vector<NodeId>> queue;
    std::vector<std::vector<NodeId>> paths;

    queue.push_back({src});
    while (!queue.empty() && counts[dst] < k) {
        std::vector<NodeId> path = std::move(queue.front());
        queue.pop_front();

        const NodeId u = path.back();
        ++counts[u];
        if (u == dst) {
            paths.push_back(std::move(path));
            continue;
        }
        if (counts[u] > k) {
            continue;
        }
        for (NodeId v : graph.neighbors_unchecked(u)) {
            if (std::find(path.begin(), path.end(), v) != path.end()) {
                continue;
            }
            std::vector<NodeId> extended;
            extended.reserve(path.size() + 1);
            extended.assign(path.begin(), path.end());
            extended.push_back(v);
            queue.push_back(std::move(extended));
        }
    }
    return paths;
}

template <typename T>
std::vector<std::vector<NodeId>> k_shortest_paths(
    const CSRGraph<T>& graph,
    NodeId src,
    NodeId dst,
    NodeId k
) {
    graph.validate_node_id(src);
    graph.validate_node_id(dst);
    GTRAV_CHECK_ARG(k > 0, "k_shortest_paths: the number of requested paths must be positive.");
    if (GTRAV_UNLIKELY(src == dst)) {
        throw SelfLoopError(src);
    }
    return k_shortest_paths_unchecked(graph, src, dst, k);
}

} // namespace gtrav::kernel::k_shortest_paths
