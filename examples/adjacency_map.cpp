/**
 * Adjacency Map Example
 *
 * Demonstrates the map view by storing a small directed graph:
 * - Building a map from vertex to out-neighbour set
 * - Updating bindings functionally (old versions stay valid)
 * - Folding over bindings
 */

#include <inctrie/map.hpp>
#include <inctrie/set.hpp>
#include <iostream>
#include <utility>
#include <vector>

using namespace inctrie;

using Vertex = int;
using Graph = Map<Vertex, std::vector<Vertex>>;

static Graph add_edge(const Graph& g, Vertex from, Vertex to) {
    std::vector<Vertex> successors = map::find(g, from).value_or(std::vector<Vertex>{});
    successors.push_back(to);
    return map::update(g, from, std::move(successors));
}

int main() {
    std::cout << "=== Adjacency Map Example ===\n\n";

    Graph g = map::empty<Vertex, std::vector<Vertex>>();
    std::vector<std::pair<Vertex, Vertex>> edges{{1, 2}, {2, 3}, {3, 1}, {1, 3}, {4, 1}};
    for (const auto& [from, to] : edges) {
        g = add_edge(g, from, to);
        std::cout << "  Added edge " << from << " -> " << to << "\n";
    }
    std::cout << "\n";

    Graph snapshot = g;
    g = add_edge(g, 2, 4);

    for (Vertex v : {1, 2, 3, 4, 5}) {
        auto successors = map::find(g, v);
        std::cout << "Vertex " << v << ":";
        if (!successors) {
            std::cout << " (no outgoing edges)\n";
            continue;
        }
        for (Vertex w : *successors) std::cout << " " << w;
        std::cout << "\n";
    }
    std::cout << "\n";

    std::size_t before = map::find(snapshot, 2).value_or(std::vector<Vertex>{}).size();
    std::size_t after = map::find(g, 2).value_or(std::vector<Vertex>{}).size();
    std::cout << "Out-degree of 2 in snapshot: " << before << ", now: " << after << "\n";

    std::size_t edge_count = map::fold(g, std::size_t{0},
        [](Vertex, const std::vector<Vertex>& succ, std::size_t n) { return n + succ.size(); });
    std::cout << "Total edges: " << edge_count << "\n";

    Set<Vertex> sources = map::fold(g, set::empty<Vertex>(),
        [](Vertex v, const std::vector<Vertex>&, Set<Vertex> acc) { return set::add(acc, v); });
    std::cout << "Vertices with outgoing edges: " << element_count(sources) << "\n";

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
