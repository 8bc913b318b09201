#include "wm_graph.hpp"
#include "errors.hpp"
#include <string>

namespace wm_graph {

Graph encode(const std::vector<int>& zeta6) {
    size_t mu = zeta6.size();
    if (mu == 0)
        throw ConfigError("zeta6 must be non-empty");

    Graph g;
    g.nodes.resize(mu);
    for (size_t r = 0; r < mu; ++r)
        g.nodes[r].next = (r + 1) % mu;

    for (size_t r = 0; r < mu; ++r) {
        int d = zeta6[r];
        if (d < 0 || d > 5)
            throw ConfigError("base-6 digit " + std::to_string(d) + " out of range");
        if (d != 0)
            g.nodes[r].digit = (r + static_cast<size_t>(d) - 1) % mu;
    }
    g.head = 0;
    return g;
}

static size_t follow_next(const Graph& g, size_t from) {
    const auto& next = g.nodes[from].next;
    if (!next || *next >= g.nodes.size())
        throw StructureError("invalid structure (broken ring)");
    return *next;
}

std::vector<int> decode(const Graph& graph, size_t mu) {
    if (mu == 0)
        throw ConfigError("mu must be > 0");
    if (graph.head >= graph.nodes.size())
        throw StructureError("invalid structure (broken ring)");

    // Materialize the ring in order from the head.
    std::vector<size_t> ring;
    ring.reserve(mu);
    ring.push_back(graph.head);
    for (size_t i = 1; i < mu; ++i)
        ring.push_back(follow_next(graph, ring.back()));

    std::vector<int> zeta6(mu, 0);
    for (size_t r = 0; r < mu; ++r) {
        const auto& target = graph.nodes[ring[r]].digit;
        if (!target)
            continue;

        // Steps along `next` from node r to its digit target; s == 0 means
        // the node points at itself, i.e. digit 1.
        size_t probe = ring[r];
        size_t s = 0;
        while (probe != *target) {
            probe = follow_next(graph, probe);
            ++s;
            if (s > mu)
                throw StructureError("invalid structure (unreachable digit)");
        }
        zeta6[r] = static_cast<int>(s + 1);
    }
    return zeta6;
}

bool round_trips(const std::vector<int>& zeta6) {
    for (int d : zeta6) {
        if (d > 0 && static_cast<size_t>(d) > zeta6.size())
            return false;
    }
    return !zeta6.empty();
}

} // namespace wm_graph
