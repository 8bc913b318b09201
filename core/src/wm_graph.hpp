#pragma once
#include <cstddef>
#include <optional>
#include <vector>

// Base-6 watermark graph.
//
// mu nodes form one cycle through `next`. Node r optionally carries a `digit`
// relation to node (r + d - 1) mod mu, where d in [1,5] is its base-6 digit;
// digit 0 leaves the relation empty. The code lives only in these relations.
//
// Nodes sit in an arena and relations are arena indices, so the cycle has
// no ownership to break and the head is just an index.

namespace wm_graph {

struct Node {
    std::optional<size_t> next;
    std::optional<size_t> digit;
};

struct Graph {
    std::vector<Node> nodes;
    size_t head = 0;
};

// Build the ring for zeta6. Throws ConfigError if zeta6 is empty or holds
// a digit outside [0,5].
Graph encode(const std::vector<int>& zeta6);

// Walk mu nodes from graph.head and recover their digits.
// Throws StructureError "invalid structure (broken ring)" when a `next`
// relation is missing or dangles, and "invalid structure (unreachable digit)"
// when a digit target is not met within mu steps.
std::vector<int> decode(const Graph& graph, size_t mu);

// True if decode(encode(zeta6), mu) reproduces zeta6, i.e. no non-zero
// digit exceeds the ring length. Larger digits wrap around the ring.
bool round_trips(const std::vector<int>& zeta6);

} // namespace wm_graph
