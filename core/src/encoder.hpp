#pragma once
#include "params.hpp"
#include "wm_graph.hpp"
#include <vector>

// Client side: embed hint bits carrying the secret code into a parameter list.
// Server side: detect hints in a received list, rebuild the code, build the
// watermark graph, and restore the original values.

namespace encoder {

using Permutation = std::vector<size_t>;

struct PreparedInput {
    ParamList   watermarked_params;
    Permutation permutation;
    int         eta;
};

struct AuthenticationBuild {
    wm_graph::Graph graph;
    Permutation     permutation;
    int             eta;
};

// Keyed permutation of the floor(params_len / 2) pairs.
// Throws ConfigError if params_len < 2 or eta <= 0, CoverageError if there
// are fewer pairs than eta or keyed::index over the permutation leaves a bit
// position without a vote. Both sides run this identically.
Permutation compute_permutation(size_t params_len, const Key& key, int eta);

// gamma[p] = (params[2p] - params[2p+1]) mod 2 for every pair in P.
std::vector<int> hints_detection(const ParamList& params, const Permutation& P);

// Vote each pair's hint into bit position keyed::index(p, eta, key).
// Unanimous positions take the vote; any disagreement (not only a tie)
// falls back to keyed::bit.
std::vector<int> code_builder(const std::vector<int>& gamma, int eta,
                              const Key& key, const Permutation& P);

// Scatter zeta's eta-bit form over the pairs and embed one bit per pair.
PreparedInput prepare_parameters(const ParamList& params, const Key& key,
                                 const Integer& zeta, int eta);

AuthenticationBuild build_watermark_graph(const ParamList& received,
                                          const Key& key, int eta);

// Undo the embedding for every pair in P.
ParamList restore_params(const ParamList& watermarked, const Permutation& P);

} // namespace encoder
