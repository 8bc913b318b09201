#pragma once
#include "bigint.hpp"
#include "wm_graph.hpp"
#include <optional>
#include <string>
#include <vector>

// Authority comparing the code carried by a watermark graph to the expected one.

namespace controller {

struct VerificationResult {
    bool                            is_authentic = false;
    std::optional<Integer>          recovered_zeta;
    std::optional<std::vector<int>> recovered_zeta6;
    std::optional<std::string>      error;
};

// Decode the graph over mu = base-6 length of expected_zeta and compare.
// Throws ConfigError if expected_zeta < 0. Decode failures never escape:
// they come back as a non-authentic result carrying the error text.
VerificationResult verify(const wm_graph::Graph& graph, const Integer& expected_zeta);

} // namespace controller
