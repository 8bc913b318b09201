#include "controller.hpp"
#include "digits.hpp"
#include "errors.hpp"
#include <exception>
#include <utility>

namespace controller {

VerificationResult verify(const wm_graph::Graph& graph, const Integer& expected_zeta) {
    if (expected_zeta.is_negative())
        throw ConfigError("expected_zeta must be non-negative");

    size_t mu = digits::to_digits(expected_zeta, 6).size();

    VerificationResult vr;
    try {
        std::vector<int> zeta6 = wm_graph::decode(graph, mu);
        Integer zeta = digits::from_digits(zeta6, 6);
        vr.is_authentic    = (zeta == expected_zeta);
        vr.recovered_zeta  = std::move(zeta);
        vr.recovered_zeta6 = std::move(zeta6);
    } catch (const std::exception& e) {
        // Structural damage (or a decoded digit past base 6) is a failed
        // verification, not an error of the caller.
        vr.is_authentic = false;
        vr.error = e.what();
    }
    return vr;
}

} // namespace controller
