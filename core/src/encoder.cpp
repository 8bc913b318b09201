#include "encoder.hpp"
#include "diff_exp.hpp"
#include "digits.hpp"
#include "errors.hpp"
#include "keyed.hpp"
#include <string>
#include <utility>

namespace encoder {

static const char kBitLabel[] = "KBit|v1";

static void check_pair(const ParamList& params, size_t p) {
    if (2 * p + 1 >= params.size())
        throw ConfigError("pair index " + std::to_string(p) +
                          " outside parameter list of length " +
                          std::to_string(params.size()));
}

// ── Permutation and coverage ──────────────────────────────────────────────────

Permutation compute_permutation(size_t params_len, const Key& key, int eta) {
    if (params_len < 2)
        throw ConfigError("Need at least 2 parameters (one pair)");
    if (eta <= 0)
        throw ConfigError("eta must be > 0");

    size_t n_pairs = params_len / 2;
    if (n_pairs < static_cast<size_t>(eta))
        throw CoverageError(
            "Not enough parameter pairs to support eta=" + std::to_string(eta) +
            ": need at least " + std::to_string(eta) + " pairs, got " +
            std::to_string(n_pairs) + ". Increase the number of input integers or reduce eta");

    Permutation P = keyed::permutation(keyed::seed(key), n_pairs);

    std::vector<bool> covered(static_cast<size_t>(eta), false);
    size_t n_covered = 0;
    for (size_t p : P) {
        size_t j = keyed::index(p, eta, key);
        if (!covered[j]) {
            covered[j] = true;
            ++n_covered;
        }
    }
    if (n_covered < static_cast<size_t>(eta))
        throw CoverageError(
            "Insufficient keyed index coverage: only " + std::to_string(n_covered) +
            "/" + std::to_string(eta) + " bit positions receive votes. "
            "Increase the number of input integers (more pairs) or reduce eta");
    return P;
}

// ── Hints and code building ───────────────────────────────────────────────────

std::vector<int> hints_detection(const ParamList& params, const Permutation& P) {
    std::vector<int> gamma(params.size() / 2, 0);
    for (size_t p : P) {
        check_pair(params, p);
        gamma[p] = diff_exp::parity(params[2 * p], params[2 * p + 1]);
    }
    return gamma;
}

std::vector<int> code_builder(const std::vector<int>& gamma, int eta,
                              const Key& key, const Permutation& P) {
    if (eta <= 0)
        throw ConfigError("eta must be > 0");

    std::vector<size_t> ones(static_cast<size_t>(eta), 0);
    std::vector<size_t> zeros(static_cast<size_t>(eta), 0);
    for (size_t p : P) {
        if (p >= gamma.size())
            throw ConfigError("pair index " + std::to_string(p) + " outside hint vector");
        size_t j = keyed::index(p, eta, key);
        if (gamma[p] == 1) ++ones[j];
        else               ++zeros[j];
    }

    std::vector<int> zeta2(static_cast<size_t>(eta), 0);
    for (size_t j = 0; j < zeta2.size(); ++j) {
        size_t o = ones[j], z = zeros[j];
        if (o > 0 && z == 0) {
            zeta2[j] = 1;
        } else if (z > 0 && o == 0) {
            zeta2[j] = 0;
        } else {
            std::string label = std::string(kBitLabel) + "|chaos|j=" + std::to_string(j) +
                                "|o=" + std::to_string(o) + "|z=" + std::to_string(z);
            zeta2[j] = keyed::bit(key, label);
        }
    }
    return zeta2;
}

// ── Client side ───────────────────────────────────────────────────────────────

PreparedInput prepare_parameters(const ParamList& params, const Key& key,
                                 const Integer& zeta, int eta) {
    if (zeta.is_negative())
        throw ConfigError("zeta must be non-negative");
    Permutation P = compute_permutation(params.size(), key, eta);
    std::vector<int> zeta2 = digits::bits_from_int(zeta, eta);

    // Direct scatter: each pair carries the bit of its assigned position.
    std::vector<int> gamma(params.size() / 2, 0);
    for (size_t p : P)
        gamma[p] = zeta2[keyed::index(p, eta, key)];

    ParamList I(params);
    for (size_t p : P) {
        diff_exp::Pair emb = diff_exp::embed(I[2 * p], I[2 * p + 1], gamma[p]);
        I[2 * p]     = std::move(emb.x);
        I[2 * p + 1] = std::move(emb.y);
    }
    return PreparedInput{std::move(I), std::move(P), eta};
}

// ── Server side ───────────────────────────────────────────────────────────────

AuthenticationBuild build_watermark_graph(const ParamList& received,
                                          const Key& key, int eta) {
    Permutation P = compute_permutation(received.size(), key, eta);

    std::vector<int> gamma = hints_detection(received, P);
    std::vector<int> zeta2 = code_builder(gamma, eta, key, P);
    std::vector<int> zeta6 = digits::convert_base(zeta2, 2, 6);

    return AuthenticationBuild{wm_graph::encode(zeta6), std::move(P), eta};
}

ParamList restore_params(const ParamList& watermarked, const Permutation& P) {
    ParamList I(watermarked);
    for (size_t p : P) {
        check_pair(I, p);
        diff_exp::Extracted ex = diff_exp::extract(I[2 * p], I[2 * p + 1]);
        I[2 * p]     = std::move(ex.original.x);
        I[2 * p + 1] = std::move(ex.original.y);
    }
    return I;
}

} // namespace encoder
