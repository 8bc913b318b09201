#pragma once
#include "params.hpp"
#include "controller.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

// Protected-call boundary: authenticate received parameters before running
// the inner computation on the restored values.

namespace guard {

enum class TamperPolicy { Raise, ReturnSentinel, CallAnyway };

// "raise", "return-sentinel", "call-anyway". Throws ConfigError otherwise.
TamperPolicy parse_policy(const std::string& name);
std::string  policy_name(TamperPolicy policy);

struct ProtectionConfig {
    Key          key;
    Integer      zeta;
    int          eta = 0;
    TamperPolicy on_tamper = TamperPolicy::Raise;
};

// Client-side helper: the watermarked list only.
ParamList prepare(const ParamList& params, const Key& key, const Integer& zeta, int eta);

// Message used by TamperPolicy::Raise.
std::string failure_message(const controller::VerificationResult& vr);

// Result type of call_protected: fn's result, or bool for a void fn.
template <typename Fn>
using protected_result_t = std::conditional_t<
    std::is_void_v<std::invoke_result_t<Fn, const ParamList&>>,
    bool, std::invoke_result_t<Fn, const ParamList&>>;

// Build and verify; on success run fn on the restored parameters. On failure:
//   Raise          -> throw AuthenticationError
//   ReturnSentinel -> std::nullopt
//   CallAnyway     -> fn on the raw received parameters
// A void fn yields true whenever it ran.
// Configuration and coverage errors from the build propagate unchanged.
template <typename Fn>
std::optional<protected_result_t<Fn>>
call_protected(const ProtectionConfig& cfg, const ParamList& received, Fn&& fn)
{
    auto run = [&fn](const ParamList& params) -> std::optional<protected_result_t<Fn>> {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, const ParamList&>>) {
            std::forward<Fn>(fn)(params);
            return true;
        } else {
            return std::forward<Fn>(fn)(params);
        }
    };

    encoder::AuthenticationBuild build =
        encoder::build_watermark_graph(received, cfg.key, cfg.eta);
    controller::VerificationResult vr = controller::verify(build.graph, cfg.zeta);

    if (vr.is_authentic)
        return run(encoder::restore_params(received, build.permutation));

    switch (cfg.on_tamper) {
        case TamperPolicy::CallAnyway:
            return run(received);
        case TamperPolicy::ReturnSentinel:
            return std::nullopt;
        case TamperPolicy::Raise:
            break;
    }
    throw AuthenticationError(failure_message(vr));
}

// Wrap fn so every call goes through call_protected.
template <typename Fn>
auto protect(ProtectionConfig cfg, Fn fn) {
    return [cfg = std::move(cfg), fn = std::move(fn)](const ParamList& received) {
        return call_protected(cfg, received, fn);
    };
}

} // namespace guard
