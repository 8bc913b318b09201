#include "guard.hpp"

namespace guard {

TamperPolicy parse_policy(const std::string& name) {
    if (name == "raise")           return TamperPolicy::Raise;
    if (name == "return-sentinel") return TamperPolicy::ReturnSentinel;
    if (name == "call-anyway")     return TamperPolicy::CallAnyway;
    throw ConfigError("unknown tamper policy '" + name +
                      "' (must be raise, return-sentinel, or call-anyway)");
}

std::string policy_name(TamperPolicy policy) {
    switch (policy) {
        case TamperPolicy::Raise:          return "raise";
        case TamperPolicy::ReturnSentinel: return "return-sentinel";
        case TamperPolicy::CallAnyway:     return "call-anyway";
    }
    throw ConfigError("invalid tamper policy value");
}

ParamList prepare(const ParamList& params, const Key& key, const Integer& zeta, int eta) {
    return encoder::prepare_parameters(params, key, zeta, eta).watermarked_params;
}

std::string failure_message(const controller::VerificationResult& vr) {
    return "Parameter authentication failed: " + vr.error.value_or("code mismatch");
}

} // namespace guard
