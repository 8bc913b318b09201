#include "guard.hpp"
#include <iostream>
#include <string>
#include <vector>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static Integer sum_even_positions(const ParamList& ps) {
    Integer total;
    for (size_t i = 0; i < ps.size(); i += 2) total += ps[i];
    return total;
}

int main() {
    bool ok = true;

    guard::ProtectionConfig cfg;
    cfg.key  = key_from_text("unit-test-key");
    cfg.zeta = Integer(424242);
    cfg.eta  = 20;

    const ParamList original = params_range(10, 1034);
    const Integer expected = sum_even_positions(original);
    const ParamList sent = guard::prepare(original, cfg.key, cfg.zeta, cfg.eta);

    ParamList tampered = sent;
    for (size_t i = 0; i < 100; i += 2) tampered[i] += Integer(1);

    // ── Authentic input reaches fn restored ──────────────────────────────────
    auto wrapped = guard::protect(cfg, sum_even_positions);
    std::optional<Integer> r = wrapped(sent);
    ok &= check(r && *r == expected, "protected call sees the original values");
    ok &= check(sum_even_positions(sent) != expected, "watermark changed the raw values");

    // ── Tamper policies ──────────────────────────────────────────────────────
    try {
        wrapped(tampered);
        ok &= fail("raise policy returned on tampered input");
    } catch (const AuthenticationError& e) {
        ok &= check(std::string(e.what()).find("Parameter authentication failed") == 0,
                    "failure message prefix");
    }

    cfg.on_tamper = guard::TamperPolicy::ReturnSentinel;
    bool called = false;
    std::optional<int> sentinel = guard::call_protected(cfg, tampered, [&](const ParamList&) {
        called = true;
        return 1;
    });
    ok &= check(!sentinel && !called, "return-sentinel skips the call");

    cfg.on_tamper = guard::TamperPolicy::CallAnyway;
    r = guard::call_protected(cfg, tampered, sum_even_positions);
    ok &= check(r && *r == sum_even_positions(tampered), "call-anyway passes the raw list");

    // Inner computation with no result
    std::vector<size_t> seen;
    auto record_size = [&](const ParamList& p) { seen.push_back(p.size()); };
    cfg.on_tamper = guard::TamperPolicy::ReturnSentinel;
    std::optional<bool> ran = guard::call_protected(cfg, sent, record_size);
    ok &= check(ran && *ran && seen.size() == 1, "void function runs on authentic input");
    ran = guard::call_protected(cfg, tampered, record_size);
    ok &= check(!ran && seen.size() == 1, "void function skipped under return-sentinel");
    cfg.on_tamper = guard::TamperPolicy::CallAnyway;
    ran = guard::protect(cfg, record_size)(tampered);
    ok &= check(ran && *ran && seen.size() == 2, "void function wrapped by protect");

    // Build errors propagate whatever the policy
    try {
        guard::call_protected(cfg, params_range(0, 16), sum_even_positions);
        ok &= fail("uncovered configuration accepted");
    } catch (const CoverageError&) {}

    // ── Policy names ─────────────────────────────────────────────────────────
    ok &= check(guard::parse_policy("raise") == guard::TamperPolicy::Raise, "parse raise");
    ok &= check(guard::parse_policy("return-sentinel") == guard::TamperPolicy::ReturnSentinel,
                "parse return-sentinel");
    ok &= check(guard::policy_name(guard::parse_policy("call-anyway")) == "call-anyway",
                "call-anyway name");
    try {
        guard::parse_policy("ignore");
        ok &= fail("unknown policy accepted");
    } catch (const ConfigError&) {}

    controller::VerificationResult vr;
    vr.is_authentic = false;
    ok &= check(guard::failure_message(vr) == "Parameter authentication failed: code mismatch",
                "mismatch message");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
