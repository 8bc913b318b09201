#include "controller.hpp"
#include "digits.hpp"
#include "errors.hpp"
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

static wm_graph::Graph graph_for(long long code) {
    return wm_graph::encode(digits::to_digits(Integer(code), 6));
}

int main() {
    bool ok = true;

    // Matching code
    controller::VerificationResult vr = controller::verify(graph_for(424242), Integer(424242));
    ok &= check(vr.is_authentic, "424242 authentic");
    ok &= check(vr.recovered_zeta && *vr.recovered_zeta == Integer(424242), "recovered 424242");
    ok &= check(vr.recovered_zeta6 &&
                *vr.recovered_zeta6 == std::vector<int>({1, 3, 0, 3, 2, 0, 3, 0}),
                "recovered base-6 digits");
    ok &= check(!vr.error, "no error on success");

    ok &= check(controller::verify(graph_for(0), Integer(0)).is_authentic, "code 0 authentic");
    ok &= check(controller::verify(graph_for(1296), Integer(1296)).is_authentic, "1296 authentic");

    // Mismatch is a normal outcome
    vr = controller::verify(graph_for(424243), Integer(424242));
    ok &= check(!vr.is_authentic, "different code rejected");
    ok &= check(vr.recovered_zeta && *vr.recovered_zeta == Integer(424243), "mismatch reports decoded code");
    ok &= check(!vr.error, "mismatch carries no error");

    // Short code whose digit exceeds the ring length cannot verify
    vr = controller::verify(graph_for(3), Integer(3));
    ok &= check(!vr.is_authentic && vr.recovered_zeta && *vr.recovered_zeta == Integer(1),
                "code 3 aliases to 1");

    // Structural damage comes back as a result, not an exception
    wm_graph::Graph broken = graph_for(424242);
    broken.nodes[3].next.reset();
    try {
        vr = controller::verify(broken, Integer(424242));
        ok &= check(!vr.is_authentic, "broken graph rejected");
        ok &= check(vr.error && vr.error->find("broken ring") != std::string::npos,
                    "broken graph error text");
        ok &= check(!vr.recovered_zeta && !vr.recovered_zeta6, "no recovered code on error");
    } catch (const std::exception& e) {
        ok &= fail(std::string("verify threw on a broken graph: ") + e.what());
    }

    // Decoded digit above 5: an intact 7-ring whose node 0 points six steps on
    wm_graph::Graph wide = wm_graph::encode(std::vector<int>({1, 0, 0, 0, 0, 0, 0}));
    wide.nodes[0].digit = 6;
    vr = controller::verify(wide, Integer(46656));   // 6^6, seven base-6 digits
    ok &= check(!vr.is_authentic && vr.error, "out-of-range decoded digit rejected");

    // Negative expected code is a configuration error
    try {
        controller::verify(graph_for(1), Integer(-1));
        ok &= fail("negative expected code accepted");
    } catch (const ConfigError&) {}

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
