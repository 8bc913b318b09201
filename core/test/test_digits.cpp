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

template <typename Fn>
static bool throws_config(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

int main() {
    using digits::to_digits;
    using digits::from_digits;
    using digits::bits_from_int;
    using digits::convert_base;
    using V = std::vector<int>;

    bool ok = true;

    // to_digits / from_digits
    ok &= check(to_digits(Integer(0), 6) == V{0}, "0 in base 6");
    ok &= check(to_digits(Integer(424242), 6) == V({1, 3, 0, 3, 2, 0, 3, 0}), "424242 in base 6");
    ok &= check(to_digits(Integer(5), 2) == V({1, 0, 1}), "5 in base 2");
    ok &= check(to_digits(Integer(255), 16) == V({15, 15}), "255 in base 16");
    ok &= check(from_digits(V({1, 3, 0, 3, 2, 0, 3, 0}), 6) == Integer(424242), "from base 6");
    ok &= check(from_digits(V({0, 0, 1}), 2) == Integer(1), "leading zeros ignored");

    Integer big = Integer::from_dec("340282366920938463463374607431768211457"); // 2^128 + 1
    std::vector<int> big_bits = to_digits(big, 2);
    ok &= check(big_bits.size() == 129 && big_bits.front() == 1 && big_bits.back() == 1,
                "2^128+1 in base 2");
    ok &= check(from_digits(to_digits(big, 6), 6) == big, "2^128+1 through base 6");

    ok &= check(throws_config([] { to_digits(Integer(5), 1); }), "base 1 rejected");
    ok &= check(throws_config([] { to_digits(Integer(-1), 6); }), "negative n rejected");
    ok &= check(throws_config([] { from_digits(V{}, 6); }), "empty digits rejected");
    ok &= check(throws_config([] { from_digits(V({1, 6}), 6); }), "digit == base rejected");
    ok &= check(throws_config([] { from_digits(V({-1}), 6); }), "negative digit rejected");

    // bits_from_int
    ok &= check(bits_from_int(Integer(5), 6) == V({0, 0, 0, 1, 0, 1}), "5 padded to 6 bits");
    ok &= check(bits_from_int(Integer(0), 3) == V({0, 0, 0}), "0 padded to 3 bits");
    ok &= check(bits_from_int(Integer(424242), 20) ==
                V({0, 1, 1, 0, 0, 1, 1, 1, 1, 0, 0, 1, 0, 0, 1, 1, 0, 0, 1, 0}),
                "424242 as 20 bits");
    ok &= check(bits_from_int(Integer(15), 4) == V({1, 1, 1, 1}), "exact fit");
    ok &= check(throws_config([] { bits_from_int(Integer(16), 4); }), "16 needs 5 bits");
    ok &= check(throws_config([] { bits_from_int(Integer(1), 0); }), "eta 0 rejected");
    ok &= check(digits::int_from_bits(V({1, 0, 0, 0, 0})) == Integer(16), "int_from_bits");

    // convert_base
    ok &= check(convert_base(bits_from_int(Integer(424242), 20), 2, 6) ==
                V({1, 3, 0, 3, 2, 0, 3, 0}), "bits to base 6");
    ok &= check(convert_base(V({0, 0, 0}), 2, 6) == V{0}, "zero bits to base 6");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
