#include "digits.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

namespace digits {

std::vector<int> to_digits(const Integer& n, int base) {
    if (base < 2)
        throw ConfigError("base must be >= 2");
    if (n.is_negative())
        throw ConfigError("n must be non-negative");
    if (n.is_zero())
        return {0};

    std::vector<int> out;
    Integer rest(n);
    while (!rest.is_zero())
        out.push_back(static_cast<int>(rest.div_word(static_cast<uint64_t>(base))));
    std::reverse(out.begin(), out.end());
    return out;
}

Integer from_digits(const std::vector<int>& ds, int base) {
    if (base < 2)
        throw ConfigError("base must be >= 2");
    if (ds.empty())
        throw ConfigError("digits must be non-empty");

    Integer n;
    for (int d : ds) {
        if (d < 0 || d >= base)
            throw ConfigError("digit " + std::to_string(d) +
                              " out of range for base " + std::to_string(base));
        n.mul_add_word(static_cast<uint64_t>(base), static_cast<uint64_t>(d));
    }
    return n;
}

std::vector<int> bits_from_int(const Integer& n, int eta) {
    if (eta <= 0)
        throw ConfigError("eta must be > 0");
    std::vector<int> bits = to_digits(n, 2);
    if (bits.size() > static_cast<size_t>(eta))
        throw ConfigError("eta too small to represent n (need " +
                          std::to_string(bits.size()) + " bits, eta=" +
                          std::to_string(eta) + ")");
    bits.insert(bits.begin(), static_cast<size_t>(eta) - bits.size(), 0);
    return bits;
}

Integer int_from_bits(const std::vector<int>& bits) {
    return from_digits(bits, 2);
}

std::vector<int> convert_base(const std::vector<int>& ds, int base_from, int base_to) {
    return to_digits(from_digits(ds, base_from), base_to);
}

} // namespace digits
