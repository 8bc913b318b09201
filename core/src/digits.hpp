#pragma once
#include "bigint.hpp"
#include <vector>

namespace digits {

// Big-endian digits of n >= 0 in base >= 2. n == 0 gives {0}.
std::vector<int> to_digits(const Integer& n, int base);

// Inverse of to_digits. Throws ConfigError on empty input or a digit
// outside [0, base).
Integer from_digits(const std::vector<int>& ds, int base);

// Fixed-length big-endian bit array (zero-padded on the left).
// Throws ConfigError if eta <= 0 or n needs more than eta bits.
std::vector<int> bits_from_int(const Integer& n, int eta);

Integer int_from_bits(const std::vector<int>& bits);

// Re-express a digit array in another base via the integer value.
std::vector<int> convert_base(const std::vector<int>& ds, int base_from, int base_to);

} // namespace digits
