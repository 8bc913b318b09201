#pragma once
#include "bigint.hpp"

// Reversible difference expansion (DE) on an integer pair.
//
//   embed:    d = x - y,  a = floor((x + y) / 2),  d' = 2d + bit
//             x' = a + ceil(d' / 2),  y' = a - floor(d' / 2)
//   extract:  d' = x' - y',  bit = d' mod 2,  d = floor(d' / 2)
//             a = floor((x' + y') / 2),  x = a + ceil(d / 2),  y = a - floor(d / 2)
//
// extract(embed(x, y, bit)) == (bit, x, y) exactly for all integers.
// The embedded difference doubles, so values are arbitrary precision.

namespace diff_exp {

struct Pair {
    Integer x;
    Integer y;
};

struct Extracted {
    int  bit;
    Pair original;
};

// Throws ConfigError unless bit is 0 or 1.
Pair      embed(const Integer& x, const Integer& y, int bit);
Extracted extract(const Integer& x_emb, const Integer& y_emb);

// (x - y) mod 2, always 0 or 1.
int parity(const Integer& x, const Integer& y);

} // namespace diff_exp
