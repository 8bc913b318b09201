#include "diff_exp.hpp"
#include "errors.hpp"

namespace diff_exp {

Pair embed(const Integer& x, const Integer& y, int bit) {
    if (bit != 0 && bit != 1)
        throw ConfigError("bit must be 0 or 1");

    Integer d = x - y;
    Integer a = (x + y).floor_div2();
    Integer d_prime = d + d + Integer(bit);

    return Pair{a + d_prime.ceil_div2(), a - d_prime.floor_div2()};
}

Extracted extract(const Integer& x_emb, const Integer& y_emb) {
    Integer d_prime = x_emb - y_emb;
    int bit = d_prime.is_odd() ? 1 : 0;
    Integer d = d_prime.floor_div2();
    Integer a = (x_emb + y_emb).floor_div2();

    return Extracted{bit, Pair{a + d.ceil_div2(), a - d.floor_div2()}};
}

int parity(const Integer& x, const Integer& y) {
    return (x - y).is_odd() ? 1 : 0;
}

} // namespace diff_exp
