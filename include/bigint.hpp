#pragma once
#include <string>
#include <cstdint>
#include <ostream>
#include <openssl/bn.h>

// Signed arbitrary-precision integer owning an OpenSSL BIGNUM.
// Copies duplicate the BIGNUM, moves transfer it. All OpenSSL failures
// throw std::runtime_error.
class Integer {
public:
    Integer();
    Integer(long long v);
    Integer(const Integer& other);
    Integer(Integer&& other) noexcept;
    Integer& operator=(const Integer& other);
    Integer& operator=(Integer&& other) noexcept;
    ~Integer();

    // Parse an optionally '-' prefixed decimal string. Throws
    // std::invalid_argument on malformed text.
    static Integer from_dec(const std::string& text);
    std::string    to_dec() const;

    bool is_zero() const;
    bool is_negative() const;
    bool is_odd() const;
    int  num_bits() const;     // bits of the magnitude; 0 for zero

    // Fits in a signed 64-bit value; writes it to out when it does.
    bool to_int64(int64_t& out) const;

    // Division rounding toward negative / positive infinity.
    Integer floor_div2() const;
    Integer ceil_div2() const;

    // this = this / w (magnitude), returns the remainder. Non-negative only.
    uint64_t div_word(uint64_t w);
    // this = this * w + a. Non-negative only.
    void     mul_add_word(uint64_t w, uint64_t a);

    Integer& operator+=(const Integer& rhs);
    Integer& operator-=(const Integer& rhs);

    friend Integer operator+(Integer lhs, const Integer& rhs) { return lhs += rhs; }
    friend Integer operator-(Integer lhs, const Integer& rhs) { return lhs -= rhs; }
    Integer operator-() const;

    friend bool operator==(const Integer& a, const Integer& b) { return compare(a, b) == 0; }
    friend bool operator!=(const Integer& a, const Integer& b) { return compare(a, b) != 0; }
    friend bool operator< (const Integer& a, const Integer& b) { return compare(a, b) <  0; }
    friend bool operator> (const Integer& a, const Integer& b) { return compare(a, b) >  0; }
    friend bool operator<=(const Integer& a, const Integer& b) { return compare(a, b) <= 0; }
    friend bool operator>=(const Integer& a, const Integer& b) { return compare(a, b) >= 0; }

    static int compare(const Integer& a, const Integer& b);

    const BIGNUM* bn() const { return bn_; }

private:
    BIGNUM* bn_;
};

inline std::ostream& operator<<(std::ostream& os, const Integer& v) {
    return os << v.to_dec();
}
