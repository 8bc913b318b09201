#include "bigint.hpp"
#include <openssl/crypto.h>
#include <stdexcept>
#include <utility>

static BIGNUM* new_bn() {
    BIGNUM* bn = BN_new();
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

// ── Lifetime ──────────────────────────────────────────────────────────────────

Integer::Integer() : bn_(new_bn()) {}

Integer::Integer(long long v) : bn_(new_bn()) {
    unsigned long long mag = v < 0 ? 0ULL - static_cast<unsigned long long>(v)
                                   : static_cast<unsigned long long>(v);
    if (BN_set_word(bn_, static_cast<BN_ULONG>(mag)) != 1) {
        BN_free(bn_);
        throw std::runtime_error("BN_set_word failed");
    }
    BN_set_negative(bn_, v < 0 ? 1 : 0);
}

Integer::Integer(const Integer& other) : bn_(BN_dup(other.bn_)) {
    if (!bn_) throw std::runtime_error("BN_dup failed");
}

Integer::Integer(Integer&& other) noexcept : bn_(other.bn_) {
    other.bn_ = nullptr;
}

Integer& Integer::operator=(const Integer& other) {
    if (this != &other) {
        if (!BN_copy(bn_ ? bn_ : (bn_ = new_bn()), other.bn_))
            throw std::runtime_error("BN_copy failed");
    }
    return *this;
}

Integer& Integer::operator=(Integer&& other) noexcept {
    std::swap(bn_, other.bn_);
    return *this;
}

Integer::~Integer() {
    BN_free(bn_);
}

// ── Decimal text ──────────────────────────────────────────────────────────────

Integer Integer::from_dec(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (text.size() == start)
        throw std::invalid_argument("Invalid integer: '" + text + "'");
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9')
            throw std::invalid_argument("Invalid integer: '" + text + "'");
    }

    Integer out;
    if (BN_dec2bn(&out.bn_, text.c_str()) != static_cast<int>(text.size()))
        throw std::runtime_error("BN_dec2bn failed");
    return out;
}

std::string Integer::to_dec() const {
    char* s = BN_bn2dec(bn_);
    if (!s) throw std::runtime_error("BN_bn2dec failed");
    std::string out(s);
    OPENSSL_free(s);
    return out;
}

// ── Queries ───────────────────────────────────────────────────────────────────

bool Integer::is_zero() const     { return BN_is_zero(bn_) == 1; }
bool Integer::is_negative() const { return BN_is_negative(bn_) == 1; }
bool Integer::is_odd() const      { return BN_is_odd(bn_) == 1; }
int  Integer::num_bits() const    { return BN_num_bits(bn_); }

bool Integer::to_int64(int64_t& out) const {
    if (BN_num_bits(bn_) > 63) return false;
    int64_t mag = static_cast<int64_t>(BN_get_word(bn_));
    out = is_negative() ? -mag : mag;
    return true;
}

int Integer::compare(const Integer& a, const Integer& b) {
    return BN_cmp(a.bn_, b.bn_);
}

// ── Arithmetic ────────────────────────────────────────────────────────────────

// BN_rshift1 shifts the magnitude and keeps the sign, i.e. truncates toward
// zero. Odd negatives need one more step down to reach the floor.
Integer Integer::floor_div2() const {
    Integer r;
    if (BN_rshift1(r.bn_, bn_) != 1)
        throw std::runtime_error("BN_rshift1 failed");
    if (is_negative() && is_odd()) {
        if (BN_sub_word(r.bn_, 1) != 1)
            throw std::runtime_error("BN_sub_word failed");
    }
    return r;
}

Integer Integer::ceil_div2() const {
    return -((-*this).floor_div2());
}

uint64_t Integer::div_word(uint64_t w) {
    BN_ULONG rem = BN_div_word(bn_, static_cast<BN_ULONG>(w));
    if (rem == static_cast<BN_ULONG>(-1))
        throw std::runtime_error("BN_div_word failed");
    return static_cast<uint64_t>(rem);
}

void Integer::mul_add_word(uint64_t w, uint64_t a) {
    if (BN_mul_word(bn_, static_cast<BN_ULONG>(w)) != 1 ||
        BN_add_word(bn_, static_cast<BN_ULONG>(a)) != 1)
        throw std::runtime_error("BN_mul_word/BN_add_word failed");
}

Integer& Integer::operator+=(const Integer& rhs) {
    if (BN_add(bn_, bn_, rhs.bn_) != 1)
        throw std::runtime_error("BN_add failed");
    return *this;
}

Integer& Integer::operator-=(const Integer& rhs) {
    if (BN_sub(bn_, bn_, rhs.bn_) != 1)
        throw std::runtime_error("BN_sub failed");
    return *this;
}

Integer Integer::operator-() const {
    Integer r(*this);
    if (!r.is_zero())
        BN_set_negative(r.bn_, is_negative() ? 0 : 1);
    return r;
}
