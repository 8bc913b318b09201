#include "keyed.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace keyed {

static const char kSeedLabel[]  = "PRNG|v1";
static const char kPermCtx[]    = "KPerm|v1";
static const char kIndexLabel[] = "KInd|v1";
// U+2014 EM DASH, UTF-8 encoded; separates fields of the index label
static const char kIndexSep[]   = "\xE2\x80\x94";

// ── HMAC source ───────────────────────────────────────────────────────────────

Digest hmac_sha256(const std::vector<uint8_t>& key, const std::string& msg) {
    if (key.empty())
        throw ConfigError("key must be non-empty");

    Digest out;
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
              out.data(), &out_len) || out_len != out.size())
        throw std::runtime_error("HMAC-SHA256 failed");
    return out;
}

uint64_t draw(const std::vector<uint8_t>& key, const std::string& label) {
    Digest d = hmac_sha256(key, label);
    uint64_t r = 0;
    for (int i = 0; i < 8; ++i)
        r = (r << 8) | d[i];
    return r;
}

bool accept(uint64_t r, uint64_t m) {
    // 2^64 mod m, computed without leaving 64 bits
    uint64_t rem = (std::numeric_limits<uint64_t>::max() % m + 1) % m;
    if (rem == 0) return true;
    return r < (0 - rem);
}

// ── Derivations ───────────────────────────────────────────────────────────────

std::vector<uint8_t> seed(const Key& key) {
    Digest d = hmac_sha256(key, kSeedLabel);
    return std::vector<uint8_t>(d.begin(), d.end());
}

static std::string perm_label(size_t i, uint64_t c) {
    return std::string("perm|") + kPermCtx + "|i=" + std::to_string(i) +
           "|c=" + std::to_string(c);
}

std::vector<size_t> permutation(const std::vector<uint8_t>& seed, size_t n) {
    std::vector<size_t> P(n);
    std::iota(P.begin(), P.end(), size_t{0});

    uint64_t c = 0;
    for (size_t i = 0; i + 1 < n; ++i) {
        uint64_t m = i + 1;
        for (;;) {
            uint64_t r = draw(seed, perm_label(i, c));
            ++c;
            if (accept(r, m)) {
                std::swap(P[i], P[static_cast<size_t>(r % m)]);
                break;
            }
        }
    }
    return P;
}

static std::string index_label(size_t p, uint64_t c) {
    return std::string(kIndexLabel) + kIndexSep + std::to_string(p) +
           kIndexSep + std::to_string(c);
}

size_t index(size_t p, int eta, const Key& key) {
    if (eta <= 0)
        throw ConfigError("eta must be > 0");
    uint64_t m = static_cast<uint64_t>(eta);
    for (uint64_t c = 0;; ++c) {
        uint64_t r = draw(key, index_label(p, c));
        if (accept(r, m))
            return static_cast<size_t>(r % m);
    }
}

int bit(const Key& key, const std::string& label) {
    return static_cast<int>(draw(key, label) % 2);
}

} // namespace keyed
