#pragma once
#include "params.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Keyed pseudorandom derivations over HMAC-SHA256.
// Every value is a pure function of (key, label, counter); counters are
// passed in explicitly so both sides reproduce the exact same draw sequence.

namespace keyed {

using Digest = std::array<uint8_t, 32>;

// HMAC-SHA256(key, msg). Throws ConfigError on an empty key.
Digest hmac_sha256(const std::vector<uint8_t>& key, const std::string& msg);

// First 8 bytes of HMAC-SHA256(key, label) as a big-endian uint64.
uint64_t draw(const std::vector<uint8_t>& key, const std::string& label);

// True if r lies below the largest multiple of m that fits in 2^64,
// i.e. r % m is unbiased. m must be > 0.
bool accept(uint64_t r, uint64_t m);

// Seed material for the permutation: HMAC(key, "PRNG|v1").
std::vector<uint8_t> seed(const Key& key);

// Fisher-Yates shuffle of [0, n). Step i draws j in [0, i] from
// HMAC(seed, "perm|KPerm|v1|i=<i>|c=<c>"); c counts every draw of the run.
std::vector<size_t> permutation(const std::vector<uint8_t>& seed, size_t n);

// Bit position in [0, eta) assigned to pair p. Draw counter is local to
// the call. Throws ConfigError if eta <= 0.
size_t index(size_t p, int eta, const Key& key);

// Deterministic tie-break bit: HMAC(key, label) mod 2.
int bit(const Key& key, const std::string& label);

} // namespace keyed
