#pragma once
#include "bigint.hpp"
#include <string>
#include <vector>
#include <cstdint>

// Ordered parameter list. Pair p occupies positions (2p, 2p+1); a trailing
// odd element is carried through untouched.
using ParamList = std::vector<Integer>;

// Shared secret key bytes (HMAC-SHA256 key).
using Key = std::vector<uint8_t>;

// Consecutive values first, first+1, ..., last-1.
ParamList params_range(long long first, long long last);

// UTF-8 bytes of text, for keys given as strings.
Key key_from_text(const std::string& text);
