#pragma once
#include <stdexcept>
#include <string>

// Invalid input or configuration: bad base, negative values, eta <= 0,
// too few parameters, code too large for eta, empty key. Fatal to the call.
struct ConfigError : std::invalid_argument {
    explicit ConfigError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Key, eta and pair count do not give every bit position a vote.
// Deterministic for a given (key, n_pairs, eta); fix by changing configuration.
struct CoverageError : std::runtime_error {
    explicit CoverageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed watermark graph (broken ring, unreachable digit target).
struct StructureError : std::runtime_error {
    explicit StructureError(const std::string& msg) : std::runtime_error(msg) {}
};

// Protected call rejected received parameters under TamperPolicy::Raise.
struct AuthenticationError : std::runtime_error {
    explicit AuthenticationError(const std::string& msg) : std::runtime_error(msg) {}
};
