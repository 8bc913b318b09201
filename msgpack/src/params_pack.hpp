#pragma once
#include "params.hpp"
#include <vector>
#include <cstdint>
#include <string>

// Binary parameter file: msgpack map {"v": 1, "p": [values...]}.
// A value that fits in 64 bits is a msgpack integer, anything larger is its
// decimal string.
namespace params_mp {
    std::vector<uint8_t> pack(const ParamList& params);
    ParamList            unpack(const std::vector<uint8_t>& data);
    void                 pack_to_file(const ParamList& params, const std::string& path);
    ParamList            unpack_from_file(const std::string& path);
}
