#include "params_pack.hpp"
#include <msgpack.hpp>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

namespace params_mp {

static const uint32_t kFormatVersion = 1;

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw std::runtime_error(std::string(ctx) + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

static Integer require_value(const msgpack::object& obj, uint32_t idx) {
    switch (obj.type) {
        case msgpack::type::POSITIVE_INTEGER:
            if (obj.via.u64 > static_cast<uint64_t>(INT64_MAX))
                return Integer::from_dec(std::to_string(obj.via.u64));
            return Integer(static_cast<long long>(obj.via.u64));
        case msgpack::type::NEGATIVE_INTEGER:
            return Integer(static_cast<long long>(obj.via.i64));
        case msgpack::type::STR:
            return Integer::from_dec(require_str(obj, "'p' value"));
        default:
            throw std::runtime_error("unpack: value " + std::to_string(idx) +
                                     " must be an integer or decimal string");
    }
}

// ── pack ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack(const ParamList& params) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(2);

    // "v" → format version
    pk.pack(std::string("v"));
    pk.pack_uint32(kFormatVersion);

    // "p" → values
    pk.pack(std::string("p"));
    pk.pack_array(static_cast<uint32_t>(params.size()));
    for (const auto& v : params) {
        int64_t small = 0;
        if (v.to_int64(small))
            pk.pack_int64(small);
        else
            pk.pack(v.to_dec());
    }

    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// ── unpack ────────────────────────────────────────────────────────────────────

ParamList unpack(const std::vector<uint8_t>& data) {
    msgpack::object_handle oh = msgpack::unpack(
        reinterpret_cast<const char*>(data.data()), data.size());
    const msgpack::object& obj = oh.get();

    if (obj.type != msgpack::type::MAP)
        throw std::runtime_error("unpack: top-level object must be a map");

    ParamList params;
    bool got_v = false, got_p = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "map key");
        const msgpack::object& val = kv.val;

        if (key == "v") {
            if (val.type != msgpack::type::POSITIVE_INTEGER)
                throw std::runtime_error("unpack: 'v' must be unsigned int");
            if (val.via.u64 != kFormatVersion)
                throw std::runtime_error("unpack: unsupported version " +
                                         std::to_string(val.via.u64));
            got_v = true;
        } else if (key == "p") {
            if (val.type != msgpack::type::ARRAY)
                throw std::runtime_error("unpack: 'p' must be an array");
            const auto& arr = val.via.array;
            params.reserve(arr.size);
            for (uint32_t j = 0; j < arr.size; ++j)
                params.push_back(require_value(arr.ptr[j], j));
            got_p = true;
        }
    }

    if (!got_v || !got_p)
        throw std::runtime_error("unpack: missing required fields in msgpack params");

    return params;
}

// ── file I/O ──────────────────────────────────────────────────────────────────

void pack_to_file(const ParamList& params, const std::string& path) {
    auto bytes = pack(params);
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("pack_to_file: cannot open " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("pack_to_file: write error");
}

ParamList unpack_from_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("unpack_from_file: cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw std::runtime_error("unpack_from_file: read error");
    return unpack(bytes);
}

} // namespace params_mp
