#include "params_io.hpp"
#include "params_pack.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

// ── YAML emission ─────────────────────────────────────────────────────────────

std::string emit_params_yaml(const ParamList& params) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;
    out << YAML::Key << "type"   << YAML::Value << "params";
    out << YAML::Key << "count"  << YAML::Value << params.size();
    out << YAML::Key << "values" << YAML::Value;
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& v : params)
        out << v.to_dec();
    out << YAML::EndSeq;
    out << YAML::EndMap;
    out << YAML::EndDoc;

    return std::string(out.c_str()) + "\n";
}

// ── YAML parsing ──────────────────────────────────────────────────────────────

static ParamList params_from_node(const YAML::Node& doc) {
    // Validate document type discriminator
    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != "params")
        throw std::runtime_error("YAML params: 'type' field must be 'params' (got '" + doc_type + "')");

    YAML::Node seq = doc["values"];
    if (!seq || !seq.IsSequence())
        throw std::runtime_error("YAML params: missing 'values' sequence");

    ParamList params;
    params.reserve(seq.size());
    for (const auto& n : seq)
        params.push_back(Integer::from_dec(n.as<std::string>()));

    if (doc["count"] && doc["count"].as<size_t>() != params.size())
        throw std::runtime_error("YAML params: 'count' does not match 'values'");
    return params;
}

ParamList parse_params_yaml(const std::string& yaml_text) {
    return params_from_node(YAML::Load(yaml_text));
}

// ── Entry point ───────────────────────────────────────────────────────────────

ParamList load_params(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open params file: " + path);

    int first = f.get();
    if (first == EOF)
        throw std::runtime_error("Params file is empty: " + path);

    // YAML documents open with "---"
    if (first == 0x2D)
        return params_from_node(YAML::LoadFile(path));
    return params_mp::unpack_from_file(path);
}
