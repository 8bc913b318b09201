#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <openssl/evp.h>
#include <string>
#include <vector>

// ── Key decoding ──────────────────────────────────────────────────────────────

// Base64 via OpenSSL EVP_DecodeBlock. Whitespace is ignored (literal block
// scalars carry newlines); padding bytes are trimmed from the output.
static Key decode_b64_key(const std::string& raw) {
    std::string clean;
    clean.reserve(raw.size());
    for (char c : raw) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t')
            clean += c;
    }
    if (clean.empty() || clean.size() % 4 != 0)
        throw ConfigError("config: 'key' is not valid base64");

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(clean.data()),
                              static_cast<int>(clean.size()));
    if (len < 0)
        throw ConfigError("config: 'key' is not valid base64");

    size_t pad = 0;
    if (clean[clean.size() - 1] == '=') ++pad;
    if (clean[clean.size() - 2] == '=') ++pad;
    out.resize(static_cast<size_t>(len) - pad);
    return Key(out.begin(), out.end());
}

// ── Field access ──────────────────────────────────────────────────────────────

static std::string require_scalar(const YAML::Node& doc, const char* field) {
    YAML::Node n = doc[field];
    if (!n || !n.IsScalar())
        throw ConfigError(std::string("config: missing or non-scalar '") + field + "'");
    return n.Scalar();
}

static guard::ProtectionConfig config_from_node(const YAML::Node& doc) {
    if (!doc.IsMap())
        throw ConfigError("config: document must be a map");

    guard::ProtectionConfig cfg;

    bool has_key  = static_cast<bool>(doc["key"]);
    bool has_text = static_cast<bool>(doc["key-text"]);
    if (has_key == has_text)
        throw ConfigError("config: exactly one of 'key' or 'key-text' is required");
    cfg.key = has_key ? decode_b64_key(require_scalar(doc, "key"))
                      : key_from_text(require_scalar(doc, "key-text"));
    if (cfg.key.empty())
        throw ConfigError("config: key must be non-empty");

    try {
        cfg.zeta = Integer::from_dec(require_scalar(doc, "zeta"));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("config: 'zeta': ") + e.what());
    }
    if (cfg.zeta.is_negative())
        throw ConfigError("config: 'zeta' must be non-negative");

    try {
        cfg.eta = doc["eta"].as<int>();
    } catch (const YAML::Exception&) {
        throw ConfigError("config: missing or non-integer 'eta'");
    }
    if (cfg.eta <= 0)
        throw ConfigError("config: 'eta' must be > 0");

    if (doc["on-tamper"])
        cfg.on_tamper = guard::parse_policy(require_scalar(doc, "on-tamper"));

    return cfg;
}

// ── Entry points ──────────────────────────────────────────────────────────────

guard::ProtectionConfig parse_config(const std::string& yaml_text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config: YAML parse error: ") + e.what());
    }
    return config_from_node(doc);
}

guard::ProtectionConfig load_config(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("config " + path + ": YAML parse error: " + e.what());
    }
    return config_from_node(doc);
}
