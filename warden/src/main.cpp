#include "config.hpp"
#include "params_io.hpp"
#include "params_pack.hpp"
#include "guard.hpp"
#include "controller.hpp"
#include "encoder.hpp"
#include "digits.hpp"
#include "errors.hpp"

#include <iostream>
#include <string>
#include <cstring>
#include <optional>
#include <stdexcept>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " prepare --config <file> [--out <file>] <params-file>\n"
        "  " << prog << " verify  --config <file> <params-file>\n"
        "  " << prog << " restore --config <file> [--out <file>] <params-file>\n"
        "  " << prog << " demo\n"
        "\n"
        "  --config   YAML protection config (key or key-text, zeta, eta, on-tamper)\n"
        "  --out      Write binary msgpack params to file; prints summary to stdout\n"
        "\n"
        "  prepare: embed the configured code into <params-file>; YAML to stdout\n"
        "  verify:  rebuild the watermark from <params-file> and check the code\n"
        "  restore: authenticate <params-file> under the configured tamper policy\n"
        "           and emit the parameters handed to the protected computation\n"
        "  demo:    self-contained prepare / protected call / tamper walkthrough\n"
        "\n"
        "Params files are YAML or msgpack (auto-detected).\n"
        "Exit codes: 0=ok, 1=usage, 2=watermark/config, 3=I/O, 4=authentication failed\n";
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static void print_summary(const ParamList& params, const std::string& path) {
    std::cout << "Params written:\n"
              << "  file:   " << path          << "\n"
              << "  values: " << params.size() << "\n"
              << "  pairs:  " << params.size() / 2 << "\n";
}

static int emit_params(const ParamList& params, const std::string& out_file) {
    if (!out_file.empty()) {
        try {
            params_mp::pack_to_file(params, out_file);
        } catch (const std::exception& e) {
            std::cerr << "Error: msgpack write failed: " << e.what() << "\n";
            return 3;
        }
        print_summary(params, out_file);
        return 0;
    }
    try {
        std::cout << emit_params_yaml(params);
    } catch (const std::exception& e) {
        std::cerr << "Error: YAML output failed: " << e.what() << "\n";
        return 3;
    }
    return 0;
}

// Loads config and params; returns 0 or the exit code to stop with.
static int load_inputs(const std::string& config_path, const std::string& params_path,
                       guard::ProtectionConfig& cfg, ParamList& params)
{
    try {
        cfg = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Error: invalid config: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load config: " << e.what() << "\n";
        return 3;
    }

    try {
        params = load_params(params_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load params: " << e.what() << "\n";
        return 3;
    }
    return 0;
}

static void print_result(const controller::VerificationResult& vr) {
    std::cout << "authentic:      " << (vr.is_authentic ? "yes" : "no") << "\n";
    if (vr.recovered_zeta)
        std::cout << "recovered code: " << *vr.recovered_zeta << "\n";
    if (vr.recovered_zeta6) {
        std::cout << "recovered base6:";
        for (int d : *vr.recovered_zeta6) std::cout << " " << d;
        std::cout << "\n";
    }
    if (vr.error)
        std::cout << "error:          " << *vr.error << "\n";
}

// ── prepare command ───────────────────────────────────────────────────────────

static int cmd_prepare(const std::string& config_path, const std::string& params_path,
                       const std::string& out_file)
{
    guard::ProtectionConfig cfg;
    ParamList params;
    if (int rc = load_inputs(config_path, params_path, cfg, params))
        return rc;

    if (!wm_graph::round_trips(digits::to_digits(cfg.zeta, 6)))
        std::cerr << "Warning: code " << cfg.zeta
                  << " has a base-6 digit larger than its digit count;"
                     " verification of this code will always fail\n";

    ParamList watermarked;
    try {
        watermarked = guard::prepare(params, cfg.key, cfg.zeta, cfg.eta);
    } catch (const std::exception& e) {
        std::cerr << "Error: watermark embedding failed: " << e.what() << "\n";
        return 2;
    }
    return emit_params(watermarked, out_file);
}

// ── verify command ────────────────────────────────────────────────────────────

static int cmd_verify(const std::string& config_path, const std::string& params_path) {
    guard::ProtectionConfig cfg;
    ParamList params;
    if (int rc = load_inputs(config_path, params_path, cfg, params))
        return rc;

    controller::VerificationResult vr;
    try {
        encoder::AuthenticationBuild build =
            encoder::build_watermark_graph(params, cfg.key, cfg.eta);
        vr = controller::verify(build.graph, cfg.zeta);
    } catch (const std::exception& e) {
        std::cerr << "Error: watermark rebuild failed: " << e.what() << "\n";
        return 2;
    }

    print_result(vr);
    return vr.is_authentic ? 0 : 4;
}

// ── restore command ───────────────────────────────────────────────────────────

static int cmd_restore(const std::string& config_path, const std::string& params_path,
                       const std::string& out_file)
{
    guard::ProtectionConfig cfg;
    ParamList params;
    if (int rc = load_inputs(config_path, params_path, cfg, params))
        return rc;

    std::optional<ParamList> handed;
    try {
        handed = guard::call_protected(cfg, params,
                                       [](const ParamList& p) { return p; });
    } catch (const AuthenticationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "Error: watermark rebuild failed: " << e.what() << "\n";
        return 2;
    }

    if (!handed) {
        std::cerr << "Error: authentication failed (policy "
                  << guard::policy_name(cfg.on_tamper) << ")\n";
        return 4;
    }
    return emit_params(*handed, out_file);
}

// ── demo command ──────────────────────────────────────────────────────────────

static int cmd_demo() {
    guard::ProtectionConfig cfg;
    cfg.key       = key_from_text("demo-key-32bytes-minimum---ok");
    cfg.zeta      = Integer(123456789);
    cfg.eta       = 32;
    cfg.on_tamper = guard::TamperPolicy::Raise;

    // Toy workload: sum of the values at even indices.
    auto sum_even_indexed = guard::protect(cfg, [](const ParamList& p) {
        Integer sum;
        for (size_t i = 0; i < p.size(); i += 2) sum += p[i];
        return sum;
    });

    ParamList original = params_range(1, 513);
    ParamList watermarked;
    try {
        watermarked = guard::prepare(original, cfg.key, cfg.zeta, cfg.eta);
    } catch (const std::exception& e) {
        std::cerr << "Error: watermark embedding failed: " << e.what() << "\n";
        return 2;
    }

    std::cout << "Original params length: " << original.size() << "\n";
    std::cout << "Calling protected function with authentic watermarked params...\n";
    try {
        std::cout << "Result: " << *sum_even_indexed(watermarked) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: authentic call rejected: " << e.what() << "\n";
        return 4;
    }

    ParamList tampered = watermarked;
    tampered[33] += Integer(tampered[33].is_odd() ? -1 : 1);
    std::cout << "\nCalling protected function with tampered params (index 33 flipped)...\n";
    try {
        std::cout << "Result: " << *sum_even_indexed(tampered) << "\n";
    } catch (const AuthenticationError& e) {
        std::cout << "Tamper detected: " << e.what() << "\n";
        return 0;
    }
    std::cerr << "Error: tampered call was not detected\n";
    return 4;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "demo")
        return cmd_demo();

    if (cmd != "prepare" && cmd != "verify" && cmd != "restore") {
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path;
    std::string out_file;
    std::string params_path;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (std::strcmp(argv[i], "--out") == 0 && cmd != "verify") {
            if (++i >= argc) { std::cerr << "Error: --out requires a filename\n"; return 1; }
            out_file = argv[i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option '" << argv[i] << "'\n";
            return 1;
        } else {
            if (!params_path.empty()) {
                std::cerr << "Error: unexpected argument '" << argv[i] << "'\n";
                return 1;
            }
            params_path = argv[i];
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        return 1;
    }
    if (params_path.empty()) {
        std::cerr << "Error: <params-file> is required\n";
        return 1;
    }

    if (cmd == "prepare")
        return cmd_prepare(config_path, params_path, out_file);
    if (cmd == "verify")
        return cmd_verify(config_path, params_path);
    return cmd_restore(config_path, params_path, out_file);
}
