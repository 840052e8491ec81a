#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/encoding.hpp"
#include "common/logger.hpp"
#include "sdjwt/holder.hpp"
#include "sdjwt/issuer.hpp"
#include "sdjwt/verifier.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace sdjwt;
namespace fs = std::filesystem;

namespace {

auto& log() { return Logger::get("tool"); }

void print_usage(const char* prog) {
    std::cout << "SD-JWT test case generator\n\n"
              << "Usage:\n"
              << "  " << prog << " -s <settings.json> [-o <dir>] [<testcase.json>...]\n\n"
              << "Without test case arguments, every */specification.json below the\n"
              << "current directory is generated.\n\n"
              << "Options:\n"
              << "  -s, --settings <file>  Settings shared by all test cases (required)\n"
              << "  -o, --output <dir>     Write artifacts to <dir>/<test case name>/\n"
              << "                         (default: the directory of each test case)\n"
              << "  -q, --quiet            Suppress log output\n"
              << "  -h, --help             Show help\n\n"
              << "Artifacts:\n"
              << "  user_claims.json, sd_jwt_payload.json, sd_jwt_serialized.txt,\n"
              << "  combined_issuance.txt, hb_jwt_payload.json, hb_jwt_serialized.txt,\n"
              << "  combined_presentation.txt, verified_contents.json, disclosures.json,\n"
              << "  decoy_digests.json\n"
              << std::endl;
}

// Ed25519 seed derived from the settings seed and a role label
crypto::Ed25519Seed derive_seed(const std::string& random_seed, std::string_view role) {
    crypto::Ed25519Seed seed{};
    if (random_seed.empty()) {
        crypto::random_bytes(seed);
        return seed;
    }

    std::string material = random_seed;
    material.push_back(':');
    material.append(role);
    auto hashed = crypto::digest("sha-256", as_bytes(material));
    if (hashed && hashed->size() >= seed.size()) {
        std::copy_n(hashed->begin(), seed.size(), seed.begin());
    } else {
        log().error("Seed derivation for {} failed, using random key material", role);
        crypto::random_bytes(seed);
    }
    return seed;
}

struct DemoKeys {
    std::shared_ptr<Ed25519Signer> issuer;
    std::shared_ptr<Ed25519Signer> holder;
};

std::optional<DemoKeys> load_keys(const GeneratorSettings& settings) {
    auto issuer = Ed25519Signer::from_seed(derive_seed(settings.random_seed, "issuer"));
    auto holder = Ed25519Signer::from_seed(derive_seed(settings.random_seed, "holder"));
    if (!issuer || !holder) {
        return std::nullopt;
    }
    return DemoKeys{std::move(*issuer), std::move(*holder)};
}

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        log().error("Cannot write {}", path.string());
        return false;
    }
    out << content << '\n';
    return static_cast<bool>(out);
}

std::optional<std::vector<ClaimPath>> parse_paths(const std::vector<std::string>& pointers) {
    std::vector<ClaimPath> paths;
    for (const auto& p : pointers) {
        auto path = ClaimPath::parse(p);
        if (!path) {
            log().error("{}", path.error());
            return std::nullopt;
        }
        paths.push_back(std::move(*path));
    }
    return paths;
}

json::array disclosures_json(const std::vector<Disclosure>& disclosures) {
    json::array out;
    for (const auto& d : disclosures) {
        json::object entry;
        entry["digest"] = d.digest;
        entry["encoded"] = d.encoded;
        entry["salt"] = d.salt;
        if (d.key) entry["key"] = *d.key;
        entry["value"] = d.value;
        out.push_back(std::move(entry));
    }
    return out;
}

int generate(const fs::path& testcase_path, const GeneratorSettings& settings,
             const DemoKeys& keys, const std::optional<fs::path>& output_root) {
    auto tc = TestCase::load(testcase_path.string());
    if (!tc) {
        std::cerr << "Error: " << testcase_path.string() << ": "
                  << config_error_message(tc.error()) << "\n";
        return 1;
    }

    // Registered claims first, then the user claims
    json::object claims;
    claims["iss"] = settings.issuer;
    claims["iat"] = settings.iat;
    if (settings.exp != 0) claims["exp"] = settings.exp;
    for (const auto& kv : tc->user_claims) {
        claims[kv.key()] = kv.value();
    }

    // ---- Issuer ----
    IssuerOptions issuer_options;
    issuer_options.digest_algorithm = settings.digest_algorithm;
    if (!tc->sd_paths.empty()) {
        auto paths = parse_paths(tc->sd_paths);
        if (!paths) return 1;
        issuer_options.disclosure_policy = DisclosurePolicy::explicit_paths(std::move(*paths));
    }
    if (tc->add_decoy_claims) {
        issuer_options.decoy_policy = std::make_shared<RandomDecoys>(settings.decoy_min, settings.decoy_max);
    }

    std::optional<json::object> holder_jwk;
    if (tc->holder_binding) holder_jwk = keys.holder->public_jwk();

    auto issued = Issuer(issuer_options).issue(claims, *keys.issuer, holder_jwk);
    if (!issued) {
        std::cerr << "Error: issuance failed: " << error_code_to_string(issued.error()) << "\n";
        return 1;
    }

    // ---- Holder ----
    auto holder = Holder::parse(issued->combined);
    if (!holder) {
        std::cerr << "Error: holder could not parse the issuance: "
                  << error_code_to_string(holder.error()) << "\n";
        return 1;
    }

    DisclosureSelection selection;
    if (tc->discloses_everything()) {
        selection = DisclosureSelection::everything();
    } else {
        auto paths = parse_paths(tc->holder_disclosed_claims);
        if (!paths) return 1;
        selection = DisclosureSelection::of(std::move(*paths));
    }

    std::optional<HolderBindingRequest> binding;
    if (tc->holder_binding) {
        binding = HolderBindingRequest{settings.holder_binding_nonce, settings.verifier,
                                       keys.holder, settings.iat};
    }

    auto presentation = holder->create_presentation(selection, UnmatchedSelection::REJECT, binding);
    if (!presentation) {
        std::cerr << "Error: presentation failed: "
                  << error_code_to_string(presentation.error()) << "\n";
        return 1;
    }

    // ---- Verifier ----
    VerifierOptions verifier_options;
    verifier_options.clock_skew = settings.clock_skew;
    verifier_options.now = settings.iat;
    if (tc->holder_binding) {
        verifier_options.expected_audience = settings.verifier;
        verifier_options.expected_nonce = settings.holder_binding_nonce;
    }

    auto issuer_verifier = keys.issuer->verifier();
    IssuerKeyResolver resolve = [&](std::string_view iss)
        -> std::expected<std::shared_ptr<const SignatureVerifier>, ErrorCode> {
        if (iss == settings.issuer) return issuer_verifier;
        return std::unexpected(ErrorCode::UNKNOWN_ISSUER);
    };

    auto verified = Verifier(verifier_options).verify(presentation->combined, resolve);
    if (!verified) {
        std::cerr << "Error: verification failed: "
                  << error_code_name(verified.error()) << "\n";
        return 1;
    }

    // ---- Artifacts ----
    fs::path out_dir = output_root
        ? *output_root / TestCase::name_of(testcase_path.string())
        : testcase_path.parent_path();
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "Error: cannot create " << out_dir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    log().info("Writing test case data to '{}'", out_dir.string());

    bool ok = true;
    ok &= write_file(out_dir / "user_claims.json", json::serialize(tc->user_claims));
    ok &= write_file(out_dir / "sd_jwt_payload.json", json::serialize(issued->payload));
    ok &= write_file(out_dir / "sd_jwt_serialized.txt", issued->serialized_jws());
    ok &= write_file(out_dir / "combined_issuance.txt", issued->combined);
    if (presentation->binding_jwt) {
        ok &= write_file(out_dir / "hb_jwt_payload.json", json::serialize(presentation->binding_jwt->payload));
        ok &= write_file(out_dir / "hb_jwt_serialized.txt", presentation->binding_jwt->serialized);
    }
    ok &= write_file(out_dir / "combined_presentation.txt", presentation->combined);
    ok &= write_file(out_dir / "verified_contents.json", json::serialize(verified->claims));
    ok &= write_file(out_dir / "disclosures.json", json::serialize(disclosures_json(issued->disclosures)));
    if (tc->add_decoy_claims) {
        json::array decoys;
        for (const auto& d : issued->decoy_digests) decoys.emplace_back(d);
        ok &= write_file(out_dir / "decoy_digests.json", json::serialize(decoys));
    }

    return ok ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string settings_file;
    std::optional<fs::path> output_dir;
    bool quiet = false;
    std::vector<std::string> testcases;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-s" || arg == "--settings") {
            if (i + 1 < argc) settings_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) output_dir = fs::path(argv[++i]);
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            testcases.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (settings_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto settings = GeneratorSettings::load(settings_file);
    if (!settings) {
        std::cerr << "Error: Failed to load settings from '" << settings_file << "': "
                  << config_error_message(settings.error()) << "\n";
        return 1;
    }

    // Initialize logging
    LogConfig log_config;
    log_config.global_level = quiet ? LogLevel::OFF : log_level_from_string(settings->log_level);
    log_config.file_path = settings->log_file;
    if (!quiet) {
        for (const auto& [module, level] : settings->log_modules) {
            log_config.module_levels[module] = log_level_from_string(level);
        }
    }
    LogManager::instance().init(log_config);

    if (!crypto::init()) {
        std::cerr << "Error: Failed to initialize crypto\n";
        return 1;
    }

    auto keys = load_keys(*settings);
    if (!keys) {
        std::cerr << "Error: Failed to derive demo keys\n";
        return 1;
    }

    if (testcases.empty()) {
        auto discovered = TestCase::discover(".");
        if (!discovered) {
            std::cerr << "Error: " << config_error_message(discovered.error()) << "\n";
            return 1;
        }
        if (discovered->empty()) {
            std::cerr << "Error: no test cases given and no */"
                      << defaults::TEST_CASE_FILE_NAME << " found\n";
            return 1;
        }
        testcases = std::move(*discovered);
    }

    int failures = 0;
    for (const auto& tc : testcases) {
        log().info("Generating data for '{}'", tc);
        if (generate(tc, *settings, *keys, output_dir) != 0) {
            ++failures;
        }
    }

    LogManager::instance().flush();
    return failures == 0 ? 0 : 1;
}
