#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

std::expected<std::string, sdjwt::ConfigError> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(sdjwt::ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

namespace sdjwt {

namespace {
auto& log() { return Logger::get("common.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

// ============================================================================
// GeneratorSettings
// ============================================================================

std::expected<GeneratorSettings, ConfigError> GeneratorSettings::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<GeneratorSettings, ConfigError> GeneratorSettings::parse(const std::string& json_content) {
    GeneratorSettings settings;

    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        // identifiers section
        if (auto* ids = jsection(root, "identifiers")) {
            settings.issuer = jstr(*ids, "issuer");
            settings.verifier = jstr(*ids, "verifier");
        }

        settings.iat = jint(root, "iat", settings.iat);
        settings.exp = jint(root, "exp", settings.exp);
        settings.holder_binding_nonce = jstr(root, "holder_binding_nonce");
        settings.digest_algorithm = jstr(root, "digest_algorithm", settings.digest_algorithm);
        settings.signature_algorithm = jstr(root, "signature_algorithm", settings.signature_algorithm);
        settings.random_seed = jstr(root, "random_seed");

        // decoys section
        if (auto* decoys = jsection(root, "decoys")) {
            auto min = jint(*decoys, "min", static_cast<int64_t>(settings.decoy_min));
            auto max = jint(*decoys, "max", static_cast<int64_t>(settings.decoy_max));
            if (min < 0 || max < 0) {
                log().error("decoys.min ({}) and decoys.max ({}) must not be negative", min, max);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            settings.decoy_min = static_cast<size_t>(min);
            settings.decoy_max = static_cast<size_t>(max);
        }

        if (auto skew = jint(root, "clock_skew_seconds", -1); skew >= 0) {
            settings.clock_skew = std::chrono::seconds(skew);
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            settings.log_level = jstr(*log_sec, "level", settings.log_level);
            settings.log_file = jstr(*log_sec, "file", settings.log_file);
            if (auto* modules = jsection(*log_sec, "modules")) {
                for (const auto& kv : *modules) {
                    if (!kv.value().is_string()) {
                        log().error("log.modules.{} must be a level name", std::string(kv.key()));
                        return std::unexpected(ConfigError::INVALID_VALUE);
                    }
                    settings.log_modules[std::string(kv.key())] = std::string(kv.value().as_string());
                }
            }
        }

    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    if (settings.issuer.empty() || settings.verifier.empty()) {
        log().error("identifiers.issuer and identifiers.verifier are required");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (!crypto::is_supported_digest(settings.digest_algorithm)) {
        log().error("Unsupported digest_algorithm: {}", settings.digest_algorithm);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (settings.signature_algorithm != "EdDSA") {
        log().error("Unsupported signature_algorithm: {}", settings.signature_algorithm);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (settings.decoy_min > settings.decoy_max) {
        log().error("decoys.min ({}) exceeds decoys.max ({})", settings.decoy_min, settings.decoy_max);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (settings.exp != 0 && settings.exp <= settings.iat) {
        log().error("exp ({}) must be later than iat ({})", settings.exp, settings.iat);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    return settings;
}

// ============================================================================
// TestCase
// ============================================================================

bool TestCase::discloses_everything() const {
    return holder_disclosed_claims.size() == 1 && holder_disclosed_claims.front() == "*";
}

std::expected<TestCase, ConfigError> TestCase::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<TestCase, ConfigError> TestCase::parse(const std::string& json_content) {
    TestCase tc;

    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        auto* claims = jsection(root, "user_claims");
        if (!claims) {
            log().error("Test case has no user_claims object");
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }
        tc.user_claims = *claims;

        if (auto* paths = jarray(root, "sd_paths")) {
            for (const auto& p : *paths) {
                if (!p.is_string()) {
                    log().error("sd_paths entries must be strings");
                    return std::unexpected(ConfigError::INVALID_VALUE);
                }
                tc.sd_paths.emplace_back(p.as_string().data(), p.as_string().size());
            }
        }

        // A single string is shorthand for a one-element list
        if (auto it = root.find("holder_disclosed_claims"); it != root.end()) {
            if (it->value().is_string()) {
                tc.holder_disclosed_claims.emplace_back(it->value().as_string().data(), it->value().as_string().size());
            } else if (it->value().is_array()) {
                for (const auto& p : it->value().as_array()) {
                    if (!p.is_string()) {
                        log().error("holder_disclosed_claims entries must be strings");
                        return std::unexpected(ConfigError::INVALID_VALUE);
                    }
                    tc.holder_disclosed_claims.emplace_back(p.as_string().data(), p.as_string().size());
                }
            } else {
                log().error("holder_disclosed_claims must be a string or an array");
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
        }

        tc.holder_binding = jbool(root, "holder_binding");
        tc.add_decoy_claims = jbool(root, "add_decoy_claims");

    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Test case parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    return tc;
}

std::expected<std::vector<std::string>, ConfigError> TestCase::discover(const std::string& base_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        log().error("Test case directory not found: {}", base_dir);
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::vector<std::string> found;
    for (fs::directory_iterator it(base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) continue;
        auto candidate = it->path() / defaults::TEST_CASE_FILE_NAME;
        if (fs::is_regular_file(candidate, ec)) {
            found.push_back(candidate.string());
        }
    }
    if (ec) {
        log().error("Cannot scan {}: {}", base_dir, ec.message());
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::sort(found.begin(), found.end());
    log().debug("Discovered {} test case(s) under {}", found.size(), base_dir);
    return found;
}

std::string TestCase::name_of(const std::string& path) {
    std::filesystem::path p(path);
    if (p.filename() == defaults::TEST_CASE_FILE_NAME && p.has_parent_path()) {
        return p.parent_path().filename().string();
    }
    return p.stem().string();
}

} // namespace sdjwt
