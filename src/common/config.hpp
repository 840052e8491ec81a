#pragma once

#include "common/constants.hpp"
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sdjwt {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Generator Settings
// ============================================================================
// Shared by every test case of one sdjwt-generate run.

struct GeneratorSettings {
    // identifiers section
    std::string issuer;
    std::string verifier;

    // Registered claims added to every credential
    int64_t iat = 0;
    int64_t exp = 0;

    std::string holder_binding_nonce;

    std::string digest_algorithm{format::DEFAULT_DIGEST_ALG};
    std::string signature_algorithm = "EdDSA";

    // decoys section, used by test cases with add_decoy_claims
    size_t decoy_min = defaults::DECOY_MIN_ELEMENTS;
    size_t decoy_max = defaults::DECOY_MAX_ELEMENTS;

    std::chrono::seconds clock_skew{defaults::CLOCK_SKEW};

    // Seeds the issuer and holder keys so repeated runs keep the same keys
    std::string random_seed;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::map<std::string, std::string> log_modules;  // module -> level

    // Load from JSON file
    static std::expected<GeneratorSettings, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<GeneratorSettings, ConfigError> parse(const std::string& json_content);
};

// ============================================================================
// Test Case
// ============================================================================

struct TestCase {
    boost::json::object user_claims;

    // JSON pointers of the claims to make selectively disclosable;
    // empty means every top-level claim
    std::vector<std::string> sd_paths;

    // JSON pointers the holder reveals; "*" reveals everything
    std::vector<std::string> holder_disclosed_claims;

    bool holder_binding = false;
    bool add_decoy_claims = false;

    bool discloses_everything() const;

    static std::expected<TestCase, ConfigError> load(const std::string& path);
    static std::expected<TestCase, ConfigError> parse(const std::string& json_content);

    // Every <base_dir>/*/specification.json, sorted by path
    static std::expected<std::vector<std::string>, ConfigError> discover(const std::string& base_dir);

    // Directory name for specification.json files, file stem otherwise
    static std::string name_of(const std::string& path);
};

} // namespace sdjwt
