#include <gtest/gtest.h>
#include "common/config.hpp"
#include <filesystem>
#include <fstream>

using namespace sdjwt;

namespace {
constexpr const char* MINIMAL_SETTINGS = R"({
    "identifiers": {
        "issuer": "https://example.com/issuer",
        "verifier": "https://example.com/verifier"
    }
})";
} // anonymous namespace

TEST(GeneratorSettingsTest, Defaults) {
    auto settings = GeneratorSettings::parse(MINIMAL_SETTINGS);
    ASSERT_TRUE(settings.has_value());

    EXPECT_EQ(settings->issuer, "https://example.com/issuer");
    EXPECT_EQ(settings->verifier, "https://example.com/verifier");
    EXPECT_EQ(settings->iat, 0);
    EXPECT_EQ(settings->exp, 0);
    EXPECT_EQ(settings->digest_algorithm, "sha-256");
    EXPECT_EQ(settings->signature_algorithm, "EdDSA");
    EXPECT_EQ(settings->decoy_min, 2u);
    EXPECT_EQ(settings->decoy_max, 5u);
    EXPECT_EQ(settings->clock_skew, std::chrono::seconds(60));
    EXPECT_TRUE(settings->random_seed.empty());
    EXPECT_EQ(settings->log_level, "info");
}

TEST(GeneratorSettingsTest, AllSections) {
    auto settings = GeneratorSettings::parse(R"({
        "identifiers": {
            "issuer": "https://example.com/issuer",
            "verifier": "https://example.com/verifier"
        },
        "iat": 1683000000,
        "exp": 1883000000,
        "holder_binding_nonce": "XZOUco1u_gEPknxS78sWWg",
        "digest_algorithm": "sha-384",
        "random_seed": "deterministic-demo",
        "clock_skew_seconds": 0,
        "decoys": {"min": 1, "max": 3},
        "log": {
            "level": "debug",
            "file": "generate.log",
            "modules": {"sdjwt.verifier": "trace", "common.config": "off"}
        }
    })");
    ASSERT_TRUE(settings.has_value());

    EXPECT_EQ(settings->iat, 1683000000);
    EXPECT_EQ(settings->exp, 1883000000);
    EXPECT_EQ(settings->holder_binding_nonce, "XZOUco1u_gEPknxS78sWWg");
    EXPECT_EQ(settings->digest_algorithm, "sha-384");
    EXPECT_EQ(settings->random_seed, "deterministic-demo");
    EXPECT_EQ(settings->clock_skew, std::chrono::seconds(0));
    EXPECT_EQ(settings->decoy_min, 1u);
    EXPECT_EQ(settings->decoy_max, 3u);
    EXPECT_EQ(settings->log_level, "debug");
    EXPECT_EQ(settings->log_file, "generate.log");
    ASSERT_EQ(settings->log_modules.size(), 2u);
    EXPECT_EQ(settings->log_modules.at("sdjwt.verifier"), "trace");
}

TEST(GeneratorSettingsTest, MissingIdentifiers) {
    EXPECT_EQ(GeneratorSettings::parse("{}").error(), ConfigError::MISSING_REQUIRED);
    EXPECT_EQ(GeneratorSettings::parse(R"({"identifiers": {"issuer": "x"}})").error(),
              ConfigError::MISSING_REQUIRED);
}

TEST(GeneratorSettingsTest, InvalidValues) {
    auto with = [](const std::string& extra) {
        return GeneratorSettings::parse(
            R"({"identifiers": {"issuer": "i", "verifier": "v"}, )" + extra + "}");
    };

    EXPECT_EQ(with(R"("digest_algorithm": "md5")").error(), ConfigError::INVALID_VALUE);
    EXPECT_EQ(with(R"("signature_algorithm": "RS256")").error(), ConfigError::INVALID_VALUE);
    EXPECT_EQ(with(R"("decoys": {"min": 6, "max": 2})").error(), ConfigError::INVALID_VALUE);
    EXPECT_EQ(with(R"("decoys": {"min": -1, "max": -1})").error(), ConfigError::INVALID_VALUE);
    EXPECT_EQ(with(R"("decoys": {"min": 0, "max": -3})").error(), ConfigError::INVALID_VALUE);
    EXPECT_TRUE(with(R"("decoys": {"min": 0, "max": 0})").has_value());
    EXPECT_EQ(with(R"("iat": 100, "exp": 100)").error(), ConfigError::INVALID_VALUE);
    EXPECT_EQ(with(R"("log": {"modules": {"sdjwt": 3}})").error(), ConfigError::INVALID_VALUE);
    EXPECT_TRUE(with(R"("iat": 100, "exp": 101)").has_value());
}

TEST(GeneratorSettingsTest, ParseErrors) {
    EXPECT_EQ(GeneratorSettings::parse("not json").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(GeneratorSettings::parse("[1, 2, 3]").error(), ConfigError::PARSE_ERROR);
}

TEST(GeneratorSettingsTest, LoadFromFile) {
    EXPECT_EQ(GeneratorSettings::load("/nonexistent/settings.json").error(), ConfigError::FILE_NOT_FOUND);

    auto path = std::filesystem::temp_directory_path() / "sdjwt_settings_test.json";
    {
        std::ofstream out(path);
        out << MINIMAL_SETTINGS;
    }
    auto settings = GeneratorSettings::load(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->issuer, "https://example.com/issuer");
}

TEST(TestCaseTest, FullCase) {
    auto tc = TestCase::parse(R"({
        "user_claims": {
            "given_name": "Alice",
            "address": {"locality": "Anytown"}
        },
        "sd_paths": ["/given_name", "/address/locality"],
        "holder_disclosed_claims": ["/given_name"],
        "holder_binding": true,
        "add_decoy_claims": true
    })");
    ASSERT_TRUE(tc.has_value());

    EXPECT_EQ(tc->user_claims.at("given_name").as_string(), "Alice");
    ASSERT_EQ(tc->sd_paths.size(), 2u);
    EXPECT_EQ(tc->sd_paths[1], "/address/locality");
    ASSERT_EQ(tc->holder_disclosed_claims.size(), 1u);
    EXPECT_EQ(tc->holder_disclosed_claims[0], "/given_name");
    EXPECT_FALSE(tc->discloses_everything());
    EXPECT_TRUE(tc->holder_binding);
    EXPECT_TRUE(tc->add_decoy_claims);
}

TEST(TestCaseTest, MinimalCase) {
    auto tc = TestCase::parse(R"({"user_claims": {"sub": "user_42"}})");
    ASSERT_TRUE(tc.has_value());
    EXPECT_TRUE(tc->sd_paths.empty());
    EXPECT_TRUE(tc->holder_disclosed_claims.empty());
    EXPECT_FALSE(tc->holder_binding);
    EXPECT_FALSE(tc->add_decoy_claims);
}

TEST(TestCaseTest, DiscloseEverythingShorthand) {
    auto tc = TestCase::parse(R"({"user_claims": {}, "holder_disclosed_claims": "*"})");
    ASSERT_TRUE(tc.has_value());
    EXPECT_TRUE(tc->discloses_everything());
}

TEST(TestCaseTest, Rejects) {
    EXPECT_EQ(TestCase::parse(R"({"sd_paths": []})").error(), ConfigError::MISSING_REQUIRED);
    EXPECT_EQ(TestCase::parse(R"({"user_claims": {}, "sd_paths": [1]})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(TestCase::parse(R"({"user_claims": {}, "holder_disclosed_claims": 5})").error(),
              ConfigError::INVALID_VALUE);
    EXPECT_EQ(TestCase::parse("{").error(), ConfigError::PARSE_ERROR);
}

TEST(ConfigErrorTest, Messages) {
    EXPECT_EQ(config_error_message(ConfigError::FILE_NOT_FOUND), "Configuration file not found");
    EXPECT_EQ(config_error_message(ConfigError::MISSING_REQUIRED), "Missing required configuration");
}

TEST(TestCaseTest, DiscoverSpecificationFiles) {
    namespace fs = std::filesystem;
    auto base = fs::temp_directory_path() / "sdjwt_discover_test";
    fs::remove_all(base);
    fs::create_directories(base / "simple");
    fs::create_directories(base / "address_only");
    fs::create_directories(base / "no_spec");
    for (const auto* dir : {"simple", "address_only"}) {
        std::ofstream(base / dir / "specification.json") << R"({"user_claims": {}})";
    }
    std::ofstream(base / "no_spec" / "other.json") << "{}";
    std::ofstream(base / "specification.json") << "{}";

    auto found = TestCase::discover(base.string());
    fs::remove_all(base);

    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->size(), 2u);
    EXPECT_EQ((*found)[0], (base / "address_only" / "specification.json").string());
    EXPECT_EQ((*found)[1], (base / "simple" / "specification.json").string());

    EXPECT_EQ(TestCase::discover("/nonexistent/testcases").error(), ConfigError::FILE_NOT_FOUND);
}

TEST(TestCaseTest, NameOf) {
    EXPECT_EQ(TestCase::name_of("cases/array_of_nationalities/specification.json"), "array_of_nationalities");
    EXPECT_EQ(TestCase::name_of("cases/simple.json"), "simple");
}
