/*
 * test_security_config.cpp - Tests for the security configuration section
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <map>

#include "config/sections/security_config.hpp"

using namespace rampart::config;

namespace {

constexpr const char* STRONG_KEY = "0123456789abcdef0123456789abcdef";

auto environment(std::map<std::string, std::string> values)
    -> SecurityConfig::EnvironmentReader {
    return [values = std::move(values)](
               const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

auto validConfig() -> SecurityConfig {
    SecurityConfig cfg;
    cfg.secretKey = STRONG_KEY;
    cfg.allowedHosts = {"example.com", ".example.com"};
    return cfg;
}

}  // namespace

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(SecurityConfigTest, Defaults) {
    auto cfg = SecurityConfig::defaults();
    EXPECT_TRUE(cfg.secretKey.empty());
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.allowedHosts,
              (std::vector<std::string>{"localhost", "127.0.0.1"}));
    EXPECT_EQ(cfg.csrfHeader, "X-CSRF-Token");
    EXPECT_EQ(cfg.csrfField, "csrf_token");
    EXPECT_TRUE(cfg.sanitizeInputs);
    EXPECT_FALSE(cfg.sanitizeFailClosed);
    EXPECT_EQ(SecurityConfig::path(), "/rampart/security");
}

TEST(SecurityConfigTest, FromJsonOverridesGivenKeys) {
    json j = {{"secretKey", STRONG_KEY},
              {"allowedHosts", {".example.com"}},
              {"sanitizeFailClosed", true},
              {"hardenedHeaders", true},
              {"extraHeaders",
               json::array({{{"name", "X-Powered-By"}, {"value", "rampart"}}})}};

    auto cfg = SecurityConfig::fromJson(j);
    EXPECT_EQ(cfg.secretKey, STRONG_KEY);
    EXPECT_EQ(cfg.allowedHosts, std::vector<std::string>{".example.com"});
    EXPECT_TRUE(cfg.sanitizeFailClosed);
    EXPECT_TRUE(cfg.sanitizeInputs);
    EXPECT_TRUE(cfg.hardenedHeaders);
    ASSERT_EQ(cfg.extraHeaders.size(), 1u);
    EXPECT_EQ(cfg.extraHeaders[0].first, "X-Powered-By");
}

TEST(SecurityConfigTest, JsonRoundTrip) {
    auto cfg = validConfig();
    cfg.csp.useNonce = true;
    cfg.extraHeaders = {{"X-A", "1"}};

    auto restored = SecurityConfig::fromJson(cfg.toJson());
    EXPECT_EQ(restored.toJson(), cfg.toJson());
}

TEST(SecurityConfigTest, WrongShapesAreRejected) {
    EXPECT_THROW((void)SecurityConfig::fromJson({{"allowedHosts", "x"}}),
                 InvalidConfigException);
    EXPECT_THROW((void)SecurityConfig::fromJson({{"extraHeaders", 1}}),
                 InvalidConfigException);
    EXPECT_FALSE(SecurityConfig::tryFromJson({{"debug", "yes"}}).has_value());
    EXPECT_FALSE(
        SecurityConfig::tryFromJson({{"allowedHosts", "x"}}).has_value());
}

TEST(SecurityConfigTest, SchemaRequiresSecret) {
    auto schema = SecurityConfig::schema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["required"][0], "secretKey");
    EXPECT_TRUE(schema["properties"].contains("allowedHosts"));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(SecurityConfigValidateTest, ValidConfigPasses) {
    auto result = validConfig().validate();
    EXPECT_TRUE(result.isValid());
    EXPECT_TRUE(result.errors.empty());
}

TEST(SecurityConfigValidateTest, MissingSecret) {
    SecurityConfig cfg;
    auto result = cfg.validate();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.errors[0].path, "/rampart/security/secretKey");
    EXPECT_EQ(result.errors[0].keyword, "required");
}

TEST(SecurityConfigValidateTest, ShortSecretOnlyAllowedInDebug) {
    auto cfg = validConfig();
    cfg.secretKey = "short";
    EXPECT_FALSE(cfg.validate());

    cfg.debug = true;
    EXPECT_TRUE(cfg.validate());
}

TEST(SecurityConfigValidateTest, HostList) {
    auto cfg = validConfig();
    cfg.allowedHosts = {"example.com", " "};
    auto result = cfg.validate();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.errors[0].path, "/rampart/security/allowedHosts/1");

    cfg.allowedHosts.clear();
    EXPECT_FALSE(cfg.validate());
    cfg.debug = true;
    EXPECT_TRUE(cfg.validate());
}

TEST(SecurityConfigValidateTest, EmptyNames) {
    auto cfg = validConfig();
    cfg.csrfHeader.clear();
    cfg.csrfField.clear();
    cfg.extraHeaders = {{"", "x"}};
    auto result = cfg.validate();
    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_NE(result.summary().find("csrfHeader"), std::string::npos);
}

// ============================================================================
// Environment Tests
// ============================================================================

TEST(SecurityConfigEnvironmentTest, OverridesFields) {
    SecurityConfig cfg;
    cfg.applyEnvironment(environment({
        {"RAMPART_SECRET_KEY", STRONG_KEY},
        {"RAMPART_ALLOWED_HOSTS", " example.com, .api.example.com ,,"},
        {"RAMPART_DEBUG", "TRUE"},
        {"RAMPART_SANITIZE_INPUTS", "off"},
        {"RAMPART_SANITIZE_FAIL_CLOSED", "1"},
        {"RAMPART_CSP_NONCE", "yes"},
    }));

    EXPECT_EQ(cfg.secretKey, STRONG_KEY);
    EXPECT_EQ(cfg.allowedHosts,
              (std::vector<std::string>{"example.com", ".api.example.com"}));
    EXPECT_TRUE(cfg.debug);
    EXPECT_FALSE(cfg.sanitizeInputs);
    EXPECT_TRUE(cfg.sanitizeFailClosed);
    EXPECT_TRUE(cfg.csp.useNonce);
}

TEST(SecurityConfigEnvironmentTest, UnsetVariablesKeepValues) {
    auto cfg = validConfig();
    cfg.applyEnvironment(environment({}));
    EXPECT_EQ(cfg.secretKey, STRONG_KEY);
    EXPECT_EQ(cfg.allowedHosts.size(), 2u);
}

TEST(SecurityConfigEnvironmentTest, InvalidBooleanIsIgnored) {
    SecurityConfig cfg;
    cfg.applyEnvironment(environment({{"RAMPART_DEBUG", "maybe"}}));
    EXPECT_FALSE(cfg.debug);
}

// ============================================================================
// Compilation Tests
// ============================================================================

TEST(SecurityConfigCompileTest, BuildsPolicy) {
    auto cfg = validConfig();
    cfg.sanitizeFailClosed = true;
    cfg.extraHeaders = {{"X-Frame-Options", "SAMEORIGIN"}};

    auto policy = cfg.compile();
    EXPECT_EQ(policy.secretKey, STRONG_KEY);
    EXPECT_FALSE(policy.debug);
    EXPECT_FALSE(policy.hosts.bypass());
    EXPECT_TRUE(policy.hosts.isAllowed("api.example.com"));
    EXPECT_FALSE(policy.hosts.isAllowed("evil.com"));
    EXPECT_TRUE(policy.sanitizer.policy().failClosed);

    rampart::utils::HeaderMap headers;
    policy.headers.inject(headers);
    EXPECT_EQ(headers.get("X-Frame-Options"), "SAMEORIGIN");
    EXPECT_FALSE(headers.contains("Referrer-Policy"));
}

TEST(SecurityConfigCompileTest, DebugBypassesHosts) {
    SecurityConfig cfg;
    cfg.secretKey = "dev";
    cfg.debug = true;
    cfg.allowedHosts.clear();

    auto policy = cfg.compile();
    EXPECT_TRUE(policy.hosts.bypass());
    EXPECT_TRUE(policy.hosts.isAllowed("anything.test"));
}

TEST(SecurityConfigCompileTest, HardenedHeaders) {
    auto cfg = validConfig();
    cfg.hardenedHeaders = true;
    rampart::utils::HeaderMap headers;
    cfg.compile().headers.inject(headers);
    EXPECT_TRUE(headers.contains("Referrer-Policy"));
    EXPECT_TRUE(headers.contains("Cross-Origin-Resource-Policy"));
}

TEST(SecurityConfigCompileTest, InvalidConfigThrows) {
    SecurityConfig cfg;
    EXPECT_THROW((void)cfg.compile(), InvalidConfigException);

    try {
        (void)cfg.compile();
        FAIL() << "compile() accepted an empty secret";
    } catch (const BadConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("secretKey"), std::string::npos);
    }
}
