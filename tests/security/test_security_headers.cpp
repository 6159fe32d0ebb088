/*
 * test_security_headers.cpp - Tests for CSP and security header injection
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "security/crypto.hpp"
#include "security/security_headers.hpp"

using namespace rampart::security;
using rampart::utils::HeaderMap;

// ============================================================================
// Content Security Policy Tests
// ============================================================================

TEST(ContentSecurityPolicyTest, DefaultHeaderValue) {
    auto csp = ContentSecurityPolicy::defaults();
    EXPECT_EQ(csp.toHeaderValue(),
              "default-src 'self'; script-src 'self'; style-src 'self'; "
              "img-src 'self' data:; font-src 'self'; connect-src 'self'; "
              "frame-ancestors 'none'; base-uri 'self'; form-action 'self'");
    EXPECT_EQ(csp.headerName(), "Content-Security-Policy");
}

TEST(ContentSecurityPolicyTest, NonceReplacesUnsafeInline) {
    ContentSecurityPolicy csp;
    csp.setDirective("script-src", {"'self'", "'unsafe-inline'"})
        .setDirective("img-src", {"'unsafe-inline'"});

    EXPECT_EQ(csp.toHeaderValue("abc"),
              "script-src 'self' 'nonce-abc'; img-src 'unsafe-inline'");
    EXPECT_EQ(csp.toHeaderValue(),
              "script-src 'self' 'unsafe-inline'; img-src 'unsafe-inline'");
}

TEST(ContentSecurityPolicyTest, EmptyDirectivesAreSkipped) {
    ContentSecurityPolicy csp;
    csp.setDirective("default-src", {"'none'"}).setDirective("script-src", {});
    EXPECT_EQ(csp.toHeaderValue(), "default-src 'none'");
}

TEST(ContentSecurityPolicyTest, SetDirectiveReplacesInPlace) {
    auto csp = ContentSecurityPolicy::defaults();
    const auto count = csp.directives.size();
    csp.setDirective("img-src", {"*"});
    EXPECT_EQ(csp.directives.size(), count);
    EXPECT_NE(csp.toHeaderValue().find("img-src *;"), std::string::npos);
}

TEST(ContentSecurityPolicyTest, ReportOnlyHeaderName) {
    auto csp = ContentSecurityPolicy::defaults();
    csp.reportOnly = true;
    EXPECT_EQ(csp.headerName(), "Content-Security-Policy-Report-Only");
}

TEST(ContentSecurityPolicyTest, JsonOverridesDefaults) {
    json config;
    config["directives"]["script-src"] =
        json::array({"'self'", "cdn.example.com"});
    config["useNonce"] = true;
    auto csp = ContentSecurityPolicy::fromJson(config);

    EXPECT_TRUE(csp.useNonce);
    EXPECT_FALSE(csp.reportOnly);
    EXPECT_NE(csp.toHeaderValue().find("script-src 'self' cdn.example.com"),
              std::string::npos);
    EXPECT_NE(csp.toHeaderValue().find("frame-ancestors 'none'"),
              std::string::npos);

    auto again = ContentSecurityPolicy::fromJson(csp.toJson());
    EXPECT_EQ(again.toHeaderValue(), csp.toHeaderValue());
    EXPECT_TRUE(again.useNonce);
}

// ============================================================================
// Header Set Tests
// ============================================================================

TEST(SecurityHeaderSetTest, Defaults) {
    auto set = SecurityHeaderSet::defaults();
    ASSERT_EQ(set.headers().size(), 2u);
    EXPECT_EQ(set.headers()[0].first, "X-Content-Type-Options");
    EXPECT_EQ(set.headers()[0].second, "nosniff");
    EXPECT_EQ(set.headers()[1].first, "X-Frame-Options");
    EXPECT_EQ(set.headers()[1].second, "DENY");
}

TEST(SecurityHeaderSetTest, HardenedAddsPolicies) {
    auto set = SecurityHeaderSet::hardened();
    HeaderMap headers;
    for (const auto& [name, value] : set.headers()) {
        headers.add(name, value);
    }
    EXPECT_EQ(headers.get("referrer-policy"), "strict-origin-when-cross-origin");
    EXPECT_EQ(headers.get("Cross-Origin-Opener-Policy"), "same-origin");
    EXPECT_TRUE(headers.contains("Permissions-Policy"));
    EXPECT_TRUE(headers.contains("X-Frame-Options"));
}

TEST(SecurityHeaderSetTest, SetAndRemoveIgnoreCase) {
    auto set = SecurityHeaderSet::defaults();
    set.set("x-frame-options", "SAMEORIGIN");
    ASSERT_EQ(set.headers().size(), 2u);
    EXPECT_EQ(set.headers()[1].second, "SAMEORIGIN");

    EXPECT_TRUE(set.remove("X-CONTENT-TYPE-OPTIONS"));
    EXPECT_FALSE(set.remove("X-Content-Type-Options"));
    EXPECT_EQ(set.headers().size(), 1u);
}

// ============================================================================
// Injector Tests
// ============================================================================

TEST(HeaderInjectorTest, AddsDefaultHeaders) {
    HeaderInjector injector;
    HeaderMap headers{{"Content-Type", "text/html"}};

    EXPECT_EQ(injector.inject(headers), 3u);
    EXPECT_EQ(headers.get("X-Content-Type-Options"), "nosniff");
    EXPECT_EQ(headers.get("X-Frame-Options"), "DENY");
    EXPECT_EQ(headers.get("Content-Security-Policy"),
              ContentSecurityPolicy::defaults().toHeaderValue());
    EXPECT_EQ(headers.get("Content-Type"), "text/html");
}

TEST(HeaderInjectorTest, KeepsHandlerHeaders) {
    HeaderInjector injector;
    HeaderMap headers{{"x-frame-options", "SAMEORIGIN"},
                      {"Content-Security-Policy", "default-src *"}};

    EXPECT_EQ(injector.inject(headers), 1u);
    EXPECT_EQ(headers.get("X-Frame-Options"), "SAMEORIGIN");
    EXPECT_EQ(headers.get("Content-Security-Policy"), "default-src *");
    EXPECT_EQ(headers.size(), 3u);
}

TEST(HeaderInjectorTest, InjectIsIdempotent) {
    HeaderInjector injector;
    HeaderMap headers;
    injector.inject(headers);
    const auto size = headers.size();
    EXPECT_EQ(injector.inject(headers), 0u);
    EXPECT_EQ(headers.size(), size);
}

TEST(HeaderInjectorTest, NonceOnlyWhenEnabled) {
    auto csp = ContentSecurityPolicy::defaults();
    HeaderInjector plain(csp, SecurityHeaderSet::defaults());
    HeaderMap a;
    plain.inject(a, "n0nce");
    EXPECT_EQ(a.get("Content-Security-Policy")->find("nonce-"),
              std::string_view::npos);

    csp.useNonce = true;
    HeaderInjector withNonce(csp, SecurityHeaderSet::defaults());
    HeaderMap b;
    withNonce.inject(b, "n0nce");
    EXPECT_NE(b.get("Content-Security-Policy")->find("script-src 'self' 'nonce-n0nce'"),
              std::string_view::npos);
    EXPECT_NE(b.get("Content-Security-Policy")->find("style-src 'self' 'nonce-n0nce'"),
              std::string_view::npos);
}

TEST(HeaderInjectorTest, ReportOnlyPolicy) {
    auto csp = ContentSecurityPolicy::defaults();
    csp.reportOnly = true;
    HeaderInjector injector(csp, SecurityHeaderSet::defaults());
    HeaderMap headers;
    injector.inject(headers);
    EXPECT_TRUE(headers.contains("Content-Security-Policy-Report-Only"));
    EXPECT_FALSE(headers.contains("Content-Security-Policy"));
}

TEST(HeaderInjectorTest, GeneratedNoncesAreUnique) {
    auto a = HeaderInjector::generateNonce();
    auto b = HeaderInjector::generateNonce();
    EXPECT_EQ(a.size(), 24u);
    EXPECT_NE(a, b);
}
