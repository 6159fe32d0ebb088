/*
 * security_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "security_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace rampart::config {

namespace {

auto trim(std::string_view text) -> std::string {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

auto splitList(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto item = trim(text.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

auto parseBool(const char* name, const std::string& raw)
    -> std::optional<bool> {
    std::string value = trim(raw);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    spdlog::warn("Ignoring {}: '{}' is not a boolean", name, raw);
    return std::nullopt;
}

bool isLocalHost(const std::string& host) {
    return host == "localhost" || host == "127.0.0.1" || host == "::1" ||
           host == "[::1]";
}

}  // namespace

json SecurityConfig::serialize() const {
    json headers = json::array();
    for (const auto& [name, value] : extraHeaders) {
        headers.push_back({{"name", name}, {"value", value}});
    }
    return {
        // Keys and mode
        {"secretKey", secretKey},
        {"debug", debug},
        // Hosts
        {"allowedHosts", allowedHosts},
        // CSRF
        {"csrfHeader", csrfHeader},
        {"csrfField", csrfField},
        // Sanitization
        {"sanitizeInputs", sanitizeInputs},
        {"sanitizeFailClosed", sanitizeFailClosed},
        {"sensitiveFields", sensitiveFields},
        // Headers
        {"csp", csp.toJson()},
        {"hardenedHeaders", hardenedHeaders},
        {"extraHeaders", headers}};
}

SecurityConfig SecurityConfig::deserialize(const json& j) {
    SecurityConfig cfg;

    cfg.secretKey = j.value("secretKey", cfg.secretKey);
    cfg.debug = j.value("debug", cfg.debug);

    cfg.allowedHosts = stringList(j, "allowedHosts", cfg.allowedHosts);

    cfg.csrfHeader = j.value("csrfHeader", cfg.csrfHeader);
    cfg.csrfField = j.value("csrfField", cfg.csrfField);

    cfg.sanitizeInputs = j.value("sanitizeInputs", cfg.sanitizeInputs);
    cfg.sanitizeFailClosed =
        j.value("sanitizeFailClosed", cfg.sanitizeFailClosed);
    cfg.sensitiveFields = stringList(j, "sensitiveFields", cfg.sensitiveFields);

    if (j.contains("csp")) {
        cfg.csp = security::ContentSecurityPolicy::fromJson(j.at("csp"));
    }
    cfg.hardenedHeaders = j.value("hardenedHeaders", cfg.hardenedHeaders);
    if (j.contains("extraHeaders")) {
        const auto& headers = j.at("extraHeaders");
        if (!headers.is_array()) {
            THROW_INVALID_CONFIG_EXCEPTION(std::string(PATH) +
                                           "/extraHeaders must be an array");
        }
        for (const auto& header : headers) {
            cfg.extraHeaders.emplace_back(header.at("name").get<std::string>(),
                                          header.at("value").get<std::string>());
        }
    }

    return cfg;
}

json SecurityConfig::generateSchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"secretKey", {
                {"type", "string"},
                {"minLength", 1},
                {"description", "HMAC key, at least 32 bytes outside debug"}
            }},
            {"debug", {{"type", "boolean"}, {"default", false}}},
            {"allowedHosts", {
                {"type", "array"},
                {"items", {{"type", "string"}, {"minLength", 1}}},
                {"default", json::array({"localhost", "127.0.0.1"})}
            }},
            {"csrfHeader", {{"type", "string"}, {"default", "X-CSRF-Token"}}},
            {"csrfField", {{"type", "string"}, {"default", "csrf_token"}}},
            {"sanitizeInputs", {{"type", "boolean"}, {"default", true}}},
            {"sanitizeFailClosed", {{"type", "boolean"}, {"default", false}}},
            {"sensitiveFields", {
                {"type", "array"},
                {"items", {{"type", "string"}}}
            }},
            {"csp", {
                {"type", "object"},
                {"properties", {
                    {"directives", {{"type", "object"}}},
                    {"useNonce", {{"type", "boolean"}, {"default", false}}},
                    {"reportOnly", {{"type", "boolean"}, {"default", false}}}
                }}
            }},
            {"hardenedHeaders", {{"type", "boolean"}, {"default", false}}},
            {"extraHeaders", {
                {"type", "array"},
                {"items", {
                    {"type", "object"},
                    {"required", json::array({"name", "value"})},
                    {"properties", {
                        {"name", {{"type", "string"}}},
                        {"value", {{"type", "string"}}}
                    }}
                }}
            }}
        }},
        {"required", json::array({"secretKey"})}
    };
}

ConfigValidationResult SecurityConfig::validate() const {
    ConfigValidationResult result;
    const std::string base(PATH);

    if (secretKey.empty()) {
        result.addError(base + "/secretKey", "secret key is not set",
                        "required");
    } else if (!debug && secretKey.size() < MIN_SECRET_LENGTH) {
        result.addError(base + "/secretKey",
                        "secret key must be at least " +
                            std::to_string(MIN_SECRET_LENGTH) +
                            " bytes outside debug mode",
                        "minLength");
    }

    for (std::size_t i = 0; i < allowedHosts.size(); ++i) {
        if (trim(allowedHosts[i]).empty()) {
            result.addError(base + "/allowedHosts/" + std::to_string(i),
                            "host pattern is empty", "minLength");
        }
    }
    if (!debug && allowedHosts.empty()) {
        result.addError(base + "/allowedHosts",
                        "allowed hosts cannot be empty outside debug mode",
                        "minItems");
    }

    if (csrfHeader.empty()) {
        result.addError(base + "/csrfHeader", "header name is empty",
                        "minLength");
    }
    if (csrfField.empty()) {
        result.addError(base + "/csrfField", "field name is empty",
                        "minLength");
    }
    for (const auto& [name, value] : extraHeaders) {
        if (name.empty()) {
            result.addError(base + "/extraHeaders", "header name is empty",
                            "minLength");
        }
    }

    return result;
}

void SecurityConfig::applyEnvironment(const EnvironmentReader& reader) {
    if (auto value = reader("RAMPART_SECRET_KEY")) {
        secretKey = *value;
    }
    if (auto value = reader("RAMPART_ALLOWED_HOSTS")) {
        allowedHosts = splitList(*value);
    }
    if (auto value = reader("RAMPART_DEBUG")) {
        debug = parseBool("RAMPART_DEBUG", *value).value_or(debug);
    }
    if (auto value = reader("RAMPART_SANITIZE_INPUTS")) {
        sanitizeInputs =
            parseBool("RAMPART_SANITIZE_INPUTS", *value).value_or(sanitizeInputs);
    }
    if (auto value = reader("RAMPART_SANITIZE_FAIL_CLOSED")) {
        sanitizeFailClosed = parseBool("RAMPART_SANITIZE_FAIL_CLOSED", *value)
                                 .value_or(sanitizeFailClosed);
    }
    if (auto value = reader("RAMPART_CSP_NONCE")) {
        csp.useNonce =
            parseBool("RAMPART_CSP_NONCE", *value).value_or(csp.useNonce);
    }
}

auto SecurityConfig::compile() const -> security::SecurityPolicy {
    auto result = validate();
    if (!result) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid security configuration: " +
                                       result.summary());
    }

    if (!debug && std::all_of(allowedHosts.begin(), allowedHosts.end(),
                              isLocalHost)) {
        spdlog::warn(
            "Allowed hosts only contain local addresses outside debug mode");
    }
    if (debug) {
        spdlog::warn("Debug mode is on: host validation is bypassed");
    }

    security::SecurityPolicy policy;
    policy.secretKey = secretKey;
    policy.hosts = security::HostMatcher::fromStrings(allowedHosts, debug);

    security::SanitizationPolicy sanitization;
    sanitization.enabled = sanitizeInputs;
    sanitization.failClosed = sanitizeFailClosed;
    sanitization.sensitiveFields = sensitiveFields;
    policy.sanitizer = security::BodySanitizer(std::move(sanitization));

    auto headers = hardenedHeaders ? security::SecurityHeaderSet::hardened()
                                   : security::SecurityHeaderSet::defaults();
    for (const auto& [name, value] : extraHeaders) {
        headers.set(name, value);
    }
    policy.headers = security::HeaderInjector(csp, std::move(headers));

    policy.csrfHeader = csrfHeader;
    policy.csrfField = csrfField;
    policy.debug = debug;
    return policy;
}

auto SecurityConfig::systemEnvironment(const char* name)
    -> std::optional<std::string> {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

}  // namespace rampart::config
