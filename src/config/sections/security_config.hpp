/*
 * security_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Security middleware configuration section

**************************************************/

#ifndef RAMPART_CONFIG_SECTIONS_SECURITY_CONFIG_HPP
#define RAMPART_CONFIG_SECTIONS_SECURITY_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/config_section.hpp"
#include "security/security_headers.hpp"
#include "security/security_policy.hpp"

namespace rampart::config {

/**
 * @brief Security middleware configuration
 *
 * @example
 * ```json
 * {
 *   "rampart": {
 *     "security": {
 *       "secretKey": "change-me-to-at-least-32-bytes-of-entropy",
 *       "debug": false,
 *       "allowedHosts": ["example.com", ".example.com"],
 *       "sanitizeInputs": true,
 *       "sanitizeFailClosed": false
 *     }
 *   }
 * }
 * ```
 */
struct SecurityConfig : ConfigSection<SecurityConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/rampart/security";

    /// Shortest secret accepted outside debug mode.
    static constexpr std::size_t MIN_SECRET_LENGTH = 32;

    /// Reads one environment variable; nullopt when unset.
    using EnvironmentReader =
        std::function<std::optional<std::string>(const char*)>;

    // ========================================================================
    // Keys and Mode
    // ========================================================================

    std::string secretKey;  ///< HMAC key for CSRF tokens
    bool debug{false};      ///< Debug mode, bypasses host validation

    // ========================================================================
    // Host Validation
    // ========================================================================

    std::vector<std::string> allowedHosts{"localhost", "127.0.0.1"};

    // ========================================================================
    // CSRF
    // ========================================================================

    std::string csrfHeader{"X-CSRF-Token"};
    std::string csrfField{"csrf_token"};

    // ========================================================================
    // Body Sanitization
    // ========================================================================

    bool sanitizeInputs{true};
    bool sanitizeFailClosed{false};
    std::vector<std::string> sensitiveFields{"password", "token", "secret",
                                             "key"};

    // ========================================================================
    // Response Headers
    // ========================================================================

    security::ContentSecurityPolicy csp{
        security::ContentSecurityPolicy::defaults()};
    bool hardenedHeaders{false};  ///< Add referrer/permissions/COOP/CORP
    std::vector<std::pair<std::string, std::string>> extraHeaders;

    // ========================================================================
    // Serialization
    // ========================================================================

    [[nodiscard]] json serialize() const;

    /// @throws InvalidConfigException if a list has the wrong shape
    [[nodiscard]] static SecurityConfig deserialize(const json& j);

    [[nodiscard]] static json generateSchema();

    // ========================================================================
    // Validation and Compilation
    // ========================================================================

    [[nodiscard]] ConfigValidationResult validate() const;

    /**
     * @brief Override fields from RAMPART_* environment variables
     *
     * RAMPART_SECRET_KEY, RAMPART_ALLOWED_HOSTS (comma list), RAMPART_DEBUG,
     * RAMPART_SANITIZE_INPUTS, RAMPART_SANITIZE_FAIL_CLOSED,
     * RAMPART_CSP_NONCE.
     */
    void applyEnvironment(const EnvironmentReader& reader = systemEnvironment);

    /**
     * @brief Build the immutable policy used by the request pipeline
     * @throws InvalidConfigException when validate() reports errors
     */
    [[nodiscard]] auto compile() const -> security::SecurityPolicy;

    static auto systemEnvironment(const char* name)
        -> std::optional<std::string>;
};

}  // namespace rampart::config

#endif  // RAMPART_CONFIG_SECTIONS_SECURITY_CONFIG_HPP
