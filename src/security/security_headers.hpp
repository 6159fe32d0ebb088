/*
 * security_headers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Content Security Policy builder and response header injection

**************************************************/

#ifndef RAMPART_SECURITY_SECURITY_HEADERS_HPP
#define RAMPART_SECURITY_SECURITY_HEADERS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/header_map.hpp"

namespace rampart::security {

using json = nlohmann::json;

/**
 * @brief Directive list rendered into a Content-Security-Policy value
 */
struct ContentSecurityPolicy {
    using Directive = std::pair<std::string, std::vector<std::string>>;

    std::vector<Directive> directives;
    /// Generate a per-request nonce and allow it for scripts and styles.
    bool useNonce{false};
    /// Emit Content-Security-Policy-Report-Only instead of enforcing.
    bool reportOnly{false};

    /// `'self'` everywhere, `data:` images, no framing.
    [[nodiscard]] static auto defaults() -> ContentSecurityPolicy;

    /// Replace the sources of @p name, appending the directive if new.
    auto setDirective(std::string name, std::vector<std::string> sources)
        -> ContentSecurityPolicy&;

    /**
     * @brief Render the header value
     *
     * With a nonce, `'nonce-<n>'` is appended to script-src and style-src
     * and `'unsafe-inline'` is dropped from both. Directives without
     * sources are omitted.
     */
    [[nodiscard]] auto toHeaderValue(
        std::optional<std::string_view> nonce = std::nullopt) const
        -> std::string;

    [[nodiscard]] auto headerName() const -> std::string_view;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> ContentSecurityPolicy;
};

/**
 * @brief Ordered set of fixed response headers
 *
 * Setting a name that already exists replaces its value in place.
 */
class SecurityHeaderSet {
public:
    using Header = std::pair<std::string, std::string>;

    /// `X-Content-Type-Options: nosniff` and `X-Frame-Options: DENY`.
    [[nodiscard]] static auto defaults() -> SecurityHeaderSet;

    /// defaults() plus referrer, permissions and cross-origin policies.
    [[nodiscard]] static auto hardened() -> SecurityHeaderSet;

    auto set(std::string name, std::string value) -> SecurityHeaderSet&;
    bool remove(std::string_view name);

    [[nodiscard]] auto headers() const -> const std::vector<Header>& {
        return headers_;
    }

private:
    std::vector<Header> headers_;
};

/**
 * @brief Adds the configured security headers to outgoing responses
 */
class HeaderInjector {
public:
    HeaderInjector();
    HeaderInjector(ContentSecurityPolicy csp, SecurityHeaderSet headers);

    /**
     * @brief Add every configured header not already present
     *
     * Headers set by the application handler win. Called for every
     * response, rejections included.
     *
     * @return number of headers added
     */
    auto inject(utils::HeaderMap& headers,
                std::optional<std::string_view> nonce = std::nullopt) const
        -> std::size_t;

    /// Fresh base64 nonce from 16 CSPRNG bytes.
    [[nodiscard]] static auto generateNonce() -> std::string;

    [[nodiscard]] bool usesNonce() const { return csp_.useNonce; }
    [[nodiscard]] auto csp() const -> const ContentSecurityPolicy& {
        return csp_;
    }
    [[nodiscard]] auto headers() const -> const SecurityHeaderSet& {
        return headers_;
    }

private:
    ContentSecurityPolicy csp_;
    SecurityHeaderSet headers_;
};

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_SECURITY_HEADERS_HPP
