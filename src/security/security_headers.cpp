/*
 * security_headers.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "security_headers.hpp"

#include <algorithm>

#include "crypto.hpp"

namespace rampart::security {

namespace {

constexpr std::string_view UNSAFE_INLINE = "'unsafe-inline'";

bool takesNonce(std::string_view directive) {
    return directive == "script-src" || directive == "style-src";
}

}  // namespace

auto ContentSecurityPolicy::defaults() -> ContentSecurityPolicy {
    ContentSecurityPolicy csp;
    csp.directives = {
        {"default-src", {"'self'"}},
        {"script-src", {"'self'"}},
        {"style-src", {"'self'"}},
        {"img-src", {"'self'", "data:"}},
        {"font-src", {"'self'"}},
        {"connect-src", {"'self'"}},
        {"frame-ancestors", {"'none'"}},
        {"base-uri", {"'self'"}},
        {"form-action", {"'self'"}},
    };
    return csp;
}

auto ContentSecurityPolicy::setDirective(std::string name,
                                         std::vector<std::string> sources)
    -> ContentSecurityPolicy& {
    auto it = std::find_if(directives.begin(), directives.end(),
                           [&name](const Directive& d) {
                               return d.first == name;
                           });
    if (it != directives.end()) {
        it->second = std::move(sources);
    } else {
        directives.emplace_back(std::move(name), std::move(sources));
    }
    return *this;
}

auto ContentSecurityPolicy::toHeaderValue(
    std::optional<std::string_view> nonce) const -> std::string {
    std::string value;
    for (const auto& [name, sources] : directives) {
        if (sources.empty()) {
            continue;
        }
        const bool withNonce = nonce.has_value() && takesNonce(name);

        std::string rendered = name;
        for (const auto& source : sources) {
            if (withNonce && source == UNSAFE_INLINE) {
                continue;
            }
            rendered += ' ';
            rendered += source;
        }
        if (withNonce) {
            rendered += " 'nonce-";
            rendered += *nonce;
            rendered += '\'';
        }

        if (!value.empty()) {
            value += "; ";
        }
        value += rendered;
    }
    return value;
}

auto ContentSecurityPolicy::headerName() const -> std::string_view {
    return reportOnly ? "Content-Security-Policy-Report-Only"
                      : "Content-Security-Policy";
}

auto ContentSecurityPolicy::toJson() const -> json {
    json dirs = json::object();
    for (const auto& [name, sources] : directives) {
        dirs[name] = sources;
    }
    return {{"directives", dirs},
            {"useNonce", useNonce},
            {"reportOnly", reportOnly}};
}

auto ContentSecurityPolicy::fromJson(const json& j) -> ContentSecurityPolicy {
    auto csp = defaults();
    if (j.contains("directives") && j["directives"].is_object()) {
        for (const auto& [name, sources] : j["directives"].items()) {
            csp.setDirective(name, sources.get<std::vector<std::string>>());
        }
    }
    csp.useNonce = j.value("useNonce", csp.useNonce);
    csp.reportOnly = j.value("reportOnly", csp.reportOnly);
    return csp;
}

auto SecurityHeaderSet::defaults() -> SecurityHeaderSet {
    SecurityHeaderSet set;
    set.set("X-Content-Type-Options", "nosniff")
        .set("X-Frame-Options", "DENY");
    return set;
}

auto SecurityHeaderSet::hardened() -> SecurityHeaderSet {
    auto set = defaults();
    set.set("Referrer-Policy", "strict-origin-when-cross-origin")
        .set("Permissions-Policy", "geolocation=(), microphone=(), camera=()")
        .set("Cross-Origin-Opener-Policy", "same-origin")
        .set("Cross-Origin-Resource-Policy", "same-origin");
    return set;
}

auto SecurityHeaderSet::set(std::string name, std::string value)
    -> SecurityHeaderSet& {
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&name](const Header& h) {
                               return utils::HeaderMap::equalsIgnoreCase(
                                   h.first, name);
                           });
    if (it != headers_.end()) {
        it->second = std::move(value);
    } else {
        headers_.emplace_back(std::move(name), std::move(value));
    }
    return *this;
}

bool SecurityHeaderSet::remove(std::string_view name) {
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [name](const Header& h) {
                               return utils::HeaderMap::equalsIgnoreCase(
                                   h.first, name);
                           });
    if (it == headers_.end()) {
        return false;
    }
    headers_.erase(it);
    return true;
}

HeaderInjector::HeaderInjector()
    : csp_(ContentSecurityPolicy::defaults()),
      headers_(SecurityHeaderSet::defaults()) {}

HeaderInjector::HeaderInjector(ContentSecurityPolicy csp,
                               SecurityHeaderSet headers)
    : csp_(std::move(csp)), headers_(std::move(headers)) {}

auto HeaderInjector::inject(utils::HeaderMap& headers,
                            std::optional<std::string_view> nonce) const
    -> std::size_t {
    std::size_t added = 0;
    if (!csp_.directives.empty() && !headers.contains(csp_.headerName())) {
        headers.add(std::string(csp_.headerName()),
                    csp_.toHeaderValue(csp_.useNonce ? nonce : std::nullopt));
        ++added;
    }
    for (const auto& [name, value] : headers_.headers()) {
        if (headers.setIfAbsent(name, value)) {
            ++added;
        }
    }
    return added;
}

auto HeaderInjector::generateNonce() -> std::string {
    return base64Encode(randomBytes(16));
}

}  // namespace rampart::security
