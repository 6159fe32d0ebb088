/*
 * host_matcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Allowed-host validation against configured patterns

**************************************************/

#ifndef RAMPART_SECURITY_HOST_MATCHER_HPP
#define RAMPART_SECURITY_HOST_MATCHER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rampart::security {

/**
 * @brief One entry of the allowed-hosts list
 *
 * - `*` accepts every host
 * - `.example.com` accepts `example.com` and any subdomain of it
 * - anything else must equal the host exactly
 */
struct AllowedHostPattern {
    enum class Kind { Exact, WildcardAll, SuffixWildcard };

    Kind kind{Kind::Exact};
    /// Lower-cased host for Exact, the dotted suffix for SuffixWildcard.
    std::string value;

    [[nodiscard]] static auto parse(std::string_view pattern)
        -> AllowedHostPattern;

    /// @param host a host already passed through HostMatcher::normalizeHost
    [[nodiscard]] bool matches(std::string_view host) const;

    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * @brief Validates the Host header of incoming requests
 *
 * Immutable after construction; safe to share across request threads.
 */
class HostMatcher {
public:
    HostMatcher() = default;
    HostMatcher(std::vector<AllowedHostPattern> patterns, bool bypass);

    [[nodiscard]] static auto fromStrings(
        const std::vector<std::string>& patterns, bool bypass) -> HostMatcher;

    /**
     * @brief Whether @p declaredHost (port allowed) is acceptable
     *
     * Always true when the bypass flag is set. Patterns are tried in order.
     */
    [[nodiscard]] bool isAllowed(std::string_view declaredHost) const;

    /**
     * @brief Validate a possibly missing Host header
     * @return nullopt when accepted, otherwise the rejection message
     */
    [[nodiscard]] auto validate(std::optional<std::string_view> hostHeader) const
        -> std::optional<std::string>;

    /**
     * @brief Strip the port and lower-case a declared host
     *
     * `[::1]:8080` keeps its brackets, one trailing dot is removed.
     */
    [[nodiscard]] static auto normalizeHost(std::string_view host)
        -> std::string;

    [[nodiscard]] auto patterns() const -> const std::vector<AllowedHostPattern>& {
        return patterns_;
    }

    [[nodiscard]] bool bypass() const { return bypass_; }

private:
    std::vector<AllowedHostPattern> patterns_;
    bool bypass_{false};
};

/// Convenience form of HostMatcher::isAllowed for a raw pattern list.
[[nodiscard]] bool isHostAllowed(std::string_view host,
                                 const std::vector<std::string>& patterns,
                                 bool bypass = false);

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_HOST_MATCHER_HPP
