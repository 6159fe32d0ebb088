/*
 * host_matcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_matcher.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace rampart::security {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

}  // namespace

auto AllowedHostPattern::parse(std::string_view pattern) -> AllowedHostPattern {
    auto text = toLower(trim(pattern));
    if (text == "*") {
        return {Kind::WildcardAll, std::move(text)};
    }
    if (!text.empty() && text.front() == '.') {
        return {Kind::SuffixWildcard, std::move(text)};
    }
    return {Kind::Exact, std::move(text)};
}

bool AllowedHostPattern::matches(std::string_view host) const {
    switch (kind) {
        case Kind::WildcardAll:
            return true;
        case Kind::Exact:
            return host == value;
        case Kind::SuffixWildcard: {
            const std::string_view suffix = value;
            if (host == suffix.substr(1)) {
                return true;
            }
            // suffix starts with '.', so the match sits on a label boundary
            return host.size() > suffix.size() && host.ends_with(suffix);
        }
    }
    return false;
}

auto AllowedHostPattern::toString() const -> std::string { return value; }

HostMatcher::HostMatcher(std::vector<AllowedHostPattern> patterns, bool bypass)
    : patterns_(std::move(patterns)), bypass_(bypass) {}

auto HostMatcher::fromStrings(const std::vector<std::string>& patterns,
                              bool bypass) -> HostMatcher {
    std::vector<AllowedHostPattern> parsed;
    parsed.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        parsed.push_back(AllowedHostPattern::parse(pattern));
    }
    return HostMatcher(std::move(parsed), bypass);
}

bool HostMatcher::isAllowed(std::string_view declaredHost) const {
    if (bypass_) {
        return true;
    }
    const auto host = normalizeHost(declaredHost);
    if (host.empty()) {
        return false;
    }
    return std::any_of(
        patterns_.begin(), patterns_.end(),
        [&host](const AllowedHostPattern& p) { return p.matches(host); });
}

auto HostMatcher::validate(std::optional<std::string_view> hostHeader) const
    -> std::optional<std::string> {
    const std::string shown =
        hostHeader ? std::string(*hostHeader) : std::string("<no host>");

    if (bypass_) {
        return std::nullopt;
    }
    if (hostHeader && isAllowed(*hostHeader)) {
        return std::nullopt;
    }

    spdlog::warn("Rejected request for disallowed host '{}'", shown);
    return "Invalid Host header: '" + shown + "'";
}

auto HostMatcher::normalizeHost(std::string_view host) -> std::string {
    host = trim(host);
    std::string_view name;
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        name = close == std::string_view::npos ? host
                                               : host.substr(0, close + 1);
    } else {
        name = host.substr(0, host.find(':'));
    }
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    return toLower(name);
}

bool isHostAllowed(std::string_view host,
                   const std::vector<std::string>& patterns, bool bypass) {
    return HostMatcher::fromStrings(patterns, bypass).isAllowed(host);
}

}  // namespace rampart::security
