/*
 * security_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Compiled, immutable security settings shared by all requests

**************************************************/

#ifndef RAMPART_SECURITY_SECURITY_POLICY_HPP
#define RAMPART_SECURITY_SECURITY_POLICY_HPP

#include <string>

#include "body_sanitizer.hpp"
#include "host_matcher.hpp"
#include "security_headers.hpp"

namespace rampart::security {

/**
 * @brief Everything the pipeline needs to process one request
 *
 * Built once from configuration and never modified afterwards. Requests
 * hold a shared_ptr to the snapshot they started with.
 */
struct SecurityPolicy {
    std::string secretKey;
    HostMatcher hosts;
    BodySanitizer sanitizer;
    HeaderInjector headers;
    /// Request header carrying the presented CSRF token (also used on
    /// responses to surface the masked token).
    std::string csrfHeader{"X-CSRF-Token"};
    /// Form or JSON body field carrying the presented CSRF token.
    std::string csrfField{"csrf_token"};
    bool debug{false};
};

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_SECURITY_POLICY_HPP
