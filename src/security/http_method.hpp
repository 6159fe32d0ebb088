/*
 * http_method.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Classification of HTTP methods as safe or unsafe

**************************************************/

#ifndef RAMPART_SECURITY_HTTP_METHOD_HPP
#define RAMPART_SECURITY_HTTP_METHOD_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace rampart::security {

enum class MethodClass { Safe, Unsafe };

/**
 * @brief Partition HTTP methods into read-only and state-mutating
 *
 * GET, HEAD, OPTIONS and TRACE are safe. Everything else, including methods
 * this code has never heard of, must carry a CSRF token.
 */
inline auto classifyMethod(std::string_view method) -> MethodClass {
    static constexpr std::array<std::string_view, 4> SAFE_METHODS = {
        "GET", "HEAD", "OPTIONS", "TRACE"};

    std::string upper(method);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    return std::find(SAFE_METHODS.begin(), SAFE_METHODS.end(), upper) !=
                   SAFE_METHODS.end()
               ? MethodClass::Safe
               : MethodClass::Unsafe;
}

inline bool isSafeMethod(std::string_view method) {
    return classifyMethod(method) == MethodClass::Safe;
}

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_HTTP_METHOD_HPP
