/*
 * secret_compare.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Constant-time comparison of secrets

**************************************************/

#ifndef RAMPART_SECURITY_SECRET_COMPARE_HPP
#define RAMPART_SECURITY_SECRET_COMPARE_HPP

#include <string_view>

namespace rampart::security {

/**
 * @brief Constant-time equality of two secrets
 *
 * Inputs of different length are unequal and their bytes are never read.
 * For equal lengths every byte pair is examined regardless of where the first
 * difference lies (OpenSSL CRYPTO_memcmp).
 */
[[nodiscard]] bool constantTimeEquals(std::string_view lhs,
                                      std::string_view rhs) noexcept;

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_SECRET_COMPARE_HPP
