/*
 * crypto.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: OpenSSL-backed primitives shared by the security components

**************************************************/

#ifndef RAMPART_SECURITY_CRYPTO_HPP
#define RAMPART_SECURITY_CRYPTO_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/error/exception.hpp"

namespace rampart::security {

using Bytes = std::vector<unsigned char>;

/**
 * @brief Raised when the system CSPRNG or a digest primitive fails
 */
class CryptoException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_CRYPTO_EXCEPTION(...)                                     \
    throw rampart::security::CryptoException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Fill a buffer with bytes from the OpenSSL CSPRNG
 * @throws CryptoException if the generator is not seeded
 */
[[nodiscard]] auto randomBytes(std::size_t count) -> Bytes;

/**
 * @brief HMAC-SHA256 of @p message under @p key (32-byte digest)
 */
[[nodiscard]] auto hmacSha256(std::string_view key, const Bytes& message)
    -> Bytes;

[[nodiscard]] auto toHex(const Bytes& data) -> std::string;
[[nodiscard]] auto fromHex(std::string_view hex) -> std::optional<Bytes>;

/// Standard base64 with padding.
[[nodiscard]] auto base64Encode(const Bytes& data) -> std::string;

/// URL-safe base64 (`-` and `_`), no padding. Safe inside form bodies.
[[nodiscard]] auto base64UrlEncode(const Bytes& data) -> std::string;
[[nodiscard]] auto base64UrlDecode(std::string_view text)
    -> std::optional<Bytes>;

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_CRYPTO_HPP
