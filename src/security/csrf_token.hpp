/*
 * csrf_token.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: CSRF token generation, storage, masking and verification

**************************************************/

#ifndef RAMPART_SECURITY_CSRF_TOKEN_HPP
#define RAMPART_SECURITY_CSRF_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "session/session.hpp"

namespace rampart::security {

/// Token bound to an anonymous session.
struct AnonymousBinding {
    std::string sessionId;
};

/// Token bound to a logged-in user.
struct AuthenticatedBinding {
    std::int64_t userId{0};
};

using CsrfBinding = std::variant<AnonymousBinding, AuthenticatedBinding>;

/**
 * @brief Stateful CSRF tokens stored against the session
 *
 * A token is HMAC-SHA256(secret, context | binding | nonce | timestamp)
 * encoded as 64 lowercase hex characters. The timestamp and nonce only make
 * each issuance unique; nothing is parsed back out. Verification is a
 * constant-time comparison with the value held by the session.
 *
 * Tokens handed to clients are masked: a fresh random pad is XORed with the
 * raw token on every response so the bytes never repeat (BREACH).
 */
class TokenCodec {
public:
    static constexpr std::string_view ANONYMOUS_CONTEXT =
        "rampart.middleware.csrf";
    static constexpr std::string_view AUTHENTICATED_CONTEXT =
        "rampart.middleware.user_token";

    /// Length in characters of a raw (unmasked) token.
    static constexpr std::size_t TOKEN_LENGTH = 64;

    [[nodiscard]] static auto generate(std::string_view secretKey,
                                       std::string_view sessionId)
        -> std::string;

    [[nodiscard]] static auto generate(std::string_view secretKey,
                                       const CsrfBinding& binding)
        -> std::string;

    /// Overwrite the session's current token.
    static void store(session::Session& session, std::string token);

    /**
     * @brief Check a presented token against the stored one
     *
     * True only if both are present and equal. Never throws.
     */
    [[nodiscard]] static bool verify(
        const std::optional<std::string>& stored,
        const std::optional<std::string>& presented) noexcept;

    /**
     * @brief Current token of the session, created on first touch
     * @throws session::SessionError if the backend fails
     */
    [[nodiscard]] static auto issue(session::Session& session,
                                    std::string_view secretKey)
        -> std::string;

    /**
     * @brief Replace the token after a successful state-changing request
     * @return the new token, or nullopt for safe methods (no rotation)
     * @throws session::SessionError if the backend fails
     */
    static auto rotateAfterSuccess(session::Session& session,
                                   std::string_view secretKey,
                                   std::string_view method)
        -> std::optional<std::string>;

    /// Binding derived from the session's authentication state.
    [[nodiscard]] static auto bindingFor(const session::Session& session)
        -> CsrfBinding;

    /// Masked, URL-safe form of a raw token for delivery to clients.
    [[nodiscard]] static auto mask(std::string_view token) -> std::string;

    /**
     * @brief Recover the raw token from what a client presented
     *
     * Accepts the masked form and a bare raw token. Returns nullopt for
     * anything else.
     */
    [[nodiscard]] static auto unmask(std::string_view presented)
        -> std::optional<std::string>;
};

}  // namespace rampart::security

#endif  // RAMPART_SECURITY_CSRF_TOKEN_HPP
