/*
 * csrf_token.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "csrf_token.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "http_method.hpp"
#include "secret_compare.hpp"

namespace rampart::security {

namespace {

constexpr std::size_t NONCE_BYTES = 16;

void append(Bytes& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

auto keyedDigest(std::string_view secretKey, std::string_view context,
                 std::string_view subject) -> std::string {
    Bytes message;
    message.reserve(context.size() + subject.size() + NONCE_BYTES + 10);
    append(message, context);
    message.push_back(0);
    append(message, subject);
    message.push_back(0);

    auto nonce = randomBytes(NONCE_BYTES);
    message.insert(message.end(), nonce.begin(), nonce.end());

    const auto nanos = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    for (int shift = 56; shift >= 0; shift -= 8) {
        message.push_back(static_cast<unsigned char>(nanos >> shift));
    }

    return toHex(hmacSha256(secretKey, message));
}

bool isRawToken(std::string_view text) {
    return text.size() == TokenCodec::TOKEN_LENGTH &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) {
               return std::isdigit(c) || (c >= 'a' && c <= 'f');
           });
}

}  // namespace

auto TokenCodec::generate(std::string_view secretKey,
                          std::string_view sessionId) -> std::string {
    return keyedDigest(secretKey, ANONYMOUS_CONTEXT, sessionId);
}

auto TokenCodec::generate(std::string_view secretKey,
                          const CsrfBinding& binding) -> std::string {
    if (const auto* user = std::get_if<AuthenticatedBinding>(&binding)) {
        return keyedDigest(secretKey, AUTHENTICATED_CONTEXT,
                           std::to_string(user->userId));
    }
    return generate(secretKey, std::get<AnonymousBinding>(binding).sessionId);
}

void TokenCodec::store(session::Session& session, std::string token) {
    session.setToken(std::move(token));
}

bool TokenCodec::verify(const std::optional<std::string>& stored,
                        const std::optional<std::string>& presented) noexcept {
    if (!stored || !presented) {
        return false;
    }
    return constantTimeEquals(*stored, *presented);
}

auto TokenCodec::issue(session::Session& session, std::string_view secretKey)
    -> std::string {
    if (auto existing = session.getToken()) {
        return *existing;
    }
    auto token = generate(secretKey, bindingFor(session));
    store(session, token);
    spdlog::debug("CSRF token issued for new session");
    return token;
}

auto TokenCodec::rotateAfterSuccess(session::Session& session,
                                    std::string_view secretKey,
                                    std::string_view method)
    -> std::optional<std::string> {
    if (isSafeMethod(method)) {
        return std::nullopt;
    }
    auto token = generate(secretKey, bindingFor(session));
    store(session, token);
    spdlog::debug("CSRF token rotated after {} request", method);
    return token;
}

auto TokenCodec::bindingFor(const session::Session& session) -> CsrfBinding {
    if (auto userId = session.get<std::int64_t>(session::USER_ID_KEY)) {
        return AuthenticatedBinding{*userId};
    }
    return AnonymousBinding{session.id()};
}

auto TokenCodec::mask(std::string_view token) -> std::string {
    auto pad = randomBytes(token.size());
    Bytes out(pad.begin(), pad.end());
    out.reserve(token.size() * 2);
    for (std::size_t i = 0; i < token.size(); ++i) {
        out.push_back(static_cast<unsigned char>(token[i]) ^ pad[i]);
    }
    return base64UrlEncode(out);
}

auto TokenCodec::unmask(std::string_view presented)
    -> std::optional<std::string> {
    if (isRawToken(presented)) {
        return std::string(presented);
    }

    auto decoded = base64UrlDecode(presented);
    if (!decoded || decoded->size() != 2 * TOKEN_LENGTH) {
        return std::nullopt;
    }

    std::string token(TOKEN_LENGTH, '\0');
    for (std::size_t i = 0; i < TOKEN_LENGTH; ++i) {
        token[i] =
            static_cast<char>((*decoded)[TOKEN_LENGTH + i] ^ (*decoded)[i]);
    }
    return token;
}

}  // namespace rampart::security
