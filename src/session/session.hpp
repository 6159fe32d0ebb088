/*
 * session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Session collaborator interface used by the security pipeline

**************************************************/

#ifndef RAMPART_SESSION_SESSION_HPP
#define RAMPART_SESSION_SESSION_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "atom/error/exception.hpp"

namespace rampart::session {

using json = nlohmann::json;

/// Session key holding the authenticated user's id.
inline constexpr std::string_view USER_ID_KEY = "user_id";

/**
 * @brief Raised by a session backend that cannot serve a request
 *
 * The security pipeline treats this as a CSRF rejection (fail closed).
 */
class SessionError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_SESSION_ERROR(...)                                     \
    throw rampart::session::SessionError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A single client session as seen by the pipeline
 *
 * Implementations must be safe to call from several request threads at once.
 * Every operation may throw SessionError when the backing store is
 * unreachable or the session has been destroyed.
 */
class Session {
public:
    virtual ~Session() = default;

    [[nodiscard]] virtual auto id() const -> std::string = 0;

    /// Current CSRF token, if one has been issued.
    [[nodiscard]] virtual auto getToken() const
        -> std::optional<std::string> = 0;

    /// Replace the CSRF token; the previous value stops verifying.
    virtual void setToken(std::string token) = 0;

    [[nodiscard]] virtual auto getValue(std::string_view key) const
        -> std::optional<json> = 0;
    virtual void setValue(std::string key, json value) = 0;
    virtual void removeValue(std::string_view key) = 0;

    /**
     * @brief Typed read of a stored value
     * @return nullopt when the key is absent or holds another type
     */
    template <typename T>
    [[nodiscard]] auto get(std::string_view key) const -> std::optional<T> {
        auto value = getValue(key);
        if (!value) {
            return std::nullopt;
        }
        try {
            return value->template get<T>();
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    template <typename T>
    void set(std::string key, T&& value) {
        setValue(std::move(key), json(std::forward<T>(value)));
    }
};

}  // namespace rampart::session

#endif  // RAMPART_SESSION_SESSION_HPP
