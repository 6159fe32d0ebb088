/*
 * mock_session.hpp - GoogleMock session backend for pipeline tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RAMPART_TESTS_MOCKS_MOCK_SESSION_HPP
#define RAMPART_TESTS_MOCKS_MOCK_SESSION_HPP

#include <gmock/gmock.h>

#include "security/crypto.hpp"
#include "session/session.hpp"

namespace rampart::test {

class MockSession : public session::Session {
public:
    MOCK_METHOD(std::string, id, (), (const, override));
    MOCK_METHOD(std::optional<std::string>, getToken, (), (const, override));
    MOCK_METHOD(void, setToken, (std::string token), (override));
    MOCK_METHOD(std::optional<session::json>, getValue, (std::string_view key),
                (const, override));
    MOCK_METHOD(void, setValue, (std::string key, session::json value),
                (override));
    MOCK_METHOD(void, removeValue, (std::string_view key), (override));
};

/// Throwing action standing in for an unreachable session backend.
inline auto backendDown() {
    return ::testing::Throw(session::SessionError(
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, "backend unreachable"));
}

/// Throwing action for a backend whose encryption layer fails.
inline auto cryptoFailure() {
    return ::testing::Throw(security::CryptoException(
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, "cipher failure"));
}

}  // namespace rampart::test

#endif  // RAMPART_TESTS_MOCKS_MOCK_SESSION_HPP
