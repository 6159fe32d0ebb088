/*
 * secret_compare.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "secret_compare.hpp"

#include <openssl/crypto.h>

namespace rampart::security {

bool constantTimeEquals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.empty()) {
        return true;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace rampart::security
