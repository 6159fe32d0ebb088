/*
 * crypto.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "crypto.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <climits>
#include <string>

namespace rampart::security {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

auto randomBytes(std::size_t count) -> Bytes {
    Bytes out(count);
    if (count == 0) {
        return out;
    }
    if (count > static_cast<std::size_t>(INT_MAX) ||
        RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        THROW_CRYPTO_EXCEPTION("RAND_bytes failed to produce " +
                               std::to_string(count) + " bytes");
    }
    return out;
}

auto hmacSha256(std::string_view key, const Bytes& message) -> Bytes {
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    const unsigned char* result =
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             message.data(), message.size(), digest.data(), &length);
    if (result == nullptr) {
        THROW_CRYPTO_EXCEPTION("HMAC-SHA256 computation failed");
    }
    digest.resize(length);
    return digest;
}

auto toHex(const Bytes& data) -> std::string {
    std::string out;
    out.reserve(data.size() * 2);
    for (unsigned char byte : data) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

auto fromHex(std::string_view hex) -> std::optional<Bytes> {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

auto base64Encode(const Bytes& data) -> std::string {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written =
        EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

auto base64UrlEncode(const Bytes& data) -> std::string {
    std::string out = base64Encode(data);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

auto base64UrlDecode(std::string_view text) -> std::optional<Bytes> {
    if (text.empty() || text.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string standard;
    standard.reserve(text.size() + 3);
    for (char c : text) {
        if (c == '-') {
            standard.push_back('+');
        } else if (c == '_') {
            standard.push_back('/');
        } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                   (c >= '0' && c <= '9')) {
            standard.push_back(c);
        } else {
            return std::nullopt;
        }
    }
    std::size_t padding = 0;
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
        ++padding;
    }

    Bytes out(3 * (standard.size() / 4));
    const int decoded = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
        static_cast<int>(standard.size()));
    if (decoded < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

}  // namespace rampart::security
