/*
 * api.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: JSON response models for the demo API

**************************************************/

#ifndef RAMPART_SERVER_MODELS_API_HPP
#define RAMPART_SERVER_MODELS_API_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace rampart::models::api {

using json = nlohmann::json;

/// Machine-readable code plus a message safe to show to clients.
struct ApiError {
    std::string code;
    std::string message;
};

/**
 * @brief Identifier echoed in the X-Request-ID header and the JSON body
 *
 * Millisecond wall clock and a wrapping sequence, both hex:
 * `18c3f2a9b10-002a`.
 */
inline auto generateRequestId() -> std::string {
    static std::atomic<std::uint32_t> sequence{0};
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const auto seq = sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return fmt::format("{:x}-{:04x}", millis, seq & 0xFFFFu);
}

/// `{"success":true,"request_id":…,"data":…[,"message":…]}`
inline auto success(const json& data, std::string_view requestId,
                    std::string_view message = {}) -> json {
    json envelope{{"success", true},
                  {"request_id", std::string(requestId)},
                  {"data", data}};
    if (!message.empty()) {
        envelope["message"] = std::string(message);
    }
    return envelope;
}

/// `{"success":false,"request_id":…,"error":{"code":…,"message":…}}`
inline auto failure(const ApiError& error, std::string_view requestId)
    -> json {
    return {{"success", false},
            {"request_id", std::string(requestId)},
            {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace rampart::models::api

#endif  // RAMPART_SERVER_MODELS_API_HPP
