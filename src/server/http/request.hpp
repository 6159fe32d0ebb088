/*
 * request.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Transport-neutral request and response types seen by the
security pipeline

**************************************************/

#ifndef RAMPART_SERVER_HTTP_REQUEST_HPP
#define RAMPART_SERVER_HTTP_REQUEST_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "session/session.hpp"
#include "utils/header_map.hpp"

namespace rampart::server::http {

using utils::HeaderMap;

/// Pipeline stages in the order a request passes through them.
enum class Stage {
    Received,
    HostChecked,
    MethodClassified,
    CsrfChecked,
    Sanitized,
    Dispatched,
    HeadersInjected,
    Sent
};

[[nodiscard]] constexpr auto stageName(Stage stage) -> std::string_view {
    switch (stage) {
        case Stage::Received:
            return "received";
        case Stage::HostChecked:
            return "host_checked";
        case Stage::MethodClassified:
            return "method_classified";
        case Stage::CsrfChecked:
            return "csrf_checked";
        case Stage::Sanitized:
            return "sanitized";
        case Stage::Dispatched:
            return "dispatched";
        case Stage::HeadersInjected:
            return "headers_injected";
        case Stage::Sent:
            return "sent";
    }
    return "unknown";
}

struct Response {
    int status{200};
    HeaderMap headers;
    std::string body;
};

/**
 * @brief One inbound request
 *
 * Owned by a single request thread. The cancellation flag is shared with
 * the transport, which sets it when the client goes away.
 */
struct RequestContext {
    std::string method;
    std::string url;
    HeaderMap headers;
    std::string body;
    std::shared_ptr<session::Session> session;

    /// Creates the session when none is attached; called only once the
    /// host check has passed.
    std::function<std::shared_ptr<session::Session>()> sessionLoader;

    /// Set by the pipeline when the CSP uses per-request nonces.
    std::optional<std::string> cspNonce;

    /// Stages reached so far.
    std::vector<Stage> trace;

    std::shared_ptr<std::atomic<bool>> cancelled{
        std::make_shared<std::atomic<bool>>(false)};

    [[nodiscard]] auto contentType() const -> std::string_view {
        return headers.get("Content-Type").value_or(std::string_view{});
    }

    void cancel() { cancelled->store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const {
        return cancelled->load(std::memory_order_relaxed);
    }

    void record(Stage stage) { trace.push_back(stage); }

    [[nodiscard]] bool reached(Stage stage) const {
        for (auto s : trace) {
            if (s == stage) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace rampart::server::http

#endif  // RAMPART_SERVER_HTTP_REQUEST_HPP
