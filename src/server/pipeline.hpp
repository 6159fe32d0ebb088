/*
 * pipeline.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Security pipeline wrapped around the application handler

**************************************************/

#ifndef RAMPART_SERVER_PIPELINE_HPP
#define RAMPART_SERVER_PIPELINE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "config/config_store.hpp"
#include "http/request.hpp"
#include "security/http_method.hpp"
#include "security/security_policy.hpp"

namespace rampart::server {

using http::RequestContext;
using http::Response;
using http::Stage;

/// The request may go on to the handler.
struct Proceed {};

/// The request is answered here and the handler is never invoked.
struct Rejection {
    int status{400};
    std::string code;
    std::string message;
};

/// The client went away; no response is produced.
struct Aborted {};

using PipelineOutcome = std::variant<Proceed, Rejection, Aborted>;

/**
 * @brief Per-request state carried from beforeDispatch to afterDispatch
 */
struct DispatchState {
    /// Configuration the request started with, kept for its whole life.
    std::shared_ptr<const security::SecurityPolicy> policy;
    security::MethodClass methodClass{security::MethodClass::Safe};
    /// Token held by the session when the request was checked or issued.
    std::optional<std::string> token;
    /// The request got past the CSRF check (unsafe) or token issue (safe).
    bool csrfPassed{false};
};

using Handler = std::function<Response(RequestContext&)>;

/**
 * @brief Runs the security stages around an application handler
 *
 * Received -> HostChecked -> MethodClassified -> CsrfChecked -> Sanitized
 * -> Dispatched -> HeadersInjected -> Sent. A rejection short-circuits to
 * header injection; the handler then never runs.
 *
 * Transports with split before/after hooks call beforeDispatch and
 * afterDispatch themselves; everything else uses process().
 *
 * @thread_safety All methods are const and may run concurrently for
 * independent requests.
 */
class SecurityPipeline {
public:
    explicit SecurityPipeline(std::shared_ptr<config::ConfigStore> store);

    /**
     * @brief Host check, method classification, CSRF check or token issue,
     *        body sanitization
     *
     * Pins the current configuration snapshot into @p state. On Proceed
     * the request body has been sanitized in place.
     */
    auto beforeDispatch(RequestContext& request, DispatchState& state) const
        -> PipelineOutcome;

    /**
     * @brief Security headers, token rotation and surfacing
     * @return false when the request was cancelled and nothing must be sent
     */
    bool afterDispatch(RequestContext& request, const DispatchState& state,
                       Response& response) const;

    /**
     * @brief JSON error response for a rejection, security headers included
     */
    [[nodiscard]] auto rejectionResponse(RequestContext& request,
                                         const DispatchState& state,
                                         const Rejection& rejection) const
        -> Response;

    /**
     * @brief Run the complete pipeline around @p handler
     *
     * The handler is invoked at most once. An exception it throws becomes a
     * 500 response.
     *
     * @return the response to send, or nullopt when the client disconnected
     */
    auto process(RequestContext& request, const Handler& handler) const
        -> std::optional<Response>;

    [[nodiscard]] auto store() const -> const config::ConfigStore& {
        return *store_;
    }

private:
    [[nodiscard]] auto checkCsrf(RequestContext& request,
                                 DispatchState& state) const
        -> std::optional<Rejection>;

    void issueToken(RequestContext& request, DispatchState& state) const;

    /// Records Sanitized only when the body was actually rewritten.
    [[nodiscard]] static auto sanitize(RequestContext& request,
                                       const DispatchState& state)
        -> std::optional<Rejection>;

    static void attachSession(RequestContext& request);

    [[nodiscard]] static auto presentedToken(
        const RequestContext& request, const security::SecurityPolicy& policy)
        -> std::optional<std::string>;

    std::shared_ptr<config::ConfigStore> store_;
};

}  // namespace rampart::server

#endif  // RAMPART_SERVER_PIPELINE_HPP
