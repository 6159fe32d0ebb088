/*
 * pipeline.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include "models/api.hpp"
#include "security/body_sanitizer.hpp"
#include "security/crypto.hpp"
#include "security/csrf_token.hpp"
#include "utils/form_codec.hpp"

namespace rampart::server {

namespace {

constexpr std::string_view CSRF_REJECTED_MESSAGE =
    "CSRF token missing or invalid";

auto policyOf(const std::shared_ptr<const config::ConfigSnapshot>& snapshot)
    -> std::shared_ptr<const security::SecurityPolicy> {
    // shares ownership of the whole snapshot
    return {snapshot, &snapshot->policy};
}

auto errorResponse(int status, const std::string& code,
                   const std::string& message) -> Response {
    auto requestId = models::api::generateRequestId();
    Response response;
    response.status = status;
    response.headers.set("Content-Type", "application/json");
    response.headers.set("X-Request-ID", requestId);
    response.body =
        models::api::failure({code, message}, requestId).dump();
    return response;
}

}  // namespace

SecurityPipeline::SecurityPipeline(std::shared_ptr<config::ConfigStore> store)
    : store_(std::move(store)) {}

auto SecurityPipeline::beforeDispatch(RequestContext& request,
                                      DispatchState& state) const
    -> PipelineOutcome {
    state.policy = policyOf(store_->snapshot());
    const auto& policy = *state.policy;

    if (request.isCancelled()) {
        return Aborted{};
    }
    request.record(Stage::Received);

    // Host
    auto host = request.headers.get("Host");
    if (auto message = policy.hosts.validate(host)) {
        return Rejection{400, "host_rejected", std::move(*message)};
    }
    request.record(Stage::HostChecked);
    attachSession(request);

    if (request.isCancelled()) {
        return Aborted{};
    }
    state.methodClass = security::classifyMethod(request.method);
    request.record(Stage::MethodClassified);

    // CSRF
    if (request.isCancelled()) {
        return Aborted{};
    }
    if (state.methodClass == security::MethodClass::Unsafe) {
        if (auto rejection = checkCsrf(request, state)) {
            return std::move(*rejection);
        }
        request.record(Stage::CsrfChecked);
    } else {
        issueToken(request, state);
    }

    // Body
    if (request.isCancelled()) {
        return Aborted{};
    }
    if (auto rejection = sanitize(request, state)) {
        return std::move(*rejection);
    }

    if (policy.headers.usesNonce()) {
        request.cspNonce = security::HeaderInjector::generateNonce();
    }
    return Proceed{};
}

bool SecurityPipeline::afterDispatch(RequestContext& request,
                                     const DispatchState& state,
                                     Response& response) const {
    if (request.isCancelled()) {
        spdlog::info("Client disconnected from {} {}, dropping response",
                     request.method, request.url);
        return false;
    }
    const auto& policy = *state.policy;

    policy.headers.inject(response.headers, request.cspNonce);
    request.record(Stage::HeadersInjected);

    if (state.csrfPassed && request.session) {
        auto token = state.token;
        if (state.methodClass == security::MethodClass::Unsafe &&
            response.status < 400) {
            try {
                if (auto rotated = security::TokenCodec::rotateAfterSuccess(
                        *request.session, policy.secretKey, request.method)) {
                    token = std::move(rotated);
                }
            } catch (const session::SessionError& e) {
                spdlog::error("CSRF token rotation failed for {} {}: {}",
                              request.method, request.url, e.what());
            } catch (const security::CryptoException& e) {
                spdlog::error("CSRF token rotation failed for {} {}: {}",
                              request.method, request.url, e.what());
            }
        }
        if (token) {
            try {
                response.headers.set(policy.csrfHeader,
                                     security::TokenCodec::mask(*token));
            } catch (const security::CryptoException& e) {
                spdlog::error("Cannot mask CSRF token for {} {}: {}",
                              request.method, request.url, e.what());
            }
        }
    }

    request.record(Stage::Sent);
    return true;
}

auto SecurityPipeline::rejectionResponse(RequestContext& request,
                                         const DispatchState& state,
                                         const Rejection& rejection) const
    -> Response {
    auto response =
        errorResponse(rejection.status, rejection.code, rejection.message);
    spdlog::warn("Rejected {} {} with {} {} (request_id: {})", request.method,
                 request.url, rejection.status, rejection.code,
                 *response.headers.get("X-Request-ID"));

    if (state.policy) {
        state.policy->headers.inject(response.headers, request.cspNonce);
    }
    request.record(Stage::HeadersInjected);
    request.record(Stage::Sent);
    return response;
}

auto SecurityPipeline::process(RequestContext& request,
                               const Handler& handler) const
    -> std::optional<Response> {
    DispatchState state;
    auto outcome = beforeDispatch(request, state);

    if (std::holds_alternative<Aborted>(outcome)) {
        spdlog::info("Client disconnected from {} {} before dispatch",
                     request.method, request.url);
        return std::nullopt;
    }
    if (const auto* rejection = std::get_if<Rejection>(&outcome)) {
        return rejectionResponse(request, state, *rejection);
    }

    Response response;
    try {
        response = handler(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} {} failed: {}", request.method,
                      request.url, e.what());
        response = errorResponse(500, "internal_error",
                                 "Internal server error");
    }
    request.record(Stage::Dispatched);

    if (!afterDispatch(request, state, response)) {
        return std::nullopt;
    }
    return response;
}

auto SecurityPipeline::checkCsrf(RequestContext& request,
                                 DispatchState& state) const
    -> std::optional<Rejection> {
    const auto& policy = *state.policy;
    const Rejection rejected{403, "csrf_rejected",
                             std::string(CSRF_REJECTED_MESSAGE)};

    if (!request.session) {
        spdlog::warn("CSRF check for {} {} without a session", request.method,
                     request.url);
        return rejected;
    }

    try {
        auto stored = request.session->getToken();
        auto presented = presentedToken(request, policy);
        std::optional<std::string> raw;
        if (presented) {
            raw = security::TokenCodec::unmask(*presented);
        }

        if (!security::TokenCodec::verify(stored, raw)) {
            spdlog::warn("CSRF check failed for {} {} ({})", request.method,
                         request.url,
                         !stored      ? "no token in session"
                         : !presented ? "no token presented"
                                      : "token mismatch");
            return rejected;
        }
        state.token = std::move(stored);
        state.csrfPassed = true;
    } catch (const session::SessionError& e) {
        spdlog::error("Session backend failed during CSRF check for {} {}: {}",
                      request.method, request.url, e.what());
        return rejected;
    } catch (const security::CryptoException& e) {
        spdlog::error("Crypto failure during CSRF check for {} {}: {}",
                      request.method, request.url, e.what());
        return rejected;
    }
    return std::nullopt;
}

void SecurityPipeline::issueToken(RequestContext& request,
                                  DispatchState& state) const {
    if (!request.session) {
        return;
    }
    try {
        state.token = security::TokenCodec::issue(*request.session,
                                                  state.policy->secretKey);
        state.csrfPassed = true;
    } catch (const session::SessionError& e) {
        spdlog::warn("Could not issue CSRF token for {} {}: {}",
                     request.method, request.url, e.what());
    } catch (const security::CryptoException& e) {
        spdlog::error("Could not issue CSRF token for {} {}: {}",
                      request.method, request.url, e.what());
    }
}

void SecurityPipeline::attachSession(RequestContext& request) {
    if (request.session || !request.sessionLoader) {
        return;
    }
    try {
        request.session = request.sessionLoader();
    } catch (const session::SessionError& e) {
        spdlog::error("Cannot create a session for {} {}: {}", request.method,
                      request.url, e.what());
    } catch (const security::CryptoException& e) {
        spdlog::error("Cannot create a session for {} {}: {}", request.method,
                      request.url, e.what());
    }
}

auto SecurityPipeline::sanitize(RequestContext& request,
                                const DispatchState& state)
    -> std::optional<Rejection> {
    const auto& sanitizer = state.policy->sanitizer;
    if (!sanitizer.policy().enabled) {
        return std::nullopt;
    }

    const auto contentType = request.contentType();
    const auto status = sanitizer.sanitizeBody(contentType, request.body);
    const bool failClosed = sanitizer.policy().failClosed;

    switch (status) {
        case security::SanitizeStatus::Unsupported:
            if (failClosed) {
                return Rejection{415, "unsupported_media_type",
                                 "Unsupported content type"};
            }
            spdlog::info("Sanitization bypassed for {} {}: content type '{}'",
                         request.method, request.url, contentType);
            break;
        case security::SanitizeStatus::Malformed:
            if (failClosed) {
                return Rejection{400, "malformed_body", "Malformed JSON body"};
            }
            spdlog::warn("Sanitization bypassed for {} {}: malformed body",
                         request.method, request.url);
            break;
        case security::SanitizeStatus::Sanitized:
            request.record(Stage::Sanitized);
            break;
        case security::SanitizeStatus::Empty:
            break;
    }
    return std::nullopt;
}

auto SecurityPipeline::presentedToken(const RequestContext& request,
                                      const security::SecurityPolicy& policy)
    -> std::optional<std::string> {
    if (auto header = request.headers.get(policy.csrfHeader);
        header && !header->empty()) {
        return std::string(*header);
    }

    switch (security::BodySanitizer::classify(request.contentType())) {
        case security::BodyKind::Form:
            return utils::findFormValue(request.body, policy.csrfField);
        case security::BodyKind::Json: {
            auto document = security::BodySanitizer::parseJson(request.body);
            if (document && document->is_object()) {
                auto it = document->find(policy.csrfField);
                if (it != document->end() && it->is_string()) {
                    return it->get<std::string>();
                }
            }
            break;
        }
        case security::BodyKind::Unsupported:
            break;
    }
    return std::nullopt;
}

}  // namespace rampart::server
