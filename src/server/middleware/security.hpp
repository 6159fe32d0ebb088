/*
 * security.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Crow middleware running the inbound security pipeline

**************************************************/

#ifndef RAMPART_SERVER_MIDDLEWARE_SECURITY_HPP
#define RAMPART_SERVER_MIDDLEWARE_SECURITY_HPP

#include <crow.h>
#include <crow/middlewares/cookie_parser.h>

#include <chrono>
#include <memory>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "../pipeline.hpp"
#include "session/session_store.hpp"

namespace rampart::server::middleware {

/// Cookie carrying the session identifier.
inline constexpr const char* SESSION_COOKIE = "rampart_session";

/**
 * @brief Mounts the security pipeline on a Crow application
 *
 * Must be listed after crow::CookieParser so the session cookie is parsed
 * before this runs and written after it.
 */
struct SecurityGuard {
    struct context {
        http::RequestContext request;
        DispatchState state;
        bool proceeded = false;
    };

    std::shared_ptr<SecurityPipeline> pipeline;
    std::shared_ptr<session::InMemorySessionStore> sessions;

    void configure(std::shared_ptr<SecurityPipeline> securityPipeline,
                   std::shared_ptr<session::InMemorySessionStore> store) {
        pipeline = std::move(securityPipeline);
        sessions = std::move(store);
    }

    template <typename AllContext>
    void before_handle(crow::request& req, crow::response& res, context& ctx,
                       AllContext& all_ctx) {
        if (!pipeline || !sessions) {
            spdlog::error("SecurityGuard used before configure()");
            res.code = 500;
            res.end();
            return;
        }

        auto& cookies = all_ctx.template get<crow::CookieParser>();
        auto& request = ctx.request;
        request.method = crow::method_name(req.method);
        request.url = req.url;
        for (const auto& [name, value] : req.headers) {
            request.headers.add(name, value);
        }
        request.body = req.body;

        if (const auto& sessionId = cookies.get_cookie(SESSION_COOKIE);
            !sessionId.empty()) {
            request.session = sessions->find(sessionId);
        }
        // new sessions only for requests that pass the host check
        request.sessionLoader = [this, &cookies]() {
            auto session = sessions->create();
            cookies.set_cookie(SESSION_COOKIE, session->id())
                .path("/")
                .httponly()
                .same_site(crow::CookieParser::Cookie::SameSitePolicy::Lax);
            return std::shared_ptr<session::Session>(std::move(session));
        };

        auto outcome = pipeline->beforeDispatch(request, ctx.state);
        request.sessionLoader = nullptr;
        if (const auto* rejection = std::get_if<Rejection>(&outcome)) {
            auto response =
                pipeline->rejectionResponse(request, ctx.state, *rejection);
            res.code = response.status;
            for (const auto& [name, value] : response.headers) {
                res.set_header(name, value);
            }
            res.write(response.body);
            res.end();
            return;
        }
        if (std::holds_alternative<Aborted>(outcome)) {
            res.end();
            return;
        }

        // the handler sees the sanitized body
        req.body = request.body;
        ctx.proceeded = true;
    }

    template <typename AllContext>
    void after_handle(crow::request& /*req*/, crow::response& res,
                      context& ctx, AllContext& /*all_ctx*/) {
        if (!ctx.proceeded) {
            return;
        }
        ctx.request.record(Stage::Dispatched);

        Response response;
        response.status = res.code;
        std::unordered_set<std::string> present;
        for (const auto& [name, value] : res.headers) {
            response.headers.add(name, value);
            present.insert(toLower(name));
        }

        if (!pipeline->afterDispatch(ctx.request, ctx.state, response)) {
            return;
        }

        const auto csrfHeader = toLower(ctx.state.policy->csrfHeader);
        for (const auto& [name, value] : response.headers) {
            const auto lowered = toLower(name);
            if (!present.contains(lowered) || lowered == csrfHeader) {
                res.set_header(name, value);
            }
        }
    }

private:
    static auto toLower(std::string text) -> std::string {
        for (auto& c : text) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return text;
    }
};

/**
 * @brief Request logging middleware
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
    };

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        spdlog::info("Incoming request: {} {}", crow::method_name(req.method),
                     req.url);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        spdlog::info("Request completed: {} {} - Status: {} - Duration: {}ms",
                     crow::method_name(req.method), req.url, res.code,
                     duration.count());
    }
};

}  // namespace rampart::server::middleware

#endif  // RAMPART_SERVER_MIDDLEWARE_SECURITY_HPP
