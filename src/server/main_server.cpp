/*
 * main_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "main_server.hpp"

#include <spdlog/spdlog.h>

#include "models/api.hpp"
#include "security/csrf_token.hpp"

namespace rampart::server {

namespace {

using json = nlohmann::json;

constexpr const char* LOGGING_PATH = "/rampart/logging";

auto jsonResponse(int status, const json& body) -> crow::response {
    crow::response res(status, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

}  // namespace

MainServer::MainServer(const Config& config)
    : config_(config),
      sessions_(std::make_shared<session::InMemorySessionStore>()) {
    json document = json::object();
    if (config_.config_path) {
        document = config::ConfigStore::loadDocument(*config_.config_path);
    }

    initializeLogging(document);
    initializeSecurity(document);
    initializeRoutes();
}

void MainServer::start() {
    spdlog::info("Starting server on port {}", config_.port);
    // signals are handled by the caller, outside of signal context
    app_.signal_clear()
        .port(static_cast<std::uint16_t>(config_.port))
        .concurrency(static_cast<std::uint16_t>(config_.thread_count))
        .run();
}

void MainServer::stop() {
    spdlog::info("Stopping server...");
    app_.stop();
    logging::LoggingManager::getInstance().shutdown();
}

bool MainServer::reloadConfig() {
    if (!config_.config_path) {
        spdlog::warn("No configuration file to reload");
        return false;
    }
    try {
        store_->reload(*config_.config_path);
        return true;
    } catch (const config::BadConfigException& e) {
        spdlog::error("Configuration reload rejected: {}", e.what());
        return false;
    }
}

void MainServer::initializeLogging(const json& document) {
    const json::json_pointer pointer{LOGGING_PATH};
    auto log_config = document.contains(pointer)
                          ? logging::LoggingConfig::fromJson(document.at(pointer))
                          : logging::LoggingConfig::createDefault();
    logging::LoggingManager::getInstance().initialize(log_config);
}

void MainServer::initializeSecurity(const json& document) {
    spdlog::info("Initializing security pipeline...");

    auto security = config::ConfigStore::securitySection(document);
    security.applyEnvironment();

    store_ = std::make_shared<config::ConfigStore>(security);
    pipeline_ = std::make_shared<SecurityPipeline>(store_);
    app_.get_middleware<middleware::SecurityGuard>().configure(pipeline_,
                                                               sessions_);

    spdlog::info("Security pipeline ready: {} allowed host pattern(s)",
                 security.allowedHosts.size());
}

auto MainServer::sessionOf(const crow::request& req)
    -> std::shared_ptr<session::Session> {
    return app_.get_context<middleware::SecurityGuard>(req).request.session;
}

void MainServer::initializeRoutes() {
    CROW_ROUTE(app_, "/")
    ([]() {
        return jsonResponse(
            200, models::api::success({{"service", "rampart"}},
                                      models::api::generateRequestId()));
    });

    CROW_ROUTE(app_, "/health")
    ([this]() {
        return jsonResponse(
            200, models::api::success(
                     {{"status", "ok"},
                      {"config_generation", store_->generation()},
                      {"sessions", sessions_->size()}},
                     models::api::generateRequestId()));
    });

    // HTML form with the masked token embedded as a hidden field
    CROW_ROUTE(app_, "/form")
    ([this](const crow::request& req) {
        const auto& ctx = app_.get_context<middleware::SecurityGuard>(req);
        const auto& policy = *ctx.state.policy;
        std::string token;
        if (ctx.state.token) {
            token = security::TokenCodec::mask(*ctx.state.token);
        }
        std::string nonceAttr;
        if (ctx.request.cspNonce) {
            nonceAttr = " nonce=\"" + *ctx.request.cspNonce + "\"";
        }

        std::string html =
            "<!doctype html><html><body>"
            "<form method=\"post\" action=\"/echo\">"
            "<input type=\"hidden\" name=\"" + policy.csrfField +
            "\" value=\"" + token + "\">"
            "<input name=\"message\"><button type=\"submit\">Send</button>"
            "</form><script" + nonceAttr +
            ">document.forms[0].message.focus();</script>"
            "</body></html>";

        crow::response res(200, html);
        res.set_header("Content-Type", "text/html; charset=utf-8");
        return res;
    });

    CROW_ROUTE(app_, "/echo")
        .methods("POST"_method)([](const crow::request& req) {
            return jsonResponse(
                200, models::api::success(
                         {{"content_type", req.get_header_value("Content-Type")},
                          {"body", req.body}},
                         models::api::generateRequestId()));
        });

    CROW_ROUTE(app_, "/login")
        .methods("POST"_method)([this](const crow::request& req) {
            auto request_id = models::api::generateRequestId();
            auto body = json::parse(req.body, nullptr, false);
            if (!body.is_object() || !body.contains("user_id") ||
                !body["user_id"].is_number_integer()) {
                return jsonResponse(
                    400, models::api::failure(
                             {"invalid_request", "user_id must be an integer"},
                             request_id));
            }
            auto userId = body["user_id"].get<std::int64_t>();
            sessionOf(req)->set(std::string(session::USER_ID_KEY), userId);
            spdlog::info("Session bound to user {}", userId);
            return jsonResponse(
                200, models::api::success({{"user_id", userId}}, request_id,
                                          "Logged in"));
        });

    CROW_ROUTE(app_, "/logout")
        .methods("POST"_method)([this](const crow::request& req) {
            sessionOf(req)->removeValue(session::USER_ID_KEY);
            return jsonResponse(
                200, models::api::success(json::object(),
                                          models::api::generateRequestId(),
                                          "Logged out"));
        });

    spdlog::info("Routes registered");
}

}  // namespace rampart::server
