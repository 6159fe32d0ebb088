/*
 * main_server.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Demo server owning configuration, logging and the Crow app

**************************************************/

#ifndef RAMPART_SERVER_MAIN_SERVER_HPP
#define RAMPART_SERVER_MAIN_SERVER_HPP

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "app.hpp"
#include "config/config_store.hpp"
#include "logging/core/logging_manager.hpp"
#include "session/session_store.hpp"

namespace rampart::server {

/**
 * @brief Demo HTTP server protected by the security pipeline
 */
class MainServer {
public:
    /**
     * @brief Server configuration
     */
    struct Config {
        int port = 8080;
        int thread_count = 4;
        /// JSON file with `rampart.security` and `rampart.logging` objects.
        std::optional<std::string> config_path;
    };

    /**
     * @throws config::BadConfigException when the configuration is unusable
     */
    explicit MainServer(const Config& config);

    /**
     * @brief Start the server (blocks until stop())
     */
    void start();

    /**
     * @brief Stop the server gracefully
     */
    void stop();

    /**
     * @brief Re-read the configuration file and publish it
     * @return false when there is no file or it does not validate
     */
    bool reloadConfig();

    ServerApp& getApp() { return app_; }

    [[nodiscard]] auto configStore() const
        -> std::shared_ptr<config::ConfigStore> {
        return store_;
    }

private:
    void initializeLogging(const nlohmann::json& document);
    void initializeSecurity(const nlohmann::json& document);
    void initializeRoutes();

    [[nodiscard]] auto sessionOf(const crow::request& req)
        -> std::shared_ptr<session::Session>;

    Config config_;
    ServerApp app_;
    std::shared_ptr<config::ConfigStore> store_;
    std::shared_ptr<session::InMemorySessionStore> sessions_;
    std::shared_ptr<SecurityPipeline> pipeline_;
};

}  // namespace rampart::server

#endif  // RAMPART_SERVER_MAIN_SERVER_HPP
