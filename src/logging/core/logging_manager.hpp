/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Process-wide owner of log sinks and named loggers

**************************************************/

#ifndef RAMPART_LOGGING_LOGGING_MANAGER_HPP
#define RAMPART_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace rampart::logging {

/**
 * @brief Owns the configured sinks and every logger built on them
 *
 * initialize() installs a "rampart" logger as the spdlog default, so plain
 * spdlog::info() calls reach the configured sinks. Named loggers share the
 * same sinks. Calling initialize() again replaces sinks and loggers.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void initialize(const LoggingConfig& config);

    /// Flush and release all sinks. The spdlog default logger is kept.
    void shutdown();

    [[nodiscard]] bool isInitialized() const;

    /// Logger named @p name on the configured sinks, created on first use.
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /// Level of the default logger and every named logger.
    void setLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto sinkNames() const -> std::vector<std::string>;

    void flush();

    [[nodiscard]] auto config() const -> LoggingConfig;

private:
    LoggingManager() = default;
    ~LoggingManager();

    [[nodiscard]] auto makeLogger(const std::string& name) const
        -> std::shared_ptr<spdlog::logger>;

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};
    std::vector<std::pair<std::string, spdlog::sink_ptr>> sinks_;
    std::shared_ptr<spdlog::logger> defaultLogger_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}  // namespace rampart::logging

#endif  // RAMPART_LOGGING_LOGGING_MANAGER_HPP
