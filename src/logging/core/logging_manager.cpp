/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include "../sinks/sink_factory.hpp"

namespace rampart::logging {

namespace {
constexpr const char* DEFAULT_LOGGER = "rampart";
}

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() { shutdown(); }

void LoggingManager::initialize(const LoggingConfig& config) {
    std::vector<std::pair<std::string, spdlog::sink_ptr>> sinks;
    for (const auto& sinkConfig : config.sinks) {
        if (auto sink = SinkFactory::createSink(sinkConfig, config.pattern)) {
            sinks.emplace_back(sinkConfig.name, std::move(sink));
        }
    }

    {
        std::unique_lock lock(mutex_);
        const bool reinitializing = initialized_;
        config_ = config;
        sinks_ = std::move(sinks);
        loggers_.clear();
        initialized_ = true;

        defaultLogger_ = makeLogger(DEFAULT_LOGGER);
        spdlog::set_default_logger(defaultLogger_);
        if (reinitializing) {
            spdlog::info("Logging reconfigured");
        }
    }
    spdlog::info("Logging initialized with {} sink(s) at level {}",
                 config.sinks.size(), levelName(config.level));
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);
    if (!initialized_) {
        return;
    }
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    defaultLogger_->flush();

    loggers_.clear();
    defaultLogger_.reset();
    sinks_.clear();
    initialized_ = false;
}

bool LoggingManager::isInitialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = loggers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = makeLogger(name);
    }
    return it->second;
}

void LoggingManager::setLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);
    config_.level = level;
    for (const auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    if (defaultLogger_) {
        defaultLogger_->set_level(level);
    }
}

auto LoggingManager::sinkNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sinks_.size());
    for (const auto& [name, sink] : sinks_) {
        names.push_back(name);
    }
    return names;
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    if (defaultLogger_) {
        defaultLogger_->flush();
    }
}

auto LoggingManager::config() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

auto LoggingManager::makeLogger(const std::string& name) const
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.reserve(sinks_.size());
    for (const auto& [sinkName, sink] : sinks_) {
        sinks.push_back(sink);
    }
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config_.level);
    return logger;
}

}  // namespace rampart::logging
