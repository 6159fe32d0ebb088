/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rampart::logging {

auto SinkFactory::createSink(const SinkConfig& config,
                             std::string_view fallbackPattern)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    try {
        sink = openSink(config);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log sink '{}': {}", config.name, e.what());
        return nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Cannot open log sink '{}': {}", config.name, e.what());
        return nullptr;
    }

    sink->set_level(config.level);
    sink->set_pattern(config.pattern.empty() ? std::string(fallbackPattern)
                                             : config.pattern);
    return sink;
}

auto SinkFactory::openSink(const SinkConfig& config) -> spdlog::sink_ptr {
    if (!config.writesFile()) {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    const std::filesystem::path path(config.path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    switch (config.kind) {
        case SinkKind::RotatingFile:
            return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path, config.maxSize, config.maxFiles);
        case SinkKind::DailyFile:
            return std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.path, config.rotationHour, config.rotationMinute);
        case SinkKind::BasicFile:
        case SinkKind::Console:
            break;
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path);
}

}  // namespace rampart::logging
