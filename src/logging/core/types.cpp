/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <array>
#include <utility>

namespace rampart::logging {

namespace {

constexpr std::array<std::pair<std::string_view, SinkKind>, 6> SINK_KINDS{{
    {"console", SinkKind::Console},
    {"stdout", SinkKind::Console},
    {"file", SinkKind::BasicFile},
    {"basic_file", SinkKind::BasicFile},
    {"rotating_file", SinkKind::RotatingFile},
    {"daily_file", SinkKind::DailyFile},
}};

auto consoleSink() -> SinkConfig {
    SinkConfig sink;
    sink.name = "console";
    sink.kind = SinkKind::Console;
    sink.level = spdlog::level::info;
    return sink;
}

/// Level of @p key in @p j, or @p fallback when missing or unknown.
auto levelOf(const json& j, const char* key, spdlog::level::level_enum fallback)
    -> spdlog::level::level_enum {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto name = j.at(key).get<std::string>();
    if (auto level = parseLevel(name)) {
        return *level;
    }
    spdlog::warn("Unknown log level '{}', using {}", name, levelName(fallback));
    return fallback;
}

}  // namespace

auto parseSinkKind(std::string_view name) -> std::optional<SinkKind> {
    for (const auto& [alias, kind] : SINK_KINDS) {
        if (alias == name) {
            return kind;
        }
    }
    return std::nullopt;
}

auto sinkKindName(SinkKind kind) -> std::string_view {
    switch (kind) {
        case SinkKind::Console:
            return "console";
        case SinkKind::BasicFile:
            return "file";
        case SinkKind::RotatingFile:
            return "rotating_file";
        case SinkKind::DailyFile:
            return "daily_file";
    }
    return "console";
}

auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
    if (name == "warn") {
        return spdlog::level::warn;
    }
    if (name == "err") {
        return spdlog::level::err;
    }
    if (name == "fatal") {
        return spdlog::level::critical;
    }
    for (int i = spdlog::level::trace; i < spdlog::level::n_levels; ++i) {
        const auto level = static_cast<spdlog::level::level_enum>(i);
        const auto known = spdlog::level::to_string_view(level);
        if (name == std::string_view(known.data(), known.size())) {
            return level;
        }
    }
    return std::nullopt;
}

auto levelName(spdlog::level::level_enum level) -> std::string {
    const auto name = spdlog::level::to_string_view(level);
    return {name.data(), name.size()};
}

auto SinkConfig::toJson() const -> json {
    json j{{"name", name},
           {"type", std::string(sinkKindName(kind))},
           {"level", levelName(level)}};
    if (!pattern.empty()) {
        j["pattern"] = pattern;
    }
    if (writesFile()) {
        j["path"] = path;
    }
    if (kind == SinkKind::RotatingFile) {
        j["maxSize"] = maxSize;
        j["maxFiles"] = maxFiles;
    } else if (kind == SinkKind::DailyFile) {
        j["rotationHour"] = rotationHour;
        j["rotationMinute"] = rotationMinute;
    }
    return j;
}

auto SinkConfig::fromJson(const json& j) -> std::optional<SinkConfig> {
    const auto type = j.value("type", std::string("console"));
    auto kind = parseSinkKind(type);
    if (!kind) {
        spdlog::warn("Ignoring log sink of unknown type '{}'", type);
        return std::nullopt;
    }

    SinkConfig sink;
    sink.kind = *kind;
    sink.name = j.value("name", std::string(sinkKindName(sink.kind)));
    sink.level = levelOf(j, "level", sink.level);
    sink.pattern = j.value("pattern", sink.pattern);
    sink.path = j.value("path", sink.path);
    sink.maxSize = j.value("maxSize", sink.maxSize);
    sink.maxFiles = j.value("maxFiles", sink.maxFiles);
    sink.rotationHour = j.value("rotationHour", sink.rotationHour);
    sink.rotationMinute = j.value("rotationMinute", sink.rotationMinute);

    if (sink.writesFile() && sink.path.empty()) {
        spdlog::warn("Ignoring log sink '{}': no path", sink.name);
        return std::nullopt;
    }
    return sink;
}

auto LoggingConfig::toJson() const -> json {
    json sinkList = json::array();
    for (const auto& sink : sinks) {
        sinkList.push_back(sink.toJson());
    }
    return {{"level", levelName(level)}, {"pattern", pattern},
            {"sinks", std::move(sinkList)}};
}

auto LoggingConfig::fromJson(const json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelOf(j, "level", config.level);
    config.pattern = j.value("pattern", config.pattern);

    if (j.contains("sinks") && j.at("sinks").is_array()) {
        for (const auto& entry : j.at("sinks")) {
            if (auto sink = SinkConfig::fromJson(entry)) {
                config.sinks.push_back(std::move(*sink));
            }
        }
        return config;
    }

    config.sinks.push_back(consoleSink());
    if (j.contains("file") && j.at("file").is_string()) {
        SinkConfig file;
        file.name = "file";
        file.kind = SinkKind::RotatingFile;
        file.path = j.at("file").get<std::string>();
        config.sinks.push_back(std::move(file));
    }
    return config;
}

auto LoggingConfig::createDefault() -> LoggingConfig {
    LoggingConfig config;
    config.sinks.push_back(consoleSink());
    return config;
}

}  // namespace rampart::logging
