/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Logging configuration read from the `rampart.logging` object

**************************************************/

#ifndef RAMPART_LOGGING_TYPES_HPP
#define RAMPART_LOGGING_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rampart::logging {

using json = nlohmann::json;

enum class SinkKind { Console, BasicFile, RotatingFile, DailyFile };

/// "console"/"stdout", "file"/"basic_file", "rotating_file", "daily_file".
[[nodiscard]] auto parseSinkKind(std::string_view name)
    -> std::optional<SinkKind>;

[[nodiscard]] auto sinkKindName(SinkKind kind) -> std::string_view;

/// Level names as spdlog prints them, plus "warn", "err" and "fatal".
[[nodiscard]] auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

[[nodiscard]] auto levelName(spdlog::level::level_enum level) -> std::string;

/**
 * @brief One output of the logging system
 *
 * ```json
 * {"name": "audit", "type": "rotating_file", "level": "warning",
 *  "path": "logs/audit.log", "maxSize": 1048576, "maxFiles": 3}
 * ```
 */
struct SinkConfig {
    std::string name;
    SinkKind kind{SinkKind::Console};
    spdlog::level::level_enum level{spdlog::level::trace};
    /// Empty means the manager's pattern.
    std::string pattern;

    std::string path;
    std::size_t maxSize{10 * 1024 * 1024};
    std::size_t maxFiles{5};
    int rotationHour{0};
    int rotationMinute{0};

    [[nodiscard]] bool writesFile() const { return kind != SinkKind::Console; }

    [[nodiscard]] auto toJson() const -> json;

    /// nullopt (with a warning) for an unknown type or a file sink without path.
    [[nodiscard]] static auto fromJson(const json& j)
        -> std::optional<SinkConfig>;
};

/**
 * @brief Levels, pattern and sinks of the process-wide logger
 *
 * Without a "sinks" array, a console sink is used, plus a rotating file sink
 * when "file" names a path.
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> LoggingConfig;

    /// Console only, at info.
    [[nodiscard]] static auto createDefault() -> LoggingConfig;
};

}  // namespace rampart::logging

#endif  // RAMPART_LOGGING_TYPES_HPP
