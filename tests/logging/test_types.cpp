/*
 * test_types.cpp - Tests for logging configuration types
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "logging/core/types.hpp"

using namespace rampart::logging;
using json = nlohmann::json;

// ============================================================================
// Level and Sink Kind Names
// ============================================================================

TEST(LevelNameTest, ParsesSpdlogNamesAndAliases) {
    EXPECT_EQ(parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLevel("fatal"), spdlog::level::critical);
    EXPECT_EQ(parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(parseLevel("bogus").has_value());
    EXPECT_FALSE(parseLevel("").has_value());
}

TEST(LevelNameTest, NamesParseBack) {
    for (auto level : {spdlog::level::trace, spdlog::level::debug,
                       spdlog::level::info, spdlog::level::warn,
                       spdlog::level::err, spdlog::level::critical,
                       spdlog::level::off}) {
        EXPECT_EQ(parseLevel(levelName(level)), level);
    }
}

TEST(SinkKindTest, Aliases) {
    EXPECT_EQ(parseSinkKind("stdout"), SinkKind::Console);
    EXPECT_EQ(parseSinkKind("basic_file"), SinkKind::BasicFile);
    EXPECT_EQ(parseSinkKind("file"), SinkKind::BasicFile);
    EXPECT_EQ(parseSinkKind("daily_file"), SinkKind::DailyFile);
    EXPECT_FALSE(parseSinkKind("syslog").has_value());
    EXPECT_EQ(sinkKindName(SinkKind::RotatingFile), "rotating_file");
}

// ============================================================================
// SinkConfig Tests
// ============================================================================

TEST(SinkConfigTest, NameDefaultsToType) {
    auto sink = SinkConfig::fromJson({{"type", "daily_file"},
                                      {"path", "logs/app.log"},
                                      {"rotationHour", 3}});
    ASSERT_TRUE(sink.has_value());
    EXPECT_EQ(sink->name, "daily_file");
    EXPECT_EQ(sink->kind, SinkKind::DailyFile);
    EXPECT_EQ(sink->level, spdlog::level::trace);
    EXPECT_EQ(sink->rotationHour, 3);
    EXPECT_EQ(sink->path, "logs/app.log");
}

TEST(SinkConfigTest, RejectsUnknownTypeAndMissingPath) {
    EXPECT_FALSE(SinkConfig::fromJson({{"type", "carrier_pigeon"}}));
    EXPECT_FALSE(SinkConfig::fromJson({{"type", "rotating_file"}}));
    EXPECT_TRUE(SinkConfig::fromJson(json::object()).has_value());
}

TEST(SinkConfigTest, ToJsonOnlyCarriesRelevantOptions) {
    SinkConfig console;
    console.name = "out";
    auto j = console.toJson();
    EXPECT_EQ(j["type"], "console");
    EXPECT_FALSE(j.contains("path"));
    EXPECT_FALSE(j.contains("maxFiles"));
    EXPECT_FALSE(j.contains("pattern"));

    SinkConfig rotating;
    rotating.kind = SinkKind::RotatingFile;
    rotating.path = "x.log";
    rotating.maxFiles = 3;
    auto r = rotating.toJson();
    EXPECT_EQ(r["path"], "x.log");
    EXPECT_EQ(r["maxFiles"], 3);
    EXPECT_FALSE(r.contains("rotationHour"));
}

// ============================================================================
// LoggingConfig Tests
// ============================================================================

TEST(LoggingConfigTest, CreateDefaultHasConsoleOnly) {
    auto config = LoggingConfig::createDefault();
    EXPECT_EQ(config.level, spdlog::level::info);
    ASSERT_EQ(config.sinks.size(), 1u);
    EXPECT_EQ(config.sinks[0].kind, SinkKind::Console);
    EXPECT_EQ(config.sinks[0].name, "console");
}

TEST(LoggingConfigTest, FileShortcutAddsRotatingSink) {
    auto config =
        LoggingConfig::fromJson({{"file", "/var/log/rampart/rampart.log"}});
    ASSERT_EQ(config.sinks.size(), 2u);
    EXPECT_EQ(config.sinks[1].name, "file");
    EXPECT_EQ(config.sinks[1].kind, SinkKind::RotatingFile);
    EXPECT_EQ(config.sinks[1].path, "/var/log/rampart/rampart.log");
}

TEST(LoggingConfigTest, ExplicitSinksReplaceDefaults) {
    auto config = LoggingConfig::fromJson(
        {{"level", "debug"},
         {"sinks", json::array({{{"name", "audit"},
                                 {"type", "file"},
                                 {"path", "audit.log"}},
                                {{"type", "carrier_pigeon"}}})}});
    EXPECT_EQ(config.level, spdlog::level::debug);
    ASSERT_EQ(config.sinks.size(), 1u);
    EXPECT_EQ(config.sinks[0].name, "audit");
}

TEST(LoggingConfigTest, UnknownLevelFallsBackToInfo) {
    auto config = LoggingConfig::fromJson({{"level", "loud"}});
    EXPECT_EQ(config.level, spdlog::level::info);
}

TEST(LoggingConfigTest, JsonRoundTrip) {
    auto config = LoggingConfig::fromJson({{"file", "logs/rampart.log"}});
    config.level = spdlog::level::warn;
    auto restored = LoggingConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.toJson(), config.toJson());
}
