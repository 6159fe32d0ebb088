/*
 * test_config_store.cpp - Tests for configuration snapshots and reload
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

#include "config/config_store.hpp"

using namespace rampart::config;

namespace {

constexpr const char* STRONG_KEY = "0123456789abcdef0123456789abcdef";

auto noEnvironment() -> SecurityConfig::EnvironmentReader {
    return [](const char*) -> std::optional<std::string> {
        return std::nullopt;
    };
}

auto validConfig(std::string host = "example.com") -> SecurityConfig {
    SecurityConfig cfg;
    cfg.secretKey = STRONG_KEY;
    cfg.allowedHosts = {std::move(host)};
    return cfg;
}

}  // namespace

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("rampart_config_test_" +
                std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto writeFile(const std::string& name, const std::string& content)
        -> fs::path {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// Snapshot Tests
// ============================================================================

TEST_F(ConfigStoreTest, InitialSnapshot) {
    ConfigStore store(validConfig());
    auto snapshot = store.snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->generation, 1u);
    EXPECT_EQ(store.generation(), 1u);
    EXPECT_EQ(snapshot->policy.secretKey, STRONG_KEY);
}

TEST_F(ConfigStoreTest, InvalidInitialConfigThrows) {
    EXPECT_THROW(ConfigStore{SecurityConfig{}}, InvalidConfigException);
}

TEST_F(ConfigStoreTest, PublishReplacesSnapshot) {
    ConfigStore store(validConfig("old.example"));
    auto held = store.snapshot();

    EXPECT_EQ(store.publish(validConfig("new.example")), 2u);

    auto current = store.snapshot();
    EXPECT_EQ(current->generation, 2u);
    EXPECT_TRUE(current->policy.hosts.isAllowed("new.example"));
    EXPECT_FALSE(current->policy.hosts.isAllowed("old.example"));

    // a reader holding the old snapshot keeps a consistent view
    EXPECT_EQ(held->generation, 1u);
    EXPECT_TRUE(held->policy.hosts.isAllowed("old.example"));
}

TEST_F(ConfigStoreTest, RejectedPublishKeepsCurrent) {
    ConfigStore store(validConfig());
    auto bad = validConfig();
    bad.secretKey = "short";

    EXPECT_THROW(store.publish(bad), InvalidConfigException);
    EXPECT_EQ(store.generation(), 1u);
    EXPECT_EQ(store.snapshot()->policy.secretKey, STRONG_KEY);
}

TEST_F(ConfigStoreTest, ReadersNeverSeeTornSnapshots) {
    ConfigStore store(validConfig("gen-1.example"));
    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto snapshot = store.snapshot();
                const auto expected =
                    "gen-" + std::to_string(snapshot->generation) + ".example";
                if (snapshot->config.allowedHosts.front() != expected ||
                    !snapshot->policy.hosts.isAllowed(expected)) {
                    ++inconsistent;
                }
            }
        });
    }

    for (int gen = 2; gen <= 100; ++gen) {
        store.publish(validConfig("gen-" + std::to_string(gen) + ".example"));
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(store.generation(), 100u);
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(ConfigStoreTest, LoadFileReadsSecuritySection) {
    auto path = writeFile("config.json", R"({
        "rampart": {
            "security": {
                "secretKey": "0123456789abcdef0123456789abcdef",
                "allowedHosts": [".example.com"],
                "sanitizeFailClosed": true
            }
        }
    })");

    auto cfg = ConfigStore::loadFile(path, noEnvironment());
    EXPECT_EQ(cfg.allowedHosts, std::vector<std::string>{".example.com"});
    EXPECT_TRUE(cfg.sanitizeFailClosed);
}

TEST_F(ConfigStoreTest, EnvironmentOverridesFile) {
    auto path = writeFile("config.json",
                          R"({"rampart": {"security": {"secretKey": "x"}}})");
    auto cfg = ConfigStore::loadFile(
        path, [](const char* name) -> std::optional<std::string> {
            if (std::string_view(name) == "RAMPART_SECRET_KEY") {
                return std::string(STRONG_KEY);
            }
            return std::nullopt;
        });
    EXPECT_EQ(cfg.secretKey, STRONG_KEY);
}

TEST_F(ConfigStoreTest, MissingSectionUsesDefaults) {
    auto cfg = ConfigStore::securitySection(json::object());
    EXPECT_EQ(cfg.toJson(), SecurityConfig::defaults().toJson());
}

TEST_F(ConfigStoreTest, SectionMustBeObject) {
    json doc = {{"rampart", {{"security", json::array()}}}};
    EXPECT_THROW((void)ConfigStore::securitySection(doc),
                 InvalidConfigException);

    json typed = {{"rampart", {{"security", {{"debug", "yes"}}}}}};
    EXPECT_THROW((void)ConfigStore::securitySection(typed),
                 InvalidConfigException);
}

TEST_F(ConfigStoreTest, UnreadableOrInvalidFile) {
    EXPECT_THROW((void)ConfigStore::loadDocument(dir_ / "missing.json"),
                 ConfigIOException);

    auto path = writeFile("broken.json", "{ not json");
    EXPECT_THROW((void)ConfigStore::loadDocument(path), ConfigIOException);
}

TEST_F(ConfigStoreTest, ReloadPublishesFileContents) {
    ConfigStore store(validConfig());
    auto path = writeFile("reload.json", R"({
        "rampart": {"security": {
            "secretKey": "0123456789abcdef0123456789abcdef",
            "allowedHosts": ["reloaded.example"]
        }}
    })");

    EXPECT_EQ(store.reload(path), 2u);
    EXPECT_TRUE(store.snapshot()->policy.hosts.isAllowed("reloaded.example"));

    auto bad = writeFile("bad.json",
                         R"({"rampart": {"security": {"secretKey": ""}}})");
    EXPECT_THROW(store.reload(bad), BadConfigException);
    EXPECT_EQ(store.generation(), 2u);
}
