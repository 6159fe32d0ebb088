/*
 * config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_store.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace rampart::config {

ConfigStore::ConfigStore(const SecurityConfig& initial)
    : current_(build(initial, 1)) {}

auto ConfigStore::snapshot() const -> std::shared_ptr<const ConfigSnapshot> {
    return current_.load(std::memory_order_acquire);
}

auto ConfigStore::publish(const SecurityConfig& config) -> std::uint64_t {
    std::lock_guard lock(writeMutex_);

    const auto next = current_.load(std::memory_order_relaxed)->generation + 1;
    auto snapshot = build(config, next);
    current_.store(std::move(snapshot), std::memory_order_release);

    spdlog::info("Published security configuration generation {}", next);
    return next;
}

auto ConfigStore::reload(const fs::path& path) -> std::uint64_t {
    return publish(loadFile(path));
}

auto ConfigStore::generation() const -> std::uint64_t {
    return snapshot()->generation;
}

auto ConfigStore::loadDocument(const fs::path& path) -> json {
    std::ifstream input(path);
    if (!input) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open config file: " + path.string());
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        THROW_CONFIG_IO_EXCEPTION("Config file is not valid JSON: " +
                                  path.string());
    }
    spdlog::info("Loaded config from file: {}", path.string());
    return document;
}

auto ConfigStore::securitySection(const json& document) -> SecurityConfig {
    const json::json_pointer pointer{std::string(SecurityConfig::PATH)};
    if (!document.contains(pointer)) {
        return SecurityConfig::defaults();
    }

    const auto& section = document.at(pointer);
    if (!section.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(std::string(SecurityConfig::PATH) +
                                       " must be an object");
    }
    try {
        return SecurityConfig::fromJson(section);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(std::string(SecurityConfig::PATH) +
                                       ": " + e.what());
    }
}

auto ConfigStore::loadFile(const fs::path& path,
                           const SecurityConfig::EnvironmentReader& reader)
    -> SecurityConfig {
    auto config = securitySection(loadDocument(path));
    config.applyEnvironment(reader);
    return config;
}

auto ConfigStore::build(const SecurityConfig& config, std::uint64_t generation)
    -> std::shared_ptr<const ConfigSnapshot> {
    auto snapshot = std::make_shared<ConfigSnapshot>();
    snapshot->config = config;
    snapshot->policy = config.compile();
    snapshot->generation = generation;
    return snapshot;
}

}  // namespace rampart::config
