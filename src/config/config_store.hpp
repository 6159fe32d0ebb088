/*
 * config_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Immutable security configuration snapshots with atomic publish

**************************************************/

#ifndef RAMPART_CONFIG_CONFIG_STORE_HPP
#define RAMPART_CONFIG_CONFIG_STORE_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

#include "sections/security_config.hpp"

namespace rampart::config {

namespace fs = std::filesystem;

/**
 * @brief One published configuration, never modified after publication
 */
struct ConfigSnapshot {
    SecurityConfig config;
    security::SecurityPolicy policy;
    std::uint64_t generation{0};
};

/**
 * @brief Holds the live configuration snapshot
 *
 * Readers load the current snapshot without locking and keep it for the
 * whole request. Writers build and validate a complete snapshot before
 * swapping it in, so a reader sees either the old or the new value.
 *
 * @thread_safety snapshot() is lock-free; publish() is serialized.
 */
class ConfigStore {
public:
    /**
     * @throws InvalidConfigException if @p initial does not validate
     */
    explicit ConfigStore(const SecurityConfig& initial);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    [[nodiscard]] auto snapshot() const
        -> std::shared_ptr<const ConfigSnapshot>;

    /**
     * @brief Validate, compile and publish a new configuration
     * @return the generation of the published snapshot
     * @throws InvalidConfigException on validation failure; the current
     *         snapshot stays in place
     */
    auto publish(const SecurityConfig& config) -> std::uint64_t;

    /**
     * @brief Re-read @p path (plus environment overrides) and publish it
     * @throws ConfigIOException, InvalidConfigException
     */
    auto reload(const fs::path& path) -> std::uint64_t;

    [[nodiscard]] auto generation() const -> std::uint64_t;

    /**
     * @brief Parse a JSON configuration document
     * @throws ConfigIOException when unreadable or not valid JSON
     */
    [[nodiscard]] static auto loadDocument(const fs::path& path) -> json;

    /**
     * @brief Security section of a document, defaults when absent
     * @throws InvalidConfigException when the section has the wrong shape
     */
    [[nodiscard]] static auto securitySection(const json& document)
        -> SecurityConfig;

    /// loadDocument + securitySection + environment overrides.
    [[nodiscard]] static auto loadFile(
        const fs::path& path,
        const SecurityConfig::EnvironmentReader& reader =
            SecurityConfig::systemEnvironment) -> SecurityConfig;

private:
    [[nodiscard]] static auto build(const SecurityConfig& config,
                                    std::uint64_t generation)
        -> std::shared_ptr<const ConfigSnapshot>;

    std::atomic<std::shared_ptr<const ConfigSnapshot>> current_;
    std::mutex writeMutex_;
};

}  // namespace rampart::config

#endif  // RAMPART_CONFIG_CONFIG_STORE_HPP
