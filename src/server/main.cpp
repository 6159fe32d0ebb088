/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file main.cpp
 * @brief Rampart demo server
 *
 * Serves a few routes behind the security pipeline. SIGHUP re-reads the
 * configuration file; SIGINT and SIGTERM stop the server. Signal handlers
 * only raise flags; a watcher thread does the work.
 */

#include "main_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

using namespace std::chrono_literals;

std::unique_ptr<rampart::server::MainServer> server;

// Only lock-free atomics are touched from signal context.
std::atomic<int> pendingStop{0};
std::atomic<bool> pendingReload{false};
static_assert(std::atomic<int>::is_always_lock_free);
static_assert(std::atomic<bool>::is_always_lock_free);

constexpr std::string_view USAGE =
    "Options:\n"
    "  --config <file>     JSON file with rampart.security / rampart.logging\n"
    "  --port <number>     Listening port (default: 8080)\n"
    "  --threads <number>  Worker threads (default: 4)\n"
    "  --help, -h          Print this text\n"
    "Environment overrides:\n"
    "  RAMPART_SECRET_KEY RAMPART_ALLOWED_HOSTS RAMPART_DEBUG\n"
    "  RAMPART_SANITIZE_INPUTS RAMPART_SANITIZE_FAIL_CLOSED "
    "RAMPART_CSP_NONCE\n";

void onTerminate(int signal) { pendingStop.store(signal); }

void onReload(int /*signal*/) { pendingReload.store(true); }

/// Acts on signals outside of signal context until @p stop is requested.
void watchSignals(const std::stop_token& stop) {
    while (!stop.stop_requested()) {
        if (pendingReload.exchange(false)) {
            spdlog::info("SIGHUP received, reloading configuration");
            server->reloadConfig();
        }
        if (const int signal = pendingStop.exchange(0); signal != 0) {
            spdlog::warn("Signal {} received, stopping", signal);
            server->stop();
            return;
        }
        std::this_thread::sleep_for(200ms);
    }
}

/// nullopt when --help was requested.
auto parseArguments(int argc, char* argv[])
    -> std::optional<rampart::server::MainServer::Config> {
    rampart::server::MainServer::Config config;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        if (!hasValue) {
            spdlog::warn("Ignoring option without value: {}", arg);
            continue;
        }
        if (arg == "--config") {
            config.config_path = argv[++i];
        } else if (arg == "--port") {
            config.port = std::stoi(argv[++i]);
        } else if (arg == "--threads") {
            config.thread_count = std::stoi(argv[++i]);
        } else {
            spdlog::warn("Unknown option: {}", arg);
        }
    }
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = parseArguments(argc, argv);
        if (!config) {
            std::cout << "Usage: " << argv[0] << " [options]\n" << USAGE;
            return 0;
        }

        server = std::make_unique<rampart::server::MainServer>(*config);

        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);
#ifdef SIGHUP
        std::signal(SIGHUP, onReload);
#endif

        std::jthread watcher(watchSignals);

        spdlog::info("Listening on port {} with {} worker(s), config {}",
                     config->port, config->thread_count,
                     config->config_path.value_or("<none>"));
        server->start();
    } catch (const std::exception& e) {
        spdlog::critical("Server failed: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    return 0;
}
