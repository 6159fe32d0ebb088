/*
 * session_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: In-memory session backend

**************************************************/

#ifndef RAMPART_SESSION_SESSION_STORE_HPP
#define RAMPART_SESSION_SESSION_STORE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "session.hpp"

namespace rampart::session {

/**
 * @brief Session kept entirely in process memory
 *
 * Each session owns its own mutex, so requests on distinct sessions never
 * contend. Once destroyed every accessor throws SessionError.
 */
class InMemorySession final : public Session {
public:
    using Clock = std::chrono::steady_clock;

    explicit InMemorySession(std::string id,
                             Clock::time_point now = Clock::now());

    [[nodiscard]] auto id() const -> std::string override;
    [[nodiscard]] auto getToken() const -> std::optional<std::string> override;
    void setToken(std::string token) override;
    [[nodiscard]] auto getValue(std::string_view key) const
        -> std::optional<json> override;
    void setValue(std::string key, json value) override;
    void removeValue(std::string_view key) override;

    /// Drop the token and all values; later calls throw.
    void invalidate();

    [[nodiscard]] bool isValid() const;

    /// Mark the session as used at @p now.
    void touch(Clock::time_point now);

    [[nodiscard]] auto lastAccess() const -> Clock::time_point {
        return lastAccess_.load(std::memory_order_relaxed);
    }

private:
    void ensureValid() const;

    const std::string id_;
    std::atomic<Clock::time_point> lastAccess_;
    mutable std::mutex mutex_;
    std::optional<std::string> token_;
    std::unordered_map<std::string, json> values_;
    bool valid_{true};
};

struct SessionStoreOptions {
    /// Sessions unused for this long are expired.
    std::chrono::seconds idleTimeout{std::chrono::minutes(30)};
    /// Creating a session beyond this evicts the least recently used one.
    std::size_t maxSessions{10000};
};

/**
 * @brief Thread-safe registry of in-memory sessions
 *
 * Expired sessions are invisible to find() and are removed by sweep(),
 * which create() also runs once a minute and whenever the store is full.
 * Removed sessions are invalidated, so requests still holding one see
 * SessionError.
 */
class InMemorySessionStore {
public:
    using Clock = InMemorySession::Clock;

    explicit InMemorySessionStore(SessionStoreOptions options = {});

    InMemorySessionStore(const InMemorySessionStore&) = delete;
    InMemorySessionStore& operator=(const InMemorySessionStore&) = delete;

    /// Create a session with a fresh random identifier.
    [[nodiscard]] auto create() -> std::shared_ptr<InMemorySession>;

    [[nodiscard]] auto find(const std::string& id) const
        -> std::shared_ptr<InMemorySession>;

    /**
     * @brief Destroy a session, discarding its CSRF token
     * @return false if no such session existed
     */
    bool destroy(const std::string& id);

    /**
     * @brief Remove every session idle at @p now
     * @return number of sessions removed
     */
    auto sweep(Clock::time_point now = Clock::now()) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto options() const -> const SessionStoreOptions& {
        return options_;
    }

private:
    [[nodiscard]] bool isExpired(const InMemorySession& session,
                                 Clock::time_point now) const;

    auto sweepLocked(Clock::time_point now) -> std::size_t;
    void evictLeastRecentLocked();

    const SessionStoreOptions options_;
    Clock::time_point lastSweep_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<InMemorySession>>
        sessions_;
};

}  // namespace rampart::session

#endif  // RAMPART_SESSION_SESSION_STORE_HPP
