/*
 * session_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "security/crypto.hpp"

namespace rampart::session {

namespace {
constexpr std::size_t SESSION_ID_BYTES = 16;
constexpr std::chrono::minutes SWEEP_INTERVAL{1};
}  // namespace

InMemorySession::InMemorySession(std::string id, Clock::time_point now)
    : id_(std::move(id)), lastAccess_(now) {}

auto InMemorySession::id() const -> std::string { return id_; }

auto InMemorySession::getToken() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    ensureValid();
    return token_;
}

void InMemorySession::setToken(std::string token) {
    std::lock_guard lock(mutex_);
    ensureValid();
    token_ = std::move(token);
}

auto InMemorySession::getValue(std::string_view key) const
    -> std::optional<json> {
    std::lock_guard lock(mutex_);
    ensureValid();
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySession::setValue(std::string key, json value) {
    std::lock_guard lock(mutex_);
    ensureValid();
    values_[std::move(key)] = std::move(value);
}

void InMemorySession::removeValue(std::string_view key) {
    std::lock_guard lock(mutex_);
    ensureValid();
    values_.erase(std::string(key));
}

void InMemorySession::invalidate() {
    std::lock_guard lock(mutex_);
    valid_ = false;
    token_.reset();
    values_.clear();
}

bool InMemorySession::isValid() const {
    std::lock_guard lock(mutex_);
    return valid_;
}

void InMemorySession::touch(Clock::time_point now) {
    lastAccess_.store(now, std::memory_order_relaxed);
}

void InMemorySession::ensureValid() const {
    if (!valid_) {
        THROW_SESSION_ERROR("Session " + id_ + " has been destroyed");
    }
}

InMemorySessionStore::InMemorySessionStore(SessionStoreOptions options)
    : options_(options), lastSweep_(Clock::now()) {}

auto InMemorySessionStore::create() -> std::shared_ptr<InMemorySession> {
    const auto now = Clock::now();
    auto session = std::make_shared<InMemorySession>(
        security::toHex(security::randomBytes(SESSION_ID_BYTES)), now);

    std::unique_lock lock(mutex_);
    if (now - lastSweep_ >= SWEEP_INTERVAL ||
        sessions_.size() >= options_.maxSessions) {
        sweepLocked(now);
    }
    while (!sessions_.empty() && sessions_.size() >= options_.maxSessions) {
        evictLeastRecentLocked();
    }
    sessions_[session->id()] = session;
    spdlog::debug("Session created ({} active)", sessions_.size());
    return session;
}

auto InMemorySessionStore::find(const std::string& id) const
    -> std::shared_ptr<InMemorySession> {
    const auto now = Clock::now();
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || isExpired(*it->second, now)) {
        return nullptr;
    }
    it->second->touch(now);
    return it->second;
}

bool InMemorySessionStore::destroy(const std::string& id) {
    std::shared_ptr<InMemorySession> session;
    {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    // Requests still holding the session observe it as destroyed
    session->invalidate();
    spdlog::debug("Session destroyed");
    return true;
}

auto InMemorySessionStore::sweep(Clock::time_point now) -> std::size_t {
    std::unique_lock lock(mutex_);
    return sweepLocked(now);
}

bool InMemorySessionStore::isExpired(const InMemorySession& session,
                                     Clock::time_point now) const {
    return now - session.lastAccess() >= options_.idleTimeout;
}

auto InMemorySessionStore::sweepLocked(Clock::time_point now) -> std::size_t {
    lastSweep_ = now;
    const auto removed = std::erase_if(sessions_, [&](const auto& entry) {
        if (!isExpired(*entry.second, now)) {
            return false;
        }
        entry.second->invalidate();
        return true;
    });
    if (removed > 0) {
        spdlog::debug("Expired {} idle session(s), {} active", removed,
                      sessions_.size());
    }
    return removed;
}

void InMemorySessionStore::evictLeastRecentLocked() {
    auto oldest = std::min_element(
        sessions_.begin(), sessions_.end(), [](const auto& a, const auto& b) {
            return a.second->lastAccess() < b.second->lastAccess();
        });
    oldest->second->invalidate();
    sessions_.erase(oldest);
    spdlog::debug("Session limit of {} reached, evicted the least recently "
                  "used session",
                  options_.maxSessions);
}

auto InMemorySessionStore::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

}  // namespace rampart::session
