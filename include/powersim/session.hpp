// filename: session.hpp
// part of Power System Session Server
// MIT License

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "powersim/engine.hpp"
#include "powersim/types.hpp"

namespace powersim {

using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

class SessionLease;

/**
 * @brief One loaded model plus its lifecycle metadata.
 *
 * Timestamps are only read and written by SessionManager under its registry
 * lock. The model itself is reached through acquire(), which serialises
 * analysis calls on this session.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(std::string id,
            std::unique_ptr<ModelInstance> model,
            std::string sourcePath,
            SteadyClock::time_point now,
            WallClock::time_point wallNow);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& sourcePath() const { return sourcePath_; }
    [[nodiscard]] SteadyClock::time_point createdAt() const { return createdAt_; }
    [[nodiscard]] SteadyClock::time_point lastAccessedAt() const { return lastAccessedAt_; }
    [[nodiscard]] std::uint64_t accessSequence() const { return accessSequence_; }

    // Wall-clock rendering of a monotonic instant recorded by this session.
    [[nodiscard]] WallClock::time_point toWallTime(SteadyClock::time_point t) const;

    [[nodiscard]] bool isExpired(SteadyClock::time_point now, std::chrono::nanoseconds ttl) const {
        return (now - lastAccessedAt_) > ttl;
    }

    void touch(SteadyClock::time_point now, std::uint64_t sequence) {
        lastAccessedAt_ = now;
        accessSequence_ = sequence;
    }

    /**
     * @brief Block until no other lease is active and take exclusive access.
     *
     * The returned lease is empty once the model has been released. The
     * session must be owned by a std::shared_ptr.
     */
    [[nodiscard]] SessionLease acquire();

    /**
     * @brief Wait for the active lease, then destroy the model.
     */
    void releaseModel();

private:
    friend class SessionLease;

    const std::string id_;
    const std::string sourcePath_;
    const SteadyClock::time_point createdAt_;
    const WallClock::time_point createdWall_;
    SteadyClock::time_point lastAccessedAt_;
    std::uint64_t accessSequence_{0};

    std::mutex modelMutex_;
    std::unique_ptr<ModelInstance> model_;
};

/**
 * @brief Exclusive access to a session's model for the duration of one operation.
 */
class SessionLease {
public:
    SessionLease() = default;
    SessionLease(SessionLease&& other) noexcept
        : owner_(std::move(other.owner_)), lock_(std::move(other.lock_)), model_(other.model_) {
        other.model_ = nullptr;
    }
    // Unlocks the held session before dropping the reference that may own it.
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    explicit operator bool() const { return model_ != nullptr; }

    [[nodiscard]] ModelInstance& model() const;

private:
    friend class Session;

    SessionLease(std::shared_ptr<Session> owner, std::unique_lock<std::mutex> lock, ModelInstance* model)
        : owner_(std::move(owner)), lock_(std::move(lock)), model_(model) {}

    std::shared_ptr<Session> owner_;
    std::unique_lock<std::mutex> lock_;
    ModelInstance* model_{nullptr};
};

struct SessionInfo {
    std::string sessionId;
    std::string sourcePath;
    WallClock::time_point createdAt;
    WallClock::time_point lastAccessedAt;
};

/**
 * @brief Registry of live sessions with LRU capacity eviction and idle expiry.
 *
 * All registry mutations happen under one mutex. Sessions leaving the registry
 * (close, expiry, eviction) are torn down after that mutex is released, once
 * any in-flight lease on them has ended.
 */
class SessionManager {
public:
    using TimeSource = std::function<SteadyClock::time_point()>;

    SessionManager(std::size_t capacity = kDefaultMaxSessions,
                   std::chrono::nanoseconds ttl = kDefaultSessionTtl,
                   TimeSource now = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Register a loaded model and return its new session id.
     *
     * Expired sessions are swept first; at capacity the least recently
     * accessed session is evicted.
     */
    std::string create(std::unique_ptr<ModelInstance> model, const std::string& sourcePath);

    /**
     * @brief Look up and touch a session; nullptr when unknown or expired.
     */
    [[nodiscard]] std::shared_ptr<Session> get(const std::string& sessionId);

    /**
     * @brief Remove a session and release its model before returning.
     * @return false when no such session was registered or it had expired.
     */
    bool close(const std::string& sessionId);

    [[nodiscard]] std::vector<SessionInfo> list();

    // Closes every session. Further create() calls still work.
    void shutdown();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::chrono::nanoseconds ttl() const { return ttl_; }

private:
    using SessionList = std::vector<std::shared_ptr<Session>>;

    // Caller holds mutex_.
    void sweepExpiredLocked(SteadyClock::time_point now, SessionList& removed);
    std::shared_ptr<Session> evictOldestLocked();
    std::string generateIdLocked();

    static void retire(SessionList& removed);

    const std::size_t capacity_;
    const std::chrono::nanoseconds ttl_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::uint64_t nextSequence_{0};
    std::mt19937_64 rng_;
};

}  // namespace powersim
