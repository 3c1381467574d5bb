#include "powersim/session.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace powersim {
namespace {

std::mt19937_64 makeIdGenerator() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device(), device(), device(), device(), device()};
    return std::mt19937_64(seed);
}

}  // namespace

Session::Session(std::string id,
                 std::unique_ptr<ModelInstance> model,
                 std::string sourcePath,
                 SteadyClock::time_point now,
                 WallClock::time_point wallNow)
    : id_(std::move(id)), sourcePath_(std::move(sourcePath)), createdAt_(now), createdWall_(wallNow),
      lastAccessedAt_(now), model_(std::move(model)) {}

WallClock::time_point Session::toWallTime(SteadyClock::time_point t) const {
    return createdWall_ + std::chrono::duration_cast<WallClock::duration>(t - createdAt_);
}

SessionLease Session::acquire() {
    std::unique_lock<std::mutex> lock(modelMutex_);
    if (!model_) {
        return SessionLease{};
    }
    ModelInstance* model = model_.get();
    return SessionLease(shared_from_this(), std::move(lock), model);
}

void Session::releaseModel() {
    std::unique_ptr<ModelInstance> doomed;
    {
        std::lock_guard<std::mutex> lock(modelMutex_);
        doomed = std::move(model_);
    }
    doomed.reset();
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        model_ = nullptr;
        lock_ = std::move(other.lock_);
        owner_ = std::move(other.owner_);
        model_ = other.model_;
        other.model_ = nullptr;
    }
    return *this;
}

ModelInstance& SessionLease::model() const {
    if (!model_) {
        throw std::logic_error("SessionLease::model called on an empty lease");
    }
    return *model_;
}

SessionManager::SessionManager(std::size_t capacity, std::chrono::nanoseconds ttl, TimeSource now)
    : capacity_(capacity), ttl_(ttl), now_(std::move(now)), rng_(makeIdGenerator()) {
    if (capacity_ == 0) {
        throw std::invalid_argument("SessionManager capacity must be at least 1");
    }
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("SessionManager ttl must be positive");
    }
    if (!now_) {
        now_ = []() { return SteadyClock::now(); };
    }
}

SessionManager::~SessionManager() { shutdown(); }

std::string SessionManager::create(std::unique_ptr<ModelInstance> model, const std::string& sourcePath) {
    if (!model) {
        throw std::invalid_argument("SessionManager::create requires a model instance");
    }

    SessionList removed;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = now_();
        sweepExpiredLocked(now, removed);
        if (sessions_.size() >= capacity_) {
            removed.push_back(evictOldestLocked());
        }

        id = generateIdLocked();
        auto session = std::make_shared<Session>(id, std::move(model), sourcePath, now, WallClock::now());
        session->touch(now, ++nextSequence_);
        sessions_.emplace(id, std::move(session));
    }

    retire(removed);
    return id;
}

std::shared_ptr<Session> SessionManager::get(const std::string& sessionId) {
    SessionList removed;
    std::shared_ptr<Session> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return nullptr;
        }
        const auto now = now_();
        if (it->second->isExpired(now, ttl_)) {
            removed.push_back(std::move(it->second));
            sessions_.erase(it);
        } else {
            it->second->touch(now, ++nextSequence_);
            found = it->second;
        }
    }

    retire(removed);
    return found;
}

bool SessionManager::close(const std::string& sessionId) {
    SessionList removed;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        // An expired session is still torn down but reported as unknown.
        closed = !it->second->isExpired(now_(), ttl_);
        removed.push_back(std::move(it->second));
        sessions_.erase(it);
    }

    retire(removed);
    return closed;
}

std::vector<SessionInfo> SessionManager::list() {
    SessionList removed;
    std::vector<std::shared_ptr<Session>> live;
    std::vector<SessionInfo> infos;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweepExpiredLocked(now_(), removed);
        live.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            live.push_back(entry.second);
        }
        std::sort(live.begin(), live.end(), [](const auto& a, const auto& b) {
            return a->createdAt() < b->createdAt() ||
                   (a->createdAt() == b->createdAt() && a->id() < b->id());
        });
        infos.reserve(live.size());
        for (const auto& session : live) {
            infos.push_back({session->id(), session->sourcePath(), session->toWallTime(session->createdAt()),
                             session->toWallTime(session->lastAccessedAt())});
        }
    }

    retire(removed);
    return infos;
}

void SessionManager::shutdown() {
    SessionList removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.reserve(sessions_.size());
        for (auto& entry : sessions_) {
            removed.push_back(std::move(entry.second));
        }
        sessions_.clear();
    }
    retire(removed);
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::sweepExpiredLocked(SteadyClock::time_point now, SessionList& removed) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second->isExpired(now, ttl_)) {
            removed.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<Session> SessionManager::evictOldestLocked() {
    auto oldest = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (oldest == sessions_.end()) {
            oldest = it;
            continue;
        }
        const Session& candidate = *it->second;
        const Session& current = *oldest->second;
        if (candidate.lastAccessedAt() < current.lastAccessedAt() ||
            (candidate.lastAccessedAt() == current.lastAccessedAt() &&
             candidate.accessSequence() < current.accessSequence())) {
            oldest = it;
        }
    }
    if (oldest == sessions_.end()) {
        return nullptr;
    }
    std::shared_ptr<Session> evicted = std::move(oldest->second);
    sessions_.erase(oldest);
    return evicted;
}

std::string SessionManager::generateIdLocked() {
    // RFC 4122 version 4 layout over 128 random bits.
    std::uint64_t hi = rng_();
    std::uint64_t lo = rng_();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned int>(hi >> 32), static_cast<unsigned int>((hi >> 16) & 0xFFFFU),
                  static_cast<unsigned int>(hi & 0xFFFFU), static_cast<unsigned int>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

void SessionManager::retire(SessionList& removed) {
    for (auto& session : removed) {
        if (session) {
            session->releaseModel();
        }
    }
    removed.clear();
}

}  // namespace powersim
