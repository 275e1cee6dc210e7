#include "session/connection_registry.h"

#include "logging/logger.h"
#include "session/connection_session.h"

#include <utility>

namespace spoofwatch {
namespace session {

ConnectionRegistry::ConnectionRegistry(DuplicatePolicy policy) : policy_(policy) {}

ConnectionRegistry::~ConnectionRegistry() {
    drain();
}

RegisterResult ConnectionRegistry::tryRegister(
    const std::string& clientId, const std::shared_ptr<ConnectionSession>& session) {
    RegisterResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(clientId);
        if (it != sessions_.end()) {
            if (policy_ == DuplicatePolicy::RejectNew) {
                return result;
            }
            result.evicted = std::move(it->second);
            retireLocked(result.evicted);
            it->second = session;
        } else {
            sessions_.emplace(clientId, session);
        }
        ++totalConnections_;
        result.registered = true;
    }

    // Outside the lock: eviction calls into the old session's transport.
    if (result.evicted) {
        result.evicted->requestEviction("identity claimed by a new connection");
    }
    return result;
}

bool ConnectionRegistry::remove(const std::string& clientId, const ConnectionSession* session) {
    std::shared_ptr<ConnectionSession> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(clientId);
        if (it == sessions_.end() || it->second.get() != session) {
            return false;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
        retireLocked(removed);
    }
    LOG_DEBUG("Registry: removed '{}'", clientId);
    return true;
}

std::shared_ptr<ConnectionSession> ConnectionRegistry::find(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ConnectionRegistry::evict(const std::string& clientId, const std::string& reason) {
    std::shared_ptr<ConnectionSession> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(clientId);
        if (it == sessions_.end()) {
            return false;
        }
        evicted = std::move(it->second);
        sessions_.erase(it);
        retireLocked(evicted);
    }
    evicted->requestEviction(reason);
    return true;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> ConnectionRegistry::clientIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<SessionStats> ConnectionRegistry::snapshot() const {
    std::vector<std::shared_ptr<ConnectionSession>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            live.push_back(session);
        }
    }
    std::vector<SessionStats> stats;
    stats.reserve(live.size());
    for (const auto& session : live) {
        stats.push_back(session->snapshot());
    }
    return stats;
}

uint64_t ConnectionRegistry::totalDetections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = retiredDetections_;
    for (const auto& [id, session] : sessions_) {
        total += session->detectionCount();
    }
    return total;
}

uint64_t ConnectionRegistry::totalConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalConnections_;
}

std::size_t ConnectionRegistry::drain() {
    std::unordered_map<std::string, std::shared_ptr<ConnectionSession>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            retireLocked(session);
        }
        drained.swap(sessions_);
    }
    for (const auto& [id, session] : drained) {
        session->requestEviction("server shutting down");
    }
    if (!drained.empty()) {
        LOG_INFO("Registry: drained {} session(s)", drained.size());
    }
    return drained.size();
}

void ConnectionRegistry::retireLocked(const std::shared_ptr<ConnectionSession>& session) {
    retiredDetections_ += session->detectionCount();
}

}  // namespace session
}  // namespace spoofwatch
