#pragma once

#include "core/config_loader.h"
#include "session/session_stats.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace spoofwatch {
namespace session {

class ConnectionSession;

struct RegisterResult {
    bool registered = false;
    std::shared_ptr<ConnectionSession> evicted;  // previous holder, EvictExisting only
};

/**
 * @brief Process-wide directory of live sessions keyed by client identity.
 *
 * Constructed once by the daemon and passed by reference. The mutex only guards map
 * operations and snapshot copies; sessions are never called back while it is held.
 */
class ConnectionRegistry {
   public:
    explicit ConnectionRegistry(DuplicatePolicy policy = DuplicatePolicy::RejectNew);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Insert under the duplicate policy. With EvictExisting the previous holder is removed
    // and asked to shut down before this returns.
    RegisterResult tryRegister(const std::string& clientId,
                               const std::shared_ptr<ConnectionSession>& session);

    // Remove the entry only if it still refers to `session`.
    bool remove(const std::string& clientId, const ConnectionSession* session);

    std::shared_ptr<ConnectionSession> find(const std::string& clientId) const;

    // Operator eviction. Returns false when the identity is not registered.
    bool evict(const std::string& clientId, const std::string& reason);

    std::size_t size() const;
    std::vector<std::string> clientIds() const;
    std::vector<SessionStats> snapshot() const;

    // Detections over every session since start, including retired ones.
    uint64_t totalDetections() const;
    // Successful registrations since start.
    uint64_t totalConnections() const;

    DuplicatePolicy policy() const {
        return policy_;
    }

    // Empty the registry and cancel every session (daemon shutdown). Returns the count.
    std::size_t drain();

   private:
    void retireLocked(const std::shared_ptr<ConnectionSession>& session);

    const DuplicatePolicy policy_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConnectionSession>> sessions_;
    uint64_t retiredDetections_ = 0;
    uint64_t totalConnections_ = 0;
};

}  // namespace session
}  // namespace spoofwatch
