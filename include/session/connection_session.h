#pragma once

#include "audio/window_buffer.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "detection/detection_invoker.h"
#include "session/protocol.h"
#include "session/session_stats.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spoofwatch {
namespace session {

class ConnectionRegistry;

enum class SessionState { Connecting, Active, Closing, Closed };

const char* sessionStateToString(SessionState state);

// How a session talks to its connection. Both callbacks must be safe to call after the
// peer has gone away.
struct SessionTransport {
    // Write one serialized message (no trailing newline). false = peer unreachable.
    std::function<bool(const std::string& line)> send;
    // Shut the connection down so a blocked reader wakes up. Called from any thread.
    std::function<void()> shutdown;
    std::string peer;  // for log lines
};

using DetectionListener =
    std::function<void(const std::string& clientId, const detection::DetectionResult& result,
                       double timestamp)>;

/**
 * @brief Server-side state of one client connection.
 *
 * Owns the connection's WindowingBuffer and drives the protocol state machine
 * (Connecting -> Active -> Closing -> Closed). handleLine() and close() belong to the
 * connection's own thread; requestEviction() and snapshot() may be called from anywhere.
 */
class ConnectionSession : public std::enable_shared_from_this<ConnectionSession> {
   public:
    // Throws std::invalid_argument when the stream defaults describe no valid window.
    ConnectionSession(ConnectionRegistry& registry, const detection::DetectionInvoker& invoker,
                      const StreamDefaults& defaults, SessionTransport transport);

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    void setDetectionListener(DetectionListener listener) {
        detectionListener_ = std::move(listener);
    }

    /**
     * @brief Process one inbound wire message
     * @return false once the session has closed (disconnect, duplicate refusal, eviction,
     *         unreachable peer); the caller should stop reading.
     */
    bool handleLine(std::string_view line);

    // Report a connection-level failure (oversized frame, read error) and close.
    void failTransport(const std::string& reason);

    // Idempotent teardown: registry entry removed, buffer released, transport shut down.
    void close();

    // Cancel from another thread: pending results are dropped and the transport is shut
    // down so the owning thread observes the close.
    void requestEviction(const std::string& reason);

    SessionState state() const {
        return state_.load(std::memory_order_acquire);
    }
    bool cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Identity, empty until connect succeeded. Immutable afterwards.
    const std::string& clientId() const {
        return clientId_;
    }

    // Reads atomics only; never touches the buffer.
    SessionStats snapshot() const;

    uint64_t detectionCount() const {
        return totalDetections_.load(std::memory_order_relaxed);
    }

   private:
    bool handleConnecting(const InboundMessage& message);
    bool handleActive(const InboundMessage& message);
    bool handleAudioChunk(const InboundMessage& message);
    bool handleConfig(const InboundMessage& message);

    bool send(const nlohmann::json& message);
    // False once the session is closed: the send failed or the code is connection-fatal.
    bool sendError(ErrorCode code, const std::string& message);
    void publishBufferStats();

    ConnectionRegistry& registry_;
    const detection::DetectionInvoker& invoker_;
    SessionTransport transport_;
    DetectionListener detectionListener_;

    // Owned by the connection thread.
    audio::WindowDurations durations_;
    uint32_t configuredRate_;
    std::optional<uint32_t> committedRate_;  // locked in by the first accepted chunk
    std::unique_ptr<audio::WindowingBuffer> buffer_;
    bool registered_ = false;

    std::string clientId_;
    double connectedAt_ = 0.0;

    std::atomic<SessionState> state_{SessionState::Connecting};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> closed_{false};

    std::atomic<uint64_t> totalMessages_{0};
    std::atomic<uint64_t> totalDetections_{0};
    std::atomic<uint64_t> totalWindows_{0};
    std::atomic<uint64_t> totalErrors_{0};
    std::atomic<uint64_t> protocolViolations_{0};
    std::atomic<std::size_t> bufferSize_{0};
    std::atomic<uint32_t> sampleRate_{0};
};

}  // namespace session
}  // namespace spoofwatch
