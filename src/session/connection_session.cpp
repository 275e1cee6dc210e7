#include "session/connection_session.h"

#include "audio/sample_decoder.h"
#include "logging/logger.h"
#include "session/connection_registry.h"

#include <stdexcept>
#include <utility>

namespace spoofwatch {
namespace session {

const char* sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Active:
        return "active";
    case SessionState::Closing:
        return "closing";
    case SessionState::Closed:
    default:
        return "closed";
    }
}

ConnectionSession::ConnectionSession(ConnectionRegistry& registry,
                                     const detection::DetectionInvoker& invoker,
                                     const StreamDefaults& defaults, SessionTransport transport)
    : registry_(registry),
      invoker_(invoker),
      transport_(std::move(transport)),
      configuredRate_(defaults.sampleRate) {
    durations_.chunk = defaults.chunkDuration;
    durations_.overlap = defaults.overlapDuration;
    durations_.min = defaults.minDuration;
    durations_.max = defaults.maxWindowDuration;

    audio::WindowLengths lengths;
    std::string error;
    if (!audio::computeWindowLengths(durations_, configuredRate_, lengths, error)) {
        throw std::invalid_argument("invalid stream defaults: " + error);
    }
    buffer_ = std::make_unique<audio::WindowingBuffer>(lengths, configuredRate_);
    sampleRate_.store(configuredRate_, std::memory_order_relaxed);
}

bool ConnectionSession::handleLine(std::string_view line) {
    if (closed_.load(std::memory_order_acquire)) {
        return false;
    }
    if (cancelled()) {
        close();
        return false;
    }
    totalMessages_.fetch_add(1, std::memory_order_relaxed);

    InboundMessage message;
    std::string error;
    ErrorCode code = parseInbound(line, message, error);
    if (code != ErrorCode::OK) {
        if (code == ErrorCode::SESSION_PROTOCOL_VIOLATION) {
            protocolViolations_.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_WARN("[{}] rejected message: {}", clientId_.empty() ? transport_.peer : clientId_,
                 error);
        return sendError(code, error);
    }

    LOG_TRACE("[{}] <- {}", clientId_.empty() ? transport_.peer : clientId_, message.typeName);
    if (state() == SessionState::Connecting) {
        return handleConnecting(message);
    }
    return handleActive(message);
}

bool ConnectionSession::handleConnecting(const InboundMessage& message) {
    if (message.type != MessageType::Connect) {
        protocolViolations_.fetch_add(1, std::memory_order_relaxed);
        return sendError(ErrorCode::SESSION_PROTOCOL_VIOLATION,
                         "Expected 'connect' as the first message, got '" + message.typeName +
                             "'");
    }

    clientId_ = message.clientId.empty() ? generateClientId() : message.clientId;
    connectedAt_ = nowSeconds();

    RegisterResult result = registry_.tryRegister(clientId_, shared_from_this());
    if (!result.registered) {
        LOG_WARN("[{}] duplicate connection from {} refused", clientId_, transport_.peer);
        return sendError(ErrorCode::SESSION_DUPLICATE_CONNECTION,
                         "Client ID '" + clientId_ + "' is already connected");
    }
    registered_ = true;
    state_.store(SessionState::Active, std::memory_order_release);

    if (result.evicted) {
        LOG_INFO("[{}] replaced an existing connection (evict_existing)", clientId_);
    }
    LOG_INFO("[{}] connected from {}", clientId_, transport_.peer);
    return send(buildConnected(clientId_, nowSeconds()));
}

bool ConnectionSession::handleActive(const InboundMessage& message) {
    switch (message.type) {
    case MessageType::AudioChunk:
        return handleAudioChunk(message);
    case MessageType::Config:
        return handleConfig(message);
    case MessageType::Ping:
        return send(buildPong(nowSeconds()));
    case MessageType::Stats:
        return send(buildStats(sessionStatsToJson(snapshot()), nowSeconds()));
    case MessageType::Disconnect:
        LOG_INFO("[{}] disconnect requested", clientId_);
        close();
        return false;
    case MessageType::Connect:
        protocolViolations_.fetch_add(1, std::memory_order_relaxed);
        return sendError(ErrorCode::SESSION_PROTOCOL_VIOLATION,
                         "Already connected as '" + clientId_ + "'");
    case MessageType::Unknown:
    default:
        protocolViolations_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("[{}] unknown message type '{}'", clientId_, message.typeName);
        return sendError(ErrorCode::SESSION_PROTOCOL_VIOLATION,
                         "Unknown message type: " + message.typeName);
    }
}

bool ConnectionSession::handleAudioChunk(const InboundMessage& message) {
    const int64_t declaredRate = message.sampleRate.value_or(configuredRate_);
    audio::DecodeResult decoded =
        audio::decodeSamples(message.audioData, message.encoding, declaredRate, committedRate_);
    if (!decoded.ok()) {
        LOG_WARN("[{}] audio chunk rejected ({}): {}", clientId_,
                 errorCodeToString(decoded.code), decoded.message);
        return sendError(decoded.code, decoded.message);
    }

    if (!committedRate_) {
        const uint32_t rate = decoded.sequence.sampleRate;
        if (rate != buffer_->sampleRate()) {
            audio::WindowLengths lengths;
            std::string error;
            if (!audio::computeWindowLengths(durations_, rate, lengths, error) ||
                !buffer_->reconfigure(lengths, rate, error)) {
                return sendError(ErrorCode::VALIDATION_INVALID_CONFIG,
                                 "Invalid window configuration at " + std::to_string(rate) +
                                     " Hz: " + error);
            }
        }
        committedRate_ = rate;
        configuredRate_ = rate;
        sampleRate_.store(rate, std::memory_order_relaxed);
        LOG_DEBUG("[{}] sample rate committed at {} Hz", clientId_, rate);
    }

    std::vector<audio::AudioWindow> windows = buffer_->feed(decoded.sequence.samples);
    totalWindows_.fetch_add(windows.size(), std::memory_order_relaxed);
    publishBufferStats();

    for (const auto& window : windows) {
        if (cancelled()) {
            break;
        }
        detection::DetectionContext context{clientId_, window.index};
        detection::DetectionOutcome outcome = invoker_.detect(window, context);
        if (cancelled()) {
            LOG_DEBUG("[{}] discarding result for window {} after cancellation", clientId_,
                      window.index);
            break;
        }
        if (!outcome.ok()) {
            if (!sendError(outcome.code, outcome.message)) {
                return false;
            }
            continue;
        }

        const double timestamp = nowSeconds();
        totalDetections_.fetch_add(1, std::memory_order_relaxed);
        if (!send(buildDetectionResult(clientId_, window.index, window.samples.size(),
                                       outcome.result, timestamp))) {
            return false;
        }
        if (detectionListener_) {
            detectionListener_(clientId_, outcome.result, timestamp);
        }
    }

    if (cancelled()) {
        close();
        return false;
    }
    return true;
}

bool ConnectionSession::handleConfig(const InboundMessage& message) {
    if (!message.hasConfigFields()) {
        return true;
    }

    uint32_t rate = configuredRate_;
    if (message.sampleRate) {
        if (!audio::isSupportedSampleRate(*message.sampleRate)) {
            return sendError(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE,
                             "Sample rate " + std::to_string(*message.sampleRate) +
                                 " Hz is out of range [" + std::to_string(audio::kMinSampleRate) +
                                 ", " + std::to_string(audio::kMaxSampleRate) + "]");
        }
        rate = static_cast<uint32_t>(*message.sampleRate);
        if (committedRate_ && *committedRate_ != rate) {
            return sendError(ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH,
                             "Sample rate is fixed at " + std::to_string(*committedRate_) +
                                 " Hz once audio has been received");
        }
    }

    audio::WindowDurations candidate = durations_;
    if (message.chunkDuration) {
        candidate.chunk = *message.chunkDuration;
    }
    if (message.overlapDuration) {
        candidate.overlap = *message.overlapDuration;
    }
    if (message.minDuration) {
        candidate.min = *message.minDuration;
    }

    audio::WindowLengths lengths;
    std::string error;
    if (!audio::computeWindowLengths(candidate, rate, lengths, error) ||
        !buffer_->reconfigure(lengths, rate, error)) {
        LOG_WARN("[{}] config rejected: {}", clientId_, error);
        return sendError(ErrorCode::VALIDATION_INVALID_CONFIG, "Invalid configuration: " + error);
    }

    durations_ = candidate;
    configuredRate_ = rate;
    sampleRate_.store(rate, std::memory_order_relaxed);
    publishBufferStats();
    LOG_DEBUG("[{}] window reconfigured: chunk={} overlap={} min={} samples at {} Hz", clientId_,
              lengths.chunk, lengths.overlap, lengths.min, rate);
    return true;
}

void ConnectionSession::failTransport(const std::string& reason) {
    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    LOG_WARN("[{}] transport failure: {}", clientId_.empty() ? transport_.peer : clientId_,
             reason);
    sendError(ErrorCode::SESSION_TRANSPORT_FAILURE, reason);
}

void ConnectionSession::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    state_.store(SessionState::Closing, std::memory_order_release);

    if (registered_) {
        registry_.remove(clientId_, this);
    }
    const std::size_t discarded = buffer_ ? buffer_->pendingSamples() : 0;
    if (buffer_) {
        buffer_->clear();
    }
    bufferSize_.store(0, std::memory_order_relaxed);
    // requestEviction() has already shut the transport down.
    if (transport_.shutdown && !cancelled()) {
        transport_.shutdown();
    }

    state_.store(SessionState::Closed, std::memory_order_release);
    if (registered_) {
        LOG_INFO("[{}] session closed ({} messages, {} detections, {} pending samples dropped)",
                 clientId_, totalMessages_.load(), totalDetections_.load(), discarded);
    } else {
        LOG_DEBUG("[{}] connection closed before registration", transport_.peer);
    }
}

void ConnectionSession::requestEviction(const std::string& reason) {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    LOG_INFO("[{}] evicted: {}", clientId_, reason);
    if (transport_.shutdown) {
        transport_.shutdown();
    }
}

SessionStats ConnectionSession::snapshot() const {
    SessionStats stats;
    stats.clientId = clientId_;
    stats.connectedAt = connectedAt_;
    stats.totalMessages = totalMessages_.load(std::memory_order_relaxed);
    stats.totalDetections = totalDetections_.load(std::memory_order_relaxed);
    stats.totalWindows = totalWindows_.load(std::memory_order_relaxed);
    stats.totalErrors = totalErrors_.load(std::memory_order_relaxed);
    stats.protocolViolations = protocolViolations_.load(std::memory_order_relaxed);
    stats.bufferSize = bufferSize_.load(std::memory_order_relaxed);
    stats.sampleRate = sampleRate_.load(std::memory_order_relaxed);
    stats.bufferDuration =
        stats.sampleRate > 0
            ? static_cast<double>(stats.bufferSize) / static_cast<double>(stats.sampleRate)
            : 0.0;
    return stats;
}

bool ConnectionSession::send(const nlohmann::json& message) {
    if (!transport_.send || !transport_.send(serialize(message))) {
        LOG_DEBUG("[{}] send failed, closing", clientId_.empty() ? transport_.peer : clientId_);
        close();
        return false;
    }
    return true;
}

bool ConnectionSession::sendError(ErrorCode code, const std::string& message) {
    totalErrors_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("[{}] -> error {} ({})", clientId_.empty() ? transport_.peer : clientId_,
              errorCodeToString(code), errorCodeToHex(code));
    if (!send(buildError(code, message, nowSeconds()))) {
        return false;
    }
    if (isConnectionFatal(code)) {
        close();
        return false;
    }
    return true;
}

void ConnectionSession::publishBufferStats() {
    bufferSize_.store(buffer_->pendingSamples(), std::memory_order_relaxed);
}

}  // namespace session
}  // namespace spoofwatch
