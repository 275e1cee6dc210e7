#ifndef SPOOFWATCH_ERROR_CODES_H
#define SPOOFWATCH_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace spoofwatch {

/**
 * @brief Error codes shared by the stream core, the status surfaces and the wire protocol.
 *
 * Categories use the upper nibble of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Audio payload decoding
 * - 0x2xxx: Connection session / transport
 * - 0x3xxx: Operator surfaces (ZeroMQ control plane, HTTP status server)
 * - 0x4xxx: Classifier model
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio payload (0x1000)
    AUDIO_MALFORMED_PAYLOAD = 0x1001,
    AUDIO_UNSUPPORTED_ENCODING = 0x1002,
    AUDIO_SAMPLE_RATE_MISMATCH = 0x1003,

    // Session / transport (0x2000)
    SESSION_DUPLICATE_CONNECTION = 0x2001,
    SESSION_PROTOCOL_VIOLATION = 0x2002,
    SESSION_TRANSPORT_FAILURE = 0x2003,
    SESSION_NOT_FOUND = 0x2004,

    // IPC: ZeroMQ and HTTP status (0x3000)
    IPC_INVALID_COMMAND = 0x3001,
    IPC_INVALID_PARAMS = 0x3002,
    IPC_PROTOCOL_ERROR = 0x3003,
    IPC_UNKNOWN_ROUTE = 0x3004,
    IPC_METHOD_NOT_ALLOWED = 0x3005,
    IPC_MALFORMED_REQUEST = 0x3006,

    // Model (0x4000)
    MODEL_UNAVAILABLE = 0x4001,
    MODEL_INFERENCE_ERROR = 0x4002,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_SAMPLE_RATE = 0x5002,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its string name.
 * @return Name (e.g., "AUDIO_MALFORMED_PAYLOAD"), or "UNKNOWN_ERROR" for unmapped codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name for an error code ("audio_payload", "session", ...).
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief HTTP status used when the code is reported over the status surface.
 * @return e.g. 400, 404, 405, 409, 503; 500 for unknown codes
 */
int toHttpStatus(ErrorCode code);

/**
 * @brief Hex rendering (e.g., "0x1001").
 */
std::string errorCodeToHex(ErrorCode code);

constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isSessionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isModelError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}

/**
 * @brief Whether the error ends the connection attempt instead of leaving the session Active.
 *
 * Duplicate identities and transport failures terminate; every other error is reported to
 * the client and the session keeps running. ConnectionSession closes after sending a
 * fatal error.
 */
constexpr bool isConnectionFatal(ErrorCode code) {
    return code == ErrorCode::SESSION_DUPLICATE_CONNECTION ||
           code == ErrorCode::SESSION_TRANSPORT_FAILURE;
}

}  // namespace spoofwatch

#endif  // SPOOFWATCH_ERROR_CODES_H
