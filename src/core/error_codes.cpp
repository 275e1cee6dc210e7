#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace spoofwatch {

namespace {

struct ErrorCodeInfo {
    const char* name;
    int httpStatus;
};

// clang-format off
const std::unordered_map<ErrorCode, ErrorCodeInfo> kErrorCodeTable = {
    {ErrorCode::OK,                             {"OK", 200}},

    {ErrorCode::AUDIO_MALFORMED_PAYLOAD,        {"AUDIO_MALFORMED_PAYLOAD", 400}},
    {ErrorCode::AUDIO_UNSUPPORTED_ENCODING,     {"AUDIO_UNSUPPORTED_ENCODING", 415}},
    {ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH,     {"AUDIO_SAMPLE_RATE_MISMATCH", 422}},

    {ErrorCode::SESSION_DUPLICATE_CONNECTION,   {"SESSION_DUPLICATE_CONNECTION", 409}},
    {ErrorCode::SESSION_PROTOCOL_VIOLATION,     {"SESSION_PROTOCOL_VIOLATION", 400}},
    {ErrorCode::SESSION_TRANSPORT_FAILURE,      {"SESSION_TRANSPORT_FAILURE", 500}},
    {ErrorCode::SESSION_NOT_FOUND,              {"SESSION_NOT_FOUND", 404}},

    {ErrorCode::IPC_INVALID_COMMAND,            {"IPC_INVALID_COMMAND", 400}},
    {ErrorCode::IPC_INVALID_PARAMS,             {"IPC_INVALID_PARAMS", 400}},
    {ErrorCode::IPC_PROTOCOL_ERROR,             {"IPC_PROTOCOL_ERROR", 500}},
    {ErrorCode::IPC_UNKNOWN_ROUTE,              {"IPC_UNKNOWN_ROUTE", 404}},
    {ErrorCode::IPC_METHOD_NOT_ALLOWED,         {"IPC_METHOD_NOT_ALLOWED", 405}},
    {ErrorCode::IPC_MALFORMED_REQUEST,          {"IPC_MALFORMED_REQUEST", 400}},

    {ErrorCode::MODEL_UNAVAILABLE,              {"MODEL_UNAVAILABLE", 503}},
    {ErrorCode::MODEL_INFERENCE_ERROR,          {"MODEL_INFERENCE_ERROR", 500}},

    {ErrorCode::VALIDATION_INVALID_CONFIG,      {"VALIDATION_INVALID_CONFIG", 400}},
    {ErrorCode::VALIDATION_INVALID_SAMPLE_RATE, {"VALIDATION_INVALID_SAMPLE_RATE", 400}},

    {ErrorCode::INTERNAL_UNKNOWN,               {"INTERNAL_UNKNOWN", 500}},
};
// clang-format on

}  // namespace

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeTable.find(code);
    if (it != kErrorCodeTable.end()) {
        return it->second.name;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isAudioError(code)) {
        return "audio_payload";
    }
    if (isSessionError(code)) {
        return "session";
    }
    if (isIpcError(code)) {
        return "ipc";
    }
    if (isModelError(code)) {
        return "model";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

int toHttpStatus(ErrorCode code) {
    auto it = kErrorCodeTable.find(code);
    if (it != kErrorCodeTable.end()) {
        return it->second.httpStatus;
    }
    return 500;
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

}  // namespace spoofwatch
