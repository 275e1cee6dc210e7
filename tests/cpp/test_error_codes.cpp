/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error code names, categories and HTTP mapping.
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace spoofwatch;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::AUDIO_MALFORMED_PAYLOAD), "AUDIO_MALFORMED_PAYLOAD");
    EXPECT_STREQ(errorCodeToString(ErrorCode::SESSION_DUPLICATE_CONNECTION),
                 "SESSION_DUPLICATE_CONNECTION");
    EXPECT_STREQ(errorCodeToString(ErrorCode::MODEL_INFERENCE_ERROR), "MODEL_INFERENCE_ERROR");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE),
                 "VALIDATION_INVALID_SAMPLE_RATE");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
    EXPECT_EQ(toHttpStatus(unknownCode), 500);
}

TEST(ErrorCodes, EveryNamedCodeIsMapped) {
    const ErrorCode codes[] = {
        ErrorCode::AUDIO_MALFORMED_PAYLOAD,      ErrorCode::AUDIO_UNSUPPORTED_ENCODING,
        ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH,   ErrorCode::SESSION_DUPLICATE_CONNECTION,
        ErrorCode::SESSION_PROTOCOL_VIOLATION,   ErrorCode::SESSION_TRANSPORT_FAILURE,
        ErrorCode::SESSION_NOT_FOUND,            ErrorCode::IPC_INVALID_COMMAND,
        ErrorCode::IPC_INVALID_PARAMS,           ErrorCode::IPC_PROTOCOL_ERROR,
        ErrorCode::IPC_UNKNOWN_ROUTE,            ErrorCode::IPC_METHOD_NOT_ALLOWED,
        ErrorCode::IPC_MALFORMED_REQUEST,        ErrorCode::MODEL_UNAVAILABLE,
        ErrorCode::MODEL_INFERENCE_ERROR,        ErrorCode::VALIDATION_INVALID_CONFIG,
        ErrorCode::VALIDATION_INVALID_SAMPLE_RATE,
    };
    for (ErrorCode code : codes) {
        EXPECT_STRNE(errorCodeToString(code), "UNKNOWN_ERROR") << errorCodeToHex(code);
        EXPECT_STRNE(getErrorCategory(code), "internal") << errorCodeToString(code);
    }
}

// ============================================================
// Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::AUDIO_UNSUPPORTED_ENCODING), "audio_payload");
    EXPECT_STREQ(getErrorCategory(ErrorCode::SESSION_PROTOCOL_VIOLATION), "session");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IPC_INVALID_COMMAND), "ipc");
    EXPECT_STREQ(getErrorCategory(ErrorCode::MODEL_UNAVAILABLE), "model");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");
}

TEST(ErrorCodes, CategoryCheckers) {
    EXPECT_TRUE(isAudioError(ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH));
    EXPECT_FALSE(isAudioError(ErrorCode::SESSION_NOT_FOUND));
    EXPECT_TRUE(isSessionError(ErrorCode::SESSION_TRANSPORT_FAILURE));
    EXPECT_TRUE(isIpcError(ErrorCode::IPC_PROTOCOL_ERROR));
    EXPECT_TRUE(isModelError(ErrorCode::MODEL_INFERENCE_ERROR));
    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE));
}

// ============================================================
// HTTP / Hex / Fatality
// ============================================================

TEST(ErrorCodes, HttpStatusMapping) {
    EXPECT_EQ(toHttpStatus(ErrorCode::OK), 200);
    EXPECT_EQ(toHttpStatus(ErrorCode::AUDIO_MALFORMED_PAYLOAD), 400);
    EXPECT_EQ(toHttpStatus(ErrorCode::SESSION_DUPLICATE_CONNECTION), 409);
    EXPECT_EQ(toHttpStatus(ErrorCode::SESSION_NOT_FOUND), 404);
    EXPECT_EQ(toHttpStatus(ErrorCode::MODEL_UNAVAILABLE), 503);
    EXPECT_EQ(toHttpStatus(ErrorCode::IPC_UNKNOWN_ROUTE), 404);
    EXPECT_EQ(toHttpStatus(ErrorCode::IPC_METHOD_NOT_ALLOWED), 405);
    EXPECT_EQ(toHttpStatus(ErrorCode::IPC_MALFORMED_REQUEST), 400);
}

TEST(ErrorCodes, HexRendering) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::AUDIO_MALFORMED_PAYLOAD), "0x1001");
    EXPECT_EQ(errorCodeToHex(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE), "0x5002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

TEST(ErrorCodes, OnlyDuplicateAndTransportAreConnectionFatal) {
    EXPECT_TRUE(isConnectionFatal(ErrorCode::SESSION_DUPLICATE_CONNECTION));
    EXPECT_TRUE(isConnectionFatal(ErrorCode::SESSION_TRANSPORT_FAILURE));
    EXPECT_FALSE(isConnectionFatal(ErrorCode::AUDIO_MALFORMED_PAYLOAD));
    EXPECT_FALSE(isConnectionFatal(ErrorCode::SESSION_PROTOCOL_VIOLATION));
    EXPECT_FALSE(isConnectionFatal(ErrorCode::MODEL_INFERENCE_ERROR));
}
