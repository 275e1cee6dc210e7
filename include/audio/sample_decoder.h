#pragma once

#include "core/error_codes.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spoofwatch {
namespace audio {

constexpr uint32_t kMinSampleRate = 8000;
constexpr uint32_t kMaxSampleRate = 192000;

enum class SampleEncoding {
    Base64,  // base64 of raw little-endian float32 bytes
    Json     // JSON array of numbers (inline, or as a JSON-encoded string)
};

std::optional<SampleEncoding> parseEncoding(std::string_view name);
const char* encodingToString(SampleEncoding encoding);

// Canonical decoded audio: mono float32 at the declared rate.
struct SampleSequence {
    std::vector<float> samples;
    uint32_t sampleRate = 0;
};

struct DecodeResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    SampleSequence sequence;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

bool isSupportedSampleRate(int64_t sampleRate);

// Decode one wire payload. Pure: no connection state is touched.
//
// committedRate is the rate the connection locked in with its first chunk; when present
// and different from declaredSampleRate the result is AUDIO_SAMPLE_RATE_MISMATCH.
DecodeResult decodeSamples(const nlohmann::json& payload, std::string_view encoding,
                           int64_t declaredSampleRate,
                           std::optional<uint32_t> committedRate = std::nullopt);

// Little-endian float32 bytes -> samples. Fails when the length is not a multiple of 4.
bool samplesFromLittleEndianBytes(const std::vector<uint8_t>& bytes, std::vector<float>& out);

// Inverse of samplesFromLittleEndianBytes; used by clients and tests to build payloads.
std::vector<uint8_t> samplesToLittleEndianBytes(const std::vector<float>& samples);

}  // namespace audio
}  // namespace spoofwatch
