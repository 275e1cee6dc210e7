#include "audio/sample_decoder.h"

#include "core/base64.h"

#include <cfloat>
#include <cmath>
#include <cstring>

namespace spoofwatch {
namespace audio {

namespace {

constexpr std::size_t kFloatBytes = 4;

DecodeResult failure(ErrorCode code, std::string message) {
    DecodeResult result;
    result.code = code;
    result.message = std::move(message);
    return result;
}

bool allFinite(const std::vector<float>& samples, std::size_t& badIndex) {
    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (!std::isfinite(samples[i])) {
            badIndex = i;
            return false;
        }
    }
    return true;
}

DecodeResult decodeBase64(const nlohmann::json& payload) {
    if (!payload.is_string()) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                       "audio_data must be a base64 string for encoding 'base64'");
    }
    const auto& text = payload.get_ref<const std::string&>();
    auto bytes = base64::decode(text);
    if (!bytes) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD, "audio_data is not valid base64");
    }
    DecodeResult result;
    if (!samplesFromLittleEndianBytes(*bytes, result.sequence.samples)) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                       "decoded length " + std::to_string(bytes->size()) +
                           " is not a multiple of 4 bytes");
    }
    return result;
}

DecodeResult decodeJsonArray(const nlohmann::json& array) {
    DecodeResult result;
    auto& samples = result.sequence.samples;
    samples.reserve(array.size());
    for (std::size_t i = 0; i < array.size(); ++i) {
        const auto& element = array[i];
        if (!element.is_number()) {
            return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                           "audio_data element " + std::to_string(i) + " is not numeric");
        }
        // Narrowing a double outside float range is undefined; refuse it first.
        const double value = element.get<double>();
        if (!std::isfinite(value) || std::fabs(value) > FLT_MAX) {
            return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                           "audio_data element " + std::to_string(i) +
                               " is not a finite 32-bit float");
        }
        samples.push_back(static_cast<float>(value));
    }
    return result;
}

DecodeResult decodeJson(const nlohmann::json& payload) {
    if (payload.is_array()) {
        return decodeJsonArray(payload);
    }
    if (payload.is_string()) {
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(payload.get_ref<const std::string&>());
        } catch (const nlohmann::json::parse_error& e) {
            return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                           std::string("audio_data is not a JSON array: ") + e.what());
        }
        if (parsed.is_array()) {
            return decodeJsonArray(parsed);
        }
    }
    return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                   "audio_data must be a JSON array of numbers for encoding 'json'");
}

}  // namespace

std::optional<SampleEncoding> parseEncoding(std::string_view name) {
    if (name == "base64") {
        return SampleEncoding::Base64;
    }
    if (name == "json") {
        return SampleEncoding::Json;
    }
    return std::nullopt;
}

const char* encodingToString(SampleEncoding encoding) {
    switch (encoding) {
    case SampleEncoding::Json:
        return "json";
    case SampleEncoding::Base64:
    default:
        return "base64";
    }
}

bool isSupportedSampleRate(int64_t sampleRate) {
    return sampleRate >= static_cast<int64_t>(kMinSampleRate) &&
           sampleRate <= static_cast<int64_t>(kMaxSampleRate);
}

DecodeResult decodeSamples(const nlohmann::json& payload, std::string_view encoding,
                           int64_t declaredSampleRate, std::optional<uint32_t> committedRate) {
    auto parsedEncoding = parseEncoding(encoding);
    if (!parsedEncoding) {
        return failure(ErrorCode::AUDIO_UNSUPPORTED_ENCODING,
                       "Unsupported encoding: " + std::string(encoding));
    }
    if (!isSupportedSampleRate(declaredSampleRate)) {
        return failure(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE,
                       "Sample rate " + std::to_string(declaredSampleRate) +
                           " Hz is out of range [" + std::to_string(kMinSampleRate) + ", " +
                           std::to_string(kMaxSampleRate) + "]");
    }
    const auto rate = static_cast<uint32_t>(declaredSampleRate);
    if (committedRate && *committedRate != rate) {
        return failure(ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH,
                       "Sample rate " + std::to_string(rate) +
                           " Hz does not match the connection rate " +
                           std::to_string(*committedRate) + " Hz");
    }
    if (payload.is_null()) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD, "Missing audio_data");
    }

    DecodeResult result = (*parsedEncoding == SampleEncoding::Base64) ? decodeBase64(payload)
                                                                      : decodeJson(payload);
    if (!result.ok()) {
        return result;
    }
    if (result.sequence.samples.empty()) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD, "audio_data contains no samples");
    }
    std::size_t badIndex = 0;
    if (!allFinite(result.sequence.samples, badIndex)) {
        return failure(ErrorCode::AUDIO_MALFORMED_PAYLOAD,
                       "audio_data sample " + std::to_string(badIndex) + " is NaN or infinite");
    }
    result.sequence.sampleRate = rate;
    return result;
}

bool samplesFromLittleEndianBytes(const std::vector<uint8_t>& bytes, std::vector<float>& out) {
    out.clear();
    if (bytes.size() % kFloatBytes != 0) {
        return false;
    }
    out.resize(bytes.size() / kFloatBytes);
    for (std::size_t i = 0; i < out.size(); ++i) {
        const uint8_t* p = bytes.data() + i * kFloatBytes;
        const uint32_t bits = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                              (static_cast<uint32_t>(p[2]) << 16) |
                              (static_cast<uint32_t>(p[3]) << 24);
        std::memcpy(&out[i], &bits, sizeof(float));
    }
    return true;
}

std::vector<uint8_t> samplesToLittleEndianBytes(const std::vector<float>& samples) {
    std::vector<uint8_t> bytes(samples.size() * kFloatBytes);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        uint32_t bits = 0;
        std::memcpy(&bits, &samples[i], sizeof(float));
        uint8_t* p = bytes.data() + i * kFloatBytes;
        p[0] = static_cast<uint8_t>(bits & 0xFF);
        p[1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
        p[2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
        p[3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
    }
    return bytes;
}

}  // namespace audio
}  // namespace spoofwatch
