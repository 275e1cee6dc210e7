#include "audio/sample_decoder.h"
#include "core/base64.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <vector>

using namespace spoofwatch;
using nlohmann::json;

namespace {

std::string encodeSamples(const std::vector<float>& samples) {
    return base64::encode(audio::samplesToLittleEndianBytes(samples));
}

}  // namespace

TEST(SampleDecoder, Base64PayloadDecodesLittleEndianFloats) {
    std::vector<float> samples = {0.0f, 0.5f, -0.25f, 1.0f};
    auto result = audio::decodeSamples(json(encodeSamples(samples)), "base64", 16000);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.sequence.samples, samples);
    EXPECT_EQ(result.sequence.sampleRate, 16000u);
}

TEST(SampleDecoder, KnownByteLayout) {
    // 1.0f = 0x3F800000, little-endian 00 00 80 3F
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x80, 0x3F};
    std::vector<float> out;
    ASSERT_TRUE(audio::samplesFromLittleEndianBytes(bytes, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
}

TEST(SampleDecoder, JsonArrayAndJsonStringPayloads) {
    auto inlineArray = audio::decodeSamples(json::array({0.1, -0.2, 0.3}), "json", 22050);
    ASSERT_TRUE(inlineArray.ok()) << inlineArray.message;
    ASSERT_EQ(inlineArray.sequence.samples.size(), 3u);
    EXPECT_FLOAT_EQ(inlineArray.sequence.samples[1], -0.2f);

    auto asString = audio::decodeSamples(json("[0.1, -0.2, 0.3]"), "json", 22050);
    ASSERT_TRUE(asString.ok()) << asString.message;
    EXPECT_EQ(asString.sequence.samples, inlineArray.sequence.samples);
}

TEST(SampleDecoder, InvalidBase64IsMalformed) {
    auto result = audio::decodeSamples(json("not base64!"), "base64", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);
    EXPECT_FALSE(result.message.empty());
}

TEST(SampleDecoder, ByteLengthNotMultipleOfFourIsMalformed) {
    std::vector<uint8_t> bytes = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    auto result = audio::decodeSamples(json(base64::encode(bytes)), "base64", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);
}

TEST(SampleDecoder, EmptyAndMissingPayloadsAreMalformed) {
    EXPECT_EQ(audio::decodeSamples(json(""), "base64", 16000).code,
              ErrorCode::AUDIO_MALFORMED_PAYLOAD);
    EXPECT_EQ(audio::decodeSamples(json::array(), "json", 16000).code,
              ErrorCode::AUDIO_MALFORMED_PAYLOAD);
    EXPECT_EQ(audio::decodeSamples(json(), "base64", 16000).code,
              ErrorCode::AUDIO_MALFORMED_PAYLOAD);
}

TEST(SampleDecoder, NonNumericJsonElementIsMalformed) {
    auto result = audio::decodeSamples(json::array({0.1, "x"}), "json", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);
}

TEST(SampleDecoder, NonFiniteSamplesAreMalformed) {
    std::vector<float> samples = {0.1f, std::numeric_limits<float>::quiet_NaN()};
    auto result = audio::decodeSamples(json(encodeSamples(samples)), "base64", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);

    samples = {std::numeric_limits<float>::infinity()};
    result = audio::decodeSamples(json(encodeSamples(samples)), "base64", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);
}

TEST(SampleDecoder, JsonValuesOutsideFloatRangeAreMalformed) {
    auto result = audio::decodeSamples(json::array({0.1, 1e39}), "json", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);
    EXPECT_NE(result.message.find("element 1"), std::string::npos);

    result = audio::decodeSamples(json("[-1e300]"), "json", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_MALFORMED_PAYLOAD);

    const double largest = std::numeric_limits<float>::max();
    result = audio::decodeSamples(json::array({largest, -largest}), "json", 16000);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.sequence.samples[0], std::numeric_limits<float>::max());
    EXPECT_EQ(result.sequence.samples[1], -std::numeric_limits<float>::max());
}

TEST(SampleDecoder, UnsupportedEncoding) {
    auto result = audio::decodeSamples(json("AAAA"), "pcm16", 16000);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_UNSUPPORTED_ENCODING);
}

TEST(SampleDecoder, SampleRateRange) {
    EXPECT_TRUE(audio::isSupportedSampleRate(8000));
    EXPECT_TRUE(audio::isSupportedSampleRate(192000));
    EXPECT_FALSE(audio::isSupportedSampleRate(7999));
    EXPECT_FALSE(audio::isSupportedSampleRate(0));
    EXPECT_FALSE(audio::isSupportedSampleRate(192001));

    auto result = audio::decodeSamples(json(encodeSamples({0.1f})), "base64", 4000);
    EXPECT_EQ(result.code, ErrorCode::VALIDATION_INVALID_SAMPLE_RATE);
}

TEST(SampleDecoder, CommittedRateMismatch) {
    auto payload = json(encodeSamples({0.1f, 0.2f}));
    EXPECT_TRUE(audio::decodeSamples(payload, "base64", 16000, 16000u).ok());
    auto result = audio::decodeSamples(payload, "base64", 44100, 16000u);
    EXPECT_EQ(result.code, ErrorCode::AUDIO_SAMPLE_RATE_MISMATCH);
}

TEST(SampleDecoder, EncodingNames) {
    EXPECT_EQ(audio::parseEncoding("base64"), audio::SampleEncoding::Base64);
    EXPECT_EQ(audio::parseEncoding("json"), audio::SampleEncoding::Json);
    EXPECT_FALSE(audio::parseEncoding("wav").has_value());
    EXPECT_STREQ(audio::encodingToString(audio::SampleEncoding::Json), "json");
}
