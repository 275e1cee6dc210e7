/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (JSON configuration)
 */

#include "core/config_loader.h"

#include "audio/sample_decoder.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace spoofwatch;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        // Unique per test and process so parallel ctest runs do not collide.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("spoofwatch_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AppConfig config;
    config.server.port = 1;
    EXPECT_FALSE(loadAppConfig("/nonexistent/path/config.json", config, false));
    EXPECT_EQ(config.server.port, DaemonConstants::DEFAULT_STREAM_PORT);
}

TEST_F(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
    AppConfig config;
    EXPECT_EQ(config.server.port, 8765);
    EXPECT_EQ(config.stream.sampleRate, 16000u);
    EXPECT_DOUBLE_EQ(config.stream.chunkDuration, 1.0);
    EXPECT_DOUBLE_EQ(config.stream.overlapDuration, 0.5);
    EXPECT_DOUBLE_EQ(config.stream.minDuration, 0.5);
    EXPECT_EQ(config.duplicatePolicy, DuplicatePolicy::RejectNew);
    EXPECT_EQ(config.detection.backend, "bypass");
    EXPECT_TRUE(config.status.zmqEnabled);
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    writeConfig(R"({
        "server": {"bindAddress": "127.0.0.1", "port": 9000, "maxMessageBytes": 65536},
        "stream": {"sampleRate": 22050, "chunkDuration": 2.0, "overlapDuration": 1.0,
                   "minDuration": 2.0},
        "registry": {"duplicatePolicy": "evict_existing"},
        "detection": {"backend": "onnx", "threshold": 0.7,
                      "ort": {"modelPath": "/models/aasist.onnx", "provider": "TRT",
                              "spoofIndex": 0}},
        "status": {"httpPort": 0, "zmqEnabled": false, "zmqEndpoint": "tcp://*:6000"},
        "logging": {"level": "debug", "filePath": "/tmp/spoofwatch.log"}
    })");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.server.bindAddress, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.server.maxMessageBytes, 65536u);
    EXPECT_EQ(config.stream.sampleRate, 22050u);
    EXPECT_DOUBLE_EQ(config.stream.chunkDuration, 2.0);
    EXPECT_EQ(config.duplicatePolicy, DuplicatePolicy::EvictExisting);
    EXPECT_EQ(config.detection.backend, "ort");
    EXPECT_FLOAT_EQ(config.detection.threshold, 0.7f);
    EXPECT_EQ(config.detection.ort.modelPath, "/models/aasist.onnx");
    EXPECT_EQ(config.detection.ort.provider, "tensorrt");
    EXPECT_EQ(config.detection.ort.spoofIndex, 0);
    EXPECT_EQ(config.status.httpPort, 0);
    EXPECT_FALSE(config.status.zmqEnabled);
    EXPECT_EQ(config.status.zmqEndpoint, "tcp://*:6000");
    EXPECT_EQ(config.logging.level, logging::LogLevel::Debug);
    EXPECT_EQ(config.logging.filePath, "/tmp/spoofwatch.log");
}

TEST_F(ConfigLoaderTest, PartialConfigKeepsDefaults) {
    writeConfig(R"({"server": {"port": 7000}})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.server.port, 7000);
    EXPECT_EQ(config.stream.sampleRate, 16000u);
    EXPECT_EQ(config.status.httpPort, DaemonConstants::DEFAULT_HTTP_PORT);
}

TEST_F(ConfigLoaderTest, InvalidStreamSectionFallsBackToDefaults) {
    writeConfig(R"({"stream": {"chunkDuration": 0.5, "overlapDuration": 0.5}})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_DOUBLE_EQ(config.stream.chunkDuration, 1.0);
    EXPECT_DOUBLE_EQ(config.stream.overlapDuration, 0.5);
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesAreReplaced) {
    writeConfig(R"({"server": {"port": 70000, "maxMessageBytes": 10},
                    "detection": {"threshold": 3.0, "ort": {"spoofIndex": 5}},
                    "status": {"httpPort": -1}})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.server.port, DaemonConstants::DEFAULT_STREAM_PORT);
    EXPECT_EQ(config.server.maxMessageBytes, AppConfig::ServerConfig{}.maxMessageBytes);
    EXPECT_FLOAT_EQ(config.detection.threshold, 0.5f);
    EXPECT_EQ(config.detection.ort.spoofIndex, 1);
    EXPECT_EQ(config.status.httpPort, 0);
}

TEST_F(ConfigLoaderTest, MalformedJsonReturnsFalseWithDefaults) {
    writeConfig(R"({"server": {"port": 7000,)");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.server.port, DaemonConstants::DEFAULT_STREAM_PORT);
}

TEST_F(ConfigLoaderTest, WrongValueTypeReturnsFalse) {
    writeConfig(R"({"server": {"port": "eighty"}})");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.server.port, DaemonConstants::DEFAULT_STREAM_PORT);
}

TEST_F(ConfigLoaderTest, NonObjectRootReturnsFalse) {
    writeConfig("[1, 2, 3]");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
}

// ============================================================
// Helpers
// ============================================================

TEST(ConfigHelpers, DuplicatePolicyParsing) {
    EXPECT_EQ(parseDuplicatePolicy("reject_new"), DuplicatePolicy::RejectNew);
    EXPECT_EQ(parseDuplicatePolicy("EVICT_EXISTING"), DuplicatePolicy::EvictExisting);
    EXPECT_EQ(parseDuplicatePolicy("evict"), DuplicatePolicy::EvictExisting);
    EXPECT_EQ(parseDuplicatePolicy("whatever"), DuplicatePolicy::RejectNew);
    EXPECT_STREQ(duplicatePolicyToString(DuplicatePolicy::EvictExisting), "evict_existing");
    EXPECT_STREQ(duplicatePolicyToString(DuplicatePolicy::RejectNew), "reject_new");
}

TEST(ConfigHelpers, BackendNameNormalization) {
    EXPECT_EQ(normalizeBackendName("ORT"), "ort");
    EXPECT_EQ(normalizeBackendName("onnxruntime"), "ort");
    EXPECT_EQ(normalizeBackendName("bypass"), "bypass");
    EXPECT_EQ(normalizeBackendName("mystery"), "bypass");
}

TEST(ConfigHelpers, StreamDefaultsValidation) {
    std::string error;
    EXPECT_TRUE(validateStreamDefaults(StreamDefaults{}, error));

    StreamDefaults badRate;
    badRate.sampleRate = 4000;
    EXPECT_FALSE(validateStreamDefaults(badRate, error));

    StreamDefaults zeroChunk;
    zeroChunk.chunkDuration = 0.0;
    zeroChunk.overlapDuration = 0.0;
    EXPECT_FALSE(validateStreamDefaults(zeroChunk, error));

    StreamDefaults negativeMin;
    negativeMin.minDuration = -0.1;
    EXPECT_FALSE(validateStreamDefaults(negativeMin, error));

    // Same range the stream decoder enforces.
    StreamDefaults topRate;
    topRate.sampleRate = audio::kMaxSampleRate;
    EXPECT_TRUE(validateStreamDefaults(topRate, error)) << error;
    topRate.sampleRate = audio::kMaxSampleRate + 1;
    EXPECT_FALSE(validateStreamDefaults(topRate, error));
    StreamDefaults bottomRate;
    bottomRate.sampleRate = audio::kMinSampleRate;
    EXPECT_TRUE(validateStreamDefaults(bottomRate, error)) << error;
}

TEST(ConfigHelpers, StreamDefaultsRespectWindowLimit) {
    std::string error;

    StreamDefaults longChunk;
    longChunk.chunkDuration = 12.0;
    EXPECT_FALSE(validateStreamDefaults(longChunk, error));
    EXPECT_NE(error.find("maxWindowDuration"), std::string::npos);

    StreamDefaults longMin;
    longMin.minDuration = 10.5;
    EXPECT_FALSE(validateStreamDefaults(longMin, error));

    StreamDefaults raisedLimit;
    raisedLimit.maxWindowDuration = 30.0;
    raisedLimit.chunkDuration = 20.0;
    raisedLimit.minDuration = 20.0;
    EXPECT_TRUE(validateStreamDefaults(raisedLimit, error)) << error;

    StreamDefaults zeroLimit;
    zeroLimit.maxWindowDuration = 0.0;
    EXPECT_FALSE(validateStreamDefaults(zeroLimit, error));

    // Cannot be expressed in samples at the highest supported rate.
    StreamDefaults hugeLimit;
    hugeLimit.maxWindowDuration = 1e300;
    EXPECT_FALSE(validateStreamDefaults(hugeLimit, error));
}

TEST_F(ConfigLoaderTest, StreamChunkAboveLimitFallsBackToDefaults) {
    writeConfig(R"({"stream": {"chunkDuration": 60.0, "overlapDuration": 1.0}})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_DOUBLE_EQ(config.stream.chunkDuration, 1.0);
    EXPECT_DOUBLE_EQ(config.stream.maxWindowDuration, 10.0);

    writeConfig(R"({"stream": {"chunkDuration": 60.0, "overlapDuration": 1.0,
                               "maxWindowDuration": 120.0}})");
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_DOUBLE_EQ(config.stream.chunkDuration, 60.0);
    EXPECT_DOUBLE_EQ(config.stream.maxWindowDuration, 120.0);
}
