#include "audio/window_buffer.h"

#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace spoofwatch::audio;

namespace {

WindowLengths makeLengths(std::size_t chunk, std::size_t overlap, std::size_t min) {
    WindowLengths lengths;
    lengths.chunk = chunk;
    lengths.overlap = overlap;
    lengths.min = min;
    return lengths;
}

std::vector<float> ramp(std::size_t count, float start = 0.0f) {
    std::vector<float> samples(count);
    std::iota(samples.begin(), samples.end(), start);
    return samples;
}

std::size_t expectedWindows(std::size_t total, const WindowLengths& lengths) {
    if (total < lengths.chunk) {
        return 0;
    }
    return (total - lengths.chunk) / lengths.hop() + 1;
}

}  // namespace

TEST(WindowLengthsTest, ComputesSampleCountsFromDurations) {
    WindowDurations durations;
    durations.chunk = 1.0;
    durations.overlap = 0.25;
    durations.min = 0.5;
    WindowLengths lengths;
    std::string error;
    ASSERT_TRUE(computeWindowLengths(durations, 16000, lengths, error)) << error;
    EXPECT_EQ(lengths.chunk, 16000u);
    EXPECT_EQ(lengths.overlap, 4000u);
    EXPECT_EQ(lengths.min, 8000u);
    EXPECT_EQ(lengths.hop(), 12000u);
}

TEST(WindowLengthsTest, RejectsOverlapNotShorterThanChunk) {
    WindowDurations durations;
    durations.chunk = 0.5;
    durations.overlap = 0.5;
    WindowLengths lengths;
    std::string error;
    EXPECT_FALSE(computeWindowLengths(durations, 16000, lengths, error));
    EXPECT_FALSE(error.empty());
}

TEST(WindowLengthsTest, RejectsZeroChunkNegativeDurationAndZeroRate) {
    WindowLengths lengths;
    std::string error;

    WindowDurations zeroChunk;
    zeroChunk.chunk = 0.0;
    zeroChunk.overlap = 0.0;
    EXPECT_FALSE(computeWindowLengths(zeroChunk, 16000, lengths, error));

    WindowDurations negative;
    negative.min = -1.0;
    EXPECT_FALSE(computeWindowLengths(negative, 16000, lengths, error));

    EXPECT_FALSE(computeWindowLengths(WindowDurations{}, 0, lengths, error));
}

TEST(WindowLengthsTest, RejectsDurationsBeyondWindowLimit) {
    WindowLengths lengths;
    std::string error;

    WindowDurations longChunk;
    longChunk.chunk = 1e300;
    longChunk.overlap = 0.5;
    EXPECT_FALSE(computeWindowLengths(longChunk, 16000, lengths, error));
    EXPECT_NE(error.find("chunk_duration"), std::string::npos);

    WindowDurations longMin;
    longMin.min = kDefaultMaxWindowDuration + 0.5;
    EXPECT_FALSE(computeWindowLengths(longMin, 16000, lengths, error));
    EXPECT_NE(error.find("min_duration"), std::string::npos);

    WindowDurations atLimit;
    atLimit.chunk = kDefaultMaxWindowDuration;
    atLimit.min = kDefaultMaxWindowDuration;
    ASSERT_TRUE(computeWindowLengths(atLimit, 16000, lengths, error)) << error;
    EXPECT_EQ(lengths.chunk, 160000u);
}

TEST(WindowLengthsTest, RejectsSampleCountsThatOverflow) {
    WindowDurations durations;
    durations.max = 1e300;
    durations.chunk = 1e300;
    durations.overlap = 0.0;
    durations.min = 0.0;
    WindowLengths lengths;
    std::string error;
    EXPECT_FALSE(computeWindowLengths(durations, 16000, lengths, error));
    EXPECT_FALSE(error.empty());

    WindowDurations badLimit;
    badLimit.max = 0.0;
    EXPECT_FALSE(computeWindowLengths(badLimit, 16000, lengths, error));
}

TEST(WindowingBufferTest, ConstructorThrowsOnInvalidLengths) {
    EXPECT_THROW(WindowingBuffer(makeLengths(100, 100, 0), 16000), std::invalid_argument);
    EXPECT_THROW(WindowingBuffer(makeLengths(0, 0, 0), 16000), std::invalid_argument);
}

TEST(WindowingBufferTest, FirstWindowThenOverlapCarry) {
    WindowingBuffer buffer(makeLengths(16000, 4000, 16000), 16000);

    auto first = buffer.feed(std::vector<float>(16000, 0.0f));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].samples.size(), 16000u);
    EXPECT_EQ(first[0].index, 0u);
    EXPECT_EQ(buffer.pendingSamples(), 4000u);

    auto second = buffer.feed(std::vector<float>(12000, 0.0f));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].index, 1u);
    EXPECT_EQ(buffer.pendingSamples(), 4000u);
    EXPECT_EQ(buffer.windowsEmitted(), 2u);
    EXPECT_EQ(buffer.samplesReceived(), 28000u);
}

TEST(WindowingBufferTest, WindowContentsFollowArrivalOrder) {
    WindowingBuffer buffer(makeLengths(8, 2, 0), 8000);
    auto windows = buffer.feed(ramp(20));
    // hop = 6: windows start at 0, 6, 12
    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(windows[0].samples, ramp(8, 0.0f));
    EXPECT_EQ(windows[1].samples, ramp(8, 6.0f));
    EXPECT_EQ(windows[2].samples, ramp(8, 12.0f));
    // Retained tail: last 2 samples of window 2 (18, 19)
    EXPECT_EQ(buffer.pendingCopy(), ramp(2, 18.0f));
}

TEST(WindowingBufferTest, WindowCountMatchesCompletenessFormula) {
    const WindowLengths lengths = makeLengths(100, 30, 50);
    const std::size_t feeds[] = {7, 93, 1, 150, 64, 3, 300, 12};
    WindowingBuffer buffer(lengths, 8000);
    std::size_t total = 0;
    std::size_t emitted = 0;
    for (std::size_t count : feeds) {
        emitted += buffer.feed(std::vector<float>(count, 0.1f)).size();
        total += count;
        EXPECT_EQ(emitted, expectedWindows(total, lengths)) << "after " << total << " samples";
    }
}

TEST(WindowingBufferTest, ChunkBoundariesDoNotChangeOutput) {
    const WindowLengths lengths = makeLengths(16000, 8000, 8000);
    const auto stream = ramp(32000);

    WindowingBuffer single(lengths, 16000);
    auto oneShot = single.feed(stream);

    WindowingBuffer split(lengths, 16000);
    std::vector<AudioWindow> pieces;
    for (std::size_t offset = 0; offset < stream.size(); offset += 1000) {
        auto out = split.feed(stream.data() + offset, 1000);
        for (auto& window : out) {
            pieces.push_back(std::move(window));
        }
    }

    ASSERT_EQ(oneShot.size(), 3u);
    ASSERT_EQ(pieces.size(), oneShot.size());
    for (std::size_t i = 0; i < oneShot.size(); ++i) {
        EXPECT_EQ(pieces[i].index, oneShot[i].index);
        EXPECT_EQ(pieces[i].samples, oneShot[i].samples);
    }
    EXPECT_EQ(single.pendingCopy(), split.pendingCopy());
}

TEST(WindowingBufferTest, MinLengthGatesOnlyTheFirstWindow) {
    WindowingBuffer buffer(makeLengths(100, 50, 250), 8000);
    EXPECT_TRUE(buffer.feed(std::vector<float>(200, 0.0f)).empty());
    EXPECT_EQ(buffer.pendingSamples(), 200u);

    // 250 pending: windows at 0, 50, 100, 150
    auto first = buffer.feed(std::vector<float>(50, 0.0f));
    EXPECT_EQ(first.size(), 4u);
    EXPECT_EQ(buffer.pendingSamples(), 50u);

    // Steady state: a single hop completes the next window
    EXPECT_EQ(buffer.feed(std::vector<float>(50, 0.0f)).size(), 1u);
}

TEST(WindowingBufferTest, ShortFeedsAccumulateWithoutEmitting) {
    WindowingBuffer buffer(makeLengths(16000, 8000, 8000), 16000);
    EXPECT_TRUE(buffer.feed(std::vector<float>(4000, 0.0f)).empty());
    EXPECT_TRUE(buffer.feed(std::vector<float>(4000, 0.0f)).empty());
    EXPECT_EQ(buffer.pendingSamples(), 8000u);
    EXPECT_DOUBLE_EQ(buffer.pendingDuration(), 0.5);
    EXPECT_EQ(buffer.feed(std::vector<float>(8000, 0.0f)).size(), 1u);
}

TEST(WindowingBufferTest, ReconfigureEmitsNothingAndAppliesOnNextFeed) {
    WindowingBuffer buffer(makeLengths(100, 0, 0), 8000);
    EXPECT_TRUE(buffer.feed(std::vector<float>(60, 0.0f)).empty());

    std::string error;
    ASSERT_TRUE(buffer.reconfigure(makeLengths(50, 10, 0), 8000, error)) << error;
    EXPECT_EQ(buffer.pendingSamples(), 60u);
    EXPECT_EQ(buffer.windowsEmitted(), 0u);

    auto windows = buffer.feed(nullptr, 0);
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0].samples.size(), 50u);
    EXPECT_EQ(buffer.pendingSamples(), 20u);
}

TEST(WindowingBufferTest, ReconfigureRejectsInvalidLengths) {
    WindowingBuffer buffer(makeLengths(100, 0, 0), 8000);
    std::string error;
    EXPECT_FALSE(buffer.reconfigure(makeLengths(10, 20, 0), 8000, error));
    EXPECT_EQ(buffer.lengths().chunk, 100u);
}

TEST(WindowingBufferTest, ClearDropsPendingButKeepsCounters) {
    WindowingBuffer buffer(makeLengths(10, 0, 0), 8000);
    buffer.feed(std::vector<float>(25, 0.0f));
    buffer.clear();
    EXPECT_EQ(buffer.pendingSamples(), 0u);
    EXPECT_EQ(buffer.windowsEmitted(), 2u);
    EXPECT_EQ(buffer.samplesReceived(), 25u);
}
