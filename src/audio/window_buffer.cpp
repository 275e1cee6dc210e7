#include "audio/window_buffer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace spoofwatch {
namespace audio {

namespace {

bool durationToSamples(double seconds, uint32_t sampleRate, std::size_t& out) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return false;
    }
    const double samples = seconds * static_cast<double>(sampleRate);
    // llround is unspecified past long long; size_t is the other bound.
    constexpr double kLimit = static_cast<double>(
        std::min<unsigned long long>(std::numeric_limits<long long>::max(),
                                     std::numeric_limits<std::size_t>::max()));
    if (!(samples < kLimit)) {
        return false;
    }
    out = static_cast<std::size_t>(std::llround(samples));
    return true;
}

}  // namespace

bool computeWindowLengths(const WindowDurations& durations, uint32_t sampleRate,
                          WindowLengths& out, std::string& error) {
    if (sampleRate == 0) {
        error = "sample rate must be positive";
        return false;
    }
    if (!std::isfinite(durations.max) || durations.max <= 0.0) {
        error = "maximum window duration must be positive";
        return false;
    }
    if (durations.chunk > durations.max) {
        error = "chunk_duration (" + std::to_string(durations.chunk) + " s) exceeds the " +
                std::to_string(durations.max) + " s window limit";
        return false;
    }
    if (durations.min > durations.max) {
        error = "min_duration (" + std::to_string(durations.min) + " s) exceeds the " +
                std::to_string(durations.max) + " s window limit";
        return false;
    }
    WindowLengths lengths;
    if (!durationToSamples(durations.chunk, sampleRate, lengths.chunk)) {
        error = "chunk_duration must be a finite, non-negative number of samples";
        return false;
    }
    if (!durationToSamples(durations.overlap, sampleRate, lengths.overlap)) {
        error = "overlap_duration must be a finite, non-negative number of samples";
        return false;
    }
    if (!durationToSamples(durations.min, sampleRate, lengths.min)) {
        error = "min_duration must be a finite, non-negative number of samples";
        return false;
    }
    if (!validateWindowLengths(lengths, error)) {
        return false;
    }
    out = lengths;
    return true;
}

bool validateWindowLengths(const WindowLengths& lengths, std::string& error) {
    if (lengths.chunk == 0) {
        error = "chunk length must be at least one sample";
        return false;
    }
    if (lengths.overlap >= lengths.chunk) {
        error = "overlap (" + std::to_string(lengths.overlap) +
                " samples) must be shorter than the chunk (" + std::to_string(lengths.chunk) +
                " samples)";
        return false;
    }
    return true;
}

WindowingBuffer::WindowingBuffer(const WindowLengths& lengths, uint32_t sampleRate)
    : lengths_(lengths), sampleRate_(sampleRate) {
    std::string error;
    if (!validateWindowLengths(lengths, error)) {
        throw std::invalid_argument("WindowingBuffer: " + error);
    }
    storage_.reserve(std::max(lengths_.chunk, lengths_.min));
}

std::vector<AudioWindow> WindowingBuffer::feed(const float* data, std::size_t count) {
    std::vector<AudioWindow> windows;
    if (count > 0) {
        storage_.insert(storage_.end(), data, data + count);
        samplesReceived_ += count;
    }

    // The first window waits for min samples; afterwards only the chunk length matters.
    if (windowsEmitted_ == 0 && pendingSamples() < std::max(lengths_.chunk, lengths_.min)) {
        return windows;
    }

    while (pendingSamples() >= lengths_.chunk) {
        AudioWindow window;
        window.index = windowsEmitted_++;
        window.sampleRate = sampleRate_;
        const auto begin = storage_.begin() + static_cast<std::ptrdiff_t>(head_);
        window.samples.assign(begin, begin + static_cast<std::ptrdiff_t>(lengths_.chunk));
        windows.push_back(std::move(window));
        head_ += lengths_.hop();
    }

    compact();
    return windows;
}

bool WindowingBuffer::reconfigure(const WindowLengths& lengths, uint32_t sampleRate,
                                  std::string& error) {
    if (!validateWindowLengths(lengths, error)) {
        return false;
    }
    lengths_ = lengths;
    sampleRate_ = sampleRate;
    return true;
}

void WindowingBuffer::clear() {
    storage_.clear();
    storage_.shrink_to_fit();
    head_ = 0;
}

double WindowingBuffer::pendingDuration() const {
    if (sampleRate_ == 0) {
        return 0.0;
    }
    return static_cast<double>(pendingSamples()) / static_cast<double>(sampleRate_);
}

std::vector<float> WindowingBuffer::pendingCopy() const {
    return std::vector<float>(storage_.begin() + static_cast<std::ptrdiff_t>(head_),
                              storage_.end());
}

void WindowingBuffer::compact() {
    if (head_ == 0) {
        return;
    }
    storage_.erase(storage_.begin(), storage_.begin() + static_cast<std::ptrdiff_t>(head_));
    head_ = 0;
}

}  // namespace audio
}  // namespace spoofwatch
