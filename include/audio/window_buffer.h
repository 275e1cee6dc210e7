#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace spoofwatch {
namespace audio {

// Upper bound on chunk and min durations; bounds the pending queue of every connection.
constexpr double kDefaultMaxWindowDuration = 10.0;  // seconds

// Window geometry in samples.
struct WindowLengths {
    std::size_t chunk = 0;    // samples per emitted window
    std::size_t overlap = 0;  // samples carried from the end of one window into the next
    std::size_t min = 0;      // samples required before the very first window

    std::size_t hop() const {
        return chunk - overlap;
    }
};

// Window geometry in seconds, as configured by the operator or the client.
struct WindowDurations {
    double chunk = 1.0;
    double overlap = 0.5;
    double min = 0.5;
    double max = kDefaultMaxWindowDuration;  // limit for chunk and min, not client-settable
};

// Convert durations to sample counts (rounded to nearest) and validate the result.
// Fails when chunk or min exceed durations.max or a count does not fit in size_t.
bool computeWindowLengths(const WindowDurations& durations, uint32_t sampleRate,
                          WindowLengths& out, std::string& error);

bool validateWindowLengths(const WindowLengths& lengths, std::string& error);

struct AudioWindow {
    uint64_t index = 0;  // 0-based emission order within the buffer's lifetime
    uint32_t sampleRate = 0;
    std::vector<float> samples;
};

// Per-connection accumulator that slices a sample stream into overlapping windows.
//
// Single owner, no internal locking: the connection that feeds it is the only caller.
// After each emitted window the last `overlap` samples of that window stay at the head
// of the pending queue, followed by everything that arrived after it.
class WindowingBuffer {
   public:
    // Throws std::invalid_argument when lengths fail validateWindowLengths().
    WindowingBuffer(const WindowLengths& lengths, uint32_t sampleRate);

    // Append samples and return every window completed by them, in order.
    std::vector<AudioWindow> feed(const float* data, std::size_t count);
    std::vector<AudioWindow> feed(const std::vector<float>& samples) {
        return feed(samples.data(), samples.size());
    }

    // New lengths apply to windows emitted from the next feed() on; pending samples are
    // kept and reinterpreted. No window is emitted by this call.
    bool reconfigure(const WindowLengths& lengths, uint32_t sampleRate, std::string& error);

    // Drop pending samples (session close). Counters are kept.
    void clear();

    std::size_t pendingSamples() const {
        return storage_.size() - head_;
    }
    double pendingDuration() const;
    std::vector<float> pendingCopy() const;

    const WindowLengths& lengths() const {
        return lengths_;
    }
    uint32_t sampleRate() const {
        return sampleRate_;
    }
    uint64_t windowsEmitted() const {
        return windowsEmitted_;
    }
    uint64_t samplesReceived() const {
        return samplesReceived_;
    }

   private:
    void compact();

    WindowLengths lengths_;
    uint32_t sampleRate_;
    std::vector<float> storage_;
    std::size_t head_ = 0;  // index of the oldest pending sample in storage_
    uint64_t windowsEmitted_ = 0;
    uint64_t samplesReceived_ = 0;
};

}  // namespace audio
}  // namespace spoofwatch
