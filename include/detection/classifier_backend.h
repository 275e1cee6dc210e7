#pragma once

#include "core/config_loader.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spoofwatch {
namespace detection {

constexpr const char* kLabelBonafide = "bonafide";
constexpr const char* kLabelSpoof = "spoof";

// Raw backend verdict for one window, before normalization by the invoker.
struct ClassifierOutput {
    std::string label;
    float score = 0.0f;                        // confidence of `label`
    std::map<std::string, float> distribution;  // label -> probability
    std::vector<float> logits;                  // optional, empty when unavailable
};

// Audio classification capability.
//
// classify() is called from connection worker threads concurrently and must not keep
// per-call state in members. It may throw; the invoker turns exceptions into
// MODEL_INFERENCE_ERROR.
class ClassifierBackend {
   public:
    virtual ~ClassifierBackend() = default;

    virtual const char* name() const = 0;

    virtual bool isReady() const = 0;

    // Why the backend is not ready (empty when ready).
    virtual std::string statusMessage() const = 0;

    virtual ClassifierOutput classify(const float* samples, std::size_t count,
                                      uint32_t sampleRate) = 0;

    // One throwaway inference so the first client window does not pay initialization cost.
    virtual bool warmup(std::string& error) {
        (void)error;
        return true;
    }
};

std::unique_ptr<ClassifierBackend> createClassifierBackend(
    const AppConfig::DetectionConfig& config);

}  // namespace detection
}  // namespace spoofwatch
