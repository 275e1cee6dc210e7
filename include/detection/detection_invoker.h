#pragma once

#include "audio/window_buffer.h"
#include "core/error_codes.h"
#include "detection/classifier_backend.h"

#include <cstdint>
#include <string>
#include <vector>

namespace spoofwatch {
namespace detection {

// Normalized verdict for one window.
struct DetectionResult {
    std::string label;  // kLabelBonafide or kLabelSpoof
    float score = 0.0f;
    bool isSpoof = false;
    float bonafideScore = 0.0f;
    float spoofScore = 0.0f;
    std::vector<float> logits;
    double processingTimeMs = 0.0;
};

struct DetectionOutcome {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    DetectionResult result;

    bool ok() const {
        return code == ErrorCode::OK;
    }
};

// Identifies the window in log lines.
struct DetectionContext {
    std::string clientId;
    uint64_t windowIndex = 0;
};

// Stateless adapter from a window to a DetectionOutcome. Safe to share between
// connection threads as long as the backend is.
class DetectionInvoker {
   public:
    explicit DetectionInvoker(ClassifierBackend& backend) : backend_(backend) {}

    DetectionOutcome detect(const audio::AudioWindow& window,
                            const DetectionContext& context) const;

    bool isReady() const {
        return backend_.isReady();
    }
    const char* backendName() const {
        return backend_.name();
    }

   private:
    ClassifierBackend& backend_;
};

// Scale a window so its peak magnitude is 1.0 when it exceeds 1.0; otherwise unchanged.
// Returns true when the samples were rescaled.
bool peakNormalize(std::vector<float>& samples);

// Fill in missing distribution entries, clamp scores and derive isSpoof.
// Returns false with a reason when the output cannot be interpreted.
bool normalizeOutput(const ClassifierOutput& output, DetectionResult& result,
                     std::string& error);

}  // namespace detection
}  // namespace spoofwatch
