#include "detection/detection_invoker.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <optional>

namespace spoofwatch {
namespace detection {

namespace {

float clamp01(float value) {
    return std::min(1.0f, std::max(0.0f, value));
}

// Canonical label or empty when the backend used a name we do not understand.
std::string canonicalLabel(const std::string& label) {
    std::string lower(label);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == kLabelBonafide || lower == "real" || lower == "genuine") {
        return kLabelBonafide;
    }
    if (lower == kLabelSpoof || lower == "fake" || lower == "synthetic") {
        return kLabelSpoof;
    }
    return {};
}

}  // namespace

bool peakNormalize(std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::fabs(s));
    }
    if (peak <= 1.0f) {
        return false;
    }
    const float scale = 1.0f / peak;
    for (float& s : samples) {
        s *= scale;
    }
    return true;
}

bool normalizeOutput(const ClassifierOutput& output, DetectionResult& result,
                     std::string& error) {
    result.label = canonicalLabel(output.label);
    if (result.label.empty()) {
        error = "unrecognized label '" + output.label + "'";
        return false;
    }
    if (!std::isfinite(output.score)) {
        error = "non-finite score";
        return false;
    }
    if (output.distribution.empty()) {
        error = "empty score distribution";
        return false;
    }

    const bool isSpoof = result.label == kLabelSpoof;
    const float score = clamp01(output.score);

    std::optional<float> bonafide;
    std::optional<float> spoof;
    for (const auto& [name, value] : output.distribution) {
        if (!std::isfinite(value)) {
            error = "non-finite probability for '" + name + "'";
            return false;
        }
        std::string canonical = canonicalLabel(name);
        if (canonical == kLabelBonafide) {
            bonafide = clamp01(value);
        } else if (canonical == kLabelSpoof) {
            spoof = clamp01(value);
        }
    }
    // A missing side is derived from the score of the chosen label.
    if (!spoof) {
        spoof = isSpoof ? score : 1.0f - score;
    }
    if (!bonafide) {
        bonafide = isSpoof ? 1.0f - score : score;
    }

    result.score = score;
    result.isSpoof = isSpoof;
    result.bonafideScore = *bonafide;
    result.spoofScore = *spoof;
    result.logits = output.logits;
    return true;
}

DetectionOutcome DetectionInvoker::detect(const audio::AudioWindow& window,
                                          const DetectionContext& context) const {
    DetectionOutcome outcome;

    if (!backend_.isReady()) {
        outcome.code = ErrorCode::MODEL_UNAVAILABLE;
        std::string reason = backend_.statusMessage();
        outcome.message = "Model is not available";
        if (!reason.empty()) {
            outcome.message += ": " + reason;
        }
        LOG_WARN("[{}] window {} ({} samples) skipped: {}", context.clientId,
                 context.windowIndex, window.samples.size(), outcome.message);
        return outcome;
    }

    std::vector<float> samples = window.samples;
    if (peakNormalize(samples)) {
        LOG_DEBUG("[{}] window {} peak-normalized", context.clientId, context.windowIndex);
    }

    ClassifierOutput output;
    const auto start = std::chrono::steady_clock::now();
    try {
        output = backend_.classify(samples.data(), samples.size(), window.sampleRate);
    } catch (const std::exception& e) {
        outcome.code = ErrorCode::MODEL_INFERENCE_ERROR;
        outcome.message = std::string("Detection failed: ") + e.what();
        LOG_ERROR("[{}] {} backend failed on window {} ({} samples): {}", context.clientId,
                  backend_.name(), context.windowIndex, samples.size(), e.what());
        return outcome;
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    std::string error;
    if (!normalizeOutput(output, outcome.result, error)) {
        outcome.code = ErrorCode::MODEL_INFERENCE_ERROR;
        outcome.message = "Detection failed: malformed classifier output (" + error + ")";
        LOG_ERROR("[{}] {} backend returned malformed output for window {} ({} samples): {}",
                  context.clientId, backend_.name(), context.windowIndex, samples.size(), error);
        return outcome;
    }
    outcome.result.processingTimeMs =
        std::chrono::duration<double, std::milli>(elapsed).count();

    LOG_DEBUG("[{}] window {}: {} ({:.3f}) in {:.2f} ms", context.clientId, context.windowIndex,
              outcome.result.label, outcome.result.score, outcome.result.processingTimeMs);
    return outcome;
}

}  // namespace detection
}  // namespace spoofwatch
