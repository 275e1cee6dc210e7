#include "detection/classifier_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <utility>

#ifdef SPOOFWATCH_ENABLE_ORT
#include <onnxruntime_cxx_api.h>
#endif

namespace spoofwatch {
namespace detection {
namespace {

[[maybe_unused]] constexpr uint32_t kWarmupSampleRate = 16000;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

class BypassClassifierBackend final : public ClassifierBackend {
   public:
    const char* name() const override {
        return "bypass";
    }

    bool isReady() const override {
        return true;
    }

    std::string statusMessage() const override {
        return {};
    }

    ClassifierOutput classify(const float* samples, std::size_t count,
                              uint32_t sampleRate) override {
        (void)sampleRate;
        if (samples == nullptr || count == 0) {
            throw std::invalid_argument("empty window");
        }
        ClassifierOutput output;
        output.label = kLabelBonafide;
        output.score = 1.0f;
        output.distribution = {{kLabelBonafide, 1.0f}, {kLabelSpoof, 0.0f}};
        return output;
    }
};

#ifdef SPOOFWATCH_ENABLE_ORT

Ort::Env& ortEnv() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "spoofwatch");
    return env;
}

struct ProviderSpec {
    const char* alias;
    const char* ortName;
};

constexpr ProviderSpec kProviders[] = {
    {"cpu", "CPUExecutionProvider"},
    {"cuda", "CUDAExecutionProvider"},
    {"tensorrt", "TensorrtExecutionProvider"},
    {"trt", "TensorrtExecutionProvider"},
};

const ProviderSpec* findProvider(const std::string& alias) {
    const std::string lower = toLower(alias);
    for (const auto& spec : kProviders) {
        if (lower == spec.alias) {
            return &spec;
        }
    }
    return nullptr;
}

bool providerCompiledIn(const char* ortName) {
    const std::vector<std::string> available = Ort::GetAvailableProviders();
    return std::find(available.begin(), available.end(), ortName) != available.end();
}

// Binary anti-spoofing model: input [1, N] float32 waveform, output [1, 2] logits.
class OrtClassifierBackend final : public ClassifierBackend {
   public:
    explicit OrtClassifierBackend(AppConfig::DetectionConfig config)
        : config_(std::move(config)),
          memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
        try {
            openSession();
        } catch (const Ort::Exception& e) {
            session_.reset();
            error_ = std::string("onnxruntime: ") + e.what();
        }
        ready_.store(session_ != nullptr, std::memory_order_release);
        if (session_) {
            LOG_INFO("Classifier: loaded {} ({} -> {}, provider {})", config_.ort.modelPath,
                     inputName_, outputName_, config_.ort.provider);
        }
    }

    const char* name() const override {
        return "ort";
    }

    bool isReady() const override {
        return ready_.load(std::memory_order_acquire);
    }

    std::string statusMessage() const override {
        std::lock_guard<std::mutex> lock(errorMutex_);
        return error_;
    }

    ClassifierOutput classify(const float* samples, std::size_t count,
                              uint32_t sampleRate) override {
        (void)sampleRate;
        if (samples == nullptr || count == 0) {
            throw std::invalid_argument("empty window");
        }
        if (!session_) {
            throw std::runtime_error(statusMessage());
        }

        const std::array<int64_t, 2> shape{1, static_cast<int64_t>(count)};
        // The tensor only views the samples; Run() does not write to its inputs.
        Ort::Value input = Ort::Value::CreateTensor<float>(
            memoryInfo_, const_cast<float*>(samples), count, shape.data(), shape.size());

        const char* inputNames[] = {inputName_.c_str()};
        const char* outputNames[] = {outputName_.c_str()};
        std::vector<Ort::Value> outputs =
            session_->Run(Ort::RunOptions{nullptr}, inputNames, &input, 1, outputNames, 1);
        if (outputs.size() != 1 || !outputs[0].IsTensor()) {
            throw std::runtime_error("model produced no logits tensor");
        }
        return fromLogits(outputs[0]);
    }

    bool warmup(std::string& error) override {
        if (!session_) {
            error = statusMessage();
            return false;
        }
        const std::vector<float> silence(kWarmupSampleRate, 0.0f);
        try {
            classify(silence.data(), silence.size(), kWarmupSampleRate);
            error.clear();
            return true;
        } catch (const std::exception& e) {
            // Ort::Exception derives from std::exception.
            error = std::string("warmup failed: ") + e.what();
        }
        {
            std::lock_guard<std::mutex> lock(errorMutex_);
            error_ = error;
        }
        ready_.store(false, std::memory_order_release);
        return false;
    }

   private:
    void openSession() {
        const std::string& modelPath = config_.ort.modelPath;
        if (modelPath.empty()) {
            error_ = "detection.ort.modelPath is empty";
            return;
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(modelPath, ec)) {
            error_ = "model not found: " + modelPath;
            return;
        }
        const ProviderSpec* provider = findProvider(config_.ort.provider);
        if (provider == nullptr) {
            error_ = "unsupported execution provider '" + config_.ort.provider + "'";
            return;
        }
        if (!providerCompiledIn(provider->ortName)) {
            error_ = std::string(provider->ortName) + " is not part of this onnxruntime build";
            return;
        }

        Ort::SessionOptions options;
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        if (config_.ort.intraOpThreads > 0) {
            options.SetIntraOpNumThreads(config_.ort.intraOpThreads);
        }
        const std::string ortName = provider->ortName;
        if (ortName == "CUDAExecutionProvider") {
            OrtCUDAProviderOptions cuda{};
            options.AppendExecutionProvider_CUDA(cuda);
        } else if (ortName == "TensorrtExecutionProvider") {
            OrtTensorRTProviderOptions trt{};
            options.AppendExecutionProvider_TensorRT(trt);
        }

        auto session = std::make_unique<Ort::Session>(ortEnv(), modelPath.c_str(), options);
        if (session->GetInputCount() < 1 || session->GetOutputCount() < 1) {
            error_ = "model needs one input and one output";
            return;
        }
        Ort::AllocatorWithDefaultOptions allocator;
        inputName_ = session->GetInputNameAllocated(0, allocator).get();
        outputName_ = session->GetOutputNameAllocated(0, allocator).get();
        session_ = std::move(session);
        error_.clear();
    }

    ClassifierOutput fromLogits(const Ort::Value& logits) const {
        const std::size_t n = logits.GetTensorTypeAndShapeInfo().GetElementCount();
        if (n != 2) {
            throw std::runtime_error("expected 2 logits, got " + std::to_string(n));
        }
        const float* raw = logits.GetTensorData<float>();
        const int spoof = config_.ort.spoofIndex;
        const float spoofLogit = raw[spoof];
        const float bonafideLogit = raw[1 - spoof];

        // Two-class softmax reduces to a logistic of the logit difference.
        const float pSpoof = 1.0f / (1.0f + std::exp(bonafideLogit - spoofLogit));

        ClassifierOutput output;
        output.logits.assign(raw, raw + n);
        output.distribution[kLabelBonafide] = 1.0f - pSpoof;
        output.distribution[kLabelSpoof] = pSpoof;
        const bool isSpoof = pSpoof >= config_.threshold;
        output.label = isSpoof ? kLabelSpoof : kLabelBonafide;
        output.score = isSpoof ? pSpoof : 1.0f - pSpoof;
        return output;
    }

    AppConfig::DetectionConfig config_;
    Ort::MemoryInfo memoryInfo_;
    std::unique_ptr<Ort::Session> session_;
    std::string inputName_;
    std::string outputName_;
    mutable std::mutex errorMutex_;
    std::string error_;
    std::atomic<bool> ready_{false};
};

#else  // SPOOFWATCH_ENABLE_ORT

class OrtClassifierBackend final : public ClassifierBackend {
   public:
    explicit OrtClassifierBackend(const AppConfig::DetectionConfig& config)
        : modelPath_(config.ort.modelPath) {}

    const char* name() const override {
        return "ort";
    }

    bool isReady() const override {
        return false;
    }

    std::string statusMessage() const override {
        return "ONNX Runtime backend is not enabled at build time (model: " +
               (modelPath_.empty() ? std::string("<none>") : modelPath_) + ")";
    }

    ClassifierOutput classify(const float* samples, std::size_t count,
                              uint32_t sampleRate) override {
        (void)samples;
        (void)count;
        (void)sampleRate;
        throw std::runtime_error(statusMessage());
    }

    bool warmup(std::string& error) override {
        error = statusMessage();
        return false;
    }

   private:
    std::string modelPath_;
};

#endif  // SPOOFWATCH_ENABLE_ORT

}  // namespace

std::unique_ptr<ClassifierBackend> createClassifierBackend(
    const AppConfig::DetectionConfig& config) {
    std::string backend = normalizeBackendName(config.backend);

    if (backend == "ort") {
        return std::make_unique<OrtClassifierBackend>(config);
    }
    if (toLower(config.backend) != "bypass") {
        LOG_WARN("Classifier: Unknown backend '{}' (falling back to bypass)", config.backend);
    }
    return std::make_unique<BypassClassifierBackend>();
}

}  // namespace detection
}  // namespace spoofwatch
