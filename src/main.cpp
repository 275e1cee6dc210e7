#include "core/config_loader.h"
#include "daemon/app/app_options.h"
#include "daemon/control/control_plane.h"
#include "daemon/metrics/status_report.h"
#include "detection/classifier_backend.h"
#include "detection/detection_invoker.h"
#include "logging/logger.h"
#include "network/status_http_server.h"
#include "network/stream_server.h"
#include "session/connection_registry.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace spoofwatch;

namespace {

std::atomic_bool* gStopFlag = nullptr;

void handleSignal(int) {
    if (gStopFlag) {
        gStopFlag->store(true, std::memory_order_relaxed);
    }
}

}  // namespace

int main(int argc, char** argv) {
    logging::initializeEarly();

    AppOptions options;
    bool showHelp = false;
    std::string optionError;
    if (!parseArgs(argc, argv, options, showHelp, optionError)) {
        if (!optionError.empty()) {
            std::cerr << optionError << std::endl;
        }
        return showHelp ? 0 : 1;
    }

    AppConfig config;
    if (!loadAppConfig(options.configPath, config)) {
        LOG_WARN("Config '{}' not loaded; using defaults", options.configPath);
    }
    if (!applyEnvOverrides(config, optionError)) {
        std::cerr << optionError << std::endl;
        return 1;
    }
    applyCliOverrides(options, config);

    std::string streamError;
    if (!validateStreamDefaults(config.stream, streamError)) {
        LOG_CRITICAL("Invalid stream configuration: {}", streamError);
        return 1;
    }

    logging::initialize(config.logging);

    LOG_INFO("[spoofwatchd] start");
    LOG_INFO("  - stream:  {}:{}", config.server.bindAddress, config.server.port);
    LOG_INFO("  - window:  chunk {}s, overlap {}s, min {}s @ {} Hz", config.stream.chunkDuration,
             config.stream.overlapDuration, config.stream.minDuration, config.stream.sampleRate);
    LOG_INFO("  - duplicate policy: {}", duplicatePolicyToString(config.duplicatePolicy));
    LOG_INFO("  - backend: {}", config.detection.backend);
    if (config.status.httpPort > 0) {
        LOG_INFO("  - HTTP status: {}:{}", config.status.httpBindAddress, config.status.httpPort);
    } else {
        LOG_INFO("  - HTTP status: disabled");
    }
    if (config.status.zmqEnabled) {
        LOG_INFO("  - ZeroMQ REP: {}", config.status.zmqEndpoint);
    } else {
        LOG_INFO("  - ZeroMQ API: disabled");
    }

    std::unique_ptr<detection::ClassifierBackend> backend =
        detection::createClassifierBackend(config.detection);
    if (config.detection.warmup) {
        std::string warmupError;
        if (!backend->warmup(warmupError)) {
            LOG_WARN("Backend '{}' warmup failed: {}", backend->name(), warmupError);
        }
    }
    if (!backend->isReady()) {
        LOG_WARN("Backend '{}' not ready ({}); detections will report MODEL_UNAVAILABLE",
                 backend->name(), backend->statusMessage());
    }

    detection::DetectionInvoker invoker(*backend);
    session::ConnectionRegistry registry(config.duplicatePolicy);

    metrics::Dependencies statusDeps;
    statusDeps.registry = &registry;
    statusDeps.invoker = &invoker;
    statusDeps.startedAt = std::chrono::steady_clock::now();

    std::unique_ptr<control::ControlPlane> controlPlane;
    if (config.status.zmqEnabled) {
        control::ControlPlaneDependencies controlDeps;
        controlDeps.registry = &registry;
        controlDeps.status = statusDeps;
        controlDeps.endpoint = config.status.zmqEndpoint;
        controlPlane = std::make_unique<control::ControlPlane>(controlDeps);
        if (!controlPlane->start()) {
            LOG_WARN("ZeroMQ control plane failed to start; continuing without it");
            controlPlane.reset();
        }
    }

    network::StreamServer streamServer(network::streamServerOptionsFromConfig(config), registry,
                                       invoker);
    if (controlPlane) {
        control::ControlPlane* plane = controlPlane.get();
        streamServer.setDetectionListener(
            [plane](const std::string& clientId, const detection::DetectionResult& result,
                    double timestamp) { plane->publishDetection(clientId, result, timestamp); });
    }

    std::unique_ptr<network::StatusHttpServer> httpServer;
    if (config.status.httpPort > 0) {
        httpServer = std::make_unique<network::StatusHttpServer>(
            config.status.httpBindAddress, config.status.httpPort, statusDeps);
        if (!httpServer->start()) {
            LOG_WARN("HTTP status server failed to start; continuing without it");
            httpServer.reset();
        }
    }

    std::atomic_bool stopRequested{false};
    gStopFlag = &stopRequested;

    struct sigaction sa {};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    if (!streamServer.start()) {
        LOG_CRITICAL("Failed to start stream server on port {}", config.server.port);
        if (httpServer) {
            httpServer->stop();
        }
        if (controlPlane) {
            controlPlane->stop();
        }
        logging::shutdown();
        return 1;
    }

    while (!stopRequested.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("[spoofwatchd] shutdown requested");
    std::size_t drained = registry.drain();
    streamServer.stop();
    LOG_INFO("[spoofwatchd] drained {} session(s), {} detection(s) total", drained,
             registry.totalDetections());

    if (httpServer) {
        httpServer->stop();
    }
    if (controlPlane) {
        controlPlane->stop();
    }
    gStopFlag = nullptr;

    LOG_INFO("[spoofwatchd] stopped");
    logging::shutdown();
    return 0;
}
