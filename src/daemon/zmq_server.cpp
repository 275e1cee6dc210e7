#include "daemon/control/zmq_server.h"

#include "logging/logger.h"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <zmq.hpp>

namespace spoofwatch {
namespace control {
namespace {

constexpr const char* kIpcScheme = "ipc://";
constexpr const char* kTcpScheme = "tcp://";

bool hasScheme(const std::string& endpoint, const char* scheme) {
    return endpoint.compare(0, std::char_traits<char>::length(scheme), scheme) == 0;
}

// Stale socket files from a previous run make bind() fail.
void removeIpcFile(const std::string& endpoint) {
    if (!hasScheme(endpoint, kIpcScheme)) {
        return;
    }
    const std::string path = endpoint.substr(std::char_traits<char>::length(kIpcScheme));
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_DEBUG("ZeroMQ: could not remove {}: {}", path, ec.message());
    }
}

std::string dumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::string ControlRequest::stringParam(const std::string& key) const {
    if (!isJson) {
        return argument;
    }
    auto it = params.find(key);
    if (it != params.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

ControlServer::ControlServer(ControlServerOptions options)
    : options_(std::move(options)), pubEndpoint_(derivePubEndpoint(options_.endpoint)) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::on(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ControlServer::start() {
    if (isRunning()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);

        rep_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        rep_->set(zmq::sockopt::linger, 0);
        removeIpcFile(options_.endpoint);
        rep_->bind(options_.endpoint);

        pub_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pub_->set(zmq::sockopt::linger, 0);
        removeIpcFile(pubEndpoint_);
        pub_->bind(pubEndpoint_);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: cannot bind {} / {}: {}", options_.endpoint, pubEndpoint_, e.what());
        closeSockets();
        return false;
    }

    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&ControlServer::run, this);
    LOG_INFO("ZeroMQ: REP {} | PUB {}", options_.endpoint, pubEndpoint_);
    return true;
}

void ControlServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    // The server thread notices within one poll timeout.
    if (thread_.joinable()) {
        thread_.join();
    }
    closeSockets();
    removeIpcFile(options_.endpoint);
    removeIpcFile(pubEndpoint_);
    LOG_DEBUG("ZeroMQ: stopped");
}

bool ControlServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pub_) {
        return false;
    }
    try {
        return pub_->send(zmq::buffer(message), zmq::send_flags::dontwait).has_value();
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 100, "ZeroMQ: publish failed: {}", e.what());
        return false;
    }
}

ControlRequest ControlServer::parseRequest(const std::string& raw) {
    ControlRequest request;
    request.raw = raw;
    // Some clients send C strings including the terminator.
    const std::string text = raw.substr(0, raw.find('\0'));

    if (!text.empty() && text.front() == '{') {
        request.isJson = true;
        nlohmann::json body = nlohmann::json::parse(text, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            request.parseError = "request is not a JSON object";
            return request;
        }
        auto cmd = body.find("cmd");
        if (cmd != body.end() && cmd->is_string()) {
            request.command = cmd->get<std::string>();
        }
        auto params = body.find("params");
        if (params != body.end() && params->is_object()) {
            request.params = *params;
        }
        return request;
    }

    const auto colon = text.find(':');
    request.command = text.substr(0, colon);
    if (colon != std::string::npos) {
        request.argument = text.substr(colon + 1);
    }
    return request;
}

std::string ControlServer::okReply(const ControlRequest& request, const std::string& message,
                                   const nlohmann::json& data) {
    if (!request.isJson) {
        if (!data.is_null()) {
            return "OK:" + dumpJson(data);
        }
        return message.empty() ? std::string("OK") : "OK:" + message;
    }
    nlohmann::json reply = {{"status", "ok"}};
    if (!message.empty()) {
        reply["message"] = message;
    }
    if (!data.is_null()) {
        reply["data"] = data;
    }
    return dumpJson(reply);
}

std::string ControlServer::errorReply(const ControlRequest& request, ErrorCode code,
                                      const std::string& message) {
    if (!request.isJson) {
        return "ERR:" + message;
    }
    nlohmann::json reply = {
        {"status", "error"}, {"error_code", errorCodeToString(code)}, {"message", message}};
    return dumpJson(reply);
}

std::string ControlServer::handle(const ControlRequest& request) const {
    if (!request.parseError.empty()) {
        return errorReply(request, ErrorCode::IPC_PROTOCOL_ERROR,
                          "JSON parse error: " + request.parseError);
    }
    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        return errorReply(request, ErrorCode::IPC_INVALID_COMMAND,
                          "Unknown command: " + request.command);
    }
    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: {} failed: {}", request.command, e.what());
        return errorReply(request, ErrorCode::IPC_PROTOCOL_ERROR,
                          std::string("Handler exception: ") + e.what());
    }
}

void ControlServer::run() {
    const auto timeout = std::chrono::milliseconds(options_.pollTimeoutMs);
    while (isRunning()) {
        try {
            zmq::pollitem_t items[] = {{rep_->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 1, timeout);
            if ((items[0].revents & ZMQ_POLLIN) == 0) {
                continue;
            }

            zmq::message_t message;
            if (!rep_->recv(message, zmq::recv_flags::dontwait)) {
                continue;
            }
            const std::string reply = handle(parseRequest(message.to_string()));
            rep_->send(zmq::buffer(reply), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (isRunning()) {
                LOG_WARN("ZeroMQ: REP loop error: {}", e.what());
            }
        }
    }
}

void ControlServer::closeSockets() {
    std::lock_guard<std::mutex> lock(pubMutex_);
    rep_.reset();
    pub_.reset();
    context_.reset();
}

std::string ControlServer::derivePubEndpoint(const std::string& endpoint) {
    const std::string suffixed = endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
    if (!hasScheme(endpoint, kTcpScheme)) {
        return suffixed;
    }
    const auto colon = endpoint.rfind(':');
    const std::string port = endpoint.substr(colon + 1);
    if (colon < std::char_traits<char>::length(kTcpScheme) || port.empty() ||
        port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) {
        return suffixed;
    }
    return endpoint.substr(0, colon + 1) + std::to_string(std::stoi(port) + 1);
}

}  // namespace control
}  // namespace spoofwatch
