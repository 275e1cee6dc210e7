#include "network/status_http_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "network/socket_utils.h"
#include "session/protocol.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace spoofwatch {
namespace network {

namespace {

constexpr int kAcceptPollMs = 200;
constexpr int kRequestTimeoutMs = 2000;
constexpr std::size_t kMaxRequestBytes = 8 * 1024;

HttpResponse errorResponse(ErrorCode code, const std::string& message) {
    nlohmann::json body = {{"error", message},
                           {"error_code", errorCodeToString(code)},
                           {"category", getErrorCategory(code)},
                           {"timestamp", session::nowSeconds()}};
    return {toHttpStatus(code), body.dump()};
}

// Read until the end of the request head; the body (if any) is ignored.
bool readRequestHead(int fd, std::string& head) {
    char buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos && head.find("\n\n") == std::string::npos) {
        if (head.size() > kMaxRequestBytes) {
            return false;
        }
        if (waitReadable(fd, kRequestTimeoutMs) <= 0) {
            return false;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            return !head.empty();
        }
        head.append(buf, static_cast<std::size_t>(n));
    }
    return true;
}

}  // namespace

const char* httpReasonPhrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 503:
        return "Service Unavailable";
    default:
        return "Internal Server Error";
    }
}

StatusHttpServer::StatusHttpServer(std::string bindAddress, int port, metrics::Dependencies deps)
    : bindAddress_(std::move(bindAddress)), port_(port), deps_(deps) {}

StatusHttpServer::~StatusHttpServer() {
    stop();
}

bool StatusHttpServer::start() {
    if (running_.load(std::memory_order_acquire)) {
        return true;
    }
    ListenResult listener = openListener(bindAddress_, port_, 4);
    if (!listener.ok()) {
        LOG_WARN("[StatusHttpServer] {}", listener.error);
        return false;
    }
    fd_ = listener.fd;
    boundPort_ = listener.boundPort;

    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this]() { serveLoop(); });
    LOG_INFO("[StatusHttpServer] listening on {}:{}", bindAddress_, boundPort_);
    return true;
}

void StatusHttpServer::stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
        worker_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

HttpResponse StatusHttpServer::handleRequest(const std::string& method,
                                             const std::string& target) const {
    std::string path = target.substr(0, target.find('?'));
    const bool known = path == "/health" || path == "/stats";
    if (!known) {
        return errorResponse(ErrorCode::IPC_UNKNOWN_ROUTE, "Not found: " + path);
    }
    if (method != "GET") {
        return errorResponse(ErrorCode::IPC_METHOD_NOT_ALLOWED,
                             "Method " + method + " not allowed");
    }
    if (path == "/health") {
        return {metrics::isHealthy(deps_) ? 200 : 503, metrics::buildHealthJson(deps_).dump()};
    }
    return {200, metrics::buildStatsJson(deps_).dump(-1, ' ', false,
                                                     nlohmann::json::error_handler_t::replace)};
}

void StatusHttpServer::serveLoop() {
    while (running_.load(std::memory_order_acquire)) {
        if (waitReadable(fd_, kAcceptPollMs) <= 0) {
            continue;
        }
        int cfd = ::accept(fd_, nullptr, nullptr);
        if (cfd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("[StatusHttpServer] accept failed: {}", std::strerror(errno));
            }
            continue;
        }
        serveClient(cfd);
        ::close(cfd);
    }
}

void StatusHttpServer::serveClient(int fd) const {
    std::string head;
    HttpResponse response;
    if (!readRequestHead(fd, head)) {
        response = errorResponse(ErrorCode::IPC_MALFORMED_REQUEST, "Malformed request");
    } else {
        std::istringstream line(head.substr(0, head.find_first_of("\r\n")));
        std::string method;
        std::string target;
        line >> method >> target;
        if (method.empty() || target.empty()) {
            response = errorResponse(ErrorCode::IPC_MALFORMED_REQUEST, "Malformed request");
        } else {
            response = handleRequest(method, target);
            LOG_DEBUG("[StatusHttpServer] {} {} -> {}", method, target, response.status);
        }
    }

    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << httpReasonPhrase(response.status) << "\r\n";
    oss << "Content-Type: application/json\r\n";
    oss << "Content-Length: " << response.body.size() << "\r\n";
    if (response.status == 405) {
        oss << "Allow: GET\r\n";
    }
    oss << "Connection: close\r\n\r\n";
    oss << response.body;
    const std::string raw = oss.str();
    if (!sendAll(fd, raw.data(), raw.size())) {
        LOG_DEBUG("[StatusHttpServer] client went away before the response was sent");
    }
}

}  // namespace network
}  // namespace spoofwatch
