#include "network/stream_server.h"

#include "logging/logger.h"
#include "network/socket_utils.h"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <new>
#include <stdexcept>
#include <string_view>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace spoofwatch {
namespace network {

namespace {

constexpr std::size_t kRecvChunkBytes = 64 * 1024;

}  // namespace

StreamServerOptions streamServerOptionsFromConfig(const AppConfig& config) {
    StreamServerOptions options;
    options.bindAddress = config.server.bindAddress;
    options.port = config.server.port;
    options.backlog = config.server.backlog;
    options.maxMessageBytes = config.server.maxMessageBytes;
    options.pollIntervalMs = config.server.pollIntervalMs;
    options.stream = config.stream;
    return options;
}

void StreamServer::Connection::shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void StreamServer::Connection::closeSocket() {
    std::lock_guard<std::mutex> lock(mutex);
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

StreamServer::StreamServer(StreamServerOptions options, session::ConnectionRegistry& registry,
                           const detection::DetectionInvoker& invoker)
    : options_(std::move(options)), registry_(registry), invoker_(invoker) {}

StreamServer::~StreamServer() {
    stop();
}

void StreamServer::setDetectionListener(session::DetectionListener listener) {
    detectionListener_ = std::move(listener);
}

bool StreamServer::start() {
    if (running_.load(std::memory_order_acquire)) {
        return true;
    }

    ListenResult listener =
        openListener(options_.bindAddress, options_.port, options_.backlog);
    if (!listener.ok()) {
        LOG_ERROR("Stream: {}", listener.error);
        return false;
    }
    listenFd_ = listener.fd;
    boundPort_ = listener.boundPort;

    running_.store(true, std::memory_order_release);
    try {
        acceptThread_ = std::thread([this]() { acceptLoop(); });
    } catch (const std::system_error& e) {
        LOG_ERROR("Stream: failed to start accept thread: {}", e.what());
        running_.store(false, std::memory_order_release);
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    LOG_INFO("Stream: listening on {}:{} (backlog={}, maxMessageBytes={})", options_.bindAddress,
             boundPort_, options_.backlog, options_.maxMessageBytes);
    return true;
}

void StreamServer::stop() {
    const bool wasRunning = running_.exchange(false, std::memory_order_acq_rel);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::list<std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        remaining.swap(connections_);
    }
    for (const auto& connection : remaining) {
        connection->shutdown();
    }
    for (const auto& connection : remaining) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }

    if (wasRunning) {
        LOG_INFO("Stream: stopped ({} connection(s) closed)", remaining.size());
    }
}

std::size_t StreamServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    std::size_t count = 0;
    for (const auto& connection : connections_) {
        if (!connection->finished.load(std::memory_order_acquire)) {
            ++count;
        }
    }
    return count;
}

void StreamServer::acceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
        int ready = waitReadable(listenFd_, options_.pollIntervalMs);
        reapFinished();
        if (ready <= 0) {
            continue;
        }

        struct sockaddr_storage addr {};
        socklen_t addrlen = sizeof(addr);
        int fd = ::accept(listenFd_, reinterpret_cast<struct sockaddr*>(&addr), &addrlen);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR &&
                errno != ECONNABORTED) {
                LOG_WARN("Stream: accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        int enable = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) < 0) {
            LOG_DEBUG("Stream: setsockopt(SO_KEEPALIVE) failed: {}", std::strerror(errno));
        }

        auto connection = std::make_shared<Connection>();
        connection->fd = fd;
        connection->peer = addressString(addr, addrlen);
        LOG_DEBUG("Stream: connection from {}", connection->peer);

        std::lock_guard<std::mutex> lock(connectionsMutex_);
        try {
            connection->worker = std::thread([this, connection]() { serveConnection(connection); });
        } catch (const std::system_error& e) {
            LOG_ERROR("Stream: cannot start worker for {}: {}", connection->peer, e.what());
            connection->closeSocket();
            continue;
        }
        connections_.push_back(std::move(connection));
    }
}

void StreamServer::serveConnection(const std::shared_ptr<Connection>& connection) {
    const int fd = connection->fd;

    session::SessionTransport transport;
    transport.peer = connection->peer;
    transport.send = [fd](const std::string& line) {
        std::string framed;
        framed.reserve(line.size() + 1);
        framed.append(line);
        framed.push_back('\n');
        return sendAll(fd, framed.data(), framed.size());
    };
    std::weak_ptr<Connection> weak = connection;
    transport.shutdown = [weak]() {
        if (auto c = weak.lock()) {
            c->shutdown();
        }
    };

    std::shared_ptr<session::ConnectionSession> session;
    try {
        session = std::make_shared<session::ConnectionSession>(registry_, invoker_,
                                                               options_.stream,
                                                               std::move(transport));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Stream: cannot create session for {}: {}", connection->peer, e.what());
        connection->closeSocket();
        connection->finished.store(true, std::memory_order_release);
        return;
    }
    if (detectionListener_) {
        session->setDetectionListener(detectionListener_);
    }

    std::vector<char> chunk(kRecvChunkBytes);
    std::string pending;
    std::size_t scanFrom = 0;
    bool open = true;

    while (open && running_.load(std::memory_order_acquire)) {
        if (session->cancelled()) {
            break;
        }
        int ready = waitReadable(fd, options_.pollIntervalMs);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            session->failTransport(std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
        if (n == 0) {
            LOG_DEBUG("Stream: {} closed the connection", connection->peer);
            break;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LOG_WARN("Stream: recv from {} failed: {}", connection->peer, std::strerror(errno));
            break;
        }
        pending.append(chunk.data(), static_cast<std::size_t>(n));

        std::size_t lineStart = 0;
        std::size_t newline;
        while ((newline = pending.find('\n', scanFrom)) != std::string::npos) {
            std::string_view line(pending.data() + lineStart, newline - lineStart);
            lineStart = newline + 1;
            scanFrom = lineStart;
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (line.size() > options_.maxMessageBytes) {
                session->failTransport("Message exceeds " +
                                       std::to_string(options_.maxMessageBytes) + " bytes");
                open = false;
                break;
            }
            if (line.empty()) {
                continue;
            }
            bool keep = false;
            try {
                keep = session->handleLine(line);
            } catch (const std::bad_alloc&) {
                // Only this connection is dropped; the daemon keeps serving the others.
                LOG_ERROR("Stream: out of memory while handling a message from {}",
                          connection->peer);
                session->failTransport("Out of memory while handling message");
            }
            if (!keep) {
                open = false;
                break;
            }
        }
        if (!open) {
            break;
        }
        pending.erase(0, lineStart);
        scanFrom = pending.size();
        if (pending.size() > options_.maxMessageBytes) {
            session->failTransport("Message exceeds " + std::to_string(options_.maxMessageBytes) +
                                   " bytes");
            break;
        }
    }

    session->close();
    connection->closeSocket();
    connection->finished.store(true, std::memory_order_release);
}

void StreamServer::reapFinished() {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->finished.load(std::memory_order_acquire)) {
            if ((*it)->worker.joinable()) {
                (*it)->worker.join();
            }
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace network
}  // namespace spoofwatch
