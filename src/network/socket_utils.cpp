#include "network/socket_utils.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace spoofwatch {
namespace network {

namespace {

uint16_t localPort(int fd) {
    struct sockaddr_storage local {};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return 0;
    }
    if (local.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    }
    if (local.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
    }
    return 0;
}

}  // namespace

ListenResult openListener(const std::string& bindAddress, int port, int backlog) {
    ListenResult result;

    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* res = nullptr;
    const std::string portStr = std::to_string(port);
    const char* host = bindAddress.empty() ? nullptr : bindAddress.c_str();
    int gai = ::getaddrinfo(host, portStr.c_str(), &hints, &res);
    if (gai != 0) {
        result.error = std::string("getaddrinfo failed: ") + gai_strerror(gai);
        return result;
    }

    int fd = -1;
    for (auto* p = res; p != nullptr; p = p->ai_next) {
        fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            continue;
        }
        int enable = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
            ::close(fd);
            fd = -1;
            continue;
        }
        if (::bind(fd, p->ai_addr, p->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        result.error = "bind failed for " + (bindAddress.empty() ? "*" : bindAddress) + ":" +
                       portStr + " (" + std::strerror(errno) + ")";
        return result;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    if (::listen(fd, backlog > 0 ? backlog : 4) < 0) {
        result.error = std::string("listen: ") + std::strerror(errno);
        ::close(fd);
        return result;
    }

    result.fd = fd;
    result.boundPort = localPort(fd);
    return result;
}

std::string addressString(const struct sockaddr_storage& addr, socklen_t len) {
    char host[NI_MAXHOST] = {0};
    char service[NI_MAXSERV] = {0};
    if (::getnameinfo(reinterpret_cast<const struct sockaddr*>(&addr), len, host, sizeof(host),
                      service, sizeof(service), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "<unknown>";
    }
    return std::string(host) + ":" + service;
}

bool sendAll(int fd, const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::send(fd, data + offset, size - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

int waitReadable(int fd, int timeoutMs) {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0) {
        return 0;
    }
    return 1;
}

}  // namespace network
}  // namespace spoofwatch
