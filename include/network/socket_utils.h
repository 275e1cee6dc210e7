#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace spoofwatch {
namespace network {

struct ListenResult {
    int fd = -1;
    uint16_t boundPort = 0;  // actual port (useful when port 0 was requested)
    std::string error;

    bool ok() const {
        return fd >= 0;
    }
};

// Bind + listen on bindAddress:port (empty address = all interfaces). The socket is
// non-blocking so accept loops can poll for shutdown.
ListenResult openListener(const std::string& bindAddress, int port, int backlog);

// "host:port" of a peer, "<unknown>" when it cannot be resolved numerically.
std::string addressString(const struct sockaddr_storage& addr, socklen_t len);

// Write the whole buffer; retries on EINTR and never raises SIGPIPE.
bool sendAll(int fd, const char* data, std::size_t size);

// Wait up to timeoutMs for fd to become readable. 1 = readable, 0 = timeout, -1 = error.
int waitReadable(int fd, int timeoutMs);

}  // namespace network
}  // namespace spoofwatch
