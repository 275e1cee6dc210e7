#ifndef SPOOFWATCH_DAEMON_CONSTANTS_H
#define SPOOFWATCH_DAEMON_CONSTANTS_H

// Constants shared across daemon components

namespace spoofwatch {
namespace DaemonConstants {

// Network defaults
constexpr int DEFAULT_STREAM_PORT = 8765;
constexpr int DEFAULT_HTTP_PORT = 8766;

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/spoofwatch.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

// REP poll interval; bounds how long stop() waits for the server thread
constexpr int ZEROMQ_POLL_TIMEOUT_MS = 100;

}  // namespace DaemonConstants
}  // namespace spoofwatch

#endif  // SPOOFWATCH_DAEMON_CONSTANTS_H
