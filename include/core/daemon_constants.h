#ifndef NEEDLEDROP_DAEMON_CONSTANTS_H
#define NEEDLEDROP_DAEMON_CONSTANTS_H

// Constants shared by the daemon, its sidecar clients and the control plane

namespace needledrop {
namespace DaemonConstants {

constexpr const char* VERSION = "0.3.0";
constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// Control plane (REP) and event stream (PUB, derived from the REP endpoint)
constexpr const char* CONTROL_IPC_PATH = "ipc:///tmp/needledrop.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

// Sidecars
constexpr const char* RECOGNIZER_IPC_PATH = "ipc:///tmp/needledrop-recognizer.sock";
constexpr const char* SCROBBLER_IPC_PATH = "ipc:///tmp/needledrop-scrobbler.sock";

// Slice length when polling a sidecar reply, bounds cancellation latency
constexpr int IPC_POLL_SLICE_MS = 100;

// Consecutive misses before the aggressive fallback runs
constexpr int NO_MATCH_STREAK_FOR_FALLBACK = 3;

// Grace period for listener queues to drain on shutdown
constexpr int LISTENER_DRAIN_TIMEOUT_MS = 2000;

}  // namespace DaemonConstants
}  // namespace needledrop

#endif  // NEEDLEDROP_DAEMON_CONSTANTS_H
