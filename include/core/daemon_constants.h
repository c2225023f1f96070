#ifndef ZONELINK_DAEMON_CONSTANTS_H
#define ZONELINK_DAEMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

// Protocol constants and defaults shared across daemon components

namespace DaemonConstants {

// SSDP
constexpr const char* SSDP_MULTICAST_ADDRESS = "239.255.255.250";
constexpr uint16_t SSDP_PORT = 1900;
constexpr int SSDP_MX_SECONDS = 3;
constexpr const char* ZONE_PLAYER_URN = "urn:schemas-upnp-org:device:ZonePlayer:1";
constexpr int DEFAULT_SEARCH_INTERVAL_SEC = 30;
constexpr size_t SSDP_MAX_DATAGRAM_BYTES = 8192;

// Devices whose descriptor carries this model string never host the topology service
constexpr const char* PLACEHOLDER_MODEL_NAME = "Unknown";
constexpr int DEFAULT_STALE_AFTER_CYCLES = 3;

// GENA
constexpr const char* TOPOLOGY_SERVICE = "ZoneGroupTopology";
constexpr const char* TOPOLOGY_SERVICE_TYPE = "urn:schemas-upnp-org:service:ZoneGroupTopology:1";
constexpr const char* TOPOLOGY_CONTROL_PATH = "/ZoneGroupTopology/Control";
constexpr int DEFAULT_SUBSCRIPTION_TIMEOUT_SEC = 1800;
constexpr int MIN_RENEWAL_DELAY_SEC = 1;
constexpr int DEFAULT_SUBSCRIBE_RETRY_SEC = 30;
constexpr size_t DEFAULT_GENA_WORKERS = 4;
constexpr const char* NOTIFY_PATH_PREFIX = "/notify/";
constexpr size_t MAX_NOTIFY_BODY_BYTES = 1024 * 1024;

// HTTP
constexpr int DEFAULT_HTTP_TIMEOUT_MS = 5000;
constexpr const char* USER_AGENT = "Linux UPnP/1.0 zonelink/1.0";

// Work queues
constexpr size_t DEFAULT_ONBOARDING_QUEUE_CAPACITY = 64;
constexpr size_t DEFAULT_DISPATCH_QUEUE_CAPACITY = 256;
constexpr int DEFAULT_ONBOARDING_WORKERS = 4;

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/zonelink.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

// Process
constexpr const char* PID_FILE_PATH = "/tmp/zonelink.pid";
constexpr int MAIN_LOOP_INTERVAL_MS = 100;

}  // namespace DaemonConstants

#endif  // ZONELINK_DAEMON_CONSTANTS_H
