#ifndef ZONELINK_CONFIG_LOADER_H
#define ZONELINK_CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace zonelink {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct DiscoveryConfig {
        std::string searchTarget = DaemonConstants::ZONE_PLAYER_URN;
        std::string multicastAddress = DaemonConstants::SSDP_MULTICAST_ADDRESS;
        uint16_t port = DaemonConstants::SSDP_PORT;
        int mx = DaemonConstants::SSDP_MX_SECONDS;
        int searchIntervalSec = DaemonConstants::DEFAULT_SEARCH_INTERVAL_SEC;
        std::string bindAddress;  // empty = INADDR_ANY
        int staleAfterCycles = DaemonConstants::DEFAULT_STALE_AFTER_CYCLES;
        int onboardingWorkers = DaemonConstants::DEFAULT_ONBOARDING_WORKERS;
        size_t onboardingQueueCapacity = DaemonConstants::DEFAULT_ONBOARDING_QUEUE_CAPACITY;
    } discovery;

    struct EventsConfig {
        std::string callbackHost;  // empty = pick the interface facing the devices
        uint16_t callbackPort = 0;  // 0 = ephemeral
        int requestedTimeoutSec = DaemonConstants::DEFAULT_SUBSCRIPTION_TIMEOUT_SEC;
        size_t dispatchQueueCapacity = DaemonConstants::DEFAULT_DISPATCH_QUEUE_CAPACITY;
        std::vector<std::string> deviceServices = {"MediaRenderer/AVTransport",
                                                   "MediaRenderer/RenderingControl"};
        bool unsubscribeOnStop = false;
    } events;

    struct HttpConfig {
        int timeoutMs = DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS;
    } http;

    struct ZeroMqConfig {
        std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    } zeromq;

    logging::LogConfig logging;
};

// Load JSON config into outConfig. Missing or malformed files leave defaults and return false.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

/**
 * @brief Apply ZONELINK_* environment overrides on top of a loaded config.
 *
 * @param error Set to a description of the first invalid variable
 * @return false if a variable could not be parsed
 */
bool applyEnvironmentOverrides(AppConfig& config, std::string& error);

}  // namespace zonelink

#endif  // ZONELINK_CONFIG_LOADER_H
