#pragma once

#include "core/config_loader.h"
#include "daemon/api/events.h"
#include "discovery/device_registry.h"

#include <atomic>
#include <cstdint>
#include <memory>

namespace zonelink::net {
class HttpTransport;
}  // namespace zonelink::net

namespace zonelink::discovery {
class DiscoveryOrchestrator;
}  // namespace zonelink::discovery

namespace zonelink::control {
class ControlPlane;
}  // namespace zonelink::control

namespace zonelink::app {

struct ControlFlags {
    std::atomic<bool> running{true};
    std::atomic<bool> reloadRequested{false};
    std::atomic<bool> zmqBindFailed{false};
};

/**
 * @brief Components of one run cycle. Rebuilt from scratch on every reload.
 *
 * Member order is teardown order in reverse: the control plane goes first,
 * the registry last.
 */
struct Components {
    std::unique_ptr<discovery::DeviceRegistry> registry;
    std::unique_ptr<net::HttpTransport> transport;
    std::unique_ptr<api::EventDispatcher> dispatcher;
    std::unique_ptr<discovery::DiscoveryOrchestrator> orchestrator;
    std::unique_ptr<control::ControlPlane> controlPlane;

    Components();
    ~Components();

    Components(const Components&) = delete;
    Components& operator=(const Components&) = delete;
};

struct RuntimeState {
    AppConfig config;
    ControlFlags flags;
    Components components;
    uint64_t reloadCount = 0;
};

}  // namespace zonelink::app
