#pragma once

#include "daemon/api/events.h"
#include "daemon/control/zmq_server.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace zonelink::discovery {
class DeviceRegistry;
class DiscoveryOrchestrator;
}  // namespace zonelink::discovery

namespace zonelink::control {

struct ControlPlaneDependencies {
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    discovery::DiscoveryOrchestrator* orchestrator = nullptr;
    const discovery::DeviceRegistry* registry = nullptr;
    // Must not publish once the control plane is destroyed.
    api::EventDispatcher* dispatcher = nullptr;

    std::atomic<bool>* runningFlag = nullptr;
    std::atomic<bool>* reloadRequested = nullptr;
    std::atomic<bool>* zmqBindFailed = nullptr;

    std::function<void()> quitMainLoop;
};

/**
 * @brief Query commands on the REP socket and discovery events on the PUB socket.
 *
 * Commands: PING, DEVICES, DEVICE, ZONES, ZONE, STATUS, RESCAN, RELOAD.
 * Events: {"type": ..., "timestamp": <epoch ms>, "data": {...}}.
 */
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    // False on bind failure; the running flag is cleared so the daemon exits.
    bool start();
    void stop();

    const std::string& pubEndpoint() const;
    uint64_t eventsPublished() const {
        return eventsPublished_.load(std::memory_order_relaxed);
    }

    // Routes a request through the registered handlers without the socket.
    std::string handle(const std::string& raw);

    static nlohmann::json buildEvent(const std::string& type, const nlohmann::json& data);
    static std::string buildOkResponse(const ipc::ZmqRequest& request,
                                       const nlohmann::json& data = {},
                                       const std::string& message = "");

   private:
    void registerHandlers();
    void subscribeEvents();
    void publish(const nlohmann::json& event);

    std::string handlePing(const ipc::ZmqRequest& request);
    std::string handleDevices(const ipc::ZmqRequest& request);
    std::string handleDevice(const ipc::ZmqRequest& request);
    std::string handleZones(const ipc::ZmqRequest& request);
    std::string handleZone(const ipc::ZmqRequest& request);
    std::string handleStatus(const ipc::ZmqRequest& request);
    std::string handleRescan(const ipc::ZmqRequest& request);
    std::string handleReload(const ipc::ZmqRequest& request);

    discovery::DiscoveryOrchestrator& orchestrator();

    ControlPlaneDependencies deps_;
    std::unique_ptr<ipc::ZmqCommandServer> zmqServer_;
    std::atomic<bool> publishing_{false};
    std::atomic<uint64_t> eventsPublished_{0};
};

}  // namespace zonelink::control
