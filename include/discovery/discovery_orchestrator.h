#ifndef ZONELINK_DISCOVERY_DISCOVERY_ORCHESTRATOR_H
#define ZONELINK_DISCOVERY_DISCOVERY_ORCHESTRATOR_H

#include "core/config_loader.h"
#include "daemon/api/events.h"
#include "discovery/device_registry.h"
#include "discovery/topology_manager.h"
#include "discovery/work_queue.h"
#include "net/http_client.h"
#include "net/soap_client.h"
#include "upnp/descriptor_resolver.h"
#include "upnp/event_subscriber.h"
#include "upnp/ssdp_prober.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace zonelink {
namespace discovery {

struct OrchestratorConfig {
    upnp::SsdpConfig ssdp;
    upnp::EventSubscriberConfig events;
    int searchIntervalSec = DaemonConstants::DEFAULT_SEARCH_INTERVAL_SEC;
    int onboardingWorkers = DaemonConstants::DEFAULT_ONBOARDING_WORKERS;
    size_t onboardingQueueCapacity = DaemonConstants::DEFAULT_ONBOARDING_QUEUE_CAPACITY;
    size_t dispatchQueueCapacity = DaemonConstants::DEFAULT_DISPATCH_QUEUE_CAPACITY;
    int httpTimeoutMs = DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS;
    std::vector<std::string> deviceServices;

    static OrchestratorConfig fromAppConfig(const AppConfig& config);
};

/**
 * @brief Collaborators owned by the application and shared with the orchestrator.
 */
struct OrchestratorDependencies {
    DeviceRegistry& registry;
    net::HttpTransport& transport;
    api::EventDispatcher* dispatcher = nullptr;  // optional
};

/**
 * @brief Runs SSDP search, per-device onboarding and the topology dispatch loop.
 *
 * Threads:
 * - SSDP listener (SsdpProber) and GENA listener/renewer (EventSubscriber)
 * - onboarding workers fed by a bounded queue of descriptor locations
 * - one dispatch loop that applies topology documents in arrival order
 * - the periodic search timer
 *
 * An instance is started once; a reload builds a new one.
 */
class DiscoveryOrchestrator {
   public:
    DiscoveryOrchestrator(OrchestratorConfig config, OrchestratorDependencies deps);
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief Start the GENA listener, the workers, the SSDP socket, then search.
     *
     * @throws DiscoverySocketError if the SSDP socket or the GENA listener cannot be bound
     */
    void start();

    // Cancels the search timer, closes sockets and drains the queues.
    void stop();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Ask the search thread for an immediate M-SEARCH. False when not running.
    bool rescan();

    // SsdpProber callback; also the entry point for topology-discovered members.
    void handleSearchResponse(const upnp::SsdpResponse& response);

    /**
     * @brief Onboard one device synchronously (workers call this).
     *
     * @return the registration, or nullopt when the descriptor could not be
     *         fetched or parsed
     */
    std::optional<Registration> onboard(const std::string& location);

    nlohmann::json buildDevicesJson() const;
    std::optional<nlohmann::json> buildDeviceJson(const std::string& idOrRoom) const;
    nlohmann::json buildZonesJson() const;
    std::optional<nlohmann::json> buildZoneJson(const std::string& room) const;
    nlohmann::json buildStatusJson() const;

    TopologySnapshotPtr topologySnapshot() const {
        return topology_.snapshot();
    }
    const upnp::EventSubscriber& subscriber() const {
        return *subscriber_;
    }
    uint16_t ssdpPort() const {
        return prober_->localPort();
    }

   private:
    enum class DispatchKind { Notification, Seed, Refresh };

    struct DispatchItem {
        DispatchKind kind = DispatchKind::Notification;
        std::string deviceId;
        std::string service;
        std::string body;
        std::chrono::system_clock::time_point receivedAt;
    };

    bool enqueueOnboarding(const std::string& location);
    bool enqueueDispatch(DispatchItem item);
    void onboardingWorker();
    void dispatchLoop();
    void processDispatchItem(DispatchItem& item);
    void searchLoop();
    void performSearch();
    void closeSearchCycle();
    void subscribeTopology(const DevicePtr& device);
    void subscribeDeviceServices(const DevicePtr& device);
    void publishDevice(api::DeviceChange change, const DevicePtr& device);
    nlohmann::json topologyInfo(const Device& device, const TopologySnapshot& snapshot) const;
    std::string callbackBaseUrl() const;

    OrchestratorConfig config_;
    DeviceRegistry& registry_;
    net::HttpTransport& transport_;
    api::EventDispatcher* dispatcher_;

    upnp::DescriptorResolver resolver_;
    net::SoapClient soap_;
    TopologyManager topology_;
    std::unique_ptr<upnp::EventSubscriber> subscriber_;
    std::unique_ptr<upnp::SsdpProber> prober_;

    BoundedWorkQueue<std::string> onboardingQueue_;
    BoundedWorkQueue<DispatchItem> dispatchQueue_;
    mutable std::mutex inFlightMutex_;
    std::set<std::string> inFlight_;

    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    mutable std::mutex searchMutex_;
    std::condition_variable searchCv_;
    bool rescanRequested_ = false;
    std::chrono::system_clock::time_point lastSearch_{};

    std::vector<std::thread> workers_;
    std::thread dispatchThread_;
    std::thread searchThread_;

    std::atomic<uint64_t> descriptorFailures_{0};
    std::atomic<uint64_t> onboardingCoalesced_{0};
    std::atomic<uint64_t> onboardingRejected_{0};
    std::atomic<uint64_t> notificationsDropped_{0};
    std::atomic<uint64_t> topologyErrors_{0};
    std::atomic<uint64_t> subscribeFailures_{0};
};

}  // namespace discovery
}  // namespace zonelink

#endif  // ZONELINK_DISCOVERY_DISCOVERY_ORCHESTRATOR_H
