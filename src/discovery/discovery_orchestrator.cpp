#include "discovery/discovery_orchestrator.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/network_utils.h"

#include <algorithm>

namespace zonelink {
namespace discovery {

namespace {

constexpr auto kQueuePollInterval = std::chrono::milliseconds(200);
constexpr auto kSeedEnqueueTimeout = std::chrono::seconds(2);

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

OrchestratorConfig OrchestratorConfig::fromAppConfig(const AppConfig& config) {
    OrchestratorConfig out;
    out.ssdp.searchTarget = config.discovery.searchTarget;
    out.ssdp.multicastAddress = config.discovery.multicastAddress;
    out.ssdp.port = config.discovery.port;
    out.ssdp.mx = config.discovery.mx;
    out.ssdp.bindAddress = config.discovery.bindAddress;
    out.events.callbackHost = config.events.callbackHost;
    out.events.callbackPort = config.events.callbackPort;
    out.events.requestedTimeoutSec = config.events.requestedTimeoutSec;
    out.events.httpTimeoutMs = config.http.timeoutMs;
    out.events.unsubscribeOnStop = config.events.unsubscribeOnStop;
    out.searchIntervalSec = config.discovery.searchIntervalSec;
    out.onboardingWorkers = config.discovery.onboardingWorkers;
    out.onboardingQueueCapacity = config.discovery.onboardingQueueCapacity;
    out.dispatchQueueCapacity = config.events.dispatchQueueCapacity;
    out.httpTimeoutMs = config.http.timeoutMs;
    out.deviceServices = config.events.deviceServices;
    return out;
}

DiscoveryOrchestrator::DiscoveryOrchestrator(OrchestratorConfig config,
                                             OrchestratorDependencies deps)
    : config_(std::move(config)),
      registry_(deps.registry),
      transport_(deps.transport),
      dispatcher_(deps.dispatcher),
      resolver_(transport_, config_.httpTimeoutMs),
      soap_(transport_, config_.httpTimeoutMs),
      topology_(registry_,
                [this](const TopologySnapshotPtr& snapshot) {
                    if (dispatcher_) {
                        dispatcher_->publish(api::TopologyChanged{snapshot});
                    }
                }),
      onboardingQueue_(config_.onboardingQueueCapacity),
      dispatchQueue_(config_.dispatchQueueCapacity) {
    subscriber_ = std::make_unique<upnp::EventSubscriber>(
        transport_, config_.events,
        [this](const std::string& deviceId, const std::string& service, std::string body) {
            DispatchItem item;
            item.kind = DispatchKind::Notification;
            item.deviceId = deviceId;
            item.service = service;
            item.body = std::move(body);
            item.receivedAt = std::chrono::system_clock::now();
            if (!enqueueDispatch(std::move(item))) {
                notificationsDropped_.fetch_add(1, std::memory_order_relaxed);
                LOG_WARN("Discovery: dispatch queue full, dropped {} event from {}", service,
                         deviceId);
            }
        });
    prober_ = std::make_unique<upnp::SsdpProber>(
        config_.ssdp, [this](const upnp::SsdpResponse& response) { handleSearchResponse(response); });
}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
    stop();
}

void DiscoveryOrchestrator::start() {
    if (started_.exchange(true)) {
        return;
    }

    // The listener must be up before the first SUBSCRIBE goes out
    subscriber_->start();
    running_.store(true, std::memory_order_release);

    dispatchThread_ = std::thread([this]() { dispatchLoop(); });
    int workers = std::max(1, config_.onboardingWorkers);
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { onboardingWorker(); });
    }

    try {
        prober_->start();
    } catch (const DiscoverySocketError&) {
        stop();
        throw;
    }

    searchThread_ = std::thread([this]() { searchLoop(); });
    LOG_INFO("Discovery: started ({} workers, search every {}s)", workers,
             config_.searchIntervalSec);
}

void DiscoveryOrchestrator::stop() {
    bool wasRunning = running_.exchange(false, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> lock(searchMutex_);
        searchCv_.notify_all();
    }
    if (searchThread_.joinable()) {
        searchThread_.join();
    }
    prober_->stop();

    onboardingQueue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    subscriber_->stop();
    dispatchQueue_.close();
    if (dispatchThread_.joinable()) {
        dispatchThread_.join();
    }

    if (wasRunning) {
        LOG_INFO("Discovery: stopped ({} devices known)", registry_.size());
    }
}

bool DiscoveryOrchestrator::rescan() {
    if (!running_.load(std::memory_order_acquire)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(searchMutex_);
        rescanRequested_ = true;
    }
    searchCv_.notify_all();
    return true;
}

// ========== Search ==========

void DiscoveryOrchestrator::performSearch() {
    if (prober_->search()) {
        std::lock_guard<std::mutex> lock(searchMutex_);
        lastSearch_ = std::chrono::system_clock::now();
    }
}

void DiscoveryOrchestrator::closeSearchCycle() {
    for (const auto& device : registry_.beginSearchCycle()) {
        publishDevice(api::DeviceChange::Stale, device);
    }
}

void DiscoveryOrchestrator::searchLoop() {
    performSearch();

    const auto interval = std::chrono::seconds(std::max(1, config_.searchIntervalSec));
    while (running_.load(std::memory_order_acquire)) {
        bool rescan = false;
        {
            std::unique_lock<std::mutex> lock(searchMutex_);
            searchCv_.wait_for(lock, interval, [this]() {
                return !running_.load(std::memory_order_acquire) || rescanRequested_;
            });
            rescan = rescanRequested_;
            rescanRequested_ = false;
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        if (!rescan) {
            closeSearchCycle();
        }
        performSearch();
    }
}

void DiscoveryOrchestrator::handleSearchResponse(const upnp::SsdpResponse& response) {
    if (!response.deviceId.empty()) {
        DevicePtr known = registry_.lookup(response.deviceId);
        if (known && known->location == response.location) {
            if (DevicePtr revived = registry_.markSeen(known->id)) {
                LOG_INFO("Discovery: {} ({}) is back", revived->id, revived->roomName);
                publishDevice(api::DeviceChange::Active, revived);
            }
            return;
        }
    }
    enqueueOnboarding(response.location);
}

// ========== Onboarding ==========

bool DiscoveryOrchestrator::enqueueOnboarding(const std::string& location) {
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (!inFlight_.insert(location).second) {
            onboardingCoalesced_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }
    if (!onboardingQueue_.tryPush(location)) {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(location);
        onboardingRejected_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Discovery: onboarding queue full, {} retried on next search", location);
        return false;
    }
    return true;
}

void DiscoveryOrchestrator::onboardingWorker() {
    while (true) {
        std::optional<std::string> location = onboardingQueue_.pop(kQueuePollInterval);
        if (!location) {
            if (onboardingQueue_.closed()) {
                break;
            }
            continue;
        }
        if (running_.load(std::memory_order_acquire)) {
            onboard(*location);
        }
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(*location);
    }
}

std::optional<Registration> DiscoveryOrchestrator::onboard(const std::string& location) {
    upnp::DeviceDescriptor descriptor;
    try {
        descriptor = resolver_.fetch(location);
    } catch (const DescriptorFetchError& e) {
        descriptorFailures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Discovery: descriptor fetch failed for {}: {}", location, e.what());
        return std::nullopt;
    } catch (const DescriptorParseError& e) {
        descriptorFailures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Discovery: descriptor at {} rejected ({}): {}", location,
                 errorCodeToString(e.code()), e.what());
        return std::nullopt;
    }

    Registration registration = registry_.registerDevice(descriptor, location);
    const DevicePtr& device = registration.device;
    if (registration.result == RegisterResult::AlreadyKnown) {
        if (registration.reactivated) {
            publishDevice(api::DeviceChange::Active, device);
        }
        return registration;
    }

    LOG_INFO("Discovery: {} {} ({}, {}) at {}", registerResultToString(registration.result),
             device->id, device->roomName, device->modelName, device->baseUrl);

    if (device->supportsTopology()) {
        subscribeTopology(device);
    } else {
        LOG_DEBUG("Discovery: {} has no ZoneGroupTopology service", device->id);
    }
    // Re-resolve the last document so members waiting for this device appear
    DispatchItem refresh;
    refresh.kind = DispatchKind::Refresh;
    refresh.deviceId = device->id;
    enqueueDispatch(std::move(refresh));

    if (device->supportsTopology()) {
        try {
            DispatchItem seed;
            seed.kind = DispatchKind::Seed;
            seed.deviceId = device->id;
            seed.body = soap_.getZoneGroupState(device->baseUrl);
            seed.receivedAt = std::chrono::system_clock::now();
            // Waits for room; the seed is the only topology source until the first NOTIFY
            if (!dispatchQueue_.push(std::move(seed), kSeedEnqueueTimeout)) {
                LOG_WARN("Discovery: dispatch queue full, topology seed from {} dropped",
                         device->id);
            }
        } catch (const Error& e) {
            topologyErrors_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("Discovery: GetZoneGroupState on {} failed ({}): {}", device->id,
                     errorCodeToString(e.code()), e.what());
        }
    }

    publishDevice(registration.result == RegisterResult::Added ? api::DeviceChange::Found
                                                               : api::DeviceChange::Updated,
                  device);

    // Unchanged leases are kept; a device that moved is subscribed at its new address
    subscribeDeviceServices(device);
    return registration;
}

void DiscoveryOrchestrator::subscribeTopology(const DevicePtr& device) {
    try {
        subscriber_->subscribe(device->baseUrl, DaemonConstants::TOPOLOGY_SERVICE, device->id);
    } catch (const SubscribeError& e) {
        subscribeFailures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Discovery: topology subscription for {} failed: {}", device->id, e.what());
    }
}

void DiscoveryOrchestrator::subscribeDeviceServices(const DevicePtr& device) {
    for (const auto& service : config_.deviceServices) {
        try {
            subscriber_->subscribe(device->baseUrl, service, device->id);
        } catch (const SubscribeError& e) {
            subscribeFailures_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("Discovery: {} subscription for {} failed: {}", service, device->id,
                     e.what());
        }
    }
}

void DiscoveryOrchestrator::publishDevice(api::DeviceChange change, const DevicePtr& device) {
    if (dispatcher_ && device) {
        dispatcher_->publish(api::DeviceChanged{change, device});
    }
}

// ========== Dispatch ==========

bool DiscoveryOrchestrator::enqueueDispatch(DispatchItem item) {
    return dispatchQueue_.tryPush(std::move(item));
}

void DiscoveryOrchestrator::dispatchLoop() {
    while (true) {
        std::optional<DispatchItem> item = dispatchQueue_.pop(kQueuePollInterval);
        if (!item) {
            if (dispatchQueue_.closed()) {
                break;
            }
            continue;
        }
        processDispatchItem(*item);
    }
}

void DiscoveryOrchestrator::processDispatchItem(DispatchItem& item) {
    TopologyUpdate update;
    try {
        switch (item.kind) {
        case DispatchKind::Notification:
            if (item.service != DaemonConstants::TOPOLOGY_SERVICE) {
                if (dispatcher_) {
                    dispatcher_->publish(api::DeviceEvent{item.deviceId, item.service,
                                                          std::move(item.body), item.receivedAt});
                }
                return;
            }
            update = topology_.handleTopologyEvent(item.deviceId, item.service, item.body);
            break;
        case DispatchKind::Seed:
            update = topology_.applyZoneGroupState(item.deviceId, item.body);
            break;
        case DispatchKind::Refresh:
            update = topology_.refresh();
            break;
        }
    } catch (const TopologyParseError& e) {
        topologyErrors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Discovery: topology document from {} dropped: {}", item.deviceId, e.what());
        return;
    }

    for (const auto& location : update.unresolvedLocations) {
        if (!registry_.lookupByLocation(location) && running_.load(std::memory_order_acquire)) {
            LOG_DEBUG("Discovery: topology names unknown member at {}", location);
            enqueueOnboarding(location);
        }
    }
}

// ========== Consumer views ==========

nlohmann::json DiscoveryOrchestrator::topologyInfo(const Device& device,
                                                   const TopologySnapshot& snapshot) const {
    nlohmann::json j;
    const ZoneGroup* group = snapshot.groupFor(device.id);
    if (group == nullptr) {
        j["groupId"] = nullptr;
        j["isCoordinator"] = false;
        return j;
    }
    j["groupId"] = group->id;
    j["coordinator"] = group->coordinatorId;
    j["isCoordinator"] = group->coordinatorId == device.id;
    return j;
}

nlohmann::json DiscoveryOrchestrator::buildDevicesJson() const {
    TopologySnapshotPtr snapshot = topology_.snapshot();
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& device : registry_.devices()) {
        nlohmann::json j = device->toJson();
        j["topology"] = topologyInfo(*device, *snapshot);
        devices.push_back(j);
    }
    return devices;
}

std::optional<nlohmann::json> DiscoveryOrchestrator::buildDeviceJson(
    const std::string& idOrRoom) const {
    DevicePtr device = registry_.lookup(idOrRoom);
    if (!device) {
        device = registry_.lookupByRoom(idOrRoom);
    }
    if (!device) {
        return std::nullopt;
    }
    nlohmann::json j = device->toJson();
    j["topology"] = topologyInfo(*device, *topology_.snapshot());
    return j;
}

nlohmann::json DiscoveryOrchestrator::buildZonesJson() const {
    return topology_.snapshot()->toJson(registry_);
}

std::optional<nlohmann::json> DiscoveryOrchestrator::buildZoneJson(const std::string& room) const {
    TopologySnapshotPtr snapshot = topology_.snapshot();
    auto coordinator = snapshot->roomCoordinator(room);
    if (!coordinator) {
        return std::nullopt;
    }
    const ZoneGroup* group = snapshot->groupFor(*coordinator);
    if (group == nullptr) {
        return std::nullopt;
    }
    nlohmann::json zones = snapshot->toJson(registry_);
    for (const auto& g : zones["groups"]) {
        if (g["id"] == group->id) {
            nlohmann::json j = g;
            j["roomCoordinator"] = *coordinator;
            j["stereoPair"] = snapshot->stereoPairPrimary(room).has_value();
            return j;
        }
    }
    return std::nullopt;
}

std::string DiscoveryOrchestrator::callbackBaseUrl() const {
    std::string host = config_.events.callbackHost;
    if (host.empty()) {
        auto devices = registry_.devices();
        host = net::selectLocalAddress(devices.empty() ? std::string() : devices.front()->ip);
    }
    return "http://" + host + ":" + std::to_string(subscriber_->listenPort()) +
           DaemonConstants::NOTIFY_PATH_PREFIX;
}

nlohmann::json DiscoveryOrchestrator::buildStatusJson() const {
    TopologySnapshotPtr snapshot = topology_.snapshot();
    std::chrono::system_clock::time_point lastSearch;
    {
        std::lock_guard<std::mutex> lock(searchMutex_);
        lastSearch = lastSearch_;
    }

    nlohmann::json j;
    j["running"] = isRunning();
    j["devices"] = {{"total", registry_.size()},
                    {"active", registry_.activeCount()},
                    {"stale", registry_.staleCount()}};
    j["subscriptions"] = subscriber_->subscriptionCount();
    j["topology"] = {{"version", snapshot->version()},
                     {"groups", snapshot->groupCount()},
                     {"hash", snapshot->contentHash()},
                     {"documentsRejected", topology_.documentsRejected()}};
    j["queues"] = {{"onboarding", onboardingQueue_.size()},
                   {"onboardingCapacity", onboardingQueue_.capacity()},
                   {"dispatch", dispatchQueue_.size()},
                   {"dispatchCapacity", dispatchQueue_.capacity()}};
    j["search"] = {{"cycles", registry_.searchCycles()},
                   {"sent", prober_->searchesSent()},
                   {"responses", prober_->responsesAccepted()},
                   {"lastSearchMs", lastSearch == std::chrono::system_clock::time_point{}
                                        ? nlohmann::json(nullptr)
                                        : nlohmann::json(toEpochMillis(lastSearch))}};
    j["callbackUrl"] = callbackBaseUrl();
    j["errors"] = {{"descriptor", descriptorFailures_.load()},
                   {"subscribe", subscribeFailures_.load()},
                   {"topology", topologyErrors_.load()},
                   {"notificationsDropped", notificationsDropped_.load()},
                   {"onboardingRejected", onboardingRejected_.load()},
                   {"onboardingCoalesced", onboardingCoalesced_.load()}};
    return j;
}

}  // namespace discovery
}  // namespace zonelink
