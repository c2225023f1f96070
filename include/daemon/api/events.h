#pragma once

#include "discovery/device_registry.h"
#include "discovery/topology_manager.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace zonelink::api {

enum class DeviceChange { Found, Updated, Stale, Active };

const char* deviceChangeToString(DeviceChange change);

struct DeviceChanged {
    DeviceChange change = DeviceChange::Found;
    discovery::DevicePtr device;
};

struct TopologyChanged {
    discovery::TopologySnapshotPtr snapshot;
};

// Notification from a device service other than ZoneGroupTopology.
struct DeviceEvent {
    std::string deviceId;
    std::string service;
    std::string body;
    std::chrono::system_clock::time_point receivedAt;
};

/**
 * @brief In-process fan-out of discovery events to consumers (PUB socket, tests).
 *
 * Handlers run on the publishing thread and must not block.
 */
class EventDispatcher {
   public:
    using DeviceChangedHandler = std::function<void(const DeviceChanged&)>;
    using TopologyChangedHandler = std::function<void(const TopologyChanged&)>;
    using DeviceEventHandler = std::function<void(const DeviceEvent&)>;

    void subscribe(const DeviceChangedHandler& handler);
    void subscribe(const TopologyChangedHandler& handler);
    void subscribe(const DeviceEventHandler& handler);

    void publish(const DeviceChanged& event) const;
    void publish(const TopologyChanged& event) const;
    void publish(const DeviceEvent& event) const;

   private:
    template <typename Event, typename Handler>
    void publishImpl(const Event& event, const std::vector<Handler>& handlers) const;

    mutable std::mutex mutex_;
    std::vector<DeviceChangedHandler> deviceHandlers_;
    std::vector<TopologyChangedHandler> topologyHandlers_;
    std::vector<DeviceEventHandler> eventHandlers_;
};

inline const char* deviceChangeToString(DeviceChange change) {
    switch (change) {
    case DeviceChange::Updated:
        return "device_updated";
    case DeviceChange::Stale:
        return "device_stale";
    case DeviceChange::Active:
        return "device_active";
    case DeviceChange::Found:
    default:
        return "device_found";
    }
}

inline void EventDispatcher::subscribe(const DeviceChangedHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    deviceHandlers_.push_back(handler);
}

inline void EventDispatcher::subscribe(const TopologyChangedHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    topologyHandlers_.push_back(handler);
}

inline void EventDispatcher::subscribe(const DeviceEventHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventHandlers_.push_back(handler);
}

inline void EventDispatcher::publish(const DeviceChanged& event) const {
    publishImpl(event, deviceHandlers_);
}

inline void EventDispatcher::publish(const TopologyChanged& event) const {
    publishImpl(event, topologyHandlers_);
}

inline void EventDispatcher::publish(const DeviceEvent& event) const {
    publishImpl(event, eventHandlers_);
}

template <typename Event, typename Handler>
void EventDispatcher::publishImpl(const Event& event, const std::vector<Handler>& handlers) const {
    std::vector<Handler> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handlers;
    }
    for (const auto& handler : copy) {
        if (handler) {
            handler(event);
        }
    }
}

}  // namespace zonelink::api
