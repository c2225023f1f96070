#include "discovery/device_registry.h"

#include "logging/logger.h"
#include "net/http_client.h"

#include <algorithm>

namespace zonelink {
namespace discovery {

const char* livenessToString(Liveness liveness) {
    switch (liveness) {
    case Liveness::Stale:
        return "stale";
    case Liveness::Active:
    default:
        return "active";
    }
}

const char* registerResultToString(RegisterResult result) {
    switch (result) {
    case RegisterResult::Added:
        return "added";
    case RegisterResult::Updated:
        return "updated";
    case RegisterResult::AlreadyKnown:
    default:
        return "already_known";
    }
}

bool Device::isPortable() const {
    std::string model = net::toLowerAscii(modelName);
    return model.find("roam") != std::string::npos || model.find("move") != std::string::npos;
}

bool Device::supportsTopology() const {
    if (isPortable()) {
        return false;
    }
    if (services.empty()) {
        // Descriptor listed nothing; assume a regular zone player.
        return true;
    }
    for (const auto& service : services) {
        if (upnp::shortServiceType(service.serviceType) == DaemonConstants::TOPOLOGY_SERVICE) {
            return true;
        }
    }
    return false;
}

nlohmann::json Device::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["room"] = roomName;
    j["model"] = modelName;
    if (!modelNumber.empty()) {
        j["modelNumber"] = modelNumber;
    }
    if (!displayName.empty()) {
        j["displayName"] = displayName;
    }
    if (!softwareVersion.empty()) {
        j["softwareVersion"] = softwareVersion;
    }
    j["location"] = location;
    j["baseUrl"] = baseUrl;
    j["ip"] = ip;
    j["liveness"] = livenessToString(liveness);
    j["supportsTopology"] = supportsTopology();
    nlohmann::json services = nlohmann::json::array();
    for (const auto& service : this->services) {
        services.push_back(upnp::shortServiceType(service.serviceType));
    }
    j["services"] = services;
    return j;
}

DeviceRegistry::DeviceRegistry(int staleAfterCycles)
    : staleAfterCycles_(std::max(1, staleAfterCycles)) {}

DevicePtr DeviceRegistry::touchLocked(Entry& entry) {
    entry.seenThisCycle = true;
    entry.missedCycles = 0;
    if (entry.device->liveness != Liveness::Stale) {
        return nullptr;
    }
    auto revived = std::make_shared<Device>(*entry.device);
    revived->liveness = Liveness::Active;
    entry.device = revived;
    return revived;
}

Registration DeviceRegistry::registerDevice(const upnp::DeviceDescriptor& descriptor,
                                            const std::string& location) {
    auto device = std::make_shared<Device>();
    device->id = upnp::normalizeDeviceId(descriptor.id);
    device->roomName = descriptor.roomName;
    device->modelName = descriptor.modelName;
    device->modelNumber = descriptor.modelNumber;
    device->displayName = descriptor.displayName;
    device->softwareVersion = descriptor.softwareVersion;
    device->location = location;
    device->baseUrl = net::baseUrlOf(location);
    if (auto url = net::parseUrl(location)) {
        device->ip = url->host;
    }
    device->services = descriptor.services;

    std::lock_guard<std::mutex> lock(mutex_);
    Registration registration;

    auto it = entries_.find(device->id);
    if (it == entries_.end()) {
        Entry entry;
        entry.device = device;
        entries_.emplace(device->id, entry);
        idByLocation_[location] = device->id;
        registration.result = RegisterResult::Added;
        registration.device = device;
        return registration;
    }

    Entry& entry = it->second;
    const Device& current = *entry.device;
    bool changed = current.roomName != device->roomName ||
                   current.modelName != device->modelName ||
                   current.modelNumber != device->modelNumber || current.location != location;

    if (!changed) {
        DevicePtr revived = touchLocked(entry);
        registration.result = RegisterResult::AlreadyKnown;
        registration.reactivated = revived != nullptr;
        registration.device = entry.device;
        return registration;
    }

    registration.reactivated = current.liveness == Liveness::Stale;
    if (current.location != location) {
        idByLocation_.erase(current.location);
    }
    idByLocation_[location] = device->id;
    entry.device = device;
    entry.seenThisCycle = true;
    entry.missedCycles = 0;
    registration.result = RegisterResult::Updated;
    registration.device = device;
    return registration;
}

DevicePtr DeviceRegistry::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(upnp::normalizeDeviceId(id));
    return it != entries_.end() ? it->second.device : nullptr;
}

DevicePtr DeviceRegistry::lookupByRoom(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DevicePtr staleMatch;
    for (const auto& [id, entry] : entries_) {
        if (!net::equalsIgnoreCase(entry.device->roomName, room)) {
            continue;
        }
        if (entry.device->liveness == Liveness::Active) {
            return entry.device;
        }
        if (!staleMatch) {
            staleMatch = entry.device;
        }
    }
    return staleMatch;
}

DevicePtr DeviceRegistry::lookupByLocation(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loc = idByLocation_.find(location);
    if (loc == idByLocation_.end()) {
        return nullptr;
    }
    auto it = entries_.find(loc->second);
    return it != entries_.end() ? it->second.device : nullptr;
}

bool DeviceRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(upnp::normalizeDeviceId(id)) > 0;
}

DevicePtr DeviceRegistry::markSeen(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(upnp::normalizeDeviceId(id));
    if (it == entries_.end()) {
        return nullptr;
    }
    return touchLocked(it->second);
}

std::vector<DevicePtr> DeviceRegistry::beginSearchCycle() {
    std::vector<DevicePtr> newlyStale;
    std::lock_guard<std::mutex> lock(mutex_);
    searchCycles_++;
    for (auto& [id, entry] : entries_) {
        if (entry.seenThisCycle) {
            entry.missedCycles = 0;
        } else {
            entry.missedCycles++;
        }
        entry.seenThisCycle = false;

        if (entry.missedCycles >= staleAfterCycles_ &&
            entry.device->liveness == Liveness::Active) {
            auto stale = std::make_shared<Device>(*entry.device);
            stale->liveness = Liveness::Stale;
            entry.device = stale;
            newlyStale.push_back(stale);
            LOG_INFO("Registry: {} ({}) not seen for {} search cycles, marking stale", id,
                     stale->roomName, entry.missedCycles);
        }
    }
    return newlyStale;
}

std::vector<DevicePtr> DeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DevicePtr> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry.device);
    }
    return out;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t DeviceRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const auto& kv) {
            return kv.second.device->liveness == Liveness::Active;
        }));
}

size_t DeviceRegistry::staleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const auto& kv) {
            return kv.second.device->liveness == Liveness::Stale;
        }));
}

uint64_t DeviceRegistry::searchCycles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return searchCycles_;
}

}  // namespace discovery
}  // namespace zonelink
