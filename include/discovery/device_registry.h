#ifndef ZONELINK_DISCOVERY_DEVICE_REGISTRY_H
#define ZONELINK_DISCOVERY_DEVICE_REGISTRY_H

#include "core/daemon_constants.h"
#include "upnp/descriptor_resolver.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace zonelink {
namespace discovery {

enum class Liveness { Active, Stale };

const char* livenessToString(Liveness liveness);

/**
 * @brief A known device. Records are immutable; the registry swaps in a new
 *        copy when descriptor data or liveness changes.
 */
struct Device {
    std::string id;
    std::string roomName;
    std::string modelName;
    std::string modelNumber;
    std::string displayName;
    std::string softwareVersion;
    std::string location;
    std::string baseUrl;  // http://host:port
    std::string ip;
    std::vector<upnp::ServiceInfo> services;
    Liveness liveness = Liveness::Active;

    // Portable models ("Roam", "Move") do not host ZoneGroupTopology.
    bool isPortable() const;

    // Whether topology subscription / GetZoneGroupState should be attempted.
    bool supportsTopology() const;

    nlohmann::json toJson() const;
};

using DevicePtr = std::shared_ptr<const Device>;

enum class RegisterResult { Added, AlreadyKnown, Updated };

const char* registerResultToString(RegisterResult result);

struct Registration {
    RegisterResult result = RegisterResult::AlreadyKnown;
    DevicePtr device;
    bool reactivated = false;  // device was Stale and is Active again
};

/**
 * @brief Canonical set of known devices, keyed by normalized identifier.
 *
 * One instance is owned by the application and passed by reference to the
 * components that need lookups. All methods are thread-safe.
 */
class DeviceRegistry {
   public:
    explicit DeviceRegistry(int staleAfterCycles = DaemonConstants::DEFAULT_STALE_AFTER_CYCLES);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Register a resolved descriptor seen at location.
     *
     * Unseen id -> Added. Same room, model and location -> AlreadyKnown with no
     * mutation. Changed data -> Updated (record replaced). Every call counts as
     * a sighting for liveness.
     */
    Registration registerDevice(const upnp::DeviceDescriptor& descriptor,
                                const std::string& location);

    // Accepts ids with or without the "uuid:" prefix.
    DevicePtr lookup(const std::string& id) const;

    // Case-insensitive; active devices win over stale ones.
    DevicePtr lookupByRoom(const std::string& room) const;

    DevicePtr lookupByLocation(const std::string& location) const;

    bool contains(const std::string& id) const;

    /**
     * @brief Record a sighting without re-registering (SSDP response from a known device).
     *
     * @return the new record if the device went from Stale to Active, else nullptr
     */
    DevicePtr markSeen(const std::string& id);

    /**
     * @brief Close the current search cycle and open the next one.
     *
     * Devices not seen during the closing cycle accumulate a miss; those that
     * reach staleAfterCycles misses turn Stale and are returned.
     */
    std::vector<DevicePtr> beginSearchCycle();

    // Sorted by id.
    std::vector<DevicePtr> devices() const;

    size_t size() const;
    size_t activeCount() const;
    size_t staleCount() const;
    uint64_t searchCycles() const;

   private:
    struct Entry {
        DevicePtr device;
        bool seenThisCycle = true;
        int missedCycles = 0;
    };

    // Caller holds mutex_. Returns the reactivated record or nullptr.
    DevicePtr touchLocked(Entry& entry);

    const int staleAfterCycles_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::string> idByLocation_;
    uint64_t searchCycles_ = 0;
};

}  // namespace discovery
}  // namespace zonelink

#endif  // ZONELINK_DISCOVERY_DEVICE_REGISTRY_H
