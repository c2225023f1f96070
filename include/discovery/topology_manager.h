#ifndef ZONELINK_DISCOVERY_TOPOLOGY_MANAGER_H
#define ZONELINK_DISCOVERY_TOPOLOGY_MANAGER_H

#include "discovery/device_registry.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace zonelink {
namespace discovery {

/**
 * @brief Per-member attributes carried by a ZoneGroupMember element.
 */
struct ZoneMember {
    std::string id;
    std::string zoneName;
    std::string location;
    std::string channelMapSet;  // "UUID1:LF,LF;UUID2:RF,RF" for stereo pairs
    bool invisible = false;
};

/**
 * @brief One zone group. Devices are referenced by identifier and resolved
 *        through the DeviceRegistry; the coordinator is always in memberIds.
 */
struct ZoneGroup {
    std::string id;
    std::string coordinatorId;
    std::vector<std::string> memberIds;
};

/**
 * @brief Group list as written in a ZoneGroupState document, before resolution.
 */
struct RawZoneGroup {
    std::string id;
    std::string coordinatorId;
    std::vector<ZoneMember> members;
};

/**
 * @brief Immutable picture of every zone group at one instant.
 *
 * Built completely before it is published; readers keep whatever snapshot
 * they fetched for as long as they hold the pointer.
 */
class TopologySnapshot {
   public:
    TopologySnapshot() = default;
    TopologySnapshot(std::vector<ZoneGroup> groups, std::map<std::string, ZoneMember> members,
                     uint64_t version, std::chrono::system_clock::time_point timestamp);

    const std::vector<ZoneGroup>& groups() const {
        return groups_;
    }
    size_t groupCount() const {
        return groups_.size();
    }
    uint64_t version() const {
        return version_;
    }
    const std::string& contentHash() const {
        return contentHash_;
    }
    std::chrono::system_clock::time_point timestamp() const {
        return timestamp_;
    }

    const ZoneGroup* groupFor(const std::string& deviceId) const;
    const ZoneMember* member(const std::string& deviceId) const;
    bool isCoordinator(const std::string& deviceId) const;

    // Empty when the device is in no group.
    std::string coordinatorOf(const std::string& deviceId) const;
    std::vector<std::string> membersOf(const std::string& deviceId) const;

    /**
     * @brief Left speaker of a stereo pair named room, taken from ChannelMapSet.
     *
     * Only answers when the room has more than one member in its group.
     */
    std::optional<std::string> stereoPairPrimary(const std::string& room) const;

    /**
     * @brief Device that answers for room: the group coordinator if it is in the
     *        room, else the stereo primary, else the first member in the room.
     */
    std::optional<std::string> roomCoordinator(const std::string& room) const;

    nlohmann::json toJson(const DeviceRegistry& registry) const;

    // Hash of the canonical group content; version and timestamp are not part of it.
    static std::string computeContentHash(const std::vector<ZoneGroup>& groups,
                                          const std::map<std::string, ZoneMember>& members);

   private:
    std::vector<ZoneGroup> groups_;
    std::map<std::string, ZoneMember> members_;
    std::map<std::string, size_t> groupIndexById_;  // device id -> index into groups_
    uint64_t version_ = 0;
    std::string contentHash_ = computeContentHash({}, {});
    std::chrono::system_clock::time_point timestamp_{};
};

using TopologySnapshotPtr = std::shared_ptr<const TopologySnapshot>;

enum class UpdateStatus { Changed, Unchanged, Ignored };

const char* updateStatusToString(UpdateStatus status);

struct TopologyUpdate {
    UpdateStatus status = UpdateStatus::Ignored;
    TopologySnapshotPtr snapshot;
    // Members the document named that are not registered yet.
    std::vector<std::string> unresolvedLocations;
};

/**
 * @brief Turns ZoneGroupTopology payloads into TopologySnapshots.
 *
 * Every accepted document replaces the whole topology. Updates must be fed
 * from one thread (the dispatch loop); snapshot() may be called from any thread.
 */
class TopologyManager {
   public:
    using ChangeCallback = std::function<void(const TopologySnapshotPtr&)>;

    explicit TopologyManager(const DeviceRegistry& registry, ChangeCallback onChange = nullptr);

    TopologyManager(const TopologyManager&) = delete;
    TopologyManager& operator=(const TopologyManager&) = delete;

    /**
     * @brief Apply a GENA property set from the ZoneGroupTopology service.
     *
     * Property sets without ZoneGroupState (other topology variables) and
     * notifications from other services are Ignored.
     *
     * @throws TopologyParseError when the body or the nested document is malformed
     */
    TopologyUpdate handleTopologyEvent(const std::string& deviceId, const std::string& service,
                                       const std::string& body);

    /**
     * @brief Apply a full ZoneGroupState document (GetZoneGroupState result or event value).
     *
     * @throws TopologyParseError; the current snapshot stays in place
     */
    TopologyUpdate applyZoneGroupState(const std::string& sourceDeviceId, const std::string& xml);

    // Resolve the last accepted document again against the registry.
    TopologyUpdate refresh();

    TopologySnapshotPtr snapshot() const;

    uint64_t documentsAccepted() const {
        return documentsAccepted_;
    }
    uint64_t documentsRejected() const {
        return documentsRejected_;
    }

    static std::vector<RawZoneGroup> parseZoneGroupState(const std::string& xml);

   private:
    TopologyUpdate resolveAndPublish(const std::vector<RawZoneGroup>& raw);

    const DeviceRegistry& registry_;
    ChangeCallback onChange_;

    std::mutex updateMutex_;  // serializes resolve + publish
    std::vector<RawZoneGroup> lastDocument_;
    bool haveDocument_ = false;
    uint64_t documentsAccepted_ = 0;
    uint64_t documentsRejected_ = 0;

    mutable std::mutex snapshotMutex_;
    TopologySnapshotPtr snapshot_;
};

}  // namespace discovery
}  // namespace zonelink

#endif  // ZONELINK_DISCOVERY_TOPOLOGY_MANAGER_H
