#include "discovery/topology_manager.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "net/http_client.h"
#include "net/xml_utils.h"
#include "upnp/descriptor_resolver.h"

#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>
#include <tinyxml2.h>

namespace zonelink {
namespace discovery {

namespace {

// FNV-1a, 64 bit
uint64_t fnv1a(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool parseInvisible(const tinyxml2::XMLElement* element) {
    const char* value = element->Attribute("Invisible");
    return value != nullptr && (std::string(value) == "1" || net::equalsIgnoreCase(value, "true"));
}

const tinyxml2::XMLElement* findZoneGroups(const tinyxml2::XMLDocument& doc) {
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr) {
        return nullptr;
    }
    std::string_view rootName = net::localName(root->Name());
    if (rootName == "ZoneGroups") {
        return root;  // legacy shape
    }
    if (rootName == "ZoneGroupState") {
        return net::firstChildByLocalName(root, "ZoneGroups");
    }
    return nullptr;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

}  // namespace

const char* updateStatusToString(UpdateStatus status) {
    switch (status) {
    case UpdateStatus::Changed:
        return "changed";
    case UpdateStatus::Unchanged:
        return "unchanged";
    case UpdateStatus::Ignored:
    default:
        return "ignored";
    }
}

// ========== TopologySnapshot ==========

TopologySnapshot::TopologySnapshot(std::vector<ZoneGroup> groups,
                                   std::map<std::string, ZoneMember> members, uint64_t version,
                                   std::chrono::system_clock::time_point timestamp)
    : groups_(std::move(groups)),
      members_(std::move(members)),
      version_(version),
      contentHash_(computeContentHash(groups_, members_)),
      timestamp_(timestamp) {
    for (size_t i = 0; i < groups_.size(); ++i) {
        for (const auto& id : groups_[i].memberIds) {
            groupIndexById_[id] = i;
        }
    }
}

std::string TopologySnapshot::computeContentHash(
    const std::vector<ZoneGroup>& groups, const std::map<std::string, ZoneMember>& members) {
    // Group order in the document is not meaningful
    std::vector<std::string> lines;
    lines.reserve(groups.size());
    for (const auto& group : groups) {
        std::ostringstream line;
        line << group.id << '|' << group.coordinatorId;
        for (const auto& id : group.memberIds) {
            line << '|' << id;
            auto it = members.find(id);
            if (it != members.end()) {
                line << ',' << it->second.zoneName << ',' << it->second.channelMapSet << ','
                     << (it->second.invisible ? '1' : '0');
            }
        }
        lines.push_back(line.str());
    }
    std::sort(lines.begin(), lines.end());

    std::string canonical;
    for (const auto& line : lines) {
        canonical += line;
        canonical += '\n';
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a(canonical)));
    return buf;
}

const ZoneGroup* TopologySnapshot::groupFor(const std::string& deviceId) const {
    auto it = groupIndexById_.find(upnp::normalizeDeviceId(deviceId));
    return it != groupIndexById_.end() ? &groups_[it->second] : nullptr;
}

const ZoneMember* TopologySnapshot::member(const std::string& deviceId) const {
    auto it = members_.find(upnp::normalizeDeviceId(deviceId));
    return it != members_.end() ? &it->second : nullptr;
}

bool TopologySnapshot::isCoordinator(const std::string& deviceId) const {
    const ZoneGroup* group = groupFor(deviceId);
    return group != nullptr && group->coordinatorId == upnp::normalizeDeviceId(deviceId);
}

std::string TopologySnapshot::coordinatorOf(const std::string& deviceId) const {
    const ZoneGroup* group = groupFor(deviceId);
    return group != nullptr ? group->coordinatorId : std::string();
}

std::vector<std::string> TopologySnapshot::membersOf(const std::string& deviceId) const {
    const ZoneGroup* group = groupFor(deviceId);
    return group != nullptr ? group->memberIds : std::vector<std::string>{};
}

std::optional<std::string> TopologySnapshot::stereoPairPrimary(const std::string& room) const {
    for (const auto& group : groups_) {
        std::vector<const ZoneMember*> inRoom;
        for (const auto& id : group.memberIds) {
            auto it = members_.find(id);
            if (it != members_.end() && net::equalsIgnoreCase(it->second.zoneName, room)) {
                inRoom.push_back(&it->second);
            }
        }
        if (inRoom.size() < 2) {
            continue;
        }
        // "RINCON_L:LF,LF;RINCON_R:RF,RF"
        for (const ZoneMember* m : inRoom) {
            std::stringstream entries(m->channelMapSet);
            std::string entry;
            while (std::getline(entries, entry, ';')) {
                size_t colon = entry.find(':');
                if (colon == std::string::npos) {
                    continue;
                }
                std::string channels = entry.substr(colon + 1);
                if (channels.rfind("LF", 0) != 0) {
                    continue;
                }
                // The left channel may name a player that was dropped from this group
                std::string id = upnp::normalizeDeviceId(entry.substr(0, colon));
                if (std::any_of(inRoom.begin(), inRoom.end(),
                                [&id](const ZoneMember* candidate) { return candidate->id == id; })) {
                    return id;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> TopologySnapshot::roomCoordinator(const std::string& room) const {
    for (const auto& group : groups_) {
        std::string firstInRoom;
        for (const auto& id : group.memberIds) {
            auto it = members_.find(id);
            if (it != members_.end() && net::equalsIgnoreCase(it->second.zoneName, room)) {
                firstInRoom = id;
                break;
            }
        }
        if (firstInRoom.empty()) {
            continue;
        }
        auto coordinator = members_.find(group.coordinatorId);
        if (coordinator != members_.end() &&
            net::equalsIgnoreCase(coordinator->second.zoneName, room)) {
            return group.coordinatorId;
        }
        if (auto primary = stereoPairPrimary(room)) {
            return primary;
        }
        return firstInRoom;
    }
    return std::nullopt;
}

nlohmann::json TopologySnapshot::toJson(const DeviceRegistry& registry) const {
    auto describeMember = [&](const std::string& id) {
        nlohmann::json m;
        m["id"] = id;
        auto it = members_.find(id);
        DevicePtr device = registry.lookup(id);
        std::string room = device ? device->roomName : std::string();
        if (room.empty() && it != members_.end()) {
            room = it->second.zoneName;
        }
        m["room"] = room;
        if (device) {
            m["model"] = device->modelName;
            m["liveness"] = livenessToString(device->liveness);
        }
        if (it != members_.end()) {
            if (!it->second.channelMapSet.empty()) {
                m["channelMapSet"] = it->second.channelMapSet;
            }
            m["invisible"] = it->second.invisible;
        }
        return m;
    };

    nlohmann::json groups = nlohmann::json::array();
    for (const auto& group : groups_) {
        nlohmann::json g;
        g["id"] = group.id;
        g["coordinator"] = describeMember(group.coordinatorId);
        nlohmann::json members = nlohmann::json::array();
        for (const auto& id : group.memberIds) {
            members.push_back(describeMember(id));
        }
        g["members"] = members;
        groups.push_back(g);
    }

    nlohmann::json j;
    j["version"] = version_;
    j["hash"] = contentHash_;
    j["timestamp"] = formatTimestamp(timestamp_);
    j["groups"] = groups;
    return j;
}

// ========== TopologyManager ==========

TopologyManager::TopologyManager(const DeviceRegistry& registry, ChangeCallback onChange)
    : registry_(registry),
      onChange_(std::move(onChange)),
      snapshot_(std::make_shared<TopologySnapshot>()) {}

TopologySnapshotPtr TopologyManager::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

std::vector<RawZoneGroup> TopologyManager::parseZoneGroupState(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw TopologyParseError(std::string("ZoneGroupState is not well-formed: ") +
                                 doc.ErrorStr());
    }
    const tinyxml2::XMLElement* zoneGroups = findZoneGroups(doc);
    if (zoneGroups == nullptr) {
        throw TopologyParseError("ZoneGroupState document has no ZoneGroups element");
    }

    std::vector<RawZoneGroup> groups;
    for (const tinyxml2::XMLElement* g = net::firstChildByLocalName(zoneGroups, "ZoneGroup");
         g != nullptr; g = net::nextSiblingByLocalName(g, "ZoneGroup")) {
        RawZoneGroup group;
        group.id = net::attributeOr(g, "ID");
        group.coordinatorId = upnp::normalizeDeviceId(net::attributeOr(g, "Coordinator"));
        if (group.coordinatorId.empty()) {
            LOG_DEBUG("Topology: skipping group {} without coordinator", group.id);
            continue;
        }
        for (const tinyxml2::XMLElement* m = net::firstChildByLocalName(g, "ZoneGroupMember");
             m != nullptr; m = net::nextSiblingByLocalName(m, "ZoneGroupMember")) {
            ZoneMember member;
            member.id = upnp::normalizeDeviceId(net::attributeOr(m, "UUID"));
            if (member.id.empty()) {
                continue;
            }
            member.zoneName = net::attributeOr(m, "ZoneName");
            member.location = net::attributeOr(m, "Location");
            member.channelMapSet = net::attributeOr(m, "ChannelMapSet");
            member.invisible = parseInvisible(m);
            group.members.push_back(std::move(member));
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

TopologyUpdate TopologyManager::handleTopologyEvent(const std::string& deviceId,
                                                    const std::string& service,
                                                    const std::string& body) {
    if (service != DaemonConstants::TOPOLOGY_SERVICE) {
        return TopologyUpdate{};
    }

    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.c_str(), body.size()) != tinyxml2::XML_SUCCESS) {
        std::lock_guard<std::mutex> lock(updateMutex_);
        documentsRejected_++;
        throw TopologyParseError("Topology event from " + deviceId +
                                 " is not well-formed: " + doc.ErrorStr());
    }

    // <e:propertyset><e:property><ZoneGroupState>&lt;ZoneGroupState&gt;...
    const tinyxml2::XMLElement* root = doc.RootElement();
    const tinyxml2::XMLElement* state = nullptr;
    if (root != nullptr && net::localName(root->Name()) == "propertyset") {
        for (const tinyxml2::XMLElement* p = net::firstChildByLocalName(root, "property");
             p != nullptr && state == nullptr; p = net::nextSiblingByLocalName(p, "property")) {
            state = net::firstChildByLocalName(p, "ZoneGroupState");
        }
    }
    if (state == nullptr || state->GetText() == nullptr) {
        LOG_TRACE("Topology: event from {} carries no ZoneGroupState", deviceId);
        return TopologyUpdate{};
    }
    return applyZoneGroupState(deviceId, state->GetText());
}

TopologyUpdate TopologyManager::applyZoneGroupState(const std::string& sourceDeviceId,
                                                    const std::string& xml) {
    std::vector<RawZoneGroup> raw;
    try {
        raw = parseZoneGroupState(xml);
    } catch (const TopologyParseError& e) {
        std::lock_guard<std::mutex> lock(updateMutex_);
        documentsRejected_++;
        LOG_WARN("Topology: dropping document from {}: {}", sourceDeviceId, e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(updateMutex_);
    lastDocument_ = raw;
    haveDocument_ = true;
    documentsAccepted_++;
    return resolveAndPublish(raw);
}

TopologyUpdate TopologyManager::refresh() {
    std::lock_guard<std::mutex> lock(updateMutex_);
    if (!haveDocument_) {
        TopologyUpdate update;
        update.status = UpdateStatus::Unchanged;
        update.snapshot = snapshot();
        return update;
    }
    return resolveAndPublish(lastDocument_);
}

TopologyUpdate TopologyManager::resolveAndPublish(const std::vector<RawZoneGroup>& raw) {
    TopologyUpdate update;
    std::set<std::string> placed;
    std::set<std::string> unresolved;
    std::vector<ZoneGroup> groups;
    std::map<std::string, ZoneMember> members;

    auto noteUnresolved = [&](const ZoneMember& m) {
        if (!m.location.empty() && unresolved.insert(m.location).second) {
            update.unresolvedLocations.push_back(m.location);
        }
    };

    for (const auto& rawGroup : raw) {
        DevicePtr coordinator = registry_.lookup(rawGroup.coordinatorId);
        if (!coordinator || placed.count(rawGroup.coordinatorId) != 0) {
            // The coordinator invariant cannot hold for this group
            for (const auto& m : rawGroup.members) {
                if (!registry_.contains(m.id)) {
                    noteUnresolved(m);
                }
            }
            LOG_DEBUG("Topology: omitting group {} (coordinator {} unavailable)", rawGroup.id,
                      rawGroup.coordinatorId);
            continue;
        }

        ZoneGroup group;
        group.id = rawGroup.id;
        group.coordinatorId = rawGroup.coordinatorId;
        for (const auto& m : rawGroup.members) {
            DevicePtr device = registry_.lookup(m.id);
            if (!device) {
                noteUnresolved(m);
                continue;
            }
            if (placed.count(m.id) != 0 ||
                std::find(group.memberIds.begin(), group.memberIds.end(), m.id) !=
                    group.memberIds.end()) {
                continue;
            }
            ZoneMember member = m;
            if (member.zoneName.empty()) {
                member.zoneName = device->roomName;
            }
            members[m.id] = member;
            group.memberIds.push_back(m.id);
        }

        if (std::find(group.memberIds.begin(), group.memberIds.end(), group.coordinatorId) ==
            group.memberIds.end()) {
            ZoneMember member;
            member.id = coordinator->id;
            member.zoneName = coordinator->roomName;
            member.location = coordinator->location;
            members[member.id] = member;
            group.memberIds.insert(group.memberIds.begin(), group.coordinatorId);
        }

        for (const auto& id : group.memberIds) {
            placed.insert(id);
        }
        groups.push_back(std::move(group));
    }

    TopologySnapshotPtr current = snapshot();
    std::string hash = TopologySnapshot::computeContentHash(groups, members);
    if (hash == current->contentHash()) {
        update.status = UpdateStatus::Unchanged;
        update.snapshot = current;
        return update;
    }

    auto next = std::make_shared<const TopologySnapshot>(std::move(groups), std::move(members),
                                                         current->version() + 1,
                                                         std::chrono::system_clock::now());
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_ = next;
    }
    LOG_INFO("Topology: version {} ({} groups, hash {})", next->version(), next->groupCount(),
             next->contentHash());

    update.status = UpdateStatus::Changed;
    update.snapshot = next;
    if (onChange_) {
        try {
            onChange_(next);
        } catch (const std::exception& e) {
            LOG_ERROR("Topology: change callback failed: {}", e.what());
        }
    }
    return update;
}

}  // namespace discovery
}  // namespace zonelink
