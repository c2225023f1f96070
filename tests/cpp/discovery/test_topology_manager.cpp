/**
 * @file test_topology_manager.cpp
 * @brief ZoneGroupState resolution, snapshot invariants and change de-duplication
 */

#include "core/error_codes.h"
#include "discovery/topology_manager.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <set>

using namespace zonelink;
using namespace zonelink::discovery;

namespace {

upnp::DeviceDescriptor descriptor(const std::string& id, const std::string& room,
                                  const std::string& model = "Sonos One") {
    upnp::DeviceDescriptor d;
    d.id = id;
    d.roomName = room;
    d.modelName = model;
    return d;
}

std::string member(const std::string& uuid, const std::string& zone, const std::string& ip,
                   const std::string& extra = "") {
    return "<ZoneGroupMember UUID=\"" + uuid + "\" Location=\"http://" + ip +
           ":1400/xml/device_description.xml\" ZoneName=\"" + zone + "\" " + extra + "/>";
}

std::string kitchenA() {
    return member("RINCON_A", "Kitchen", "10.0.0.5");
}

std::string officeB() {
    return member("RINCON_B", "Office", "10.0.0.6");
}

std::string state(const std::string& groups) {
    return "<ZoneGroupState><ZoneGroups>" + groups +
           "</ZoneGroups><VanishedDevices></VanishedDevices></ZoneGroupState>";
}

std::string group(const std::string& id, const std::string& coordinator,
                  const std::string& members) {
    return "<ZoneGroup Coordinator=\"" + coordinator + "\" ID=\"" + id + "\">" + members +
           "</ZoneGroup>";
}

// GENA property set with the document escaped into the ZoneGroupState variable
std::string propertySet(const std::string& document) {
    std::string escaped;
    for (char c : document) {
        switch (c) {
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '&':
            escaped += "&amp;";
            break;
        default:
            escaped.push_back(c);
        }
    }
    return "<e:propertyset xmlns:e=\"urn:schemas-upnp-org:event-1-0\"><e:property>"
           "<ZoneGroupState>" +
           escaped + "</ZoneGroupState></e:property><e:property><ThirdPartyMediaServersX>"
                     "</ThirdPartyMediaServersX></e:property></e:propertyset>";
}

// Every device referenced by a group is registered, no group is empty, no
// device is in two groups, and each coordinator is a member of its group.
void expectWellFormed(const TopologySnapshot& snapshot, const DeviceRegistry& registry) {
    std::set<std::string> seen;
    for (const auto& g : snapshot.groups()) {
        EXPECT_FALSE(g.memberIds.empty()) << g.id;
        EXPECT_NE(std::find(g.memberIds.begin(), g.memberIds.end(), g.coordinatorId),
                  g.memberIds.end())
            << "coordinator outside group " << g.id;
        for (const auto& id : g.memberIds) {
            EXPECT_TRUE(registry.contains(id)) << id;
            EXPECT_TRUE(seen.insert(id).second) << id << " placed twice";
        }
    }
}

class TopologyManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        manager_ = std::make_unique<TopologyManager>(
            registry_,
            [this](const TopologySnapshotPtr& snapshot) { changes_.push_back(snapshot); });
    }

    void add(const std::string& id, const std::string& room, const std::string& ip) {
        registry_.registerDevice(descriptor(id, room),
                                 "http://" + ip + ":1400/xml/device_description.xml");
    }

    DeviceRegistry registry_;
    std::unique_ptr<TopologyManager> manager_;
    std::vector<TopologySnapshotPtr> changes_;
};

}  // namespace

TEST_F(TopologyManagerTest, InitialSnapshotIsEmpty) {
    auto snapshot = manager_->snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->groupCount(), 0u);
    EXPECT_EQ(snapshot->version(), 0u);
    EXPECT_FALSE(snapshot->contentHash().empty());
}

TEST_F(TopologyManagerTest, StandaloneCoordinator) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    auto update = manager_->applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A", kitchenA())));

    EXPECT_EQ(update.status, UpdateStatus::Changed);
    auto snapshot = manager_->snapshot();
    ASSERT_EQ(snapshot->groupCount(), 1u);
    EXPECT_TRUE(snapshot->isCoordinator("RINCON_A"));
    EXPECT_TRUE(snapshot->isCoordinator("uuid:RINCON_A"));
    EXPECT_EQ(snapshot->coordinatorOf("RINCON_A"), "RINCON_A");
    EXPECT_EQ(snapshot->membersOf("RINCON_A"), std::vector<std::string>{"RINCON_A"});
    EXPECT_EQ(snapshot->roomCoordinator("kitchen").value_or(""), "RINCON_A");
    EXPECT_EQ(snapshot->version(), 1u);
    ASSERT_EQ(changes_.size(), 1u);
    EXPECT_EQ(changes_[0], snapshot);
}

TEST_F(TopologyManagerTest, StereoPairHasOneCoordinatorAndTwoMembers) {
    add("RINCON_L", "Living Room", "10.0.0.10");
    add("RINCON_R", "Living Room", "10.0.0.11");
    const std::string cms = "ChannelMapSet=\"RINCON_L:LF,LF;RINCON_R:RF,RF\"";
    manager_->applyZoneGroupState(
        "RINCON_L",
        state(group("RINCON_L:5", "RINCON_L",
                    member("RINCON_L", "Living Room", "10.0.0.10", cms) +
                        member("RINCON_R", "Living Room", "10.0.0.11",
                               cms + " Invisible=\"1\""))));

    auto snapshot = manager_->snapshot();
    ASSERT_EQ(snapshot->groupCount(), 1u);
    EXPECT_EQ(snapshot->membersOf("RINCON_R").size(), 2u);
    int coordinators = 0;
    for (const auto& id : snapshot->membersOf("RINCON_L")) {
        coordinators += snapshot->isCoordinator(id) ? 1 : 0;
    }
    EXPECT_EQ(coordinators, 1);
    EXPECT_EQ(snapshot->stereoPairPrimary("Living Room").value_or(""), "RINCON_L");
    EXPECT_EQ(snapshot->roomCoordinator("Living Room").value_or(""), "RINCON_L");
    ASSERT_NE(snapshot->member("RINCON_R"), nullptr);
    EXPECT_TRUE(snapshot->member("RINCON_R")->invisible);
    expectWellFormed(*snapshot, registry_);
}

TEST_F(TopologyManagerTest, StereoPrimaryAnswersWhenCoordinatorIsElsewhere) {
    add("RINCON_K", "Kitchen", "10.0.0.5");
    add("RINCON_L", "Living Room", "10.0.0.10");
    add("RINCON_R", "Living Room", "10.0.0.11");
    const std::string cms = "ChannelMapSet=\"RINCON_L:LF,LF;RINCON_R:RF,RF\"";
    manager_->applyZoneGroupState(
        "RINCON_K",
        state(group("RINCON_K:1", "RINCON_K",
                    member("RINCON_K", "Kitchen", "10.0.0.5") +
                        member("RINCON_R", "Living Room", "10.0.0.11", cms) +
                        member("RINCON_L", "Living Room", "10.0.0.10", cms))));

    auto snapshot = manager_->snapshot();
    EXPECT_EQ(snapshot->roomCoordinator("Living Room").value_or(""), "RINCON_L");
    EXPECT_EQ(snapshot->roomCoordinator("Kitchen").value_or(""), "RINCON_K");
    EXPECT_FALSE(snapshot->stereoPairPrimary("Kitchen").has_value());
    EXPECT_FALSE(snapshot->roomCoordinator("Garage").has_value());
}

TEST_F(TopologyManagerTest, StereoPrimaryMustBeAGroupMember) {
    add("RINCON_L", "Living Room", "10.0.0.10");
    add("RINCON_R", "Living Room", "10.0.0.11");
    // Left channel names a player that is not part of the group
    const std::string cms = "ChannelMapSet=\"RINCON_X:LF,LF;RINCON_R:RF,RF\"";
    manager_->applyZoneGroupState(
        "RINCON_R",
        state(group("RINCON_R:3", "RINCON_R",
                    member("RINCON_R", "Living Room", "10.0.0.11", cms) +
                        member("RINCON_L", "Living Room", "10.0.0.10", cms))));

    auto snapshot = manager_->snapshot();
    EXPECT_FALSE(snapshot->stereoPairPrimary("Living Room").has_value());
    EXPECT_EQ(snapshot->roomCoordinator("Living Room").value_or(""), "RINCON_R");
}

TEST_F(TopologyManagerTest, UnknownMembersAreDroppedAndReported) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    auto update = manager_->applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A",
                                kitchenA() +
                                    member("RINCON_X", "Den", "10.0.0.99"))));

    EXPECT_EQ(update.status, UpdateStatus::Changed);
    EXPECT_EQ(manager_->snapshot()->membersOf("RINCON_A"), std::vector<std::string>{"RINCON_A"});
    EXPECT_EQ(manager_->snapshot()->groupFor("RINCON_X"), nullptr);
    ASSERT_EQ(update.unresolvedLocations.size(), 1u);
    EXPECT_EQ(update.unresolvedLocations[0], "http://10.0.0.99:1400/xml/device_description.xml");
    expectWellFormed(*manager_->snapshot(), registry_);
}

TEST_F(TopologyManagerTest, GroupWithUnknownCoordinatorIsOmitted) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    add("RINCON_B", "Office", "10.0.0.6");
    auto update = manager_->applyZoneGroupState(
        "RINCON_A",
        state(group("RINCON_A:1", "RINCON_A", kitchenA()) +
              group("RINCON_X:2", "RINCON_X",
                    member("RINCON_X", "Den", "10.0.0.99") + officeB())));

    auto snapshot = manager_->snapshot();
    EXPECT_EQ(snapshot->groupCount(), 1u);
    EXPECT_EQ(snapshot->groupFor("RINCON_B"), nullptr);
    EXPECT_EQ(update.unresolvedLocations,
              std::vector<std::string>{"http://10.0.0.99:1400/xml/device_description.xml"});
    expectWellFormed(*snapshot, registry_);
}

TEST_F(TopologyManagerTest, CoordinatorMissingFromMembersIsInsertedFirst) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    add("RINCON_B", "Office", "10.0.0.6");
    manager_->applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A", officeB())));

    auto members = manager_->snapshot()->membersOf("RINCON_B");
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0], "RINCON_A");
    EXPECT_EQ(manager_->snapshot()->member("RINCON_A")->zoneName, "Kitchen");
    expectWellFormed(*manager_->snapshot(), registry_);
}

TEST_F(TopologyManagerTest, DeviceIsPlacedInOneGroupOnly) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    add("RINCON_B", "Office", "10.0.0.6");
    manager_->applyZoneGroupState(
        "RINCON_A",
        state(group("RINCON_A:1", "RINCON_A",
                    kitchenA() + officeB()) +
              group("RINCON_B:2", "RINCON_B", officeB())));

    auto snapshot = manager_->snapshot();
    EXPECT_EQ(snapshot->groupCount(), 1u);
    EXPECT_EQ(snapshot->coordinatorOf("RINCON_B"), "RINCON_A");
    expectWellFormed(*snapshot, registry_);
}

TEST_F(TopologyManagerTest, IdenticalEventsRaiseOneChange) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    add("RINCON_B", "Office", "10.0.0.6");
    const std::string doc =
        state(group("RINCON_A:1", "RINCON_A", kitchenA()) +
              group("RINCON_B:2", "RINCON_B", officeB()));
    // Same groups listed in the other order
    const std::string reordered =
        state(group("RINCON_B:2", "RINCON_B", officeB()) +
              group("RINCON_A:1", "RINCON_A", kitchenA()));

    EXPECT_EQ(
        manager_->handleTopologyEvent("RINCON_A", "ZoneGroupTopology", propertySet(doc)).status,
        UpdateStatus::Changed);
    EXPECT_EQ(
        manager_->handleTopologyEvent("RINCON_B", "ZoneGroupTopology", propertySet(doc)).status,
        UpdateStatus::Unchanged);
    EXPECT_EQ(manager_->applyZoneGroupState("RINCON_A", reordered).status, UpdateStatus::Unchanged);

    EXPECT_EQ(changes_.size(), 1u);
    EXPECT_EQ(manager_->snapshot()->version(), 1u);
    EXPECT_EQ(manager_->documentsAccepted(), 3u);
}

TEST_F(TopologyManagerTest, GroupingChangeProducesNewSnapshot) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    add("RINCON_B", "Office", "10.0.0.6");
    manager_->applyZoneGroupState(
        "RINCON_A",
        state(group("RINCON_A:1", "RINCON_A", kitchenA()) +
              group("RINCON_B:2", "RINCON_B", officeB())));
    auto before = manager_->snapshot();

    manager_->applyZoneGroupState(
        "RINCON_A",
        state(group("RINCON_A:1", "RINCON_A",
                    kitchenA() + officeB())));
    auto after = manager_->snapshot();

    // A reader holding the old snapshot still sees the old grouping
    EXPECT_EQ(before->groupCount(), 2u);
    EXPECT_TRUE(before->isCoordinator("RINCON_B"));
    EXPECT_EQ(after->groupCount(), 1u);
    EXPECT_FALSE(after->isCoordinator("RINCON_B"));
    EXPECT_EQ(after->version(), 2u);
    EXPECT_NE(before->contentHash(), after->contentHash());
    EXPECT_EQ(changes_.size(), 2u);
}

TEST_F(TopologyManagerTest, RefreshPicksUpNewlyRegisteredMembers) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    const std::string doc = state(group(
        "RINCON_A:1", "RINCON_A",
        kitchenA() + officeB()));
    manager_->applyZoneGroupState("RINCON_A", doc);
    EXPECT_EQ(manager_->snapshot()->membersOf("RINCON_A").size(), 1u);

    add("RINCON_B", "Office", "10.0.0.6");
    auto update = manager_->refresh();
    EXPECT_EQ(update.status, UpdateStatus::Changed);
    EXPECT_EQ(manager_->snapshot()->membersOf("RINCON_A").size(), 2u);
    EXPECT_TRUE(update.unresolvedLocations.empty());
}

TEST_F(TopologyManagerTest, RefreshWithoutDocumentIsUnchanged) {
    EXPECT_EQ(manager_->refresh().status, UpdateStatus::Unchanged);
    EXPECT_TRUE(changes_.empty());
}

TEST_F(TopologyManagerTest, StaleDevicesStayInTopology) {
    DeviceRegistry registry(1);
    TopologyManager manager(registry);
    registry.registerDevice(descriptor("RINCON_A", "Kitchen"),
                            "http://10.0.0.5:1400/xml/device_description.xml");
    registry.beginSearchCycle();
    registry.beginSearchCycle();
    ASSERT_EQ(registry.staleCount(), 1u);

    manager.applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A", kitchenA())));
    EXPECT_TRUE(manager.snapshot()->isCoordinator("RINCON_A"));
}

TEST_F(TopologyManagerTest, LegacyZoneGroupsRootIsAccepted) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    auto update = manager_->applyZoneGroupState(
        "RINCON_A",
        "<ZoneGroups>" +
            group("RINCON_A:1", "uuid:RINCON_A", member("uuid:RINCON_A", "Kitchen", "10.0.0.5")) +
            "</ZoneGroups>");
    EXPECT_EQ(update.status, UpdateStatus::Changed);
    EXPECT_TRUE(manager_->snapshot()->isCoordinator("RINCON_A"));
}

TEST_F(TopologyManagerTest, MalformedDocumentKeepsLastSnapshot) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    manager_->applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A", kitchenA())));
    auto good = manager_->snapshot();

    try {
        manager_->applyZoneGroupState("RINCON_A", "<ZoneGroupState><ZoneGroups>");
        FAIL() << "expected TopologyParseError";
    } catch (const TopologyParseError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TOPOLOGY_PARSE_FAILED);
    }
    EXPECT_THROW(manager_->applyZoneGroupState("RINCON_A", "<Other/>"), TopologyParseError);
    EXPECT_THROW(manager_->handleTopologyEvent("RINCON_A", "ZoneGroupTopology", "<e:propertyset"),
                 TopologyParseError);

    EXPECT_EQ(manager_->snapshot(), good);
    EXPECT_EQ(manager_->documentsRejected(), 3u);
    EXPECT_EQ(changes_.size(), 1u);
}

TEST_F(TopologyManagerTest, EventsWithoutZoneGroupStateAreIgnored) {
    const std::string body =
        "<e:propertyset xmlns:e=\"urn:schemas-upnp-org:event-1-0\"><e:property>"
        "<AvailableSoftwareUpdate>&lt;UpdateItem/&gt;</AvailableSoftwareUpdate>"
        "</e:property></e:propertyset>";
    EXPECT_EQ(manager_->handleTopologyEvent("RINCON_A", "ZoneGroupTopology", body).status,
              UpdateStatus::Ignored);
    EXPECT_EQ(manager_->handleTopologyEvent("RINCON_A", "MediaRenderer/AVTransport", body).status,
              UpdateStatus::Ignored);
    EXPECT_TRUE(changes_.empty());
}

TEST_F(TopologyManagerTest, JsonResolvesRoomsThroughRegistry) {
    add("RINCON_A", "Kitchen", "10.0.0.5");
    manager_->applyZoneGroupState(
        "RINCON_A", state(group("RINCON_A:1", "RINCON_A", member("RINCON_A", "", "10.0.0.5"))));

    auto j = manager_->snapshot()->toJson(registry_);
    EXPECT_EQ(j["version"], 1);
    ASSERT_EQ(j["groups"].size(), 1u);
    EXPECT_EQ(j["groups"][0]["coordinator"]["room"], "Kitchen");
    EXPECT_EQ(j["groups"][0]["members"][0]["liveness"], "active");
}
