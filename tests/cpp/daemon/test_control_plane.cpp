/**
 * @file test_control_plane.cpp
 * @brief Query commands and PUB events of the ZeroMQ control plane
 */

#include "daemon/api/events.h"
#include "daemon/control/control_plane.h"
#include "discovery/device_registry.h"
#include "discovery/discovery_orchestrator.h"
#include "support/fake_http_transport.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <zmq.hpp>

using namespace zonelink;
using zonelink::control::ControlPlane;
using zonelink::control::ControlPlaneDependencies;

namespace {

std::string makeIpcEndpoint() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/zonelink_control_plane_test_" << ::getpid() << "_" << counter++
        << ".sock";
    return oss.str();
}

upnp::DeviceDescriptor kitchenDescriptor() {
    upnp::DeviceDescriptor descriptor;
    descriptor.id = "RINCON_A";
    descriptor.roomName = "Kitchen";
    descriptor.modelName = "Sonos One";
    upnp::ServiceInfo topology;
    topology.serviceType = "urn:schemas-upnp-org:service:ZoneGroupTopology:1";
    topology.controlUrl = "/ZoneGroupTopology/Control";
    topology.eventSubUrl = "/ZoneGroupTopology/Event";
    descriptor.services.push_back(topology);
    return descriptor;
}

class ControlPlaneTest : public ::testing::Test {
   protected:
    void SetUp() override {
        discovery::OrchestratorConfig config;
        config.ssdp.multicastAddress = "127.0.0.1";
        config.events.callbackHost = "127.0.0.1";
        config.events.listenAddress = "127.0.0.1";
        orchestrator_ = std::make_unique<discovery::DiscoveryOrchestrator>(
            config, discovery::OrchestratorDependencies{registry_, transport_, &dispatcher_});
    }

    std::unique_ptr<ControlPlane> makeControlPlane(bool withOrchestrator = true) {
        ControlPlaneDependencies deps;
        deps.endpoint = makeIpcEndpoint();
        deps.orchestrator = withOrchestrator ? orchestrator_.get() : nullptr;
        deps.registry = &registry_;
        deps.dispatcher = &dispatcher_;
        deps.runningFlag = &running_;
        deps.reloadRequested = &reloadRequested_;
        deps.zmqBindFailed = &zmqBindFailed_;
        deps.quitMainLoop = [this]() { quitCalls_++; };
        return std::make_unique<ControlPlane>(std::move(deps));
    }

    static nlohmann::json parse(const std::string& reply) {
        return nlohmann::json::parse(reply);
    }

    test_support::FakeHttpTransport transport_;
    discovery::DeviceRegistry registry_;
    api::EventDispatcher dispatcher_;
    std::unique_ptr<discovery::DiscoveryOrchestrator> orchestrator_;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};
    std::atomic<bool> zmqBindFailed_{false};
    int quitCalls_ = 0;
};

}  // namespace

TEST_F(ControlPlaneTest, PingInBothForms) {
    auto plane = makeControlPlane();
    EXPECT_EQ(plane->handle("PING"), "OK:pong");

    auto reply = parse(plane->handle(R"({"cmd":"ping"})"));
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["message"], "pong");
    EXPECT_FALSE(reply.contains("data"));
}

TEST_F(ControlPlaneTest, UnknownCommandIsRejected) {
    auto plane = makeControlPlane();
    auto reply = parse(plane->handle(R"({"cmd":"PLAY"})"));
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error_code"], "IPC_INVALID_COMMAND");
}

TEST_F(ControlPlaneTest, DevicesListsRegisteredDevices) {
    auto plane = makeControlPlane();
    EXPECT_EQ(parse(plane->handle(R"({"cmd":"DEVICES"})"))["data"].size(), 0u);

    registry_.registerDevice(kitchenDescriptor(),
                             "http://10.0.0.5:1400/xml/device_description.xml");

    auto reply = parse(plane->handle(R"({"cmd":"DEVICES"})"));
    ASSERT_EQ(reply["data"].size(), 1u);
    EXPECT_EQ(reply["data"][0]["id"], "RINCON_A");
    EXPECT_EQ(reply["data"][0]["room"], "Kitchen");
    EXPECT_EQ(reply["data"][0]["ip"], "10.0.0.5");
    EXPECT_EQ(reply["data"][0]["topology"]["groupId"], nullptr);
}

TEST_F(ControlPlaneTest, DeviceLookupByIdOrRoom) {
    auto plane = makeControlPlane();
    registry_.registerDevice(kitchenDescriptor(),
                             "http://10.0.0.5:1400/xml/device_description.xml");

    auto byId = parse(plane->handle(R"({"cmd":"DEVICE","params":{"id":"uuid:RINCON_A"}})"));
    EXPECT_EQ(byId["status"], "ok");
    EXPECT_EQ(byId["data"]["room"], "Kitchen");

    auto byRoom = parse(plane->handle(R"({"cmd":"DEVICE","params":{"room":"kitchen"}})"));
    EXPECT_EQ(byRoom["data"]["id"], "RINCON_A");

    std::string raw = plane->handle("DEVICE:Kitchen");
    ASSERT_EQ(raw.rfind("OK:", 0), 0u);
    EXPECT_EQ(parse(raw.substr(3))["id"], "RINCON_A");
}

TEST_F(ControlPlaneTest, DeviceErrors) {
    auto plane = makeControlPlane();

    auto missing = parse(plane->handle(R"({"cmd":"DEVICE"})"));
    EXPECT_EQ(missing["error_code"], "IPC_INVALID_PARAMS");

    auto unknown = parse(plane->handle(R"({"cmd":"DEVICE","params":{"room":"Garage"}})"));
    EXPECT_EQ(unknown["error_code"], "IPC_NOT_FOUND");
    EXPECT_EQ(plane->handle("DEVICE:Garage"), "ERR:Unknown device: Garage");
}

TEST_F(ControlPlaneTest, ZonesWithEmptyTopology) {
    auto plane = makeControlPlane();

    auto zones = parse(plane->handle(R"({"cmd":"ZONES"})"));
    EXPECT_EQ(zones["data"]["version"], 0);
    EXPECT_EQ(zones["data"]["groups"].size(), 0u);

    auto zone = parse(plane->handle(R"({"cmd":"ZONE","params":{"room":"Kitchen"}})"));
    EXPECT_EQ(zone["error_code"], "IPC_NOT_FOUND");

    auto missing = parse(plane->handle(R"({"cmd":"ZONE"})"));
    EXPECT_EQ(missing["error_code"], "IPC_INVALID_PARAMS");
}

TEST_F(ControlPlaneTest, StatusIncludesIpcSection) {
    auto plane = makeControlPlane();
    auto status = parse(plane->handle(R"({"cmd":"STATUS"})"));
    EXPECT_EQ(status["data"]["running"], false);
    EXPECT_EQ(status["data"]["devices"]["total"], 0);
    EXPECT_EQ(status["data"]["topology"]["version"], 0);
    EXPECT_TRUE(status["data"]["ipc"]["endpoint"].is_string());
    EXPECT_TRUE(status["data"]["ipc"]["pubEndpoint"].is_string());
}

TEST_F(ControlPlaneTest, RescanRequiresRunningDiscovery) {
    auto plane = makeControlPlane();
    auto reply = parse(plane->handle(R"({"cmd":"RESCAN"})"));
    EXPECT_EQ(reply["error_code"], "IPC_DAEMON_NOT_RUNNING");
}

TEST_F(ControlPlaneTest, QueriesWithoutOrchestratorReportNotRunning) {
    auto plane = makeControlPlane(false);
    EXPECT_EQ(parse(plane->handle(R"({"cmd":"DEVICES"})"))["error_code"],
              "IPC_DAEMON_NOT_RUNNING");
    EXPECT_EQ(parse(plane->handle(R"({"cmd":"STATUS"})"))["error_code"],
              "IPC_DAEMON_NOT_RUNNING");
    // PING does not need discovery
    EXPECT_EQ(plane->handle("PING"), "OK:pong");
}

TEST_F(ControlPlaneTest, ReloadSetsFlagAndQuitsMainLoop) {
    auto plane = makeControlPlane();
    auto reply = parse(plane->handle(R"({"cmd":"RELOAD"})"));
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["message"], "Reload scheduled");
    EXPECT_TRUE(reloadRequested_.load());
    EXPECT_EQ(quitCalls_, 1);
    EXPECT_TRUE(running_.load());
}

TEST_F(ControlPlaneTest, BuildEventShape) {
    auto event = ControlPlane::buildEvent("device_found", {{"id", "RINCON_A"}});
    EXPECT_EQ(event["type"], "device_found");
    EXPECT_TRUE(event["timestamp"].is_number_integer());
    EXPECT_GT(event["timestamp"].get<int64_t>(), 0);
    EXPECT_EQ(event["data"]["id"], "RINCON_A");
}

TEST_F(ControlPlaneTest, BuildOkResponseRawForms) {
    auto raw = ipc::ZmqCommandServer::parseRequest("PING");
    EXPECT_EQ(ControlPlane::buildOkResponse(raw), "OK");
    EXPECT_EQ(ControlPlane::buildOkResponse(raw, nullptr, "done"), "OK:done");
    EXPECT_EQ(ControlPlane::buildOkResponse(raw, {{"a", 1}}), "OK:{\"a\":1}");
}

TEST_F(ControlPlaneTest, DispatcherEventsArePublished) {
    auto plane = makeControlPlane();
    ASSERT_TRUE(plane->start());

    zmq::context_t ctx(1);
    zmq::socket_t sub(ctx, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 200);
    sub.connect(plane->pubEndpoint());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto registration = registry_.registerDevice(
        kitchenDescriptor(), "http://10.0.0.5:1400/xml/device_description.xml");

    zmq::message_t msg;
    bool received = false;
    for (int i = 0; i < 10 && !received; ++i) {
        dispatcher_.publish(api::DeviceChanged{api::DeviceChange::Found, registration.device});
        if (sub.recv(msg, zmq::recv_flags::none)) {
            received = true;
        }
    }
    ASSERT_TRUE(received);

    auto event = nlohmann::json::parse(std::string(static_cast<char*>(msg.data()), msg.size()));
    EXPECT_EQ(event["type"], "device_found");
    EXPECT_EQ(event["data"]["id"], "RINCON_A");
    EXPECT_GE(plane->eventsPublished(), 1u);

    plane->stop();
    uint64_t before = plane->eventsPublished();
    dispatcher_.publish(api::DeviceEvent{"RINCON_A", "AVTransport", "<e/>", {}});
    EXPECT_EQ(plane->eventsPublished(), before);
}

TEST_F(ControlPlaneTest, BindFailureStopsTheDaemon) {
    ControlPlaneDependencies deps;
    deps.endpoint = "tcp://127.0.0.1:47321";
    deps.runningFlag = &running_;
    deps.zmqBindFailed = &zmqBindFailed_;
    deps.quitMainLoop = [this]() { quitCalls_++; };

    ControlPlane first(deps);
    ASSERT_TRUE(first.start());

    ControlPlane second(deps);
    EXPECT_FALSE(second.start());
    EXPECT_TRUE(zmqBindFailed_.load());
    EXPECT_FALSE(running_.load());
    EXPECT_EQ(quitCalls_, 1);
}
