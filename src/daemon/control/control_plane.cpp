#include "daemon/control/control_plane.h"

#include "discovery/device_registry.h"
#include "discovery/discovery_orchestrator.h"
#include "logging/logger.h"

#include <chrono>
#include <utility>

namespace zonelink::control {
namespace {

int64_t epochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string invalidParams(const ipc::ZmqRequest& request, const std::string& message) {
    return ipc::ZmqCommandServer::errorResponse(request, ErrorCode::IPC_INVALID_PARAMS, message);
}

std::string notFound(const ipc::ZmqRequest& request, const std::string& message) {
    return ipc::ZmqCommandServer::errorResponse(request, ErrorCode::IPC_NOT_FOUND, message);
}

}  // namespace

ControlPlane::ControlPlane(ControlPlaneDependencies deps)
    : deps_(std::move(deps)), zmqServer_(std::make_unique<ipc::ZmqCommandServer>(deps_.endpoint)) {
    registerHandlers();
    subscribeEvents();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    if (zmqServer_->start()) {
        publishing_.store(true, std::memory_order_release);
        return true;
    }

    if (deps_.zmqBindFailed) {
        deps_.zmqBindFailed->store(true, std::memory_order_release);
    }
    if (deps_.runningFlag) {
        deps_.runningFlag->store(false, std::memory_order_release);
    }
    if (deps_.quitMainLoop) {
        deps_.quitMainLoop();
    }
    return false;
}

void ControlPlane::stop() {
    publishing_.store(false, std::memory_order_release);
    zmqServer_->stop();
}

const std::string& ControlPlane::pubEndpoint() const {
    return zmqServer_->pubEndpoint();
}

std::string ControlPlane::handle(const std::string& raw) {
    return zmqServer_->dispatch(ipc::ZmqCommandServer::parseRequest(raw));
}

nlohmann::json ControlPlane::buildEvent(const std::string& type, const nlohmann::json& data) {
    nlohmann::json event;
    event["type"] = type;
    event["timestamp"] = epochMillis(std::chrono::system_clock::now());
    event["data"] = data;
    return event;
}

std::string ControlPlane::buildOkResponse(const ipc::ZmqRequest& request,
                                          const nlohmann::json& data, const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!message.empty()) {
            resp["message"] = message;
        }
        if (!data.is_null()) {
            resp["data"] = data;
        }
        return resp.dump();
    }

    if (!data.is_null()) {
        return "OK:" + data.dump();
    }
    if (!message.empty()) {
        return "OK:" + message;
    }
    return "OK";
}

void ControlPlane::registerHandlers() {
    zmqServer_->registerCommand("PING", [this](const auto& req) { return handlePing(req); });
    zmqServer_->registerCommand("DEVICES", [this](const auto& req) { return handleDevices(req); });
    zmqServer_->registerCommand("DEVICE", [this](const auto& req) { return handleDevice(req); });
    zmqServer_->registerCommand("ZONES", [this](const auto& req) { return handleZones(req); });
    zmqServer_->registerCommand("ZONE", [this](const auto& req) { return handleZone(req); });
    zmqServer_->registerCommand("STATUS", [this](const auto& req) { return handleStatus(req); });
    zmqServer_->registerCommand("RESCAN", [this](const auto& req) { return handleRescan(req); });
    zmqServer_->registerCommand("RELOAD", [this](const auto& req) { return handleReload(req); });
}

void ControlPlane::subscribeEvents() {
    if (!deps_.dispatcher) {
        return;
    }
    deps_.dispatcher->subscribe([this](const api::DeviceChanged& event) {
        publish(buildEvent(api::deviceChangeToString(event.change), event.device->toJson()));
    });
    deps_.dispatcher->subscribe([this](const api::TopologyChanged& event) {
        nlohmann::json data;
        if (deps_.registry) {
            data = event.snapshot->toJson(*deps_.registry);
        } else {
            data = {{"version", event.snapshot->version()},
                    {"groups", event.snapshot->groupCount()}};
        }
        publish(buildEvent("topology_changed", data));
    });
    deps_.dispatcher->subscribe([this](const api::DeviceEvent& event) {
        nlohmann::json data;
        data["deviceId"] = event.deviceId;
        data["service"] = event.service;
        data["body"] = event.body;
        data["receivedAt"] = epochMillis(event.receivedAt);
        publish(buildEvent("device_event", data));
    });
}

void ControlPlane::publish(const nlohmann::json& event) {
    if (!publishing_.load(std::memory_order_acquire)) {
        return;
    }
    if (zmqServer_->publish(event.dump())) {
        eventsPublished_.fetch_add(1, std::memory_order_relaxed);
    } else {
        LOG_EVERY_N(WARN, 100, "ZeroMQ: event {} not published", event.value("type", ""));
    }
}

discovery::DiscoveryOrchestrator& ControlPlane::orchestrator() {
    if (!deps_.orchestrator) {
        throw Error(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Discovery is not running");
    }
    return *deps_.orchestrator;
}

// ========== Handlers ==========

std::string ControlPlane::handlePing(const ipc::ZmqRequest& request) {
    return buildOkResponse(request, nullptr, "pong");
}

std::string ControlPlane::handleDevices(const ipc::ZmqRequest& request) {
    return buildOkResponse(request, orchestrator().buildDevicesJson());
}

std::string ControlPlane::handleDevice(const ipc::ZmqRequest& request) {
    std::string key = request.param("id");
    if (key.empty()) {
        key = request.param("room");
    }
    if (key.empty()) {
        return invalidParams(request, "Missing params.id or params.room");
    }
    auto device = orchestrator().buildDeviceJson(key);
    if (!device) {
        return notFound(request, "Unknown device: " + key);
    }
    return buildOkResponse(request, *device);
}

std::string ControlPlane::handleZones(const ipc::ZmqRequest& request) {
    return buildOkResponse(request, orchestrator().buildZonesJson());
}

std::string ControlPlane::handleZone(const ipc::ZmqRequest& request) {
    std::string room = request.param("room");
    if (room.empty()) {
        return invalidParams(request, "Missing params.room");
    }
    auto zone = orchestrator().buildZoneJson(room);
    if (!zone) {
        return notFound(request, "No zone for room: " + room);
    }
    return buildOkResponse(request, *zone);
}

std::string ControlPlane::handleStatus(const ipc::ZmqRequest& request) {
    nlohmann::json data = orchestrator().buildStatusJson();
    data["ipc"] = {{"endpoint", zmqServer_->endpoint()},
                   {"pubEndpoint", zmqServer_->pubEndpoint()},
                   {"requestsServed", zmqServer_->requestsServed()},
                   {"eventsPublished", eventsPublished()}};
    return buildOkResponse(request, data);
}

std::string ControlPlane::handleRescan(const ipc::ZmqRequest& request) {
    if (!orchestrator().rescan()) {
        return ipc::ZmqCommandServer::errorResponse(request, ErrorCode::IPC_DAEMON_NOT_RUNNING,
                                                    "Discovery is not running");
    }
    return buildOkResponse(request, nullptr, "Search scheduled");
}

std::string ControlPlane::handleReload(const ipc::ZmqRequest& request) {
    if (deps_.reloadRequested) {
        deps_.reloadRequested->store(true);
    }
    if (deps_.quitMainLoop) {
        deps_.quitMainLoop();
    }
    LOG_INFO("ZeroMQ: reload requested");
    return buildOkResponse(request, nullptr, "Reload scheduled");
}

}  // namespace zonelink::control
