#include "daemon/app/app.h"

#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "daemon/control/control_plane.h"
#include "daemon/lifecycle/shutdown_manager.h"
#include "discovery/discovery_orchestrator.h"
#include "logging/logger.h"
#include "net/http_client.h"

#include <chrono>
#include <thread>

namespace zonelink::app {

Components::Components() = default;
Components::~Components() = default;

App::App(RuntimeState& state, std::string configFilePath)
    : state_(state), configFilePath_(std::move(configFilePath)) {}

bool App::loadRuntimeConfig(const std::string& configFilePath, const AppOverrides& overrides,
                            AppConfig& config) {
    config = AppConfig{};
    if (!loadAppConfig(configFilePath, config)) {
        LOG_INFO("Config: using defaults (no usable {})", configFilePath);
    }

    std::string error;
    if (!applyEnvironmentOverrides(config, error)) {
        LOG_ERROR("Config: {}", error);
        return false;
    }

    if (overrides.callbackHost) {
        config.events.callbackHost = *overrides.callbackHost;
    }
    if (overrides.callbackPort) {
        config.events.callbackPort = *overrides.callbackPort;
    }
    if (overrides.logLevel) {
        config.logging.level = logging::stringToLevel(*overrides.logLevel);
    }
    return true;
}

bool App::buildComponents() {
    Components& c = state_.components;
    const AppConfig& config = state_.config;

    c.registry = std::make_unique<discovery::DeviceRegistry>(config.discovery.staleAfterCycles);
    c.transport = std::make_unique<net::PosixHttpTransport>();
    c.dispatcher = std::make_unique<api::EventDispatcher>();
    c.orchestrator = std::make_unique<discovery::DiscoveryOrchestrator>(
        discovery::OrchestratorConfig::fromAppConfig(config),
        discovery::OrchestratorDependencies{*c.registry, *c.transport, c.dispatcher.get()});

    control::ControlPlaneDependencies controlDeps;
    controlDeps.endpoint = config.zeromq.endpoint;
    controlDeps.orchestrator = c.orchestrator.get();
    controlDeps.registry = c.registry.get();
    controlDeps.dispatcher = c.dispatcher.get();
    controlDeps.runningFlag = &state_.flags.running;
    controlDeps.reloadRequested = &state_.flags.reloadRequested;
    controlDeps.zmqBindFailed = &state_.flags.zmqBindFailed;
    c.controlPlane = std::make_unique<control::ControlPlane>(std::move(controlDeps));

    if (!c.controlPlane->start()) {
        LOG_ERROR("Startup aborted: cannot bind ZeroMQ endpoint {}", config.zeromq.endpoint);
        return false;
    }

    try {
        c.orchestrator->start();
    } catch (const DiscoverySocketError& e) {
        LOG_ERROR("Startup aborted: {} ({})", e.what(), errorCodeToString(e.code()));
        return false;
    }
    return true;
}

void App::teardownComponents() {
    Components& c = state_.components;
    // Stop publishers before the sockets they publish on
    if (c.orchestrator) {
        c.orchestrator->stop();
    }
    if (c.controlPlane) {
        c.controlPlane->stop();
    }
    c.controlPlane.reset();
    c.orchestrator.reset();
    c.dispatcher.reset();
    c.transport.reset();
    c.registry.reset();
}

int App::run(const AppOverrides& overrides) {
    lifecycle::ShutdownManager::Dependencies shutdownDeps{&state_.flags.running,
                                                          &state_.flags.reloadRequested};
    lifecycle::ShutdownManager shutdownManager(shutdownDeps);
    shutdownManager.installSignalHandlers();

    int exitCode = 0;

    do {
        shutdownManager.reset();
        state_.flags.zmqBindFailed.store(false);

        if (!loadRuntimeConfig(configFilePath_, overrides, state_.config)) {
            exitCode = 1;
            break;
        }
        logging::initialize(state_.config.logging);
        if (state_.reloadCount > 0) {
            LOG_INFO("Reload #{}: configuration re-read from {}", state_.reloadCount,
                     configFilePath_);
        }

        bool started = buildComponents();
        if (started) {
            LOG_INFO("Discovering {} via {}:{} (search every {}s)",
                     state_.config.discovery.searchTarget,
                     state_.config.discovery.multicastAddress, state_.config.discovery.port,
                     state_.config.discovery.searchIntervalSec);
            LOG_INFO("Queries on {}, events on {}", state_.config.zeromq.endpoint,
                     state_.components.controlPlane->pubEndpoint());
            shutdownManager.notifyReady();

            const auto interval =
                std::chrono::milliseconds(DaemonConstants::MAIN_LOOP_INTERVAL_MS);
            while (state_.flags.running.load() && !state_.flags.reloadRequested.load() &&
                   !state_.flags.zmqBindFailed.load()) {
                std::this_thread::sleep_for(interval);
                shutdownManager.tick();
            }
        } else {
            exitCode = 1;
            state_.flags.reloadRequested = false;
        }

        shutdownManager.runShutdownSequence();
        teardownComponents();

        if (state_.flags.zmqBindFailed.load()) {
            LOG_ERROR("Exiting due to ZeroMQ initialization failure");
            exitCode = 1;
            break;
        }

        if (state_.flags.reloadRequested) {
            state_.reloadCount++;
            LOG_INFO("Reload requested, rebuilding components (discovery restarts from scratch)");
        }
    } while (state_.flags.reloadRequested);

    LOG_INFO("zonelinkd stopped");
    return exitCode;
}

}  // namespace zonelink::app
