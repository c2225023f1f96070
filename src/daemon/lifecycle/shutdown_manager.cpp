#include "daemon/lifecycle/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <stdexcept>
#include <utility>

namespace zonelink::lifecycle {

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.runningFlag || !deps_.reloadFlag) {
        throw std::invalid_argument("ShutdownManager requires running/reload flags");
    }

    controller_.setSignalState(&globalSignalState());
    controller_.setLogCallback([](const char* message) { LOG_INFO("{}", message); });
    controller_.setQuitLoopCallback([this]() {
        if (quitLoopCallback_) {
            quitLoopCallback_();
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void ShutdownManager::setQuitLoopCallback(std::function<void()> cb) {
    quitLoopCallback_ = std::move(cb);
}

void ShutdownManager::notifyReady() {
    if (readyNotified_) {
        return;
    }
    readyNotified_ = true;
    readyAt_ = std::chrono::steady_clock::now();
    LOG_INFO("Daemon ready");
}

void ShutdownManager::tick() {
    if (controller_.processPendingSignals()) {
        deps_.runningFlag->store(controller_.isRunning());
        deps_.reloadFlag->store(controller_.isReloadRequested());
    }
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;
    if (deps_.reloadFlag->load()) {
        LOG_INFO("Stopping components for reload...");
    } else {
        LOG_INFO("Shutting down...");
    }
}

void ShutdownManager::reset() {
    sequenceRan_ = false;
    readyNotified_ = false;
    readyAt_ = {};
    deps_.runningFlag->store(true);
    deps_.reloadFlag->store(false);
    controller_.setRunning(true);
    controller_.clearReloadRequest();
    globalSignalState().reset();
}

bool ShutdownManager::isRunning() const {
    return controller_.isRunning();
}

bool ShutdownManager::isReloadRequested() const {
    return controller_.isReloadRequested();
}

std::chrono::steady_clock::duration ShutdownManager::uptime() const {
    if (!readyNotified_) {
        return std::chrono::steady_clock::duration::zero();
    }
    return std::chrono::steady_clock::now() - readyAt_;
}

}  // namespace zonelink::lifecycle
