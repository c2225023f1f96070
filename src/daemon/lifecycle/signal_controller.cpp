#include "daemon/lifecycle/signal_controller.h"

#include <cstdio>

namespace zonelink::lifecycle {

namespace {
SignalState g_signalState;
}  // namespace

SignalState& globalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

bool SignalController::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::None;

    if (signalState_->shutdown) {
        signalState_->shutdown = 0;
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        // A reload requested earlier must not restart the daemon after a shutdown
        reloadRequested_ = false;
        finish(Action::Shutdown, "Received signal %d, shutting down");
        return true;
    }

    if (signalState_->reload) {
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        reloadRequested_ = true;
        finish(Action::Reload, "Received SIGHUP (signal %d), reloading configuration");
        return true;
    }

    return false;
}

void SignalController::finish(Action action, const char* message) {
    lastAction_ = action;
    if (logCallback_) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), message, lastSignal_);
        logCallback_(buf);
    }
    if (quitLoopCallback_) {
        quitLoopCallback_();
    }
    running_ = false;
}

}  // namespace zonelink::lifecycle
