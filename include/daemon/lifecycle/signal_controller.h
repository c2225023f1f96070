#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace zonelink::lifecycle {

// ========== Signal State ==========
// Written only by signalHandler, polled by the main loop.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

// ========== Signal Controller ==========
// Turns pending signal flags into running / reload state. Testable without
// delivering real signals.

class SignalController {
   public:
    using QuitLoopCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    enum class Action { None, Shutdown, Reload };

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setQuitLoopCallback(QuitLoopCallback cb) {
        quitLoopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Returns true if a signal was consumed. Shutdown wins over a pending reload.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    void setRunning(bool running) {
        running_ = running;
    }

    bool isReloadRequested() const {
        return reloadRequested_.load();
    }
    void clearReloadRequest() {
        reloadRequested_ = false;
    }

    int lastSignal() const {
        return lastSignal_;
    }
    Action lastAction() const {
        return lastAction_;
    }

   private:
    void finish(Action action, const char* message);

    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};

    QuitLoopCallback quitLoopCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    Action lastAction_ = Action::None;
};

// Async-signal-safe: only sets flags in the global SignalState.
void signalHandler(int sig);

SignalState& globalSignalState();

}  // namespace zonelink::lifecycle
