#pragma once

#include "daemon/lifecycle/signal_controller.h"

#include <atomic>
#include <chrono>
#include <functional>

namespace zonelink::lifecycle {

/**
 * @brief Owns signal installation and mirrors signal state into the daemon flags.
 *
 * One instance lives across reload cycles; reset() re-arms it for the next one.
 */
class ShutdownManager {
   public:
    struct Dependencies {
        std::atomic<bool>* runningFlag = nullptr;
        std::atomic<bool>* reloadFlag = nullptr;
    };

    explicit ShutdownManager(Dependencies deps);

    // SIGINT/SIGTERM/SIGHUP only set flags. SIGPIPE is ignored.
    void installSignalHandlers();

    void setQuitLoopCallback(std::function<void()> cb);

    void notifyReady();

    // Called from the main loop.
    void tick();

    void runShutdownSequence();

    void reset();

    bool isRunning() const;
    bool isReloadRequested() const;

    // Zero until notifyReady() has been called in this cycle.
    std::chrono::steady_clock::duration uptime() const;

   private:
    Dependencies deps_;
    SignalController controller_;
    std::function<void()> quitLoopCallback_;

    bool readyNotified_{false};
    bool sequenceRan_{false};
    std::chrono::steady_clock::time_point readyAt_{};
};

}  // namespace zonelink::lifecycle
