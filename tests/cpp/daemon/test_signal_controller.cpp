#include "daemon/lifecycle/shutdown_manager.h"
#include "daemon/lifecycle/signal_controller.h"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace zonelink::lifecycle;

class SignalControllerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_.reset();
        controller_.setSignalState(&state_);
        quitLoopCalls_ = 0;
        controller_.setQuitLoopCallback([this]() { ++quitLoopCalls_; });
        controller_.setLogCallback([this](const char* msg) { logs_.emplace_back(msg); });
    }

    SignalState state_;
    SignalController controller_;
    int quitLoopCalls_ = 0;
    std::vector<std::string> logs_;
};

TEST_F(SignalControllerTest, SignalStateResetClearsEverything) {
    state_.shutdown = 1;
    state_.reload = 1;
    state_.received = SIGTERM;
    state_.reset();
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_EQ(state_.reload, 0);
    EXPECT_EQ(state_.received, 0);
}

TEST_F(SignalControllerTest, InitialState) {
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(controller_.lastAction(), SignalController::Action::None);
}

TEST_F(SignalControllerTest, NoPendingSignalIsNoOp) {
    EXPECT_FALSE(controller_.processPendingSignals());
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_EQ(quitLoopCalls_, 0);
    EXPECT_TRUE(logs_.empty());
}

TEST_F(SignalControllerTest, NullStateIsNoOp) {
    SignalController detached;
    EXPECT_FALSE(detached.processPendingSignals());
    EXPECT_TRUE(detached.isRunning());
}

TEST_F(SignalControllerTest, SigtermStopsTheLoop) {
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.lastAction(), SignalController::Action::Shutdown);
    EXPECT_EQ(controller_.lastSignal(), SIGTERM);
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_FALSE(controller_.isRunning());
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(quitLoopCalls_, 1);
    ASSERT_EQ(logs_.size(), 1u);
    EXPECT_NE(logs_[0].find("shutting down"), std::string::npos);
}

TEST_F(SignalControllerTest, SigintIsTreatedAsShutdown) {
    state_.shutdown = 1;
    state_.received = SIGINT;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.lastAction(), SignalController::Action::Shutdown);
    EXPECT_EQ(controller_.lastSignal(), SIGINT);
}

TEST_F(SignalControllerTest, SighupRequestsReload) {
    state_.reload = 1;
    state_.received = SIGHUP;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.lastAction(), SignalController::Action::Reload);
    EXPECT_TRUE(controller_.isReloadRequested());
    EXPECT_FALSE(controller_.isRunning());
    EXPECT_EQ(state_.reload, 0);
    EXPECT_EQ(quitLoopCalls_, 1);
}

TEST_F(SignalControllerTest, ShutdownWinsOverPendingReload) {
    state_.reload = 1;
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.lastAction(), SignalController::Action::Shutdown);
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(state_.reload, 0);

    // Nothing left to consume
    EXPECT_FALSE(controller_.processPendingSignals());
}

TEST_F(SignalControllerTest, ShutdownAfterReloadCancelsTheReload) {
    state_.reload = 1;
    state_.received = SIGHUP;
    ASSERT_TRUE(controller_.processPendingSignals());
    ASSERT_TRUE(controller_.isReloadRequested());

    state_.shutdown = 1;
    state_.received = SIGTERM;
    ASSERT_TRUE(controller_.processPendingSignals());
    EXPECT_FALSE(controller_.isReloadRequested());
}

TEST_F(SignalControllerTest, SignalHandlerWritesGlobalState) {
    auto& global = globalSignalState();
    global.reset();

    signalHandler(SIGHUP);
    EXPECT_EQ(global.reload, 1);
    EXPECT_EQ(global.shutdown, 0);
    EXPECT_EQ(global.received, SIGHUP);

    signalHandler(SIGTERM);
    EXPECT_EQ(global.shutdown, 1);
    EXPECT_EQ(global.received, SIGTERM);
    global.reset();
}

// ========== ShutdownManager ==========

class ShutdownManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        globalSignalState().reset();
    }
    void TearDown() override {
        globalSignalState().reset();
    }

    std::atomic<bool> running_{true};
    std::atomic<bool> reload_{false};
};

TEST_F(ShutdownManagerTest, RequiresFlags) {
    ShutdownManager::Dependencies none;
    EXPECT_THROW(ShutdownManager{none}, std::invalid_argument);

    ShutdownManager::Dependencies runningOnly;
    runningOnly.runningFlag = &running_;
    EXPECT_THROW(ShutdownManager{runningOnly}, std::invalid_argument);
}

TEST_F(ShutdownManagerTest, TickMirrorsShutdownIntoFlags) {
    ShutdownManager manager({&running_, &reload_});
    bool quitCalled = false;
    manager.setQuitLoopCallback([&]() { quitCalled = true; });

    manager.tick();
    EXPECT_TRUE(running_.load());

    signalHandler(SIGTERM);
    manager.tick();
    EXPECT_FALSE(running_.load());
    EXPECT_FALSE(reload_.load());
    EXPECT_TRUE(quitCalled);
    EXPECT_FALSE(manager.isRunning());
}

TEST_F(ShutdownManagerTest, TickMirrorsReloadIntoFlags) {
    ShutdownManager manager({&running_, &reload_});

    signalHandler(SIGHUP);
    manager.tick();
    EXPECT_FALSE(running_.load());
    EXPECT_TRUE(reload_.load());
    EXPECT_TRUE(manager.isReloadRequested());
}

TEST_F(ShutdownManagerTest, ResetRearmsForNextCycle) {
    ShutdownManager manager({&running_, &reload_});
    signalHandler(SIGHUP);
    manager.tick();
    manager.runShutdownSequence();

    manager.reset();
    EXPECT_TRUE(running_.load());
    EXPECT_FALSE(reload_.load());
    EXPECT_TRUE(manager.isRunning());
    EXPECT_FALSE(manager.isReloadRequested());
    EXPECT_EQ(globalSignalState().reload, 0);
}

TEST_F(ShutdownManagerTest, UptimeStartsAtReady) {
    ShutdownManager manager({&running_, &reload_});
    EXPECT_EQ(manager.uptime(), std::chrono::steady_clock::duration::zero());

    manager.notifyReady();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GT(manager.uptime(), std::chrono::steady_clock::duration::zero());

    manager.reset();
    EXPECT_EQ(manager.uptime(), std::chrono::steady_clock::duration::zero());
}
