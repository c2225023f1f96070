#pragma once

#include "daemon/app/runtime_state.h"

#include <cstdint>
#include <optional>
#include <string>

namespace zonelink::app {

// Command-line values; they win over the config file and the environment.
struct AppOverrides {
    std::optional<std::string> callbackHost;
    std::optional<uint16_t> callbackPort;
    std::optional<std::string> logLevel;
};

class App {
   public:
    App(RuntimeState& state, std::string configFilePath);

    // Runs until SIGINT/SIGTERM; SIGHUP or RELOAD rebuilds everything. Returns the exit code.
    int run(const AppOverrides& overrides);

    // Config file, then ZONELINK_* environment, then overrides. False on an invalid variable.
    static bool loadRuntimeConfig(const std::string& configFilePath, const AppOverrides& overrides,
                                  AppConfig& config);

   private:
    bool buildComponents();
    void teardownComponents();

    RuntimeState& state_;
    std::string configFilePath_;
};

}  // namespace zonelink::app
