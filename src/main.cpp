#include "core/config_loader.h"
#include "core/daemon_constants.h"
#include "daemon/app/app.h"
#include "daemon/app/runtime_state.h"
#include "daemon/lifecycle/pid_lock.h"
#include "logging/logger.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

struct CommandLine {
    std::string configPath = zonelink::DEFAULT_CONFIG_FILE;
    std::string pidFilePath = DaemonConstants::PID_FILE_PATH;
    zonelink::app::AppOverrides overrides;
};

void printUsage(const char* programName) {
    std::cout << "zonelinkd - zone player discovery and topology daemon" << std::endl;
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config <path>      JSON config file (default: config.json)" << std::endl;
    std::cout << "  --callback-host <ip>     Address devices use to reach the event listener"
              << std::endl;
    std::cout << "  --callback-port <n>      Event listener port (default: ephemeral)"
              << std::endl;
    std::cout << "  -l, --log-level <lvl>    trace|debug|info|warn|error|critical|off" << std::endl;
    std::cout << "  --pid-file <path>        Single-instance lock (default: /tmp/zonelink.pid)"
              << std::endl;
    std::cout << "  -h, --help               Show this help message" << std::endl;
}

bool parsePort(const std::string& text, uint16_t& port) {
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

// 0 = run, 1 = error, 2 = help shown
int parseArguments(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needsValue = [&]() {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires a value" << std::endl;
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            return 2;
        } else if (arg == "-c" || arg == "--config") {
            if (!needsValue()) {
                return 1;
            }
            cmd.configPath = argv[++i];
        } else if (arg == "--callback-host") {
            if (!needsValue()) {
                return 1;
            }
            cmd.overrides.callbackHost = argv[++i];
        } else if (arg == "--callback-port") {
            if (!needsValue()) {
                return 1;
            }
            uint16_t port = 0;
            if (!parsePort(argv[++i], port)) {
                std::cerr << "Invalid --callback-port: " << argv[i] << std::endl;
                return 1;
            }
            cmd.overrides.callbackPort = port;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!needsValue()) {
                return 1;
            }
            cmd.overrides.logLevel = argv[++i];
        } else if (arg == "--pid-file") {
            if (!needsValue()) {
                return 1;
            }
            cmd.pidFilePath = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    int parsed = parseArguments(argc, argv, cmd);
    if (parsed != 0) {
        printUsage(argv[0]);
        return parsed == 2 ? 0 : 1;
    }

    // stderr only until the config file has been read
    zonelink::logging::initializeEarly();

    auto pidLock = zonelink::lifecycle::PidLock::tryAcquire(cmd.pidFilePath);
    if (!pidLock) {
        return 1;
    }

    LOG_INFO("zonelinkd starting (PID {}, config {})", getpid(), cmd.configPath);

    zonelink::app::RuntimeState state;
    zonelink::app::App app(state, cmd.configPath);
    int exitCode = app.run(cmd.overrides);

    zonelink::logging::shutdown();
    return exitCode;
}
