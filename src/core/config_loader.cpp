#include "core/config_loader.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace zonelink {

namespace {

template <typename T>
T clampOrDefault(T value, T minValue, T maxValue, T fallback, const char* key, bool verbose) {
    if (value < minValue || value > maxValue) {
        if (verbose) {
            LOG_WARN("Config: {} out of range ({}), using {}", key, value, fallback);
        }
        return fallback;
    }
    return value;
}

bool parseEnvInt(const char* name, int& target, std::string& error) {
    if (const char* env = std::getenv(name)) {
        char* end = nullptr;
        long value = std::strtol(env, &end, 10);
        if (end && end != env && *end == '\0') {
            target = static_cast<int>(value);
            return true;
        }
        error = std::string("Environment variable ") + name + " is not an integer: " + env;
        return false;
    }
    return true;
}

void parseDiscovery(const nlohmann::json& d, AppConfig::DiscoveryConfig& out, bool verbose) {
    AppConfig::DiscoveryConfig defaults;

    if (d.contains("searchTarget") && d["searchTarget"].is_string()) {
        out.searchTarget = d["searchTarget"].get<std::string>();
    }
    if (d.contains("multicastAddress") && d["multicastAddress"].is_string()) {
        out.multicastAddress = d["multicastAddress"].get<std::string>();
    }
    if (d.contains("port") && d["port"].is_number_integer()) {
        int port = clampOrDefault(d["port"].get<int>(), 1, 65535,
                                  static_cast<int>(defaults.port), "discovery.port", verbose);
        out.port = static_cast<uint16_t>(port);
    }
    if (d.contains("mx") && d["mx"].is_number_integer()) {
        out.mx = clampOrDefault(d["mx"].get<int>(), 1, 5, defaults.mx, "discovery.mx", verbose);
    }
    if (d.contains("searchIntervalSec") && d["searchIntervalSec"].is_number_integer()) {
        out.searchIntervalSec =
            clampOrDefault(d["searchIntervalSec"].get<int>(), 5, 3600, defaults.searchIntervalSec,
                           "discovery.searchIntervalSec", verbose);
    }
    if (d.contains("bindAddress") && d["bindAddress"].is_string()) {
        out.bindAddress = d["bindAddress"].get<std::string>();
    }
    if (d.contains("staleAfterCycles") && d["staleAfterCycles"].is_number_integer()) {
        out.staleAfterCycles =
            clampOrDefault(d["staleAfterCycles"].get<int>(), 1, 1000, defaults.staleAfterCycles,
                           "discovery.staleAfterCycles", verbose);
    }
    if (d.contains("onboardingWorkers") && d["onboardingWorkers"].is_number_integer()) {
        out.onboardingWorkers =
            clampOrDefault(d["onboardingWorkers"].get<int>(), 1, 32, defaults.onboardingWorkers,
                           "discovery.onboardingWorkers", verbose);
    }
    if (d.contains("onboardingQueueCapacity") &&
        d["onboardingQueueCapacity"].is_number_unsigned()) {
        out.onboardingQueueCapacity = clampOrDefault<size_t>(
            d["onboardingQueueCapacity"].get<size_t>(), 1, 4096, defaults.onboardingQueueCapacity,
            "discovery.onboardingQueueCapacity", verbose);
    }
}

void parseEvents(const nlohmann::json& e, AppConfig::EventsConfig& out, bool verbose) {
    AppConfig::EventsConfig defaults;

    if (e.contains("callbackHost") && e["callbackHost"].is_string()) {
        out.callbackHost = e["callbackHost"].get<std::string>();
    }
    if (e.contains("callbackPort") && e["callbackPort"].is_number_integer()) {
        int port = clampOrDefault(e["callbackPort"].get<int>(), 0, 65535, 0,
                                  "events.callbackPort", verbose);
        out.callbackPort = static_cast<uint16_t>(port);
    }
    if (e.contains("requestedTimeoutSec") && e["requestedTimeoutSec"].is_number_integer()) {
        out.requestedTimeoutSec =
            clampOrDefault(e["requestedTimeoutSec"].get<int>(), 60, 86400,
                           defaults.requestedTimeoutSec, "events.requestedTimeoutSec", verbose);
    }
    if (e.contains("dispatchQueueCapacity") && e["dispatchQueueCapacity"].is_number_unsigned()) {
        out.dispatchQueueCapacity = clampOrDefault<size_t>(
            e["dispatchQueueCapacity"].get<size_t>(), 1, 65536, defaults.dispatchQueueCapacity,
            "events.dispatchQueueCapacity", verbose);
    }
    if (e.contains("deviceServices") && e["deviceServices"].is_array()) {
        out.deviceServices.clear();
        for (const auto& item : e["deviceServices"]) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                out.deviceServices.push_back(item.get<std::string>());
            }
        }
    }
    if (e.contains("unsubscribeOnStop") && e["unsubscribeOnStop"].is_boolean()) {
        out.unsubscribeOnStop = e["unsubscribeOnStop"].get<bool>();
    }
}

void parseLogging(const nlohmann::json& l, logging::LogConfig& out) {
    if (l.contains("level") && l["level"].is_string()) {
        out.level = logging::stringToLevel(l["level"].get<std::string>());
    }
    if (l.contains("file") && l["file"].is_string()) {
        out.filePath = l["file"].get<std::string>();
    }
    if (l.contains("maxFileSizeMb") && l["maxFileSizeMb"].is_number_unsigned()) {
        size_t mb = std::max<size_t>(1, l["maxFileSizeMb"].get<size_t>());
        out.maxFileSize = mb * 1024 * 1024;
    }
    if (l.contains("maxBackups") && l["maxBackups"].is_number_unsigned()) {
        out.maxBackups = l["maxBackups"].get<size_t>();
    }
    if (l.contains("console") && l["console"].is_boolean()) {
        out.consoleOutput = l["console"].get<bool>();
    }
    if (l.contains("colored") && l["colored"].is_boolean()) {
        out.coloredOutput = l["colored"].get<bool>();
    }
    if (l.contains("pattern") && l["pattern"].is_string()) {
        out.pattern = l["pattern"].get<std::string>();
    }
}

}  // namespace

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (!j.is_object()) {
            if (verbose) {
                LOG_ERROR("Config: {} is not a JSON object", configPath.string());
            }
            return false;
        }

        AppConfig parsed;

        if (j.contains("discovery") && j["discovery"].is_object()) {
            parseDiscovery(j["discovery"], parsed.discovery, verbose);
        }
        if (j.contains("events") && j["events"].is_object()) {
            parseEvents(j["events"], parsed.events, verbose);
        }
        if (j.contains("http") && j["http"].is_object()) {
            auto http = j["http"];
            if (http.contains("timeoutMs") && http["timeoutMs"].is_number_integer()) {
                parsed.http.timeoutMs =
                    clampOrDefault(http["timeoutMs"].get<int>(), 100, 60000,
                                   DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS, "http.timeoutMs",
                                   verbose);
            }
        }
        if (j.contains("zeromq") && j["zeromq"].is_object()) {
            auto zmq = j["zeromq"];
            if (zmq.contains("endpoint") && zmq["endpoint"].is_string() &&
                !zmq["endpoint"].get<std::string>().empty()) {
                parsed.zeromq.endpoint = zmq["endpoint"].get<std::string>();
            }
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            parseLogging(j["logging"], parsed.logging);
        }

        outConfig = std::move(parsed);
        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool applyEnvironmentOverrides(AppConfig& config, std::string& error) {
    if (const char* host = std::getenv("ZONELINK_CALLBACK_HOST")) {
        config.events.callbackHost = host;
    }

    int callbackPort = config.events.callbackPort;
    if (!parseEnvInt("ZONELINK_CALLBACK_PORT", callbackPort, error)) {
        return false;
    }
    if (callbackPort < 0 || callbackPort > 65535) {
        error = "ZONELINK_CALLBACK_PORT must be between 0 and 65535";
        return false;
    }
    config.events.callbackPort = static_cast<uint16_t>(callbackPort);

    int interval = config.discovery.searchIntervalSec;
    if (!parseEnvInt("ZONELINK_SEARCH_INTERVAL_SEC", interval, error)) {
        return false;
    }
    if (interval <= 0) {
        error = "ZONELINK_SEARCH_INTERVAL_SEC must be positive";
        return false;
    }
    config.discovery.searchIntervalSec = interval;

    if (const char* endpoint = std::getenv("ZONELINK_ZMQ_ENDPOINT")) {
        if (*endpoint != '\0') {
            config.zeromq.endpoint = endpoint;
        }
    }
    if (const char* lvl = std::getenv("ZONELINK_LOG_LEVEL")) {
        config.logging.level = logging::stringToLevel(lvl);
    }
    return true;
}

}  // namespace zonelink
