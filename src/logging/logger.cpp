/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of the zonelink logging facade
 */

#include "logging/logger.h"

#include <array>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace zonelink {
namespace logging {

namespace {

constexpr const char* kLoggerName = "zonelinkd";

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
};

// Indexed by LogLevel
constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

const LevelEntry& entryFor(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < kLevels.size() ? kLevels[index] : kLevels[static_cast<size_t>(LogLevel::Info)];
}

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> ready{false};
    // Configured sinks are in place; the early stderr logger does not count.
    bool configured = false;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    auto level = entryFor(config.level).spdlogLevel;

    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
            config.coloredOutput ? spdlog::color_mode::automatic : spdlog::color_mode::never);
        console->set_level(level);
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups);
        rotating->set_level(level);
        sinks.push_back(std::move(rotating));
    }
    return sinks;
}

// Caller holds state().mutex.
void install(LoggerState& s, const std::vector<spdlog::sink_ptr>& sinks, const LogConfig& config) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(entryFor(config.level).spdlogLevel);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
    s.logger = std::move(logger);
    s.ready.store(true, std::memory_order_release);
}

}  // namespace

bool initialize(const LogConfig& config) {
    auto& s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    auto level = entryFor(config.level).spdlogLevel;

    if (s.configured && s.logger) {
        s.logger->set_level(level);
        s.logger->set_pattern(config.pattern);
        for (auto& sink : s.logger->sinks()) {
            sink->set_level(level);
        }
        return true;
    }

    try {
        install(s, buildSinks(config), config);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "zonelinkd: cannot set up logging: " << ex.what() << std::endl;
        return false;
    }
    s.configured = true;
    lock.unlock();

    if (config.filePath.empty()) {
        LOG_INFO("Logging at level {}", levelToString(config.level));
    } else {
        LOG_INFO("Logging at level {} to {} (rotate at {} bytes, keep {})",
                 levelToString(config.level), config.filePath, config.maxFileSize,
                 config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.ready.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        install(s, sinks, LogConfig{});
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "zonelinkd: cannot set up stderr logging: " << ex.what() << std::endl;
        return false;
    }
}

void shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.logger) {
        s.logger->flush();
    }
    s.ready.store(false, std::memory_order_release);
    s.configured = false;
    spdlog::shutdown();
    s.logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = state().logger;
    if (!logger) {
        return;
    }
    logger->set_level(entryFor(level).spdlogLevel);
    LOG_INFO("Log level is now {}", levelToString(level));
}

LogLevel getLevel() {
    auto logger = state().logger;
    if (!logger) {
        return LogLevel::Info;
    }
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == logger->level()) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

void flush() {
    if (auto logger = state().logger) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    auto& s = state();
    if (!s.ready.load(std::memory_order_acquire)) {
        initializeEarly();
    }
    return s.logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string name;
    name.reserve(str.size());
    for (char c : str) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (const auto& entry : kLevels) {
        if (entry.name == name) {
            return entry.level;
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "err") {
        return LogLevel::Error;
    }
    if (name == "fatal") {
        return LogLevel::Critical;
    }
    if (name == "none") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace zonelink
