/**
 * @file logger.h
 * @brief Logging facade for zonelink
 *
 * All components log through the LOG_* macros below; spdlog stays an
 * implementation detail of this module.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace zonelink {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Sink and level settings, usually filled from the "logging" section
 *        of the daemon config file.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty = console only
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Create (or reconfigure) the process logger.
 *
 * Calling it again after a successful initialization only updates level and
 * pattern; sinks are kept so that a SIGHUP reload does not reopen files.
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief stderr-only logger for the window before the config file is read.
 */
bool initializeEarly();

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Case-insensitive level name lookup ("warning" and "err" are accepted).
 * Unknown names map to Info.
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace zonelink

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                \
    do {                                              \
        auto logger = zonelink::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...)                                \
    do {                                              \
        auto logger = zonelink::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                 \
    do {                                              \
        auto logger = zonelink::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_WARN(...)                                 \
    do {                                              \
        auto logger = zonelink::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_ERROR(...)                                \
    do {                                              \
        auto logger = zonelink::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__); \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = zonelink::logging::getLogger();    \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

// Rate limiter for hot paths such as repeated NOTIFY parse failures from one device.
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
