/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * Thin wrapper around spdlog with convenience macros. Components tag
 * their messages with a bracketed name, e.g. "[SyncBridge] ...".
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace scenebridge {

/**
 * @brief Initialize logging (call once at startup)
 *
 * @param appName Logger name shown in every line
 * @param level   Minimum level for all sinks
 * @param logFile Rotating log file; empty for console only
 */
void initLogging(const std::string& appName,
                 spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& logFile = "");

/// Get default logger, initializing a console logger on first use
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

/// Map "trace".."critical"/"off" to a level; unknown names give info
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace scenebridge

#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(scenebridge::getLogger(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(scenebridge::getLogger(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(scenebridge::getLogger(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(scenebridge::getLogger(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(scenebridge::getLogger(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(scenebridge::getLogger(), __VA_ARGS__)
