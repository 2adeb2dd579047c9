/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <scenebridge/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <iostream>
#include <vector>

namespace scenebridge {

static std::shared_ptr<spdlog::logger> s_logger;

void initLogging(const std::string& appName,
                 spdlog::level::level_enum level,
                 const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 10, 3);  // 10MB, 3 files
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file '" << logFile << "' unavailable: " << ex.what() << std::endl;
        }
    }

    s_logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
    s_logger->set_level(level);
    s_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    spdlog::set_default_logger(s_logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!s_logger) {
        initLogging("scenebridge");
    }
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    auto logger = getLogger();
    logger->set_level(level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(level);
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace scenebridge
