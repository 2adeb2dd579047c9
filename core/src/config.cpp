/**
 * @file config.cpp
 * @brief Bridge configuration parsing
 */

#include <scenebridge/core/config.hpp>
#include <scenebridge/core/logger.hpp>

#include <cmath>
#include <fstream>

using json = nlohmann::json;

namespace scenebridge {

namespace {

Result<FitMode> fitModeFromString(const std::string& name) {
    if (name == "contain") return Ok(FitMode::Contain);
    if (name == "cover") return Ok(FitMode::Cover);
    return Err<FitMode>(ErrorCode::InvalidArgument, "Unknown fitMode '" + name + "'");
}

bool isPositiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // anonymous namespace

const char* fitModeToString(FitMode mode) {
    switch (mode) {
        case FitMode::Contain: return "contain";
        case FitMode::Cover: return "cover";
        default: return "contain";
    }
}

Result<BridgeConfig> configFromJson(const json& j) {
    if (!j.is_object()) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument, "Config root must be an object");
    }

    BridgeConfig config;
    try {
        config.baseSize = j.value("baseSize", config.baseSize);
        config.defaultAspectRatio = j.value("defaultAspectRatio", config.defaultAspectRatio);
        config.nodeStopCeiling = j.value("nodeStopCeiling", config.nodeStopCeiling);
        config.driftTolerance = j.value("driftTolerance", config.driftTolerance);

        if (j.contains("fitMode")) {
            auto fit = fitModeFromString(j["fitMode"].get<std::string>());
            if (!fit) return fit.error();
            config.fitMode = fit.value();
        }

        if (j.contains("log")) {
            const auto& log = j["log"];
            config.logLevel = log.value("level", config.logLevel);
            config.logFile = log.value("file", config.logFile);
        }
    } catch (const json::exception& e) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument,
            std::string("Config value has wrong type: ") + e.what());
    }

    if (config.baseSize <= 0) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument, "baseSize must be positive");
    }
    if (!isPositiveFinite(config.defaultAspectRatio)) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument, "defaultAspectRatio must be positive");
    }
    if (!isPositiveFinite(config.nodeStopCeiling)) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument, "nodeStopCeiling must be positive");
    }
    if (!std::isfinite(config.driftTolerance) || config.driftTolerance < 0.0) {
        return Err<BridgeConfig>(ErrorCode::InvalidArgument, "driftTolerance must be >= 0");
    }

    return config;
}

Result<BridgeConfig> loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("[Config] Failed to open config file: {}", path);
        return Err<BridgeConfig>(ErrorCode::FileNotFound, "Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        LOG_ERROR("[Config] Failed to parse config file: {} - {}", path, e.what());
        return Err<BridgeConfig>(ErrorCode::ParseError,
            "Failed to parse config file: " + std::string(e.what()));
    }

    auto config = configFromJson(j);
    if (config) {
        LOG_INFO("[Config] Configuration loaded from file: {}", path);
    } else {
        LOG_ERROR("[Config] Invalid config file {}: {}", path, config.error().what());
    }
    return config;
}

json configToJson(const BridgeConfig& config) {
    return {
        {"baseSize", config.baseSize},
        {"defaultAspectRatio", config.defaultAspectRatio},
        {"nodeStopCeiling", config.nodeStopCeiling},
        {"driftTolerance", config.driftTolerance},
        {"fitMode", fitModeToString(config.fitMode)},
        {"log", {
            {"level", config.logLevel},
            {"file", config.logFile}
        }}
    };
}

} // namespace scenebridge
