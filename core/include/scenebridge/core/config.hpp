/**
 * @file config.hpp
 * @brief Bridge configuration loaded from JSON
 *
 * Example:
 * @code
 *   {
 *     "baseSize": 1280,
 *     "defaultAspectRatio": 0.5625,
 *     "nodeStopCeiling": 3600,
 *     "driftTolerance": 0.1,
 *     "fitMode": "contain",
 *     "log": { "level": "debug", "file": "scene_preview.log" }
 *   }
 * @endcode
 *
 * Missing keys keep their defaults.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace scenebridge {

struct BridgeConfig {
    /// Longer side of the drawing surface, in pixels
    int baseSize = kDefaultBaseSize;

    /// Aspect ratio (width / height) used when the caller has no hint
    double defaultAspectRatio = kDefaultAspectRatio;

    /// Stop time given to new source nodes, in seconds
    Seconds nodeStopCeiling = kDefaultNodeStopCeiling;

    /// Allowed gap between the context clock and an element, in seconds
    Seconds driftTolerance = kDefaultDriftTolerance;

    FitMode fitMode = FitMode::Contain;

    std::string logLevel = "info";
    std::string logFile;
};

/// Build a config from JSON, validating every present key
Result<BridgeConfig> configFromJson(const nlohmann::json& json);

/// Read and parse a JSON config file
Result<BridgeConfig> loadConfigFile(const std::string& path);

nlohmann::json configToJson(const BridgeConfig& config);

const char* fitModeToString(FitMode mode);

} // namespace scenebridge
