/**
 * @file aspect_ratio.hpp
 * @brief Media aspect ratio resolution and fit selection
 */

#pragma once

#include <scenebridge/core/types.hpp>

#include <optional>
#include <string>

namespace scenebridge::engine {

/**
 * @brief Parse "9:16", "16/9" or a plain decimal such as "1.7778"
 *
 * @return width / height, or nullopt for malformed or non-positive input
 */
std::optional<double> parseAspectRatio(const std::string& text);

/**
 * @brief Aspect ratio to lay the media out with
 *
 * Priority: element dimensions when known, then a positive hint, then
 * the project ratio for non-video media, then 9:16.
 */
double resolveMediaAspectRatio(int videoWidth, int videoHeight,
                               double hint,
                               MediaKind kind,
                               double projectRatio);

/// How the media sits inside the project frame
enum class FitLayout {
    Exact,      ///< Ratios match (within 0.01)
    Letterbox,  ///< Media wider than the frame: bars top and bottom
    Pillarbox,  ///< Media narrower than the frame: bars left and right
    Fill,       ///< Cropped to fill the frame
};

struct FitDecision {
    FitMode mode = FitMode::Contain;
    FitLayout layout = FitLayout::Exact;
};

/**
 * @brief Pick contain or cover for a media/project pair
 *
 * @param letterbox true to show the whole media with bars, false to crop
 */
FitDecision chooseFit(double mediaRatio, double projectRatio, bool letterbox);

const char* fitLayoutToString(FitLayout layout);

} // namespace scenebridge::engine
