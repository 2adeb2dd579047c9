/**
 * @file aspect_ratio.cpp
 * @brief Aspect ratio helpers
 */

#include <scenebridge/engine/aspect_ratio.hpp>

#include <cmath>
#include <cstdlib>

namespace scenebridge::engine {

namespace {

constexpr double kRatioMatchTolerance = 0.01;

bool isUsableRatio(double ratio) {
    return std::isfinite(ratio) && ratio > 0.0;
}

/// Parse a whole string as a double; false on trailing garbage
bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

} // anonymous namespace

std::optional<double> parseAspectRatio(const std::string& text) {
    size_t sep = text.find_first_of(":/");

    double ratio = 0.0;
    if (sep == std::string::npos) {
        if (!parseNumber(text, ratio)) return std::nullopt;
    } else {
        double w = 0.0;
        double h = 0.0;
        if (!parseNumber(text.substr(0, sep), w) || !parseNumber(text.substr(sep + 1), h)) {
            return std::nullopt;
        }
        if (h == 0.0) return std::nullopt;
        ratio = w / h;
    }

    if (!isUsableRatio(ratio)) return std::nullopt;
    return ratio;
}

double resolveMediaAspectRatio(int videoWidth, int videoHeight,
                               double hint,
                               MediaKind kind,
                               double projectRatio) {
    if (videoWidth > 0 && videoHeight > 0) {
        return static_cast<double>(videoWidth) / static_cast<double>(videoHeight);
    }
    if (isUsableRatio(hint)) {
        return hint;
    }
    if (kind != MediaKind::Video) {
        return isUsableRatio(projectRatio) ? projectRatio : kDefaultAspectRatio;
    }
    return kDefaultAspectRatio;
}

FitDecision chooseFit(double mediaRatio, double projectRatio, bool letterbox) {
    if (!letterbox) {
        return {FitMode::Cover, FitLayout::Fill};
    }
    if (!isUsableRatio(projectRatio)) projectRatio = kDefaultAspectRatio;
    if (!isUsableRatio(mediaRatio)) mediaRatio = projectRatio;

    if (std::abs(mediaRatio - projectRatio) < kRatioMatchTolerance) {
        return {FitMode::Contain, FitLayout::Exact};
    }
    if (mediaRatio > projectRatio) {
        return {FitMode::Contain, FitLayout::Letterbox};
    }
    return {FitMode::Contain, FitLayout::Pillarbox};
}

const char* fitLayoutToString(FitLayout layout) {
    switch (layout) {
        case FitLayout::Exact: return "exact";
        case FitLayout::Letterbox: return "letterbox";
        case FitLayout::Pillarbox: return "pillarbox";
        case FitLayout::Fill: return "fill";
        default: return "unknown";
    }
}

} // namespace scenebridge::engine
