/**
 * @file preview_options.cpp
 * @brief scene_preview argument parsing
 */

#include "preview_options.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace scenebridge::preview {

namespace {

bool parseFinite(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

/// Whole milliseconds in (0, INT_MAX]
bool parseTimeoutMs(const std::string& text, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE) return false;
    if (value <= 0 || value > INT_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

} // anonymous namespace

void printUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " <media> [options]\n"
        << "  --config <file.json>   Bridge configuration\n"
        << "  --aspect <w:h>         Aspect ratio hint, e.g. 16:9\n"
        << "  --seek <seconds>       Seek before playing\n"
        << "  --play-seconds <s>     Playback time (default 3, at most 86400)\n"
        << "  --narration <audio>    Narration track kept in sync\n"
        << "  --timeout-ms <n>       Load timeout in whole ms (default 10000)\n";
}

std::optional<PreviewOptions> parsePreviewOptions(int argc, const char* const argv[]) {
    PreviewOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            options.configPath = *v;
        } else if (arg == "--aspect") {
            auto v = next();
            if (!v) return std::nullopt;
            options.aspect = *v;
        } else if (arg == "--narration") {
            auto v = next();
            if (!v) return std::nullopt;
            options.narrationPath = *v;
        } else if (arg == "--seek") {
            auto v = next();
            double t = 0.0;
            if (!v || !parseFinite(*v, t)) {
                std::cerr << "Invalid --seek value" << std::endl;
                return std::nullopt;
            }
            options.seekTo = t;
        } else if (arg == "--play-seconds") {
            auto v = next();
            double s = 0.0;
            if (!v || !parseFinite(*v, s) || s < 0.0 || s > kMaxPlaySeconds) {
                std::cerr << "Invalid --play-seconds value" << std::endl;
                return std::nullopt;
            }
            options.playSeconds = s;
        } else if (arg == "--timeout-ms") {
            auto v = next();
            if (!v || !parseTimeoutMs(*v, options.timeoutMs)) {
                std::cerr << "Invalid --timeout-ms value" << std::endl;
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << std::endl;
            return std::nullopt;
        } else if (options.mediaPath.empty()) {
            options.mediaPath = arg;
        } else {
            std::cerr << "Unexpected argument " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (options.mediaPath.empty()) return std::nullopt;
    return options;
}

} // namespace scenebridge::preview
