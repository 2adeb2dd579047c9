/**
 * @file preview_options.hpp
 * @brief Command-line options for scene_preview
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace scenebridge::preview {

/// Longest playback scene_preview accepts, in seconds
constexpr double kMaxPlaySeconds = 24.0 * 60.0 * 60.0;

struct PreviewOptions {
    std::string mediaPath;
    std::string configPath;
    std::string aspect;
    std::string narrationPath;
    std::optional<double> seekTo;
    double playSeconds = 3.0;
    int timeoutMs = 10000;
};

/**
 * @brief Parse argv
 *
 * Returns nullopt on --help or on any invalid argument; the reason is
 * written to std::cerr.
 */
std::optional<PreviewOptions> parsePreviewOptions(int argc, const char* const argv[]);

void printUsage(std::ostream& out, const char* argv0);

} // namespace scenebridge::preview
