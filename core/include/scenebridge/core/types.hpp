/**
 * @file types.hpp
 * @brief Core type definitions for SceneBridge
 *
 * Positions and durations that cross the bridge boundary are double
 * seconds, because a raw media element may report NaN or infinity for a
 * duration it does not know yet. Timestamps handed to FFmpeg are int64_t
 * microseconds.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <cmath>
#include <string>

namespace scenebridge {

// ============================================================================
// Time Types
// ============================================================================

/// Media position or duration in seconds
using Seconds = double;

/// Timestamp in microseconds since media start
using Timestamp = int64_t;

/// Time base constant: 1 second = 1,000,000 microseconds
constexpr Timestamp kTimeBaseUs = 1'000'000;

/// Invalid timestamp sentinel
constexpr Timestamp kNoTimestamp = INT64_MIN;

using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

/// Monotonic clock used for wall-clock media positions
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline Timestamp toTimestamp(Seconds s) {
    return static_cast<Timestamp>(std::llround(s * static_cast<double>(kTimeBaseUs)));
}

inline Seconds toSeconds(Timestamp us) {
    return static_cast<double>(us) / static_cast<double>(kTimeBaseUs);
}

/// True for a duration an element can be trusted with: finite and positive
inline bool isUsableDuration(Seconds d) {
    return std::isfinite(d) && d > 0.0;
}

// ============================================================================
// Media Types
// ============================================================================

/// Kind of media a scene carries. Only Video drives the bridge.
enum class MediaKind {
    None = 0,
    Video,
    Image,
    Gallery,
};

inline const char* mediaKindToString(MediaKind kind) {
    switch (kind) {
        case MediaKind::None: return "none";
        case MediaKind::Video: return "video";
        case MediaKind::Image: return "image";
        case MediaKind::Gallery: return "gallery";
        default: return "unknown";
    }
}

/// Parse "video", "image", "gallery"; anything else is None
inline MediaKind mediaKindFromString(const std::string& name) {
    if (name == "video") return MediaKind::Video;
    if (name == "image") return MediaKind::Image;
    if (name == "gallery") return MediaKind::Gallery;
    return MediaKind::None;
}

/// How a frame is placed on a surface of a different aspect ratio
enum class FitMode {
    Contain,    ///< Whole frame visible, bars on two sides
    Cover,      ///< Surface filled, frame cropped
};

/// Pixel dimensions of a drawing surface or decoded frame
struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,
    NotSupported,
    OutOfMemory,

    // I/O errors
    FileNotFound,
    ReadError,
    ParseError,
    EndOfFile,

    // Codec errors
    DecoderError,

    // Bridge lifecycle errors
    SurfaceUnavailable,
    ContextCreationFailed,
    NodeCreationFailed,
    MediaDecodeError,
    InvalidDuration,
    PlaybackCommandFailed,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::OutOfMemory: return "Out of memory";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::EndOfFile: return "End of file";
        case ErrorCode::DecoderError: return "Decoder error";
        case ErrorCode::SurfaceUnavailable: return "Surface unavailable";
        case ErrorCode::ContextCreationFailed: return "Context creation failed";
        case ErrorCode::NodeCreationFailed: return "Node creation failed";
        case ErrorCode::MediaDecodeError: return "Media decode error";
        case ErrorCode::InvalidDuration: return "Invalid duration";
        case ErrorCode::PlaybackCommandFailed: return "Playback command failed";
        default: return "Unknown error code";
    }
}

// ============================================================================
// Utility Constants
// ============================================================================

/// Fallback aspect ratio when neither media nor caller provide one (9:16)
constexpr double kDefaultAspectRatio = 9.0 / 16.0;

/// Longer side of the drawing surface in pixels
constexpr int kDefaultBaseSize = 1920;

/// Playable upper bound given to a fresh source node, before the real
/// duration is known
constexpr Seconds kDefaultNodeStopCeiling = 3600.0;

/// Largest gap tolerated between two clocks before one is re-aligned
constexpr Seconds kDefaultDriftTolerance = 0.1;

/// Minimum distance kept between trim handles
constexpr Seconds kMinTrimGap = 0.1;

/// Scene duration assigned to still images
constexpr Seconds kDefaultImageDuration = 30.0;

} // namespace scenebridge
