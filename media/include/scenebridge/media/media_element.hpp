/**
 * @file media_element.hpp
 * @brief Raw media element interface
 *
 * A media element is the low-level playback primitive behind a source
 * node: it loads one URL, owns a native position and duration, and
 * reports load, error and position changes. Its position and duration
 * are the ground truth for timing; the compositing engine only follows.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>
#include <scenebridge/core/signals.hpp>
#include <scenebridge/media/video_frame.hpp>

#include <functional>
#include <memory>
#include <string>

namespace scenebridge::media {

/**
 * @brief Load state of a media element
 */
enum class ReadyState {
    Empty,      ///< No source assigned
    Loading,    ///< load() called, metadata not known yet
    Metadata,   ///< Duration and dimensions known
    Failed,     ///< Decode or network failure
};

/**
 * @brief Raw media element (video or audio)
 *
 * All methods and signals belong to the event-loop thread. Implementations
 * that load in the background deliver their results through the loop.
 */
class MediaElement {
public:
    virtual ~MediaElement() = default;

    /// Start loading a URL. Results arrive later via the signals.
    virtual void load(const std::string& url) = 0;

    [[nodiscard]] virtual const std::string& source() const = 0;
    [[nodiscard]] virtual ReadyState readyState() const = 0;

    /// Duration in seconds; NaN until metadata is known, may be infinite
    [[nodiscard]] virtual Seconds duration() const = 0;

    [[nodiscard]] virtual Seconds currentTime() const = 0;
    virtual void setCurrentTime(Seconds time) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    [[nodiscard]] virtual bool paused() const = 0;

    /// Intrinsic frame size; 0 for audio or before metadata
    [[nodiscard]] virtual int videoWidth() const = 0;
    [[nodiscard]] virtual int videoHeight() const = 0;

    /**
     * @brief Deliver pending notifications
     *
     * Called once per host frame. Fires timeUpdated when the position
     * moved since the last poll, and ended when playback reached the
     * duration.
     */
    virtual void poll() = 0;

    /// Frame at the current position, or nullptr (audio, not loaded)
    virtual std::shared_ptr<const VideoFrame> currentFrame() = 0;

    // ========== Signals ==========

    VoidSignal loadedMetadata;
    Signal<const Error&> failed;
    Signal<Seconds> timeUpdated;
    VoidSignal ended;
};

/// Creates a fresh, unloaded element
using MediaElementFactory = std::function<std::unique_ptr<MediaElement>()>;

} // namespace scenebridge::media
