/**
 * @file scene_playhead.hpp
 * @brief Scene editor frame loop
 *
 * Runs once per host frame on top of the bridge. Video scenes read their
 * position from the bridge; image scenes advance a clock of their own.
 * Either way the playhead stops at the trim end and keeps an optional
 * narration element aligned with the scene position. The bridge knows
 * nothing about narration.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/signals.hpp>
#include <scenebridge/engine/sync_bridge.hpp>
#include <scenebridge/engine/trim_range.hpp>
#include <scenebridge/media/media_element.hpp>

namespace scenebridge::engine {

class ScenePlayhead {
public:
    /**
     * @param bridge         Bridge driving video; may be nullptr for image scenes
     * @param kind           Media kind of the scene
     * @param driftTolerance Narration is realigned past this gap
     */
    ScenePlayhead(SyncBridge* bridge, MediaKind kind,
                  Seconds driftTolerance = kDefaultDriftTolerance);

    /// Narration track to keep aligned; not owned, nullptr to detach
    void setNarration(media::MediaElement* narration) { m_narration = narration; }

    TrimRange& trim() { return m_trim; }
    const TrimRange& trim() const { return m_trim; }

    /// Forward a discovered media duration to the trim window. Video
    /// scenes also pick the duration up from the bridge on play and tick.
    void setDuration(Seconds duration);

    // ========== Transport ==========

    /**
     * @brief Start playback
     *
     * Restarts from the trim start after the end was reached or a trim
     * handle was released. Returns false while video is not ready.
     */
    bool play();

    void pause();

    /// Move scene, bridge and narration to a position
    void seekTo(Seconds time);

    /**
     * @brief Advance one host frame
     *
     * Drives the bridge, reads the new position and stops at the trim end.
     */
    void tick(Seconds delta);

    // ========== Trim handles ==========

    void dragStartHandle(Seconds time);
    void dragEndHandle(Seconds time);

    /// Handle released: park at the trim start and arm a reset
    void endDrag();

    // ========== State ==========

    [[nodiscard]] Seconds currentTime() const { return m_time; }
    [[nodiscard]] bool isPlaying() const { return m_playing; }
    [[nodiscard]] bool resetPending() const { return m_forceReset; }
    [[nodiscard]] MediaKind kind() const { return m_kind; }

    // ========== Signals ==========

    Signal<Seconds> timeChanged;
    VoidSignal reachedEnd;

private:
    bool isVideo() const { return m_kind == MediaKind::Video && m_bridge != nullptr; }
    void adoptBridgeDuration();
    void syncNarration();
    void setTime(Seconds time);

    SyncBridge* m_bridge;
    MediaKind m_kind;
    Seconds m_driftTolerance;
    media::MediaElement* m_narration = nullptr;

    TrimRange m_trim;
    Seconds m_time = 0.0;
    bool m_playing = false;
    bool m_forceReset = false;
};

} // namespace scenebridge::engine
