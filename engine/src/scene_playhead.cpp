/**
 * @file scene_playhead.cpp
 * @brief Scene playhead implementation
 */

#include <scenebridge/engine/scene_playhead.hpp>
#include <scenebridge/core/logger.hpp>

#include <algorithm>
#include <cmath>

namespace scenebridge::engine {

ScenePlayhead::ScenePlayhead(SyncBridge* bridge, MediaKind kind, Seconds driftTolerance)
    : m_bridge(bridge)
    , m_kind(kind)
    , m_driftTolerance(driftTolerance) {
    Seconds initial = TrimRange::defaultDurationFor(kind);
    if (initial > 0.0) {
        m_trim.setDuration(initial);
    }
}

void ScenePlayhead::setDuration(Seconds duration) {
    m_trim.setDuration(duration);
}

bool ScenePlayhead::play() {
    if (m_kind == MediaKind::Video) {
        if (!m_bridge || !m_bridge->getState().isReady) {
            LOG_DEBUG("[ScenePlayhead] play() ignored: video not ready");
            return false;
        }
        adoptBridgeDuration();
    }

    bool outside = m_time < m_trim.start() || m_time >= m_trim.end();
    if (m_forceReset || outside) {
        LOG_DEBUG("[ScenePlayhead] Resetting to trim start {:.3f}", m_trim.start());
        seekTo(m_trim.start());
        m_forceReset = false;
    }

    m_playing = true;
    if (isVideo()) {
        m_bridge->play();
    }
    if (m_narration) {
        m_narration->setCurrentTime(m_time);
        m_narration->play();
    }
    return true;
}

void ScenePlayhead::pause() {
    m_playing = false;
    if (isVideo()) {
        m_bridge->pause();
    }
    if (m_narration) {
        m_narration->pause();
    }
}

void ScenePlayhead::seekTo(Seconds time) {
    if (!std::isfinite(time)) return;

    time = std::max(0.0, time);
    if (isVideo()) {
        m_bridge->seek(time);
        if (m_bridge->getState().isReady) {
            time = m_bridge->getState().currentTime;
        }
    }
    if (m_narration) {
        m_narration->setCurrentTime(time);
    }
    setTime(time);
}

void ScenePlayhead::tick(Seconds delta) {
    if (isVideo()) {
        m_bridge->tick(delta);
    }
    if (m_narration) {
        m_narration->poll();
    }
    if (!m_playing) return;

    if (isVideo() && !m_bridge->getState().isReady) {
        // Bridge was re-initialized or failed underneath us
        m_playing = false;
        return;
    }
    if (isVideo()) {
        adoptBridgeDuration();
    }

    Seconds next = isVideo() ? m_bridge->getState().currentTime
                             : std::min(m_time + delta, m_trim.end());

    Seconds end = m_trim.end();
    if (next >= end) {
        LOG_DEBUG("[ScenePlayhead] Reached trim end {:.3f}", end);
        m_forceReset = true;
        pause();
        setTime(end);
        reachedEnd.fire();
        return;
    }

    if (next < m_trim.start()) {
        seekTo(m_trim.start());
        return;
    }

    setTime(next);
    syncNarration();
}

void ScenePlayhead::dragStartHandle(Seconds time) {
    if (m_playing) pause();
    seekTo(m_trim.setStart(time));
}

void ScenePlayhead::dragEndHandle(Seconds time) {
    if (m_playing) pause();
    seekTo(m_trim.setEnd(time));
}

void ScenePlayhead::endDrag() {
    seekTo(m_trim.start());
    m_forceReset = true;
}

void ScenePlayhead::adoptBridgeDuration() {
    Seconds duration = m_bridge->getState().duration;
    if (isUsableDuration(duration) && duration != m_trim.duration()) {
        m_trim.setDuration(duration);
    }
}

void ScenePlayhead::syncNarration() {
    if (!m_narration) return;
    if (std::abs(m_narration->currentTime() - m_time) > m_driftTolerance) {
        LOG_TRACE("[ScenePlayhead] Realigning narration {:.3f} -> {:.3f}",
                  m_narration->currentTime(), m_time);
        m_narration->setCurrentTime(m_time);
    }
}

void ScenePlayhead::setTime(Seconds time) {
    if (time == m_time) return;
    m_time = time;
    timeChanged.fire(m_time);
}

} // namespace scenebridge::engine
