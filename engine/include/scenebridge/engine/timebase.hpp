/**
 * @file timebase.hpp
 * @brief Consumer-visible playback time state
 *
 * The one authoritative record of readiness, duration and position.
 * Only the bridge writes it; the rendering context's own clock never
 * leaks into it.
 */

#pragma once

#include <scenebridge/core/types.hpp>

#include <algorithm>

namespace scenebridge::engine {

/// Snapshot returned by SyncBridge::getState()
struct BridgeState {
    bool isReady = false;
    Seconds duration = 0.0;
    Seconds currentTime = 0.0;
};

class Timebase {
public:
    /**
     * @brief Enter the ready state with a known duration
     *
     * @return false (state unchanged) if the duration is not finite and positive
     */
    bool markReady(Seconds duration) {
        if (!isUsableDuration(duration)) {
            return false;
        }
        m_ready = true;
        m_duration = duration;
        m_currentTime = std::clamp(m_currentTime, 0.0, m_duration);
        return true;
    }

    /// Back to the initial state: not ready, zero duration and position
    void reset() {
        m_ready = false;
        m_duration = 0.0;
        m_currentTime = 0.0;
    }

    /**
     * @brief Move the position, clamped to [0, duration]
     *
     * Ignored before readiness. Returns true if the position changed.
     */
    bool setCurrentTime(Seconds time) {
        if (!m_ready || !std::isfinite(time)) {
            return false;
        }
        Seconds clamped = std::clamp(time, 0.0, m_duration);
        if (clamped == m_currentTime) {
            return false;
        }
        m_currentTime = clamped;
        return true;
    }

    [[nodiscard]] bool isReady() const { return m_ready; }
    [[nodiscard]] Seconds duration() const { return m_duration; }
    [[nodiscard]] Seconds currentTime() const { return m_currentTime; }

    [[nodiscard]] BridgeState snapshot() const {
        return {m_ready, m_duration, m_currentTime};
    }

private:
    bool m_ready = false;
    Seconds m_duration = 0.0;
    Seconds m_currentTime = 0.0;
};

} // namespace scenebridge::engine
