/**
 * @file trim_range.hpp
 * @brief Consumer-owned trim window of a scene
 *
 * The bridge never enforces trims; it clamps seeks to the full duration
 * only. The scene editor keeps its [start, end] window here.
 */

#pragma once

#include <scenebridge/core/types.hpp>

namespace scenebridge::engine {

class TrimRange {
public:
    /**
     * @param start Initial trim start
     * @param end   Initial trim end; <= 0 follows the media duration
     */
    explicit TrimRange(Seconds start = 0.0, Seconds end = 0.0);

    /// Scene duration to assume before the media reports one
    static Seconds defaultDurationFor(MediaKind kind);

    /**
     * @brief Apply a newly discovered media duration
     *
     * The end follows the duration until the user moves the end handle.
     */
    void setDuration(Seconds duration);

    /**
     * @brief Move the start handle
     *
     * Clamped to [0, end - kMinTrimGap]. Ignored while the duration is
     * unknown. Returns the resulting start.
     */
    Seconds setStart(Seconds time);

    /**
     * @brief Move the end handle
     *
     * Clamped to [start + kMinTrimGap, duration] and marks the trim as
     * set by hand. Ignored while the duration is unknown.
     */
    Seconds setEnd(Seconds time);

    /// Clamp a position into [start, end]
    [[nodiscard]] Seconds clamp(Seconds time) const;

    [[nodiscard]] Seconds start() const { return m_start; }
    [[nodiscard]] Seconds end() const;
    [[nodiscard]] Seconds duration() const { return m_duration; }
    [[nodiscard]] Seconds length() const { return end() - m_start; }
    [[nodiscard]] bool isManuallySet() const { return m_manual; }

private:
    Seconds m_start;
    Seconds m_end;
    Seconds m_duration = 0.0;
    bool m_endFollowsDuration;
    bool m_manual = false;
};

} // namespace scenebridge::engine
