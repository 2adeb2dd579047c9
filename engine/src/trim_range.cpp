/**
 * @file trim_range.cpp
 * @brief Trim window implementation
 */

#include <scenebridge/engine/trim_range.hpp>

#include <algorithm>
#include <cmath>

namespace scenebridge::engine {

TrimRange::TrimRange(Seconds start, Seconds end)
    : m_start(std::max(0.0, std::isfinite(start) ? start : 0.0))
    , m_end(std::isfinite(end) && end > 0.0 ? end : 0.0)
    , m_endFollowsDuration(!(std::isfinite(end) && end > 0.0)) {}

Seconds TrimRange::defaultDurationFor(MediaKind kind) {
    return kind == MediaKind::Image ? kDefaultImageDuration : 0.0;
}

void TrimRange::setDuration(Seconds duration) {
    if (!isUsableDuration(duration)) return;
    m_duration = duration;

    if (m_endFollowsDuration && !m_manual) {
        m_end = duration;
    }
    m_end = std::min(m_end, duration);
    m_start = std::clamp(m_start, 0.0, std::max(0.0, m_end - kMinTrimGap));
}

Seconds TrimRange::setStart(Seconds time) {
    if (m_duration <= 0.0 || !std::isfinite(time)) return m_start;

    time = std::clamp(time, 0.0, m_duration);
    m_start = std::max(0.0, std::min(time, end() - kMinTrimGap));
    return m_start;
}

Seconds TrimRange::setEnd(Seconds time) {
    if (m_duration <= 0.0 || !std::isfinite(time)) return end();

    time = std::clamp(time, 0.0, m_duration);
    m_end = std::min(m_duration, std::max(time, m_start + kMinTrimGap));
    m_endFollowsDuration = false;
    m_manual = true;
    return m_end;
}

Seconds TrimRange::end() const {
    if (m_end > 0.0) return m_end;
    return m_duration;
}

Seconds TrimRange::clamp(Seconds time) const {
    return std::clamp(time, m_start, std::max(m_start, end()));
}

} // namespace scenebridge::engine
