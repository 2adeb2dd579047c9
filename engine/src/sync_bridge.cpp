/**
 * @file sync_bridge.cpp
 * @brief Playback synchronization bridge implementation
 */

#include <scenebridge/engine/sync_bridge.hpp>
#include <scenebridge/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace scenebridge::engine {

// ============================================================================
// DispatchGuard
// ============================================================================

SyncBridge::DispatchGuard::DispatchGuard(SyncBridge& bridge)
    : m_bridge(bridge) {
    ++m_bridge.m_dispatchDepth;
}

SyncBridge::DispatchGuard::~DispatchGuard() {
    if (--m_bridge.m_dispatchDepth > 0) return;

    // Nodes before contexts, matching the teardown order
    auto sources = std::move(m_bridge.m_retiredSources);
    m_bridge.m_retiredSources.clear();
    sources.clear();

    auto contexts = std::move(m_bridge.m_retiredContexts);
    m_bridge.m_retiredContexts.clear();
    contexts.clear();
}

// ============================================================================
// SyncBridge
// ============================================================================

SyncBridge::SyncBridge(RenderingEngine& engine, BridgeConfig config)
    : m_config(std::move(config))
    , m_lifecycle(engine, m_config.defaultAspectRatio) {}

SyncBridge::~SyncBridge() {
    release();
}

void SyncBridge::setCallbacks(BridgeCallbacks callbacks) {
    m_callbacks = std::move(callbacks);
}

void SyncBridge::initialize(const std::string& mediaUrl, MediaKind mediaKind,
                            double aspectRatioHint) {
    DispatchGuard guard(*this);

    if (mediaKind != MediaKind::Video || mediaUrl.empty()) {
        if (hasPair()) {
            LOG_INFO("[SyncBridge] Media kind is {}, releasing video pair",
                     mediaKindToString(mediaKind));
            ++m_generation;
            teardown();
        } else {
            LOG_DEBUG("[SyncBridge] initialize() ignored for {} media", mediaKindToString(mediaKind));
        }
        m_mediaUrl = mediaUrl;
        m_mediaKind = mediaKind;
        return;
    }

    const uint64_t generation = ++m_generation;
    teardown();

    m_mediaUrl = mediaUrl;
    m_mediaKind = mediaKind;
    LOG_INFO("[SyncBridge] Initializing generation {} for {}", generation, mediaUrl);

    auto prepared = m_lifecycle.prepare(m_surface, aspectRatioHint, m_config.baseSize);
    if (!prepared) {
        reportError(prepared.error());
        return;
    }
    m_context = std::move(prepared).value();

    auto source = std::make_unique<SourceNodeManager>(m_config.nodeStopCeiling);
    auto created = source->createNode(m_context.get(), mediaUrl);
    if (!created) {
        Error error = created.error();
        m_source = std::move(source);
        teardown();
        reportError(error);
        return;
    }

    source->watch({
        [this, generation]() { handleLoaded(generation); },
        [this, generation](const Error& e) { handleError(generation, e); },
        [this, generation](Seconds t) { handleTimeUpdate(generation, t); },
        [this, generation]() { handleEnded(generation); },
    });
    m_source = std::move(source);
}

void SyncBridge::play() {
    DispatchGuard guard(*this);

    if (!m_context || !m_source) {
        LOG_DEBUG("[SyncBridge] play() ignored: no rendering context");
        return;
    }
    if (!m_timebase.isReady()) {
        LOG_INFO("[SyncBridge] play() ignored: media not ready");
        return;
    }

    try {
        m_context->play();
        m_source->ensureStarted();
        m_isPlaying = true;
        // Draw now instead of waiting for the next tick
        m_context->update(0.0);
    } catch (const std::exception& e) {
        m_isPlaying = false;
        commandFailed("play", e);
    }
}

void SyncBridge::pause() {
    DispatchGuard guard(*this);

    if (!m_context) {
        LOG_DEBUG("[SyncBridge] pause() ignored: no rendering context");
        return;
    }

    try {
        m_context->pause();
        m_isPlaying = false;
    } catch (const std::exception& e) {
        commandFailed("pause", e);
    }
}

void SyncBridge::seek(Seconds time) {
    DispatchGuard guard(*this);

    if (!m_context) {
        LOG_DEBUG("[SyncBridge] seek() ignored: no rendering context");
        return;
    }
    if (!std::isfinite(time)) {
        LOG_WARN("[SyncBridge] seek() ignored: time is not finite");
        return;
    }

    const uint64_t generation = m_generation;
    Seconds upper = std::numeric_limits<double>::infinity();

    try {
        if (m_timebase.isReady()) {
            upper = m_timebase.duration();
        } else if (Seconds contextDuration = m_context->duration(); contextDuration > 0.0) {
            upper = contextDuration;
        }

        Seconds target = std::clamp(time, 0.0, upper);

        // The two players do not share a clock: write both
        m_context->setCurrentTime(target);
        if (media::MediaElement* el = element()) {
            el->setCurrentTime(target);
        }

        if (m_timebase.isReady()) {
            m_timebase.setCurrentTime(target);
            if (auto onTimeUpdate = m_callbacks.onTimeUpdate) {
                onTimeUpdate(m_timebase.currentTime());
            }
            if (generation != m_generation) return;
        }

        if (!m_isPlaying && m_context) {
            m_context->update(0.0);
        }
    } catch (const std::exception& e) {
        commandFailed("seek", e);
    }
}

void SyncBridge::tick(Seconds delta) {
    DispatchGuard guard(*this);

    if (!m_context) return;

    try {
        m_context->update(delta);
    } catch (const std::exception& e) {
        LOG_ERROR("[SyncBridge] Rendering context update failed: {}", e.what());
    }
}

void SyncBridge::release() {
    DispatchGuard guard(*this);

    if (hasPair()) {
        LOG_DEBUG("[SyncBridge] Releasing {}", m_mediaUrl);
        ++m_generation;
    }
    teardown();
    m_mediaUrl.clear();
    m_mediaKind = MediaKind::None;
}

bool SyncBridge::isInitializing() const {
    if (!m_source) return false;
    SourceNodeState state = m_source->state();
    return state == SourceNodeState::Pending || state == SourceNodeState::Invalid;
}

SourceNodeState SyncBridge::sourceState() const {
    return m_source ? m_source->state() : SourceNodeState::Uninitialized;
}

media::MediaElement* SyncBridge::element() const {
    return m_source ? m_source->element() : nullptr;
}

// ============================================================================
// Teardown
// ============================================================================

void SyncBridge::teardown() {
    m_isPlaying = false;

    // Node first, then context
    if (m_source) {
        m_source->dispose();
        m_retiredSources.push_back(std::move(m_source));
    }
    if (m_context) {
        m_lifecycle.dispose(*m_context);
        m_retiredContexts.push_back(std::move(m_context));
    }

    m_timebase.reset();
    m_lastError.reset();
}

// ============================================================================
// Engine handlers
// ============================================================================

void SyncBridge::handleLoaded(uint64_t generation) {
    DispatchGuard guard(*this);

    if (generation != m_generation || !m_source) {
        LOG_DEBUG("[SyncBridge] Dropping stale loaded (generation {}, current {})",
                  generation, m_generation);
        return;
    }

    auto loaded = m_source->onLoaded();
    if (!loaded) {
        const Error& error = loaded.error();
        if (error.code() == ErrorCode::InvalidDuration) {
            LOG_WARN("[SyncBridge] Loaded without a usable duration, staying not ready: {}",
                     error.what());
            m_timebase.reset();
            m_isPlaying = false;
        } else {
            LOG_DEBUG("[SyncBridge] {}", error.what());
        }
        return;
    }

    const Seconds duration = loaded.value();
    const bool wasReady = m_timebase.isReady();
    const bool durationChanged = !wasReady || duration != m_timebase.duration();
    m_timebase.markReady(duration);

    LOG_INFO("[SyncBridge] Ready: {} ({:.3f}s)", m_mediaUrl, duration);

    if (durationChanged) {
        if (auto onDurationChange = m_callbacks.onDurationChange) {
            onDurationChange(duration);
        }
    }

    // The duration callback may have re-initialized
    if (generation != m_generation) return;

    if (!wasReady) {
        if (auto onReady = m_callbacks.onReady) {
            onReady();
        }
    }
}

void SyncBridge::handleError(uint64_t generation, const Error& error) {
    DispatchGuard guard(*this);

    if (generation != m_generation || !m_source) {
        LOG_DEBUG("[SyncBridge] Dropping stale error (generation {}, current {}): {}",
                  generation, m_generation, error.what());
        return;
    }
    if (m_source->state() == SourceNodeState::Failed) {
        LOG_DEBUG("[SyncBridge] Repeated error ignored: {}", error.what());
        return;
    }

    Error decodeError = m_source->onError(error);
    m_timebase.reset();
    m_isPlaying = false;
    reportError(decodeError);
}

void SyncBridge::handleTimeUpdate(uint64_t generation, Seconds time) {
    DispatchGuard guard(*this);

    if (generation != m_generation || !m_timebase.isReady()) return;

    if (m_timebase.setCurrentTime(time)) {
        if (auto onTimeUpdate = m_callbacks.onTimeUpdate) {
            onTimeUpdate(m_timebase.currentTime());
        }
    }
}

void SyncBridge::handleEnded(uint64_t generation) {
    DispatchGuard guard(*this);

    if (generation != m_generation) return;
    LOG_DEBUG("[SyncBridge] Element reached its end");
    m_isPlaying = false;

    // Otherwise the context keeps its clock running and restarts the
    // element on the next seek or tick
    if (!m_context) return;
    try {
        m_context->pause();
    } catch (const std::exception& e) {
        commandFailed("pause", e);
    }
}

// ============================================================================
// Error reporting
// ============================================================================

void SyncBridge::reportError(const Error& error) {
    m_lastError = error;
    LOG_ERROR("[SyncBridge] {} ({})", error.what(), errorCodeToString(error.code()));

    if (auto onError = m_callbacks.onError) {
        onError(error);
    }
}

void SyncBridge::commandFailed(const char* command, const std::exception& e) {
    reportError(Error(ErrorCode::Unknown, e.what())
                    .wrap(ErrorCode::PlaybackCommandFailed, std::string(command) + " failed"));
}

} // namespace scenebridge::engine
