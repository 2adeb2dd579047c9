/**
 * @file sync_bridge.hpp
 * @brief Playback synchronization bridge
 *
 * Keeps what the rendering context shows consistent with what the raw
 * media element is doing, and is the only surface the scene editor
 * talks to. One bridge owns at most one context/node pair at a time.
 *
 * Every asynchronous handler captures the generation it was registered
 * under and drops itself when the bridge has moved on. That token, not
 * cancellation, is what keeps a slow callback from a superseded
 * initialization away from the current state.
 *
 * Usage:
 * @code
 *   SoftwareEngine engine(FfmpegMediaElement::factory(loop));
 *   SyncBridge bridge(engine, config);
 *   bridge.attachSurface(&surface);
 *   bridge.setCallbacks({.onReady = [&] { bridge.play(); }});
 *   bridge.initialize("clip.mp4", MediaKind::Video, 16.0 / 9.0);
 *
 *   // each host frame
 *   loop.runPending();
 *   bridge.tick(1.0 / 30.0);
 * @endcode
 *
 * All calls belong to the event-loop thread. No operation throws.
 * Callbacks may call back into the bridge, but must not destroy it.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>
#include <scenebridge/core/config.hpp>
#include <scenebridge/engine/context_lifecycle.hpp>
#include <scenebridge/engine/rendering_context.hpp>
#include <scenebridge/engine/source_node_manager.hpp>
#include <scenebridge/engine/timebase.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scenebridge::engine {

/**
 * @brief Consumer callbacks; any member may be empty
 */
struct BridgeCallbacks {
    std::function<void()> onReady;
    std::function<void(const Error&)> onError;
    std::function<void(Seconds)> onDurationChange;
    std::function<void(Seconds)> onTimeUpdate;
};

class SyncBridge {
public:
    /**
     * @param engine Engine that creates contexts; must outlive the bridge
     * @param config Surface size, node stop ceiling, default ratio
     */
    explicit SyncBridge(RenderingEngine& engine, BridgeConfig config = {});
    ~SyncBridge();

    SyncBridge(const SyncBridge&) = delete;
    SyncBridge& operator=(const SyncBridge&) = delete;

    void setCallbacks(BridgeCallbacks callbacks);

    /// Mount or unmount the drawing surface; takes effect on the next initialize
    void attachSurface(RenderSurface* surface) { m_surface = surface; }
    [[nodiscard]] RenderSurface* surface() const { return m_surface; }

    // ========== Operations ==========

    /**
     * @brief Build a context/node pair for a video URL
     *
     * Non-video kinds and empty URLs only tear down an existing pair.
     * Otherwise the generation is bumped, the old node then the old
     * context are disposed, and the new pair is built. Construction
     * errors reach onError.
     *
     * @param aspectRatioHint Width / height; <= 0 or non-finite means none
     */
    void initialize(const std::string& mediaUrl, MediaKind mediaKind,
                    double aspectRatioHint = 0.0);

    /// Start playback; ignored (logged) until ready
    void play();

    /// Pause playback; ignored (logged) without a context
    void pause();

    /**
     * @brief Move context and element to t, clamped to [0, duration]
     *
     * When ready, currentTime changes immediately and onTimeUpdate fires.
     */
    void seek(Seconds time);

    /// Advance the context by one host frame and draw it
    void tick(Seconds delta);

    [[nodiscard]] BridgeState getState() const { return m_timebase.snapshot(); }

    /// Tear down the pair, as on unmount. Called by the destructor.
    void release();

    // ========== Status ==========

    [[nodiscard]] uint64_t generation() const { return m_generation; }
    [[nodiscard]] bool isPlaying() const { return m_isPlaying; }

    /// A pair exists that is neither ready nor failed
    [[nodiscard]] bool isInitializing() const;

    [[nodiscard]] bool hasError() const { return m_lastError.has_value(); }
    [[nodiscard]] const std::optional<Error>& lastError() const { return m_lastError; }

    [[nodiscard]] SourceNodeState sourceState() const;
    [[nodiscard]] const std::string& mediaUrl() const { return m_mediaUrl; }
    [[nodiscard]] MediaKind mediaKind() const { return m_mediaKind; }

    [[nodiscard]] RenderingContext* context() const { return m_context.get(); }
    [[nodiscard]] media::MediaElement* element() const;
    [[nodiscard]] const BridgeConfig& config() const { return m_config; }

private:
    /// Defers destruction of torn-down objects until the outermost
    /// bridge entry point returns
    class DispatchGuard {
    public:
        explicit DispatchGuard(SyncBridge& bridge);
        ~DispatchGuard();
        DispatchGuard(const DispatchGuard&) = delete;
        DispatchGuard& operator=(const DispatchGuard&) = delete;
    private:
        SyncBridge& m_bridge;
    };

    void teardown();
    bool hasPair() const { return m_context != nullptr || m_source != nullptr; }

    void handleLoaded(uint64_t generation);
    void handleError(uint64_t generation, const Error& error);
    void handleTimeUpdate(uint64_t generation, Seconds time);
    void handleEnded(uint64_t generation);

    void reportError(const Error& error);
    void commandFailed(const char* command, const std::exception& e);

    BridgeConfig m_config;
    ContextLifecycle m_lifecycle;
    BridgeCallbacks m_callbacks;
    RenderSurface* m_surface = nullptr;

    std::string m_mediaUrl;
    MediaKind m_mediaKind = MediaKind::None;
    uint64_t m_generation = 0;

    std::unique_ptr<RenderingContext> m_context;
    std::unique_ptr<SourceNodeManager> m_source;
    Timebase m_timebase;
    bool m_isPlaying = false;
    std::optional<Error> m_lastError;

    int m_dispatchDepth = 0;
    std::vector<std::unique_ptr<SourceNodeManager>> m_retiredSources;
    std::vector<std::unique_ptr<RenderingContext>> m_retiredContexts;
};

} // namespace scenebridge::engine
