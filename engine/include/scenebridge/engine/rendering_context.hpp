/**
 * @file rendering_context.hpp
 * @brief Rendering engine interface
 *
 * A RenderingEngine creates RenderingContexts bound to a surface. A
 * context owns a graph of VideoNodes that feed its destination, keeps a
 * clock of its own and draws one frame per update(). Every call may
 * throw; the bridge converts exceptions into Errors at the boundary.
 *
 * Usage:
 * @code
 *   auto ctx = engine.createContext(surface);
 *   auto node = ctx->createVideoNode("clip.mp4");
 *   node->connect(ctx->destination());
 *   node->start(0);
 *   node->stop(3600);
 *   auto c = node->loaded.connect([&] { ... });
 *   ctx->play();
 *   ctx->update(1.0 / 30.0);
 * @endcode
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>
#include <scenebridge/core/signals.hpp>
#include <scenebridge/media/media_element.hpp>
#include <scenebridge/engine/render_surface.hpp>

#include <memory>
#include <string>

namespace scenebridge::engine {

/**
 * @brief Transport state of a rendering context
 */
enum class ContextState {
    Paused,     ///< Clock stopped
    Playing,    ///< Clock running
    Stalled,    ///< Playing, but a source is still loading
    Ended,      ///< Clock reached the context duration
};

/**
 * @brief Sequencing state of a source node
 */
enum class NodeState {
    Waiting,    ///< start() not called yet
    Sequenced,  ///< Scheduled, context time before start
    Playing,    ///< Active and the context is playing
    Paused,     ///< Active and the context is paused
    Ended,      ///< Context time past stop
    Error,      ///< Element failed
};

inline const char* contextStateToString(ContextState state) {
    switch (state) {
        case ContextState::Paused: return "paused";
        case ContextState::Playing: return "playing";
        case ContextState::Stalled: return "stalled";
        case ContextState::Ended: return "ended";
        default: return "unknown";
    }
}

inline const char* nodeStateToString(NodeState state) {
    switch (state) {
        case NodeState::Waiting: return "waiting";
        case NodeState::Sequenced: return "sequenced";
        case NodeState::Playing: return "playing";
        case NodeState::Paused: return "paused";
        case NodeState::Ended: return "ended";
        case NodeState::Error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Sink node that composites its inputs onto the surface
 */
class DestinationNode {
public:
    virtual ~DestinationNode() = default;
};

/**
 * @brief Engine-side handle for one playable media input
 */
class VideoNode {
public:
    virtual ~VideoNode() = default;

    /// Route output to a destination; false if the engine refused
    [[nodiscard]] virtual bool connect(DestinationNode& destination) = 0;

    /// Schedule playback start, in context time
    virtual void start(Seconds time) = 0;

    /// Schedule playback stop, in context time
    virtual void stop(Seconds time) = 0;

    [[nodiscard]] virtual NodeState state() const = 0;

    /// Underlying raw media element; nullptr once destroyed
    virtual media::MediaElement* element() = 0;

    /// Detach from the graph and release the element. Idempotent.
    virtual void destroy() = 0;

    // ========== Signals ==========

    /// The element knows its metadata (duration, dimensions)
    VoidSignal loaded;

    /// The element failed to load or decode
    Signal<const Error&> failed;
};

/**
 * @brief Compositing context bound to one surface
 */
class RenderingContext {
public:
    virtual ~RenderingContext() = default;

    virtual std::shared_ptr<VideoNode> createVideoNode(const std::string& url) = 0;
    virtual DestinationNode& destination() = 0;

    virtual void play() = 0;
    virtual void pause() = 0;

    [[nodiscard]] virtual Seconds currentTime() const = 0;
    virtual void setCurrentTime(Seconds time) = 0;

    /// Latest stop time among sequenced nodes; 0 when there are none
    [[nodiscard]] virtual Seconds duration() const = 0;

    [[nodiscard]] virtual ContextState state() const = 0;

    /// Advance the clock by delta seconds (if playing) and draw a frame
    virtual void update(Seconds delta) = 0;

    /// Destroy every node in the graph
    virtual void reset() = 0;

    /// Release the surface and native resources
    virtual void dispose() = 0;
};

/**
 * @brief Factory for rendering contexts
 */
class RenderingEngine {
public:
    virtual ~RenderingEngine() = default;

    virtual std::unique_ptr<RenderingContext> createContext(RenderSurface& surface) = 0;
};

} // namespace scenebridge::engine
