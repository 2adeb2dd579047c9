/**
 * @file software_engine.hpp
 * @brief CPU implementation of the rendering engine
 *
 * SoftwareContext keeps its own clock, advanced by update(delta) while
 * playing. Each update sequences the nodes against that clock, keeps
 * their elements aligned within the drift tolerance, polls the elements
 * for notifications and composites the active frames onto the surface.
 *
 * Drive update() through SyncBridge::tick(): element notifications fire
 * from inside update() and may tear the context down.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/engine/compositor.hpp>
#include <scenebridge/engine/rendering_context.hpp>
#include <scenebridge/media/media_element.hpp>

#include <memory>
#include <string>
#include <vector>

namespace scenebridge::engine {

struct SoftwareEngineConfig {
    /// Allowed gap between the context clock and an element
    Seconds driftTolerance = kDefaultDriftTolerance;

    FitMode fitMode = FitMode::Contain;
};

/**
 * @brief Source node wrapping one media element
 */
class SoftwareVideoNode : public VideoNode {
public:
    SoftwareVideoNode(std::unique_ptr<media::MediaElement> element, std::string url);
    ~SoftwareVideoNode() override;

    [[nodiscard]] bool connect(DestinationNode& destination) override;
    void start(Seconds time) override;
    void stop(Seconds time) override;
    [[nodiscard]] NodeState state() const override { return m_state; }
    media::MediaElement* element() override;
    void destroy() override;

    /// Begin loading the element's source
    void load();

    [[nodiscard]] const std::string& url() const { return m_url; }
    [[nodiscard]] bool isDestroyed() const { return m_destroyed; }
    [[nodiscard]] bool hasStop() const { return m_hasStop; }
    [[nodiscard]] Seconds startTime() const { return m_startTime; }
    [[nodiscard]] Seconds stopTime() const { return m_stopTime; }
    [[nodiscard]] bool isConnected() const { return m_destination != nullptr; }

    /**
     * @brief Place the node on the context timeline
     *
     * Updates the node state and drives the element to match.
     */
    void sequence(Seconds contextTime, bool contextPlaying, Seconds driftTolerance);

    /// True when the node should be drawn at the current context time
    [[nodiscard]] bool isActive() const {
        return m_state == NodeState::Playing || m_state == NodeState::Paused;
    }

private:
    void handleLoaded();
    void handleFailed(const Error& error);

    std::unique_ptr<media::MediaElement> m_element;
    std::string m_url;
    DestinationNode* m_destination = nullptr;

    NodeState m_state = NodeState::Waiting;
    bool m_started = false;
    bool m_hasStop = false;
    Seconds m_startTime = 0.0;
    Seconds m_stopTime = 0.0;
    bool m_destroyed = false;

    ScopedConnection m_loadedConn;
    ScopedConnection m_failedConn;
};

/**
 * @brief Software compositing context
 */
class SoftwareContext : public RenderingContext {
public:
    SoftwareContext(RenderSurface& surface,
                    media::MediaElementFactory factory,
                    const SoftwareEngineConfig& config);
    ~SoftwareContext() override;

    std::shared_ptr<VideoNode> createVideoNode(const std::string& url) override;
    DestinationNode& destination() override { return m_destination; }

    void play() override;
    void pause() override;

    [[nodiscard]] Seconds currentTime() const override { return m_time; }
    void setCurrentTime(Seconds time) override;

    [[nodiscard]] Seconds duration() const override;
    [[nodiscard]] ContextState state() const override { return m_state; }

    void update(Seconds delta) override;
    void reset() override;
    void dispose() override;

    [[nodiscard]] bool isDisposed() const { return m_disposed; }
    [[nodiscard]] size_t nodeCount() const { return m_nodes.size(); }
    [[nodiscard]] RenderSurface* surface() const { return m_surface; }

private:
    class Destination : public DestinationNode {};

    void render();

    RenderSurface* m_surface;
    media::MediaElementFactory m_factory;
    SoftwareEngineConfig m_config;
    Compositor m_compositor;
    Destination m_destination;

    std::vector<std::shared_ptr<SoftwareVideoNode>> m_nodes;
    ContextState m_state = ContextState::Paused;
    Seconds m_time = 0.0;
    bool m_disposed = false;
};

/**
 * @brief Engine producing SoftwareContexts
 */
class SoftwareEngine : public RenderingEngine {
public:
    explicit SoftwareEngine(media::MediaElementFactory factory,
                            SoftwareEngineConfig config = {});

    std::unique_ptr<RenderingContext> createContext(RenderSurface& surface) override;

    [[nodiscard]] const SoftwareEngineConfig& config() const { return m_config; }

private:
    media::MediaElementFactory m_factory;
    SoftwareEngineConfig m_config;
};

} // namespace scenebridge::engine
