/**
 * @file source_node_manager.hpp
 * @brief Lifecycle of the one source node behind a bridge
 *
 * State machine:
 *
 *   Uninitialized --createNode--> Pending --loaded--> Ready | Invalid
 *   Pending/Ready/Invalid --error--> Failed
 *   any --dispose--> Disposed (terminal)
 *
 * One manager covers one node; re-initialization builds a new manager.
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>
#include <scenebridge/core/signals.hpp>
#include <scenebridge/engine/rendering_context.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scenebridge::engine {

enum class SourceNodeState {
    Uninitialized,
    Pending,
    Ready,
    Invalid,
    Failed,
    Disposed,
};

inline const char* sourceNodeStateToString(SourceNodeState state) {
    switch (state) {
        case SourceNodeState::Uninitialized: return "uninitialized";
        case SourceNodeState::Pending: return "pending";
        case SourceNodeState::Ready: return "ready";
        case SourceNodeState::Invalid: return "invalid";
        case SourceNodeState::Failed: return "failed";
        case SourceNodeState::Disposed: return "disposed";
        default: return "unknown";
    }
}

/**
 * @brief Handlers wired to the node and its element
 *
 * Any member may be empty.
 */
struct SourceNodeHandlers {
    std::function<void()> loaded;
    std::function<void(const Error&)> failed;
    std::function<void(Seconds)> timeUpdated;
    std::function<void()> ended;
};

class SourceNodeManager {
public:
    explicit SourceNodeManager(Seconds stopCeiling = kDefaultNodeStopCeiling);
    ~SourceNodeManager();

    SourceNodeManager(const SourceNodeManager&) = delete;
    SourceNodeManager& operator=(const SourceNodeManager&) = delete;

    /**
     * @brief Create the node, connect it and sequence it over [0, ceiling]
     *
     * The stop time is a generous ceiling because the real duration is
     * unknown until "loaded". Fails with NodeCreationFailed.
     */
    Result<void> createNode(RenderingContext* context, const std::string& url);

    /// Subscribe to node and element events until dispose()
    void watch(const SourceNodeHandlers& handlers);

    /**
     * @brief Handle "loaded": read the element's duration
     *
     * Finite and positive moves to Ready; anything else moves to Invalid
     * and returns InvalidDuration.
     */
    Result<Seconds> onLoaded();

    /**
     * @brief Handle "error": move to Failed
     *
     * @return MediaDecodeError carrying the engine's message
     */
    Error onError(const Error& engineError);

    /// Re-issue start(0) if the engine left the node Waiting
    void ensureStarted();

    /// Disconnect handlers and destroy the node. Never throws.
    void dispose();

    [[nodiscard]] SourceNodeState state() const { return m_state; }
    [[nodiscard]] Seconds duration() const { return m_duration; }
    [[nodiscard]] const std::string& url() const { return m_url; }
    [[nodiscard]] Seconds stopCeiling() const { return m_stopCeiling; }

    [[nodiscard]] VideoNode* node() const { return m_node.get(); }

    /// Raw element of the live node, or nullptr
    [[nodiscard]] media::MediaElement* element() const;

private:
    Seconds m_stopCeiling;
    SourceNodeState m_state = SourceNodeState::Uninitialized;
    Seconds m_duration = 0.0;
    std::string m_url;

    std::shared_ptr<VideoNode> m_node;
    std::vector<ScopedConnection> m_connections;
};

} // namespace scenebridge::engine
