/**
 * @file source_node_manager.cpp
 * @brief Source node lifecycle implementation
 */

#include <scenebridge/engine/source_node_manager.hpp>
#include <scenebridge/core/logger.hpp>

#include <exception>
#include <stdexcept>

namespace scenebridge::engine {

SourceNodeManager::SourceNodeManager(Seconds stopCeiling)
    : m_stopCeiling(stopCeiling) {}

SourceNodeManager::~SourceNodeManager() {
    dispose();
}

Result<void> SourceNodeManager::createNode(RenderingContext* context, const std::string& url) {
    if (m_state != SourceNodeState::Uninitialized) {
        return Err(ErrorCode::NodeCreationFailed,
                   std::string("Source node already created (state ") +
                   sourceNodeStateToString(m_state) + ")");
    }
    if (!context) {
        m_state = SourceNodeState::Failed;
        return Err(ErrorCode::NodeCreationFailed, "No rendering context");
    }

    m_url = url;

    std::shared_ptr<VideoNode> node;
    try {
        node = context->createVideoNode(url);
    } catch (const std::exception& e) {
        LOG_ERROR("[SourceNodeManager] Engine threw while creating node for {}: {}", url, e.what());
        m_state = SourceNodeState::Failed;
        return Err(ErrorCode::NodeCreationFailed,
                   std::string("Failed to create source node: ") + e.what());
    }

    if (!node) {
        LOG_ERROR("[SourceNodeManager] Engine returned no node for {}", url);
        m_state = SourceNodeState::Failed;
        return Err(ErrorCode::NodeCreationFailed, "Engine returned no source node");
    }

    try {
        if (!node->connect(context->destination())) {
            throw std::runtime_error("destination refused the connection");
        }
        node->start(0.0);
        node->stop(m_stopCeiling);
    } catch (const std::exception& e) {
        LOG_ERROR("[SourceNodeManager] Failed to sequence node for {}: {}", url, e.what());
        try {
            node->destroy();
        } catch (const std::exception& destroyError) {
            LOG_WARN("[SourceNodeManager] Error destroying half-built node: {}", destroyError.what());
        }
        m_state = SourceNodeState::Failed;
        return Err(ErrorCode::NodeCreationFailed,
                   std::string("Failed to connect source node: ") + e.what());
    }

    m_node = std::move(node);
    m_state = SourceNodeState::Pending;
    LOG_DEBUG("[SourceNodeManager] Node created for {} (stop {:.1f}s)", url, m_stopCeiling);
    return Ok();
}

void SourceNodeManager::watch(const SourceNodeHandlers& handlers) {
    if (!m_node) return;

    if (handlers.loaded) {
        m_connections.emplace_back(m_node->loaded.connect(handlers.loaded));
    }
    if (handlers.failed) {
        m_connections.emplace_back(m_node->failed.connect(handlers.failed));
    }

    media::MediaElement* el = m_node->element();
    if (!el) return;

    if (handlers.timeUpdated) {
        m_connections.emplace_back(el->timeUpdated.connect(handlers.timeUpdated));
    }
    if (handlers.ended) {
        m_connections.emplace_back(el->ended.connect(handlers.ended));
    }
}

Result<Seconds> SourceNodeManager::onLoaded() {
    switch (m_state) {
        case SourceNodeState::Pending:
        case SourceNodeState::Ready:
        case SourceNodeState::Invalid:
            break;
        default:
            return Err<Seconds>(ErrorCode::InvalidArgument,
                std::string("Loaded ignored in state ") + sourceNodeStateToString(m_state));
    }

    media::MediaElement* el = element();
    Seconds duration = el ? el->duration() : 0.0;

    if (!isUsableDuration(duration)) {
        m_state = SourceNodeState::Invalid;
        m_duration = 0.0;
        return Err<Seconds>(ErrorCode::InvalidDuration,
            "Element reported unusable duration " + std::to_string(duration));
    }

    m_state = SourceNodeState::Ready;
    m_duration = duration;
    return duration;
}

Error SourceNodeManager::onError(const Error& engineError) {
    if (m_state != SourceNodeState::Disposed) {
        m_state = SourceNodeState::Failed;
    }
    m_duration = 0.0;

    std::string context = "Media failed to load";
    if (!m_url.empty()) context += " (" + m_url + ")";
    return engineError.wrap(ErrorCode::MediaDecodeError, context);
}

void SourceNodeManager::ensureStarted() {
    if (m_node && m_node->state() == NodeState::Waiting) {
        LOG_DEBUG("[SourceNodeManager] Node still waiting, re-issuing start");
        m_node->start(0.0);
    }
}

void SourceNodeManager::dispose() {
    if (m_state == SourceNodeState::Disposed) return;

    m_connections.clear();

    if (m_node) {
        try {
            m_node->destroy();
        } catch (const std::exception& e) {
            LOG_WARN("[SourceNodeManager] Error destroying node: {}", e.what());
        }
        m_node.reset();
    }

    m_state = SourceNodeState::Disposed;
}

media::MediaElement* SourceNodeManager::element() const {
    return m_node ? m_node->element() : nullptr;
}

} // namespace scenebridge::engine
