/**
 * @file software_engine.cpp
 * @brief Software rendering engine implementation
 */

#include <scenebridge/engine/software_engine.hpp>
#include <scenebridge/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace scenebridge::engine {

// ============================================================================
// SoftwareVideoNode
// ============================================================================

SoftwareVideoNode::SoftwareVideoNode(std::unique_ptr<media::MediaElement> element, std::string url)
    : m_element(std::move(element))
    , m_url(std::move(url)) {
    m_loadedConn = m_element->loadedMetadata.connect([this]() { handleLoaded(); });
    m_failedConn = m_element->failed.connect([this](const Error& e) { handleFailed(e); });
}

SoftwareVideoNode::~SoftwareVideoNode() = default;

void SoftwareVideoNode::load() {
    if (m_destroyed) return;
    m_element->load(m_url);
}

bool SoftwareVideoNode::connect(DestinationNode& destination) {
    if (m_destroyed) return false;
    m_destination = &destination;
    return true;
}

void SoftwareVideoNode::start(Seconds time) {
    if (m_destroyed) return;
    m_startTime = std::max(0.0, time);
    m_started = true;
    if (m_state == NodeState::Waiting) {
        m_state = NodeState::Sequenced;
    }
}

void SoftwareVideoNode::stop(Seconds time) {
    if (m_destroyed) return;
    m_stopTime = time;
    m_hasStop = true;
}

media::MediaElement* SoftwareVideoNode::element() {
    return m_destroyed ? nullptr : m_element.get();
}

void SoftwareVideoNode::destroy() {
    if (m_destroyed) return;
    m_destroyed = true;

    m_loadedConn.disconnect();
    m_failedConn.disconnect();
    m_destination = nullptr;

    // The element lives until the node object goes away; an emission
    // may still be on the stack.
    m_element->pause();
}

void SoftwareVideoNode::sequence(Seconds contextTime, bool contextPlaying, Seconds driftTolerance) {
    if (m_destroyed || !m_started || m_state == NodeState::Error) return;

    media::MediaElement& el = *m_element;

    if (contextTime < m_startTime) {
        m_state = NodeState::Sequenced;
        if (!el.paused()) el.pause();
        return;
    }
    if (m_hasStop && contextTime >= m_stopTime) {
        m_state = NodeState::Ended;
        if (!el.paused()) el.pause();
        return;
    }

    m_state = contextPlaying ? NodeState::Playing : NodeState::Paused;

    if (el.readyState() != media::ReadyState::Metadata) return;

    Seconds local = contextTime - m_startTime;
    if (isUsableDuration(el.duration()) && local >= el.duration()) {
        return;  // element holds its last frame and reports its own end
    }

    if (contextPlaying) {
        if (el.paused()) el.play();
    } else if (!el.paused()) {
        el.pause();
    }

    if (std::abs(el.currentTime() - local) > driftTolerance) {
        LOG_TRACE("[SoftwareVideoNode] Drift {:.3f}s on {}, realigning",
                  el.currentTime() - local, m_url);
        el.setCurrentTime(local);
    }
}

void SoftwareVideoNode::handleLoaded() {
    if (m_destroyed) return;
    loaded.fire();
}

void SoftwareVideoNode::handleFailed(const Error& error) {
    if (m_destroyed) return;
    m_state = NodeState::Error;
    Error copy = error;
    failed.fire(copy);
}

// ============================================================================
// SoftwareContext
// ============================================================================

SoftwareContext::SoftwareContext(RenderSurface& surface,
                                 media::MediaElementFactory factory,
                                 const SoftwareEngineConfig& config)
    : m_surface(&surface)
    , m_factory(std::move(factory))
    , m_config(config)
    , m_compositor(config.fitMode) {}

SoftwareContext::~SoftwareContext() {
    dispose();
}

std::shared_ptr<VideoNode> SoftwareContext::createVideoNode(const std::string& url) {
    if (m_disposed) {
        throw std::logic_error("SoftwareContext: context already disposed");
    }
    if (!m_factory) {
        throw std::runtime_error("SoftwareContext: no media element factory");
    }

    auto element = m_factory();
    if (!element) {
        throw std::runtime_error("SoftwareContext: factory returned no media element");
    }

    auto node = std::make_shared<SoftwareVideoNode>(std::move(element), url);
    m_nodes.push_back(node);
    node->load();

    LOG_DEBUG("[SoftwareContext] Created node for {}", url);
    return node;
}

void SoftwareContext::play() {
    if (m_disposed) return;
    m_state = ContextState::Playing;
}

void SoftwareContext::pause() {
    if (m_disposed) return;
    if (m_state == ContextState::Playing || m_state == ContextState::Stalled) {
        m_state = ContextState::Paused;
    }
    for (auto& node : m_nodes) {
        media::MediaElement* el = node->element();
        if (el && !el->paused()) el->pause();
    }
}

void SoftwareContext::setCurrentTime(Seconds time) {
    if (m_disposed || !std::isfinite(time)) return;

    m_time = std::max(0.0, time);
    if (m_state == ContextState::Ended && m_time < duration()) {
        m_state = ContextState::Paused;
    }

    for (auto& node : m_nodes) {
        media::MediaElement* el = node->element();
        if (el && m_time >= node->startTime()) {
            el->setCurrentTime(m_time - node->startTime());
        }
    }
}

Seconds SoftwareContext::duration() const {
    Seconds latest = 0.0;
    for (const auto& node : m_nodes) {
        if (!node->isDestroyed() && node->hasStop()) {
            latest = std::max(latest, node->stopTime());
        }
    }
    return latest;
}

void SoftwareContext::update(Seconds delta) {
    if (m_disposed) return;
    if (!std::isfinite(delta) || delta < 0.0) delta = 0.0;

    m_nodes.erase(
        std::remove_if(m_nodes.begin(), m_nodes.end(),
            [](const std::shared_ptr<SoftwareVideoNode>& n) { return n->isDestroyed(); }),
        m_nodes.end());

    if (m_state == ContextState::Playing || m_state == ContextState::Stalled) {
        bool stalled = std::any_of(m_nodes.begin(), m_nodes.end(),
            [this](const std::shared_ptr<SoftwareVideoNode>& n) {
                media::MediaElement* el = n->element();
                bool scheduled = m_time >= n->startTime() &&
                                 (!n->hasStop() || m_time < n->stopTime());
                return scheduled && el && el->readyState() == media::ReadyState::Loading;
            });

        if (stalled) {
            m_state = ContextState::Stalled;
        } else {
            m_state = ContextState::Playing;
            m_time += delta;
        }

        Seconds total = duration();
        if (total > 0.0 && m_time >= total) {
            m_time = total;
            m_state = ContextState::Ended;
            LOG_DEBUG("[SoftwareContext] Reached end at {:.3f}s", total);
        }
    }

    bool playing = m_state == ContextState::Playing;

    // Notifications below may dispose this context or destroy nodes
    auto nodes = m_nodes;
    for (auto& node : nodes) {
        node->sequence(m_time, playing, m_config.driftTolerance);
    }
    for (auto& node : nodes) {
        if (m_disposed) return;
        if (node->isDestroyed()) continue;
        if (media::MediaElement* el = node->element()) {
            el->poll();
        }
    }
    if (m_disposed) return;

    render();
}

void SoftwareContext::render() {
    if (!m_surface) return;

    m_compositor.clear(*m_surface);
    for (auto& node : m_nodes) {
        if (!node->isActive()) continue;
        media::MediaElement* el = node->element();
        if (!el) continue;
        if (auto frame = el->currentFrame()) {
            m_compositor.draw(*m_surface, *frame);
        }
    }
    m_surface->markPresented();
}

void SoftwareContext::reset() {
    auto nodes = std::move(m_nodes);
    m_nodes.clear();
    for (auto& node : nodes) {
        node->destroy();
    }
    m_time = 0.0;
    m_state = ContextState::Paused;
}

void SoftwareContext::dispose() {
    if (m_disposed) return;
    reset();
    m_surface = nullptr;
    m_disposed = true;
    LOG_DEBUG("[SoftwareContext] Disposed");
}

// ============================================================================
// SoftwareEngine
// ============================================================================

SoftwareEngine::SoftwareEngine(media::MediaElementFactory factory, SoftwareEngineConfig config)
    : m_factory(std::move(factory))
    , m_config(config) {}

std::unique_ptr<RenderingContext> SoftwareEngine::createContext(RenderSurface& surface) {
    if (surface.isEmpty()) {
        throw std::invalid_argument("SoftwareEngine: surface has no pixels");
    }
    return std::make_unique<SoftwareContext>(surface, m_factory, m_config);
}

} // namespace scenebridge::engine
