/**
 * @file context_lifecycle.cpp
 * @brief Rendering context lifecycle implementation
 */

#include <scenebridge/engine/context_lifecycle.hpp>
#include <scenebridge/core/logger.hpp>

#include <cmath>
#include <exception>

namespace scenebridge::engine {

Size computeSurfaceSize(double aspectRatio, int baseSize) {
    if (!std::isfinite(aspectRatio) || aspectRatio <= 0.0) {
        aspectRatio = kDefaultAspectRatio;
    }

    Size size;
    if (aspectRatio >= 1.0) {
        size.width = baseSize;
        size.height = static_cast<int>(std::lround(baseSize / aspectRatio));
    } else {
        size.height = baseSize;
        size.width = static_cast<int>(std::lround(baseSize * aspectRatio));
    }
    return size;
}

ContextLifecycle::ContextLifecycle(RenderingEngine& engine, double defaultAspectRatio)
    : m_engine(engine)
    , m_defaultAspectRatio(defaultAspectRatio) {}

double ContextLifecycle::effectiveRatio(double aspectRatioHint) const {
    if (std::isfinite(aspectRatioHint) && aspectRatioHint > 0.0) {
        return aspectRatioHint;
    }
    return m_defaultAspectRatio;
}

Result<std::unique_ptr<RenderingContext>> ContextLifecycle::prepare(
        RenderSurface* surface, double aspectRatioHint, int baseSize) {
    if (!surface) {
        LOG_WARN("[ContextLifecycle] No drawing surface attached");
        return Error(ErrorCode::SurfaceUnavailable, "Drawing surface is not available");
    }

    Size size = computeSurfaceSize(effectiveRatio(aspectRatioHint), baseSize);
    surface->resize(size.width, size.height);
    LOG_DEBUG("[ContextLifecycle] Surface sized to {}x{}", size.width, size.height);

    std::unique_ptr<RenderingContext> context;
    try {
        context = m_engine.createContext(*surface);
    } catch (const std::exception& e) {
        LOG_ERROR("[ContextLifecycle] Engine threw while creating context: {}", e.what());
        return Error(ErrorCode::ContextCreationFailed,
                     std::string("Failed to create rendering context: ") + e.what());
    }

    if (!context) {
        LOG_ERROR("[ContextLifecycle] Engine returned no context");
        return Error(ErrorCode::ContextCreationFailed, "Engine returned no rendering context");
    }

    return Result<std::unique_ptr<RenderingContext>>(std::move(context));
}

void ContextLifecycle::dispose(RenderingContext& context) {
    try {
        context.reset();
    } catch (const std::exception& e) {
        LOG_WARN("[ContextLifecycle] Error resetting context: {}", e.what());
    }

    try {
        context.dispose();
    } catch (const std::exception& e) {
        LOG_WARN("[ContextLifecycle] Error disposing context: {}", e.what());
    }
}

} // namespace scenebridge::engine
