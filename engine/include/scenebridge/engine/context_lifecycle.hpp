/**
 * @file context_lifecycle.hpp
 * @brief Creation and disposal of rendering contexts
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>
#include <scenebridge/engine/rendering_context.hpp>

#include <memory>

namespace scenebridge::engine {

/**
 * @brief Surface dimensions for an aspect ratio (width / height)
 *
 * The longer side is baseSize. Landscape and square: height is
 * round(baseSize / ratio). Portrait: width is round(baseSize * ratio).
 */
Size computeSurfaceSize(double aspectRatio, int baseSize);

class ContextLifecycle {
public:
    /**
     * @param engine             Engine that builds contexts; must outlive this
     * @param defaultAspectRatio Used when the caller gives no usable hint
     */
    explicit ContextLifecycle(RenderingEngine& engine,
                              double defaultAspectRatio = kDefaultAspectRatio);

    /**
     * @brief Size the surface and create a context on it
     *
     * @param surface         Drawing surface; nullptr if not mounted yet
     * @param aspectRatioHint Width / height; non-finite or <= 0 means none
     * @param baseSize        Longer side in pixels
     *
     * @return The context, SurfaceUnavailable or ContextCreationFailed
     */
    Result<std::unique_ptr<RenderingContext>> prepare(RenderSurface* surface,
                                                      double aspectRatioHint,
                                                      int baseSize);

    /**
     * @brief Reset then dispose a context
     *
     * Engine exceptions are logged and swallowed so teardown always
     * completes.
     */
    void dispose(RenderingContext& context);

    /// Hint if usable, otherwise the default ratio
    [[nodiscard]] double effectiveRatio(double aspectRatioHint) const;

private:
    RenderingEngine& m_engine;
    double m_defaultAspectRatio;
};

} // namespace scenebridge::engine
