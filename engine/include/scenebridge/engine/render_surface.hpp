/**
 * @file render_surface.hpp
 * @brief Drawing surface a rendering context paints into
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/media/video_frame.hpp>

namespace scenebridge::engine {

/**
 * @brief RGBA drawing surface (the "canvas")
 *
 * The host owns the surface; a rendering context only borrows it
 * between createContext() and dispose().
 */
class RenderSurface {
public:
    RenderSurface() = default;
    RenderSurface(int width, int height) { resize(width, height); }

    /// Reallocate the pixel buffer; contents are cleared to transparent
    void resize(int width, int height) {
        if (width < 0) width = 0;
        if (height < 0) height = 0;
        m_pixels = media::VideoFrame(width, height);
    }

    [[nodiscard]] int width() const { return m_pixels.width(); }
    [[nodiscard]] int height() const { return m_pixels.height(); }
    [[nodiscard]] Size size() const { return {width(), height()}; }
    [[nodiscard]] bool isEmpty() const { return !m_pixels.isValid(); }

    media::VideoFrame& pixels() { return m_pixels; }
    const media::VideoFrame& pixels() const { return m_pixels; }

    /// Number of presented frames, bumped by the context after each draw
    [[nodiscard]] uint64_t frameCount() const { return m_frameCount; }
    void markPresented() { ++m_frameCount; }

private:
    media::VideoFrame m_pixels;
    uint64_t m_frameCount = 0;
};

} // namespace scenebridge::engine
