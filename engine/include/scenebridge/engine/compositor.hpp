/**
 * @file compositor.hpp
 * @brief Draws decoded frames onto a render surface
 *
 * Places a frame with contain or cover fit and blends it over the
 * surface (Porter-Duff over, nearest-neighbour sampling).
 */

#pragma once

#include <scenebridge/core/types.hpp>
#include <scenebridge/media/video_frame.hpp>
#include <scenebridge/engine/render_surface.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace scenebridge::engine {

/**
 * @brief Destination rectangle in surface pixels
 *
 * May extend past the surface edges (cover fit).
 */
struct FitRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const FitRect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

class Compositor {
public:
    Compositor() = default;
    explicit Compositor(FitMode mode) : m_fitMode(mode) {}

    void setFitMode(FitMode mode) { m_fitMode = mode; }
    [[nodiscard]] FitMode fitMode() const { return m_fitMode; }

    /**
     * @brief Set background color (RGBA)
     */
    void setBackgroundColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        m_bgColor = {r, g, b, a};
    }

    /// Fill the surface with the background color
    void clear(RenderSurface& surface) const {
        surface.pixels().fill(m_bgColor[0], m_bgColor[1], m_bgColor[2], m_bgColor[3]);
    }

    /**
     * @brief Rectangle a source of size src occupies on a dst surface
     */
    static FitRect fitRect(Size src, Size dst, FitMode mode) {
        if (src.width <= 0 || src.height <= 0 || dst.width <= 0 || dst.height <= 0) {
            return {};
        }

        double scaleX = static_cast<double>(dst.width) / src.width;
        double scaleY = static_cast<double>(dst.height) / src.height;
        double scale = mode == FitMode::Cover ? std::max(scaleX, scaleY)
                                              : std::min(scaleX, scaleY);

        FitRect rect;
        rect.width = static_cast<int>(std::lround(src.width * scale));
        rect.height = static_cast<int>(std::lround(src.height * scale));
        rect.x = (dst.width - rect.width) / 2;
        rect.y = (dst.height - rect.height) / 2;
        return rect;
    }

    /**
     * @brief Blend a frame onto the surface
     *
     * @param opacity Multiplies the source alpha
     */
    void draw(RenderSurface& surface, const media::VideoFrame& frame, float opacity = 1.0f) const {
        if (!frame.isValid() || surface.isEmpty()) return;

        FitRect rect = fitRect({frame.width(), frame.height()}, surface.size(), m_fitMode);
        if (rect.width <= 0 || rect.height <= 0) return;

        media::VideoFrame& dst = surface.pixels();

        int x0 = std::max(0, rect.x);
        int y0 = std::max(0, rect.y);
        int x1 = std::min(dst.width(), rect.x + rect.width);
        int y1 = std::min(dst.height(), rect.y + rect.height);

        for (int y = y0; y < y1; ++y) {
            int sy = std::min(frame.height() - 1,
                static_cast<int>(static_cast<int64_t>(y - rect.y) * frame.height() / rect.height));
            for (int x = x0; x < x1; ++x) {
                int sx = std::min(frame.width() - 1,
                    static_cast<int>(static_cast<int64_t>(x - rect.x) * frame.width() / rect.width));
                blendOver(dst.pixel(x, y), frame.pixel(sx, sy), opacity);
            }
        }
    }

    /**
     * @brief Porter-Duff over for one RGBA8 pixel
     */
    static void blendOver(uint8_t* dst, const uint8_t* src, float opacity) {
        float srcA = (src[3] / 255.0f) * opacity;
        if (srcA >= 1.0f) {
            std::copy(src, src + 4, dst);
            return;
        }
        float dstA = dst[3] / 255.0f;

        float outA = srcA + dstA * (1.0f - srcA);
        for (int c = 0; c < 3; ++c) {
            float s = src[c] / 255.0f;
            float d = dst[c] / 255.0f;
            float out = outA > 0.0f ? (s * srcA + d * dstA * (1.0f - srcA)) / outA : 0.0f;
            dst[c] = static_cast<uint8_t>(std::lround(std::clamp(out, 0.0f, 1.0f) * 255.0f));
        }
        dst[3] = static_cast<uint8_t>(std::lround(std::clamp(outA, 0.0f, 1.0f) * 255.0f));
    }

private:
    FitMode m_fitMode = FitMode::Contain;
    std::array<uint8_t, 4> m_bgColor = {0, 0, 0, 255};
};

} // namespace scenebridge::engine
