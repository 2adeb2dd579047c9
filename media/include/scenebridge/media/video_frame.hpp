/**
 * @file video_frame.hpp
 * @brief Decoded RGBA video frame
 */

#pragma once

#include <scenebridge/core/types.hpp>

#include <cstdint>
#include <vector>

namespace scenebridge::media {

/**
 * @brief Packed RGBA8 frame in CPU memory
 *
 * Rows are tightly packed (stride == width * 4).
 */
class VideoFrame {
public:
    VideoFrame() = default;

    VideoFrame(int width, int height, Seconds pts = 0.0)
        : m_width(width)
        , m_height(height)
        , m_pts(pts)
        , m_pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0) {}

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }
    [[nodiscard]] int stride() const { return m_width * 4; }
    [[nodiscard]] Seconds pts() const { return m_pts; }
    [[nodiscard]] bool isValid() const { return m_width > 0 && m_height > 0; }

    uint8_t* data() { return m_pixels.data(); }
    const uint8_t* data() const { return m_pixels.data(); }

    /// Pointer to the pixel at (x, y); no bounds check
    uint8_t* pixel(int x, int y) {
        return m_pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 4;
    }
    const uint8_t* pixel(int x, int y) const {
        return m_pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 4;
    }

    /// Fill every pixel with one color
    void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        for (size_t i = 0; i + 3 < m_pixels.size(); i += 4) {
            m_pixels[i + 0] = r;
            m_pixels[i + 1] = g;
            m_pixels[i + 2] = b;
            m_pixels[i + 3] = a;
        }
    }

private:
    int m_width = 0;
    int m_height = 0;
    Seconds m_pts = 0.0;
    std::vector<uint8_t> m_pixels;
};

} // namespace scenebridge::media
