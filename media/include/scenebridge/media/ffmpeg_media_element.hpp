/**
 * @file ffmpeg_media_element.hpp
 * @brief Media element backed by FFmpeg (PIMPL)
 *
 * Opening runs on a detached worker thread; the result is posted back
 * to the event loop, where loadedMetadata or failed fires. Reloading or
 * destroying the element abandons a running open without waiting for
 * it. Playback position
 * follows the wall clock while playing. Frames are decoded on demand
 * and converted to RGBA.
 *
 * Usage:
 * @code
 *   EventLoop loop;
 *   FfmpegMediaElement element(loop);
 *   auto c = element.loadedMetadata.connect([&] { ... });
 *   element.load("clip.mp4");
 *   while (...) { loop.runPending(); element.poll(); }
 * @endcode
 */

#pragma once

#include <scenebridge/core/event_loop.hpp>
#include <scenebridge/media/media_element.hpp>

#include <memory>
#include <string>

namespace scenebridge::media {

class FfmpegMediaElement : public MediaElement {
public:
    explicit FfmpegMediaElement(EventLoop& loop);
    ~FfmpegMediaElement() override;

    FfmpegMediaElement(const FfmpegMediaElement&) = delete;
    FfmpegMediaElement& operator=(const FfmpegMediaElement&) = delete;

    void load(const std::string& url) override;

    [[nodiscard]] const std::string& source() const override;
    [[nodiscard]] ReadyState readyState() const override;
    [[nodiscard]] Seconds duration() const override;

    [[nodiscard]] Seconds currentTime() const override;
    void setCurrentTime(Seconds time) override;

    void play() override;
    void pause() override;
    [[nodiscard]] bool paused() const override;

    [[nodiscard]] int videoWidth() const override;
    [[nodiscard]] int videoHeight() const override;

    void poll() override;
    std::shared_ptr<const VideoFrame> currentFrame() override;

    /// Factory producing elements bound to a loop
    static MediaElementFactory factory(EventLoop& loop);

private:
    struct Impl;
    std::shared_ptr<Impl> m_impl;
};

} // namespace scenebridge::media
