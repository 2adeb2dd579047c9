/**
 * @file ffmpeg_media_element.cpp
 * @brief FFmpeg media element implementation
 */

#include <scenebridge/media/ffmpeg_media_element.hpp>
#include <scenebridge/core/logger.hpp>
#include "ffmpeg/ff_common.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <mutex>
#include <thread>

namespace scenebridge::media {

namespace {

/// Default frame duration when the stream reports no frame rate (25 fps)
constexpr Timestamp kFallbackFrameDurationUs = 40'000;

/// Forward jump beyond which decoding seeks instead of reading through
constexpr Timestamp kSeekThresholdUs = 2'000'000;

/**
 * @brief State shared by the element and one detached open thread
 *
 * The element sets `cancelled` under `postMutex` when it abandons the
 * open; from then on the thread never touches the event loop.
 */
struct OpenTask {
    std::atomic<bool> cancelled{false};
    std::mutex postMutex;
};

/// AVIOInterruptCB: non-zero aborts blocking libavformat I/O
int interruptOpen(void* opaque) {
    return static_cast<const std::atomic<bool>*>(opaque)->load() ? 1 : 0;
}

/// Everything the worker thread learns about a URL
struct OpenedMedia {
    // Declared first: outlives the format context whose interrupt
    // callback reads its flag
    std::shared_ptr<OpenTask> task;
    ff::FormatContextPtr format;
    ff::CodecContextPtr codec;
    int videoStream = -1;
    Seconds duration = std::numeric_limits<double>::quiet_NaN();
    int width = 0;
    int height = 0;
};

Result<OpenedMedia> openMedia(const std::string& url, const std::shared_ptr<OpenTask>& task) {
    OpenedMedia opened;
    opened.task = task;

    AVFormatContext* rawFormat = avformat_alloc_context();
    if (!rawFormat) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate format context");
    }
    rawFormat->interrupt_callback.callback = &interruptOpen;
    rawFormat->interrupt_callback.opaque = &task->cancelled;

    // Frees rawFormat on failure
    int ret = avformat_open_input(&rawFormat, url.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return ff::avError(ret, "Failed to open " + url);
    }
    opened.format.reset(rawFormat);

    ret = avformat_find_stream_info(rawFormat, nullptr);
    if (ret < 0) {
        return ff::avError(ret, "Failed to find stream info");
    }

    opened.duration = ff::containerDuration(rawFormat);

    int audioStream = av_find_best_stream(rawFormat, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    opened.videoStream = av_find_best_stream(rawFormat, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);

    if (opened.videoStream < 0 && audioStream < 0) {
        return Error(ErrorCode::MediaDecodeError, "No video or audio streams found");
    }

    if (opened.videoStream >= 0) {
        AVCodecParameters* codecpar = rawFormat->streams[opened.videoStream]->codecpar;

        const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
        if (!codec) {
            return Error(ErrorCode::DecoderError, "Decoder not found");
        }

        ff::CodecContextPtr codecCtx(avcodec_alloc_context3(codec));
        if (!codecCtx) {
            return Error(ErrorCode::OutOfMemory, "Failed to allocate codec context");
        }

        ret = avcodec_parameters_to_context(codecCtx.get(), codecpar);
        if (ret < 0) {
            return ff::avError(ret, "Failed to copy codec parameters");
        }

        codecCtx->thread_count = 0;  // Auto
        codecCtx->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;

        ret = avcodec_open2(codecCtx.get(), codec, nullptr);
        if (ret < 0) {
            return ff::avError(ret, "Failed to open codec");
        }

        opened.width = codecpar->width;
        opened.height = codecpar->height;
        opened.codec = std::move(codecCtx);
    }

    return Result<OpenedMedia>(std::move(opened));
}

} // anonymous namespace

// ============================================================================
// FfmpegMediaElement Implementation
// ============================================================================

struct FfmpegMediaElement::Impl : std::enable_shared_from_this<Impl> {
    EventLoop& loop;
    FfmpegMediaElement* owner;

    std::string source;
    ReadyState state = ReadyState::Empty;
    Seconds duration = std::numeric_limits<double>::quiet_NaN();
    int width = 0;
    int height = 0;

    // Wall-clock position
    bool playing = false;
    Seconds basePosition = 0.0;
    TimePoint playStart{};
    Seconds lastReported = -1.0;
    bool endedFired = false;

    // Background open
    std::shared_ptr<OpenTask> openTask;
    uint64_t loadToken = 0;

    // Decoding state (event-loop thread only)
    ff::FormatContextPtr format;
    ff::CodecContextPtr codec;
    int videoStream = -1;
    ff::PacketPtr packet;
    ff::FramePtr decoded;
    ff::SwsPtr sws;
    Timestamp frameDurationUs = kFallbackFrameDurationUs;
    Timestamp lastPts = kNoTimestamp;
    bool eof = false;
    std::shared_ptr<VideoFrame> cached;

    Impl(EventLoop& l, FfmpegMediaElement* o) : loop(l), owner(o) {}

    ~Impl() {
        cancelOpen();
    }

    /// Abandon a running open without waiting for it
    void cancelOpen() {
        if (!openTask) return;
        std::shared_ptr<OpenTask> task = std::move(openTask);
        std::lock_guard<std::mutex> lock(task->postMutex);
        task->cancelled = true;
        LOG_DEBUG("[FfmpegMediaElement] Abandoned open of {}", source);
    }

    void resetMedia() {
        cached.reset();
        sws.reset();
        decoded.reset();
        packet.reset();
        codec.reset();
        format.reset();
        videoStream = -1;
        lastPts = kNoTimestamp;
        eof = false;
        frameDurationUs = kFallbackFrameDurationUs;

        duration = std::numeric_limits<double>::quiet_NaN();
        width = 0;
        height = 0;
        playing = false;
        basePosition = 0.0;
        lastReported = -1.0;
        endedFired = false;
    }

    void startLoad(const std::string& url) {
        ++loadToken;
        cancelOpen();

        resetMedia();
        source = url;
        state = ReadyState::Loading;

        uint64_t token = loadToken;
        std::weak_ptr<Impl> weak = weak_from_this();

        if (url.empty()) {
            loop.post([weak, token]() {
                auto self = weak.lock();
                if (!self || self->loadToken != token) return;
                self->finishLoad(Error(ErrorCode::MediaDecodeError, "Empty media source"));
            });
            return;
        }

        LOG_DEBUG("[FfmpegMediaElement] Opening {}", url);

        // Detached: an open stuck in the kernel (a FIFO with no writer, a
        // dead mount) must not hold up the loop thread on teardown
        auto task = std::make_shared<OpenTask>();
        openTask = task;
        EventLoop& target = loop;
        std::thread([&target, weak, token, url, task]() {
            auto result = std::make_shared<Result<OpenedMedia>>(openMedia(url, task));

            std::lock_guard<std::mutex> lock(task->postMutex);
            if (task->cancelled) return;
            target.post([weak, token, result]() {
                auto self = weak.lock();
                if (!self || self->loadToken != token) return;
                self->finishLoad(std::move(*result));
            });
        }).detach();
    }

    void finishLoad(Result<OpenedMedia>&& result) {
        auto self = shared_from_this();
        openTask.reset();

        if (!result.ok()) {
            state = ReadyState::Failed;
            LOG_WARN("[FfmpegMediaElement] Load failed for {}: {}", source, result.error().what());
            Error error = result.error();
            if (owner) owner->failed.fire(error);
            return;
        }

        OpenedMedia opened = std::move(result).value();
        format = std::move(opened.format);
        // The flag it pointed at belongs to the finished open
        format->interrupt_callback = AVIOInterruptCB{nullptr, nullptr};
        codec = std::move(opened.codec);
        videoStream = opened.videoStream;
        duration = opened.duration;
        width = opened.width;
        height = opened.height;

        if (videoStream >= 0) {
            AVRational rate = format->streams[videoStream]->avg_frame_rate;
            if (rate.num > 0 && rate.den > 0) {
                frameDurationUs = av_rescale_q(1, av_inv_q(rate), {1, 1000000});
            }
        }
        packet.reset(av_packet_alloc());
        decoded.reset(av_frame_alloc());

        state = ReadyState::Metadata;
        playStart = Clock::now();

        LOG_INFO("[FfmpegMediaElement] Loaded {} ({}x{}, duration {:.3f}s)",
                 source, width, height, duration);

        if (owner) owner->loadedMetadata.fire();
    }

    Seconds position() const {
        if (!playing || state != ReadyState::Metadata) {
            return basePosition;
        }
        Seconds elapsed = std::chrono::duration<double>(Clock::now() - playStart).count();
        Seconds pos = basePosition + elapsed;
        if (isUsableDuration(duration)) {
            pos = std::min(pos, duration);
        }
        return pos;
    }

    void seekTo(Seconds time) {
        time = std::max(0.0, time);
        if (isUsableDuration(duration)) {
            time = std::min(time, duration);
        }
        basePosition = time;
        playStart = Clock::now();
        endedFired = false;
    }

    void startPlaying() {
        if (playing) return;
        if (isUsableDuration(duration) && basePosition >= duration) {
            basePosition = 0.0;
        }
        playing = true;
        endedFired = false;
        playStart = Clock::now();
    }

    void stopPlaying() {
        if (!playing) return;
        basePosition = position();
        playing = false;
    }

    void poll() {
        if (state != ReadyState::Metadata) return;
        auto self = shared_from_this();

        Seconds pos = position();
        bool reachedEnd = playing && !endedFired &&
                          isUsableDuration(duration) && pos >= duration;
        if (reachedEnd) {
            basePosition = duration;
            playing = false;
            endedFired = true;
            pos = duration;
        }

        if (pos != lastReported) {
            lastReported = pos;
            if (owner) owner->timeUpdated.fire(pos);
        }
        if (reachedEnd && owner) {
            owner->ended.fire();
        }
    }

    // ========== Frame decoding ==========

    std::shared_ptr<const VideoFrame> frameAt(Seconds time) {
        if (state != ReadyState::Metadata || !codec || videoStream < 0) {
            return nullptr;
        }

        Timestamp target = toTimestamp(time);
        if (cached && lastPts != kNoTimestamp &&
            target >= lastPts && target < lastPts + frameDurationUs) {
            return cached;
        }

        AVStream* stream = format->streams[videoStream];

        bool backwards = lastPts != kNoTimestamp && target < lastPts;
        bool farAhead = target > (lastPts == kNoTimestamp ? 0 : lastPts) + kSeekThresholdUs;
        if (backwards || farAhead) {
            int ret = av_seek_frame(format.get(), videoStream,
                ff::fromMicroseconds(target, stream->time_base), AVSEEK_FLAG_BACKWARD);
            if (ret < 0) {
                LOG_WARN("[FfmpegMediaElement] {}", ff::avError(ret, "Seek failed").what());
                return cached;
            }
            avcodec_flush_buffers(codec.get());
            eof = false;
            lastPts = kNoTimestamp;
        }

        while (true) {
            int ret = avcodec_receive_frame(codec.get(), decoded.get());

            if (ret == 0) {
                Timestamp pts = ff::toMicroseconds(decoded->best_effort_timestamp, stream->time_base);
                if (pts == kNoTimestamp) {
                    pts = lastPts == kNoTimestamp ? 0 : lastPts + frameDurationUs;
                }
                lastPts = pts;

                if (pts + frameDurationUs <= target) {
                    av_frame_unref(decoded.get());
                    continue;  // Keep decoding
                }

                convertDecoded(pts);
                av_frame_unref(decoded.get());
                return cached;
            }

            if (ret == AVERROR(EAGAIN)) {
                if (eof) return cached;

                ret = av_read_frame(format.get(), packet.get());
                if (ret == AVERROR_EOF) {
                    avcodec_send_packet(codec.get(), nullptr);
                    eof = true;
                    continue;
                }
                if (ret < 0) {
                    LOG_WARN("[FfmpegMediaElement] {}", ff::avError(ret, "Failed to read frame").what());
                    return cached;
                }
                if (packet->stream_index != videoStream) {
                    av_packet_unref(packet.get());
                    continue;  // Wrong stream
                }

                ret = avcodec_send_packet(codec.get(), packet.get());
                av_packet_unref(packet.get());
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    LOG_WARN("[FfmpegMediaElement] {}", ff::avError(ret, "Failed to send packet").what());
                    return cached;
                }
                continue;
            }

            if (ret != AVERROR_EOF) {
                LOG_WARN("[FfmpegMediaElement] {}", ff::avError(ret, "Decode error").what());
            }
            // Hold the last frame past the end of the stream
            return cached;
        }
    }

    void convertDecoded(Timestamp pts) {
        int w = decoded->width;
        int h = decoded->height;

        sws.reset(sws_getCachedContext(sws.release(),
            w, h, static_cast<AVPixelFormat>(decoded->format),
            w, h, AV_PIX_FMT_RGBA,
            SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!sws) {
            LOG_WARN("[FfmpegMediaElement] Failed to create scaler for {}x{}", w, h);
            return;
        }

        auto frame = std::make_shared<VideoFrame>(w, h, toSeconds(pts));
        uint8_t* dst[4] = {frame->data(), nullptr, nullptr, nullptr};
        int dstStride[4] = {frame->stride(), 0, 0, 0};
        sws_scale(sws.get(), decoded->data, decoded->linesize, 0, h, dst, dstStride);

        cached = std::move(frame);
    }
};

// ============================================================================
// FfmpegMediaElement Public Interface
// ============================================================================

FfmpegMediaElement::FfmpegMediaElement(EventLoop& loop)
    : m_impl(std::make_shared<Impl>(loop, this)) {}

FfmpegMediaElement::~FfmpegMediaElement() {
    // A posted result may still hold the impl; it must not reach us
    m_impl->owner = nullptr;
    m_impl->cancelOpen();
}

void FfmpegMediaElement::load(const std::string& url) {
    m_impl->startLoad(url);
}

const std::string& FfmpegMediaElement::source() const {
    return m_impl->source;
}

ReadyState FfmpegMediaElement::readyState() const {
    return m_impl->state;
}

Seconds FfmpegMediaElement::duration() const {
    return m_impl->duration;
}

Seconds FfmpegMediaElement::currentTime() const {
    return m_impl->position();
}

void FfmpegMediaElement::setCurrentTime(Seconds time) {
    m_impl->seekTo(time);
}

void FfmpegMediaElement::play() {
    m_impl->startPlaying();
}

void FfmpegMediaElement::pause() {
    m_impl->stopPlaying();
}

bool FfmpegMediaElement::paused() const {
    return !m_impl->playing;
}

int FfmpegMediaElement::videoWidth() const {
    return m_impl->width;
}

int FfmpegMediaElement::videoHeight() const {
    return m_impl->height;
}

void FfmpegMediaElement::poll() {
    m_impl->poll();
}

std::shared_ptr<const VideoFrame> FfmpegMediaElement::currentFrame() {
    return m_impl->frameAt(m_impl->position());
}

MediaElementFactory FfmpegMediaElement::factory(EventLoop& loop) {
    return [&loop]() -> std::unique_ptr<MediaElement> {
        return std::make_unique<FfmpegMediaElement>(loop);
    };
}

} // namespace scenebridge::media
