/**
 * @file ff_common.hpp
 * @brief FFmpeg headers, owning handles and error/time conversion
 *
 * Private to the media module; public headers never see libav types.
 */

#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <scenebridge/core/types.hpp>
#include <scenebridge/core/result.hpp>

#include <limits>
#include <memory>
#include <string>

namespace scenebridge::media::ff {

// ========== Errors ==========

/// Map an AVERROR to the closest scenebridge code
inline ErrorCode classifyAvError(int errnum) {
    if (errnum == AVERROR(ENOENT)) return ErrorCode::FileNotFound;
    if (errnum == AVERROR(ENOMEM)) return ErrorCode::OutOfMemory;
    if (errnum == AVERROR_EOF) return ErrorCode::EndOfFile;
    if (errnum == AVERROR_DECODER_NOT_FOUND) return ErrorCode::DecoderError;
    return ErrorCode::MediaDecodeError;
}

/**
 * @brief Build an Error from an FFmpeg return code
 * @param what Operation that failed, e.g. "avformat_open_input"
 */
inline Error avError(int errnum, const std::string& what = {}) {
    char text[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, text, sizeof(text));

    Error error(classifyAvError(errnum), text);
    return what.empty() ? error : error.wrap(error.code(), what);
}

// ========== Owning handles ==========

// libav frees through a pointer-to-pointer; adapt that to unique_ptr
template<typename T, void (*Free)(T**)>
struct AvFree {
    void operator()(T* p) const {
        if (p) Free(&p);
    }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, AvFree<AVFormatContext, avformat_close_input>>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, AvFree<AVCodecContext, avcodec_free_context>>;
using PacketPtr = std::unique_ptr<AVPacket, AvFree<AVPacket, av_packet_free>>;
using FramePtr = std::unique_ptr<AVFrame, AvFree<AVFrame, av_frame_free>>;

struct SwsFree {
    void operator()(SwsContext* sws) const { sws_freeContext(sws); }
};
using SwsPtr = std::unique_ptr<SwsContext, SwsFree>;

// ========== Time ==========

constexpr AVRational kMicrosecondBase{1, 1000000};

inline Timestamp toMicroseconds(int64_t pts, AVRational timeBase) {
    return pts == AV_NOPTS_VALUE ? kNoTimestamp : av_rescale_q(pts, timeBase, kMicrosecondBase);
}

inline int64_t fromMicroseconds(Timestamp us, AVRational timeBase) {
    return us == kNoTimestamp ? AV_NOPTS_VALUE : av_rescale_q(us, kMicrosecondBase, timeBase);
}

/// Container duration in seconds; infinity when the container has none
inline Seconds containerDuration(const AVFormatContext* ctx) {
    if (!ctx || ctx->duration == AV_NOPTS_VALUE) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(ctx->duration) / AV_TIME_BASE;
}

} // namespace scenebridge::media::ff
