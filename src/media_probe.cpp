/**
 * @file media_probe.cpp
 * @brief libavformat media probing implementation
 */

#include "clipforge/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "clipforge/logging.hpp"

namespace clipforge {

namespace {

/// Frame rate assumed when the container does not declare one
constexpr double FALLBACK_FPS = 25.0;

/**
 * @brief Closes the format context on every exit path.
 */
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

StageOutcome LibavProber::probe(const std::string &path, MediaInfo &out) {
  FormatContextGuard guard;

  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("avformat_open_input failed for {}", path);
    return StageOutcome::fatal(fmt::format("cannot open media {}", path));
  }

  /// Find stream info (reads some packets to determine streams)
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}", path);
    return StageOutcome::fatal(fmt::format("unreadable media {}", path));
  }

  /// Find the best video stream
  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    LOG_ERROR("No video stream found in {}", path);
    return StageOutcome::fatal(fmt::format("no video stream in {}", path));
  }

  AVStream *stream = guard.ctx->streams[video_idx];
  MediaInfo info;
  info.width = stream->codecpar->width;
  info.height = stream->codecpar->height;

  AVRational r = stream->avg_frame_rate;
  if (r.den <= 0 || r.num <= 0)
    r = stream->r_frame_rate;
  info.fps = (r.den > 0 && r.num > 0) ? av_q2d(r) : FALLBACK_FPS;

  if (guard.ctx->duration != AV_NOPTS_VALUE) {
    info.duration = guard.ctx->duration / static_cast<double>(AV_TIME_BASE);
  } else if (stream->duration != AV_NOPTS_VALUE) {
    info.duration = stream->duration * av_q2d(stream->time_base);
  }

  info.has_audio = av_find_best_stream(guard.ctx, AVMEDIA_TYPE_AUDIO, -1, -1,
                                       nullptr, 0) >= 0;

  if (info.width <= 0 || info.height <= 0 || info.duration <= 0) {
    return StageOutcome::fatal(
        fmt::format("media {} reports no usable size or duration", path));
  }

  LOG_DEBUG("[probe] {}: {}x{} @ {:.2f} fps, {:.2f}s, audio={}", path,
            info.width, info.height, info.fps, info.duration, info.has_audio);
  out = info;
  return StageOutcome::success();
}

} // namespace clipforge
