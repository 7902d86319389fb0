/**
 * @file video_probe.cpp
 * @brief libavformat-based stream probe
 */

#include "cursor_fx/video_probe.hpp"

#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "cursor_fx/logging.hpp"

namespace cursor_fx {

namespace {

/// Closes the input on every exit path
struct FormatGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

bool usable_rate(AVRational r) {
  if (r.num <= 0 || r.den <= 0)
    return false;
  double fps = av_q2d(r);
  return fps > 0.0 && fps <= MAX_PLAUSIBLE_FPS;
}

} // namespace

bool probe_video(const std::string &path, VideoInfo &info, std::string &error) {
  info = VideoInfo{};

  FormatGuard guard;
  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(ret, buf, sizeof(buf));
    error = fmt::format("Cannot open {}: {}", path, buf);
    return false;
  }

  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    error = fmt::format("Cannot read stream info from {}", path);
    return false;
  }

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    error = fmt::format("No video stream in {}", path);
    return false;
  }

  const AVStream *stream = guard.ctx->streams[video_idx];
  const AVCodecParameters *par = stream->codecpar;
  if (par->width <= 0 || par->height <= 0) {
    error = fmt::format("Video stream in {} has no dimensions", path);
    return false;
  }
  info.width = par->width;
  info.height = par->height;

  // **--- FRAME RATE ---**

  /// avg_frame_rate first, then r_frame_rate, then the default
  AVRational rate = stream->avg_frame_rate;
  if (!usable_rate(rate))
    rate = stream->r_frame_rate;
  if (!usable_rate(rate)) {
    LOG_WARN("No usable frame rate in {}, assuming {} fps", path,
             DEFAULT_FPS);
    rate = AVRational{DEFAULT_FPS, 1};
  }
  info.fps_num = rate.num;
  info.fps_den = rate.den;
  info.fps = av_q2d(rate);

  // **--- DURATION ---**

  if (guard.ctx->duration != AV_NOPTS_VALUE && guard.ctx->duration > 0) {
    info.duration_sec =
        guard.ctx->duration / static_cast<double>(AV_TIME_BASE);
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    info.duration_sec = stream->duration * av_q2d(stream->time_base);
  }

  if (stream->nb_frames > 0) {
    info.total_frames = stream->nb_frames;
  } else {
    info.total_frames =
        static_cast<int64_t>(std::llround(info.duration_sec * info.fps));
  }

  info.has_audio = av_find_best_stream(guard.ctx, AVMEDIA_TYPE_AUDIO, -1, -1,
                                       nullptr, 0) >= 0;

  return true;
}

} // namespace cursor_fx
