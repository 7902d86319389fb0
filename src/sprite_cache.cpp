/**
 * @file sprite_cache.cpp
 * @brief Sprite decoding and caching implementation
 */

#include "cursor_fx/sprite_cache.hpp"

#include <filesystem>
#include <system_error>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

#include "cursor_fx/config.hpp"
#include "cursor_fx/logging.hpp"

namespace cursor_fx {

namespace {

/**
 * @brief Owns every FFmpeg object needed to decode one still image.
 * @note Frees in reverse allocation order; safe after partial setup.
 */
struct ImageDecoder {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  SwsContext *sws = nullptr;
  int stream_idx = -1;

  ~ImageDecoder() {
    if (sws)
      sws_freeContext(sws);
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  bool open(const std::string &path) {
    if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0)
      return false;
    if (avformat_find_stream_info(fmt_ctx, nullptr) < 0)
      return false;

    stream_idx =
        av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_idx < 0)
      return false;

    AVCodecParameters *param = fmt_ctx->streams[stream_idx]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(param->codec_id);
    if (!codec)
      return false;

    dec_ctx = avcodec_alloc_context3(codec);
    if (!dec_ctx)
      return false;
    if (avcodec_parameters_to_context(dec_ctx, param) < 0)
      return false;
    if (avcodec_open2(dec_ctx, codec, nullptr) < 0)
      return false;

    frame = av_frame_alloc();
    pkt = av_packet_alloc();
    return frame && pkt;
  }

  /// Decode the first picture of the stream into `frame`
  bool decode_first() {
    while (av_read_frame(fmt_ctx, pkt) >= 0) {
      if (pkt->stream_index != stream_idx) {
        av_packet_unref(pkt);
        continue;
      }
      int ret = avcodec_send_packet(dec_ctx, pkt);
      av_packet_unref(pkt);
      if (ret < 0)
        return false;
      if (avcodec_receive_frame(dec_ctx, frame) == 0)
        return true;
    }

    /// Flush: single-image demuxers may only yield the frame on drain
    avcodec_send_packet(dec_ctx, nullptr);
    return avcodec_receive_frame(dec_ctx, frame) == 0;
  }
};

} // anonymous namespace

// **---- Loading ----**

std::shared_ptr<const Sprite> load_sprite(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec))
    return nullptr;

  ImageDecoder dec;
  if (!dec.open(path) || !dec.decode_first()) {
    LOG_WARN("Failed to decode sprite: {}", path);
    return nullptr;
  }

  const int w = dec.frame->width;
  const int h = dec.frame->height;
  if (w <= 0 || h <= 0)
    return nullptr;

  dec.sws = sws_getContext(w, h, static_cast<AVPixelFormat>(dec.frame->format),
                           w, h, AV_PIX_FMT_RGBA, SWS_POINT, nullptr, nullptr,
                           nullptr);
  if (!dec.sws) {
    LOG_WARN("No RGBA conversion for sprite: {}", path);
    return nullptr;
  }

  auto sprite = std::make_shared<Sprite>();
  sprite->width = w;
  sprite->height = h;
  sprite->pixels.resize(static_cast<size_t>(w) * h * 4);

  uint8_t *dst[4] = {sprite->pixels.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {w * 4, 0, 0, 0};
  if (sws_scale(dec.sws, dec.frame->data, dec.frame->linesize, 0, h, dst,
                dst_stride) != h) {
    LOG_WARN("RGBA conversion failed for sprite: {}", path);
    return nullptr;
  }

  return sprite;
}

// **---- SpriteCache ----**

std::string normalize_cursor_style(const std::string &style) {
  return style == "hand" ? "hand" : "normal";
}

SpriteCache::SpriteCache(std::string asset_dir)
    : asset_dir_(std::move(asset_dir)) {}

SpriteCache &SpriteCache::shared() {
  static SpriteCache cache(Config::sprite_dir());
  return cache;
}

std::string SpriteCache::asset_path(const std::string &style) const {
  return (std::filesystem::path(asset_dir_) / ("cursor_" + style + ".png"))
      .string();
}

std::shared_ptr<const Sprite>
SpriteCache::get(const std::string &requested_style) {
  const std::string style = normalize_cursor_style(requested_style);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sprites_.find(style);
  if (it != sprites_.end())
    return it->second;

  ++load_attempts_;
  std::string path = asset_path(style);
  auto sprite = load_sprite(path);
  if (sprite) {
    LOG_INFO("Loaded cursor sprite '{}' ({}x{})", style, sprite->width,
             sprite->height);
  } else {
    LOG_WARN("Cursor sprite not available: {}", path);
  }

  /// Absence is cached too; it is never retried
  sprites_.emplace(style, sprite);
  return sprite;
}

void SpriteCache::put(const std::string &style,
                      std::shared_ptr<const Sprite> sprite) {
  std::lock_guard<std::mutex> lock(mutex_);
  sprites_[normalize_cursor_style(style)] = std::move(sprite);
}

size_t SpriteCache::load_attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_attempts_;
}

} // namespace cursor_fx
