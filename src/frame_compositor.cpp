/**
 * @file frame_compositor.cpp
 * @brief Per-frame raster composition implementation
 *
 * @details All pixel operations work on tightly packed RGBA rows
 *          (stride = width * 4). The source frame is only read; every write
 *          goes to the caller's output buffer.
 *
 * @attention OPTIMIZATIONS:
 *
 *          - SwsContext cached across frames (sws_getCachedContext)
 *
 *          - Blur kernel and glow mask computed once in the constructor
 *
 *          - Blur scratch buffers pre-allocated (no malloc per frame)
 */

#include "cursor_fx/frame_compositor.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include <fmt/core.h>

namespace cursor_fx {

namespace {

constexpr uint8_t GLOW_R = 180;
constexpr uint8_t GLOW_G = 130;
constexpr uint8_t GLOW_B = 255;

inline uint8_t to_byte(float v) {
  return static_cast<uint8_t>(std::clamp(v + 0.5f, 0.0f, 255.0f));
}

} // anonymous namespace

// **---- Zoom geometry ----**

ZoomCrop compute_zoom_crop(int width, int height, double focus_x,
                           double focus_y, double scale) {
  ZoomCrop crop;
  crop.width = std::clamp(static_cast<int>(std::lround(width / scale)), 1,
                          width);
  crop.height = std::clamp(static_cast<int>(std::lround(height / scale)), 1,
                           height);

  int cx = static_cast<int>(std::lround(focus_x * width));
  int cy = static_cast<int>(std::lround(focus_y * height));

  crop.left = std::max(
      0, std::min(width - crop.width,
                  cx - static_cast<int>(std::lround(crop.width / 2.0))));
  crop.top = std::max(
      0, std::min(height - crop.height,
                  cy - static_cast<int>(std::lround(crop.height / 2.0))));
  return crop;
}

// **---- Construction ----**

FrameCompositor::FrameCompositor(int width, int height, SpriteCache &sprites)
    : width_(width), height_(height), sprites_(sprites) {
  /// Gaussian kernel, truncated at 3 sigma
  const int radius = static_cast<int>(std::ceil(3.0 * CURSOR_BLUR_SIGMA));
  blur_kernel_.resize(2 * radius + 1);
  float sum = 0.0f;
  for (int k = -radius; k <= radius; ++k) {
    float v = static_cast<float>(
        std::exp(-(k * k) / (2.0 * CURSOR_BLUR_SIGMA * CURSOR_BLUR_SIGMA)));
    blur_kernel_[k + radius] = v;
    sum += v;
  }
  for (auto &v : blur_kernel_)
    v /= sum;

  /// Radial glow: peak CLICK_GLOW_ALPHA at the center, soft falloff
  const double center = (CLICK_GLOW_SIZE - 1) / 2.0;
  const double sigma = CLICK_GLOW_SIZE / 4.0;
  glow_mask_.resize(CLICK_GLOW_SIZE * CLICK_GLOW_SIZE);
  for (int y = 0; y < CLICK_GLOW_SIZE; ++y) {
    for (int x = 0; x < CLICK_GLOW_SIZE; ++x) {
      double dx = x - center;
      double dy = y - center;
      double a = CLICK_GLOW_ALPHA *
                 std::exp(-(dx * dx + dy * dy) / (2.0 * sigma * sigma));
      glow_mask_[y * CLICK_GLOW_SIZE + x] = static_cast<float>(a);
    }
  }

  const size_t patch_px = (2 * CURSOR_BLUR_RADIUS) * (2 * CURSOR_BLUR_RADIUS);
  patch_.resize(patch_px * FRAME_CHANNELS);
  scratch_.resize(patch_px * FRAME_CHANNELS);
}

FrameCompositor::~FrameCompositor() {
  if (sws_)
    sws_freeContext(sws_);
}

// **---- Main entry ----**

bool FrameCompositor::composite(const std::vector<uint8_t> &in,
                                std::vector<uint8_t> &out,
                                const FrameState &state,
                                const std::string &style) {
  const size_t frame_size =
      static_cast<size_t>(width_) * height_ * FRAME_CHANNELS;
  if (width_ <= 0 || height_ <= 0 || in.size() != frame_size) {
    last_error_ = fmt::format(
        "Unexpected frame buffer: {} bytes for {}x{} RGBA (expected {})",
        in.size(), width_, height_, frame_size);
    return false;
  }
  out.resize(frame_size);

  double cursor_x = state.cursor_x;
  double cursor_y = state.cursor_y;
  const bool cursor_valid = cursor_x >= 0 && cursor_y >= 0;

  // **----- STEP 1: ZOOM -----**

  if (state.zoom_scale > ZOOM_EPSILON_SCALE) {
    ZoomCrop crop = compute_zoom_crop(width_, height_, state.zoom_focus_x,
                                      state.zoom_focus_y, state.zoom_scale);
    if (!apply_zoom(in.data(), out.data(), crop))
      return false;

    cursor_x = (cursor_x - crop.left) * state.zoom_scale;
    cursor_y = (cursor_y - crop.top) * state.zoom_scale;
  } else {
    std::memcpy(out.data(), in.data(), frame_size);
  }

  if (!cursor_valid || cursor_x < 0 || cursor_y < 0)
    return true;

  const int ix = static_cast<int>(std::lround(cursor_x));
  const int iy = static_cast<int>(std::lround(cursor_y));

  // **----- STEP 2: ERASE NATIVE CURSOR -----**

  blur_cursor_region(out.data(), ix, iy);

  // **----- STEP 3: CLICK GLOW -----**

  if (state.clicking)
    draw_click_glow(out.data(), ix, iy);

  // **----- STEP 4: SPRITE -----**

  auto sprite = sprites_.get(style);
  if (sprite)
    overlay_sprite(out.data(), *sprite, ix, iy);

  return true;
}

// **---- Zoom ----**

bool FrameCompositor::apply_zoom(const uint8_t *src, uint8_t *dst,
                                 const ZoomCrop &crop) {
  sws_ = sws_getCachedContext(sws_, crop.width, crop.height, AV_PIX_FMT_RGBA,
                              width_, height_, AV_PIX_FMT_RGBA, SWS_LANCZOS,
                              nullptr, nullptr, nullptr);
  if (!sws_) {
    last_error_ = fmt::format("Failed to create {}x{} -> {}x{} scaler",
                              crop.width, crop.height, width_, height_);
    return false;
  }

  const int stride = width_ * FRAME_CHANNELS;
  const uint8_t *src_slice[4] = {
      src + static_cast<size_t>(crop.top) * stride +
          static_cast<size_t>(crop.left) * FRAME_CHANNELS,
      nullptr, nullptr, nullptr};
  int src_stride[4] = {stride, 0, 0, 0};
  uint8_t *dst_slice[4] = {dst, nullptr, nullptr, nullptr};
  int dst_stride[4] = {stride, 0, 0, 0};

  int rows = sws_scale(sws_, src_slice, src_stride, 0, crop.height, dst_slice,
                       dst_stride);
  if (rows != height_) {
    last_error_ = fmt::format("Zoom resample produced {} of {} rows", rows,
                              height_);
    return false;
  }
  return true;
}

// **---- Native cursor blur ----**

void FrameCompositor::blur_cursor_region(uint8_t *frame, int ix, int iy) {
  const int x1 = std::max(0, ix - CURSOR_BLUR_RADIUS);
  const int y1 = std::max(0, iy - CURSOR_BLUR_RADIUS);
  const int x2 = std::min(width_, ix + CURSOR_BLUR_RADIUS);
  const int y2 = std::min(height_, iy + CURSOR_BLUR_RADIUS);
  const int pw = x2 - x1;
  const int ph = y2 - y1;
  if (pw <= 0 || ph <= 0)
    return;

  const int stride = width_ * FRAME_CHANNELS;
  const int radius = static_cast<int>(blur_kernel_.size() / 2);

  /// Load patch
  for (int y = 0; y < ph; ++y) {
    const uint8_t *row = frame + static_cast<size_t>(y1 + y) * stride +
                         static_cast<size_t>(x1) * FRAME_CHANNELS;
    float *prow = patch_.data() + static_cast<size_t>(y) * pw * FRAME_CHANNELS;
    for (int i = 0; i < pw * FRAME_CHANNELS; ++i)
      prow[i] = row[i];
  }

  /// Horizontal pass (edges clamp inside the patch)
  for (int y = 0; y < ph; ++y) {
    const float *prow =
        patch_.data() + static_cast<size_t>(y) * pw * FRAME_CHANNELS;
    float *srow =
        scratch_.data() + static_cast<size_t>(y) * pw * FRAME_CHANNELS;
    for (int x = 0; x < pw; ++x) {
      float acc[FRAME_CHANNELS] = {0, 0, 0, 0};
      for (int k = -radius; k <= radius; ++k) {
        int sx = std::clamp(x + k, 0, pw - 1);
        float w = blur_kernel_[k + radius];
        for (int c = 0; c < FRAME_CHANNELS; ++c)
          acc[c] += w * prow[sx * FRAME_CHANNELS + c];
      }
      for (int c = 0; c < FRAME_CHANNELS; ++c)
        srow[x * FRAME_CHANNELS + c] = acc[c];
    }
  }

  /// Vertical pass, written straight back into the frame
  for (int y = 0; y < ph; ++y) {
    uint8_t *row = frame + static_cast<size_t>(y1 + y) * stride +
                   static_cast<size_t>(x1) * FRAME_CHANNELS;
    for (int x = 0; x < pw; ++x) {
      float acc[FRAME_CHANNELS] = {0, 0, 0, 0};
      for (int k = -radius; k <= radius; ++k) {
        int sy = std::clamp(y + k, 0, ph - 1);
        float w = blur_kernel_[k + radius];
        const float *src = scratch_.data() +
                           (static_cast<size_t>(sy) * pw + x) * FRAME_CHANNELS;
        for (int c = 0; c < FRAME_CHANNELS; ++c)
          acc[c] += w * src[c];
      }
      for (int c = 0; c < FRAME_CHANNELS; ++c)
        row[x * FRAME_CHANNELS + c] = to_byte(acc[c]);
    }
  }
}

// **---- Click glow ----**

void FrameCompositor::draw_click_glow(uint8_t *frame, int ix, int iy) {
  const int half = CLICK_GLOW_SIZE / 2;
  const int left = std::max(0, std::min(width_ - CLICK_GLOW_SIZE, ix - half));
  const int top = std::max(0, std::min(height_ - CLICK_GLOW_SIZE, iy - half));
  const int stride = width_ * FRAME_CHANNELS;

  for (int gy = 0; gy < CLICK_GLOW_SIZE; ++gy) {
    int y = top + gy;
    if (y >= height_)
      break;
    uint8_t *row = frame + static_cast<size_t>(y) * stride;
    for (int gx = 0; gx < CLICK_GLOW_SIZE; ++gx) {
      int x = left + gx;
      if (x >= width_)
        break;
      float a = glow_mask_[gy * CLICK_GLOW_SIZE + gx];
      uint8_t *px = row + x * FRAME_CHANNELS;
      px[0] = to_byte(px[0] * (1.0f - a) + GLOW_R * a);
      px[1] = to_byte(px[1] * (1.0f - a) + GLOW_G * a);
      px[2] = to_byte(px[2] * (1.0f - a) + GLOW_B * a);
    }
  }
}

// **---- Sprite ----**

void FrameCompositor::overlay_sprite(uint8_t *frame, const Sprite &sprite,
                                     int ix, int iy) {
  if (sprite.width <= 0 || sprite.height <= 0 ||
      sprite.pixels.size() <
          static_cast<size_t>(sprite.width) * sprite.height * 4)
    return;

  /// Hotspot is the sprite's top-left; keep the whole sprite on screen
  const int left = std::max(0, std::min(width_ - sprite.width, ix));
  const int top = std::max(0, std::min(height_ - sprite.height, iy));
  const int stride = width_ * FRAME_CHANNELS;

  for (int sy = 0; sy < sprite.height; ++sy) {
    int y = top + sy;
    if (y >= height_)
      break;
    uint8_t *row = frame + static_cast<size_t>(y) * stride;
    const uint8_t *srow =
        sprite.pixels.data() + static_cast<size_t>(sy) * sprite.width * 4;
    for (int sx = 0; sx < sprite.width; ++sx) {
      int x = left + sx;
      if (x >= width_)
        break;
      const uint8_t *s = srow + sx * 4;
      if (s[3] == 0)
        continue;
      uint8_t *px = row + x * FRAME_CHANNELS;
      if (s[3] == 255) {
        px[0] = s[0];
        px[1] = s[1];
        px[2] = s[2];
        px[3] = 255;
        continue;
      }
      float a = s[3] / 255.0f;
      px[0] = to_byte(s[0] * a + px[0] * (1.0f - a));
      px[1] = to_byte(s[1] * a + px[1] * (1.0f - a));
      px[2] = to_byte(s[2] * a + px[2] * (1.0f - a));
      px[3] = to_byte(s[3] + px[3] * (1.0f - a));
    }
  }
}

} // namespace cursor_fx
