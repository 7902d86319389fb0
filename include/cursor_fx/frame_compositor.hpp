/**
 * @file frame_compositor.hpp
 * @brief Per-frame raster composition for the cursor overlay
 *
 * @details Steps, in order, on an RGBA frame:
 *
 *          1. Zoom crop + Lanczos upscale (libswscale) when scale > 1.01
 *
 *          2. Gaussian blur of a 50x50 patch over the native cursor
 *
 *          3. Radial click glow when the cursor is clicking
 *
 *          4. Cursor sprite overlay (skipped silently if unavailable)
 *
 *          Steps 2-4 are skipped when the cursor position is invalid.
 *
 * @attention THREAD MODEL:
 *            - One FrameCompositor per pipeline. It owns a cached SwsContext
 *              and scratch buffers and is not safe to share between threads.
 */

#ifndef CURSOR_FX_FRAME_COMPOSITOR_HPP
#define CURSOR_FX_FRAME_COMPOSITOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "sprite_cache.hpp"
#include "types.hpp"

struct SwsContext;

namespace cursor_fx {

/**
 * @struct ZoomCrop
 * @brief Source rectangle selected by the zoom step.
 */
struct ZoomCrop {
  int left = 0;
  int top = 0;
  int width = 0;
  int height = 0;
};

/**
 * @brief Compute the zoom crop rectangle, clamped to stay inside the frame.
 * @param width Frame width
 * @param height Frame height
 * @param focus_x Normalized focus point
 * @param focus_y Normalized focus point
 * @param scale Magnification (> 1)
 */
ZoomCrop compute_zoom_crop(int width, int height, double focus_x,
                           double focus_y, double scale);

class FrameCompositor {
public:
  /**
   * @param width Frame width in pixels
   * @param height Frame height in pixels
   * @param sprites Sprite source (usually SpriteCache::shared())
   */
  FrameCompositor(int width, int height, SpriteCache &sprites);
  ~FrameCompositor();

  /// Disable copy (owns an SwsContext)
  FrameCompositor(const FrameCompositor &) = delete;
  FrameCompositor &operator=(const FrameCompositor &) = delete;

  /**
   * @brief Produce the transformed frame.
   *
   * @param in Source frame, width * height * 4 bytes; never modified
   * @param out Destination frame (resized as needed)
   * @param state Cursor and zoom state for this frame
   * @param style Cursor sprite style name
   * @return false on a malformed buffer or resampling failure
   */
  bool composite(const std::vector<uint8_t> &in, std::vector<uint8_t> &out,
                 const FrameState &state, const std::string &style);

  const std::string &last_error() const { return last_error_; }

private:
  int width_;
  int height_;
  SpriteCache &sprites_;
  SwsContext *sws_ = nullptr;

  /// Precomputed once; reused by every frame
  std::vector<float> blur_kernel_;
  std::vector<float> glow_mask_;

  /// Scratch space for the blur (avoids malloc in the hot loop)
  std::vector<float> patch_;
  std::vector<float> scratch_;

  std::string last_error_;

  bool apply_zoom(const uint8_t *src, uint8_t *dst, const ZoomCrop &crop);
  void blur_cursor_region(uint8_t *frame, int ix, int iy);
  void draw_click_glow(uint8_t *frame, int ix, int iy);
  void overlay_sprite(uint8_t *frame, const Sprite &sprite, int ix, int iy);
};

} // namespace cursor_fx

#endif // CURSOR_FX_FRAME_COMPOSITOR_HPP
