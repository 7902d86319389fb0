/**
 * @file types.hpp
 * @brief Core data types and constants for Cursor FX
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Pixel format and compositing constants
 *
 *          - CursorSample and ZoomWindow (job inputs)
 *
 *          - FrameState (derived per output frame)
 *
 *          - VideoInfo (probe result)
 */

#ifndef CURSOR_FX_TYPES_HPP
#define CURSOR_FX_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace cursor_fx {

// **----- CONSTANTS -----**

/**
 * @brief Bytes per pixel of the raw frame stream (RGBA).
 * @note Both ffmpeg subprocesses are told to use rgba, so a frame is always
 *       width * height * FRAME_CHANNELS bytes.
 */
constexpr int FRAME_CHANNELS = 4;

/// Half-size of the square patch blurred over the native cursor
constexpr int CURSOR_BLUR_RADIUS = 25;

/// Gaussian sigma used for the native cursor patch
constexpr double CURSOR_BLUR_SIGMA = 15.0;

/// Edge length of the click glow box
constexpr int CLICK_GLOW_SIZE = 60;

/// Peak opacity of the click glow (at its center)
constexpr double CLICK_GLOW_ALPHA = 0.3;

/// Zoom scales at or below this are treated as identity
constexpr double ZOOM_EPSILON_SCALE = 1.01;

/// Fraction of the sample gap during which a click stays visible
constexpr double CLICK_VISIBLE_FRACTION = 0.3;

/// Fraction of a zoom window spent easing in (and again easing out)
constexpr double ZOOM_EASE_FRACTION = 0.15;

// **----- DATA STRUCTURES -----**

enum class CursorKind { Move, Click };

/**
 * @struct CursorSample
 * @brief One recorded cursor event.
 * @note Timestamps are milliseconds from recording start; coordinates are in
 *       source-video pixel space.
 */
struct CursorSample {
  double timestamp_ms;
  double x;
  double y;
  CursorKind kind = CursorKind::Move;
  bool keyboard = false; //< Originated from keyboard input (zoom trigger only)
};

/**
 * @struct ZoomWindow
 * @brief A time window rendered with a camera zoom toward (x, y).
 * @note x and y are normalized to [0,1]; active on [start, start+duration].
 */
struct ZoomWindow {
  double start_sec;
  double x;
  double y;
  double scale;
  double duration_sec;
};

/// Interpolated cursor position; x = y = -1 means "do not draw"
struct CursorPoint {
  double x = -1.0;
  double y = -1.0;
  bool clicking = false;
};

/// Camera state for one instant; identity is focus (0.5, 0.5) at scale 1
struct ZoomState {
  double focus_x = 0.5;
  double focus_y = 0.5;
  double scale = 1.0;
};

/**
 * @struct FrameState
 * @brief Everything the compositor needs for one output frame.
 * @note Purely a function of (samples, windows, timestamp). Never persisted.
 */
struct FrameState {
  double cursor_x = -1.0;
  double cursor_y = -1.0;
  bool clicking = false;
  double zoom_focus_x = 0.5;
  double zoom_focus_y = 0.5;
  double zoom_scale = 1.0;
};

/**
 * @struct VideoInfo
 * @brief Stream metadata returned by probe_video().
 */
struct VideoInfo {
  int width = 0;
  int height = 0;
  double fps = 0;
  int fps_num = 0;         //< Exact frame rate numerator (for the encoder)
  int fps_den = 1;         //< Exact frame rate denominator
  double duration_sec = 0;
  int64_t total_frames = 0; //< Container count, or duration * fps estimate
  bool has_audio = false;

  size_t frame_size() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height) *
           FRAME_CHANNELS;
  }
};

} // namespace cursor_fx

#endif // CURSOR_FX_TYPES_HPP
