/**
 * @file interpolator.cpp
 * @brief Cursor and zoom interpolation implementation
 */

#include "cursor_fx/interpolator.hpp"

#include <algorithm>
#include <cmath>

namespace cursor_fx {

namespace {

constexpr double AUTO_ZOOM_MIN_GAP_MS = 5000.0;
constexpr double AUTO_ZOOM_LOOKAHEAD_MS = 500.0;
constexpr double AUTO_ZOOM_TRAVEL_PX = 50.0;
constexpr double AUTO_ZOOM_SCALE = 1.5;
constexpr double AUTO_ZOOM_DURATION_SEC = 2.0;
constexpr size_t AUTO_ZOOM_MAX_WINDOWS = 5;

} // anonymous namespace

// **---- Cursor ----**

CursorPoint interpolate_cursor(const std::vector<CursorSample> &samples,
                               double time_ms) {
  CursorPoint out;
  if (samples.empty())
    return out;

  const CursorSample &first = samples.front();
  if (time_ms <= first.timestamp_ms) {
    out.x = first.x;
    out.y = first.y;
    out.clicking = first.kind == CursorKind::Click;
    return out;
  }

  /// A click cannot still be showing once the recording has ended
  const CursorSample &last = samples.back();
  if (time_ms >= last.timestamp_ms) {
    out.x = last.x;
    out.y = last.y;
    out.clicking = false;
    return out;
  }

  for (size_t i = 0; i + 1 < samples.size(); ++i) {
    const CursorSample &prev = samples[i];
    const CursorSample &next = samples[i + 1];
    if (prev.timestamp_ms <= time_ms && time_ms <= next.timestamp_ms) {
      double gap = next.timestamp_ms - prev.timestamp_ms;
      double alpha = (gap == 0.0) ? 0.0 : (time_ms - prev.timestamp_ms) / gap;
      out.x = prev.x + (next.x - prev.x) * alpha;
      out.y = prev.y + (next.y - prev.y) * alpha;
      out.clicking =
          prev.kind == CursorKind::Click && alpha < CLICK_VISIBLE_FRACTION;
      return out;
    }
  }

  /// Unordered input with no bracketing pair: draw nothing
  return CursorPoint{};
}

// **---- Zoom ----**

double cubic_in_out(double t) {
  if (t < 0.5)
    return 4.0 * t * t * t;
  return 1.0 - std::pow(-2.0 * t + 2.0, 3) / 2.0;
}

ZoomState active_zoom(const std::vector<ZoomWindow> &windows,
                      double time_sec) {
  for (const auto &w : windows) {
    double start = w.start_sec;
    double end = start + w.duration_sec;
    if (time_sec < start || time_sec > end)
      continue;

    double progress =
        (w.duration_sec > 0.0) ? (time_sec - start) / w.duration_sec : 0.0;

    double ease;
    if (progress < ZOOM_EASE_FRACTION) {
      ease = cubic_in_out(progress / ZOOM_EASE_FRACTION);
    } else if (progress > 1.0 - ZOOM_EASE_FRACTION) {
      ease = cubic_in_out(1.0 - (progress - (1.0 - ZOOM_EASE_FRACTION)) /
                                    ZOOM_EASE_FRACTION);
    } else {
      ease = 1.0;
    }

    ZoomState z;
    z.focus_x = w.x;
    z.focus_y = w.y;
    z.scale = 1.0 + (w.scale - 1.0) * ease;
    return z;
  }
  return ZoomState{};
}

FrameState compute_frame_state(const std::vector<CursorSample> &samples,
                               const std::vector<ZoomWindow> &windows,
                               int64_t frame_index, double fps) {
  double time_sec = (fps > 0.0) ? static_cast<double>(frame_index) / fps : 0.0;
  double time_ms = time_sec * 1000.0;

  CursorPoint cursor = interpolate_cursor(samples, time_ms);
  ZoomState zoom = active_zoom(windows, time_sec);

  FrameState state;
  state.cursor_x = cursor.x;
  state.cursor_y = cursor.y;
  state.clicking = cursor.clicking;
  state.zoom_focus_x = zoom.focus_x;
  state.zoom_focus_y = zoom.focus_y;
  state.zoom_scale = zoom.scale;
  return state;
}

// **---- Input hygiene ----**

bool sort_samples(std::vector<CursorSample> &samples) {
  auto by_time = [](const CursorSample &a, const CursorSample &b) {
    return a.timestamp_ms < b.timestamp_ms;
  };
  if (std::is_sorted(samples.begin(), samples.end(), by_time))
    return false;
  std::stable_sort(samples.begin(), samples.end(), by_time);
  return true;
}

std::vector<CursorSample> pointer_samples(
    const std::vector<CursorSample> &samples) {
  std::vector<CursorSample> out;
  out.reserve(samples.size());
  for (const auto &s : samples) {
    if (!s.keyboard)
      out.push_back(s);
  }
  return out;
}

// **---- Automatic zoom ----**

std::vector<ZoomWindow> detect_zoom_windows(
    const std::vector<CursorSample> &samples, int view_width,
    int view_height) {
  std::vector<ZoomWindow> zooms;
  if (view_width <= 0 || view_height <= 0)
    return zooms;

  double last_zoom_ms = -AUTO_ZOOM_MIN_GAP_MS;

  for (size_t i = 0; i < samples.size(); ++i) {
    const CursorSample &s = samples[i];
    bool trigger = s.kind == CursorKind::Click || s.keyboard;
    if (!trigger)
      continue;
    if (s.timestamp_ms - last_zoom_ms < AUTO_ZOOM_MIN_GAP_MS)
      continue;

    bool travelling = false;
    for (size_t j = i + 1; j < samples.size(); ++j) {
      const CursorSample &n = samples[j];
      if (n.timestamp_ms > s.timestamp_ms + AUTO_ZOOM_LOOKAHEAD_MS)
        break;
      if (n.kind == CursorKind::Move && !n.keyboard) {
        double dist = std::hypot(n.x - s.x, n.y - s.y);
        if (dist > AUTO_ZOOM_TRAVEL_PX) {
          travelling = true;
          break;
        }
      }
    }
    if (travelling)
      continue;

    ZoomWindow w;
    w.start_sec = s.timestamp_ms / 1000.0;
    w.x = std::clamp(s.x / view_width, 0.0, 1.0);
    w.y = std::clamp(s.y / view_height, 0.0, 1.0);
    w.scale = AUTO_ZOOM_SCALE;
    w.duration_sec = AUTO_ZOOM_DURATION_SEC;
    zooms.push_back(w);
    last_zoom_ms = s.timestamp_ms;

    if (zooms.size() >= AUTO_ZOOM_MAX_WINDOWS)
      break;
  }
  return zooms;
}

} // namespace cursor_fx
