/**
 * @file interpolator.hpp
 * @brief Time-indexed lookup of cursor position and zoom state
 *
 * @details Pure functions, no I/O and no state. Every output frame calls
 *          compute_frame_state() independently, so frames can be evaluated
 *          in any order.
 */

#ifndef CURSOR_FX_INTERPOLATOR_HPP
#define CURSOR_FX_INTERPOLATOR_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace cursor_fx {

/**
 * @brief Cursor position and click flag at a continuous time.
 *
 * @note Empty input returns the (-1, -1) sentinel. Times before the first
 *       sample clamp to it; times after the last clamp to it with the click
 *       flag cleared. In between, x/y are linear and a Click sample stays
 *       visible for the first CLICK_VISIBLE_FRACTION of the gap.
 *
 * @param samples Time-ordered cursor samples
 * @param time_ms Milliseconds from recording start
 */
CursorPoint interpolate_cursor(const std::vector<CursorSample> &samples,
                               double time_ms);

/**
 * @brief Cubic ease-in-out on [0,1].
 */
double cubic_in_out(double t);

/**
 * @brief Zoom state at a continuous time (first matching window wins).
 *
 * @note Only the magnitude eases; the focus point is the window's own.
 *       Outside every window the identity state is returned.
 *
 * @param windows Zoom windows, assumed disjoint
 * @param time_sec Seconds from recording start
 */
ZoomState active_zoom(const std::vector<ZoomWindow> &windows, double time_sec);

/**
 * @brief Combine interpolate_cursor() and active_zoom() for one frame.
 * @param frame_index Zero-based frame number in source order
 * @param fps Frame rate of the source stream
 */
FrameState compute_frame_state(const std::vector<CursorSample> &samples,
                               const std::vector<ZoomWindow> &windows,
                               int64_t frame_index, double fps);

/**
 * @brief Stable-sort samples by timestamp.
 * @return true if the input was out of order and had to be reordered
 */
bool sort_samples(std::vector<CursorSample> &samples);

/**
 * @brief Drop keyboard-input samples, keeping only pointer positions.
 * @note Keyboard samples carry a synthetic position (the view center) and
 *       must not pull the drawn cursor toward it.
 */
std::vector<CursorSample> pointer_samples(
    const std::vector<CursorSample> &samples);

/**
 * @brief Derive zoom windows from click and keyboard samples.
 *
 * @attention RULES:
 *
 * - At least 5 s between two accepted triggers
 *
 * - A trigger followed within 500 ms by a Move more than 50 px away is
 *   skipped (the user is travelling, not focusing)
 *
 * - Each window: 1.5x for 2 s, focus normalized by the view size
 *
 * - At most 5 windows
 *
 * @param view_width Width used to normalize the focus point
 * @param view_height Height used to normalize the focus point
 */
std::vector<ZoomWindow> detect_zoom_windows(
    const std::vector<CursorSample> &samples, int view_width, int view_height);

} // namespace cursor_fx

#endif // CURSOR_FX_INTERPOLATOR_HPP
