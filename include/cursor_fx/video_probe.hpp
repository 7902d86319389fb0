/**
 * @file video_probe.hpp
 * @brief Stream metadata lookup with libavformat
 */

#ifndef CURSOR_FX_VIDEO_PROBE_HPP
#define CURSOR_FX_VIDEO_PROBE_HPP

#include <string>

#include "types.hpp"

namespace cursor_fx {

/// Frame rate assumed when the container reports none
constexpr int DEFAULT_FPS = 25;

/// Reported rates above this are timebase artifacts, not real frame rates
constexpr double MAX_PLAUSIBLE_FPS = 240.0;

/**
 * @brief Read width, height, frame rate, duration and audio presence.
 *
 * @note total_frames is the container's frame count when it records one,
 *       otherwise round(duration * fps). Only the header and the first few
 *       packets are read.
 *
 * @param path Video file
 * @param info Output
 * @param error Output: reason on failure
 * @return false if the file cannot be opened or has no usable video stream
 */
bool probe_video(const std::string &path, VideoInfo &info, std::string &error);

} // namespace cursor_fx

#endif // CURSOR_FX_VIDEO_PROBE_HPP
