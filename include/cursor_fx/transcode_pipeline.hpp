/**
 * @file transcode_pipeline.hpp
 * @brief Decode -> composite -> encode orchestration for one video
 *
 * @details The TranscodePipeline class runs the whole per-video workflow:
 *
 *          1. Probe the source (size, frame rate, duration, audio)
 *
 *          2. Start the decoder (raw RGBA on stdout) and the encoder (raw
 *             RGBA on stdin + the source's audio track)
 *
 *          3. Pump frames through the FrameCompositor with bounded buffering
 *
 *          4. Close the encoder input and wait for both children
 *
 * @note When job_id is set, all log messages are prefixed with [Job id].
 *       On any failure both children are terminated and the partial output
 *       file is removed.
 */

#ifndef CURSOR_FX_TRANSCODE_PIPELINE_HPP
#define CURSOR_FX_TRANSCODE_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "ffmpeg_executor.hpp"
#include "sprite_cache.hpp"
#include "types.hpp"

namespace cursor_fx {

/**
 * @brief Progress report.
 * @param fraction frames_done / estimated total, clamped to [0,1]
 * @param frames_done Frames composited so far
 */
using ProgressCallback = std::function<void(double fraction, int64_t frames_done)>;

/**
 * @class TranscodePipeline
 * @brief Renders the cursor overlay and zoom effects into a new video.
 *
 * @attention WORKFLOW:
 *
 * 1. probe_video() the input (failure is fatal)
 *
 * 2. Drop keyboard samples and sort the track if it arrived out of order;
 *    with auto zoom on and no windows, derive windows from the clicks
 *
 * 3. Spawn decoder and encoder subprocesses
 *
 * 4. FramePump: reader thread, compositor on this thread, writer thread
 *
 * 5. Wait (bounded) for both subprocesses and check their exit codes
 */
class TranscodePipeline {
  std::string input_path;
  std::string output_path;
  std::vector<CursorSample> samples;
  std::vector<ZoomWindow> windows;
  std::string style;

  std::string job_id_;  //< Log prefix (empty = no prefix)
  SpriteCache *sprites_; //< Defaults to SpriteCache::shared()
  bool auto_zoom_;       //< Derive windows from clicks when none are given
  EncoderSettings settings_;

  VideoInfo info_;
  int64_t frames_written_ = 0;
  double elapsed_sec_ = 0;
  std::string last_error_;

  /**
   * @brief Print frames, durations and render speed.
   */
  void print_render_summary();

  /**
   * @brief Record the failure, log it and remove the partial output.
   */
  int fail(const std::string &msg);

  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);

public:
  /**
   * @brief Construct a transcode pipeline.
   * @param in Source video path
   * @param out Output video path (overwritten)
   * @param cursor_samples Recorded cursor track (any order)
   * @param zoom_windows Zoom windows (may be empty)
   * @param cursor_style Sprite style name
   * @param job_id Log prefix (empty = no prefix, default)
   */
  TranscodePipeline(std::string in, std::string out,
                    std::vector<CursorSample> cursor_samples,
                    std::vector<ZoomWindow> zoom_windows,
                    std::string cursor_style, std::string job_id = "");

  /**
   * @brief Run the complete transcode.
   * @param on_progress Called every PROGRESS_INTERVAL_FRAMES frames and once
   *                    at the end (may be null)
   * @return 0 on success, non-zero on error (see last_error())
   */
  int run(const ProgressCallback &on_progress = nullptr);

  /// Use a specific sprite cache instead of the process-wide one
  void set_sprite_cache(SpriteCache *cache) { sprites_ = cache; }

  /// Override AUTO_ZOOM for this pipeline
  void set_auto_zoom(bool enabled) { auto_zoom_ = enabled; }

  /// Override the environment-derived encoder settings
  void set_encoder_settings(EncoderSettings settings) {
    settings_ = std::move(settings);
  }

  /**
   * @brief Probe result of the last run().
   */
  const VideoInfo &video_info() const { return info_; }

  /**
   * @brief Frames written to the encoder by the last run().
   */
  int64_t frames_written() const { return frames_written_; }

  const std::string &last_error() const { return last_error_; }
};

} // namespace cursor_fx

#endif // CURSOR_FX_TRANSCODE_PIPELINE_HPP
