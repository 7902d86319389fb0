/**
 * @file transcode_pipeline.cpp
 * @brief Decode -> composite -> encode implementation
 *
 * @details Threads during a run:
 *
 *          - FramePump reader (decoder stdout)
 *
 *          - this thread (interpolation + compositing)
 *
 *          - FramePump writer (encoder stdin)
 *
 *          - one stderr drain per subprocess
 *
 * @note When job_id is set, all log messages are prefixed with [Job id].
 */

#include "cursor_fx/transcode_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "cursor_fx/config.hpp"
#include "cursor_fx/frame_compositor.hpp"
#include "cursor_fx/frame_pump.hpp"
#include "cursor_fx/interpolator.hpp"
#include "cursor_fx/logging.hpp"
#include "cursor_fx/subprocess.hpp"
#include "cursor_fx/system.hpp"
#include "cursor_fx/video_probe.hpp"

namespace cursor_fx {

namespace {

/// Error reports carry at most this much of a child's stderr
constexpr size_t ERROR_TAIL_BYTES = 512;

std::string short_tail(const std::string &tail) {
  std::string t = tail;
  while (!t.empty() && (t.back() == '\n' || t.back() == '\r'))
    t.pop_back();
  if (t.size() > ERROR_TAIL_BYTES)
    t = "..." + t.substr(t.size() - ERROR_TAIL_BYTES);
  return t;
}

std::string describe_exit(const char *who, int code, const std::string &tail) {
  std::string t = short_tail(tail);
  if (t.empty())
    return fmt::format("{} exited with code {}", who, code);
  return fmt::format("{} exited with code {}: {}", who, code, t);
}

} // namespace

// **---- Constructor ----**

TranscodePipeline::TranscodePipeline(std::string in, std::string out,
                                     std::vector<CursorSample> cursor_samples,
                                     std::vector<ZoomWindow> zoom_windows,
                                     std::string cursor_style,
                                     std::string job_id)
    : input_path(std::move(in)), output_path(std::move(out)),
      samples(std::move(cursor_samples)), windows(std::move(zoom_windows)),
      style(std::move(cursor_style)), job_id_(std::move(job_id)),
      sprites_(&SpriteCache::shared()), auto_zoom_(Config::auto_zoom()),
      settings_(EncoderSettings::from_config()) {}

// **---- Logging Helpers ----**

void TranscodePipeline::log_info(const std::string &msg) {
  if (!job_id_.empty()) {
    JOB_INFO(job_id_, "{}", msg);
  } else {
    LOG_INFO("{}", msg);
  }
}

void TranscodePipeline::log_phase(const std::string &msg) {
  if (!job_id_.empty()) {
    LOG_PHASE("[Job {}] {}", job_id_, msg);
  } else {
    LOG_PHASE("{}", msg);
  }
}

int TranscodePipeline::fail(const std::string &msg) {
  last_error_ = msg;
  if (!job_id_.empty()) {
    JOB_ERROR(job_id_, "{}", msg);
  } else {
    LOG_ERROR("{}", msg);
  }

  std::error_code ec;
  if (std::filesystem::remove(output_path, ec))
    log_info(fmt::format("Removed partial output {}", output_path));
  return 1;
}

// **---- Main Processing ----**

int TranscodePipeline::run(const ProgressCallback &on_progress) {
  last_error_.clear();
  frames_written_ = 0;
  elapsed_sec_ = 0;
  auto run_start = std::chrono::steady_clock::now();

  // **----- PROBE VIDEO METADATA -----**

  log_phase("Probing...");
  {
    TIMER_START(probe);
    std::string err;
    bool ok = probe_video(input_path, info_, err);
    TIMER_END(probe);
    if (!ok)
      return fail(fmt::format("Probe failed: {}", err));
  }
  log_info(fmt::format("Source: {}x{} @ {:.2f}fps, {} (~{} frames), {}",
                       info_.width, info_.height, info_.fps,
                       format_time(info_.duration_sec), info_.total_frames,
                       info_.has_audio ? "with audio" : "no audio"));

  // **----- PREPARE CURSOR TRACK -----**

  std::vector<CursorSample> track = pointer_samples(samples);
  if (sort_samples(track)) {
    if (!job_id_.empty()) {
      JOB_WARN(job_id_, "Cursor samples were out of order, sorted by time");
    } else {
      LOG_WARN("Cursor samples were out of order, sorted by time");
    }
  }
  if (track.empty())
    log_info("No cursor samples, frames pass through without overlay");

  if (windows.empty() && auto_zoom_) {
    std::vector<CursorSample> ordered = samples;
    sort_samples(ordered);
    windows = detect_zoom_windows(ordered, info_.width, info_.height);
    log_info(fmt::format("Auto zoom: {} windows from clicks", windows.size()));
  }
  log_info(fmt::format("{} cursor samples, {} zoom windows, style '{}'",
                       track.size(), windows.size(), style));

  // **----- SPAWN SUBPROCESSES -----**

  std::error_code ec;
  auto out_dir = std::filesystem::path(output_path).parent_path();
  if (!out_dir.empty())
    std::filesystem::create_directories(out_dir, ec);

  auto decode_args =
      build_decode_args(settings_.ffmpeg_bin, info_, input_path);
  auto encode_args =
      build_encode_args(settings_, info_, input_path, output_path);

  log_phase("Transcoding...");
  log_info(fmt::format("Decoder: {}", describe_command(decode_args)));
  log_info(fmt::format("Encoder: {}", describe_command(encode_args)));

  Subprocess decoder;
  if (!decoder.start(decode_args, false, true))
    return fail(fmt::format("Cannot start decoder: {}", decoder.last_error()));

  Subprocess encoder;
  if (!encoder.start(encode_args, true, false)) {
    decoder.terminate();
    return fail(fmt::format("Cannot start encoder: {}", encoder.last_error()));
  }

  // **----- PUMP FRAMES -----**

  const int stall_ms = std::max(1, Config::pipe_stall_timeout_sec()) * 1000;
  const int64_t interval =
      std::max(1, Config::progress_interval_frames());

  PipeFrameSource source(decoder, info_.frame_size(), stall_ms);
  PipeFrameSink sink(encoder, stall_ms);
  FramePump pump(info_.frame_size(),
                 static_cast<size_t>(std::max(1, Config::frame_queue_depth())));
  FrameCompositor compositor(info_.width, info_.height, *sprites_);

  auto process = [&](int64_t index, const std::vector<uint8_t> &in,
                     std::vector<uint8_t> &out, std::string &error) {
    FrameState state = compute_frame_state(track, windows, index, info_.fps);
    if (!compositor.composite(in, out, state, style)) {
      error = compositor.last_error();
      return false;
    }
    return true;
  };

  auto report = [&](int64_t done) {
    if (!on_progress || done % interval != 0)
      return;
    double fraction =
        info_.total_frames > 0
            ? std::min(1.0, static_cast<double>(done) / info_.total_frames)
            : 0.0;
    on_progress(fraction, done);
  };

  TIMER_START(composite);
  bool pumped = pump.run(source, sink, process, report);
  TIMER_END(composite);
  frames_written_ = pump.frames_written();

  if (!pumped) {
    std::string msg = pump.last_error();
    decoder.terminate();
    encoder.terminate();
    std::string dec_tail = short_tail(decoder.stderr_tail());
    std::string enc_tail = short_tail(encoder.stderr_tail());
    if (!dec_tail.empty())
      msg += fmt::format(" | decoder: {}", dec_tail);
    if (!enc_tail.empty())
      msg += fmt::format(" | encoder: {}", enc_tail);
    return fail(msg);
  }

  // **----- WAIT FOR SUBPROCESSES -----**

  TIMER_START(finalize);
  const int exit_timeout_ms =
      std::max(1, Config::subprocess_timeout_sec()) * 1000;

  int dec_code = -1;
  if (!decoder.wait(exit_timeout_ms, dec_code)) {
    decoder.terminate();
    encoder.terminate();
    return fail(fmt::format("Decoder did not exit within {} s",
                            exit_timeout_ms / 1000));
  }

  int enc_code = -1;
  if (!encoder.wait(exit_timeout_ms, enc_code)) {
    encoder.terminate();
    return fail(fmt::format("Encoder did not finish within {} s",
                            exit_timeout_ms / 1000));
  }
  TIMER_END(finalize);

  if (dec_code != 0)
    return fail(describe_exit("Decoder", dec_code, decoder.stderr_tail()));
  if (enc_code != 0)
    return fail(describe_exit("Encoder", enc_code, encoder.stderr_tail()));
  if (frames_written_ == 0)
    return fail(fmt::format("Decoder produced no frames from {}", input_path));

  if (on_progress)
    on_progress(1.0, frames_written_);

  elapsed_sec_ = std::chrono::duration<double>(
                     std::chrono::steady_clock::now() - run_start)
                     .count();

  if (!job_id_.empty()) {
    LOG_SUCCESS("[Job {}] Output saved to: {}", job_id_, output_path);
  } else {
    LOG_SUCCESS("Output saved to: {}", output_path);
  }
  print_render_summary();

  return 0;
}

// **---- Render Summary ----**

void TranscodePipeline::print_render_summary() {
  std::string prefix =
      job_id_.empty() ? "" : fmt::format("[Job {}] ", job_id_);

  double out_duration =
      info_.fps > 0 ? static_cast<double>(frames_written_) / info_.fps : 0.0;
  double render_fps =
      elapsed_sec_ > 0 ? static_cast<double>(frames_written_) / elapsed_sec_
                       : 0.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "{}================= RENDER SUMMARY =================\n", prefix);
  fmt::print("{}{:<20} {:>15}\n", prefix, "Resolution:",
             fmt::format("{}x{}", info_.width, info_.height));
  fmt::print("{}{:<20} {:>15}\n", prefix, "Frames:", frames_written_);
  fmt::print("{}{:<20} {:>15}\n", prefix,
             "Source:", format_time(info_.duration_sec));
  fmt::print("{}{:<20} {:>15}\n", prefix, "Output:", format_time(out_duration));
  fmt::print("{}{:<20} {:>15}\n", prefix, "Elapsed:", format_time(elapsed_sec_));
  fmt::print("{}{:<20} {:>11.1f} fps\n", prefix, "Render speed:", render_fps);
  fmt::print(fg(fmt::color::cyan),
             "{}==================================================\n", prefix);
  std::fflush(stdout);
}

} // namespace cursor_fx
