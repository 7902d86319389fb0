/**
 * @file ffmpeg_executor.hpp
 * @brief Command lines for the decode and encode ffmpeg subprocesses
 *
 * @details Separate module for building ffmpeg invocations. The transcode
 *          pipeline runs two children:
 *
 *          - decoder: source file -> raw RGBA frames on stdout
 *
 *          - encoder: raw RGBA frames on stdin + the source file again for
 *            its audio track -> compressed output file
 */

#ifndef CURSOR_FX_FFMPEG_EXECUTOR_HPP
#define CURSOR_FX_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace cursor_fx {

/**
 * @struct EncoderSettings
 * @brief Output codec parameters.
 */
struct EncoderSettings {
  std::string ffmpeg_bin = "ffmpeg";
  std::string video_codec = "libx264";
  std::string preset = "veryfast";
  int crf = 20;
  int threads = 0; //< 0 = let the encoder decide
  std::string audio_codec = "copy";

  /// Settings from the ENCODER_* / AUDIO_CODEC / FFMPEG_BIN environment
  static EncoderSettings from_config();
};

/**
 * @brief Decoder argv: emit the first video stream of `input_path` as raw
 *        RGBA at a constant info.fps_num / info.fps_den.
 */
std::vector<std::string> build_decode_args(const std::string &ffmpeg_bin,
                                           const VideoInfo &info,
                                           const std::string &input_path);

/**
 * @brief Encoder argv: read raw RGBA at info's size/rate from stdin, take
 *        audio (if any) from `input_path`, write `output_path`.
 */
std::vector<std::string> build_encode_args(const EncoderSettings &settings,
                                           const VideoInfo &info,
                                           const std::string &input_path,
                                           const std::string &output_path);

/**
 * @brief Render argv as a single shell-like string for logging.
 */
std::string describe_command(const std::vector<std::string> &args);

} // namespace cursor_fx

#endif // CURSOR_FX_FFMPEG_EXECUTOR_HPP
