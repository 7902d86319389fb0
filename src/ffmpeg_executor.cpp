/**
 * @file ffmpeg_executor.cpp
 * @brief ffmpeg command line construction
 */

#include "cursor_fx/ffmpeg_executor.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "cursor_fx/config.hpp"
#include "cursor_fx/system.hpp"

namespace cursor_fx {

EncoderSettings EncoderSettings::from_config() {
  EncoderSettings s;
  s.ffmpeg_bin = Config::ffmpeg_bin();
  s.video_codec = Config::encoder_codec();
  s.preset = Config::encoder_preset();
  s.crf = Config::encoder_crf();
  s.threads = Config::encoder_threads();
  if (s.threads <= 0)
    s.threads = detect_cpu_limit();
  s.audio_codec = Config::audio_codec();
  return s;
}

std::vector<std::string> build_decode_args(const std::string &ffmpeg_bin,
                                           const VideoInfo &info,
                                           const std::string &input_path) {
  std::string abs_path = std::filesystem::absolute(input_path).string();

  /// Constant output rate, identical to the encoder's input rate
  return {ffmpeg_bin,
          "-nostdin",
          "-hide_banner",
          "-loglevel",
          "error",
          "-i",
          abs_path,
          "-map",
          "0:v:0",
          "-an",
          "-sn",
          "-r",
          fmt::format("{}/{}", info.fps_num, info.fps_den),
          "-f",
          "rawvideo",
          "-pix_fmt",
          "rgba",
          "pipe:1"};
}

std::vector<std::string> build_encode_args(const EncoderSettings &settings,
                                           const VideoInfo &info,
                                           const std::string &input_path,
                                           const std::string &output_path) {
  std::string abs_path = std::filesystem::absolute(input_path).string();

  std::vector<std::string> args = {
      settings.ffmpeg_bin, "-y", "-hide_banner", "-loglevel", "error",
      /// Input 0: raw frames from the compositor
      "-f", "rawvideo", "-pix_fmt", "rgba", "-s",
      fmt::format("{}x{}", info.width, info.height), "-r",
      fmt::format("{}/{}", info.fps_num, info.fps_den), "-i", "pipe:0"};

  /// Input 1: the untouched source, for its audio track only. The output
  /// runs until the last video frame even when the audio ends earlier.
  if (info.has_audio) {
    args.insert(args.end(), {"-i", abs_path, "-map", "0:v:0", "-map", "1:a:0",
                             "-c:a", settings.audio_codec});
  } else {
    args.insert(args.end(), {"-map", "0:v:0"});
  }

  /// yuv420p needs even dimensions; drop the odd edge row/column
  if (info.width % 2 != 0 || info.height % 2 != 0)
    args.insert(args.end(), {"-vf", "crop=trunc(iw/2)*2:trunc(ih/2)*2"});

  args.insert(args.end(), {"-c:v", settings.video_codec, "-pix_fmt",
                           "yuv420p"});
  if (!settings.preset.empty())
    args.insert(args.end(), {"-preset", settings.preset});
  if (settings.crf >= 0)
    args.insert(args.end(), {"-crf", std::to_string(settings.crf)});
  if (settings.threads > 0)
    args.insert(args.end(), {"-threads", std::to_string(settings.threads)});

  args.insert(args.end(), {"-movflags", "+faststart", output_path});
  return args;
}

std::string describe_command(const std::vector<std::string> &args) {
  std::string out;
  out.reserve(256);
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      out += ' ';
    if (args[i].find_first_of(" \"'") != std::string::npos)
      out += fmt::format("\"{}\"", args[i]);
    else
      out += args[i];
  }
  return out;
}

} // namespace cursor_fx
