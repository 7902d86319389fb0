/**
 * @file test_ffmpeg_executor.cpp
 * @brief Decoder and encoder command lines
 */

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cursor_fx/ffmpeg_executor.hpp"

using namespace cursor_fx;

namespace {

VideoInfo sample_info(int w, int h, bool audio) {
  VideoInfo info;
  info.width = w;
  info.height = h;
  info.fps = 30000.0 / 1001.0;
  info.fps_num = 30000;
  info.fps_den = 1001;
  info.duration_sec = 10;
  info.total_frames = 300;
  info.has_audio = audio;
  return info;
}

/// Value following `flag`, or empty if the flag is absent
std::string arg_after(const std::vector<std::string> &args,
                      const std::string &flag, size_t occurrence = 0) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      if (occurrence == 0)
        return args[i + 1];
      --occurrence;
    }
  }
  return "";
}

bool has(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST(DecodeArgs, RawRgbaOnStdoutAtSourceRate) {
  auto args = build_decode_args("ffmpeg", sample_info(1280, 720, true),
                                "/videos/in.mp4");
  EXPECT_EQ(args.front(), "ffmpeg");
  EXPECT_EQ(arg_after(args, "-i"), "/videos/in.mp4");
  EXPECT_EQ(arg_after(args, "-f"), "rawvideo");
  EXPECT_EQ(arg_after(args, "-pix_fmt"), "rgba");
  EXPECT_EQ(arg_after(args, "-r"), "30000/1001");
  EXPECT_EQ(arg_after(args, "-map"), "0:v:0");
  EXPECT_TRUE(has(args, "-an"));
  EXPECT_TRUE(has(args, "-nostdin"));
  EXPECT_EQ(args.back(), "pipe:1");
}

TEST(EncodeArgs, RawInputWithAudioFromSource) {
  EncoderSettings s;
  s.crf = 18;
  s.threads = 4;
  auto args = build_encode_args(s, sample_info(1280, 720, true),
                                "/videos/in.mp4", "/out/result.mp4");

  EXPECT_EQ(arg_after(args, "-f"), "rawvideo");
  EXPECT_EQ(arg_after(args, "-s"), "1280x720");
  EXPECT_EQ(arg_after(args, "-r"), "30000/1001");
  EXPECT_EQ(arg_after(args, "-i", 0), "pipe:0");
  EXPECT_EQ(arg_after(args, "-i", 1), "/videos/in.mp4");
  EXPECT_EQ(arg_after(args, "-map", 0), "0:v:0");
  EXPECT_EQ(arg_after(args, "-map", 1), "1:a:0");
  EXPECT_EQ(arg_after(args, "-c:a"), "copy");
  EXPECT_EQ(arg_after(args, "-c:v"), "libx264");
  EXPECT_EQ(arg_after(args, "-pix_fmt", 1), "yuv420p");
  EXPECT_EQ(arg_after(args, "-crf"), "18");
  EXPECT_EQ(arg_after(args, "-threads"), "4");
  EXPECT_FALSE(has(args, "-vf"));
  EXPECT_FALSE(has(args, "-shortest"));
  EXPECT_EQ(args.back(), "/out/result.mp4");
}

TEST(EncodeArgs, NoAudioMapsVideoOnly) {
  EncoderSettings s;
  auto args = build_encode_args(s, sample_info(640, 360, false),
                                "/videos/in.mp4", "/out/result.mp4");
  EXPECT_EQ(arg_after(args, "-i", 1), "");
  EXPECT_FALSE(has(args, "1:a:0"));
  EXPECT_FALSE(has(args, "-c:a"));
  EXPECT_FALSE(has(args, "-threads"));
}

TEST(EncodeArgs, OddDimensionsAreCroppedEven) {
  EncoderSettings s;
  auto args = build_encode_args(s, sample_info(641, 361, false), "in.mp4",
                                "out.mp4");
  EXPECT_EQ(arg_after(args, "-s"), "641x361");
  EXPECT_EQ(arg_after(args, "-vf"), "crop=trunc(iw/2)*2:trunc(ih/2)*2");
}

TEST(DescribeCommand, QuotesArgumentsWithSpaces) {
  EXPECT_EQ(describe_command({"ffmpeg", "-i", "my video.mp4"}),
            "ffmpeg -i \"my video.mp4\"");
}
