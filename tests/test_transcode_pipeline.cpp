/**
 * @file test_transcode_pipeline.cpp
 * @brief End-to-end transcode against a real ffmpeg binary
 *
 * @note Generates its own source clip with ffmpeg's lavfi test sources.
 *       Skipped when no ffmpeg is on PATH.
 */

#include <filesystem>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cursor_fx/ffmpeg_executor.hpp"
#include "cursor_fx/subprocess.hpp"
#include "cursor_fx/system.hpp"
#include "cursor_fx/transcode_pipeline.hpp"
#include "cursor_fx/video_probe.hpp"

using namespace cursor_fx;
namespace fs = std::filesystem;

namespace {

constexpr int CLIP_W = 320;
constexpr int CLIP_H = 240;
constexpr int CLIP_FPS = 30;
constexpr int CLIP_SECONDS = 2;

/// Codec every ffmpeg build ships, so the test does not depend on libx264
EncoderSettings portable_settings() {
  EncoderSettings s;
  s.video_codec = "mpeg4";
  s.preset = "";
  s.crf = -1;
  s.threads = 2;
  return s;
}

class TranscodePipelineTest : public ::testing::Test {
protected:
  fs::path dir;
  SpriteCache sprites{"/nonexistent/cursor-fx-assets"};

  void SetUp() override {
    if (find_executable("ffmpeg").empty())
      GTEST_SKIP() << "ffmpeg not found on PATH";

    dir = fs::temp_directory_path() /
          ("cursor-fx-pipeline-" +
           std::string(::testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    auto sprite = std::make_shared<Sprite>();
    sprite->width = 8;
    sprite->height = 8;
    sprite->pixels.assign(8 * 8 * 4, 255);
    sprites.put("normal", sprite);
  }

  void TearDown() override {
    std::error_code ec;
    if (!dir.empty())
      fs::remove_all(dir, ec);
  }

  /// Encode a lavfi video source, optionally with a sine audio track
  std::string make_clip(const std::string &name, bool audio,
                        const std::string &video_source, int seconds,
                        int audio_seconds = -1) {
    if (audio_seconds < 0)
      audio_seconds = seconds;
    std::string path = (dir / name).string();
    std::vector<std::string> args = {"ffmpeg", "-y",    "-hide_banner",
                                     "-loglevel", "error", "-f",
                                     "lavfi", "-i", video_source};
    if (audio) {
      args.insert(args.end(),
                  {"-f", "lavfi", "-i",
                   "sine=frequency=440:duration=" +
                       std::to_string(audio_seconds),
                   "-c:a", "aac"});
    }
    args.insert(args.end(), {"-c:v", "mpeg4", "-q:v", "2", "-pix_fmt",
                             "yuv420p", path});

    Subprocess p;
    EXPECT_TRUE(p.start(args, false, false)) << p.last_error();
    int code = -1;
    EXPECT_TRUE(p.wait(60000, code));
    EXPECT_EQ(code, 0) << p.stderr_tail();
    return path;
  }

  /// Short testsrc clip
  std::string make_clip(const std::string &name, bool audio) {
    return make_clip(name, audio,
                     "testsrc=size=" + std::to_string(CLIP_W) + "x" +
                         std::to_string(CLIP_H) +
                         ":rate=" + std::to_string(CLIP_FPS) +
                         ":duration=" + std::to_string(CLIP_SECONDS),
                     CLIP_SECONDS);
  }

  /// Decode every frame of `path` as RGBA
  std::vector<std::vector<uint8_t>> decode_frames(const std::string &path,
                                                  VideoInfo &info) {
    std::vector<std::vector<uint8_t>> frames;
    std::string error;
    if (!probe_video(path, info, error)) {
      ADD_FAILURE() << error;
      return frames;
    }

    Subprocess p;
    if (!p.start(build_decode_args("ffmpeg", info, path), false, true)) {
      ADD_FAILURE() << p.last_error();
      return frames;
    }
    const size_t frame_size = static_cast<size_t>(info.width) * info.height * 4;
    PipeFrameSource source(p, frame_size, 10000);
    std::vector<uint8_t> pixels(frame_size);
    ReadResult r;
    while ((r = source.read_frame(pixels)) == ReadResult::Frame)
      frames.push_back(pixels);
    EXPECT_EQ(r, ReadResult::EndOfStream) << source.error();

    int code = -1;
    EXPECT_TRUE(p.wait(10000, code));
    EXPECT_EQ(code, 0) << p.stderr_tail();
    return frames;
  }

  std::vector<CursorSample> sweep() const {
    return {{0, 10, 10, CursorKind::Move, false},
            {500, 160, 120, CursorKind::Click, false},
            {1900, 300, 220, CursorKind::Move, false}};
  }
};

} // namespace

TEST_F(TranscodePipelineTest, ProbeReportsClipMetadata) {
  std::string clip = make_clip("probe.mp4", true);

  VideoInfo info;
  std::string error;
  ASSERT_TRUE(probe_video(clip, info, error)) << error;
  EXPECT_EQ(info.width, CLIP_W);
  EXPECT_EQ(info.height, CLIP_H);
  EXPECT_NEAR(info.fps, CLIP_FPS, 0.01);
  EXPECT_NEAR(info.duration_sec, CLIP_SECONDS, 0.2);
  EXPECT_NEAR(static_cast<double>(info.total_frames), CLIP_FPS * CLIP_SECONDS,
              2);
  EXPECT_TRUE(info.has_audio);
}

TEST_F(TranscodePipelineTest, ProbeRejectsNonVideo) {
  fs::path junk = dir / "junk.mp4";
  std::ofstream(junk) << "this is not a video";

  VideoInfo info;
  std::string error;
  EXPECT_FALSE(probe_video(junk.string(), info, error));
  EXPECT_FALSE(error.empty());
}

TEST_F(TranscodePipelineTest, RendersWithAudio) {
  std::string clip = make_clip("in.mp4", true);
  std::string out = (dir / "out" / "result.mp4").string();

  std::vector<ZoomWindow> windows = {{0.5, 0.5, 0.5, 2.0, 1.0}};
  TranscodePipeline pipeline(clip, out, sweep(), windows, "normal", "e2e");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(portable_settings());

  std::vector<double> fractions;
  int rc = pipeline.run(
      [&](double fraction, int64_t) { fractions.push_back(fraction); });
  ASSERT_EQ(rc, 0) << pipeline.last_error();

  EXPECT_NEAR(static_cast<double>(pipeline.frames_written()),
              CLIP_FPS * CLIP_SECONDS, 2);
  ASSERT_FALSE(fractions.empty());
  EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
  for (size_t i = 1; i < fractions.size(); ++i)
    EXPECT_GE(fractions[i], fractions[i - 1]);

  VideoInfo result;
  std::string error;
  ASSERT_TRUE(probe_video(out, result, error)) << error;
  EXPECT_EQ(result.width, CLIP_W);
  EXPECT_EQ(result.height, CLIP_H);
  EXPECT_NEAR(result.fps, CLIP_FPS, 0.01);
  EXPECT_NEAR(result.duration_sec, CLIP_SECONDS, 0.2);
  EXPECT_TRUE(result.has_audio);
}

TEST_F(TranscodePipelineTest, ShortAudioKeepsEveryVideoFrame) {
  std::string clip = make_clip(
      "short_audio.mp4", true,
      "testsrc=size=" + std::to_string(CLIP_W) + "x" + std::to_string(CLIP_H) +
          ":rate=" + std::to_string(CLIP_FPS) +
          ":duration=" + std::to_string(CLIP_SECONDS),
      CLIP_SECONDS, 1);
  std::string out = (dir / "short_audio_out.mp4").string();

  VideoInfo source;
  std::string error;
  ASSERT_TRUE(probe_video(clip, source, error)) << error;

  TranscodePipeline pipeline(clip, out, sweep(), {}, "normal");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(portable_settings());
  ASSERT_EQ(pipeline.run(), 0) << pipeline.last_error();
  EXPECT_EQ(pipeline.frames_written(), CLIP_FPS * CLIP_SECONDS);

  VideoInfo result;
  ASSERT_TRUE(probe_video(out, result, error)) << error;
  EXPECT_TRUE(result.has_audio);
  EXPECT_NEAR(static_cast<double>(result.total_frames),
              CLIP_FPS * CLIP_SECONDS, 1);
}

TEST_F(TranscodePipelineTest, RendersSilentClipWithAutoZoom) {
  std::string clip = make_clip("silent.mp4", false);
  std::string out = (dir / "silent_out.mp4").string();

  TranscodePipeline pipeline(clip, out, sweep(), {}, "normal");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(portable_settings());
  pipeline.set_auto_zoom(true);

  ASSERT_EQ(pipeline.run(), 0) << pipeline.last_error();

  VideoInfo result;
  std::string error;
  ASSERT_TRUE(probe_video(out, result, error)) << error;
  EXPECT_FALSE(result.has_audio);
  EXPECT_NEAR(static_cast<double>(result.total_frames),
              CLIP_FPS * CLIP_SECONDS, 2);
}

TEST_F(TranscodePipelineTest, MissingInputFailsWithoutOutput) {
  std::string out = (dir / "never.mp4").string();
  TranscodePipeline pipeline((dir / "missing.mp4").string(), out, {}, {},
                             "normal");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(portable_settings());

  EXPECT_NE(pipeline.run(), 0);
  EXPECT_NE(pipeline.last_error().find("Probe failed"), std::string::npos);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(TranscodePipelineTest, BadEncoderFailsAndRemovesOutput) {
  std::string clip = make_clip("enc.mp4", false);
  std::string out = (dir / "enc_out.mp4").string();

  EncoderSettings bad = portable_settings();
  bad.video_codec = "no_such_codec";

  TranscodePipeline pipeline(clip, out, sweep(), {}, "normal");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(bad);

  EXPECT_NE(pipeline.run(), 0);
  EXPECT_FALSE(pipeline.last_error().empty());
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(TranscodePipelineTest, CursorSpriteAndGlowFollowTheTrack) {
  std::string clip =
      make_clip("scene.mp4", false,
                "color=c=black:size=640x360:rate=30:duration=3", 3);
  std::string out = (dir / "scene_out.mp4").string();

  auto green = std::make_shared<Sprite>();
  green->width = 24;
  green->height = 24;
  green->pixels.resize(24 * 24 * 4);
  for (size_t i = 0; i < green->pixels.size(); i += 4) {
    green->pixels[i] = 0;
    green->pixels[i + 1] = 255;
    green->pixels[i + 2] = 0;
    green->pixels[i + 3] = 255;
  }
  sprites.put("normal", green);

  /// The trailing Move keeps the click inside the track so it stays lit
  std::vector<CursorSample> track = {
      {0, 100, 100, CursorKind::Move, false},
      {1000, 300, 200, CursorKind::Click, false},
      {3000, 300, 200, CursorKind::Move, false}};
  TranscodePipeline pipeline(clip, out, track, {}, "normal");
  pipeline.set_sprite_cache(&sprites);
  pipeline.set_encoder_settings(portable_settings());
  ASSERT_EQ(pipeline.run(), 0) << pipeline.last_error();

  VideoInfo info;
  auto frames = decode_frames(out, info);
  ASSERT_EQ(info.width, 640);
  ASSERT_EQ(info.height, 360);
  EXPECT_NEAR(static_cast<double>(frames.size()), 90, 1);
  ASSERT_GT(frames.size(), 33u);

  auto pixel = [&](size_t frame, int x, int y) {
    const uint8_t *p = frames[frame].data() + (y * 640 + x) * 4;
    return std::vector<int>{p[0], p[1], p[2]};
  };

  /// Sprite top-left sits on the cursor, so its middle is 12 px further in
  auto s0 = pixel(0, 112, 112);
  EXPECT_GT(s0[1], 150);
  EXPECT_LT(s0[0], 100);
  auto s33 = pixel(33, 312, 212);
  EXPECT_GT(s33[1], 150);
  EXPECT_LT(s33[2], 100);

  /// Frame 33 is 1100 ms, early in the gap after the click
  auto glow = pixel(33, 290, 200);
  EXPECT_GT(glow[2], 35);
  EXPECT_GT(glow[2], glow[1]);
  auto no_glow = pixel(0, 90, 100);
  EXPECT_LT(no_glow[2], 20);
}
