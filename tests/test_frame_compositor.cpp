/**
 * @file test_frame_compositor.cpp
 * @brief Raster composition: zoom crop, blur, glow and sprite overlay
 */

#include <cstdlib>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "cursor_fx/frame_compositor.hpp"

using namespace cursor_fx;

namespace {

constexpr int W = 64;
constexpr int H = 48;

std::vector<uint8_t> solid_frame(uint8_t r, uint8_t g, uint8_t b) {
  std::vector<uint8_t> f(static_cast<size_t>(W) * H * FRAME_CHANNELS);
  for (size_t i = 0; i < f.size(); i += FRAME_CHANNELS) {
    f[i] = r;
    f[i + 1] = g;
    f[i + 2] = b;
    f[i + 3] = 255;
  }
  return f;
}

const uint8_t *pixel(const std::vector<uint8_t> &f, int x, int y) {
  return f.data() + (static_cast<size_t>(y) * W + x) * FRAME_CHANNELS;
}

std::shared_ptr<const Sprite> red_square(int size) {
  auto s = std::make_shared<Sprite>();
  s->width = size;
  s->height = size;
  s->pixels.resize(static_cast<size_t>(size) * size * 4);
  for (size_t i = 0; i < s->pixels.size(); i += 4) {
    s->pixels[i] = 255;
    s->pixels[i + 3] = 255;
  }
  return s;
}

class FrameCompositorTest : public ::testing::Test {
protected:
  /// No assets on disk: "normal" is a red square, "hand" is unavailable
  SpriteCache sprites{"/nonexistent/cursor-fx-assets"};

  void SetUp() override {
    sprites.put("hand", nullptr);
    sprites.put("normal", red_square(4));
  }
};

} // namespace

// **---- Zoom geometry ----**

TEST(ZoomCrop, CenteredFocus) {
  ZoomCrop c = compute_zoom_crop(100, 100, 0.5, 0.5, 2.0);
  EXPECT_EQ(c.width, 50);
  EXPECT_EQ(c.height, 50);
  EXPECT_EQ(c.left, 25);
  EXPECT_EQ(c.top, 25);
}

TEST(ZoomCrop, ClampedToFrameEdges) {
  ZoomCrop c = compute_zoom_crop(100, 100, 0.0, 0.0, 2.0);
  EXPECT_EQ(c.left, 0);
  EXPECT_EQ(c.top, 0);

  c = compute_zoom_crop(100, 100, 1.0, 1.0, 2.0);
  EXPECT_EQ(c.left, 50);
  EXPECT_EQ(c.top, 50);
  EXPECT_EQ(c.left + c.width, 100);
  EXPECT_EQ(c.top + c.height, 100);
}

// **---- composite ----**

TEST_F(FrameCompositorTest, RejectsWrongBufferSize) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in(10);
  std::vector<uint8_t> out;
  EXPECT_FALSE(comp.composite(in, out, FrameState{}, "hand"));
  EXPECT_FALSE(comp.last_error().empty());
}

TEST_F(FrameCompositorTest, InvalidCursorAndNoZoomIsPassThrough) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(10, 20, 30);
  in[100] = 200;
  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, FrameState{}, "normal"));
  EXPECT_EQ(out, in);
}

TEST_F(FrameCompositorTest, InputIsNeverModified) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(0, 0, 0);
  std::vector<uint8_t> copy = in;
  std::vector<uint8_t> out;

  FrameState st;
  st.cursor_x = 20;
  st.cursor_y = 20;
  st.clicking = true;
  st.zoom_scale = 2.0;
  ASSERT_TRUE(comp.composite(in, out, st, "normal"));
  EXPECT_EQ(in, copy);
}

TEST_F(FrameCompositorTest, BlurSoftensNativeCursorOnly) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(0, 0, 0);
  /// A single bright pixel standing in for the recorded cursor
  size_t spot = (static_cast<size_t>(20) * W + 20) * FRAME_CHANNELS;
  in[spot] = in[spot + 1] = in[spot + 2] = 255;

  FrameState st;
  st.cursor_x = 20;
  st.cursor_y = 20;

  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, st, "hand"));
  EXPECT_LT(pixel(out, 20, 20)[0], 255);

  /// Outside the blur patch nothing changes
  EXPECT_EQ(pixel(out, 60, 44)[0], 0);
  EXPECT_EQ(pixel(out, 60, 44)[3], 255);
}

TEST_F(FrameCompositorTest, ClickGlowTintsAroundCursor) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(0, 0, 0);

  FrameState st;
  st.cursor_x = 32;
  st.cursor_y = 24;

  std::vector<uint8_t> plain;
  ASSERT_TRUE(comp.composite(in, plain, st, "hand"));

  st.clicking = true;
  std::vector<uint8_t> glow;
  ASSERT_TRUE(comp.composite(in, glow, st, "hand"));

  EXPECT_EQ(pixel(plain, 32, 24)[2], 0);
  EXPECT_GT(pixel(glow, 32, 24)[2], 40);
  EXPECT_GT(pixel(glow, 32, 24)[2], pixel(glow, 3, 0)[2]);
}

TEST_F(FrameCompositorTest, SpriteDrawnAtCursor) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(0, 0, 0);

  FrameState st;
  st.cursor_x = 10;
  st.cursor_y = 12;

  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, st, "normal"));
  EXPECT_EQ(pixel(out, 10, 12)[0], 255);
  EXPECT_EQ(pixel(out, 13, 15)[0], 255);
  EXPECT_EQ(pixel(out, 14, 16)[0], 0);
}

TEST_F(FrameCompositorTest, SpriteKeptInsideFrame) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(0, 0, 0);

  FrameState st;
  st.cursor_x = W - 1;
  st.cursor_y = H - 1;

  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, st, "normal"));
  EXPECT_EQ(pixel(out, W - 1, H - 1)[0], 255);
  EXPECT_EQ(pixel(out, W - 4, H - 4)[0], 255);
}

TEST_F(FrameCompositorTest, MissingSpriteStillSucceeds) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(50, 50, 50);

  FrameState st;
  st.cursor_x = 30;
  st.cursor_y = 30;

  std::vector<uint8_t> out;
  EXPECT_TRUE(comp.composite(in, out, st, "does-not-exist"));
  EXPECT_EQ(out.size(), in.size());
}

TEST_F(FrameCompositorTest, ZoomKeepsFrameSizeAndContent) {
  FrameCompositor comp(W, H, sprites);
  std::vector<uint8_t> in = solid_frame(128, 128, 128);

  FrameState st;
  st.zoom_scale = 2.0;
  st.zoom_focus_x = 0.9;
  st.zoom_focus_y = 0.1;

  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, st, "hand"));
  ASSERT_EQ(out.size(), in.size());
  for (int y = 0; y < H; y += 7) {
    for (int x = 0; x < W; x += 5) {
      EXPECT_NEAR(pixel(out, x, y)[0], 128, 3) << x << "," << y;
    }
  }
}

TEST_F(FrameCompositorTest, ZoomMagnifiesTowardFocus) {
  FrameCompositor comp(W, H, sprites);
  /// Left half black, right half white
  std::vector<uint8_t> in = solid_frame(0, 0, 0);
  for (int y = 0; y < H; ++y) {
    for (int x = W / 2; x < W; ++x) {
      uint8_t *p = in.data() + (static_cast<size_t>(y) * W + x) * 4;
      p[0] = p[1] = p[2] = 255;
    }
  }

  FrameState st;
  st.zoom_scale = 2.0;
  st.zoom_focus_x = 1.0;
  st.zoom_focus_y = 0.5;

  std::vector<uint8_t> out;
  ASSERT_TRUE(comp.composite(in, out, st, "hand"));
  /// The crop is the white right half, so the whole output is white
  EXPECT_GT(pixel(out, 2, H / 2)[0], 240);
  EXPECT_GT(pixel(out, W - 2, H / 2)[0], 240);
}
