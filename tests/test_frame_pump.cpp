/**
 * @file test_frame_pump.cpp
 * @brief Frame pump ordering, bounded buffering and failure propagation
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "cursor_fx/frame_pump.hpp"

using namespace cursor_fx;

namespace {

constexpr size_t FRAME_BYTES = 16;

/// Emits `count` frames whose first byte is the frame number
class CountingSource : public FrameSource {
public:
  explicit CountingSource(int64_t count, int64_t fail_at = -1)
      : count_(count), fail_at_(fail_at) {}

  ReadResult read_frame(std::vector<uint8_t> &pixels) override {
    if (cancelled_.load())
      return ReadResult::Failed;
    if (next_ == fail_at_)
      return ReadResult::Failed;
    if (next_ >= count_)
      return ReadResult::EndOfStream;
    std::fill(pixels.begin(), pixels.end(), 0);
    pixels[0] = static_cast<uint8_t>(next_ & 0xff);
    pixels[1] = static_cast<uint8_t>((next_ >> 8) & 0xff);
    ++next_;
    reads_.fetch_add(1);
    return ReadResult::Frame;
  }

  void cancel() override { cancelled_.store(true); }
  std::string error() const override { return "source broke"; }

  int64_t reads() const { return reads_.load(); }

private:
  int64_t count_;
  int64_t fail_at_;
  int64_t next_ = 0;
  std::atomic<int64_t> reads_{0};
  std::atomic<bool> cancelled_{false};
};

/// Records written frames; optionally slow or failing
class RecordingSink : public FrameSink {
public:
  explicit RecordingSink(int delay_ms = 0, int64_t fail_at = -1)
      : delay_ms_(delay_ms), fail_at_(fail_at) {}

  bool write_frame(const std::vector<uint8_t> &pixels) override {
    if (cancelled_.load())
      return false;
    if (static_cast<int64_t>(written_.size()) == fail_at_)
      return false;
    if (delay_ms_ > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    std::lock_guard<std::mutex> lock(mutex_);
    written_.push_back(pixels[0] | (pixels[1] << 8));
    return true;
  }

  bool close() override {
    closed_ = true;
    return true;
  }

  void cancel() override { cancelled_.store(true); }
  std::string error() const override { return "sink broke"; }

  std::vector<int> written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
  }

  bool closed() const { return closed_; }

private:
  int delay_ms_;
  int64_t fail_at_;
  mutable std::mutex mutex_;
  std::vector<int> written_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> cancelled_{false};
};

/// Copies the frame and marks it as processed
bool mark(int64_t, const std::vector<uint8_t> &in, std::vector<uint8_t> &out,
          std::string &) {
  out = in;
  out[2] = 0xAB;
  return true;
}

} // namespace

TEST(FramePump, PoolSizeFromDepth) {
  EXPECT_EQ(FramePump(FRAME_BYTES, 2).pool_size(), 8u);
  EXPECT_EQ(FramePump(FRAME_BYTES, 0).pool_size(), 6u);
}

TEST(FramePump, DeliversEveryFrameInOrder) {
  CountingSource source(500);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  ASSERT_TRUE(pump.run(source, sink, mark));

  auto written = sink.written();
  ASSERT_EQ(written.size(), 500u);
  for (int i = 0; i < 500; ++i)
    ASSERT_EQ(written[i], i);
  EXPECT_TRUE(sink.closed());
  EXPECT_EQ(pump.frames_read(), 500);
  EXPECT_EQ(pump.frames_processed(), 500);
  EXPECT_EQ(pump.frames_written(), 500);
}

TEST(FramePump, ProcessorSeesSourceIndices) {
  CountingSource source(50);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 1);

  std::vector<int64_t> seen;
  auto check = [&](int64_t index, const std::vector<uint8_t> &in,
                   std::vector<uint8_t> &out, std::string &) {
    seen.push_back(index);
    EXPECT_EQ(in[0], static_cast<uint8_t>(index));
    out = in;
    return true;
  };
  ASSERT_TRUE(pump.run(source, sink, check));
  ASSERT_EQ(seen.size(), 50u);
  for (int64_t i = 0; i < 50; ++i)
    EXPECT_EQ(seen[i], i);
}

TEST(FramePump, SlowSinkBoundsReadAhead) {
  CountingSource source(60);
  RecordingSink sink(5);
  FramePump pump(FRAME_BYTES, 2);

  std::atomic<int64_t> max_lag{0};
  auto on_frame = [&](int64_t) {
    int64_t lag = source.reads() - static_cast<int64_t>(sink.written().size());
    int64_t prev = max_lag.load();
    while (lag > prev && !max_lag.compare_exchange_weak(prev, lag)) {
    }
  };

  ASSERT_TRUE(pump.run(source, sink, mark, on_frame));
  EXPECT_EQ(sink.written().size(), 60u);
  EXPECT_LE(max_lag.load(), static_cast<int64_t>(pump.pool_size()));
}

TEST(FramePump, ProgressCallbackCountsFrames) {
  CountingSource source(10);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  std::vector<int64_t> reports;
  ASSERT_TRUE(pump.run(source, sink, mark,
                       [&](int64_t done) { reports.push_back(done); }));
  ASSERT_EQ(reports.size(), 10u);
  EXPECT_EQ(reports.front(), 1);
  EXPECT_EQ(reports.back(), 10);
}

TEST(FramePump, EmptySourceClosesSink) {
  CountingSource source(0);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);
  ASSERT_TRUE(pump.run(source, sink, mark));
  EXPECT_TRUE(sink.closed());
  EXPECT_EQ(pump.frames_written(), 0);
}

TEST(FramePump, ProcessorFailureAbortsRun) {
  CountingSource source(1000);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  auto fail_at_7 = [](int64_t index, const std::vector<uint8_t> &in,
                      std::vector<uint8_t> &out, std::string &error) {
    if (index == 7) {
      error = "bad pixels";
      return false;
    }
    out = in;
    return true;
  };

  EXPECT_FALSE(pump.run(source, sink, fail_at_7));
  EXPECT_NE(pump.last_error().find("frame 7"), std::string::npos);
  EXPECT_NE(pump.last_error().find("bad pixels"), std::string::npos);
  EXPECT_FALSE(sink.closed());
  EXPECT_LT(source.reads(), 1000);
  EXPECT_LE(pump.frames_written(), 7);
}

TEST(FramePump, SourceFailureAbortsRun) {
  CountingSource source(100, 20);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  EXPECT_FALSE(pump.run(source, sink, mark));
  EXPECT_NE(pump.last_error().find("source broke"), std::string::npos);
  EXPECT_FALSE(sink.closed());
  EXPECT_LE(pump.frames_written(), 20);
}

TEST(FramePump, SinkFailureAbortsRun) {
  CountingSource source(1000);
  RecordingSink sink(0, 5);
  FramePump pump(FRAME_BYTES, 2);

  EXPECT_FALSE(pump.run(source, sink, mark));
  EXPECT_NE(pump.last_error().find("sink broke"), std::string::npos);
  EXPECT_EQ(pump.frames_written(), 5);
  EXPECT_LT(source.reads(), 1000);
}

TEST(FramePump, WrongOutputSizeIsAnError) {
  CountingSource source(5);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  auto shrink = [](int64_t, const std::vector<uint8_t> &,
                   std::vector<uint8_t> &out, std::string &) {
    out.assign(3, 0);
    return true;
  };
  EXPECT_FALSE(pump.run(source, sink, shrink));
}

TEST(FramePump, ThrowingProcessorFailsRun) {
  CountingSource source(1000);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  auto throw_at_3 = [](int64_t index, const std::vector<uint8_t> &in,
                       std::vector<uint8_t> &out, std::string &) {
    if (index == 3)
      throw std::runtime_error("sprite directory unreadable");
    out = in;
    return true;
  };

  EXPECT_FALSE(pump.run(source, sink, throw_at_3));
  EXPECT_NE(pump.last_error().find("frame 3"), std::string::npos);
  EXPECT_NE(pump.last_error().find("sprite directory unreadable"),
            std::string::npos);
  EXPECT_FALSE(sink.closed());
  EXPECT_LE(pump.frames_written(), 3);
}

TEST(FramePump, ThrowingProgressCallbackFailsRun) {
  CountingSource source(100);
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  auto on_frame = [](int64_t done) {
    if (done == 10)
      throw std::runtime_error("progress sink gone");
  };

  EXPECT_FALSE(pump.run(source, sink, mark, on_frame));
  EXPECT_NE(pump.last_error().find("progress sink gone"), std::string::npos);
}

TEST(FramePump, ThrowingSourceFailsRun) {
  class ThrowingSource : public FrameSource {
  public:
    ReadResult read_frame(std::vector<uint8_t> &) override {
      throw std::runtime_error("read exploded");
    }
    void cancel() override {}
    std::string error() const override { return ""; }
  } source;
  RecordingSink sink;
  FramePump pump(FRAME_BYTES, 2);

  EXPECT_FALSE(pump.run(source, sink, mark));
  EXPECT_NE(pump.last_error().find("read exploded"), std::string::npos);
  EXPECT_TRUE(sink.written().empty());
}
