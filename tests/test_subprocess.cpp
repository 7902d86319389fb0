/**
 * @file test_subprocess.cpp
 * @brief Child process control and pipe frame streams, using /bin/sh
 */

#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cursor_fx/subprocess.hpp"

using namespace cursor_fx;

namespace {

std::vector<std::string> sh(const std::string &script) {
  return {"/bin/sh", "-c", script};
}

} // namespace

// **---- Subprocess ----**

TEST(Subprocess, ReportsExitCode) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("exit 3"), false, false));
  int code = -1;
  ASSERT_TRUE(p.wait(5000, code));
  EXPECT_EQ(code, 3);
  EXPECT_FALSE(p.running());
}

TEST(Subprocess, MissingProgramFailsToStart) {
  Subprocess p;
  EXPECT_FALSE(p.start({"/nonexistent/cursor-fx-binary"}, false, false));
  EXPECT_NE(p.last_error().find("Failed to execute"), std::string::npos);
}

TEST(Subprocess, EmptyCommandFails) {
  Subprocess p;
  EXPECT_FALSE(p.start({}, false, false));
}

TEST(Subprocess, KeepsStderrTail) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("echo 'something went wrong' >&2; exit 1"), false,
                      false));
  int code = 0;
  ASSERT_TRUE(p.wait(5000, code));
  EXPECT_EQ(code, 1);
  EXPECT_NE(p.stderr_tail().find("something went wrong"), std::string::npos);
}

TEST(Subprocess, StderrTailIsBounded) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("i=0; while [ $i -lt 400 ]; do "
                         "echo 'line of noise on stderr' >&2; i=$((i+1)); "
                         "done; echo LAST >&2"),
                      false, false));
  int code = -1;
  ASSERT_TRUE(p.wait(10000, code));
  std::string tail = p.stderr_tail();
  EXPECT_LE(tail.size(), STDERR_TAIL_BYTES);
  EXPECT_NE(tail.find("LAST"), std::string::npos);
}

TEST(Subprocess, WaitTimesOutThenTerminate) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("exec sleep 30"), false, false));
  int code = 0;
  EXPECT_FALSE(p.wait(100, code));
  EXPECT_TRUE(p.running());

  auto start = std::chrono::steady_clock::now();
  p.terminate();
  auto took = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(p.running());
  EXPECT_LT(took, std::chrono::seconds(5));

  ASSERT_TRUE(p.wait(0, code));
  EXPECT_EQ(code, 128 + 15);
}

// **---- PipeFrameSource ----**

TEST(PipeFrameSource, ReadsWholeFramesThenEndOfStream) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("printf 'AAAABBBB'"), false, true));

  PipeFrameSource source(p, 4, 5000);
  std::vector<uint8_t> buf(4);

  ASSERT_EQ(source.read_frame(buf), ReadResult::Frame);
  EXPECT_EQ(std::string(buf.begin(), buf.end()), "AAAA");
  ASSERT_EQ(source.read_frame(buf), ReadResult::Frame);
  EXPECT_EQ(std::string(buf.begin(), buf.end()), "BBBB");
  EXPECT_EQ(source.read_frame(buf), ReadResult::EndOfStream);

  int code = -1;
  ASSERT_TRUE(p.wait(5000, code));
  EXPECT_EQ(code, 0);
}

TEST(PipeFrameSource, TruncatedFrameIsAnError) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("printf 'AAAAB'"), false, true));

  PipeFrameSource source(p, 4, 5000);
  std::vector<uint8_t> buf(4);
  ASSERT_EQ(source.read_frame(buf), ReadResult::Frame);
  EXPECT_EQ(source.read_frame(buf), ReadResult::Failed);
  EXPECT_NE(source.error().find("mid-frame"), std::string::npos);

  int code = -1;
  EXPECT_TRUE(p.wait(5000, code));
}

TEST(PipeFrameSource, StallTimeout) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("exec sleep 30"), false, true));

  PipeFrameSource source(p, 4, 300);
  std::vector<uint8_t> buf(4);
  EXPECT_EQ(source.read_frame(buf), ReadResult::Failed);
  EXPECT_NE(source.error().find("no data"), std::string::npos);
  p.terminate();
}

TEST(PipeFrameSource, CancelStopsRead) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("exec sleep 30"), false, true));

  PipeFrameSource source(p, 4, 60000);
  source.cancel();
  std::vector<uint8_t> buf(4);
  EXPECT_EQ(source.read_frame(buf), ReadResult::Failed);
  p.terminate();
}

// **---- PipeFrameSink ----**

TEST(PipeFrameSink, WritesReachChild) {
  Subprocess p;
  /// Echo the byte count back through the exit code
  ASSERT_TRUE(p.start(sh("n=$(wc -c); exit $((n / 1000))"), true, false));

  PipeFrameSink sink(p, 5000);
  std::vector<uint8_t> frame(1000, 7);
  for (int i = 0; i < 5; ++i)
    ASSERT_TRUE(sink.write_frame(frame));
  ASSERT_TRUE(sink.close());

  int code = -1;
  ASSERT_TRUE(p.wait(5000, code));
  EXPECT_EQ(code, 5);
}

TEST(PipeFrameSink, ClosedReaderIsAnError) {
  Subprocess p;
  ASSERT_TRUE(p.start(sh("exit 0"), true, false));
  int code = -1;
  ASSERT_TRUE(p.wait(5000, code));

  PipeFrameSink sink(p, 5000);
  std::vector<uint8_t> frame(4096, 1);
  EXPECT_FALSE(sink.write_frame(frame));
  EXPECT_FALSE(sink.error().empty());
}

// **---- End to end ----**

TEST(PipeFrames, PumpBetweenChildren) {
  Subprocess producer;
  ASSERT_TRUE(producer.start(sh("printf '0123456789abcdef'"), false, true));
  Subprocess consumer;
  ASSERT_TRUE(consumer.start(sh("n=$(wc -c); exit $n"), true, false));

  PipeFrameSource source(producer, 4, 5000);
  PipeFrameSink sink(consumer, 5000);
  FramePump pump(4, 1);

  auto copy = [](int64_t, const std::vector<uint8_t> &in,
                 std::vector<uint8_t> &out, std::string &) {
    out = in;
    return true;
  };
  ASSERT_TRUE(pump.run(source, sink, copy));
  EXPECT_EQ(pump.frames_written(), 4);

  int code = -1;
  ASSERT_TRUE(producer.wait(5000, code));
  EXPECT_EQ(code, 0);
  ASSERT_TRUE(consumer.wait(5000, code));
  EXPECT_EQ(code, 16);
}
