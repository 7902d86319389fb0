/**
 * @file frame_pump.cpp
 * @brief Three-stage frame pump implementation
 *
 * @details Buffer lifecycle:
 *
 *          free pool -> reader -> decoded queue -> compositor
 *
 *          compositor -> encoded queue -> writer -> free pool
 *
 *          The compositor takes a second buffer from the pool for its output
 *          and returns the input buffer as soon as the frame is done. With
 *          both queues full, the reader and writer each holding one buffer
 *          and the compositor holding two, 2 * depth + 4 buffers are in use,
 *          so the pool never deadlocks.
 */

#include "cursor_fx/frame_pump.hpp"

#include <algorithm>
#include <exception>
#include <thread>

#include <fmt/core.h>

#include "cursor_fx/frame_queue.hpp"
#include "cursor_fx/logging.hpp"

namespace cursor_fx {

FramePump::FramePump(size_t frame_size, size_t queue_depth)
    : frame_size_(frame_size), queue_depth_(std::max<size_t>(1, queue_depth)),
      pool_size_(2 * queue_depth_ + 4) {}

bool FramePump::run(FrameSource &source, FrameSink &sink,
                    const FrameProcessor &process,
                    const FrameCallback &on_frame) {
  frames_read_.store(0);
  frames_processed_.store(0);
  frames_written_.store(0);
  last_error_.clear();

  FrameQueue free_pool;
  FrameQueue decoded(queue_depth_);
  FrameQueue encoded(queue_depth_);

  for (size_t i = 0; i < pool_size_; ++i) {
    FrameBuffer buf;
    buf.pixels.resize(frame_size_);
    free_pool.push(std::move(buf));
  }

  /// First failure wins; every queue is aborted and both ends cancelled
  std::atomic<bool> failed{false};
  auto fail = [&](const std::string &msg) {
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      if (last_error_.empty())
        last_error_ = msg;
    }
    failed.store(true);
    decoded.abort();
    encoded.abort();
    free_pool.abort();
    source.cancel();
    sink.cancel();
  };

  // **----- READER: source -> decoded -----**

  std::thread reader([&]() {
    int64_t index = 0;
    FrameBuffer buf;
    try {
      while (free_pool.pop(buf)) {
        ReadResult r = source.read_frame(buf.pixels);
        if (r == ReadResult::EndOfStream) {
          decoded.finish();
          return;
        }
        if (r == ReadResult::Failed) {
          fail(fmt::format("Decoder read failed at frame {}: {}", index,
                           source.error()));
          return;
        }
        buf.index = index++;
        ++frames_read_;
        if (!decoded.push(std::move(buf)))
          return;
      }
    } catch (const std::exception &e) {
      fail(fmt::format("Decoder read failed at frame {}: {}", index, e.what()));
    }
  });

  // **----- WRITER: encoded -> sink -----**

  std::thread writer([&]() {
    FrameBuffer buf;
    try {
      while (encoded.pop(buf)) {
        if (!sink.write_frame(buf.pixels)) {
          fail(fmt::format("Encoder write failed at frame {}: {}", buf.index,
                           sink.error()));
          return;
        }
        ++frames_written_;
        if (!free_pool.push(std::move(buf)))
          return;
      }
      if (failed.load())
        return;
      if (!sink.close()) {
        fail(fmt::format("Failed to close encoder input: {}", sink.error()));
      }
    } catch (const std::exception &e) {
      fail(fmt::format("Encoder write failed at frame {}: {}", buf.index,
                       e.what()));
    }
  });

  // **----- COMPOSITOR: decoded -> encoded (this thread) -----**

  /// Exceptions from the callbacks fail the run; the threads above must
  /// still be joined
  FrameBuffer in;
  FrameBuffer out;
  try {
    while (decoded.pop(in)) {
      if (!free_pool.pop(out))
        break;
      out.index = in.index;

      std::string err;
      if (!process(in.index, in.pixels, out.pixels, err)) {
        fail(fmt::format("Compositing failed at frame {}: {}", in.index, err));
        break;
      }
      if (out.pixels.size() != frame_size_) {
        fail(fmt::format("Compositing produced {} bytes at frame {} (expected "
                         "{})",
                         out.pixels.size(), in.index, frame_size_));
        break;
      }

      if (!free_pool.push(std::move(in)))
        break;
      if (!encoded.push(std::move(out)))
        break;

      int64_t done = ++frames_processed_;
      if (on_frame)
        on_frame(done);
    }
  } catch (const std::exception &e) {
    fail(fmt::format("Compositing failed at frame {}: {}", in.index, e.what()));
  }

  if (!failed.load())
    encoded.finish();

  reader.join();
  writer.join();

  if (failed.load()) {
    LOG_ERROR("{}", last_error_);
    return false;
  }
  return true;
}

} // namespace cursor_fx
