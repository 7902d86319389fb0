/**
 * @file frame_pump.hpp
 * @brief Three-stage frame pump between a decoder and an encoder
 *
 * @details The pump runs:
 *
 *          - a reader thread pulling complete frames from a FrameSource
 *
 *          - the compositing stage on the calling thread
 *
 *          - a writer thread pushing frames into a FrameSink
 *
 *          Stages are linked by two bounded FrameQueues and draw their
 *          buffers from a fixed pool of (2 * depth + 4) frames. When the
 *          pool is empty the reader stops reading, which leaves the
 *          decoder's pipe full and stalls the decoder itself. Memory stays
 *          bounded no matter how long the video is or which side is slower.
 *
 * @note Frames reach the sink strictly in source order.
 */

#ifndef CURSOR_FX_FRAME_PUMP_HPP
#define CURSOR_FX_FRAME_PUMP_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cursor_fx {

enum class ReadResult { Frame, EndOfStream, Failed };

/**
 * @class FrameSource
 * @brief Producer of fixed-size raw frames.
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  /**
   * @brief Fill `pixels` (already sized to one frame) with the next frame.
   */
  virtual ReadResult read_frame(std::vector<uint8_t> &pixels) = 0;

  /// Make a blocked or future read_frame() return Failed promptly
  virtual void cancel() = 0;

  virtual std::string error() const = 0;
};

/**
 * @class FrameSink
 * @brief Consumer of fixed-size raw frames.
 */
class FrameSink {
public:
  virtual ~FrameSink() = default;

  virtual bool write_frame(const std::vector<uint8_t> &pixels) = 0;

  /// Signal end of input (no more frames will arrive)
  virtual bool close() = 0;

  /// Make a blocked or future write_frame() return false promptly
  virtual void cancel() = 0;

  virtual std::string error() const = 0;
};

/**
 * @brief Compositing callback: transform frame `index` from `in` to `out`.
 * @return false (with `error` set) to abort the whole run
 */
using FrameProcessor =
    std::function<bool(int64_t index, const std::vector<uint8_t> &in,
                       std::vector<uint8_t> &out, std::string &error)>;

/// Called on the compositing thread after each frame is queued for output
using FrameCallback = std::function<void(int64_t frames_done)>;

class FramePump {
public:
  /**
   * @param frame_size Bytes per frame
   * @param queue_depth Capacity of each inter-stage queue (min 1)
   */
  FramePump(size_t frame_size, size_t queue_depth);

  /**
   * @brief Pump every frame from source through process into sink.
   * @return true if the source reached end of stream and the sink closed
   *         cleanly; false on any stage failure (see last_error())
   */
  bool run(FrameSource &source, FrameSink &sink, const FrameProcessor &process,
           const FrameCallback &on_frame = nullptr);

  int64_t frames_read() const { return frames_read_.load(); }
  int64_t frames_processed() const { return frames_processed_.load(); }
  int64_t frames_written() const { return frames_written_.load(); }

  /// Hard upper bound on frames held in memory by the pump
  size_t pool_size() const { return pool_size_; }

  const std::string &last_error() const { return last_error_; }

private:
  size_t frame_size_;
  size_t queue_depth_;
  size_t pool_size_;

  std::atomic<int64_t> frames_read_{0};
  std::atomic<int64_t> frames_processed_{0};
  std::atomic<int64_t> frames_written_{0};

  std::mutex error_mutex_;
  std::string last_error_;
};

} // namespace cursor_fx

#endif // CURSOR_FX_FRAME_PUMP_HPP
