/**
 * @file frame_queue.hpp
 * @brief Thread-safe bounded frame queue for the transcode pump
 *
 * @details Links the three pump stages (decoder reader, compositor, encoder
 *          writer) and also serves as the free-buffer pool:
 *
 *          - push() blocks while the queue is at capacity (backpressure)
 *
 *          - pop() blocks until a frame arrives or the queue is finished
 *
 *          - abort() wakes every waiter so a failed stage cannot strand the
 *            others
 */

#ifndef CURSOR_FX_FRAME_QUEUE_HPP
#define CURSOR_FX_FRAME_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace cursor_fx {

/**
 * @struct FrameBuffer
 * @brief One raw RGBA frame tagged with its source-order index.
 */
struct FrameBuffer {
  int64_t index = -1;
  std::vector<uint8_t> pixels;
};

/**
 * @class FrameQueue
 * @brief Blocking FIFO with an optional capacity.
 *
 * @attention USAGE:
 *
 *   - Producer calls push() per frame, then finish() at end of stream
 *
 *   - Consumer calls pop() in a loop until it returns false
 *
 *   - Any stage calls abort() on failure
 */
class FrameQueue {
public:
  /**
   * @param capacity Maximum queued frames (0 = unbounded)
   */
  explicit FrameQueue(size_t capacity = 0) : capacity_(capacity) {}

  /**
   * @brief Push a frame, waiting for room if the queue is full.
   * @return false if the queue was aborted (the frame is dropped)
   */
  bool push(FrameBuffer frame);

  /**
   * @brief Pop a frame (blocking).
   * @param frame Output: the next frame in FIFO order
   * @return false once the queue is finished and drained, or aborted
   */
  bool pop(FrameBuffer &frame);

  /**
   * @brief Signal that no more frames will be pushed.
   */
  void finish();

  /**
   * @brief Fail the queue: wake all waiters, refuse further traffic.
   */
  void abort();

  bool aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
  }

  /// Largest size() ever observed
  size_t high_water() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_;
  }

private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<FrameBuffer> frames_;
  size_t high_water_ = 0;
  bool done_ = false;
  bool aborted_ = false;
};

} // namespace cursor_fx

#endif // CURSOR_FX_FRAME_QUEUE_HPP
