/**
 * @file frame_queue.cpp
 * @brief Bounded frame queue implementation
 */

#include "cursor_fx/frame_queue.hpp"

#include <algorithm>

namespace cursor_fx {

bool FrameQueue::push(FrameBuffer frame) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return aborted_ || capacity_ == 0 || frames_.size() < capacity_;
    });
    if (aborted_)
      return false;
    frames_.push_back(std::move(frame));
    high_water_ = std::max(high_water_, frames_.size());
  }
  not_empty_.notify_one();
  return true;
}

bool FrameQueue::pop(FrameBuffer &frame) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [this] { return aborted_ || done_ || !frames_.empty(); });

    if (aborted_ || frames_.empty()) {
      return false;
    }

    frame = std::move(frames_.front());
    frames_.pop_front();
  }
  not_full_.notify_one();
  return true;
}

void FrameQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  not_empty_.notify_all();
}

void FrameQueue::abort() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

} // namespace cursor_fx
