/**
 * @file subprocess.hpp
 * @brief Child processes with piped stdio, and raw frame streams over them
 *
 * @details Subprocess wraps fork/exec with:
 *
 *          - non-blocking stdin/stdout pipes (flow control is done with
 *            poll(), never by blocking in read/write)
 *
 *          - a drain thread that keeps the last 4 KiB of stderr, so a
 *            chatty child can never block on a full stderr pipe and the
 *            tail is available for error reports
 *
 *          - bounded wait() and terminate() (SIGTERM, then SIGKILL)
 *
 *          PipeFrameSource / PipeFrameSink adapt a child's stdout / stdin to
 *          the FramePump interfaces.
 */

#ifndef CURSOR_FX_SUBPROCESS_HPP
#define CURSOR_FX_SUBPROCESS_HPP

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "frame_pump.hpp"

namespace cursor_fx {

/// Bytes of stderr retained per child
constexpr size_t STDERR_TAIL_BYTES = 4096;

class Subprocess {
public:
  Subprocess() = default;
  ~Subprocess();

  /// Disable copy (owns a pid and file descriptors)
  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Fork and exec argv[0] (resolved through PATH).
   * @param argv Program and arguments
   * @param pipe_stdin Give the child a stdin pipe (else /dev/null)
   * @param pipe_stdout Give the child a stdout pipe (else /dev/null)
   * @return false if the pipes could not be created or exec failed
   */
  bool start(const std::vector<std::string> &argv, bool pipe_stdin,
             bool pipe_stdout);

  /// Write end of the child's stdin (-1 if not piped or closed)
  int stdin_fd() const { return stdin_fd_; }

  /// Read end of the child's stdout (-1 if not piped)
  int stdout_fd() const { return stdout_fd_; }

  /// Close our end of the child's stdin (the child sees EOF)
  void close_stdin();

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms Milliseconds to wait (< 0 = forever)
   * @param exit_code Output: exit status, or 128 + signal if killed
   * @return false on timeout (the child is still running)
   */
  bool wait(int timeout_ms, int &exit_code);

  /**
   * @brief Stop the child: SIGTERM, up to 2 s grace, then SIGKILL. Reaps it.
   */
  void terminate();

  bool running() const { return pid_ > 0 && !reaped_; }
  pid_t pid() const { return pid_; }

  /// Last STDERR_TAIL_BYTES of the child's stderr
  std::string stderr_tail() const;

  const std::string &last_error() const { return last_error_; }

private:
  pid_t pid_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;

  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  std::thread stderr_thread_;
  mutable std::mutex tail_mutex_;
  std::string stderr_tail_;

  std::string last_error_;

  void drain_stderr();
  bool try_reap(bool block);
  void close_fds();
};

/**
 * @class PipeFrameSource
 * @brief Reads fixed-size frames from a child's stdout.
 *
 * @note A stream that ends in the middle of a frame is an error, not a
 *       short final frame.
 */
class PipeFrameSource : public FrameSource {
public:
  /**
   * @param process Running child with a stdout pipe
   * @param frame_size Bytes per frame
   * @param stall_timeout_ms Fail if no byte arrives for this long
   */
  PipeFrameSource(Subprocess &process, size_t frame_size,
                  int stall_timeout_ms);

  ReadResult read_frame(std::vector<uint8_t> &pixels) override;
  void cancel() override { cancelled_.store(true); }
  std::string error() const override;

private:
  Subprocess &process_;
  size_t frame_size_;
  int stall_timeout_ms_;
  std::atomic<bool> cancelled_{false};
  mutable std::mutex error_mutex_;
  std::string error_;

  void set_error(const std::string &msg);
};

/**
 * @class PipeFrameSink
 * @brief Writes frames to a child's stdin; close() sends EOF.
 */
class PipeFrameSink : public FrameSink {
public:
  /**
   * @param process Running child with a stdin pipe
   * @param stall_timeout_ms Fail if the child accepts no byte for this long
   */
  PipeFrameSink(Subprocess &process, int stall_timeout_ms);

  bool write_frame(const std::vector<uint8_t> &pixels) override;
  bool close() override;
  void cancel() override { cancelled_.store(true); }
  std::string error() const override;

private:
  Subprocess &process_;
  int stall_timeout_ms_;
  std::atomic<bool> cancelled_{false};
  mutable std::mutex error_mutex_;
  std::string error_;

  void set_error(const std::string &msg);
};

} // namespace cursor_fx

#endif // CURSOR_FX_SUBPROCESS_HPP
