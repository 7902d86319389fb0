/**
 * @file subprocess.cpp
 * @brief fork/exec child process and pipe frame stream implementation
 */

#include "cursor_fx/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "cursor_fx/logging.hpp"

namespace cursor_fx {

namespace {

/// Granularity of cancellation checks while waiting on a pipe
constexpr int POLL_SLICE_MS = 100;

/// Grace period between SIGTERM and SIGKILL
constexpr int TERMINATE_GRACE_MS = 2000;

/// Writes to a dead encoder must fail with EPIPE, not kill this process
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1)
    return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

std::string errno_text() { return std::strerror(errno); }

} // namespace

// **----- SUBPROCESS -----**

Subprocess::~Subprocess() {
  if (running())
    terminate();
  if (stderr_thread_.joinable())
    stderr_thread_.join();
  close_fds();
}

bool Subprocess::start(const std::vector<std::string> &argv, bool pipe_stdin,
                       bool pipe_stdout) {
  if (argv.empty()) {
    last_error_ = "Empty command line";
    return false;
  }
  if (pid_ > 0) {
    last_error_ = "Subprocess already started";
    return false;
  }

  ignore_sigpipe();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1}; //< Reports exec failure back to the parent
  int dev_null = -1;

  auto close_all = [&]() {
    for (int *p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    close_fd(dev_null);
  };

  if ((pipe_stdin && pipe2(in_pipe, O_CLOEXEC) == -1) ||
      (pipe_stdout && pipe2(out_pipe, O_CLOEXEC) == -1) ||
      pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(exec_pipe, O_CLOEXEC) == -1) {
    last_error_ = fmt::format("pipe2 failed: {}", errno_text());
    close_all();
    return false;
  }

  dev_null = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (dev_null == -1) {
    last_error_ = fmt::format("Cannot open /dev/null: {}", errno_text());
    close_all();
    return false;
  }

  /// Built before fork: the child may only make async-signal-safe calls
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    last_error_ = fmt::format("fork failed: {}", errno_text());
    close_all();
    return false;
  }

  if (pid == 0) {
    int in_fd = pipe_stdin ? in_pipe[0] : dev_null;
    int out_fd = pipe_stdout ? out_pipe[1] : dev_null;
    int err = 0;
    if (dup2(in_fd, STDIN_FILENO) == -1 || dup2(out_fd, STDOUT_FILENO) == -1 ||
        dup2(err_pipe[1], STDERR_FILENO) == -1) {
      err = errno;
    } else {
      struct sigaction sa;
      std::memset(&sa, 0, sizeof(sa));
      sa.sa_handler = SIG_DFL;
      sigaction(SIGPIPE, &sa, nullptr);
      execvp(cargv[0], cargv.data());
      err = errno;
    }
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  /// Parent: keep only our ends
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);
  close_fd(dev_null);

  pid_ = pid;
  reaped_ = false;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    last_error_ = fmt::format("Failed to execute {}: {}", argv[0],
                              std::strerror(child_errno));
    try_reap(true);
    close_fds();
    return false;
  }

  if ((stdin_fd_ >= 0 && !set_nonblocking(stdin_fd_)) ||
      (stdout_fd_ >= 0 && !set_nonblocking(stdout_fd_))) {
    last_error_ = fmt::format("fcntl(O_NONBLOCK) failed: {}", errno_text());
    stderr_thread_ = std::thread(&Subprocess::drain_stderr, this);
    terminate();
    return false;
  }

  stderr_thread_ = std::thread(&Subprocess::drain_stderr, this);
  return true;
}

void Subprocess::close_stdin() { close_fd(stdin_fd_); }

void Subprocess::drain_stderr() {
  char buf[1024];
  while (true) {
    ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
    if (n > 0) {
      std::lock_guard<std::mutex> lock(tail_mutex_);
      stderr_tail_.append(buf, static_cast<size_t>(n));
      if (stderr_tail_.size() > STDERR_TAIL_BYTES)
        stderr_tail_.erase(0, stderr_tail_.size() - STDERR_TAIL_BYTES);
      continue;
    }
    if (n == -1 && errno == EINTR)
      continue;
    return;
  }
}

bool Subprocess::try_reap(bool block) {
  if (reaped_)
    return true;
  while (true) {
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
      exit_code_ = decode_status(status);
      reaped_ = true;
      return true;
    }
    if (r == 0)
      return false;
    if (errno == EINTR)
      continue;
    /// ECHILD: someone else reaped it; the status is lost
    exit_code_ = -1;
    reaped_ = true;
    return true;
  }
}

bool Subprocess::wait(int timeout_ms, int &exit_code) {
  if (pid_ <= 0) {
    exit_code = exit_code_;
    return true;
  }

  if (!reaped_) {
    if (timeout_ms < 0) {
      try_reap(true);
    } else {
      auto deadline = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(timeout_ms);
      while (!try_reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline)
          return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
  }

  if (stderr_thread_.joinable())
    stderr_thread_.join();
  exit_code = exit_code_;
  return true;
}

void Subprocess::terminate() {
  if (running()) {
    close_stdin();
    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(TERMINATE_GRACE_MS);
    while (!try_reap(false)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        LOG_WARN("Process {} ignored SIGTERM, sending SIGKILL", pid_);
        ::kill(pid_, SIGKILL);
        try_reap(true);
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  if (stderr_thread_.joinable())
    stderr_thread_.join();
}

std::string Subprocess::stderr_tail() const {
  std::lock_guard<std::mutex> lock(tail_mutex_);
  return stderr_tail_;
}

void Subprocess::close_fds() {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

// **----- PIPE FRAME SOURCE -----**

PipeFrameSource::PipeFrameSource(Subprocess &process, size_t frame_size,
                                 int stall_timeout_ms)
    : process_(process), frame_size_(frame_size),
      stall_timeout_ms_(stall_timeout_ms) {}

void PipeFrameSource::set_error(const std::string &msg) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  error_ = msg;
}

std::string PipeFrameSource::error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return error_;
}

ReadResult PipeFrameSource::read_frame(std::vector<uint8_t> &pixels) {
  int fd = process_.stdout_fd();
  if (fd < 0) {
    set_error("Decoder has no output pipe");
    return ReadResult::Failed;
  }
  if (pixels.size() != frame_size_)
    pixels.resize(frame_size_);

  size_t got = 0;
  auto last_progress = std::chrono::steady_clock::now();

  while (got < frame_size_) {
    if (cancelled_.load()) {
      set_error("Cancelled");
      return ReadResult::Failed;
    }

    pollfd pfd{fd, POLLIN, 0};
    int r = ::poll(&pfd, 1, POLL_SLICE_MS);
    if (r == -1) {
      if (errno == EINTR)
        continue;
      set_error(fmt::format("poll failed: {}", errno_text()));
      return ReadResult::Failed;
    }
    if (r == 0) {
      auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - last_progress)
                      .count();
      if (idle >= stall_timeout_ms_) {
        set_error(fmt::format("Decoder produced no data for {} ms", idle));
        return ReadResult::Failed;
      }
      continue;
    }

    ssize_t n = ::read(fd, pixels.data() + got, frame_size_ - got);
    if (n > 0) {
      got += static_cast<size_t>(n);
      last_progress = std::chrono::steady_clock::now();
      continue;
    }
    if (n == 0) {
      if (got == 0)
        return ReadResult::EndOfStream;
      set_error(fmt::format("Stream ended mid-frame ({} of {} bytes)", got,
                            frame_size_));
      return ReadResult::Failed;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      continue;
    set_error(fmt::format("read failed: {}", errno_text()));
    return ReadResult::Failed;
  }

  return ReadResult::Frame;
}

// **----- PIPE FRAME SINK -----**

PipeFrameSink::PipeFrameSink(Subprocess &process, int stall_timeout_ms)
    : process_(process), stall_timeout_ms_(stall_timeout_ms) {}

void PipeFrameSink::set_error(const std::string &msg) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  error_ = msg;
}

std::string PipeFrameSink::error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return error_;
}

bool PipeFrameSink::write_frame(const std::vector<uint8_t> &pixels) {
  int fd = process_.stdin_fd();
  if (fd < 0) {
    set_error("Encoder input is closed");
    return false;
  }

  size_t sent = 0;
  auto last_progress = std::chrono::steady_clock::now();

  while (sent < pixels.size()) {
    if (cancelled_.load()) {
      set_error("Cancelled");
      return false;
    }

    /// Wait for the encoder to drain its pipe before producing more
    pollfd pfd{fd, POLLOUT, 0};
    int r = ::poll(&pfd, 1, POLL_SLICE_MS);
    if (r == -1) {
      if (errno == EINTR)
        continue;
      set_error(fmt::format("poll failed: {}", errno_text()));
      return false;
    }
    if (r == 0) {
      auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - last_progress)
                      .count();
      if (idle >= stall_timeout_ms_) {
        set_error(fmt::format("Encoder accepted no data for {} ms", idle));
        return false;
      }
      continue;
    }

    ssize_t n = ::write(fd, pixels.data() + sent, pixels.size() - sent);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      last_progress = std::chrono::steady_clock::now();
      continue;
    }
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
      continue;
    if (n == -1 && errno == EPIPE) {
      set_error("Encoder closed its input");
      return false;
    }
    set_error(fmt::format("write failed: {}", errno_text()));
    return false;
  }

  return true;
}

bool PipeFrameSink::close() {
  process_.close_stdin();
  return true;
}

} // namespace cursor_fx
