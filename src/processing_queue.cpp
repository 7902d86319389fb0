/**
 * @file processing_queue.cpp
 * @brief Sequential processing queue implementation
 *
 * @details Lock order: ProcessingQueue::mutex_ before JobState::mutex. The
 *          worker only ever takes a JobState mutex on its own, so it never
 *          blocks submit() for longer than a status update.
 */

#include "cursor_fx/processing_queue.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "cursor_fx/logging.hpp"
#include "cursor_fx/system.hpp"

namespace cursor_fx {

namespace fs = std::filesystem;

namespace {

/// Progress milestones of a job
constexpr int PROGRESS_STARTED = 5;
constexpr int PROGRESS_DOWNLOADED = 20;
constexpr int PROGRESS_TRANSCODED = 70;
constexpr int PROGRESS_DONE = 100;

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string iso_timestamp() {
  std::time_t t = std::time(nullptr);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

/// recordingId reduced to characters safe in a file name
std::string scratch_stem(const std::string &recording_id) {
  std::string out = recording_id;
  for (auto &c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_')
      c = '_';
  }
  return out.empty() ? "job" : out;
}

/**
 * @brief Removes every registered scratch file when it goes out of scope.
 */
struct ScratchFiles {
  std::vector<fs::path> paths;

  ~ScratchFiles() {
    for (const auto &p : paths) {
      std::error_code ec;
      fs::remove(p, ec);
      if (ec)
        LOG_WARN("Could not remove scratch file {}: {}", p.string(),
                 ec.message());
    }
  }
};

void set_progress(JobState &job, int progress) {
  std::lock_guard<std::mutex> lock(job.mutex);
  job.record.progress = std::max(job.record.progress, progress);
}

} // namespace

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "pending";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Complete:
    return "complete";
  case JobStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::string result_key(const std::string &project_id,
                       const std::string &recording_id) {
  return fmt::format("recordings/{}/{}_processed.mp4", project_id,
                     recording_id);
}

// **----- JOB HANDLE -----**

JobRecord JobHandle::status() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->record;
}

JobRecord JobHandle::wait() const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] { return is_terminal(state_->record.status); });
  return state_->record;
}

bool JobHandle::wait_for(double seconds, JobRecord &out) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  bool done = state_->cv.wait_for(
      lock, std::chrono::duration<double>(seconds),
      [this] { return is_terminal(state_->record.status); });
  out = state_->record;
  return done;
}

// **----- PIPELINE TRANSCODER -----**

bool PipelineTranscoder::transcode(const JobRequest &job,
                                   const std::string &input_path,
                                   const std::string &output_path,
                                   const ProgressCallback &on_progress,
                                   std::string &error) {
  TranscodePipeline pipeline(input_path, output_path, job.samples, job.windows,
                             job.cursor_style, job.recording_id);
  if (sprites_)
    pipeline.set_sprite_cache(sprites_);

  if (pipeline.run(on_progress) != 0) {
    error = pipeline.last_error();
    return false;
  }
  return true;
}

// **----- PROCESSING QUEUE -----**

ProcessingQueue::ProcessingQueue(std::unique_ptr<ObjectStore> store,
                                 std::unique_ptr<Transcoder> transcoder,
                                 std::string scratch_dir)
    : store_(std::move(store)), transcoder_(std::move(transcoder)),
      scratch_dir_(std::move(scratch_dir)) {
  worker_ = std::thread(&ProcessingQueue::worker_loop, this);
}

ProcessingQueue::~ProcessingQueue() { shutdown(); }

JobHandle ProcessingQueue::submit(JobRequest request) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto make_state = [&request]() {
    auto state = std::make_shared<JobState>();
    state->record.recording_id = request.recording_id;
    state->record.project_id = request.project_id;
    state->record.video_url = request.video_url;
    state->record.submitted_at_ms = now_ms();
    state->request = std::move(request);
    return state;
  };

  if (stopping_) {
    auto state = make_state();
    state->record.status = JobStatus::Failed;
    state->record.error_message = "Queue is shut down";
    state->record.completed_at_ms = state->record.submitted_at_ms;
    LOG_WARN("[Job {}] Rejected: queue is shut down",
             state->record.recording_id);
    return JobHandle(state);
  }

  auto it = jobs_.find(request.recording_id);
  if (it != jobs_.end()) {
    JobStatus current;
    {
      std::lock_guard<std::mutex> job_lock(it->second->mutex);
      current = it->second->record.status;
    }
    if (current != JobStatus::Failed) {
      JOB_INFO(request.recording_id, "Already queued ({})",
               to_string(current));
      return JobHandle(it->second);
    }
    JOB_INFO(request.recording_id, "Previous attempt failed, queueing again");
  } else {
    order_.push_back(request.recording_id);
  }

  auto state = make_state();
  jobs_[state->record.recording_id] = state;
  pending_.push_back(state);
  JOB_INFO(state->record.recording_id, "Queued ({} pending)", pending_.size());

  cv_.notify_one();
  return JobHandle(state);
}

bool ProcessingQueue::get_status(const std::string &recording_id,
                                 JobRecord &out) const {
  std::shared_ptr<JobState> state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(recording_id);
    if (it == jobs_.end())
      return false;
    state = it->second;
  }
  std::lock_guard<std::mutex> job_lock(state->mutex);
  out = state->record;
  return true;
}

std::string
ProcessingQueue::processed_video_url(const std::string &recording_id) const {
  JobRecord record;
  if (!get_status(recording_id, record) ||
      record.status != JobStatus::Complete)
    return "";
  return record.processed_video_url;
}

std::vector<JobRecord>
ProcessingQueue::jobs_for_project(const std::string &project_id) const {
  std::vector<JobRecord> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &id : order_) {
    auto it = jobs_.find(id);
    if (it == jobs_.end())
      continue;
    std::lock_guard<std::mutex> job_lock(it->second->mutex);
    if (it->second->record.project_id == project_id)
      out.push_back(it->second->record);
  }
  return out;
}

QueueStats ProcessingQueue::stats() const {
  QueueStats s;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : jobs_) {
    std::lock_guard<std::mutex> job_lock(kv.second->mutex);
    ++s.total;
    switch (kv.second->record.status) {
    case JobStatus::Pending:
      ++s.pending;
      break;
    case JobStatus::Processing:
      ++s.processing;
      break;
    case JobStatus::Complete:
      ++s.complete;
      break;
    case JobStatus::Failed:
      ++s.failed;
      break;
    }
  }
  return s;
}

void ProcessingQueue::shutdown() {
  std::deque<std::shared_ptr<JobState>> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    abandoned.swap(pending_);
  }
  cv_.notify_all();

  for (auto &state : abandoned) {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->record.status = JobStatus::Failed;
      state->record.error_message = "Queue shut down before processing";
      state->record.completed_at_ms = now_ms();
    }
    state->cv.notify_all();
  }

  /// Concurrent callers all block here until the worker has exited
  std::call_once(join_once_, [this] {
    if (worker_.joinable())
      worker_.join();
  });
}

// **----- WORKER -----**

void ProcessingQueue::worker_loop() {
  LOG_INFO("[Queue Worker] Started");

  while (true) {
    std::shared_ptr<JobState> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (stopping_)
        break;
      job = pending_.front();
      pending_.pop_front();
    }
    process_job(*job);
  }

  LOG_INFO("[Queue Worker] Stopped");
}

void ProcessingQueue::process_job(JobState &job) {
  const std::string id = job.request.recording_id;

  {
    std::lock_guard<std::mutex> lock(job.mutex);
    job.record.status = JobStatus::Processing;
    job.record.started_at_ms = now_ms();
    job.record.progress = PROGRESS_STARTED;
  }
  LOG_PHASE("[Job {}] Processing {}", id, job.request.video_url);

  std::error_code ec;
  fs::create_directories(scratch_dir_, ec);

  std::string stem = scratch_stem(id);
  std::string input_path =
      (fs::path(scratch_dir_) / (stem + "_input.mp4")).string();
  std::string output_path =
      (fs::path(scratch_dir_) / (stem + "_processed.mp4")).string();

  std::string result_url;
  std::string error;
  bool ok = false;
  {
    ScratchFiles scratch;
    scratch.paths = {input_path, output_path};

    try {
      ok = run_stages(job, input_path, output_path, result_url, error);
    } catch (const std::exception &e) {
      ok = false;
      error = fmt::format("Unexpected error: {}", e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(job.mutex);
    job.record.completed_at_ms = now_ms();
    if (ok) {
      job.record.status = JobStatus::Complete;
      job.record.processed_video_url = result_url;
      job.record.progress = PROGRESS_DONE;
    } else {
      job.record.status = JobStatus::Failed;
      job.record.error_message = error.empty() ? "Unknown error" : error;
    }
  }
  job.cv.notify_all();

  if (ok) {
    LOG_SUCCESS("[Job {}] Complete: {}", id, result_url);
  } else {
    JOB_ERROR(id, "Failed: {}", error);
  }
}

bool ProcessingQueue::run_stages(JobState &job, const std::string &input_path,
                                 const std::string &output_path,
                                 std::string &result_url, std::string &error) {
  const JobRequest &req = job.request;

  // **----- DOWNLOAD -----**

  JOB_INFO(req.recording_id, "Downloading {}...", req.video_url);
  TIMER_START(download);
  bool downloaded = store_->download(req.video_url, input_path);
  TIMER_END(download);
  if (!downloaded) {
    error = store_->last_error();
    return false;
  }
  set_progress(job, PROGRESS_DOWNLOADED);

  // **----- TRANSCODE -----**

  auto on_progress = [&job](double fraction, int64_t) {
    double f = std::min(1.0, std::max(0.0, fraction));
    set_progress(job, PROGRESS_DOWNLOADED +
                          static_cast<int>(f * (PROGRESS_TRANSCODED -
                                                PROGRESS_DOWNLOADED)));
  };

  TIMER_START(transcode);
  bool transcoded = transcoder_->transcode(req, input_path, output_path,
                                           on_progress, error);
  TIMER_END(transcode);
  if (!transcoded) {
    if (error.empty())
      error = "Transcode failed";
    return false;
  }
  set_progress(job, PROGRESS_TRANSCODED);

  // **----- UPLOAD -----**

  std::string key = result_key(req.project_id, req.recording_id);
  ObjectMetadata metadata = {{"recording-id", req.recording_id},
                             {"processed-at", iso_timestamp()}};

  std::error_code size_ec;
  auto size = std::filesystem::file_size(output_path, size_ec);
  JOB_INFO(req.recording_id, "Uploading {} ({})...", key,
           size_ec ? std::string("size unknown") : format_bytes(size));
  TIMER_START(upload);
  bool uploaded =
      store_->upload(output_path, key, "video/mp4", metadata, result_url);
  TIMER_END(upload);
  if (!uploaded) {
    error = store_->last_error();
    return false;
  }

  return true;
}

} // namespace cursor_fx
