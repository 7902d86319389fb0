/**
 * @file processing_queue.hpp
 * @brief Sequential job queue: download -> transcode -> upload
 *
 * @details One worker thread processes jobs strictly one at a time, so at
 *          most one transcode runs per process:
 *
 *          - Callers submit() a JobRequest and get a JobHandle back
 *
 *          - A request for a recordingId that is already pending, processing
 *            or complete attaches to the existing job instead of queueing a
 *            duplicate
 *
 *          - A request for a recordingId whose job failed replaces it with a
 *            fresh pending job (the only retry path)
 *
 *          - Scratch files for a job are removed on every exit path
 */

#ifndef CURSOR_FX_PROCESSING_QUEUE_HPP
#define CURSOR_FX_PROCESSING_QUEUE_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "object_store.hpp"
#include "sprite_cache.hpp"
#include "transcode_pipeline.hpp"
#include "types.hpp"

namespace cursor_fx {

enum class JobStatus { Pending, Processing, Complete, Failed };

/// "pending" / "processing" / "complete" / "failed"
const char *to_string(JobStatus status);

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::Complete || status == JobStatus::Failed;
}

/**
 * @struct JobRequest
 * @brief Everything needed to process one recording.
 */
struct JobRequest {
  std::string recording_id;
  std::string video_url;
  std::string project_id;
  std::string cursor_style = "normal";
  std::vector<CursorSample> samples;
  std::vector<ZoomWindow> windows;
};

/**
 * @struct JobRecord
 * @brief Status snapshot of a job.
 * @note Timestamps are Unix epoch milliseconds, 0 = not reached yet.
 */
struct JobRecord {
  std::string recording_id;
  std::string project_id;
  std::string video_url;
  JobStatus status = JobStatus::Pending;
  int progress = 0; //< 0..100, never decreases
  std::string processed_video_url;
  std::string error_message;
  int64_t submitted_at_ms = 0;
  int64_t started_at_ms = 0;
  int64_t completed_at_ms = 0;
};

/// Shared between the queue and every handle for the same job
struct JobState {
  mutable std::mutex mutex;
  std::condition_variable cv;
  JobRecord record;
  JobRequest request;
};

/**
 * @class JobHandle
 * @brief Caller's view of a submitted job.
 * @note Stays valid after the queue is destroyed.
 */
class JobHandle {
public:
  JobHandle() = default;
  explicit JobHandle(std::shared_ptr<JobState> state)
      : state_(std::move(state)) {}

  bool valid() const { return state_ != nullptr; }

  const std::string &recording_id() const {
    return state_->record.recording_id;
  }

  /// Current snapshot (non-blocking)
  JobRecord status() const;

  /// Block until the job is Complete or Failed
  JobRecord wait() const;

  /**
   * @brief Block up to `seconds` for a terminal state.
   * @param out Snapshot at return
   * @return false on timeout
   */
  bool wait_for(double seconds, JobRecord &out) const;

private:
  std::shared_ptr<JobState> state_;
};

/**
 * @struct QueueStats
 * @brief Job counts by status.
 */
struct QueueStats {
  size_t total = 0;
  size_t pending = 0;
  size_t processing = 0;
  size_t complete = 0;
  size_t failed = 0;
};

/**
 * @class Transcoder
 * @brief The transcode step of a job, between download and upload.
 */
class Transcoder {
public:
  virtual ~Transcoder() = default;

  /**
   * @param job The job being processed
   * @param input_path Downloaded source
   * @param output_path Where the result must be written
   * @param on_progress Transcode progress in [0,1]
   * @param error Output: reason on failure
   */
  virtual bool transcode(const JobRequest &job, const std::string &input_path,
                         const std::string &output_path,
                         const ProgressCallback &on_progress,
                         std::string &error) = 0;
};

/**
 * @class PipelineTranscoder
 * @brief Transcoder backed by TranscodePipeline.
 */
class PipelineTranscoder : public Transcoder {
public:
  /// @param sprites Sprite cache (nullptr = SpriteCache::shared())
  explicit PipelineTranscoder(SpriteCache *sprites = nullptr)
      : sprites_(sprites) {}

  bool transcode(const JobRequest &job, const std::string &input_path,
                 const std::string &output_path,
                 const ProgressCallback &on_progress,
                 std::string &error) override;

private:
  SpriteCache *sprites_;
};

/**
 * @brief Destination key of a processed recording:
 *        recordings/<projectId>/<recordingId>_processed.mp4
 */
std::string result_key(const std::string &project_id,
                       const std::string &recording_id);

/**
 * @class ProcessingQueue
 * @brief Deduplicating, strictly sequential job queue.
 *
 * @attention USAGE:
 *
 *   - submit() from any thread; the worker starts with the queue
 *
 *   - JobHandle::wait() to block for the result
 *
 *   - shutdown() (or the destructor) lets the running job finish and fails
 *     every job still pending
 */
class ProcessingQueue {
public:
  /**
   * @param store Download/upload backend
   * @param transcoder Transcode step
   * @param scratch_dir Directory for per-job temporary files
   */
  ProcessingQueue(std::unique_ptr<ObjectStore> store,
                  std::unique_ptr<Transcoder> transcoder,
                  std::string scratch_dir);
  ~ProcessingQueue();

  ProcessingQueue(const ProcessingQueue &) = delete;
  ProcessingQueue &operator=(const ProcessingQueue &) = delete;

  /**
   * @brief Queue a job, or attach to the existing job for its recordingId.
   */
  JobHandle submit(JobRequest request);

  /**
   * @brief Snapshot of the current job for a recording.
   * @return false if the recording was never submitted
   */
  bool get_status(const std::string &recording_id, JobRecord &out) const;

  /**
   * @brief Result URL if the recording's job is Complete, else empty.
   */
  std::string processed_video_url(const std::string &recording_id) const;

  /**
   * @brief Snapshots of every job of a project, in submission order.
   */
  std::vector<JobRecord> jobs_for_project(const std::string &project_id) const;

  QueueStats stats() const;

  /**
   * @brief Stop accepting jobs, fail pending ones, join the worker.
   */
  void shutdown();

private:
  std::unique_ptr<ObjectStore> store_;
  std::unique_ptr<Transcoder> transcoder_;
  std::string scratch_dir_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, std::shared_ptr<JobState>> jobs_;
  std::vector<std::string> order_; //< recordingIds in first-submission order
  std::deque<std::shared_ptr<JobState>> pending_;
  bool stopping_ = false;

  std::thread worker_;
  std::once_flag join_once_;

  void worker_loop();
  void process_job(JobState &job);
  bool run_stages(JobState &job, const std::string &input_path,
                  const std::string &output_path, std::string &result_url,
                  std::string &error);
};

} // namespace cursor_fx

#endif // CURSOR_FX_PROCESSING_QUEUE_HPP
