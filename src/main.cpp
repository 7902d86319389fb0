/**
 * @file main.cpp
 * @brief Entry point for the Cursor FX renderer
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: render one local video from a job manifest
 *
 *          - Queue mode: submit manifests to a ProcessingQueue (download,
 *            render, upload) and print each job's final status as JSON
 *
 * @note Queue mode uses STORAGE_MODE to pick the object store and
 *       SCRATCH_DIR for temporary files. Jobs always run one at a time.
 */

#include <cstdio>
#include <string>
#include <vector>

#include "cursor_fx/config.hpp"
#include "cursor_fx/job_manifest.hpp"
#include "cursor_fx/logging.hpp"
#include "cursor_fx/object_store.hpp"
#include "cursor_fx/processing_queue.hpp"
#include "cursor_fx/transcode_pipeline.hpp"

using namespace cursor_fx;

namespace {

void print_usage() {
  LOG_WARN("Usage: ./cursor_fx <input> <output> [job.json]");
  LOG_WARN("       ./cursor_fx --queue <job.json> [job.json...]");
}

// **---- QUEUE MODE ----**

int run_queue_mode(const std::vector<std::string> &manifests) {
  LOG_INFO("Cursor FX - Queue Mode");
  LOG_INFO("Manifests: {}", manifests.size());
  LOG_INFO("Scratch directory: {}", Config::scratch_dir());

  std::string error;
  auto store = make_object_store(error);
  if (!store) {
    LOG_ERROR("{}", error);
    return 1;
  }

  ProcessingQueue queue(std::move(store),
                        std::make_unique<PipelineTranscoder>(),
                        Config::scratch_dir());

  std::vector<JobHandle> handles;
  int failed = 0;

  for (const auto &path : manifests) {
    JobRequest request;
    if (!load_job_manifest(path, request, error)) {
      LOG_ERROR("{}", error);
      ++failed;
      continue;
    }
    if (request.recording_id.empty() || request.video_url.empty()) {
      LOG_ERROR("{}: recordingId and videoUrl are required", path);
      ++failed;
      continue;
    }
    handles.push_back(queue.submit(std::move(request)));
  }

  for (const auto &handle : handles) {
    JobRecord record = handle.wait();
    if (record.status == JobStatus::Failed)
      ++failed;
    std::lock_guard<std::mutex> lock(log_mutex);
    fmt::print("{}\n", job_record_to_json(record).dump(2));
  }

  queue.shutdown();

  QueueStats s = queue.stats();
  LOG_PHASE("Jobs: {} total, {} complete, {} failed", s.total, s.complete,
            s.failed);
  TimingCollector::print_summary();
  return failed;
}

// **---- SINGLE FILE MODE ----**

int run_single_mode(const std::string &input, const std::string &output,
                    const std::string &manifest) {
  LOG_INFO("Cursor FX - Single File Mode");
  LOG_INFO("Input: {}", input);
  LOG_INFO("Output: {}", output);

  JobRequest request;
  if (!manifest.empty()) {
    std::string error;
    if (!load_job_manifest(manifest, request, error)) {
      LOG_ERROR("{}", error);
      return 1;
    }
    LOG_INFO("Manifest: {}", manifest);
  }

  TIMER_START(total_run);
  TranscodePipeline app(input, output, std::move(request.samples),
                        std::move(request.windows), request.cursor_style);
  int rc = app.run([](double fraction, int64_t frames) {
    LOG_INFO("Progress: {:3.0f}% ({} frames)", fraction * 100.0, frames);
  });
  TIMER_END(total_run);

  TimingCollector::print_summary();
  return rc;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    print_usage();
    return 1;
  }

  std::string first = argv[1];
  if (first == "--queue") {
    std::vector<std::string> manifests(argv + 2, argv + argc);
    return run_queue_mode(manifests);
  }

  std::string manifest = (argc >= 4) ? argv[3] : "";
  return run_single_mode(first, argv[2], manifest);
}
