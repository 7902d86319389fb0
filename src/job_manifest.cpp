/**
 * @file job_manifest.cpp
 * @brief Manifest parsing and status serialization with nlohmann::json
 */

#include "cursor_fx/job_manifest.hpp"

#include <ctime>
#include <fstream>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "cursor_fx/logging.hpp"

namespace cursor_fx {

using json = nlohmann::json;

namespace {

/// Arrays may be embedded as JSON text (form-encoded uploads)
bool as_array(const json &value, json &out) {
  if (value.is_null()) {
    out = json::array();
    return true;
  }
  if (value.is_string()) {
    out = json::parse(value.get<std::string>());
    return out.is_array();
  }
  if (!value.is_array())
    return false;
  out = value;
  return true;
}

const json &field_or_null(const json &obj, const char *key) {
  static const json null_value;
  auto it = obj.find(key);
  return it != obj.end() ? *it : null_value;
}

double number_or(const json &obj, const char *key, const char *fallback_key,
                 double default_val) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_number())
    return it->get<double>();
  if (fallback_key) {
    it = obj.find(fallback_key);
    if (it != obj.end() && it->is_number())
      return it->get<double>();
  }
  return default_val;
}

std::string string_or(const json &obj, const char *key,
                      const std::string &default_val) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string())
    return it->get<std::string>();
  return default_val;
}

} // namespace

bool parse_job_manifest(const std::string &text, JobRequest &out,
                        std::string &error) {
  out = JobRequest{};

  try {
    json doc = json::parse(text);
    if (!doc.is_object()) {
      error = "Manifest must be a JSON object";
      return false;
    }

    out.recording_id = string_or(doc, "recordingId", "");
    out.video_url = string_or(doc, "videoUrl", "");
    out.project_id = string_or(doc, "projectId", "");
    out.cursor_style =
        normalize_cursor_style(string_or(doc, "cursorStyle", "normal"));

    // **--- CURSOR SAMPLES ---**

    json cursor;
    if (!as_array(field_or_null(doc, "cursorData"), cursor)) {
      error = "cursorData must be an array";
      return false;
    }
    size_t skipped = 0;
    out.samples.reserve(cursor.size());
    for (const auto &ev : cursor) {
      if (!ev.is_object() || !ev.contains("timestamp") ||
          !ev["timestamp"].is_number()) {
        ++skipped;
        continue;
      }
      CursorSample s;
      s.timestamp_ms = ev["timestamp"].get<double>();
      s.x = number_or(ev, "x", "coord_x", 0.0);
      s.y = number_or(ev, "y", "coord_y", 0.0);

      std::string type = string_or(ev, "type", "move");
      s.kind = (type == "click") ? CursorKind::Click : CursorKind::Move;
      s.keyboard = (type == "input");
      out.samples.push_back(s);
    }
    if (skipped > 0)
      LOG_WARN("Skipped {} cursor samples without a numeric timestamp",
               skipped);

    // **--- ZOOM WINDOWS ---**

    json zooms;
    if (!as_array(field_or_null(doc, "zoomPoints"), zooms)) {
      error = "zoomPoints must be an array";
      return false;
    }
    skipped = 0;
    for (const auto &z : zooms) {
      if (!z.is_object()) {
        ++skipped;
        continue;
      }
      ZoomWindow w;
      w.start_sec = number_or(z, "time", nullptr, 0.0);
      w.x = number_or(z, "x", nullptr, 0.5);
      w.y = number_or(z, "y", nullptr, 0.5);
      w.scale = number_or(z, "scale", nullptr, 1.0);
      w.duration_sec = number_or(z, "duration", nullptr, 0.0);
      if (w.duration_sec <= 0 || w.scale <= 0) {
        ++skipped;
        continue;
      }
      out.windows.push_back(w);
    }
    if (skipped > 0)
      LOG_WARN("Skipped {} unusable zoom points", skipped);

  } catch (const json::exception &e) {
    error = fmt::format("Invalid manifest: {}", e.what());
    return false;
  }

  return true;
}

bool load_job_manifest(const std::string &path, JobRequest &out,
                       std::string &error) {
  std::ifstream in(path);
  if (!in) {
    error = fmt::format("Cannot open manifest {}", path);
    return false;
  }
  std::stringstream buf;
  buf << in.rdbuf();
  if (!parse_job_manifest(buf.str(), out, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

std::string format_iso8601(int64_t epoch_ms) {
  std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
  int millis = static_cast<int>(epoch_ms % 1000);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(secs),
                     millis);
}

json job_record_to_json(const JobRecord &record) {
  json j;
  j["recordingId"] = record.recording_id;
  j["status"] = to_string(record.status);
  j["progress"] = record.progress;
  if (record.processed_video_url.empty())
    j["processedVideoUrl"] = nullptr;
  else
    j["processedVideoUrl"] = record.processed_video_url;
  if (!record.error_message.empty())
    j["error"] = record.error_message;
  if (record.started_at_ms > 0)
    j["startedAt"] = format_iso8601(record.started_at_ms);
  if (record.completed_at_ms > 0)
    j["completedAt"] = format_iso8601(record.completed_at_ms);
  return j;
}

} // namespace cursor_fx
