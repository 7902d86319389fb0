/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/cursor_fx.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef CURSOR_FX_CONFIG_HPP
#define CURSOR_FX_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <string>

namespace cursor_fx {
namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

// **---- External tools ----**

/// ffmpeg executable used for both the decode and the encode subprocess
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Video codec for the re-encoded output
inline const std::string &encoder_codec() {
  static std::string val = get_env_string("ENCODER_CODEC", "libx264");
  return val;
}

inline const std::string &encoder_preset() {
  static std::string val = get_env_string("ENCODER_PRESET", "veryfast");
  return val;
}

inline int encoder_crf() {
  static int val = get_env_int("ENCODER_CRF", 20);
  return val;
}

/**
 * @brief Encoder thread count
 * @note 0 = use the cgroup-aware CPU limit (see detect_cpu_limit()).
 */
inline int encoder_threads() {
  static int val = get_env_int("ENCODER_THREADS", 0);
  return val;
}

/// Audio codec for the passthrough track ("copy" = no re-encode)
inline const std::string &audio_codec() {
  static std::string val = get_env_string("AUDIO_CODEC", "copy");
  return val;
}

// **---- Pipeline ----**

/// Frames between two progress reports
inline int progress_interval_frames() {
  static int val = get_env_int("PROGRESS_INTERVAL_FRAMES", 50);
  return val;
}

/**
 * @brief Capacity of each bounded frame queue in the transcode pump
 * @note Peak memory is (2 * depth + 4) frames regardless of video length.
 */
inline int frame_queue_depth() {
  static int val = get_env_int("FRAME_QUEUE_DEPTH", 2);
  return val;
}

/// Seconds a pipe may make no progress before the run is failed
inline int pipe_stall_timeout_sec() {
  static int val = get_env_int("PIPE_STALL_TIMEOUT_SEC", 120);
  return val;
}

/// Seconds to wait for a subprocess to exit after its input is closed
inline int subprocess_timeout_sec() {
  static int val = get_env_int("SUBPROCESS_TIMEOUT_SEC", 600);
  return val;
}

// **---- Assets and scratch space ----**

/// Directory holding cursor_<style>.png sprites
inline const std::string &sprite_dir() {
  static std::string val = get_env_string("SPRITE_DIR", "assets");
  return val;
}

/// Per-job scratch files live here and are removed after every job
inline const std::string &scratch_dir() {
  static std::string val = get_env_string(
      "SCRATCH_DIR",
      (std::filesystem::temp_directory_path() / "cursor-fx").string());
  return val;
}

/**
 * @brief Derive zoom windows from clicks when a job carries none
 * @note 0 = off (default), 1 = on
 */
inline bool auto_zoom() {
  static bool val = (get_env_int("AUTO_ZOOM", 0) != 0);
  return val;
}

// **---- Object storage ----**

/// "http" (libcurl GET/PUT) or "local" (filesystem copy)
inline const std::string &storage_mode() {
  static std::string val = get_env_string("STORAGE_MODE", "http");
  return val;
}

/// Base URL that results are PUT to (key is appended)
inline const std::string &storage_upload_url() {
  static std::string val = get_env_string("STORAGE_UPLOAD_URL", "");
  return val;
}

/// Base URL that results are served from (key is appended)
inline const std::string &storage_public_url() {
  static std::string val = get_env_string("STORAGE_PUBLIC_URL", "");
  return val;
}

/// Bearer token sent with uploads (empty = no Authorization header)
inline const std::string &storage_auth_token() {
  static std::string val = get_env_string("STORAGE_AUTH_TOKEN", "");
  return val;
}

/// Root directory for STORAGE_MODE=local
inline const std::string &storage_local_root() {
  static std::string val = get_env_string("STORAGE_LOCAL_ROOT", "storage");
  return val;
}

/// Timeout for a single download or upload
inline int http_timeout_sec() {
  static int val = get_env_int("HTTP_TIMEOUT_SEC", 300);
  return val;
}

} // namespace Config
} // namespace cursor_fx

#endif // CURSOR_FX_CONFIG_HPP
