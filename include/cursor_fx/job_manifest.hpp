/**
 * @file job_manifest.hpp
 * @brief JSON job manifests in, JSON job status out
 *
 * @details Manifest format (produced by the orchestration layer):
 *
 *          {
 *            "recordingId": "...", "videoUrl": "...", "projectId": "...",
 *            "cursorStyle": "normal" | "hand",
 *            "cursorData": [ {"timestamp": ms, "x": px, "y": px,
 *                             "type": "move" | "click" | "input"} ],
 *            "zoomPoints": [ {"time": s, "x": 0..1, "y": 0..1,
 *                             "scale": s, "duration": s} ]
 *          }
 *
 * @note cursorData and zoomPoints may also arrive as JSON-encoded strings.
 *       Samples without x/y fall back to coord_x/coord_y, then 0.
 */

#ifndef CURSOR_FX_JOB_MANIFEST_HPP
#define CURSOR_FX_JOB_MANIFEST_HPP

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "processing_queue.hpp"
#include "sprite_cache.hpp"

namespace cursor_fx {

/**
 * @brief Parse a manifest document.
 * @param text JSON text
 * @param out Output request
 * @param error Output: reason on failure
 * @return false if the text is not a JSON object or a field has the wrong
 *         type; unusable individual samples are skipped with a warning
 */
bool parse_job_manifest(const std::string &text, JobRequest &out,
                        std::string &error);

/**
 * @brief Read and parse a manifest file.
 */
bool load_job_manifest(const std::string &path, JobRequest &out,
                       std::string &error);

/**
 * @brief Status document:
 *        {recordingId, status, progress, processedVideoUrl,
 *         error?, startedAt?, completedAt?}
 */
nlohmann::json job_record_to_json(const JobRecord &record);

/**
 * @brief Epoch milliseconds as ISO 8601 UTC ("2024-05-01T12:00:00.000Z").
 */
std::string format_iso8601(int64_t epoch_ms);

} // namespace cursor_fx

#endif // CURSOR_FX_JOB_MANIFEST_HPP
