/**
 * @file system.hpp
 * @brief System utilities: CPU detection, executable lookup, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - PATH lookup for the external ffmpeg binary
 *
 *          - Time and byte-size formatting utilities
 *
 * @note The CPU limit sizes the encoder's thread pool so that the single
 *       transcode running at any time does not oversubscribe a container.
 */

#ifndef CURSOR_FX_SYSTEM_HPP
#define CURSOR_FX_SYSTEM_HPP

#include <cstdint>
#include <string>

namespace cursor_fx {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Executables ----**

/**
 * @brief Resolve a program name the way execvp would.
 * @param name Bare name ("ffmpeg") or a path containing '/'
 * @return Absolute path of an executable file, or empty if none found
 */
std::string find_executable(const std::string &name);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count as a short human-readable string ("12.3 MB").
 */
std::string format_bytes(uint64_t bytes);

} // namespace cursor_fx

#endif // CURSOR_FX_SYSTEM_HPP
