/**
 * @file system.hpp
 * @brief System utilities: CPU detection, clocks and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Wall-clock helpers in epoch milliseconds
 *
 *          - Time formatting utilities (HH:MM:SS, ISO-8601)
 *
 *          - Shell quoting for collaborator command lines
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef CLIPFORGE_SYSTEM_HPP
#define CLIPFORGE_SYSTEM_HPP

#include <cstdint>
#include <string>

namespace clipforge {

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
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Encoder threads for one job when max_jobs run side by side.
 * @return max(1, detect_cpu_limit() / max_jobs)
 */
int threads_per_job(int max_jobs);

// **---- Clock ----**

/// Current wall-clock time in milliseconds since the Unix epoch
std::int64_t now_ms();

// **---- Utilities ----**

/**
 * @brief Format epoch milliseconds as ISO-8601 UTC
 *        ("2025-01-31T12:00:00.250Z").
 */
std::string format_iso8601(std::int64_t epoch_ms);

/**
 * @brief Quote a string for /bin/sh (single quotes, embedded quotes
 *        escaped).
 */
std::string shell_quote(const std::string &s);

} // namespace clipforge

#endif // CLIPFORGE_SYSTEM_HPP
