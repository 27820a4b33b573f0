/**
 * @file system.hpp
 * @brief CPU discovery, camera worker sizing and thread pinning
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Camera worker count derived from that limit
 *
 *          - Thread pinning for CPU affinity
 *
 *          - Time formatting for run summaries
 *
 * @note Thread pinning uses pthread_setaffinity_np which is Linux-specific.
 */

#ifndef GESTURE_SLICER_SYSTEM_HPP
#define GESTURE_SLICER_SYSTEM_HPP

#include <string>
#include <vector>

namespace gesture_slicer {

// **---- CPU Detection ----**

/**
 * @brief Parse a cpuset list such as "0-3,6,8-9".
 * @return CPU ids in list order; empty on malformed input
 */
std::vector<int> parse_cpu_list(const std::string &list);

/**
 * @brief Number of CPUs this process may use.
 *
 * @note std::thread::hardware_concurrency() reports the host inside a
 *       container. Checked in order:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `cpu.cfs_quota_us` / `cpu.cfs_period_us`
 *
 *        - Cpuset (v2 effective, then v1); a larger cpuset wins over quota
 *
 * @return Detected limit in [1, 64]
 */
int detect_cpu_limit();

/**
 * @brief CPU ids available for pinning (cpuset, else 0..limit-1).
 */
std::vector<int> get_available_cpus();

/**
 * @brief Number of camera worker threads for a run.
 * @param configured Requested workers, 0 for automatic
 * @param cameras Cameras to process
 * @return min(configured or CPU limit, cameras), at least 1
 */
int calculate_camera_workers(int configured, size_t cameras);

// **---- Thread Pinning ----**

/**
 * @brief Pin the calling thread to a set of CPU cores.
 * @return true if pinning succeeded
 */
bool pin_thread_to_cpus(const std::vector<int> &cpu_ids);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.
 */
std::string format_time(double seconds);

} // namespace gesture_slicer

#endif // GESTURE_SLICER_SYSTEM_HPP
