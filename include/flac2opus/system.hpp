/**
 * @file system.hpp
 * @brief System utilities: CPU detection, executable lookup, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution for the job scheduler
 *
 *          - PATH lookup for the external encoder
 *
 *          - Time formatting utilities
 *
 * @note Worker auto-detection honours `docker run --cpus` style quotas.
 */

#ifndef FLAC2OPUS_SYSTEM_HPP
#define FLAC2OPUS_SYSTEM_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace flac2opus {

// **---- CPU Detection ----**

/**
 * @brief Parse a cgroup v2 `cpu.max` line such as "150000 100000".
 * @return CPUs allowed (quota / period, rounded up), or -1 for "max" or
 *         malformed input
 */
int parse_cpu_max(const std::string &line);

/**
 * @brief Count the CPUs in a cpuset list such as "0-3,8,10-11".
 * @return Number of CPUs, or -1 if the list is empty or malformed
 */
int count_cpu_list(const std::string &list);

/**
 * @brief CPUs this process may actually use.
 *
 * @note hardware_concurrency() reports the host's cores even inside a
 *       container, so the cgroup limits are consulted first:
 *
 *        1. cgroup v2 `/sys/fs/cgroup/cpu.max`
 *
 *        2. cgroup v1 `cpu.cfs_quota_us` / `cpu.cfs_period_us`
 *
 *        3. `cpuset.cpus.effective`, then v1 `cpuset.cpus`
 *
 *        4. std::thread::hardware_concurrency()
 *
 * @return Detected limit clamped to [1, 64]
 */
int detect_cpu_limit();

/**
 * @brief Resolve the number of workers for a run.
 * @param requested Configured job count (0 or less = auto-detect)
 * @return requested if positive, otherwise detect_cpu_limit()
 */
int resolve_worker_count(int requested);

// **---- Executables ----**

/**
 * @brief Locate an executable the way a shell would.
 * @note A name containing '/' is checked directly; a bare name is
 *       searched in each PATH entry.
 * @return Full path of the executable, or nullopt if none is found
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace flac2opus

#endif // FLAC2OPUS_SYSTEM_HPP
