/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution
 *
 *          - Executable lookup on PATH
 *
 *          - Time formatting utilities
 */

#include "flac2opus/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

#include <fmt/core.h>

namespace flac2opus {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

constexpr int MAX_WORKERS = 64;

/// First line of a small kernel file, or empty if unreadable
std::string read_first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

/// Non-negative decimal, or -1 for anything else
long parse_count(const std::string &text) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos)
    return -1;
  try {
    return std::stol(text);
  } catch (const std::exception &) {
    return -1;
  }
}

int cpus_for_quota(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

bool is_executable_file(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

// **---- Cgroup Parsing ----**

int parse_cpu_max(const std::string &line) {
  std::istringstream in(line);
  std::string quota;
  std::string period;
  in >> quota >> period;
  if (quota == "max")
    return -1;
  return cpus_for_quota(parse_count(quota), parse_count(period));
}

int count_cpu_list(const std::string &list) {
  int total = 0;
  std::istringstream in(list);
  std::string item;

  while (std::getline(in, item, ',')) {
    if (item.empty())
      continue;
    size_t dash = item.find('-');
    long first = parse_count(item.substr(0, dash));
    long last = dash == std::string::npos ? first
                                          : parse_count(item.substr(dash + 1));
    if (first < 0 || last < first)
      return -1;
    total += static_cast<int>(last - first + 1);
  }
  return total > 0 ? total : -1;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  /// Tried in order; the first positive answer wins
  const std::function<int()> detectors[] = {
      [] { return parse_cpu_max(read_first_line("/sys/fs/cgroup/cpu.max")); },
      [] {
        return cpus_for_quota(
            parse_count(read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_quota_us")),
            parse_count(
                read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_period_us")));
      },
      [] {
        return count_cpu_list(
            read_first_line("/sys/fs/cgroup/cpuset.cpus.effective"));
      },
      [] {
        return count_cpu_list(
            read_first_line("/sys/fs/cgroup/cpuset/cpuset.cpus"));
      },
      [] { return static_cast<int>(std::thread::hardware_concurrency()); },
  };

  int limit = -1;
  for (const auto &detect : detectors) {
    limit = detect();
    if (limit > 0)
      break;
  }
  return std::clamp(limit, 1, MAX_WORKERS);
}

int resolve_worker_count(int requested) {
  if (requested > 0)
    return requested;
  return detect_cpu_limit();
}

// **---- Executables ----**

std::optional<fs::path> find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return fs::path(name);
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t pos = 0;
  while (pos <= path_list.size()) {
    size_t end = path_list.find(':', pos);
    if (end == std::string::npos)
      end = path_list.size();

    /// Empty PATH entry means the current directory
    std::string dir = path_list.substr(pos, end - pos);
    fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
    if (is_executable_file(candidate))
      return candidate;

    pos = end + 1;
  }
  return std::nullopt;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace flac2opus
