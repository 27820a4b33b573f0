/**
 * @file system.cpp
 * @brief CPU discovery and thread management implementation
 */

#include "gesture_slicer/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <thread>

#include <pthread.h>
#include <sched.h>

#include <fmt/core.h>

namespace gesture_slicer {

namespace {

constexpr int MAX_CPUS = 64;

constexpr const char *CGROUP2_CPU_MAX = "/sys/fs/cgroup/cpu.max";
constexpr const char *CGROUP1_QUOTA = "/sys/fs/cgroup/cpu/cpu.cfs_quota_us";
constexpr const char *CGROUP1_PERIOD = "/sys/fs/cgroup/cpu/cpu.cfs_period_us";
constexpr const char *CGROUP2_CPUSET = "/sys/fs/cgroup/cpuset.cpus.effective";
constexpr const char *CGROUP1_CPUSET = "/sys/fs/cgroup/cpuset/cpuset.cpus";

/// Whole-token integer parse; false on anything else
bool parse_long(const std::string &text, long &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  out = std::strtol(text.c_str(), &end, 10);
  return end == text.c_str() + text.size();
}

std::string first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

/// CPUs granted by a CFS quota, rounded up; -1 when unlimited or unknown
int quota_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

int cgroup2_quota() {
  std::ifstream f(CGROUP2_CPU_MAX);
  std::string quota, period;
  if (!(f >> quota >> period) || quota == "max")
    return -1;
  long q = 0, p = 0;
  if (!parse_long(quota, q) || !parse_long(period, p))
    return -1;
  return quota_cpus(q, p);
}

int cgroup1_quota() {
  long q = 0, p = 0;
  if (!parse_long(first_line(CGROUP1_QUOTA), q) ||
      !parse_long(first_line(CGROUP1_PERIOD), p))
    return -1;
  return quota_cpus(q, p);
}

std::vector<int> cpuset_cpus() {
  auto cpus = parse_cpu_list(first_line(CGROUP2_CPUSET));
  if (cpus.empty())
    cpus = parse_cpu_list(first_line(CGROUP1_CPUSET));
  return cpus;
}

} // anonymous namespace

// **---- CPU Detection ----**

std::vector<int> parse_cpu_list(const std::string &list) {
  std::vector<int> cpus;
  size_t pos = 0;
  while (pos < list.size()) {
    size_t end = list.find(',', pos);
    if (end == std::string::npos)
      end = list.size();
    std::string item = list.substr(pos, end - pos);
    pos = end + 1;

    while (!item.empty() && (item.back() == ' ' || item.back() == '\n' ||
                             item.back() == '\r'))
      item.pop_back();
    if (item.empty())
      continue;

    long first = 0, last = 0;
    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      if (!parse_long(item, first))
        return {};
      last = first;
    } else if (!parse_long(item.substr(0, dash), first) ||
               !parse_long(item.substr(dash + 1), last) || last < first) {
      return {};
    }
    for (long cpu = first; cpu <= last; ++cpu) {
      cpus.push_back(static_cast<int>(cpu));
    }
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = cgroup2_quota();
  if (limit <= 0)
    limit = cgroup1_quota();

  const int cpuset = static_cast<int>(cpuset_cpus().size());
  if (cpuset > limit)
    limit = cpuset;

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  return std::clamp(limit, 1, MAX_CPUS);
}

std::vector<int> get_available_cpus() {
  auto cpus = cpuset_cpus();
  if (cpus.empty()) {
    const int limit = detect_cpu_limit();
    for (int i = 0; i < limit; ++i) {
      cpus.push_back(i);
    }
  }
  return cpus;
}

int calculate_camera_workers(int configured, size_t cameras) {
  const int wanted = configured > 0 ? configured : detect_cpu_limit();
  const int limit = static_cast<int>(std::min<size_t>(cameras, MAX_CPUS));
  return std::max(1, std::min(wanted, limit));
}

// **---- Thread Pinning ----**

bool pin_thread_to_cpus(const std::vector<int> &cpu_ids) {
  if (cpu_ids.empty())
    return false;

  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  for (int cpu_id : cpu_ids) {
    if (cpu_id >= 0 && cpu_id < CPU_SETSIZE)
      CPU_SET(cpu_id, &cpuset);
  }

  int result =
      pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
  return (result == 0);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  const long total = std::max(0L, static_cast<long>(seconds));
  return fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60,
                     total % 60);
}

} // namespace gesture_slicer
