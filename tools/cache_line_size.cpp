/**
 * @file cache_line_size.cpp
 * @brief Build-time probe for the L1 data cache line size
 *
 * @details CMake compiles and runs this once at configure time and passes
 *          the printed value as GESTURE_SLICER_CACHE_LINE_SIZE, which sizes
 *          PaddedAtomic and the FFmpeg reader state. Strategies, in order:
 *
 *          1. sysconf(_SC_LEVEL1_DCACHE_LINESIZE)
 *
 *          2. sysfs coherency_line_size of cpu0
 *
 *          3. CPUID leaf 1 (x86/x86_64)
 *
 *          4. 64 bytes
 */

#include <cstddef>
#include <fstream>
#include <iostream>

#include <unistd.h>

#if defined(__x86_64__) || defined(__i386__)
#include <cpuid.h>
#endif

namespace {

constexpr size_t FALLBACK_LINE_SIZE = 64;

/// Reject values no real cache line has
bool plausible(long v) { return v >= 16 && v <= 1024 && (v & (v - 1)) == 0; }

size_t from_sysconf() {
#if defined(_SC_LEVEL1_DCACHE_LINESIZE)
  long v = sysconf(_SC_LEVEL1_DCACHE_LINESIZE);
  if (plausible(v))
    return static_cast<size_t>(v);
#endif
  return 0;
}

size_t from_sysfs() {
  std::ifstream f(
      "/sys/devices/system/cpu/cpu0/cache/index0/coherency_line_size");
  long v = 0;
  if (f >> v && plausible(v))
    return static_cast<size_t>(v);
  return 0;
}

size_t from_cpuid() {
#if defined(__x86_64__) || defined(__i386__)
  unsigned eax = 0, ebx = 0, ecx = 0, edx = 0;
  if (__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
    long v = static_cast<long>(((ebx >> 8) & 0xFF) * 8);
    if (plausible(v))
      return static_cast<size_t>(v);
  }
#endif
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main() {
  size_t line = from_sysconf();
  if (line == 0)
    line = from_sysfs();
  if (line == 0)
    line = from_cpuid();
  if (line == 0)
    line = FALLBACK_LINE_SIZE;
  std::cout << line;
  return 0;
}
