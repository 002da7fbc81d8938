#include "samplers.hpp"

#include <cstdio>
#include <cstring>
#include <fstream>

namespace resonance::governor {

uint64_t ProcessMemorySampler::ResidentMb() {
  std::FILE* file = std::fopen("/proc/self/status", "r");
  if (!file) {
    return 0;
  }

  uint64_t rss_kb = 0;
  char     line[256];
  while (std::fgets(line, sizeof(line), file)) {
    if (std::strncmp(line, "VmRSS:", 6) == 0) {
      unsigned long kb = 0;
      if (std::sscanf(line + 6, " %lu", &kb) == 1) {
        rss_kb = kb;
      }
      break;
    }
  }
  std::fclose(file);
  return rss_kb / 1024;
}

SysfsHardwareMonitor::SysfsHardwareMonitor(std::filesystem::path sensor_path) : sensor_path_(std::move(sensor_path)) {
}

std::optional<double> SysfsHardwareMonitor::TemperatureCelsius() {
  std::ifstream in(sensor_path_);
  if (!in) {
    return std::nullopt;
  }

  long millidegrees = 0;
  if (!(in >> millidegrees)) {
    return std::nullopt;
  }
  return static_cast<double>(millidegrees) / 1000.0;
}

} // namespace resonance::governor
