#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace resonance::governor {

/*
  Resource samplers. Production reads procfs / sysfs; tests script values.
*/
class MemorySampler {
 public:
  virtual ~MemorySampler() = default;

  // Resident set size in MiB.
  virtual uint64_t ResidentMb() = 0;
};

class HardwareMonitor {
 public:
  virtual ~HardwareMonitor() = default;

  // nullopt when no reading is available.
  virtual std::optional<double> TemperatureCelsius() = 0;
};

// VmRSS from /proc/self/status; 0 where unavailable.
class ProcessMemorySampler : public MemorySampler {
 public:
  uint64_t ResidentMb() override;
};

// Millidegrees Celsius from a sysfs thermal zone file.
class SysfsHardwareMonitor : public HardwareMonitor {
 public:
  explicit SysfsHardwareMonitor(std::filesystem::path sensor_path);

  std::optional<double> TemperatureCelsius() override;

 private:
  std::filesystem::path sensor_path_;
};

class NullHardwareMonitor : public HardwareMonitor {
 public:
  std::optional<double> TemperatureCelsius() override {
    return std::nullopt;
  }
};

} // namespace resonance::governor
