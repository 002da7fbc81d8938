#pragma once

#include <cstdint>
#include <optional>

namespace resonance::governor {

// Per-sample decision, applied at the next batch boundary.
enum class Action : std::uint8_t {
  kContinue = 0,
  kThrottle = 1,
  kHardKill = 2,
};

constexpr const char* ToString(Action action) {
  switch (action) {
    case Action::kContinue:
      return "continue";
    case Action::kThrottle:
      return "throttle";
    case Action::kHardKill:
      return "hard_kill";
  }
  return "unknown";
}

/*
  One resource sample plus the thresholds it is judged against.
  Memory limits trip when exceeded; thermal limits trip when reached.
*/
struct PressureState {
  uint64_t              memory_mb{0};
  std::optional<double> temperature_celsius;

  uint64_t memory_target_mb{0};
  uint64_t memory_hard_kill_mb{0};
  double   thermal_throttle_celsius{0};
  double   thermal_hard_kill_celsius{0};

  bool MemoryPressure() const {
    return memory_mb > memory_target_mb;
  }
  bool MemoryExhausted() const {
    return memory_mb > memory_hard_kill_mb;
  }
  bool ThermalPressure() const {
    return temperature_celsius && *temperature_celsius >= thermal_throttle_celsius;
  }
  bool ThermalEmergency() const {
    return temperature_celsius && *temperature_celsius >= thermal_hard_kill_celsius;
  }

  Action Decide() const {
    if (MemoryExhausted() || ThermalEmergency()) {
      return Action::kHardKill;
    }
    if (MemoryPressure() || ThermalPressure()) {
      return Action::kThrottle;
    }
    return Action::kContinue;
  }
};

} // namespace resonance::governor
