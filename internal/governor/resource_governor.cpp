#include "resource_governor.hpp"

#include <sstream>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resonance::governor {

ResourceGovernor::ResourceGovernor(resonance::runtime::config::GovernorConfig config,
                                   std::shared_ptr<MemorySampler> memory, std::shared_ptr<HardwareMonitor> hardware)
    : config_(std::move(config)), memory_(std::move(memory)), hardware_(std::move(hardware)) {
  if (!memory_) {
    throw std::invalid_argument("ResourceGovernor requires a memory sampler");
  }
  if (!hardware_) {
    hardware_ = std::make_shared<NullHardwareMonitor>();
  }
}

std::string ResourceGovernor::Explain(const PressureState& state, Action action) const {
  std::ostringstream reason;
  switch (action) {
    case Action::kContinue:
      reason << "within limits";
      break;
    case Action::kThrottle:
      if (state.ThermalPressure()) {
        reason << "cpu " << *state.temperature_celsius << "C >= throttle " << state.thermal_throttle_celsius << "C";
      } else {
        reason << "memory " << state.memory_mb << "MB > target " << state.memory_target_mb << "MB";
      }
      break;
    case Action::kHardKill:
      if (state.ThermalEmergency()) {
        reason << "cpu " << *state.temperature_celsius << "C >= emergency brake " << state.thermal_hard_kill_celsius
               << "C";
      } else {
        reason << "memory " << state.memory_mb << "MB > hard kill " << state.memory_hard_kill_mb << "MB";
      }
      break;
  }
  return reason.str();
}

Decision ResourceGovernor::Evaluate() {
  PressureState state;
  state.memory_mb                 = memory_->ResidentMb();
  state.temperature_celsius       = hardware_->TemperatureCelsius();
  state.memory_target_mb          = config_.memory_target_mb();
  state.memory_hard_kill_mb       = config_.memory_hard_kill_mb();
  state.thermal_throttle_celsius  = config_.thermal_throttle_celsius();
  state.thermal_hard_kill_celsius = config_.thermal_hard_kill_celsius();

  Decision decision;
  decision.action = state.Decide();
  decision.state  = state;
  decision.reason = Explain(state, decision.action);

  if (decision.action != current_action_) {
    const auto level = decision.action == Action::kHardKill ? spdlog::level::err
                       : decision.action == Action::kThrottle ? spdlog::level::warn
                                                                : spdlog::level::info;
    observability::Log(level, "Resource pressure changed",
                       {observability::StringField("from", ToString(current_action_)),
                        observability::StringField("to", ToString(decision.action)),
                        observability::IntField("memory_mb", static_cast<int64_t>(state.memory_mb)),
                        observability::DoubleField("temperature_c", state.temperature_celsius.value_or(0.0)),
                        observability::StringField("reason", decision.reason)});
    current_action_ = decision.action;
  }

  last_sample_ = state;
  return decision;
}

void ResourceGovernor::Enforce(const Decision& decision) const {
  switch (decision.action) {
    case Action::kContinue:
      return;
    case Action::kThrottle:
      Throttle();
      return;
    case Action::kHardKill:
      throw util::ResourceLimitExceeded("hard kill: " + decision.reason);
  }
}

void ResourceGovernor::Throttle() const {
  const auto delay = throttle_delay();
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

} // namespace resonance::governor
