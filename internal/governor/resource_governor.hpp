#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/governor/pressure_state.hpp"
#include "internal/governor/samplers.hpp"

namespace resonance::governor {

struct Decision {
  Action        action{Action::kContinue};
  PressureState state;
  std::string   reason;
};

/*
  Samples memory and temperature and turns each sample into a Decision.

  Transitions between actions are logged once, when they happen. Enforce()
  applies a decision: a throttle sleeps for the configured delay, a hard kill
  raises ResourceLimitExceeded so the caller stops at its batch boundary.
*/
class ResourceGovernor {
 public:
  ResourceGovernor(resonance::runtime::config::GovernorConfig config, std::shared_ptr<MemorySampler> memory,
                   std::shared_ptr<HardwareMonitor> hardware);

  Decision Evaluate();

  void Enforce(const Decision& decision) const;

  void Throttle() const;

  const PressureState& last_sample() const {
    return last_sample_;
  }

  Action current_action() const {
    return current_action_;
  }

  std::chrono::milliseconds throttle_delay() const {
    return std::chrono::milliseconds(config_.throttle_delay_ms());
  }

 private:
  std::string Explain(const PressureState& state, Action action) const;

  resonance::runtime::config::GovernorConfig config_;
  std::shared_ptr<MemorySampler>               memory_;
  std::shared_ptr<HardwareMonitor>           hardware_;

  PressureState last_sample_;
  Action        current_action_{Action::kContinue};
};

} // namespace resonance::governor
