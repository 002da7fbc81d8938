#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/time.hpp"
#include "resonance/graph/v1/node.pb.h"
#include "resonance/graph/v1/signal.pb.h"

namespace resonance::scoring {

struct ScoringReport {
  size_t signals_applied{0};
  size_t signals_dropped{0};
  size_t nodes_unobserved{0};
  size_t nodes_aged{0};
};

/*
  Signal-driven resonance scoring.

  boost = min(ctr, ctr_cap) * ctr_weight
        + min(dwell / 60, dwell_cap_minutes) * dwell_weight
        + min(depth, depth_cap) * depth_weight
        + min(returns, return_visit_cap) * return_visit_weight

  Decay runs once, after every signal has been applied. Nodes never observed
  step towards unobserved_decay_cap; observed nodes decay with age.
  resonance_floor is never crossed.

  `now` is always supplied by the caller.
*/
class ResonanceScorer {
 public:
  explicit ResonanceScorer(resonance::runtime::config::ScoringConfig config);

  double ScoreBoost(const resonance::graph::v1::Signal& signal) const;

  void ApplySignals(std::vector<resonance::graph::v1::Node>*        nodes,
                    const std::vector<resonance::graph::v1::Signal>& signals, util::TimePoint now,
                    ScoringReport* report) const;

  void ApplyDecay(std::vector<resonance::graph::v1::Node>* nodes, util::TimePoint now, ScoringReport* report) const;

  // ApplySignals followed by ApplyDecay.
  ScoringReport Score(std::vector<resonance::graph::v1::Node>*        nodes,
                      const std::vector<resonance::graph::v1::Signal>& signals, util::TimePoint now) const;

 private:
  double Floor(double score) const;

  resonance::runtime::config::ScoringConfig config_;
};

} // namespace resonance::scoring
